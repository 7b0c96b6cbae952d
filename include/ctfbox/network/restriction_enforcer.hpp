/**
 * @file restriction_enforcer.hpp
 * @brief Egress firewall installed inside challenge containers
 *
 * The rule set lives in a dedicated iptables chain hooked into OUTPUT. The
 * chain is always fully built before it is hooked, so the default reject is
 * the last rule ever installed and a half-built chain never filters traffic.
 *
 * @date 2025
 */

#pragma once

#include "ctfbox/core/execution_result.hpp"
#include "ctfbox/core/topology.hpp"
#include "ctfbox/executor/guarded_executor.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace ctfbox {
namespace network {

/**
 * @enum RuleAction
 * @brief iptables target
 */
enum class RuleAction {
    ACCEPT,
    REJECT,   ///< TCP reset for tcp, ICMP port unreachable otherwise
    DROP
};

/**
 * @struct RestrictionRule
 * @brief Destination range and what to do with it
 */
struct RestrictionRule {
    std::string destination;   ///< CIDR
    RuleAction action{RuleAction::ACCEPT};
};

/**
 * @struct RestrictionRuleSet
 * @brief Ordered egress policy
 */
struct RestrictionRuleSet {
    std::string chain{"CTFBOX_EGRESS"};       ///< Dedicated chain name
    std::vector<RestrictionRule> rules;        ///< Evaluated in order
    bool accept_established{true};             ///< Allow return traffic
    RuleAction default_action{RuleAction::REJECT};

    /// Loopback and RFC 1918 ranges accepted, everything else rejected
    static RestrictionRuleSet Default();
};

/**
 * @struct RestrictionOutcome
 * @brief Result of applying a rule set to one container
 */
struct RestrictionOutcome {
    bool success{false};
    bool changed{false};       ///< Anything was installed (false for a no-op)
    std::string cause;         ///< Failure cause
    int commands_issued{0};

    nlohmann::json ToJSON() const;
};

/**
 * @struct TopologyRestriction
 * @brief Result of applying a rule set to a whole topology
 */
struct TopologyRestriction {
    bool success{false};
    std::string cause;
    std::map<std::string, RestrictionOutcome> per_container;   ///< Keyed by container name
};

/**
 * @class RestrictionEnforcer
 * @brief Installs and verifies the egress chain through privileged exec
 *
 * Apply() is idempotent: an identical installed chain is left alone, a
 * partially built one is completed, and a different one is replaced through
 * a staging chain that is hooked before the old chain is unhooked.
 */
class RestrictionEnforcer {
public:
    explicit RestrictionEnforcer(executor::GuardedExecutor& executor);

    RestrictionOutcome Apply(const std::string& container_id, const RestrictionRuleSet& rule_set);

    /// Apply to every container; stops at the first failure
    TopologyRestriction ApplyAll(const core::Topology& topology, const RestrictionRuleSet& rule_set);

    /// Rules as `iptables -S` prints them, for @p chain
    static std::vector<std::string> BuildRuleSpecs(const RestrictionRuleSet& rule_set,
                                                   const std::string& chain);

    /// Commands that install the rule set on a container with no chain yet
    static std::vector<std::string> BuildCommands(const RestrictionRuleSet& rule_set);

    /// `-A <chain> ...` lines of an `iptables -S` listing
    static std::vector<std::string> ParseChainListing(const std::string& output,
                                                      const std::string& chain);

    /// `iptables -S OUTPUT` listing contains the jump to @p chain
    static bool HasHook(const std::string& output_listing, const std::string& chain);

    static std::string StagingChain(const std::string& chain);

    /**
     * @brief Destination the way `iptables -S` prints it back
     *
     * IPv4 addresses gain `/32` and host bits are cleared (`172.16.5.0/12`
     * lists as `172.16.0.0/12`). Anything else is returned unchanged.
     */
    static std::string CanonicalDestination(const std::string& destination);

private:
    struct ChainState {
        bool exists{false};
        std::vector<std::string> rules;
        int hooks{0};
    };

    bool ReadChain(const std::string& container_id, const std::string& chain,
                   ChainState& state, std::string& error);
    core::ExecutionResult Run(const std::string& container_id, const std::string& command,
                              RestrictionOutcome& outcome);
    bool RunRequired(const std::string& container_id, const std::string& command,
                     RestrictionOutcome& outcome);
    bool Verify(const std::string& container_id, const RestrictionRuleSet& rule_set,
                RestrictionOutcome& outcome);

    executor::GuardedExecutor& executor_;
};

std::string ToString(RuleAction action);

} // namespace network
} // namespace ctfbox
