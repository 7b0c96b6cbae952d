/**
 * @file restriction_enforcer.cpp
 * @brief Egress chain installation, repair and verification
 *
 * **Default chain** (as `iptables -S CTFBOX_EGRESS` lists it):
 * ```
 * -A CTFBOX_EGRESS -d 127.0.0.0/8 -j ACCEPT
 * -A CTFBOX_EGRESS -d 10.0.0.0/8 -j ACCEPT
 * -A CTFBOX_EGRESS -d 172.16.0.0/12 -j ACCEPT
 * -A CTFBOX_EGRESS -d 192.168.0.0/16 -j ACCEPT
 * -A CTFBOX_EGRESS -m conntrack --ctstate RELATED,ESTABLISHED -j ACCEPT
 * -A CTFBOX_EGRESS -p tcp -j REJECT --reject-with tcp-reset
 * -A CTFBOX_EGRESS -j REJECT --reject-with icmp-port-unreachable
 * ```
 * hooked with `iptables -I OUTPUT 1 -j CTFBOX_EGRESS`.
 *
 * Rejecting instead of dropping makes blocked connections fail immediately
 * rather than hang until the command deadline.
 *
 * @date 2025
 */

#include "ctfbox/network/restriction_enforcer.hpp"
#include "ctfbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>

#include <algorithm>
#include <cstdint>

using json = nlohmann::json;

namespace ctfbox {
namespace network {

using core::CallKind;
using core::ExecutionRequest;
using core::ExecutionResult;
using utils::StringUtils;

namespace {

const char* kIptables = "iptables -w";

std::string Normalize(const std::string& line) {
    return StringUtils::Join(StringUtils::SplitWhitespace(line), " ");
}

bool IsPrefix(const std::vector<std::string>& prefix, const std::vector<std::string>& full) {
    return prefix.size() <= full.size() &&
           std::equal(prefix.begin(), prefix.end(), full.begin());
}

} // anonymous namespace

// ============================================================================
// RULE SETS
// ============================================================================

RestrictionRuleSet RestrictionRuleSet::Default() {
    RestrictionRuleSet rule_set;
    rule_set.rules = {
        {"127.0.0.0/8", RuleAction::ACCEPT},
        {"10.0.0.0/8", RuleAction::ACCEPT},
        {"172.16.0.0/12", RuleAction::ACCEPT},
        {"192.168.0.0/16", RuleAction::ACCEPT},
    };
    return rule_set;
}

json RestrictionOutcome::ToJSON() const {
    json j;
    j["success"] = success;
    j["changed"] = changed;
    j["commands_issued"] = commands_issued;
    if (!cause.empty()) {
        j["cause"] = cause;
    }
    return j;
}

std::string ToString(RuleAction action) {
    switch (action) {
        case RuleAction::ACCEPT: return "ACCEPT";
        case RuleAction::REJECT: return "REJECT";
        case RuleAction::DROP: return "DROP";
    }
    return "UNKNOWN";
}

std::vector<std::string> RestrictionEnforcer::BuildRuleSpecs(const RestrictionRuleSet& rule_set,
                                                             const std::string& chain) {
    std::vector<std::string> specs;
    const std::string head = "-A " + chain;

    for (const auto& rule : rule_set.rules) {
        const std::string destination = CanonicalDestination(rule.destination);
        switch (rule.action) {
            case RuleAction::ACCEPT:
                specs.push_back(head + " -d " + destination + " -j ACCEPT");
                break;
            case RuleAction::REJECT:
                specs.push_back(head + " -d " + destination +
                                " -j REJECT --reject-with icmp-port-unreachable");
                break;
            case RuleAction::DROP:
                specs.push_back(head + " -d " + destination + " -j DROP");
                break;
        }
    }

    if (rule_set.accept_established) {
        specs.push_back(head + " -m conntrack --ctstate RELATED,ESTABLISHED -j ACCEPT");
    }

    // Default action is always last
    switch (rule_set.default_action) {
        case RuleAction::REJECT:
            specs.push_back(head + " -p tcp -j REJECT --reject-with tcp-reset");
            specs.push_back(head + " -j REJECT --reject-with icmp-port-unreachable");
            break;
        case RuleAction::DROP:
            specs.push_back(head + " -j DROP");
            break;
        case RuleAction::ACCEPT:
            specs.push_back(head + " -j ACCEPT");
            break;
    }

    return specs;
}

std::string RestrictionEnforcer::CanonicalDestination(const std::string& destination) {
    auto slash = destination.find('/');
    std::string address = destination.substr(0, slash);
    int prefix = 32;

    if (slash != std::string::npos) {
        const std::string bits = destination.substr(slash + 1);
        if (bits.empty() || bits.size() > 2 || !std::all_of(bits.begin(), bits.end(), ::isdigit)) {
            return destination;
        }
        prefix = std::stoi(bits);
        if (prefix > 32) {
            return destination;
        }
    }

    in_addr parsed{};
    if (inet_pton(AF_INET, address.c_str(), &parsed) != 1) {
        return destination;
    }

    std::uint32_t host = ntohl(parsed.s_addr);
    std::uint32_t mask = prefix == 0 ? 0 : 0xFFFFFFFFu << (32 - prefix);
    parsed.s_addr = htonl(host & mask);

    char text[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &parsed, text, sizeof(text)) == nullptr) {
        return destination;
    }
    return std::string(text) + "/" + std::to_string(prefix);
}

std::vector<std::string> RestrictionEnforcer::BuildCommands(const RestrictionRuleSet& rule_set) {
    std::vector<std::string> commands;
    commands.push_back(std::string(kIptables) + " -N " + rule_set.chain);
    for (const auto& spec : BuildRuleSpecs(rule_set, rule_set.chain)) {
        commands.push_back(std::string(kIptables) + " " + spec);
    }
    commands.push_back(std::string(kIptables) + " -I OUTPUT 1 -j " + rule_set.chain);
    return commands;
}

std::vector<std::string> RestrictionEnforcer::ParseChainListing(const std::string& output,
                                                                const std::string& chain) {
    std::vector<std::string> rules;
    const std::string head = "-A " + chain + " ";
    for (const auto& line : StringUtils::SplitLines(output)) {
        std::string normalized = Normalize(line);
        if (StringUtils::StartsWith(normalized, head)) {
            rules.push_back(normalized);
        }
    }
    return rules;
}

bool RestrictionEnforcer::HasHook(const std::string& output_listing, const std::string& chain) {
    const std::string hook = "-A OUTPUT -j " + chain;
    for (const auto& line : StringUtils::SplitLines(output_listing)) {
        if (Normalize(line) == hook) {
            return true;
        }
    }
    return false;
}

std::string RestrictionEnforcer::StagingChain(const std::string& chain) {
    return chain + "_STAGE";
}

// ============================================================================
// APPLY
// ============================================================================

RestrictionEnforcer::RestrictionEnforcer(executor::GuardedExecutor& executor)
    : executor_(executor) {}

RestrictionOutcome RestrictionEnforcer::Apply(const std::string& container_id,
                                              const RestrictionRuleSet& rule_set) {
    RestrictionOutcome outcome;
    const auto& chain = rule_set.chain;
    const auto desired = BuildRuleSpecs(rule_set, chain);

    spdlog::info("Applying egress restriction ({}) to {}", chain, container_id);

    ChainState current;
    std::string error;
    if (!ReadChain(container_id, chain, current, error)) {
        outcome.cause = error;
        spdlog::error("Restriction on {} failed: {}", container_id, outcome.cause);
        return outcome;
    }

    if (current.exists && current.rules == desired && current.hooks > 0) {
        outcome.success = true;
        spdlog::info("✓ Restriction already in place on {}", container_id);
        return outcome;
    }

    outcome.changed = true;

    if (!current.exists || IsPrefix(current.rules, desired)) {
        // Fresh install or completion of an interrupted one
        if (!current.exists &&
            !RunRequired(container_id, std::string(kIptables) + " -N " + chain, outcome)) {
            return outcome;
        }
        for (std::size_t i = current.rules.size(); i < desired.size(); ++i) {
            if (!RunRequired(container_id, std::string(kIptables) + " " + desired[i], outcome)) {
                return outcome;
            }
        }
        if (current.hooks == 0 &&
            !RunRequired(container_id, std::string(kIptables) + " -I OUTPUT 1 -j " + chain, outcome)) {
            return outcome;
        }
    } else {
        spdlog::warn("Existing {} chain on {} differs; rebuilding", chain, container_id);
        const auto staging = StagingChain(chain);

        // Leftovers of an earlier interrupted rebuild
        Run(container_id, std::string(kIptables) + " -D OUTPUT -j " + staging, outcome);
        Run(container_id, std::string(kIptables) + " -F " + staging, outcome);
        Run(container_id, std::string(kIptables) + " -X " + staging, outcome);

        if (!RunRequired(container_id, std::string(kIptables) + " -N " + staging, outcome)) {
            return outcome;
        }
        for (const auto& spec : BuildRuleSpecs(rule_set, staging)) {
            if (!RunRequired(container_id, std::string(kIptables) + " " + spec, outcome)) {
                return outcome;
            }
        }
        if (!RunRequired(container_id, std::string(kIptables) + " -I OUTPUT 1 -j " + staging, outcome)) {
            return outcome;
        }

        // Staging chain now filters; the old one can go
        for (int i = 0; i < current.hooks; ++i) {
            if (!RunRequired(container_id, std::string(kIptables) + " -D OUTPUT -j " + chain, outcome)) {
                return outcome;
            }
        }
        if (!RunRequired(container_id, std::string(kIptables) + " -F " + chain, outcome) ||
            !RunRequired(container_id, std::string(kIptables) + " -X " + chain, outcome) ||
            !RunRequired(container_id, std::string(kIptables) + " -E " + staging + " " + chain, outcome)) {
            return outcome;
        }
    }

    if (!Verify(container_id, rule_set, outcome)) {
        return outcome;
    }

    outcome.success = true;
    spdlog::info("✓ Restriction applied to {} ({} commands)", container_id, outcome.commands_issued);
    return outcome;
}

TopologyRestriction RestrictionEnforcer::ApplyAll(const core::Topology& topology,
                                                  const RestrictionRuleSet& rule_set) {
    TopologyRestriction result;
    result.success = true;

    for (const auto& container : topology.Containers()) {
        auto outcome = Apply(container.id, rule_set);
        result.per_container[container.name] = outcome;

        if (!outcome.success) {
            result.success = false;
            result.cause = container.name + ": " + outcome.cause;
            spdlog::error("Restriction failed on {}; topology is not restricted", container.name);
            break;
        }
    }

    return result;
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

bool RestrictionEnforcer::ReadChain(const std::string& container_id, const std::string& chain,
                                    ChainState& state, std::string& error) {
    RestrictionOutcome scratch;

    auto chain_listing = Run(container_id, std::string(kIptables) + " -S " + chain, scratch);
    if (chain_listing.IsTimedOut() || chain_listing.IsFailed()) {
        error = "reading chain " + chain + ": " + core::Describe(chain_listing);
        return false;
    }
    // Non-zero exit means the chain does not exist
    state.exists = chain_listing.Succeeded();
    if (state.exists) {
        state.rules = ParseChainListing(chain_listing.Output(), chain);
    }

    auto output_listing = Run(container_id, std::string(kIptables) + " -S OUTPUT", scratch);
    if (!output_listing.Succeeded()) {
        error = "reading OUTPUT chain: " + core::Describe(output_listing) + " " +
                StringUtils::Truncate(StringUtils::Trim(output_listing.Output()), 200);
        return false;
    }

    const std::string hook = "-A OUTPUT -j " + chain;
    for (const auto& line : StringUtils::SplitLines(output_listing.Output())) {
        if (Normalize(line) == hook) {
            state.hooks++;
        }
    }
    return true;
}

ExecutionResult RestrictionEnforcer::Run(const std::string& container_id, const std::string& command,
                                         RestrictionOutcome& outcome) {
    ExecutionRequest request;
    request.command = command;
    request.kind = CallKind::RESTRICTION;
    request.privileged = true;
    request.user = "root";

    outcome.commands_issued++;
    return executor_.Execute(container_id, request);
}

bool RestrictionEnforcer::RunRequired(const std::string& container_id, const std::string& command,
                                      RestrictionOutcome& outcome) {
    auto result = Run(container_id, command, outcome);
    if (result.Succeeded()) {
        return true;
    }

    outcome.cause = "'" + command + "' " + core::Describe(result);
    std::string output = StringUtils::Trim(result.Output());
    if (!output.empty()) {
        outcome.cause += ": " + StringUtils::Truncate(output, 200);
    }
    spdlog::error("Restriction on {} failed: {}", container_id, outcome.cause);
    return false;
}

bool RestrictionEnforcer::Verify(const std::string& container_id, const RestrictionRuleSet& rule_set,
                                 RestrictionOutcome& outcome) {
    ChainState installed;
    std::string error;
    if (!ReadChain(container_id, rule_set.chain, installed, error)) {
        outcome.cause = "verification: " + error;
        spdlog::error("Restriction on {} failed: {}", container_id, outcome.cause);
        return false;
    }

    if (!installed.exists || installed.rules != BuildRuleSpecs(rule_set, rule_set.chain)) {
        outcome.cause = "verification: installed chain does not match the rule set";
        spdlog::error("Restriction on {} failed: {}", container_id, outcome.cause);
        return false;
    }
    if (installed.hooks == 0) {
        outcome.cause = "verification: chain is not hooked into OUTPUT";
        spdlog::error("Restriction on {} failed: {}", container_id, outcome.cause);
        return false;
    }
    return true;
}

} // namespace network
} // namespace ctfbox
