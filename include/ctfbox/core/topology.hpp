/**
 * @file topology.hpp
 * @brief Container set of one challenge instance
 *
 * Two variants share one Container contract: a single agent container, and a
 * compose topology (agent container plus challenge service containers). The
 * executor, enforcer and health monitor only ever see individual Containers.
 *
 * @date 2025
 */

#pragma once

#include "ctfbox/core/config.hpp"
#include "ctfbox/executor/guarded_executor.hpp"
#include "ctfbox/runtime/control_plane.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctfbox {
namespace core {

/**
 * @enum ContainerRole
 * @brief What a container is for
 */
enum class ContainerRole {
    AGENT,               ///< Runs agent commands
    CHALLENGE_SERVICE    ///< Hosts part of the challenge
};

/**
 * @enum HealthState
 * @brief Liveness as last observed by the health monitor
 */
enum class HealthState {
    HEALTHY,
    DEGRADED,   ///< At least one failed probe
    DEAD        ///< max_retries consecutive failed probes
};

/**
 * @struct Container
 * @brief One container owned by a session
 */
struct Container {
    std::string id;                                     ///< Runtime id
    std::string name;                                   ///< Container name
    std::string service;                                ///< Compose service key (empty for agent)
    ContainerRole role{ContainerRole::AGENT};
    std::vector<std::string> networks;                  ///< Network membership
    HealthState health{HealthState::HEALTHY};
    std::chrono::system_clock::time_point created_at;
    runtime::ContainerSpec spec;                        ///< Recreation recipe (agent only)
    int incarnation{0};                                 ///< Times recreated

    nlohmann::json ToJSON() const;
};

std::string ToString(ContainerRole role);
std::string ToString(HealthState state);

/**
 * @class Topology
 * @brief Polymorphic container set
 */
class Topology {
public:
    virtual ~Topology() = default;

    /**
     * @brief Create every container
     * @return true if every container is up
     */
    virtual bool Launch() = 0;

    /// Remove every container; errors are logged, never thrown
    virtual void Teardown() = 0;

    /**
     * @brief Replace a container with a fresh incarnation
     * @param container_id Container to replace
     * @return Pointer to the replacement, nullptr on failure
     */
    virtual Container* Recreate(const std::string& container_id) = 0;

    const std::vector<Container>& Containers() const { return containers_; }

    /// Agent container (nullptr before Launch)
    Container* Primary();
    const Container* Primary() const;

    Container* Find(const std::string& container_id);

protected:
    Topology(std::shared_ptr<runtime::ControlPlane> control_plane,
             executor::GuardedExecutor& executor,
             const EnvironmentConfig& config);

    /**
     * @brief Create a container under the executor's deadline; nullopt on failure
     *
     * An unconfirmed create may still complete on the daemon, so its name is
     * kept for RemoveStrays().
     */
    std::optional<std::string> CreateGuarded(const runtime::ContainerSpec& spec);

    /// Force-remove, by name, every container whose create was not confirmed
    void RemoveStrays();

    /// Create the agent container from its spec; nullptr on failure
    Container* LaunchAgent(const runtime::ContainerSpec& spec);

    /**
     * @brief Start the next incarnation of an agent, then remove the old one
     *
     * @p old is updated in place, so the agent keeps its position.
     */
    Container* ReplaceAgent(Container& old, const runtime::ContainerSpec& base_spec);

    /// Remove one container under the executor's deadline
    bool RemoveGuarded(const std::string& container_id);

    std::shared_ptr<runtime::ControlPlane> control_plane_;
    executor::GuardedExecutor& executor_;
    EnvironmentConfig config_;
    std::vector<Container> containers_;
    std::vector<std::string> stray_names_;   ///< Creates that failed or timed out
};

/**
 * @class SingleContainerTopology
 * @brief Just the agent container
 */
class SingleContainerTopology : public Topology {
public:
    SingleContainerTopology(std::shared_ptr<runtime::ControlPlane> control_plane,
                            executor::GuardedExecutor& executor,
                            const EnvironmentConfig& config,
                            runtime::ContainerSpec agent_spec);

    bool Launch() override;
    void Teardown() override;
    Container* Recreate(const std::string& container_id) override;

private:
    runtime::ContainerSpec agent_spec_;
};

/**
 * @class ComposeTopology
 * @brief Agent container plus the services of a compose manifest
 */
class ComposeTopology : public Topology {
public:
    ComposeTopology(std::shared_ptr<runtime::ControlPlane> control_plane,
                    executor::GuardedExecutor& executor,
                    const EnvironmentConfig& config,
                    runtime::ContainerSpec agent_spec,
                    std::filesystem::path manifest,
                    std::string project);

    bool Launch() override;
    void Teardown() override;
    Container* Recreate(const std::string& container_id) override;

    const std::filesystem::path& GetManifest() const { return manifest_; }
    const std::string& GetProject() const { return project_; }

private:
    runtime::ContainerSpec agent_spec_;
    std::filesystem::path manifest_;
    std::string project_;
    bool project_up_{false};
};

/// Agent name for a given incarnation ("name", "name-r1", "name-r2", ...)
std::string IncarnationName(const std::string& base_name, int incarnation);

} // namespace core
} // namespace ctfbox
