/**
 * @file environment_session.hpp
 * @brief Lifecycle of one challenge's container set
 *
 * The session is the composition root: it owns the executor, the process
 * supervisor, the health monitor, the restriction enforcer, the allocator and
 * the topology, and drives them through
 *
 * ```
 * CREATED → SETTING_UP → RESTRICTING → READY ⇄ RUNNING → TEARING_DOWN → CLOSED
 *                                       ▲         │
 *                                       └─ RECOVERING
 * (any state) → FAILED
 * ```
 *
 * Restriction is applied to every container after its setup and before the
 * first agent command. A dead container is recreated, re-provisioned and
 * re-restricted, at most max_retries times.
 *
 * @date 2025
 */

#pragma once

#include "ctfbox/core/config.hpp"
#include "ctfbox/core/execution_result.hpp"
#include "ctfbox/core/topology.hpp"
#include "ctfbox/executor/guarded_executor.hpp"
#include "ctfbox/executor/process_supervisor.hpp"
#include "ctfbox/monitors/health_monitor.hpp"
#include "ctfbox/network/port_pool.hpp"
#include "ctfbox/network/restriction_enforcer.hpp"
#include "ctfbox/network/topology_allocator.hpp"
#include "ctfbox/runtime/control_plane.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace ctfbox {
namespace core {

/**
 * @enum SessionState
 * @brief Lifecycle state of an EnvironmentSession
 */
enum class SessionState {
    CREATED,
    SETTING_UP,      ///< Allocation, launch and provisioning (full egress)
    RESTRICTING,     ///< Installing the egress firewall
    READY,
    RUNNING,         ///< Agent commands have been dispatched
    RECOVERING,      ///< Replacing a dead container
    TEARING_DOWN,
    CLOSED,
    FAILED
};

std::string ToString(SessionState state);

/**
 * @class Provisioner
 * @brief Setup collaborator run on each container before restriction
 */
class Provisioner {
public:
    virtual ~Provisioner() = default;

    /**
     * @brief Prepare one container (packages, files, tools)
     * @return true once setup is complete
     */
    virtual bool Setup(const Container& container, executor::GuardedExecutor& executor) = 0;
};

/**
 * @class CommandProvisioner
 * @brief Runs a fixed list of shell commands as SETUP calls
 */
class CommandProvisioner : public Provisioner {
public:
    /**
     * @param commands Run in order; the first non-zero exit stops setup
     * @param agent_only Skip challenge service containers
     */
    explicit CommandProvisioner(std::vector<std::string> commands, bool agent_only = true);

    bool Setup(const Container& container, executor::GuardedExecutor& executor) override;

private:
    std::vector<std::string> commands_;
    bool agent_only_;
};

/**
 * @struct FileCopy
 * @brief Host file or directory placed in the agent container
 */
struct FileCopy {
    std::filesystem::path host_path;
    std::string container_path;
};

/**
 * @struct ChallengeSpec
 * @brief What to launch for one challenge
 */
struct ChallengeSpec {
    std::optional<std::filesystem::path> compose_manifest;   ///< Compose topology when set
    std::vector<std::uint16_t> internal_ports;                 ///< Challenge ports on the primary service
    std::string primary_service;                               ///< Empty = first service
    std::string image;                                         ///< Agent image; empty = config default
    std::map<std::string, std::string> environment;            ///< Agent container environment
    std::vector<FileCopy> files;                               ///< Copied into the agent before setup
};

/**
 * @struct SessionReport
 * @brief Snapshot of a session for the operator
 */
struct SessionReport {
    std::string session;
    SessionState state{SessionState::CREATED};
    std::optional<SessionState> failed_phase;     ///< Phase the session failed in
    std::optional<ErrorKind> error_kind;
    std::string error_message;
    std::vector<monitors::HealthRecord> health;
    std::map<std::string, network::RestrictionOutcome> restriction;   ///< Keyed by container name
    int recoveries{0};
    std::optional<network::TopologyAllocation> allocation;

    nlohmann::json ToJSON() const;
};

/**
 * @class EnvironmentSession
 * @brief Owns and drives the containers of one challenge instance
 *
 * Usage:
 * @code
 * auto config = LoadConfigFromEnvironment();
 * auto docker = std::make_shared<runtime::DockerCli>(config.docker_binary);
 * EnvironmentSession session(config, challenge, docker, provisioner);
 * if (session.Start()) {
 *     auto result = session.Execute("ls -la");
 * }
 * session.Teardown();
 * @endcode
 *
 * One request runs at a time. The health monitor probes from its own thread.
 */
class EnvironmentSession {
public:
    /// Called after every state change, with the session's operation lock held
    using StateListener = std::function<void(SessionState from, SessionState to)>;

    /**
     * @brief Constructor
     * @throws ConfigError if @p config is invalid
     * @throws std::invalid_argument if @p control_plane is null
     */
    EnvironmentSession(const EnvironmentConfig& config,
                       ChallengeSpec challenge,
                       std::shared_ptr<runtime::ControlPlane> control_plane,
                       std::shared_ptr<Provisioner> provisioner = nullptr);
    ~EnvironmentSession();

    EnvironmentSession(const EnvironmentSession&) = delete;
    EnvironmentSession& operator=(const EnvironmentSession&) = delete;

    /**
     * @brief Allocate, launch, provision and restrict
     * @return true when the session reached READY
     */
    bool Start();

    /**
     * @brief Run one agent request
     *
     * Only accepted in READY or RUNNING. A timeout triggers a probe: a healthy
     * container has the stuck tree escalated, a dead one is recovered.
     */
    ExecutionResult Execute(const ExecutionRequest& request);
    ExecutionResult Execute(const std::string& command,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Refuse new requests, interrupt the in-flight command once, tear down
    void Cancel();

    /// Stop monitoring, remove containers and release allocations (idempotent)
    void Teardown();

    void AddStateListener(StateListener listener);

    /// Firewall installed by Start() and recovery (default: RestrictionRuleSet::Default())
    void SetRestrictionRules(network::RestrictionRuleSet rule_set);

    SessionState GetState() const;
    SessionReport GetReport() const;
    const std::string& GetName() const { return name_; }

    /// Id of the agent container (empty before Start)
    std::string GetPrimaryContainerId() const;

    /// Ids of every container, agent first
    std::vector<std::string> GetContainerIds() const;

    std::optional<network::TopologyAllocation> GetAllocation() const;

    executor::GuardedExecutor& GetExecutor() { return *executor_; }
    monitors::HealthMonitor& GetHealthMonitor() { return *monitor_; }

private:
    void TransitionTo(SessionState next);
    void Fail(SessionState phase, ErrorKind kind, const std::string& message);

    bool Allocate(runtime::ContainerSpec& agent_spec);
    bool Provision(const Container& container);
    bool RestrictAll();
    bool RestrictOne(const Container& container);

    void HandleTimeout(const std::string& container_id, std::uint64_t generation);
    void OnContainerDead(const monitors::HealthRecord& record);
    void QueueRecovery(const std::string& container_id);
    bool RunPendingRecovery();
    bool Recover(const std::string& container_id);

    void RefreshContainerIds();

    EnvironmentConfig config_;
    ChallengeSpec challenge_;
    std::string name_;
    std::shared_ptr<runtime::ControlPlane> control_plane_;
    std::shared_ptr<Provisioner> provisioner_;
    network::RestrictionRuleSet rule_set_;

    // Destroyed in reverse order: topology first, executor last
    std::unique_ptr<executor::GuardedExecutor> executor_;
    std::unique_ptr<executor::ProcessSupervisor> supervisor_;
    std::unique_ptr<monitors::HealthMonitor> monitor_;
    std::unique_ptr<network::RestrictionEnforcer> enforcer_;
    std::unique_ptr<network::PortPool> port_pool_;
    std::unique_ptr<network::TopologyAllocator> allocator_;
    std::unique_ptr<Topology> topology_;

    /// Serializes Start/Execute/recovery/teardown
    std::mutex op_mutex_;
    std::atomic<std::thread::id> op_thread_{};

    mutable std::mutex state_mutex_;
    SessionState state_{SessionState::CREATED};
    std::optional<SessionState> failed_phase_;
    std::optional<ErrorKind> error_kind_;
    std::string error_message_;
    std::map<std::string, network::RestrictionOutcome> restriction_;
    int recoveries_{0};
    std::optional<network::TopologyAllocation> allocation_;
    std::vector<std::string> container_ids_;
    std::set<std::string> pending_recovery_;
    std::vector<StateListener> listeners_;

    std::atomic<bool> cancelled_{false};
    std::atomic<bool> teardown_started_{false};
};

} // namespace core
} // namespace ctfbox
