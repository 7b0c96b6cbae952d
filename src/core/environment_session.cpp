/**
 * @file environment_session.cpp
 * @brief Session lifecycle, timeout handling and container recovery
 *
 * **Threads**:
 * - the caller's thread runs Start(), Execute() and Teardown(), serialized by
 *   op_mutex_
 * - the health monitor thread probes every container and reports dead ones;
 *   it recovers directly when no operation is running, otherwise it queues
 *   the container for the next operation to recover
 *
 * @date 2025
 */

#include "ctfbox/core/environment_session.hpp"
#include "ctfbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <stdexcept>

using json = nlohmann::json;

namespace ctfbox {
namespace core {

using utils::StringUtils;

namespace {

/// Marks the current thread as the one holding op_mutex_
class OperationScope {
public:
    explicit OperationScope(std::atomic<std::thread::id>& owner)
        : owner_(owner) {
        owner_.store(std::this_thread::get_id());
    }
    ~OperationScope() { owner_.store(std::thread::id()); }

    OperationScope(const OperationScope&) = delete;
    OperationScope& operator=(const OperationScope&) = delete;

private:
    std::atomic<std::thread::id>& owner_;
};

} // anonymous namespace

std::string ToString(SessionState state) {
    switch (state) {
        case SessionState::CREATED: return "Created";
        case SessionState::SETTING_UP: return "SettingUp";
        case SessionState::RESTRICTING: return "Restricting";
        case SessionState::READY: return "Ready";
        case SessionState::RUNNING: return "Running";
        case SessionState::RECOVERING: return "Recovering";
        case SessionState::TEARING_DOWN: return "TearingDown";
        case SessionState::CLOSED: return "Closed";
        case SessionState::FAILED: return "Failed";
        default: return "Unknown";
    }
}

// ============================================================================
// COMMAND PROVISIONER
// ============================================================================

CommandProvisioner::CommandProvisioner(std::vector<std::string> commands, bool agent_only)
    : commands_(std::move(commands))
    , agent_only_(agent_only) {}

bool CommandProvisioner::Setup(const Container& container, executor::GuardedExecutor& executor) {
    if (agent_only_ && container.role != ContainerRole::AGENT) {
        return true;
    }

    for (const auto& command : commands_) {
        ExecutionRequest request;
        request.command = command;
        request.kind = CallKind::SETUP;

        auto result = executor.Execute(container.id, request);
        if (!result.Succeeded()) {
            spdlog::error("Setup command failed on {} ({}): {}", container.name,
                          Describe(result), StringUtils::Truncate(command, 200));
            if (!result.Output().empty()) {
                spdlog::debug("Setup output: {}", StringUtils::Truncate(result.Output(), 2000));
            }
            return false;
        }
    }

    if (!commands_.empty()) {
        spdlog::info("  ✓ {} setup command(s) on {}", commands_.size(), container.name);
    }
    return true;
}

// ============================================================================
// REPORT
// ============================================================================

json SessionReport::ToJSON() const {
    json j;
    j["session"] = session;
    j["state"] = ToString(state);
    j["failed_phase"] = failed_phase ? json(ToString(*failed_phase)) : json(nullptr);
    j["error_kind"] = error_kind ? json(ToString(*error_kind)) : json(nullptr);
    j["error_message"] = error_message;
    j["recoveries"] = recoveries;

    json health_array = json::array();
    for (const auto& record : health) {
        health_array.push_back(record.ToJSON());
    }
    j["health"] = health_array;

    json restriction_map = json::object();
    for (const auto& [name, outcome] : restriction) {
        restriction_map[name] = outcome.ToJSON();
    }
    j["restriction"] = restriction_map;

    j["allocation"] = allocation ? allocation->ToJSON() : json(nullptr);
    return j;
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

EnvironmentSession::EnvironmentSession(const EnvironmentConfig& config,
                                       ChallengeSpec challenge,
                                       std::shared_ptr<runtime::ControlPlane> control_plane,
                                       std::shared_ptr<Provisioner> provisioner)
    : config_(config)
    , challenge_(std::move(challenge))
    , control_plane_(std::move(control_plane))
    , provisioner_(std::move(provisioner))
    , rule_set_(network::RestrictionRuleSet::Default()) {
    ValidateConfig(config_);

    if (!control_plane_) {
        throw std::invalid_argument("EnvironmentSession requires a control plane");
    }

    std::string prefix = config_.session_name.empty() ? "ctfbox" : config_.session_name;
    name_ = prefix + "-" + StringUtils::RandomHex(8);

    executor_ = std::make_unique<executor::GuardedExecutor>(control_plane_, config_.timeouts);
    supervisor_ = std::make_unique<executor::ProcessSupervisor>(*executor_);
    monitor_ = std::make_unique<monitors::HealthMonitor>(*executor_);
    enforcer_ = std::make_unique<network::RestrictionEnforcer>(*executor_);

    monitor_->SetDeadCallback([this](const monitors::HealthRecord& record) { OnContainerDead(record); });

    spdlog::debug("Session {} created", name_);
}

EnvironmentSession::~EnvironmentSession() {
    Teardown();
}

// ============================================================================
// START
// ============================================================================

bool EnvironmentSession::Start() {
    std::lock_guard<std::mutex> op(op_mutex_);
    OperationScope scope(op_thread_);

    if (GetState() != SessionState::CREATED) {
        spdlog::error("Session {} cannot start from state {}", name_, ToString(GetState()));
        return false;
    }
    if (cancelled_ || teardown_started_) {
        spdlog::error("Session {} was cancelled before start", name_);
        return false;
    }

    spdlog::info("Starting session {}", name_);
    TransitionTo(SessionState::SETTING_UP);

    runtime::ContainerSpec agent_spec;
    agent_spec.image = challenge_.image.empty() ? config_.agent_image : challenge_.image;
    agent_spec.name = name_;
    for (const auto& [key, value] : challenge_.environment) {
        agent_spec.environment.push_back(key + "=" + value);
    }

    try {
        if (!Allocate(agent_spec)) {
            return false;
        }

        if (!topology_->Launch()) {
            Fail(SessionState::SETTING_UP, ErrorKind::COMMAND_FAILED, "topology launch failed");
            return false;
        }
    }
    catch (const network::AllocationError& e) {
        Fail(SessionState::SETTING_UP, ErrorKind::ALLOCATION_EXHAUSTION, e.what());
        return false;
    }
    catch (const runtime::ControlPlaneError& e) {
        Fail(SessionState::SETTING_UP, ErrorKind::CONNECTION_FAILURE, e.what());
        return false;
    }
    catch (const std::exception& e) {
        Fail(SessionState::SETTING_UP, ErrorKind::COMMAND_FAILED, e.what());
        return false;
    }

    RefreshContainerIds();

    // Setup runs with full egress
    for (const auto& container : topology_->Containers()) {
        if (!Provision(container)) {
            Fail(SessionState::SETTING_UP, ErrorKind::COMMAND_FAILED, "setup failed on " + container.name);
            return false;
        }
    }

    TransitionTo(SessionState::RESTRICTING);
    if (config_.enable_network_restriction) {
        if (!RestrictAll()) {
            return false;
        }
    } else {
        spdlog::warn("Network restriction disabled; containers keep full egress");
    }

    if (config_.enable_health_monitor) {
        monitor_->Start([this]() { return GetContainerIds(); });
    }

    TransitionTo(SessionState::READY);
    spdlog::info("✓ Session {} ready ({} container(s))", name_, topology_->Containers().size());
    return true;
}

bool EnvironmentSession::Allocate(runtime::ContainerSpec& agent_spec) {
    port_pool_ = std::make_unique<network::PortPool>(config_.port_pool);
    allocator_ = std::make_unique<network::TopologyAllocator>(*port_pool_, control_plane_, *executor_, config_);

    network::TopologyAllocation allocation;
    std::filesystem::path manifest;
    std::string project = name_;

    if (challenge_.compose_manifest && config_.enable_dynamic_ports) {
        network::AllocationRequest request;
        request.owner = name_;
        request.manifest = *challenge_.compose_manifest;
        request.extra_internal_ports = challenge_.internal_ports;
        request.primary_service = challenge_.primary_service;

        allocation = allocator_->Allocate(request);
        manifest = allocation.manifest_path;
        project = "ctfbox-" + allocation.suffix;
    } else if (config_.enable_dynamic_ports) {
        allocation = allocator_->AllocateNetwork(name_);
    } else {
        allocation.owner = name_;
        allocation.network = allocator_->EnsureFixedNetwork();
        if (challenge_.compose_manifest) {
            manifest = *challenge_.compose_manifest;
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        allocation_ = allocation;
    }

    runtime::NetworkAttachment attachment;
    attachment.network = allocation.network.name;
    agent_spec.networks = {attachment};

    if (challenge_.compose_manifest) {
        topology_ = std::make_unique<ComposeTopology>(control_plane_, *executor_, config_,
                                                      agent_spec, manifest, project);
    } else {
        topology_ = std::make_unique<SingleContainerTopology>(control_plane_, *executor_, config_, agent_spec);
    }
    return true;
}

bool EnvironmentSession::Provision(const Container& container) {
    if (container.role == ContainerRole::AGENT) {
        for (const auto& file : challenge_.files) {
            if (!std::filesystem::exists(file.host_path)) {
                spdlog::error("Cannot copy {}: no such file or directory", file.host_path.string());
                return false;
            }

            auto control_plane = control_plane_;
            auto id = container.id;
            auto copied = executor_->Guard("copy " + file.host_path.filename().string(),
                                           config_.timeouts.docker_exec_timeout,
                                           [control_plane, id, file]() {
                                               return control_plane->CopyToContainer(id, file.host_path,
                                                                                     file.container_path);
                                           });
            if (!copied || !*copied.value) {
                spdlog::error("Failed to copy {} into {}", file.host_path.string(), container.name);
                return false;
            }
            spdlog::info("  ✓ Copied {} -> {}", file.host_path.string(), file.container_path);
        }
    }

    if (!provisioner_) {
        return true;
    }

    try {
        return provisioner_->Setup(container, *executor_);
    }
    catch (const std::exception& e) {
        spdlog::error("Provisioning {} threw: {}", container.name, e.what());
        return false;
    }
}

bool EnvironmentSession::RestrictAll() {
    auto restriction = enforcer_->ApplyAll(*topology_, rule_set_);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [name, outcome] : restriction.per_container) {
            restriction_[name] = outcome;
        }
    }

    if (!restriction.success) {
        Fail(SessionState::RESTRICTING, ErrorKind::RESTRICTION_FAILURE, restriction.cause);
        return false;
    }
    return true;
}

bool EnvironmentSession::RestrictOne(const Container& container) {
    auto outcome = enforcer_->Apply(container.id, rule_set_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        restriction_[container.name] = outcome;
    }
    return outcome.success;
}

// ============================================================================
// EXECUTE
// ============================================================================

ExecutionResult EnvironmentSession::Execute(const std::string& command,
                                            std::optional<std::chrono::milliseconds> timeout) {
    ExecutionRequest request;
    request.command = command;
    request.timeout = timeout;
    request.kind = CallKind::AGENT_COMMAND;
    return Execute(request);
}

ExecutionResult EnvironmentSession::Execute(const ExecutionRequest& request) {
    std::lock_guard<std::mutex> op(op_mutex_);
    OperationScope scope(op_thread_);

    if (cancelled_ || teardown_started_) {
        return ExecutionResult::MakeFailed("session " + name_ + " is cancelled", ErrorKind::COMMAND_FAILED);
    }

    RunPendingRecovery();

    auto state = GetState();
    if (state != SessionState::READY && state != SessionState::RUNNING) {
        return ExecutionResult::MakeFailed("session " + name_ + " is " + ToString(state),
                                           ErrorKind::COMMAND_FAILED);
    }

    const Container* primary = topology_->Primary();
    if (primary == nullptr) {
        return ExecutionResult::MakeFailed("session has no agent container", ErrorKind::COMMAND_FAILED);
    }
    const std::string container_id = primary->id;

    if (state == SessionState::READY) {
        TransitionTo(SessionState::RUNNING);
    }

    auto result = executor_->Execute(container_id, request);

    if (result.IsTimedOut()) {
        HandleTimeout(container_id, result.generation);
    } else if (result.IsFailed()) {
        const auto& failed = std::get<Failed>(result.outcome);
        if (failed.kind == ErrorKind::CONNECTION_FAILURE) {
            spdlog::warn("Control plane unreachable for {}: {}", name_, failed.cause);
        }
    }

    RunPendingRecovery();
    return result;
}

void EnvironmentSession::HandleTimeout(const std::string& container_id, std::uint64_t generation) {
    const int max_probes = config_.timeouts.max_retries;

    auto record = monitor_->Probe(container_id);
    for (int probes = 1; record.state == HealthState::DEGRADED && probes < max_probes; ++probes) {
        record = monitor_->Probe(container_id);
    }

    if (record.state == HealthState::HEALTHY) {
        auto marker = executor::GuardedExecutor::MarkerFor(generation);
        auto outcome = supervisor_->Escalate(container_id, marker);
        if (!outcome.terminated) {
            spdlog::warn("Stuck command {} survived escalation: {}", marker, outcome.message);
        }
    } else if (record.state == HealthState::DEAD) {
        QueueRecovery(container_id);
    }
}

// ============================================================================
// RECOVERY
// ============================================================================

void EnvironmentSession::OnContainerDead(const monitors::HealthRecord& record) {
    if (teardown_started_) {
        return;
    }

    spdlog::error("Container {} is dead: {}", record.container_id, record.last_failure);

    if (op_thread_.load() == std::this_thread::get_id()) {
        QueueRecovery(record.container_id);
        return;
    }

    std::unique_lock<std::mutex> op(op_mutex_, std::try_to_lock);
    QueueRecovery(record.container_id);
    if (!op.owns_lock()) {
        // The running operation recovers on its way out
        return;
    }

    OperationScope scope(op_thread_);
    RunPendingRecovery();
}

void EnvironmentSession::QueueRecovery(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    pending_recovery_.insert(container_id);
}

bool EnvironmentSession::RunPendingRecovery() {
    std::set<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending.swap(pending_recovery_);
    }

    for (const auto& container_id : pending) {
        if (!Recover(container_id)) {
            return false;
        }
    }
    return true;
}

bool EnvironmentSession::Recover(const std::string& container_id) {
    auto state = GetState();
    if (!topology_ || teardown_started_ || state == SessionState::FAILED ||
        state == SessionState::CREATED) {
        return false;
    }
    if (topology_->Find(container_id) == nullptr) {
        spdlog::debug("Container {} already replaced", container_id);
        return true;
    }

    TransitionTo(SessionState::RECOVERING);

    const int attempts = config_.timeouts.max_retries;
    std::string current_id = container_id;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        spdlog::warn("Recovering container {} (attempt {}/{})", current_id, attempt, attempts);

        Container* replacement = topology_->Recreate(current_id);
        if (replacement == nullptr) {
            continue;
        }

        Container fresh = *replacement;
        if (fresh.id != current_id) {
            monitor_->Forget(current_id);
            executor_->Forget(current_id);
            current_id = fresh.id;
        }
        RefreshContainerIds();

        if (!Provision(fresh)) {
            spdlog::error("Setup failed on replacement {}", fresh.name);
            continue;
        }
        if (config_.enable_network_restriction && !RestrictOne(fresh)) {
            spdlog::error("Restriction failed on replacement {}", fresh.name);
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            recoveries_++;
        }
        spdlog::info("✓ Container {} recovered as {}", container_id, fresh.name);
        TransitionTo(SessionState::READY);
        return true;
    }

    Fail(SessionState::RECOVERING, ErrorKind::RECOVERY_FAILURE,
         "container " + container_id + " could not be recovered after " +
         std::to_string(attempts) + " attempt(s)");
    return false;
}

// ============================================================================
// CANCEL / TEARDOWN
// ============================================================================

void EnvironmentSession::Cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }
    spdlog::warn("Cancelling session {}", name_);

    auto primary_id = GetPrimaryContainerId();
    if (!primary_id.empty()) {
        if (auto generation = executor_->InFlightGeneration(primary_id)) {
            auto marker = executor::GuardedExecutor::MarkerFor(*generation);
            auto processes = supervisor_->ListProcesses(primary_id);
            if (processes) {
                std::vector<int> pids;
                for (const auto& process : executor::ProcessSupervisor::FindCommandTree(*processes, marker)) {
                    pids.push_back(process.pid);
                }
                if (!pids.empty()) {
                    spdlog::info("Interrupting in-flight command {} ({} process(es))", marker, pids.size());
                    supervisor_->Interrupt(primary_id, pids, SIGINT);
                }
            }
        }
    }

    Teardown();
}

void EnvironmentSession::Teardown() {
    if (teardown_started_.exchange(true)) {
        return;
    }

    monitor_->Stop();

    std::lock_guard<std::mutex> op(op_mutex_);
    OperationScope scope(op_thread_);

    const bool failed = GetState() == SessionState::FAILED;
    if (!failed) {
        TransitionTo(SessionState::TEARING_DOWN);
    }

    if (topology_) {
        topology_->Teardown();
    }

    std::optional<network::TopologyAllocation> allocation;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        allocation = allocation_;
    }
    if (allocation && allocator_) {
        if (!allocator_->Release(*allocation)) {
            spdlog::warn("Session {} left resources behind; see warnings above", name_);
        }
    }

    RefreshContainerIds();

    if (!failed) {
        TransitionTo(SessionState::CLOSED);
    }
    spdlog::info("Session {} torn down", name_);
}

// ============================================================================
// STATE
// ============================================================================

void EnvironmentSession::TransitionTo(SessionState next) {
    SessionState previous;
    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_;
        if (previous == next) {
            return;
        }
        state_ = next;
        listeners = listeners_;
    }

    spdlog::info("Session {}: {} -> {}", name_, ToString(previous), ToString(next));

    for (const auto& listener : listeners) {
        try {
            listener(previous, next);
        }
        catch (const std::exception& e) {
            spdlog::warn("State listener threw: {}", e.what());
        }
    }
}

void EnvironmentSession::Fail(SessionState phase, ErrorKind kind, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        failed_phase_ = phase;
        error_kind_ = kind;
        error_message_ = message;
    }
    spdlog::error("Session {} failed in {} [{}]: {}", name_, ToString(phase), ToString(kind), message);
    TransitionTo(SessionState::FAILED);
}

void EnvironmentSession::AddStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    listeners_.push_back(std::move(listener));
}

void EnvironmentSession::SetRestrictionRules(network::RestrictionRuleSet rule_set) {
    std::lock_guard<std::mutex> op(op_mutex_);
    rule_set_ = std::move(rule_set);
}

SessionState EnvironmentSession::GetState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

SessionReport EnvironmentSession::GetReport() const {
    SessionReport report;
    report.session = name_;
    report.health = monitor_->GetRecords();

    std::lock_guard<std::mutex> lock(state_mutex_);
    report.state = state_;
    report.failed_phase = failed_phase_;
    report.error_kind = error_kind_;
    report.error_message = error_message_;
    report.restriction = restriction_;
    report.recoveries = recoveries_;
    report.allocation = allocation_;
    return report;
}

std::string EnvironmentSession::GetPrimaryContainerId() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return container_ids_.empty() ? std::string() : container_ids_.front();
}

std::vector<std::string> EnvironmentSession::GetContainerIds() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return container_ids_;
}

std::optional<network::TopologyAllocation> EnvironmentSession::GetAllocation() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return allocation_;
}

void EnvironmentSession::RefreshContainerIds() {
    std::vector<std::string> ids;
    if (topology_) {
        for (const auto& container : topology_->Containers()) {
            ids.push_back(container.id);
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    container_ids_ = std::move(ids);
}

} // namespace core
} // namespace ctfbox
