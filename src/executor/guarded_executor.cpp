/**
 * @file guarded_executor.cpp
 * @brief Deadline-bounded container exec
 *
 * **Call lifecycle**:
 * ```
 * caller ── dispatch(gen) ──► worker thread ── docker exec ──► container
 *    │                            │
 *    │◄── output chunks ──────────┤  (shared CallState)
 *    │
 *    ├─ worker done first   → Completed / Failed
 *    └─ deadline first      → TimedOut, worker abandoned, container held
 *                              until ConfirmResponsive()
 * ```
 *
 * @date 2025
 */

#include "ctfbox/executor/guarded_executor.hpp"
#include "ctfbox/utils/string_utils.hpp"

#include <algorithm>
#include <condition_variable>

namespace ctfbox {
namespace executor {

using core::CallKind;
using core::ErrorKind;
using core::ExecutionRequest;
using core::ExecutionResult;
using core::TimeoutReason;
using utils::StringUtils;

namespace {

using Clock = std::chrono::steady_clock;

/// State shared between the caller and one exec worker
struct ExecCallState {
    std::mutex mutex;
    std::condition_variable cv;

    std::string output;
    Clock::time_point last_output;

    bool done{false};
    bool abandoned{false};
    int exit_code{0};
    std::optional<std::string> connection_error;
    std::optional<std::string> error;
};

/// Calls that stay allowed while a container awaits confirmation
bool AllowedWhileAwaiting(CallKind kind) {
    return kind == CallKind::HEALTH_PROBE ||
           kind == CallKind::PROCESS_LIST ||
           kind == CallKind::INTERRUPT;
}

std::chrono::milliseconds ElapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

GuardedExecutor::GuardedExecutor(std::shared_ptr<runtime::ControlPlane> control_plane,
                                 const core::TimeoutPolicy& timeouts)
    : control_plane_(std::move(control_plane))
    , timeouts_(timeouts)
    , abandoned_(std::make_shared<std::atomic<std::size_t>>(0)) {
    if (!control_plane_) {
        throw std::invalid_argument("GuardedExecutor requires a control plane");
    }
}

GuardedExecutor::~GuardedExecutor() {
    auto abandoned = abandoned_->load();
    if (abandoned > 0) {
        spdlog::debug("Executor destroyed with {} abandoned worker(s) still running", abandoned);
    }
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult GuardedExecutor::Execute(const std::string& container_id,
                                         const std::string& command,
                                         std::optional<std::chrono::milliseconds> timeout_override) {
    ExecutionRequest request;
    request.command = command;
    request.timeout = timeout_override;
    request.kind = CallKind::AGENT_COMMAND;
    return Execute(container_id, request);
}

ExecutionResult GuardedExecutor::Execute(const std::string& container_id,
                                         const ExecutionRequest& request) {
    if (!AllowedWhileAwaiting(request.kind) && IsAwaitingConfirmation(container_id)) {
        spdlog::warn("Refusing {} on {}: awaiting health confirmation after a timeout",
                     core::ToString(request.kind), container_id);
        return ExecutionResult::MakeFailed(
            "container " + container_id + " is awaiting confirmation after a timeout",
            ErrorKind::COMMAND_FAILED);
    }

    const auto budget = BudgetFor(request);
    const bool watch_output = request.kind == CallKind::AGENT_COMMAND;
    const auto generation = next_generation_.fetch_add(1);

    runtime::ExecOptions options;
    options.privileged = request.privileged;
    options.user = request.user;
    options.marker = MarkerFor(generation);

    auto state = std::make_shared<ExecCallState>();
    const auto start = Clock::now();
    state->last_output = start;

    spdlog::debug("[gen {}] {} on {}: {}", generation, core::ToString(request.kind),
                  container_id, StringUtils::Truncate(request.command, 200));

    auto control_plane = control_plane_;
    auto abandoned_count = abandoned_;
    std::string command = request.command;

    if (watch_output) {
        SetInFlight(container_id, generation);
    }

    std::thread([state, control_plane, abandoned_count, container_id, command, options, generation]() {
        auto on_output = [state](const std::string& chunk) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->output += chunk;
            state->last_output = Clock::now();
            state->cv.notify_all();
        };

        std::optional<runtime::RawExecResult> raw;
        std::optional<std::string> connection_error;
        std::optional<std::string> error;

        try {
            raw = control_plane->Exec(container_id, command, options, on_output);
        }
        catch (const runtime::ControlPlaneError& e) {
            connection_error = e.what();
        }
        catch (const std::exception& e) {
            error = e.what();
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        state->done = true;
        state->connection_error = connection_error;
        state->error = error;
        if (raw) {
            state->exit_code = raw->exit_code;
            // The full result is authoritative over streamed chunks
            state->output = raw->output;
        }
        if (state->abandoned) {
            abandoned_count->fetch_sub(1);
            spdlog::debug("[gen {}] Discarding late result from {} (exit {})",
                          generation, container_id, state->exit_code);
        }
        state->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(state->mutex);
    const auto deadline = start + budget;

    while (!state->done) {
        auto wake = deadline;
        if (watch_output) {
            wake = std::min(wake, state->last_output + timeouts_.no_output_timeout);
        }

        state->cv.wait_until(lock, wake);
        if (state->done) {
            break;
        }

        auto now = Clock::now();
        std::optional<TimeoutReason> reason;
        if (now >= deadline) {
            reason = TimeoutReason::DEADLINE;
        } else if (watch_output && now >= state->last_output + timeouts_.no_output_timeout) {
            reason = TimeoutReason::NO_OUTPUT;
        }

        if (reason) {
            state->abandoned = true;
            abandoned_->fetch_add(1);
            std::string partial = state->output;
            lock.unlock();

            if (watch_output) {
                SetInFlight(container_id, std::nullopt);
            }

            MarkAwaitingConfirmation(container_id);

            auto elapsed = ElapsedSince(start);
            spdlog::warn("[gen {}] Command timed out ({}) on {} after {} ms: {}",
                         generation, core::ToString(*reason), container_id, elapsed.count(),
                         StringUtils::Truncate(request.command, 200));

            auto result = ExecutionResult::MakeTimedOut(std::move(partial), *reason);
            result.generation = generation;
            result.elapsed = elapsed;
            return result;
        }
    }

    ExecutionResult result;
    if (state->connection_error) {
        spdlog::error("[gen {}] Control plane error on {}: {}", generation, container_id,
                      *state->connection_error);
        result = ExecutionResult::MakeFailed(*state->connection_error, ErrorKind::CONNECTION_FAILURE);
    } else if (state->error) {
        spdlog::error("[gen {}] Exec failed on {}: {}", generation, container_id, *state->error);
        result = ExecutionResult::MakeFailed(*state->error, ErrorKind::COMMAND_FAILED);
    } else {
        result = ExecutionResult::MakeCompleted(state->output, state->exit_code);
    }
    lock.unlock();

    if (watch_output) {
        SetInFlight(container_id, std::nullopt);
    }

    result.generation = generation;
    result.elapsed = ElapsedSince(start);
    spdlog::debug("[gen {}] {} in {} ms", generation, core::Describe(result), result.elapsed.count());
    return result;
}

// ============================================================================
// BUDGETS
// ============================================================================

std::chrono::milliseconds GuardedExecutor::BudgetFor(const ExecutionRequest& request) const {
    std::chrono::milliseconds budget;

    if (request.timeout) {
        budget = *request.timeout;
    } else {
        switch (request.kind) {
            case CallKind::AGENT_COMMAND:
                budget = timeouts_.action_timeout;
                break;
            case CallKind::HEALTH_PROBE:
            case CallKind::PROCESS_LIST:
            case CallKind::INTERRUPT:
                budget = timeouts_.health_check_timeout;
                break;
            case CallKind::RESTRICTION:
            case CallKind::SETUP:
            default:
                budget = timeouts_.docker_exec_timeout;
                break;
        }
    }

    return std::min(budget, timeouts_.docker_exec_timeout);
}

// ============================================================================
// CONFIRMATION TRACKING
// ============================================================================

bool GuardedExecutor::IsAwaitingConfirmation(const std::string& container_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return awaiting_confirmation_.count(container_id) > 0;
}

void GuardedExecutor::ConfirmResponsive(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (awaiting_confirmation_.erase(container_id) > 0) {
        spdlog::info("Container {} confirmed responsive", container_id);
    }
}

void GuardedExecutor::Forget(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    awaiting_confirmation_.erase(container_id);
    in_flight_.erase(container_id);
}

std::optional<std::uint64_t> GuardedExecutor::InFlightGeneration(const std::string& container_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(container_id);
    if (it == in_flight_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void GuardedExecutor::SetInFlight(const std::string& container_id, std::optional<std::uint64_t> generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation) {
        in_flight_[container_id] = *generation;
    } else {
        in_flight_.erase(container_id);
    }
}

void GuardedExecutor::MarkAwaitingConfirmation(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    awaiting_confirmation_.insert(container_id);
}

std::string GuardedExecutor::MarkerFor(std::uint64_t generation) {
    return "ctfbox-cmd-" + std::to_string(generation);
}

} // namespace executor
} // namespace ctfbox
