/**
 * @file guarded_executor.hpp
 * @brief Wall-clock deadlines around blocking control-plane calls
 *
 * Every call runs on its own detached worker thread. The caller waits on the
 * worker for at most the call's budget and then returns, whatever the worker
 * is doing. An abandoned worker keeps its own references to the control plane
 * and its call state, so it can finish (or hang) without touching anything
 * the caller still owns. Its late result is discarded.
 *
 * After a timeout the target container is held as *awaiting confirmation*:
 * agent, setup and restriction calls against it are refused until a health
 * probe reports it responsive again.
 *
 * @date 2025
 */

#pragma once

#include "ctfbox/core/config.hpp"
#include "ctfbox/core/execution_result.hpp"
#include "ctfbox/runtime/control_plane.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <type_traits>

namespace ctfbox {
namespace executor {

/**
 * @struct Guarded
 * @brief Outcome of a Guard() call
 */
template <typename T>
struct Guarded {
    std::optional<T> value;   ///< Set when the call returned in time
    bool timed_out{false};    ///< Deadline fired first
    std::string error;        ///< Exception text when the call threw
    bool connection_error{false};   ///< The exception was a ControlPlaneError

    explicit operator bool() const { return value.has_value(); }
};

/**
 * @class GuardedExecutor
 * @brief Runs container commands and control-plane operations under deadlines
 *
 * Thread-safe. The session thread and the health monitor thread share one
 * instance.
 */
class GuardedExecutor {
public:
    /**
     * @brief Constructor
     * @param control_plane Runtime backend (shared with abandoned workers)
     * @param timeouts Session deadlines
     */
    GuardedExecutor(std::shared_ptr<runtime::ControlPlane> control_plane,
                    const core::TimeoutPolicy& timeouts);
    ~GuardedExecutor();

    GuardedExecutor(const GuardedExecutor&) = delete;
    GuardedExecutor& operator=(const GuardedExecutor&) = delete;

    /**
     * @brief Run an agent command
     * @param container_id Target container
     * @param command Shell command
     * @param timeout_override Budget replacing action_timeout
     */
    core::ExecutionResult Execute(const std::string& container_id,
                                  const std::string& command,
                                  std::optional<std::chrono::milliseconds> timeout_override = std::nullopt);

    /**
     * @brief Run any in-container request
     *
     * Never blocks past the request's budget. Returns Completed, TimedOut, or
     * Failed (ConnectionFailure when the runtime is unreachable, CommandFailed
     * when the container is awaiting confirmation).
     */
    core::ExecutionResult Execute(const std::string& container_id,
                                  const core::ExecutionRequest& request);

    /**
     * @brief Run an arbitrary control-plane operation under a deadline
     *
     * @p fn runs on a detached thread and may outlive this call, so it must
     * capture everything it needs by value.
     *
     * @param operation Name used in logs
     * @param timeout Budget
     * @param fn Callable returning a value
     */
    template <typename Fn>
    auto Guard(const std::string& operation, std::chrono::milliseconds timeout, Fn fn)
        -> Guarded<std::invoke_result_t<Fn>>;

    /// Effective budget of a request: min(override or kind default, docker_exec_timeout)
    std::chrono::milliseconds BudgetFor(const core::ExecutionRequest& request) const;

    /// True while the container is awaiting confirmation after a timeout
    bool IsAwaitingConfirmation(const std::string& container_id) const;

    /// Clear the awaiting-confirmation mark (after a successful probe)
    void ConfirmResponsive(const std::string& container_id);

    /// Drop all state about a container that has been replaced
    void Forget(const std::string& container_id);

    /// Generation of the agent command currently waited on for @p container_id
    std::optional<std::uint64_t> InFlightGeneration(const std::string& container_id) const;

    /// Tag placed in the process list of the command dispatched as @p generation
    static std::string MarkerFor(std::uint64_t generation);

    /// Workers abandoned by a deadline that have not yet returned
    std::size_t AbandonedWorkers() const { return abandoned_->load(); }

    const core::TimeoutPolicy& GetTimeouts() const { return timeouts_; }
    std::shared_ptr<runtime::ControlPlane> GetControlPlane() const { return control_plane_; }

private:
    void MarkAwaitingConfirmation(const std::string& container_id);
    void SetInFlight(const std::string& container_id, std::optional<std::uint64_t> generation);

    std::shared_ptr<runtime::ControlPlane> control_plane_;
    core::TimeoutPolicy timeouts_;

    std::atomic<std::uint64_t> next_generation_{1};
    std::shared_ptr<std::atomic<std::size_t>> abandoned_;

    mutable std::mutex mutex_;
    std::set<std::string> awaiting_confirmation_;
    std::map<std::string, std::uint64_t> in_flight_;
};

// ============================================================================
// TEMPLATE IMPLEMENTATION
// ============================================================================

template <typename Fn>
auto GuardedExecutor::Guard(const std::string& operation, std::chrono::milliseconds timeout, Fn fn)
    -> Guarded<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;

    struct CallState {
        std::promise<Result> promise;
        std::atomic<bool> settled{false};   ///< First of worker/caller to finish claims it
    };

    auto state = std::make_shared<CallState>();
    auto future = state->promise.get_future();
    auto abandoned_count = abandoned_;
    auto start = std::chrono::steady_clock::now();

    std::thread([state, abandoned_count, operation, fn = std::move(fn)]() mutable {
        try {
            state->promise.set_value(fn());
        }
        catch (...) {
            state->promise.set_exception(std::current_exception());
        }
        if (state->settled.exchange(true)) {
            abandoned_count->fetch_sub(1);
            spdlog::debug("Discarding late result of {}", operation);
        }
    }).detach();

    Guarded<Result> guarded;

    if (future.wait_for(timeout) != std::future_status::ready) {
        abandoned_count->fetch_add(1);
        if (state->settled.exchange(true)) {
            // Worker finished between the wait and the claim
            abandoned_count->fetch_sub(1);
        } else {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            spdlog::warn("{} timed out after {} ms", operation, elapsed.count());
            guarded.timed_out = true;
            return guarded;
        }
    }

    try {
        guarded.value = future.get();
    }
    catch (const runtime::ControlPlaneError& e) {
        guarded.error = e.what();
        guarded.connection_error = true;
        spdlog::error("{} failed: {}", operation, e.what());
    }
    catch (const std::exception& e) {
        guarded.error = e.what();
        spdlog::error("{} failed: {}", operation, e.what());
    }
    return guarded;
}

} // namespace executor
} // namespace ctfbox
