/**
 * @file execution_result.hpp
 * @brief Execution requests, tagged execution results and the error taxonomy
 *
 * Callers branch on the variant tag of ExecutionResult instead of catching a
 * distinguished timeout exception.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace ctfbox {
namespace core {

/**
 * @enum ErrorKind
 * @brief Error taxonomy shared by every component
 */
enum class ErrorKind {
    TIMEOUT,                ///< Deadline exceeded, ultimate outcome unknown
    CONNECTION_FAILURE,     ///< Control plane unreachable or rejected the call
    RESTRICTION_FAILURE,    ///< Firewall rule rejected or verification failed
    ALLOCATION_EXHAUSTION,  ///< No free port / network within the bounded wait
    HEALTH_DEAD,            ///< Container failed repeated probes
    RECOVERY_FAILURE,       ///< Replacement container failed bring-up
    CONFIG_INVALID,         ///< Configuration rejected
    COMMAND_FAILED          ///< Call refused or failed for another reason
};

/**
 * @enum CallKind
 * @brief Logical operation a guarded call performs; selects its default budget
 */
enum class CallKind {
    AGENT_COMMAND,   ///< Agent-issued command (action_timeout, no-output watch)
    HEALTH_PROBE,    ///< Liveness probe (health_check_timeout)
    PROCESS_LIST,    ///< ps listing (health_check_timeout)
    INTERRUPT,       ///< Signal delivery (health_check_timeout)
    RESTRICTION,     ///< Firewall installation (docker_exec_timeout)
    SETUP            ///< Provisioning command (docker_exec_timeout)
};

/**
 * @struct ExecutionRequest
 * @brief One command to run inside a container
 */
struct ExecutionRequest {
    std::string command;                                   ///< Shell command
    std::optional<std::chrono::milliseconds> timeout;      ///< Override budget
    CallKind kind{CallKind::AGENT_COMMAND};                ///< Operation class
    bool privileged{false};                                ///< docker exec --privileged
    std::string user;                                      ///< docker exec -u (empty = image default)
};

/// Command ran to completion within budget
struct Completed {
    std::string output;   ///< Combined stdout/stderr
    int exit_code{0};     ///< Exit status of the command
};

/**
 * @enum TimeoutReason
 * @brief Which deadline fired
 */
enum class TimeoutReason {
    DEADLINE,   ///< Overall budget elapsed
    NO_OUTPUT   ///< No output for no_output_timeout
};

/// Deadline fired before the worker finished
struct TimedOut {
    std::string partial_output;                    ///< Output captured so far
    TimeoutReason reason{TimeoutReason::DEADLINE}; ///< Which deadline
};

/// Call could not be carried out
struct Failed {
    std::string cause;                            ///< Human-readable cause
    ErrorKind kind{ErrorKind::COMMAND_FAILED};    ///< Taxonomy entry
};

/**
 * @struct ExecutionResult
 * @brief Tagged outcome of one ExecutionRequest
 */
struct ExecutionResult {
    std::variant<Completed, TimedOut, Failed> outcome;  ///< Tagged outcome
    std::uint64_t generation{0};                        ///< Dispatch id (0 = never dispatched)
    std::chrono::milliseconds elapsed{0};               ///< Caller-side wait

    bool IsCompleted() const { return std::holds_alternative<Completed>(outcome); }
    bool IsTimedOut() const { return std::holds_alternative<TimedOut>(outcome); }
    bool IsFailed() const { return std::holds_alternative<Failed>(outcome); }

    /// Completed with exit code 0
    bool Succeeded() const {
        const auto* completed = std::get_if<Completed>(&outcome);
        return completed != nullptr && completed->exit_code == 0;
    }

    /// Output of a completed call, partial output of a timed-out one, else empty
    std::string Output() const;

    static ExecutionResult MakeCompleted(std::string output, int exit_code);
    static ExecutionResult MakeTimedOut(std::string partial_output, TimeoutReason reason);
    static ExecutionResult MakeFailed(std::string cause, ErrorKind kind);
};

std::string ToString(ErrorKind kind);
std::string ToString(CallKind kind);
std::string ToString(TimeoutReason reason);

/// One-line summary for logs ("completed exit=0", "timed out (no output)", ...)
std::string Describe(const ExecutionResult& result);

} // namespace core
} // namespace ctfbox
