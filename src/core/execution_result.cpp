#include "ctfbox/core/execution_result.hpp"

namespace ctfbox {
namespace core {

std::string ExecutionResult::Output() const {
    if (const auto* completed = std::get_if<Completed>(&outcome)) {
        return completed->output;
    }
    if (const auto* timed_out = std::get_if<TimedOut>(&outcome)) {
        return timed_out->partial_output;
    }
    return "";
}

ExecutionResult ExecutionResult::MakeCompleted(std::string output, int exit_code) {
    ExecutionResult result;
    result.outcome = Completed{std::move(output), exit_code};
    return result;
}

ExecutionResult ExecutionResult::MakeTimedOut(std::string partial_output, TimeoutReason reason) {
    ExecutionResult result;
    result.outcome = TimedOut{std::move(partial_output), reason};
    return result;
}

ExecutionResult ExecutionResult::MakeFailed(std::string cause, ErrorKind kind) {
    ExecutionResult result;
    result.outcome = Failed{std::move(cause), kind};
    return result;
}

std::string ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TIMEOUT: return "Timeout";
        case ErrorKind::CONNECTION_FAILURE: return "ConnectionFailure";
        case ErrorKind::RESTRICTION_FAILURE: return "RestrictionFailure";
        case ErrorKind::ALLOCATION_EXHAUSTION: return "AllocationExhaustion";
        case ErrorKind::HEALTH_DEAD: return "HealthDead";
        case ErrorKind::RECOVERY_FAILURE: return "RecoveryFailure";
        case ErrorKind::CONFIG_INVALID: return "ConfigInvalid";
        case ErrorKind::COMMAND_FAILED: return "CommandFailed";
    }
    return "Unknown";
}

std::string ToString(CallKind kind) {
    switch (kind) {
        case CallKind::AGENT_COMMAND: return "agent-command";
        case CallKind::HEALTH_PROBE: return "health-probe";
        case CallKind::PROCESS_LIST: return "process-list";
        case CallKind::INTERRUPT: return "interrupt";
        case CallKind::RESTRICTION: return "restriction";
        case CallKind::SETUP: return "setup";
    }
    return "unknown";
}

std::string ToString(TimeoutReason reason) {
    return reason == TimeoutReason::NO_OUTPUT ? "no output" : "deadline";
}

std::string Describe(const ExecutionResult& result) {
    if (const auto* completed = std::get_if<Completed>(&result.outcome)) {
        return "completed exit=" + std::to_string(completed->exit_code);
    }
    if (const auto* timed_out = std::get_if<TimedOut>(&result.outcome)) {
        return "timed out (" + ToString(timed_out->reason) + ")";
    }
    const auto& failed = std::get<Failed>(result.outcome);
    return "failed [" + ToString(failed.kind) + "]: " + failed.cause;
}

} // namespace core
} // namespace ctfbox
