/**
 * @file process_supervisor.hpp
 * @brief In-container process listing and signal escalation
 *
 * Used when a command blows its deadline but its container still answers
 * health probes: the stuck command's process tree is located by the marker
 * its dispatch carried and is signalled INT → TERM → KILL.
 *
 * @date 2025
 */

#pragma once

#include "ctfbox/core/execution_result.hpp"
#include "ctfbox/executor/guarded_executor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ctfbox {
namespace executor {

/**
 * @struct ProcessInfo
 * @brief One row of the container's process table
 */
struct ProcessInfo {
    int pid{0};             ///< Process ID
    int parent_pid{0};      ///< Parent process ID
    std::string command;    ///< Full command line
};

/**
 * @struct EscalationOutcome
 * @brief Result of signalling a stuck command tree
 */
struct EscalationOutcome {
    bool terminated{false};             ///< Tree is gone
    int escalations{0};                 ///< Signal rounds sent
    std::vector<std::string> signals;   ///< Signal names, in order sent
    std::string message;                ///< Failure cause when not terminated
};

/**
 * @class ProcessSupervisor
 * @brief Lists and signals processes inside a container
 *
 * Every call is routed through the GuardedExecutor with health_check_timeout
 * budgets, so a wedged container cannot stall the supervisor either.
 */
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(GuardedExecutor& executor);

    /**
     * @brief List processes (`ps -eo pid=,ppid=,args=`)
     * @return Process table, nullopt if the listing failed or timed out
     */
    std::optional<std::vector<ProcessInfo>> ListProcesses(const std::string& container_id);

    /// Send @p signal to one process
    core::ExecutionResult Interrupt(const std::string& container_id, int pid, int signal);

    /// Send @p signal to several processes in one call, in the given order
    core::ExecutionResult Interrupt(const std::string& container_id,
                                    const std::vector<int>& pids, int signal);

    /**
     * @brief Signal the tree tagged with @p marker until it is gone
     *
     * SIGINT, then SIGTERM, then SIGKILL (repeated if max_retries > 3),
     * leaves first, waiting interrupt_timeout between rounds. Never re-runs
     * the command.
     */
    EscalationOutcome Escalate(const std::string& container_id, const std::string& marker);

    // ========================================================================
    // Parsing helpers
    // ========================================================================

    static std::vector<ProcessInfo> ParseProcessList(const std::string& output);

    /**
     * @brief Root processes carrying @p marker plus all their descendants
     * @return Tree members ordered deepest first
     */
    static std::vector<ProcessInfo> FindCommandTree(const std::vector<ProcessInfo>& processes,
                                                    const std::string& marker);

    /// "INT", "TERM", "KILL", or the number
    static std::string SignalName(int signal);

private:
    GuardedExecutor& executor_;
};

} // namespace executor
} // namespace ctfbox
