/**
 * @file process_supervisor.cpp
 * @brief Process tree discovery and signal escalation inside containers
 *
 * **Escalation sequence** (one round per interrupt_timeout):
 * ```
 * round 1: kill -s INT  <leaves ... root>
 * round 2: kill -s TERM <leaves ... root>
 * round 3: kill -s KILL <leaves ... root>
 * ```
 * The tree is re-listed before every round, so children that appeared in the
 * meantime are caught too.
 *
 * @date 2025
 */

#include "ctfbox/executor/process_supervisor.hpp"
#include "ctfbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <map>
#include <set>
#include <sstream>
#include <thread>

namespace ctfbox {
namespace executor {

using core::CallKind;
using core::ExecutionRequest;
using core::ExecutionResult;
using utils::StringUtils;

ProcessSupervisor::ProcessSupervisor(GuardedExecutor& executor)
    : executor_(executor) {}

// ============================================================================
// LISTING
// ============================================================================

std::optional<std::vector<ProcessInfo>> ProcessSupervisor::ListProcesses(const std::string& container_id) {
    ExecutionRequest request;
    request.command = "ps -eo pid=,ppid=,args=";
    request.kind = CallKind::PROCESS_LIST;

    auto result = executor_.Execute(container_id, request);
    if (!result.Succeeded()) {
        spdlog::warn("Process listing on {} failed: {}", container_id, core::Describe(result));
        return std::nullopt;
    }

    return ParseProcessList(result.Output());
}

std::vector<ProcessInfo> ProcessSupervisor::ParseProcessList(const std::string& output) {
    std::vector<ProcessInfo> processes;

    for (const auto& line : StringUtils::SplitLines(output)) {
        std::istringstream iss(line);
        ProcessInfo info;
        if (!(iss >> info.pid >> info.parent_pid)) {
            continue;
        }
        std::getline(iss, info.command);
        info.command = StringUtils::Trim(info.command);
        processes.push_back(info);
    }

    return processes;
}

// ============================================================================
// PROCESS TREE
// ============================================================================

std::vector<ProcessInfo> ProcessSupervisor::FindCommandTree(const std::vector<ProcessInfo>& processes,
                                                            const std::string& marker) {
    std::map<int, std::vector<const ProcessInfo*>> children;
    std::vector<const ProcessInfo*> roots;

    for (const auto& process : processes) {
        children[process.parent_pid].push_back(&process);

        auto tokens = StringUtils::SplitWhitespace(process.command);
        if (std::find(tokens.begin(), tokens.end(), marker) != tokens.end()) {
            roots.push_back(&process);
        }
    }

    // Breadth-first walk from every root, recording depth
    std::vector<std::pair<int, const ProcessInfo*>> members;
    std::set<int> seen;
    std::vector<std::pair<int, const ProcessInfo*>> frontier;
    for (const auto* root : roots) {
        frontier.emplace_back(0, root);
    }

    while (!frontier.empty()) {
        auto [depth, process] = frontier.back();
        frontier.pop_back();
        if (!seen.insert(process->pid).second) {
            continue;
        }
        members.emplace_back(depth, process);

        auto it = children.find(process->pid);
        if (it != children.end()) {
            for (const auto* child : it->second) {
                frontier.emplace_back(depth + 1, child);
            }
        }
    }

    std::stable_sort(members.begin(), members.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<ProcessInfo> tree;
    tree.reserve(members.size());
    for (const auto& member : members) {
        tree.push_back(*member.second);
    }
    return tree;
}

// ============================================================================
// SIGNALS
// ============================================================================

ExecutionResult ProcessSupervisor::Interrupt(const std::string& container_id, int pid, int signal) {
    return Interrupt(container_id, std::vector<int>{pid}, signal);
}

ExecutionResult ProcessSupervisor::Interrupt(const std::string& container_id,
                                             const std::vector<int>& pids, int signal) {
    std::vector<std::string> pid_strings;
    for (int pid : pids) {
        pid_strings.push_back(std::to_string(pid));
    }

    ExecutionRequest request;
    // Some targets may already be gone; that is not a failure
    request.command = "kill -s " + SignalName(signal) + " " + StringUtils::Join(pid_strings, " ") +
                      " 2>/dev/null; true";
    request.kind = CallKind::INTERRUPT;

    auto result = executor_.Execute(container_id, request);
    spdlog::debug("SIG{} -> [{}] on {}: {}", SignalName(signal), StringUtils::Join(pid_strings, ","),
                  container_id, core::Describe(result));
    return result;
}

EscalationOutcome ProcessSupervisor::Escalate(const std::string& container_id, const std::string& marker) {
    static const int kSignals[] = {SIGINT, SIGTERM, SIGKILL};

    const auto& timeouts = executor_.GetTimeouts();
    EscalationOutcome outcome;

    spdlog::info("Interrupting stuck command {} on {}", marker, container_id);

    for (int round = 0; round < timeouts.max_retries; ++round) {
        auto processes = ListProcesses(container_id);
        if (!processes) {
            outcome.message = "process listing unavailable";
            spdlog::error("Escalation on {} aborted: {}", container_id, outcome.message);
            return outcome;
        }

        auto tree = FindCommandTree(*processes, marker);
        if (tree.empty()) {
            outcome.terminated = true;
            spdlog::info("✓ Command {} terminated after {} signal round(s)", marker, outcome.escalations);
            return outcome;
        }

        int signal = kSignals[std::min(round, 2)];
        std::vector<int> pids;
        for (const auto& process : tree) {
            pids.push_back(process.pid);
        }

        auto sent = Interrupt(container_id, pids, signal);
        outcome.escalations++;
        outcome.signals.push_back(SignalName(signal));
        if (sent.IsTimedOut() || sent.IsFailed()) {
            spdlog::warn("Delivering SIG{} on {} did not complete: {}", SignalName(signal), container_id,
                         core::Describe(sent));
        }

        std::this_thread::sleep_for(timeouts.interrupt_timeout);
    }

    auto processes = ListProcesses(container_id);
    if (processes && FindCommandTree(*processes, marker).empty()) {
        outcome.terminated = true;
        spdlog::info("✓ Command {} terminated after {} signal round(s)", marker, outcome.escalations);
        return outcome;
    }

    outcome.message = "command still running after " + std::to_string(outcome.escalations) +
                      " signal round(s)";
    spdlog::error("Escalation on {} exhausted: {}", container_id, outcome.message);
    return outcome;
}

std::string ProcessSupervisor::SignalName(int signal) {
    switch (signal) {
        case SIGINT: return "INT";
        case SIGTERM: return "TERM";
        case SIGKILL: return "KILL";
        case SIGHUP: return "HUP";
        case SIGQUIT: return "QUIT";
        default: return std::to_string(signal);
    }
}

} // namespace executor
} // namespace ctfbox
