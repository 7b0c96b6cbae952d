/**
 * @file health_monitor.hpp
 * @brief Container liveness probing
 *
 * A probe is a cheap `pwd` exec routed through the GuardedExecutor with the
 * health_check_timeout budget. The monitor can be driven on demand (after a
 * command timed out) or periodically from its own thread.
 *
 * @date 2025
 */

#pragma once

#include "ctfbox/core/topology.hpp"
#include "ctfbox/executor/guarded_executor.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ctfbox {
namespace monitors {

/**
 * @struct HealthRecord
 * @brief Probe history of one container incarnation
 */
struct HealthRecord {
    std::string container_id;
    std::chrono::system_clock::time_point last_probe;   ///< Last probe attempt
    int consecutive_failures{0};
    core::HealthState state{core::HealthState::HEALTHY};
    std::string last_failure;                           ///< Cause of last failed probe
    int total_probes{0};

    nlohmann::json ToJSON() const;
};

/**
 * @class HealthMonitor
 * @brief Tracks container liveness and reports dead containers
 *
 * State transitions per container:
 * ```
 * healthy ──fail──► degraded ──fail × (max_retries-1)──► dead
 *    ▲                 │
 *    └────success──────┘
 * ```
 * The dead callback fires once per container id. A replaced container gets
 * a new id and therefore a fresh record.
 *
 * **Thread Safety**: Thread-safe.
 */
class HealthMonitor {
public:
    using DeadCallback = std::function<void(const HealthRecord&)>;
    using ContainerProvider = std::function<std::vector<std::string>()>;

    /**
     * @brief Constructor
     * @param executor Executor shared with the session
     */
    explicit HealthMonitor(executor::GuardedExecutor& executor);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /**
     * @brief Probe one container now
     * @return Updated record
     */
    HealthRecord Probe(const std::string& container_id);

    /// Called (outside the monitor's lock) when a container becomes dead
    void SetDeadCallback(DeadCallback callback);

    /**
     * @brief Start periodic probing
     * @param provider Returns the container ids to probe on each pass
     * @return true if started (or already running)
     */
    bool Start(ContainerProvider provider);

    /// Stop periodic probing and join the thread
    void Stop();

    bool IsRunning() const;

    std::optional<HealthRecord> GetRecord(const std::string& container_id) const;
    std::vector<HealthRecord> GetRecords() const;

    /// Drop the record of a replaced container
    void Forget(const std::string& container_id);

    nlohmann::json ExportToJSON() const;

private:
    void MonitorLoop();

    executor::GuardedExecutor& executor_;
    int max_failures_;
    std::chrono::milliseconds interval_;

    mutable std::mutex records_mutex_;
    std::map<std::string, HealthRecord> records_;
    DeadCallback dead_callback_;

    mutable std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool is_monitoring_{false};
    ContainerProvider provider_;
    std::thread monitor_thread_;
};

} // namespace monitors
} // namespace ctfbox
