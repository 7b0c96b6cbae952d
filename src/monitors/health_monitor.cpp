/**
 * @file health_monitor.cpp
 * @brief Implementation of container liveness probing
 *
 * @date 2025
 */

#include "ctfbox/monitors/health_monitor.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace ctfbox {
namespace monitors {

using core::HealthState;

json HealthRecord::ToJSON() const {
    json j;
    j["container_id"] = container_id;
    j["state"] = core::ToString(state);
    j["consecutive_failures"] = consecutive_failures;
    j["total_probes"] = total_probes;
    j["last_probe"] = std::chrono::duration_cast<std::chrono::seconds>(
        last_probe.time_since_epoch()).count();
    if (!last_failure.empty()) {
        j["last_failure"] = last_failure;
    }
    return j;
}

// Constructor
HealthMonitor::HealthMonitor(executor::GuardedExecutor& executor)
    : executor_(executor)
    , max_failures_(executor.GetTimeouts().max_retries)
    , interval_(executor.GetTimeouts().health_check_interval) {
    spdlog::debug("Health Monitor initialized (interval {} ms, dead after {} failures)",
                  interval_.count(), max_failures_);
}

// Destructor
HealthMonitor::~HealthMonitor() {
    Stop();
}

// ============================================================================
// PROBING
// ============================================================================

HealthRecord HealthMonitor::Probe(const std::string& container_id) {
    core::ExecutionRequest request;
    request.command = "pwd";
    request.kind = core::CallKind::HEALTH_PROBE;

    auto result = executor_.Execute(container_id, request);
    bool healthy = result.Succeeded();

    if (healthy) {
        executor_.ConfirmResponsive(container_id);
    }

    HealthRecord snapshot;
    bool became_dead = false;
    DeadCallback callback;

    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        auto& record = records_[container_id];
        record.container_id = container_id;
        record.last_probe = std::chrono::system_clock::now();
        record.total_probes++;

        if (healthy) {
            if (record.state != HealthState::HEALTHY) {
                spdlog::info("Container {} healthy again", container_id);
            }
            record.consecutive_failures = 0;
            record.state = HealthState::HEALTHY;
        } else if (record.state != HealthState::DEAD) {
            record.consecutive_failures++;
            record.last_failure = core::Describe(result);

            if (record.consecutive_failures >= max_failures_) {
                record.state = HealthState::DEAD;
                became_dead = true;
                callback = dead_callback_;
                spdlog::error("Container {} is dead after {} failed probes ({})",
                              container_id, record.consecutive_failures, record.last_failure);
            } else {
                record.state = HealthState::DEGRADED;
                spdlog::warn("Container {} probe failed ({}/{}): {}", container_id,
                             record.consecutive_failures, max_failures_, record.last_failure);
            }
        }

        snapshot = record;
    }

    if (became_dead && callback) {
        callback(snapshot);
    }

    return snapshot;
}

void HealthMonitor::SetDeadCallback(DeadCallback callback) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    dead_callback_ = std::move(callback);
}

// ============================================================================
// PERIODIC MONITORING
// ============================================================================

bool HealthMonitor::Start(ContainerProvider provider) {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (is_monitoring_) {
        spdlog::warn("Health Monitor already running");
        return true;
    }
    if (!provider) {
        spdlog::error("Health Monitor needs a container provider");
        return false;
    }

    provider_ = std::move(provider);
    is_monitoring_ = true;
    monitor_thread_ = std::thread(&HealthMonitor::MonitorLoop, this);

    spdlog::info("✓ Health Monitor started (every {} ms)", interval_.count());
    return true;
}

void HealthMonitor::Stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        if (!is_monitoring_) {
            return;
        }
        is_monitoring_ = false;
    }
    loop_cv_.notify_all();

    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    spdlog::info("✓ Health Monitor stopped");
}

bool HealthMonitor::IsRunning() const {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    return is_monitoring_;
}

void HealthMonitor::MonitorLoop() {
    std::unique_lock<std::mutex> lock(loop_mutex_);

    while (is_monitoring_) {
        if (loop_cv_.wait_for(lock, interval_, [this] { return !is_monitoring_; })) {
            break;
        }

        auto provider = provider_;
        lock.unlock();

        for (const auto& container_id : provider()) {
            {
                std::lock_guard<std::mutex> records_lock(records_mutex_);
                auto it = records_.find(container_id);
                if (it != records_.end() && it->second.state == HealthState::DEAD) {
                    continue;
                }
            }
            Probe(container_id);
        }

        lock.lock();
    }
}

// ============================================================================
// RECORDS
// ============================================================================

std::optional<HealthRecord> HealthMonitor::GetRecord(const std::string& container_id) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(container_id);
    if (it != records_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<HealthRecord> HealthMonitor::GetRecords() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    std::vector<HealthRecord> records;
    for (const auto& [id, record] : records_) {
        records.push_back(record);
    }
    return records;
}

void HealthMonitor::Forget(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    records_.erase(container_id);
    spdlog::debug("Health record of {} dropped", container_id);
}

json HealthMonitor::ExportToJSON() const {
    json j = json::array();
    for (const auto& record : GetRecords()) {
        j.push_back(record.ToJSON());
    }
    return j;
}

} // namespace monitors
} // namespace ctfbox
