/**
 * @file port_pool.cpp
 * @brief flock-protected port pool with a JSON lease registry
 *
 * @date 2025
 */

#include "ctfbox/network/port_pool.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <set>
#include <thread>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <unistd.h>

using json = nlohmann::json;

namespace ctfbox {
namespace network {

namespace fs = std::filesystem;

// ============================================================================
// FILE LOCK
// ============================================================================

PortPool::FileLock::FileLock(const fs::path& path) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
    if (fd_ < 0) {
        throw AllocationError("Cannot open port pool lock " + path.string() + ": " +
                              std::strerror(errno));
    }

    while (::flock(fd_, LOCK_EX) != 0) {
        if (errno != EINTR) {
            int saved = errno;
            ::close(fd_);
            throw AllocationError("Cannot lock " + path.string() + ": " + std::strerror(saved));
        }
    }
}

PortPool::FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

PortPool::PortPool(const core::PortPoolConfig& config)
    : config_(config) {
    if (config_.range_start == 0 || config_.range_start > config_.range_end) {
        throw core::ConfigError("port_pool", "invalid range " + std::to_string(config_.range_start) +
                                "-" + std::to_string(config_.range_end));
    }

    fs::path directory = config_.lock_directory;
    if (directory.empty()) {
        directory = fs::temp_directory_path() / "ctfbox-ports";
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw AllocationError("Cannot create port pool directory " + directory.string() + ": " +
                              ec.message());
    }

    lock_path_ = directory / "ports.lock";
    registry_path_ = directory / "ports.json";

    spdlog::debug("Port pool {}-{} (registry {})", config_.range_start, config_.range_end,
                  registry_path_.string());
}

// ============================================================================
// ACQUIRE / RELEASE
// ============================================================================

std::vector<std::uint16_t> PortPool::Acquire(const std::string& owner, std::size_t count) {
    if (count == 0) {
        return {};
    }

    std::size_t capacity = static_cast<std::size_t>(config_.range_end) - config_.range_start + 1;
    if (count > capacity) {
        throw AllocationError("Requested " + std::to_string(count) + " ports but the pool holds " +
                              std::to_string(capacity));
    }

    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + config_.max_wait;
    int attempts = 0;

    while (true) {
        attempts++;
        if (auto ports = TryAcquire(owner, count)) {
            spdlog::info("Allocated {} port(s) for {}", ports->size(), owner);
            return *ports;
        }

        auto now = std::chrono::steady_clock::now();
        if (now + config_.retry_interval > deadline) {
            break;
        }

        if (attempts == 1) {
            spdlog::warn("Port pool exhausted; waiting up to {} ms for {} port(s)",
                         config_.max_wait.count(), count);
        }
        std::this_thread::sleep_for(config_.retry_interval);
    }

    throw AllocationError("Port pool " + std::to_string(config_.range_start) + "-" +
                          std::to_string(config_.range_end) + " exhausted: no " +
                          std::to_string(count) + " free port(s) after " +
                          std::to_string(attempts) + " attempt(s)");
}

void PortPool::Release(const std::string& owner) {
    FileLock lock(lock_path_);

    auto leases = LoadLeases();
    auto before = leases.size();
    leases.erase(std::remove_if(leases.begin(), leases.end(),
                                [&owner](const PortLease& lease) { return lease.owner == owner; }),
                 leases.end());

    if (leases.size() != before) {
        SaveLeases(leases);
        spdlog::info("Released ports of {}", owner);
    }
}

void PortPool::Record(const std::string& owner, const std::string& resource) {
    FileLock lock(lock_path_);

    auto leases = ReclaimDead(LoadLeases());
    auto it = std::find_if(leases.begin(), leases.end(),
                           [&owner](const PortLease& lease) { return lease.owner == owner; });
    if (it == leases.end()) {
        PortLease lease;
        lease.owner = owner;
        lease.pid = static_cast<int>(::getpid());
        lease.acquired_at = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        leases.push_back(lease);
        it = leases.end() - 1;
    }
    if (std::find(it->resources.begin(), it->resources.end(), resource) == it->resources.end()) {
        it->resources.push_back(resource);
    }
    SaveLeases(leases);
}

std::vector<PortLease> PortPool::Leases() {
    FileLock lock(lock_path_);

    auto leases = LoadLeases();
    auto live = ReclaimDead(leases);
    if (live.size() != leases.size()) {
        SaveLeases(live);
    }
    return live;
}

std::optional<std::vector<std::uint16_t>> PortPool::TryAcquire(const std::string& owner,
                                                               std::size_t count) {
    FileLock lock(lock_path_);

    auto leases = ReclaimDead(LoadLeases());

    std::set<std::uint16_t> taken;
    for (const auto& lease : leases) {
        taken.insert(lease.ports.begin(), lease.ports.end());
    }

    std::vector<std::uint16_t> chosen;
    for (std::uint32_t port = config_.range_start;
         port <= config_.range_end && chosen.size() < count; ++port) {
        auto candidate = static_cast<std::uint16_t>(port);
        if (taken.count(candidate) > 0) {
            continue;
        }
        if (config_.probe_host_ports && IsPortInUse(candidate)) {
            spdlog::debug("Port {} is bound on the host; skipping", candidate);
            continue;
        }
        chosen.push_back(candidate);
    }

    if (chosen.size() < count) {
        SaveLeases(leases);
        return std::nullopt;
    }

    auto it = std::find_if(leases.begin(), leases.end(),
                           [&owner](const PortLease& lease) { return lease.owner == owner; });
    if (it == leases.end()) {
        PortLease lease;
        lease.owner = owner;
        lease.pid = static_cast<int>(::getpid());
        lease.acquired_at = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        lease.ports = chosen;
        leases.push_back(lease);
    } else {
        it->ports.insert(it->ports.end(), chosen.begin(), chosen.end());
    }

    SaveLeases(leases);
    return chosen;
}

// ============================================================================
// HOST PROBE
// ============================================================================

bool PortPool::IsPortInUse(std::uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    bool in_use = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0;
    ::close(fd);
    return in_use;
}

// ============================================================================
// REGISTRY
// ============================================================================

std::vector<PortLease> PortPool::LoadLeases() const {
    std::vector<PortLease> leases;

    std::ifstream in(registry_path_);
    if (!in) {
        return leases;
    }

    try {
        json j = json::parse(in);
        for (const auto& entry : j.value("leases", json::array())) {
            PortLease lease;
            lease.owner = entry.value("owner", "");
            lease.pid = entry.value("pid", 0);
            lease.acquired_at = entry.value("acquired_at", static_cast<std::int64_t>(0));
            lease.ports = entry.value("ports", std::vector<std::uint16_t>{});
            lease.resources = entry.value("resources", std::vector<std::string>{});
            leases.push_back(lease);
        }
    }
    catch (const json::exception& e) {
        // Rewritten from scratch on the next save
        spdlog::warn("Port registry {} unreadable ({}); starting empty", registry_path_.string(), e.what());
        leases.clear();
    }

    return leases;
}

void PortPool::SaveLeases(const std::vector<PortLease>& leases) const {
    json j;
    j["leases"] = json::array();
    for (const auto& lease : leases) {
        j["leases"].push_back({
            {"owner", lease.owner},
            {"pid", lease.pid},
            {"acquired_at", lease.acquired_at},
            {"ports", lease.ports},
            {"resources", lease.resources}
        });
    }

    fs::path temp = registry_path_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            throw AllocationError("Cannot write port registry " + temp.string());
        }
        out << j.dump(2);
    }

    std::error_code ec;
    fs::rename(temp, registry_path_, ec);
    if (ec) {
        throw AllocationError("Cannot replace port registry " + registry_path_.string() + ": " +
                              ec.message());
    }
}

std::vector<PortLease> PortPool::ReclaimDead(std::vector<PortLease> leases) {
    auto alive = [](const PortLease& lease) {
        if (lease.pid <= 0) {
            return false;
        }
        return ::kill(lease.pid, 0) == 0 || errno == EPERM;
    };

    auto it = std::remove_if(leases.begin(), leases.end(), [&alive](const PortLease& lease) {
        if (alive(lease)) {
            return false;
        }
        spdlog::info("Reclaiming {} port(s) of exited owner {} (pid {})",
                     lease.ports.size(), lease.owner, lease.pid);
        return true;
    });
    leases.erase(it, leases.end());
    return leases;
}

} // namespace network
} // namespace ctfbox
