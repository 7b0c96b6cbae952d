/**
 * @file port_pool.hpp
 * @brief Host-wide pool of host ports shared by concurrent sessions
 *
 * Sessions may live in different processes, so exclusion uses flock(2) on a
 * lock file, and leases are kept in a JSON registry next to it:
 * ```json
 * {"leases": [{"owner": "ctfbox-3f9a1c2e", "pid": 4242,
 *              "acquired_at": 1760000000, "ports": [10000, 10001]}]}
 * ```
 * Leases whose owning process has exited are reclaimed on the next acquire.
 *
 * @date 2025
 */

#pragma once

#include "ctfbox/core/config.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ctfbox {
namespace network {

/**
 * @class AllocationError
 * @brief No ports (or network) could be allocated within the bounded wait
 */
class AllocationError : public std::runtime_error {
public:
    explicit AllocationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct PortLease
 * @brief Ports held by one owner
 */
struct PortLease {
    std::string owner;
    int pid{0};                         ///< Process holding the lease
    std::int64_t acquired_at{0};        ///< Unix seconds
    std::vector<std::uint16_t> ports;
    std::vector<std::string> resources; ///< Networks and manifest paths held with the ports
};

/**
 * @class PortPool
 * @brief Allocates host ports from an inclusive range
 *
 * Usage:
 * @code
 * PortPool pool(config.port_pool);
 * auto ports = pool.Acquire("session-a", 2);
 * // ... use ports ...
 * pool.Release("session-a");
 * @endcode
 */
class PortPool {
public:
    explicit PortPool(const core::PortPoolConfig& config);

    /**
     * @brief Reserve @p count free ports for @p owner
     *
     * Blocks, retrying every retry_interval, while the pool is exhausted.
     *
     * @throws AllocationError after max_wait, or if @p count exceeds the range
     */
    std::vector<std::uint16_t> Acquire(const std::string& owner, std::size_t count);

    /// Return every port held by @p owner; no-op for unknown owners
    void Release(const std::string& owner);

    /**
     * @brief Note a network or file that @p owner holds until Release()
     *
     * Creates a portless lease when @p owner has none, so an orphan sweep
     * can tell live resources from leftovers.
     */
    void Record(const std::string& owner, const std::string& resource);

    /// Current leases (after reclaiming dead owners)
    std::vector<PortLease> Leases();

    /// Some process on this host is bound to @p port (TCP)
    static bool IsPortInUse(std::uint16_t port);

    const std::filesystem::path& GetLockPath() const { return lock_path_; }
    const std::filesystem::path& GetRegistryPath() const { return registry_path_; }

private:
    /// Holds flock(LOCK_EX) on the lock file for its lifetime
    class FileLock {
    public:
        explicit FileLock(const std::filesystem::path& path);
        ~FileLock();
        FileLock(const FileLock&) = delete;
        FileLock& operator=(const FileLock&) = delete;

    private:
        int fd_{-1};
    };

    std::vector<PortLease> LoadLeases() const;
    void SaveLeases(const std::vector<PortLease>& leases) const;
    static std::vector<PortLease> ReclaimDead(std::vector<PortLease> leases);
    std::optional<std::vector<std::uint16_t>> TryAcquire(const std::string& owner, std::size_t count);

    core::PortPoolConfig config_;
    std::filesystem::path lock_path_;
    std::filesystem::path registry_path_;
};

} // namespace network
} // namespace ctfbox
