/**
 * @file config.hpp
 * @brief Immutable environment configuration for challenge sessions
 *
 * Every tunable the execution manager uses is gathered into one value type,
 * EnvironmentConfig, which is built once (from environment variables and/or
 * command-line flags) and handed to the EnvironmentSession constructor.
 * Components never read process state on their own.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace ctfbox {
namespace core {

/**
 * @class ConfigError
 * @brief Raised when a configuration value cannot be parsed or is out of range
 */
class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& key, const std::string& message)
        : std::runtime_error(key + ": " + message)
        , key_(key) {}

    const std::string& Key() const { return key_; }

private:
    std::string key_;
};

/**
 * @struct TimeoutPolicy
 * @brief Named wall-clock limits
 *
 * Fixed for the lifetime of a session.
 */
struct TimeoutPolicy {
    std::chrono::milliseconds action_timeout{std::chrono::seconds(25)};        ///< One agent command
    std::chrono::milliseconds no_output_timeout{std::chrono::seconds(25)};     ///< Silence before "stuck"
    std::chrono::milliseconds docker_exec_timeout{std::chrono::seconds(60)};   ///< One control-plane call
    std::chrono::milliseconds health_check_timeout{std::chrono::seconds(5)};   ///< Probe / ps / kill
    std::chrono::milliseconds health_check_interval{std::chrono::seconds(30)}; ///< Periodic probe period
    std::chrono::milliseconds interrupt_timeout{std::chrono::seconds(5)};      ///< Between escalations
    std::chrono::milliseconds compose_startup_timeout{std::chrono::seconds(600)};  ///< compose up
    std::chrono::milliseconds compose_teardown_timeout{std::chrono::seconds(100)}; ///< compose down
    int max_retries{3};                                                         ///< Shared retry bound
};

/**
 * @struct PortPoolConfig
 * @brief Host port pool shared by every session on the machine
 */
struct PortPoolConfig {
    std::uint16_t range_start{10000};                          ///< Inclusive lower bound
    std::uint16_t range_end{20000};                            ///< Inclusive upper bound
    std::chrono::milliseconds max_wait{std::chrono::seconds(120)};    ///< Exhaustion wait cap
    std::chrono::milliseconds retry_interval{std::chrono::seconds(1)}; ///< Exhaustion retry period
    std::filesystem::path lock_directory;                      ///< Lock + lease registry dir
    bool probe_host_ports{true};                               ///< Skip ports already bound on host
};

/**
 * @struct EnvironmentConfig
 * @brief Complete configuration of one environment session
 */
struct EnvironmentConfig {
    TimeoutPolicy timeouts;                       ///< Deadlines
    PortPoolConfig port_pool;                     ///< Host port pool

    bool enable_network_restriction{true};        ///< Install egress firewall after setup
    bool enable_dynamic_ports{false};             ///< Rewrite manifests with allocated ports
    bool enable_health_monitor{true};             ///< Periodic background probes

    std::string base_network{"ctfnet"};           ///< Fixed / base network name
    std::string docker_binary{"docker"};          ///< Control-plane client
    std::string agent_image{"sweagent/enigma:latest"};  ///< Agent container image
    std::string session_name;                     ///< Optional prefix for resource names
};

/// Lookup used by the loader; returns nullopt when the key is unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Build a configuration from process environment variables
 *
 * The only place in the library that reads the process environment.
 * Unset variables keep their defaults.
 *
 * @return Populated configuration
 * @throws ConfigError on unparsable or out-of-range values
 */
EnvironmentConfig LoadConfigFromEnvironment();

/**
 * @brief Build a configuration from an arbitrary key lookup
 * @param lookup Key lookup (tests pass a map-backed lambda)
 * @return Populated configuration
 * @throws ConfigError on unparsable or out-of-range values
 */
EnvironmentConfig LoadConfigFromEnvironment(const EnvLookup& lookup);

/**
 * @brief Check cross-field constraints
 * @throws ConfigError naming the offending field
 */
void ValidateConfig(const EnvironmentConfig& config);

/**
 * @brief Parse a duration such as "25", "25s", "500ms" or "2m"
 * @param key Name used in error messages
 * @param value Raw value (bare number means seconds)
 * @throws ConfigError if the value is not a non-negative duration
 */
std::chrono::milliseconds ParseDuration(const std::string& key, const std::string& value);

/**
 * @brief Parse 1/0/true/false/yes/no/on/off
 * @throws ConfigError for anything else
 */
bool ParseBool(const std::string& key, const std::string& value);

} // namespace core
} // namespace ctfbox
