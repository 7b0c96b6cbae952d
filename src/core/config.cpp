/**
 * @file config.cpp
 * @brief Environment-variable configuration loader
 *
 * Recognised variables (all optional):
 * ```
 * CTFBOX_ACTION_TIMEOUT             CTFBOX_ENABLE_NETWORK_RESTRICTION
 * CTFBOX_NO_OUTPUT_TIMEOUT          CTFBOX_ENABLE_DYNAMIC_PORTS
 * CTFBOX_DOCKER_EXEC_TIMEOUT        CTFBOX_ENABLE_HEALTH_MONITOR
 * CTFBOX_HEALTH_CHECK_TIMEOUT       CTFBOX_PORT_RANGE_START / _END
 * CTFBOX_HEALTH_CHECK_INTERVAL      CTFBOX_PORT_POOL_MAX_WAIT
 * CTFBOX_INTERRUPT_TIMEOUT          CTFBOX_PORT_POOL_RETRY_INTERVAL
 * CTFBOX_COMPOSE_STARTUP_TIMEOUT    CTFBOX_PORT_LOCK_DIR
 * CTFBOX_COMPOSE_TEARDOWN_TIMEOUT   CTFBOX_BASE_NETWORK
 * CTFBOX_MAX_RETRIES                CTFBOX_DOCKER_BINARY
 *                                   CTFBOX_AGENT_IMAGE
 * ```
 *
 * @date 2025
 */

#include "ctfbox/core/config.hpp"
#include "ctfbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <limits>

namespace ctfbox {
namespace core {

using utils::StringUtils;

namespace {

long long ParseInteger(const std::string& key, const std::string& value) {
    std::string trimmed = StringUtils::Trim(value);
    if (trimmed.empty()) {
        throw ConfigError(key, "empty value");
    }

    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(trimmed, &consumed);
    }
    catch (const std::exception&) {
        throw ConfigError(key, "not an integer: '" + value + "'");
    }

    if (consumed != trimmed.size()) {
        throw ConfigError(key, "trailing characters in '" + value + "'");
    }
    return parsed;
}

std::uint16_t ParsePort(const std::string& key, const std::string& value) {
    long long port = ParseInteger(key, value);
    if (port < 1 || port > 65535) {
        throw ConfigError(key, "port out of range: " + value);
    }
    return static_cast<std::uint16_t>(port);
}

} // anonymous namespace

// ============================================================================
// VALUE PARSERS
// ============================================================================

std::chrono::milliseconds ParseDuration(const std::string& key, const std::string& value) {
    std::string trimmed = StringUtils::ToLower(StringUtils::Trim(value));

    long long multiplier = 1000;
    std::string number = trimmed;

    if (StringUtils::EndsWith(trimmed, "ms")) {
        multiplier = 1;
        number = trimmed.substr(0, trimmed.size() - 2);
    } else if (StringUtils::EndsWith(trimmed, "s")) {
        number = trimmed.substr(0, trimmed.size() - 1);
    } else if (StringUtils::EndsWith(trimmed, "m")) {
        multiplier = 60 * 1000;
        number = trimmed.substr(0, trimmed.size() - 1);
    }

    long long amount = ParseInteger(key, number);
    if (amount < 0) {
        throw ConfigError(key, "negative duration: " + value);
    }
    if (amount > std::numeric_limits<long long>::max() / multiplier) {
        throw ConfigError(key, "duration too large: " + value);
    }

    return std::chrono::milliseconds(amount * multiplier);
}

bool ParseBool(const std::string& key, const std::string& value) {
    std::string lower = StringUtils::ToLower(StringUtils::Trim(value));

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }

    throw ConfigError(key, "not a boolean: '" + value + "'");
}

// ============================================================================
// LOADER
// ============================================================================

EnvironmentConfig LoadConfigFromEnvironment() {
    return LoadConfigFromEnvironment([](const std::string& key) -> std::optional<std::string> {
        const char* value = std::getenv(key.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

EnvironmentConfig LoadConfigFromEnvironment(const EnvLookup& lookup) {
    EnvironmentConfig config;
    auto& t = config.timeouts;

    auto duration = [&](const char* key, std::chrono::milliseconds& field) {
        if (auto value = lookup(key)) {
            field = ParseDuration(key, *value);
            spdlog::debug("Config {} = {} ms", key, field.count());
        }
    };
    auto flag = [&](const char* key, bool& field) {
        if (auto value = lookup(key)) {
            field = ParseBool(key, *value);
            spdlog::debug("Config {} = {}", key, field);
        }
    };
    auto text = [&](const char* key, std::string& field) {
        if (auto value = lookup(key)) {
            field = StringUtils::Trim(*value);
        }
    };

    duration("CTFBOX_ACTION_TIMEOUT", t.action_timeout);
    duration("CTFBOX_NO_OUTPUT_TIMEOUT", t.no_output_timeout);
    duration("CTFBOX_DOCKER_EXEC_TIMEOUT", t.docker_exec_timeout);
    duration("CTFBOX_HEALTH_CHECK_TIMEOUT", t.health_check_timeout);
    duration("CTFBOX_HEALTH_CHECK_INTERVAL", t.health_check_interval);
    duration("CTFBOX_INTERRUPT_TIMEOUT", t.interrupt_timeout);
    duration("CTFBOX_COMPOSE_STARTUP_TIMEOUT", t.compose_startup_timeout);
    duration("CTFBOX_COMPOSE_TEARDOWN_TIMEOUT", t.compose_teardown_timeout);

    if (auto value = lookup("CTFBOX_MAX_RETRIES")) {
        long long retries = ParseInteger("CTFBOX_MAX_RETRIES", *value);
        if (retries < 1 || retries > 100) {
            throw ConfigError("CTFBOX_MAX_RETRIES", "must be between 1 and 100");
        }
        t.max_retries = static_cast<int>(retries);
    }

    flag("CTFBOX_ENABLE_NETWORK_RESTRICTION", config.enable_network_restriction);
    flag("CTFBOX_ENABLE_DYNAMIC_PORTS", config.enable_dynamic_ports);
    flag("CTFBOX_ENABLE_HEALTH_MONITOR", config.enable_health_monitor);

    if (auto value = lookup("CTFBOX_PORT_RANGE_START")) {
        config.port_pool.range_start = ParsePort("CTFBOX_PORT_RANGE_START", *value);
    }
    if (auto value = lookup("CTFBOX_PORT_RANGE_END")) {
        config.port_pool.range_end = ParsePort("CTFBOX_PORT_RANGE_END", *value);
    }
    duration("CTFBOX_PORT_POOL_MAX_WAIT", config.port_pool.max_wait);
    duration("CTFBOX_PORT_POOL_RETRY_INTERVAL", config.port_pool.retry_interval);
    flag("CTFBOX_PORT_PROBE_HOST", config.port_pool.probe_host_ports);

    if (auto value = lookup("CTFBOX_PORT_LOCK_DIR")) {
        config.port_pool.lock_directory = StringUtils::Trim(*value);
    }

    text("CTFBOX_BASE_NETWORK", config.base_network);
    text("CTFBOX_DOCKER_BINARY", config.docker_binary);
    text("CTFBOX_AGENT_IMAGE", config.agent_image);

    ValidateConfig(config);
    return config;
}

// ============================================================================
// VALIDATION
// ============================================================================

void ValidateConfig(const EnvironmentConfig& config) {
    const auto& t = config.timeouts;

    if (t.action_timeout.count() <= 0) {
        throw ConfigError("action_timeout", "must be > 0");
    }
    if (t.no_output_timeout.count() <= 0) {
        throw ConfigError("no_output_timeout", "must be > 0");
    }
    if (t.docker_exec_timeout.count() <= 0) {
        throw ConfigError("docker_exec_timeout", "must be > 0");
    }
    if (t.health_check_timeout.count() <= 0) {
        throw ConfigError("health_check_timeout", "must be > 0");
    }
    if (t.max_retries < 1) {
        throw ConfigError("max_retries", "must be >= 1");
    }
    if (t.docker_exec_timeout < t.action_timeout) {
        spdlog::warn("docker_exec_timeout ({} ms) is shorter than action_timeout ({} ms); "
                     "agent commands will be cut at the control-plane budget",
                     t.docker_exec_timeout.count(), t.action_timeout.count());
    }

    if (config.port_pool.range_start > config.port_pool.range_end) {
        throw ConfigError("port_pool", "range start " +
                          std::to_string(config.port_pool.range_start) +
                          " is above range end " +
                          std::to_string(config.port_pool.range_end));
    }
    if (config.port_pool.retry_interval.count() <= 0) {
        throw ConfigError("port_pool.retry_interval", "must be > 0");
    }

    if (config.base_network.empty()) {
        throw ConfigError("base_network", "must not be empty");
    }
    if (config.docker_binary.empty()) {
        throw ConfigError("docker_binary", "must not be empty");
    }
}

} // namespace core
} // namespace ctfbox
