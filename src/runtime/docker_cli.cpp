/**
 * @file docker_cli.cpp
 * @brief Docker CLI control plane
 *
 * Commands are spawned with popen and stderr folded into stdout. Output is
 * read in chunks and forwarded to the caller's callback as it arrives, so a
 * caller that gives up early still holds everything printed so far.
 *
 * **Exec wrapping**:
 * ```
 * docker exec [--privileged] [-u USER] ID /bin/sh -c 'eval "$1"; exit $?' MARKER COMMAND
 * ```
 * The marker becomes $0 of the shell, so it appears in `ps` output for the
 * whole lifetime of the command. Because `eval` is not the last command of
 * the script, the shell cannot replace itself with the user's command, and
 * the marker stays visible. Plain POSIX sh, so busybox images work too.
 *
 * A failed exec whose output looks like a daemon error is only treated as
 * one when `docker inspect` agrees the container is not running: an agent
 * may well run a docker client of its own.
 *
 * @date 2025
 */

#include "ctfbox/runtime/docker_cli.hpp"
#include "ctfbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <array>
#include <cstdio>
#include <sys/wait.h>

using json = nlohmann::json;

namespace ctfbox {
namespace runtime {

using utils::StringUtils;

namespace {

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

CliResult ExecuteCommand(const std::string& command, const OutputCallback& on_output) {
    CliResult result;

    std::array<char, 4096> buffer;
    std::string cmd = command + " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.exit_code = -1;
        result.output = "Failed to execute command";
        return result;
    }

    std::size_t count = 0;
    while ((count = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        std::string chunk(buffer.data(), count);
        result.output += chunk;
        if (on_output) {
            on_output(chunk);
        }
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}

std::string FirstLine(const std::string& text) {
    auto lines = StringUtils::SplitLines(StringUtils::Trim(text));
    return lines.empty() ? std::string() : lines.front();
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerCli::DockerCli(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {
    spdlog::debug("Docker control plane using client: {}", docker_binary_);
}

bool DockerCli::IsDaemonAvailable() {
    auto result = Run({"version", "--format", "{{.Server.Version}}"});
    if (!result.Ok()) {
        spdlog::error("Docker daemon not reachable: {}", FirstLine(result.output));
        return false;
    }
    spdlog::info("Docker server version: {}", StringUtils::Trim(result.output));
    return true;
}

// ============================================================================
// CONTAINERS
// ============================================================================

std::string DockerCli::CreateContainer(const ContainerSpec& spec) {
    spdlog::info("Creating container: {} ({})", spec.name, spec.image);

    auto result = Run(BuildRunArgs(spec));
    if (!result.Ok()) {
        throw ControlPlaneError("Failed to create container " + spec.name + ": " +
                                FirstLine(result.output));
    }

    // `docker run` may print pull progress before the id
    auto lines = StringUtils::SplitLines(StringUtils::Trim(result.output));
    if (lines.empty()) {
        throw ControlPlaneError("docker run returned no container id for " + spec.name);
    }
    std::string container_id = StringUtils::Trim(lines.back());

    // Extra networks are attached after start
    for (std::size_t i = 1; i < spec.networks.size(); ++i) {
        if (!ConnectNetwork(spec.networks[i].network, container_id, spec.networks[i].aliases)) {
            RemoveContainer(container_id);
            throw ControlPlaneError("Failed to attach " + spec.name + " to " +
                                    spec.networks[i].network);
        }
    }

    spdlog::info("Container created: {}", container_id.substr(0, 12));
    return container_id;
}

RawExecResult DockerCli::Exec(const std::string& container_id,
                              const std::string& command,
                              const ExecOptions& options,
                              const OutputCallback& on_output) {
    auto result = Run(BuildExecArgs(container_id, command, options), on_output);

    if (result.exit_code != 0 && IsConnectionError(result.output) && !IsContainerRunning(container_id)) {
        throw ControlPlaneError(FirstLine(result.output));
    }

    RawExecResult raw;
    raw.exit_code = result.exit_code;
    raw.output = std::move(result.output);
    return raw;
}

bool DockerCli::IsContainerRunning(const std::string& container_id) {
    auto result = Run({"inspect", "--format", "{{.State.Running}}", container_id});
    return result.Ok() && StringUtils::Trim(result.output) == "true";
}

bool DockerCli::RemoveContainer(const std::string& container_id) {
    spdlog::info("Removing container: {}", container_id.substr(0, 12));

    auto result = Run({"rm", "--force", container_id});
    if (result.Ok() || StringUtils::Contains(result.output, "No such container")) {
        return true;
    }

    spdlog::error("Failed to remove container {}: {}", container_id, FirstLine(result.output));
    return false;
}

bool DockerCli::CopyToContainer(const std::string& container_id,
                                const std::filesystem::path& host_path,
                                const std::string& container_path) {
    spdlog::debug("Copying {} to {}:{}", host_path.string(), container_id.substr(0, 12), container_path);

    auto result = Run({"cp", host_path.string(), container_id + ":" + container_path});
    if (result.Ok()) {
        return true;
    }
    if (IsConnectionError(result.output)) {
        throw ControlPlaneError(FirstLine(result.output));
    }

    spdlog::error("Failed to copy {} into {}: {}", host_path.string(), container_id, FirstLine(result.output));
    return false;
}

// ============================================================================
// NETWORKS
// ============================================================================

bool DockerCli::NetworkExists(const std::string& network) {
    return Run({"network", "inspect", "--format", "{{.Name}}", network}).Ok();
}

bool DockerCli::CreateNetwork(const std::string& network) {
    spdlog::info("Creating network: {}", network);

    auto result = Run({"network", "create", "--driver", "bridge", network});
    if (result.Ok() || StringUtils::Contains(result.output, "already exists")) {
        return true;
    }

    spdlog::error("Failed to create network {}: {}", network, FirstLine(result.output));
    return false;
}

NetworkRemoval DockerCli::RemoveNetwork(const std::string& network) {
    auto result = Run({"network", "rm", network});
    if (result.Ok()) {
        spdlog::info("Network removed: {}", network);
        return NetworkRemoval::REMOVED;
    }

    std::string lower = StringUtils::ToLower(result.output);
    if (StringUtils::Contains(lower, "not found") || StringUtils::Contains(lower, "no such network")) {
        return NetworkRemoval::NOT_FOUND;
    }
    if (StringUtils::Contains(lower, "active endpoints")) {
        return NetworkRemoval::ACTIVE_ENDPOINTS;
    }

    spdlog::warn("Failed to remove network {}: {}", network, FirstLine(result.output));
    return NetworkRemoval::ERROR;
}

bool DockerCli::ConnectNetwork(const std::string& network,
                               const std::string& container_id,
                               const std::vector<std::string>& aliases) {
    std::vector<std::string> args = {"network", "connect"};
    for (const auto& alias : aliases) {
        args.push_back("--alias");
        args.push_back(alias);
    }
    args.push_back(network);
    args.push_back(container_id);

    auto result = Run(args);
    if (!result.Ok() && !StringUtils::Contains(result.output, "already exists")) {
        spdlog::error("Failed to connect {} to {}: {}", container_id, network, FirstLine(result.output));
        return false;
    }
    return true;
}

bool DockerCli::DisconnectNetwork(const std::string& network, const std::string& container_id) {
    auto result = Run({"network", "disconnect", "--force", network, container_id});
    if (!result.Ok()) {
        spdlog::warn("Failed to disconnect {} from {}: {}", container_id, network, FirstLine(result.output));
        return false;
    }
    return true;
}

std::vector<std::string> DockerCli::ListNetworkContainers(const std::string& network) {
    std::vector<std::string> ids;

    auto result = Run({"network", "inspect", "--format", "{{json .Containers}}", network});
    if (!result.Ok()) {
        return ids;
    }

    try {
        json containers = json::parse(StringUtils::Trim(result.output));
        if (containers.is_object()) {
            for (auto it = containers.begin(); it != containers.end(); ++it) {
                ids.push_back(it.key());
            }
        }
    }
    catch (const json::exception& e) {
        spdlog::warn("Failed to parse network inspect output: {}", e.what());
    }
    return ids;
}

std::vector<std::string> DockerCli::ListNetworks(const std::string& prefix) {
    std::vector<std::string> names;

    // The name filter matches substrings
    auto result = Run({"network", "ls", "--filter", "name=" + prefix, "--format", "{{.Name}}"});
    if (!result.Ok()) {
        throw ControlPlaneError("Failed to list networks: " + FirstLine(result.output));
    }

    for (const auto& line : StringUtils::SplitLines(result.output)) {
        std::string name = StringUtils::Trim(line);
        if (StringUtils::StartsWith(name, prefix)) {
            names.push_back(name);
        }
    }
    return names;
}

// ============================================================================
// COMPOSE
// ============================================================================

std::vector<ServiceContainer> DockerCli::ComposeUp(const std::filesystem::path& manifest,
                                                   const std::string& project) {
    spdlog::info("Starting compose project {} from {}", project, manifest.string());

    auto args = ComposeArgs(manifest, project);
    args.insert(args.end(), {"up", "-d", "--force-recreate"});

    auto result = Run(args);
    if (!result.Ok()) {
        throw ControlPlaneError("docker compose up failed for " + project + ": " +
                                FirstLine(result.output));
    }

    auto services = ComposePs(manifest, project);
    if (services.empty()) {
        throw ControlPlaneError("docker compose up started no containers for " + project);
    }
    return services;
}

bool DockerCli::ComposeDown(const std::filesystem::path& manifest, const std::string& project) {
    spdlog::info("Stopping compose project {}", project);

    auto args = ComposeArgs(manifest, project);
    args.insert(args.end(), {"down", "--remove-orphans", "--volumes"});

    auto result = Run(args);
    if (!result.Ok()) {
        spdlog::error("docker compose down failed for {}: {}", project, FirstLine(result.output));
        return false;
    }
    return true;
}

ServiceContainer DockerCli::RecreateService(const std::filesystem::path& manifest,
                                            const std::string& project,
                                            const std::string& service) {
    spdlog::info("Recreating service {} of project {}", service, project);

    auto args = ComposeArgs(manifest, project);
    args.insert(args.end(), {"up", "-d", "--force-recreate", "--no-deps", service});

    auto result = Run(args);
    if (!result.Ok()) {
        throw ControlPlaneError("Failed to recreate service " + service + ": " +
                                FirstLine(result.output));
    }

    for (const auto& container : ComposePs(manifest, project)) {
        if (container.service == service) {
            return container;
        }
    }
    throw ControlPlaneError("Recreated service " + service + " is not running");
}

// ============================================================================
// ARGUMENT BUILDERS
// ============================================================================

std::vector<std::string> DockerCli::BuildRunArgs(const ContainerSpec& spec) {
    std::vector<std::string> args = {"run", "-d", "--init"};

    if (!spec.name.empty()) {
        args.push_back("--name");
        args.push_back(spec.name);
    }

    if (!spec.networks.empty()) {
        const auto& primary = spec.networks.front();
        args.push_back("--network");
        args.push_back(primary.network);
        for (const auto& alias : primary.aliases) {
            args.push_back("--network-alias");
            args.push_back(alias);
        }
    }

    for (const auto& env : spec.environment) {
        args.push_back("-e");
        args.push_back(env);
    }

    if (!spec.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(spec.working_dir);
    }

    // Image must come last before the command
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    return args;
}

std::vector<std::string> DockerCli::BuildExecArgs(const std::string& container_id,
                                                  const std::string& command,
                                                  const ExecOptions& options) {
    std::vector<std::string> args = {"exec"};

    if (options.privileged) {
        args.push_back("--privileged");
    }
    if (!options.user.empty()) {
        args.push_back("-u");
        args.push_back(options.user);
    }

    args.push_back(container_id);
    args.push_back("/bin/sh");
    args.push_back("-c");

    if (options.marker.empty()) {
        args.push_back(command);
    } else {
        args.push_back("eval \"$1\"; exit $?");
        args.push_back(options.marker);
        args.push_back(command);
    }

    return args;
}

std::vector<ServiceContainer> DockerCli::ParseComposePs(const std::string& output) {
    std::vector<ServiceContainer> services;

    auto add = [&services](const json& entry) {
        if (!entry.is_object()) {
            return;
        }
        ServiceContainer container;
        container.service = entry.value("Service", "");
        container.id = entry.value("ID", "");
        container.name = entry.value("Name", "");
        if (!container.id.empty()) {
            services.push_back(container);
        }
    };

    std::string trimmed = StringUtils::Trim(output);
    if (trimmed.empty()) {
        return services;
    }

    try {
        if (trimmed.front() == '[') {
            for (const auto& entry : json::parse(trimmed)) {
                add(entry);
            }
            return services;
        }

        for (const auto& line : StringUtils::SplitLines(trimmed)) {
            if (StringUtils::Trim(line).empty()) {
                continue;
            }
            add(json::parse(line));
        }
    }
    catch (const json::exception& e) {
        spdlog::warn("Failed to parse compose ps output: {}", e.what());
    }

    return services;
}

bool DockerCli::IsConnectionError(const std::string& output) {
    std::string first = FirstLine(output);
    return StringUtils::Contains(output, "Cannot connect to the Docker daemon") ||
           StringUtils::Contains(output, "error during connect") ||
           StringUtils::StartsWith(first, "Error response from daemon:");
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

CliResult DockerCli::Run(const std::vector<std::string>& args,
                         const OutputCallback& on_output) const {
    std::string command = StringUtils::ShellQuote(docker_binary_) + " " + StringUtils::ShellJoin(args);
    spdlog::debug("Executing: {}", StringUtils::Truncate(command, 300));
    return ExecuteCommand(command, on_output);
}

std::vector<std::string> DockerCli::ComposeArgs(const std::filesystem::path& manifest,
                                                const std::string& project) const {
    return {"compose", "-f", manifest.string(), "-p", project};
}

std::vector<ServiceContainer> DockerCli::ComposePs(const std::filesystem::path& manifest,
                                                   const std::string& project) {
    auto args = ComposeArgs(manifest, project);
    args.insert(args.end(), {"ps", "--format", "json"});

    auto result = Run(args);
    if (!result.Ok()) {
        throw ControlPlaneError("docker compose ps failed for " + project + ": " +
                                FirstLine(result.output));
    }
    return ParseComposePs(result.output);
}

} // namespace runtime
} // namespace ctfbox
