/**
 * @file docker_cli.hpp
 * @brief ControlPlane implementation driving the docker command-line client
 *
 * Each call spawns one client process, so concurrent callers never serialize
 * operations on unrelated containers.
 *
 * @date 2025
 */

#pragma once

#include "ctfbox/runtime/control_plane.hpp"

#include <string>
#include <vector>

namespace ctfbox {
namespace runtime {

/**
 * @struct CliResult
 * @brief Raw outcome of one docker client invocation
 */
struct CliResult {
    int exit_code{0};
    std::string output;   ///< Combined stdout/stderr

    bool Ok() const { return exit_code == 0; }
};

/**
 * @class DockerCli
 * @brief Docker CLI backed control plane
 *
 * Usage:
 * @code
 * auto docker = std::make_shared<DockerCli>("docker");
 * auto id = docker->CreateContainer(spec);
 * auto result = docker->Exec(id, "ls /", {}, nullptr);
 * @endcode
 */
class DockerCli : public ControlPlane {
public:
    /**
     * @brief Constructor
     * @param docker_binary Client executable (name on PATH or absolute path)
     */
    explicit DockerCli(std::string docker_binary = "docker");
    ~DockerCli() override = default;

    /// `docker version` succeeds (daemon reachable)
    bool IsDaemonAvailable();

    std::string CreateContainer(const ContainerSpec& spec) override;
    RawExecResult Exec(const std::string& container_id,
                       const std::string& command,
                       const ExecOptions& options,
                       const OutputCallback& on_output) override;
    bool RemoveContainer(const std::string& container_id) override;
    bool CopyToContainer(const std::string& container_id,
                         const std::filesystem::path& host_path,
                         const std::string& container_path) override;

    /// `docker inspect` reports the container as running
    bool IsContainerRunning(const std::string& container_id);

    bool NetworkExists(const std::string& network) override;
    bool CreateNetwork(const std::string& network) override;
    NetworkRemoval RemoveNetwork(const std::string& network) override;
    bool ConnectNetwork(const std::string& network,
                        const std::string& container_id,
                        const std::vector<std::string>& aliases) override;
    bool DisconnectNetwork(const std::string& network,
                           const std::string& container_id) override;
    std::vector<std::string> ListNetworkContainers(const std::string& network) override;
    std::vector<std::string> ListNetworks(const std::string& prefix) override;

    std::vector<ServiceContainer> ComposeUp(const std::filesystem::path& manifest,
                                            const std::string& project) override;
    bool ComposeDown(const std::filesystem::path& manifest,
                     const std::string& project) override;
    ServiceContainer RecreateService(const std::filesystem::path& manifest,
                                     const std::string& project,
                                     const std::string& service) override;

    // ========================================================================
    // Argument builders (exposed for tests)
    // ========================================================================

    static std::vector<std::string> BuildRunArgs(const ContainerSpec& spec);
    static std::vector<std::string> BuildExecArgs(const std::string& container_id,
                                                  const std::string& command,
                                                  const ExecOptions& options);

    /**
     * @brief Parse `docker compose ps --format json`
     *
     * Accepts both the JSON-array form (compose < 2.21) and the
     * one-object-per-line form.
     */
    static std::vector<ServiceContainer> ParseComposePs(const std::string& output);

    /// Output indicates the daemon could not be reached or refused the call
    static bool IsConnectionError(const std::string& output);

private:
    CliResult Run(const std::vector<std::string>& args,
                  const OutputCallback& on_output = nullptr) const;
    std::vector<std::string> ComposeArgs(const std::filesystem::path& manifest,
                                         const std::string& project) const;
    std::vector<ServiceContainer> ComposePs(const std::filesystem::path& manifest,
                                            const std::string& project);

    std::string docker_binary_;
};

} // namespace runtime
} // namespace ctfbox
