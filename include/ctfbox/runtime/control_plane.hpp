/**
 * @file control_plane.hpp
 * @brief Abstract container control plane
 *
 * Every method is a blocking primitive that may hang indefinitely when the
 * runtime misbehaves. Nothing outside the executor calls these directly; the
 * GuardedExecutor wraps each call in a wall-clock deadline.
 *
 * Implementations must be safe to call from several threads at once and must
 * stay alive while an abandoned call is still running, so they are always
 * owned through std::shared_ptr.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ctfbox {
namespace runtime {

/**
 * @class ControlPlaneError
 * @brief The runtime could not be reached or refused the call outright
 *
 * Distinct from a command that ran and exited non-zero.
 */
class ControlPlaneError : public std::runtime_error {
public:
    explicit ControlPlaneError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct NetworkAttachment
 * @brief Network a container joins, with optional DNS aliases
 */
struct NetworkAttachment {
    std::string network;                ///< Network name
    std::vector<std::string> aliases;   ///< Extra DNS names on that network
};

/**
 * @struct ContainerSpec
 * @brief Everything needed to (re)create one container
 */
struct ContainerSpec {
    std::string image;                          ///< Image reference
    std::string name;                           ///< Container name
    std::vector<NetworkAttachment> networks;    ///< First entry is passed to --network
    std::vector<std::string> environment;       ///< KEY=VALUE pairs
    std::vector<std::string> command{"tail", "-f", "/dev/null"};  ///< Keep-alive
    std::string working_dir;                    ///< -w (empty = image default)
};

/**
 * @struct ExecOptions
 * @brief Per-call docker exec switches
 */
struct ExecOptions {
    bool privileged{false};   ///< --privileged
    std::string user;         ///< -u (empty = image default)
    std::string marker;       ///< Tag visible in the process list (empty = none)
};

/**
 * @struct RawExecResult
 * @brief Result of an exec that ran to completion
 */
struct RawExecResult {
    int exit_code{0};
    std::string output;   ///< Combined stdout/stderr
};

/// Receives output chunks as they arrive
using OutputCallback = std::function<void(const std::string&)>;

/**
 * @enum NetworkRemoval
 * @brief Outcome of a network removal attempt
 */
enum class NetworkRemoval {
    REMOVED,
    NOT_FOUND,
    ACTIVE_ENDPOINTS,   ///< Containers are still attached
    ERROR
};

/**
 * @struct ServiceContainer
 * @brief One running container of a compose project
 */
struct ServiceContainer {
    std::string service;   ///< Service key in the manifest
    std::string id;        ///< Container id
    std::string name;      ///< Container name
};

/**
 * @class ControlPlane
 * @brief Container runtime operations used by the environment manager
 */
class ControlPlane {
public:
    virtual ~ControlPlane() = default;

    /**
     * @brief Create and start a detached container
     * @return Container id
     * @throws ControlPlaneError if the container could not be created
     */
    virtual std::string CreateContainer(const ContainerSpec& spec) = 0;

    /**
     * @brief Run a shell command inside a container
     *
     * The command runs under /bin/sh. Output is delivered to @p on_output
     * as it arrives and is also returned in full.
     *
     * @throws ControlPlaneError if the runtime is unreachable or rejects the call
     */
    virtual RawExecResult Exec(const std::string& container_id,
                               const std::string& command,
                               const ExecOptions& options,
                               const OutputCallback& on_output) = 0;

    /// Force-remove a container; true if gone afterwards
    virtual bool RemoveContainer(const std::string& container_id) = 0;

    /**
     * @brief Copy a host file or directory into a container
     * @throws ControlPlaneError if the runtime is unreachable
     */
    virtual bool CopyToContainer(const std::string& container_id,
                                 const std::filesystem::path& host_path,
                                 const std::string& container_path) = 0;

    virtual bool NetworkExists(const std::string& network) = 0;
    virtual bool CreateNetwork(const std::string& network) = 0;
    virtual NetworkRemoval RemoveNetwork(const std::string& network) = 0;
    virtual bool ConnectNetwork(const std::string& network,
                                const std::string& container_id,
                                const std::vector<std::string>& aliases) = 0;
    virtual bool DisconnectNetwork(const std::string& network,
                                   const std::string& container_id) = 0;

    /// Ids of containers attached to a network
    virtual std::vector<std::string> ListNetworkContainers(const std::string& network) = 0;

    /// Names of networks starting with @p prefix
    virtual std::vector<std::string> ListNetworks(const std::string& prefix) = 0;

    /**
     * @brief Bring a compose project up (detached) and list its containers
     * @throws ControlPlaneError on failure
     */
    virtual std::vector<ServiceContainer> ComposeUp(const std::filesystem::path& manifest,
                                                    const std::string& project) = 0;

    virtual bool ComposeDown(const std::filesystem::path& manifest,
                             const std::string& project) = 0;

    /**
     * @brief Force-recreate one service of a running project
     * @return The replacement container
     * @throws ControlPlaneError on failure
     */
    virtual ServiceContainer RecreateService(const std::filesystem::path& manifest,
                                             const std::string& project,
                                             const std::string& service) = 0;
};

} // namespace runtime
} // namespace ctfbox
