/**
 * @file topology_allocator.hpp
 * @brief Collision-free ports and networks for parallel challenge instances
 *
 * Given a compose manifest, the allocator draws host ports from the PortPool,
 * picks a unique suffix, and writes a rewritten manifest next to the original
 * in which every service, container name and the base network carry that
 * suffix. Internal ports never change; only host-side mappings do.
 *
 * @date 2025
 */

#pragma once

#include "ctfbox/core/config.hpp"
#include "ctfbox/executor/guarded_executor.hpp"
#include "ctfbox/network/port_pool.hpp"
#include "ctfbox/runtime/control_plane.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctfbox {
namespace network {

/**
 * @struct DeclaredPort
 * @brief Container-side port a service exposes
 */
struct DeclaredPort {
    std::string service;
    std::uint16_t internal_port{0};
    std::string protocol{"tcp"};

    bool operator==(const DeclaredPort& other) const {
        return service == other.service && internal_port == other.internal_port &&
               protocol == other.protocol;
    }
};

/**
 * @struct PortMapping
 * @brief Internal port → allocated host port
 */
struct PortMapping {
    std::string service;           ///< Original service name
    std::uint16_t internal_port{0};
    std::string protocol{"tcp"};
    std::uint16_t host_port{0};
};

/**
 * @struct NetworkAllocation
 * @brief Virtual network used by one session
 */
struct NetworkAllocation {
    std::string name;
    bool created{false};                        ///< Owned by this allocation and removed on release
    std::vector<std::string> attached_containers;
};

/**
 * @struct AllocationRequest
 * @brief Input of TopologyAllocator::Allocate
 */
struct AllocationRequest {
    std::string owner;                              ///< Port lease owner
    std::filesystem::path manifest;                 ///< Original compose file
    std::vector<std::uint16_t> extra_internal_ports;   ///< Challenge ports for the primary service
    std::string primary_service;                    ///< Empty = first service in the manifest
};

/**
 * @struct TopologyAllocation
 * @brief Result of an allocation, handed to the topology launcher
 */
struct TopologyAllocation {
    std::string owner;
    std::string suffix;
    std::filesystem::path manifest_path;            ///< Manifest to launch
    bool manifest_rewritten{false};                 ///< manifest_path is ours to delete
    std::string manifest_yaml;                      ///< Rewritten document
    std::vector<PortMapping> ports;
    NetworkAllocation network;
    std::map<std::string, std::string> service_names;   ///< Original → rewritten
    std::vector<std::string> verbatim_ports;        ///< "service: entry" left unmapped (ranges)

    /// Host port mapped to @p internal_port (on @p service if given)
    std::optional<std::uint16_t> HostPortFor(std::uint16_t internal_port,
                                             const std::string& service = "") const;

    nlohmann::json ToJSON() const;
};

/**
 * @struct SweepReport
 * @brief What an orphan sweep removed
 */
struct SweepReport {
    int networks_removed{0};
    int manifests_removed{0};
    int skipped{0};     ///< Still held by a live session
    int errors{0};

    nlohmann::json ToJSON() const;
};

/**
 * @class TopologyAllocator
 * @brief Allocates and releases ports, networks and rewritten manifests
 */
class TopologyAllocator {
public:
    TopologyAllocator(PortPool& pool,
                      std::shared_ptr<runtime::ControlPlane> control_plane,
                      executor::GuardedExecutor& executor,
                      const core::EnvironmentConfig& config);

    /**
     * @brief Rewrite a compose manifest with fresh ports and a unique network
     * @throws AllocationError if ports cannot be drawn or the manifest is unusable
     */
    TopologyAllocation Allocate(const AllocationRequest& request);

    /**
     * @brief Create a unique network for a topology without a manifest
     * @throws AllocationError if the network cannot be created
     */
    TopologyAllocation AllocateNetwork(const std::string& owner);

    /**
     * @brief Static mode: make sure the fixed network exists
     *
     * The fixed network is shared and never removed by release.
     *
     * @throws AllocationError if it neither exists nor can be created
     */
    NetworkAllocation EnsureFixedNetwork();

    /**
     * @brief Give back ports, the rewritten manifest and the network
     *
     * Cleanup problems are logged as warnings and never thrown.
     *
     * @return true if everything was released cleanly
     */
    bool Release(const TopologyAllocation& allocation);

    /**
     * @brief Remove dynamic networks and rewritten manifests left by dead sessions
     *
     * Networks named `<base_network>-*` and `docker-compose-*.yml` files in
     * @p manifest_dirs are removed unless a live pool lease records them.
     * Attached containers are disconnected first.
     */
    SweepReport SweepOrphans(const std::vector<std::filesystem::path>& manifest_dirs);

    // ========================================================================
    // Manifest helpers
    // ========================================================================

    /// Parse one `ports:` entry; nullopt for ranges and unparsable forms
    static std::optional<DeclaredPort> ParsePortEntry(const YAML::Node& entry);

    /**
     * @brief Distinct declared ports of every service plus the extra challenge ports
     * @param verbatim Receives "service: entry" for each entry that cannot be remapped
     */
    static std::vector<DeclaredPort> CollectDeclaredPorts(const YAML::Node& manifest,
                                                          const std::vector<std::uint16_t>& extra_ports,
                                                          const std::string& primary_service,
                                                          std::vector<std::string>* verbatim = nullptr);

    /// @p requested if present in the manifest, otherwise the first service
    static std::string ResolvePrimaryService(const YAML::Node& manifest, const std::string& requested);

    /**
     * @brief Apply suffix, network and port rewriting to a parsed manifest
     * @return New document; @p manifest is not modified
     */
    static YAML::Node RewriteManifest(const YAML::Node& manifest,
                                      const std::string& suffix,
                                      const std::string& base_network,
                                      const std::vector<PortMapping>& ports,
                                      const std::string& primary_service);

    static std::string NetworkNameFor(const std::string& base_network, const std::string& suffix);

private:
    bool RemoveNetwork(const std::string& network);
    void DisconnectAll(const std::string& network);

    PortPool& pool_;
    std::shared_ptr<runtime::ControlPlane> control_plane_;
    executor::GuardedExecutor& executor_;
    core::EnvironmentConfig config_;
};

} // namespace network
} // namespace ctfbox
