/**
 * @file topology_allocator.cpp
 * @brief Compose manifest rewriting and network lifecycle
 *
 * **Rewrite rules** (suffix `3f9a1c2e`, base network `ctfnet`):
 * ```
 * services.web                  → services.web-3f9a1c2e
 * container_name: web           → container_name: web-3f9a1c2e
 * depends_on: [db]              → depends_on: [db-3f9a1c2e]
 * ports: ["8080:80"]            → ports: ["10000:80"]
 * ports: ["127.0.0.1:8080:80"]  → ports: ["127.0.0.1:10000:80"]
 * ports: [80] / ["80/udp"]      → ports: ["10001:80"] / ["10002:80/udp"]
 * ports: [{target: 80, ...}]    → ports: [{target: 80, published: "10003", ...}]
 * networks: [ctfnet]            → networks: {ctfnet-3f9a1c2e: {aliases: [web]}}
 * (no networks)                 → networks: {default: ..., ctfnet-3f9a1c2e: {aliases: [web]}}
 * networks.ctfnet (external)    → networks.ctfnet-3f9a1c2e: {driver: bridge, name: ctfnet-3f9a1c2e}
 * ```
 * Everything else is copied verbatim.
 *
 * @date 2025
 */

#include "ctfbox/network/topology_allocator.hpp"
#include "ctfbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <thread>

using json = nlohmann::json;

namespace ctfbox {
namespace network {

namespace fs = std::filesystem;
using utils::StringUtils;

namespace {

std::optional<std::uint16_t> ParsePortNumber(const std::string& text) {
    std::string trimmed = StringUtils::Trim(text);
    if (trimmed.empty() || trimmed.size() > 5 ||
        !std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    long value = std::stol(trimmed);
    if (value < 1 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

const PortMapping* FindMapping(const std::vector<PortMapping>& ports, const DeclaredPort& port) {
    for (const auto& mapping : ports) {
        if (mapping.service == port.service && mapping.internal_port == port.internal_port &&
            mapping.protocol == port.protocol) {
            return &mapping;
        }
    }
    return nullptr;
}

std::string ShortForm(std::uint16_t host_port, std::uint16_t internal_port, const std::string& protocol) {
    std::string text = std::to_string(host_port) + ":" + std::to_string(internal_port);
    if (protocol != "tcp") {
        text += "/" + protocol;
    }
    return text;
}

YAML::Node RewritePortEntry(const YAML::Node& entry, std::uint16_t host_port) {
    if (entry.IsMap()) {
        YAML::Node rewritten = YAML::Clone(entry);
        rewritten["published"] = std::to_string(host_port);
        return rewritten;
    }

    std::string text = entry.as<std::string>();
    std::string protocol_suffix;
    auto slash = text.find('/');
    if (slash != std::string::npos) {
        protocol_suffix = text.substr(slash);
        text = text.substr(0, slash);
    }

    auto parts = StringUtils::Split(text, ':', true);
    std::string internal = parts.back();
    std::string rewritten = std::to_string(host_port) + ":" + internal + protocol_suffix;

    // Keep the host IP of "ip:host:internal"
    if (parts.size() >= 3) {
        std::vector<std::string> ip_parts(parts.begin(), parts.end() - 2);
        rewritten = StringUtils::Join(ip_parts, ":") + ":" + rewritten;
    }

    return YAML::Node(rewritten);
}

std::string Renamed(const std::string& name, const std::set<std::string>& services, const std::string& suffix) {
    return services.count(name) > 0 ? name + "-" + suffix : name;
}

YAML::Node AliasConfig(const YAML::Node& existing, const std::string& alias) {
    YAML::Node config = existing.IsMap() ? YAML::Clone(existing) : YAML::Node(YAML::NodeType::Map);

    YAML::Node aliases(YAML::NodeType::Sequence);
    if (config["aliases"] && config["aliases"].IsSequence()) {
        aliases = config["aliases"];
    }

    bool present = false;
    for (const auto& a : aliases) {
        if (a.as<std::string>() == alias) {
            present = true;
            break;
        }
    }
    if (!present) {
        aliases.push_back(alias);
    }

    config["aliases"] = aliases;
    return config;
}

} // anonymous namespace

// ============================================================================
// TOPOLOGY ALLOCATION
// ============================================================================

std::optional<std::uint16_t> TopologyAllocation::HostPortFor(std::uint16_t internal_port,
                                                            const std::string& service) const {
    for (const auto& mapping : ports) {
        if (mapping.internal_port == internal_port && (service.empty() || mapping.service == service)) {
            return mapping.host_port;
        }
    }
    return std::nullopt;
}

json TopologyAllocation::ToJSON() const {
    json j;
    j["owner"] = owner;
    j["suffix"] = suffix;
    j["manifest"] = manifest_path.string();
    j["network"] = {{"name", network.name}, {"created", network.created}};

    json port_array = json::array();
    for (const auto& mapping : ports) {
        port_array.push_back({
            {"service", mapping.service},
            {"internal", mapping.internal_port},
            {"protocol", mapping.protocol},
            {"host", mapping.host_port}
        });
    }
    j["ports"] = port_array;
    if (!verbatim_ports.empty()) {
        j["verbatim_ports"] = verbatim_ports;
    }
    return j;
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

TopologyAllocator::TopologyAllocator(PortPool& pool,
                                     std::shared_ptr<runtime::ControlPlane> control_plane,
                                     executor::GuardedExecutor& executor,
                                     const core::EnvironmentConfig& config)
    : pool_(pool)
    , control_plane_(std::move(control_plane))
    , executor_(executor)
    , config_(config) {}

// ============================================================================
// ALLOCATE
// ============================================================================

TopologyAllocation TopologyAllocator::Allocate(const AllocationRequest& request) {
    spdlog::info("Allocating dynamic topology for {} ({})", request.owner, request.manifest.string());

    YAML::Node manifest;
    try {
        manifest = YAML::LoadFile(request.manifest.string());
    }
    catch (const YAML::Exception& e) {
        throw AllocationError("Cannot read manifest " + request.manifest.string() + ": " + e.what());
    }

    if (!manifest["services"] || !manifest["services"].IsMap() || manifest["services"].size() == 0) {
        throw AllocationError("Manifest " + request.manifest.string() + " declares no services");
    }

    const auto primary = ResolvePrimaryService(manifest, request.primary_service);
    std::vector<std::string> verbatim;
    const auto declared = CollectDeclaredPorts(manifest, request.extra_internal_ports, primary, &verbatim);

    TopologyAllocation allocation;
    allocation.owner = request.owner;
    allocation.verbatim_ports = verbatim;
    allocation.suffix = StringUtils::RandomHex(8);
    allocation.network.name = NetworkNameFor(config_.base_network, allocation.suffix);
    allocation.network.created = true;

    auto host_ports = pool_.Acquire(request.owner, declared.size());

    try {
        pool_.Record(request.owner, allocation.network.name);

        for (std::size_t i = 0; i < declared.size(); ++i) {
            PortMapping mapping;
            mapping.service = declared[i].service;
            mapping.internal_port = declared[i].internal_port;
            mapping.protocol = declared[i].protocol;
            mapping.host_port = host_ports[i];
            allocation.ports.push_back(mapping);
        }

        YAML::Node rewritten = RewriteManifest(manifest, allocation.suffix, config_.base_network,
                                               allocation.ports, primary);
        allocation.manifest_yaml = YAML::Dump(rewritten);

        for (auto it = manifest["services"].begin(); it != manifest["services"].end(); ++it) {
            auto name = it->first.as<std::string>();
            allocation.service_names[name] = name + "-" + allocation.suffix;
        }

        allocation.manifest_path = request.manifest.parent_path() /
            ("docker-compose-" + allocation.suffix + "-" + StringUtils::RandomHex(6) + ".yml");
        pool_.Record(request.owner, allocation.manifest_path.string());

        std::ofstream out(allocation.manifest_path);
        if (!out) {
            throw AllocationError("Cannot write " + allocation.manifest_path.string());
        }
        out << allocation.manifest_yaml << "\n";
        out.close();
        allocation.manifest_rewritten = true;
    }
    catch (const std::exception& e) {
        pool_.Release(request.owner);
        throw AllocationError(std::string("Manifest rewrite failed: ") + e.what());
    }

    for (const auto& mapping : allocation.ports) {
        spdlog::info("  ✓ {} {}/{} -> host {}", mapping.service, mapping.internal_port,
                     mapping.protocol, mapping.host_port);
    }
    spdlog::info("✓ Dynamic topology ready: network {}, manifest {}", allocation.network.name,
                 allocation.manifest_path.filename().string());

    return allocation;
}

TopologyAllocation TopologyAllocator::AllocateNetwork(const std::string& owner) {
    TopologyAllocation allocation;
    allocation.owner = owner;
    allocation.suffix = StringUtils::RandomHex(8);
    allocation.network.name = NetworkNameFor(config_.base_network, allocation.suffix);

    auto control_plane = control_plane_;
    auto name = allocation.network.name;
    pool_.Record(owner, name);

    auto created = executor_.Guard("create network " + name, config_.timeouts.docker_exec_timeout,
                                   [control_plane, name]() { return control_plane->CreateNetwork(name); });
    if (!created || !*created.value) {
        pool_.Release(owner);
        throw AllocationError("Cannot create network " + name);
    }

    allocation.network.created = true;
    spdlog::info("✓ Network {} allocated for {}", name, owner);
    return allocation;
}

NetworkAllocation TopologyAllocator::EnsureFixedNetwork() {
    NetworkAllocation network;
    network.name = config_.base_network;

    auto control_plane = control_plane_;
    auto name = network.name;
    const auto budget = config_.timeouts.docker_exec_timeout;

    auto exists = executor_.Guard("inspect network " + name, budget,
                                  [control_plane, name]() { return control_plane->NetworkExists(name); });
    if (!exists) {
        throw AllocationError("Cannot inspect network " + name);
    }

    if (!*exists.value) {
        auto created = executor_.Guard("create network " + name, budget,
                                       [control_plane, name]() { return control_plane->CreateNetwork(name); });
        if (!created || !*created.value) {
            throw AllocationError("Cannot create network " + name);
        }
        spdlog::info("Created fixed network {}", name);
    }

    return network;
}

// ============================================================================
// RELEASE
// ============================================================================

bool TopologyAllocator::Release(const TopologyAllocation& allocation) {
    bool clean = true;

    try {
        pool_.Release(allocation.owner);
    }
    catch (const std::exception& e) {
        spdlog::warn("Could not release ports of {}: {}", allocation.owner, e.what());
        clean = false;
    }

    if (allocation.manifest_rewritten && !allocation.manifest_path.empty()) {
        std::error_code ec;
        fs::remove(allocation.manifest_path, ec);
        if (ec) {
            spdlog::warn("Could not delete {}: {}", allocation.manifest_path.string(), ec.message());
            clean = false;
        }
    }

    if (allocation.network.created && !RemoveNetwork(allocation.network.name)) {
        clean = false;
    }

    return clean;
}

bool TopologyAllocator::RemoveNetwork(const std::string& network) {
    auto control_plane = control_plane_;
    const auto budget = config_.timeouts.docker_exec_timeout;
    const int attempts = config_.timeouts.max_retries;
    // Backoff starts at the pool retry interval and doubles
    auto backoff = config_.port_pool.retry_interval;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto removal = executor_.Guard("remove network " + network, budget,
                                       [control_plane, network]() { return control_plane->RemoveNetwork(network); });

        if (removal && (*removal.value == runtime::NetworkRemoval::REMOVED ||
                        *removal.value == runtime::NetworkRemoval::NOT_FOUND)) {
            return true;
        }
        if (attempt == attempts) {
            break;
        }

        if (removal && *removal.value == runtime::NetworkRemoval::ACTIVE_ENDPOINTS) {
            spdlog::debug("Network {} still has endpoints (attempt {}/{})", network, attempt, attempts);

            if (attempt + 1 == attempts) {
                DisconnectAll(network);
            }
        }

        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }

    spdlog::warn("Network {} could not be removed after {} attempt(s); leaving it behind", network, attempts);
    return false;
}

void TopologyAllocator::DisconnectAll(const std::string& network) {
    auto control_plane = control_plane_;
    const auto budget = config_.timeouts.docker_exec_timeout;

    auto attached = executor_.Guard("list network " + network, budget,
                                    [control_plane, network]() {
                                        return control_plane->ListNetworkContainers(network);
                                    });
    if (!attached) {
        return;
    }

    for (const auto& container_id : *attached.value) {
        spdlog::info("Disconnecting {} from {}", container_id, network);
        auto disconnected = executor_.Guard("disconnect " + container_id, budget,
                                            [control_plane, network, container_id]() {
                                                return control_plane->DisconnectNetwork(network, container_id);
                                            });
        if (!disconnected || !*disconnected.value) {
            spdlog::warn("Could not disconnect {} from {}", container_id, network);
        }
    }
}

// ============================================================================
// ORPHAN SWEEP
// ============================================================================

json SweepReport::ToJSON() const {
    json j;
    j["networks_removed"] = networks_removed;
    j["manifests_removed"] = manifests_removed;
    j["skipped"] = skipped;
    j["errors"] = errors;
    return j;
}

SweepReport TopologyAllocator::SweepOrphans(const std::vector<fs::path>& manifest_dirs) {
    SweepReport report;

    std::set<std::string> live;
    for (const auto& lease : pool_.Leases()) {
        live.insert(lease.resources.begin(), lease.resources.end());
    }

    const std::string prefix = config_.base_network + "-";
    auto control_plane = control_plane_;
    auto listed = executor_.Guard("list networks " + prefix + "*", config_.timeouts.docker_exec_timeout,
                                  [control_plane, prefix]() { return control_plane->ListNetworks(prefix); });
    if (!listed) {
        spdlog::error("Cannot list networks: {}", listed.timed_out ? "timed out" : listed.error);
        report.errors++;
    } else {
        for (const auto& network : *listed.value) {
            if (live.count(network) > 0) {
                spdlog::debug("Network {} belongs to a live session", network);
                report.skipped++;
                continue;
            }
            DisconnectAll(network);
            if (RemoveNetwork(network)) {
                spdlog::info("  ✓ Removed orphaned network {}", network);
                report.networks_removed++;
            } else {
                report.errors++;
            }
        }
    }

    for (const auto& dir : manifest_dirs) {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            spdlog::debug("Skipping {}: {}", dir.string(), ec.message());
            continue;
        }

        for (const auto& entry : it) {
            const auto filename = entry.path().filename().string();
            if (!entry.is_regular_file(ec) || !StringUtils::StartsWith(filename, "docker-compose-") ||
                !StringUtils::EndsWith(filename, ".yml")) {
                continue;
            }
            if (live.count(entry.path().string()) > 0) {
                report.skipped++;
                continue;
            }
            if (fs::remove(entry.path(), ec)) {
                spdlog::info("  ✓ Removed stale manifest {}", entry.path().string());
                report.manifests_removed++;
            } else if (ec) {
                spdlog::warn("Could not delete {}: {}", entry.path().string(), ec.message());
                report.errors++;
            }
        }
    }

    spdlog::info("✓ Orphan sweep: {} network(s), {} manifest(s) removed; {} in use, {} error(s)",
                 report.networks_removed, report.manifests_removed, report.skipped, report.errors);
    return report;
}

// ============================================================================
// MANIFEST HELPERS
// ============================================================================

std::optional<DeclaredPort> TopologyAllocator::ParsePortEntry(const YAML::Node& entry) {
    DeclaredPort port;

    if (entry.IsMap()) {
        if (!entry["target"]) {
            return std::nullopt;
        }
        auto number = ParsePortNumber(entry["target"].as<std::string>());
        if (!number) {
            return std::nullopt;
        }
        port.internal_port = *number;
        if (entry["protocol"]) {
            port.protocol = StringUtils::ToLower(entry["protocol"].as<std::string>());
        }
        return port;
    }

    if (!entry.IsScalar()) {
        return std::nullopt;
    }

    std::string text = entry.as<std::string>();
    auto slash = text.find('/');
    if (slash != std::string::npos) {
        port.protocol = StringUtils::ToLower(text.substr(slash + 1));
        text = text.substr(0, slash);
    }

    auto parts = StringUtils::Split(text, ':', true);
    if (parts.empty()) {
        return std::nullopt;
    }

    // Ranges ("8000-8010") are not remapped
    auto number = ParsePortNumber(parts.back());
    if (!number) {
        return std::nullopt;
    }

    port.internal_port = *number;
    return port;
}

std::vector<DeclaredPort> TopologyAllocator::CollectDeclaredPorts(const YAML::Node& manifest,
                                                                  const std::vector<std::uint16_t>& extra_ports,
                                                                  const std::string& primary_service,
                                                                  std::vector<std::string>* verbatim) {
    std::vector<DeclaredPort> declared;

    auto add = [&declared](const DeclaredPort& port) {
        if (std::find(declared.begin(), declared.end(), port) == declared.end()) {
            declared.push_back(port);
        }
    };

    const auto services = manifest["services"];
    if (!services || !services.IsMap()) {
        return declared;
    }

    for (auto it = services.begin(); it != services.end(); ++it) {
        const auto name = it->first.as<std::string>();
        const auto& config = it->second;
        if (!config.IsMap() || !config["ports"] || !config["ports"].IsSequence()) {
            continue;
        }

        for (const auto& entry : config["ports"]) {
            auto port = ParsePortEntry(entry);
            if (!port) {
                const std::string text = entry.IsScalar() ? entry.as<std::string>() : YAML::Dump(entry);
                if (entry.IsScalar() && StringUtils::Contains(text, ":")) {
                    spdlog::warn("Service {}: port entry '{}' binds fixed host ports and is kept verbatim; "
                                 "parallel sessions of this manifest will collide on them", name, text);
                } else {
                    spdlog::warn("Service {}: port entry '{}' kept verbatim", name, text);
                }
                if (verbatim != nullptr) {
                    verbatim->push_back(name + ": " + text);
                }
                continue;
            }
            port->service = name;
            add(*port);
        }
    }

    for (auto internal : extra_ports) {
        DeclaredPort port;
        port.service = primary_service;
        port.internal_port = internal;
        add(port);
    }

    return declared;
}

std::string TopologyAllocator::ResolvePrimaryService(const YAML::Node& manifest, const std::string& requested) {
    const auto services = manifest["services"];
    if (!services || !services.IsMap() || services.size() == 0) {
        return requested;
    }
    if (!requested.empty() && services[requested]) {
        return requested;
    }
    if (!requested.empty()) {
        spdlog::warn("Service {} not in manifest; using the first service", requested);
    }
    return services.begin()->first.as<std::string>();
}

YAML::Node TopologyAllocator::RewriteManifest(const YAML::Node& manifest,
                                              const std::string& suffix,
                                              const std::string& base_network,
                                              const std::vector<PortMapping>& ports,
                                              const std::string& primary_service) {
    YAML::Node document = YAML::Clone(manifest);
    const std::string dynamic_network = NetworkNameFor(base_network, suffix);

    std::set<std::string> service_names;
    for (auto it = manifest["services"].begin(); it != manifest["services"].end(); ++it) {
        service_names.insert(it->first.as<std::string>());
    }

    YAML::Node services(YAML::NodeType::Map);

    for (auto it = manifest["services"].begin(); it != manifest["services"].end(); ++it) {
        const auto name = it->first.as<std::string>();
        YAML::Node service = it->second.IsMap() ? YAML::Clone(it->second) : YAML::Node(YAML::NodeType::Map);

        if (service["container_name"]) {
            service["container_name"] = service["container_name"].as<std::string>() + "-" + suffix;
        }

        // depends_on: list or map form
        if (service["depends_on"]) {
            const YAML::Node original = service["depends_on"];
            if (original.IsSequence()) {
                YAML::Node renamed(YAML::NodeType::Sequence);
                for (const auto& dependency : original) {
                    renamed.push_back(Renamed(dependency.as<std::string>(), service_names, suffix));
                }
                service["depends_on"] = renamed;
            } else if (original.IsMap()) {
                YAML::Node renamed(YAML::NodeType::Map);
                for (auto dep = original.begin(); dep != original.end(); ++dep) {
                    renamed[Renamed(dep->first.as<std::string>(), service_names, suffix)] = YAML::Clone(dep->second);
                }
                service["depends_on"] = renamed;
            }
        }

        // ports
        std::set<std::pair<std::uint16_t, std::string>> present;
        YAML::Node new_ports(YAML::NodeType::Sequence);
        if (service["ports"] && service["ports"].IsSequence()) {
            for (const auto& entry : service["ports"]) {
                auto port = ParsePortEntry(entry);
                const PortMapping* mapping = nullptr;
                if (port) {
                    port->service = name;
                    mapping = FindMapping(ports, *port);
                }
                if (mapping != nullptr) {
                    new_ports.push_back(RewritePortEntry(entry, mapping->host_port));
                    present.insert({mapping->internal_port, mapping->protocol});
                } else {
                    new_ports.push_back(YAML::Clone(entry));
                }
            }
        }
        for (const auto& mapping : ports) {
            if (mapping.service == name && name == primary_service &&
                present.count({mapping.internal_port, mapping.protocol}) == 0) {
                new_ports.push_back(ShortForm(mapping.host_port, mapping.internal_port, mapping.protocol));
                present.insert({mapping.internal_port, mapping.protocol});
            }
        }
        if (new_ports.size() > 0) {
            service["ports"] = new_ports;
        }

        // networks: every service joins the dynamic network, where its
        // original name stays resolvable as an alias
        if (!service["network_mode"]) {
            YAML::Node networks(YAML::NodeType::Map);
            const YAML::Node original = service["networks"];

            if (!original) {
                networks["default"] = AliasConfig(YAML::Node(), name);
            } else if (original.IsSequence()) {
                for (const auto& net : original) {
                    auto net_name = net.as<std::string>();
                    if (net_name == base_network) {
                        net_name = dynamic_network;
                    }
                    networks[net_name] = AliasConfig(YAML::Node(), name);
                }
            } else if (original.IsMap()) {
                for (auto net = original.begin(); net != original.end(); ++net) {
                    auto net_name = net->first.as<std::string>();
                    if (net_name == base_network) {
                        net_name = dynamic_network;
                    }
                    networks[net_name] = AliasConfig(net->second, name);
                }
            }
            bool joined = false;
            for (auto net = networks.begin(); net != networks.end(); ++net) {
                joined = joined || net->first.as<std::string>() == dynamic_network;
            }
            if (!joined) {
                networks[dynamic_network] = AliasConfig(YAML::Node(), name);
            }

            service["networks"] = networks;
        }

        services[name + "-" + suffix] = service;
    }

    document["services"] = services;

    // Top-level networks: the base network is replaced by one this project creates
    YAML::Node networks(YAML::NodeType::Map);
    if (manifest["networks"] && manifest["networks"].IsMap()) {
        for (auto it = manifest["networks"].begin(); it != manifest["networks"].end(); ++it) {
            auto net_name = it->first.as<std::string>();
            if (net_name != base_network) {
                networks[net_name] = YAML::Clone(it->second);
            }
        }
    }
    YAML::Node declaration(YAML::NodeType::Map);
    declaration["driver"] = "bridge";
    declaration["name"] = dynamic_network;
    networks[dynamic_network] = declaration;
    document["networks"] = networks;

    return document;
}

std::string TopologyAllocator::NetworkNameFor(const std::string& base_network, const std::string& suffix) {
    return base_network + "-" + suffix;
}

} // namespace network
} // namespace ctfbox
