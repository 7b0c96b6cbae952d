/**
 * @file topology.cpp
 * @brief Single-container and compose topologies
 *
 * All control-plane calls go through GuardedExecutor::Guard with the budget
 * that fits the operation: docker_exec_timeout for single containers,
 * compose_startup_timeout / compose_teardown_timeout for compose projects.
 *
 * @date 2025
 */

#include "ctfbox/core/topology.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

using json = nlohmann::json;

namespace ctfbox {
namespace core {

// ============================================================================
// CONTAINER
// ============================================================================

json Container::ToJSON() const {
    json j;
    j["id"] = id;
    j["name"] = name;
    if (!service.empty()) {
        j["service"] = service;
    }
    j["role"] = ToString(role);
    j["networks"] = networks;
    j["health"] = ToString(health);
    j["incarnation"] = incarnation;
    j["created_at"] = std::chrono::duration_cast<std::chrono::seconds>(
        created_at.time_since_epoch()).count();
    return j;
}

std::string ToString(ContainerRole role) {
    return role == ContainerRole::AGENT ? "agent" : "challenge-service";
}

std::string ToString(HealthState state) {
    switch (state) {
        case HealthState::HEALTHY: return "healthy";
        case HealthState::DEGRADED: return "degraded";
        case HealthState::DEAD: return "dead";
    }
    return "unknown";
}

std::string IncarnationName(const std::string& base_name, int incarnation) {
    if (incarnation == 0) {
        return base_name;
    }
    return base_name + "-r" + std::to_string(incarnation);
}

// ============================================================================
// TOPOLOGY (BASE)
// ============================================================================

Topology::Topology(std::shared_ptr<runtime::ControlPlane> control_plane,
                   executor::GuardedExecutor& executor,
                   const EnvironmentConfig& config)
    : control_plane_(std::move(control_plane))
    , executor_(executor)
    , config_(config) {}

Container* Topology::Primary() {
    for (auto& container : containers_) {
        if (container.role == ContainerRole::AGENT) {
            return &container;
        }
    }
    return nullptr;
}

const Container* Topology::Primary() const {
    for (const auto& container : containers_) {
        if (container.role == ContainerRole::AGENT) {
            return &container;
        }
    }
    return nullptr;
}

Container* Topology::Find(const std::string& container_id) {
    auto it = std::find_if(containers_.begin(), containers_.end(),
                           [&container_id](const Container& c) { return c.id == container_id; });
    return it == containers_.end() ? nullptr : &*it;
}

std::optional<std::string> Topology::CreateGuarded(const runtime::ContainerSpec& spec) {
    auto control_plane = control_plane_;
    auto created = executor_.Guard("create container " + spec.name,
                                   config_.timeouts.docker_exec_timeout,
                                   [control_plane, spec]() { return control_plane->CreateContainer(spec); });
    if (!created) {
        spdlog::error("Failed to create container {}{}", spec.name,
                      created.timed_out ? " (timed out)" : "");
        stray_names_.push_back(spec.name);
        return std::nullopt;
    }
    return *created.value;
}

void Topology::RemoveStrays() {
    for (const auto& name : stray_names_) {
        if (!RemoveGuarded(name)) {
            spdlog::warn("Container {} may still be running", name);
        }
    }
    stray_names_.clear();
}

Container* Topology::LaunchAgent(const runtime::ContainerSpec& spec) {
    auto id = CreateGuarded(spec);
    if (!id) {
        return nullptr;
    }

    Container container;
    container.id = *id;
    container.name = spec.name;
    container.role = ContainerRole::AGENT;
    container.created_at = std::chrono::system_clock::now();
    container.spec = spec;
    for (const auto& attachment : spec.networks) {
        container.networks.push_back(attachment.network);
    }

    containers_.push_back(container);
    return &containers_.back();
}

Container* Topology::ReplaceAgent(Container& old, const runtime::ContainerSpec& base_spec) {
    // Each attempt burns an incarnation so a half-created name is never reused
    const int incarnation = old.incarnation + 1;
    old.incarnation = incarnation;

    runtime::ContainerSpec spec = base_spec;
    spec.name = IncarnationName(base_spec.name, incarnation);

    auto id = CreateGuarded(spec);
    if (!id) {
        return nullptr;
    }

    if (!RemoveGuarded(old.id)) {
        spdlog::warn("Old agent container {} could not be removed", old.name);
    }

    spdlog::info("Agent container replaced: {} -> {}", old.id.substr(0, 12), id->substr(0, 12));
    old.id = *id;
    old.name = spec.name;
    old.spec = spec;
    old.health = HealthState::HEALTHY;
    old.created_at = std::chrono::system_clock::now();
    return &old;
}

bool Topology::RemoveGuarded(const std::string& container_id) {
    auto control_plane = control_plane_;
    auto removed = executor_.Guard("remove container " + container_id,
                                   config_.timeouts.docker_exec_timeout,
                                   [control_plane, container_id]() {
                                       return control_plane->RemoveContainer(container_id);
                                   });
    return removed && *removed.value;
}

// ============================================================================
// SINGLE CONTAINER
// ============================================================================

SingleContainerTopology::SingleContainerTopology(std::shared_ptr<runtime::ControlPlane> control_plane,
                                                 executor::GuardedExecutor& executor,
                                                 const EnvironmentConfig& config,
                                                 runtime::ContainerSpec agent_spec)
    : Topology(std::move(control_plane), executor, config)
    , agent_spec_(std::move(agent_spec)) {}

bool SingleContainerTopology::Launch() {
    spdlog::info("Launching single-container topology ({})", agent_spec_.image);
    return LaunchAgent(agent_spec_) != nullptr;
}

void SingleContainerTopology::Teardown() {
    RemoveStrays();
    for (const auto& container : containers_) {
        if (!RemoveGuarded(container.id)) {
            spdlog::warn("Container {} may still be running", container.name);
        }
    }
    containers_.clear();
}

Container* SingleContainerTopology::Recreate(const std::string& container_id) {
    Container* old = Find(container_id);
    if (old == nullptr) {
        spdlog::error("Cannot recreate unknown container {}", container_id);
        return nullptr;
    }
    return ReplaceAgent(*old, agent_spec_);
}

// ============================================================================
// COMPOSE
// ============================================================================

ComposeTopology::ComposeTopology(std::shared_ptr<runtime::ControlPlane> control_plane,
                                 executor::GuardedExecutor& executor,
                                 const EnvironmentConfig& config,
                                 runtime::ContainerSpec agent_spec,
                                 std::filesystem::path manifest,
                                 std::string project)
    : Topology(std::move(control_plane), executor, config)
    , agent_spec_(std::move(agent_spec))
    , manifest_(std::move(manifest))
    , project_(std::move(project)) {}

bool ComposeTopology::Launch() {
    spdlog::info("Launching compose topology {} ({})", project_, manifest_.string());

    auto control_plane = control_plane_;
    auto manifest = manifest_;
    auto project = project_;

    // A timed-out up keeps starting services; down is safe either way
    project_up_ = true;
    auto services = executor_.Guard("compose up " + project_,
                                    config_.timeouts.compose_startup_timeout,
                                    [control_plane, manifest, project]() {
                                        return control_plane->ComposeUp(manifest, project);
                                    });
    if (!services) {
        spdlog::error("Compose project {} failed to start", project_);
        return false;
    }

    std::vector<std::string> service_networks;
    for (const auto& attachment : agent_spec_.networks) {
        service_networks.push_back(attachment.network);
    }

    for (const auto& service : *services.value) {
        Container container;
        container.id = service.id;
        container.name = service.name;
        container.service = service.service;
        container.role = ContainerRole::CHALLENGE_SERVICE;
        container.networks = service_networks;
        container.created_at = std::chrono::system_clock::now();
        containers_.push_back(container);
        spdlog::info("  ✓ Service {} -> {}", service.service, service.name);
    }

    // Agent is listed first
    Container* agent = LaunchAgent(agent_spec_);
    if (agent == nullptr) {
        return false;
    }
    std::rotate(containers_.begin(), containers_.end() - 1, containers_.end());
    return true;
}

void ComposeTopology::Teardown() {
    RemoveStrays();
    for (const auto& container : containers_) {
        if (container.role == ContainerRole::AGENT && !RemoveGuarded(container.id)) {
            spdlog::warn("Agent container {} may still be running", container.name);
        }
    }

    if (project_up_) {
        auto control_plane = control_plane_;
        auto manifest = manifest_;
        auto project = project_;
        auto down = executor_.Guard("compose down " + project_,
                                    config_.timeouts.compose_teardown_timeout,
                                    [control_plane, manifest, project]() {
                                        return control_plane->ComposeDown(manifest, project);
                                    });
        if (!down || !*down.value) {
            spdlog::warn("Compose project {} may not have been fully removed", project_);
        }
        project_up_ = false;
    }

    containers_.clear();
}

Container* ComposeTopology::Recreate(const std::string& container_id) {
    Container* old = Find(container_id);
    if (old == nullptr) {
        spdlog::error("Cannot recreate unknown container {}", container_id);
        return nullptr;
    }

    if (old->role == ContainerRole::AGENT) {
        return ReplaceAgent(*old, agent_spec_);
    }

    auto control_plane = control_plane_;
    auto manifest = manifest_;
    auto project = project_;
    auto service = old->service;

    auto recreated = executor_.Guard("recreate service " + service,
                                     config_.timeouts.compose_startup_timeout,
                                     [control_plane, manifest, project, service]() {
                                         return control_plane->RecreateService(manifest, project, service);
                                     });
    if (!recreated) {
        spdlog::error("Failed to recreate service {}", service);
        return nullptr;
    }

    old->id = recreated.value->id;
    old->name = recreated.value->name;
    old->incarnation += 1;
    old->health = HealthState::HEALTHY;
    old->created_at = std::chrono::system_clock::now();
    spdlog::info("Service {} replaced: {} -> {}", service, container_id.substr(0, 12),
                 old->id.substr(0, 12));
    return old;
}

} // namespace core
} // namespace ctfbox
