/**
 * @file fake_control_plane.hpp
 * @brief In-memory ControlPlane for deterministic unit tests
 *
 * - containers, networks and compose projects are bookkeeping only
 * - every exec is logged; `iptables` commands run against a per-container
 *   chain simulator that can also evaluate where a new outgoing connection
 *   ends up, `pwd` answers "/", `sleep N` blocks for N seconds
 * - a container can be made to hang (exec blocks until released) and the
 *   runtime can be made unreachable (exec throws ControlPlaneError)
 * - a custom exec handler can take over any command
 *
 * @date 2025
 */

#pragma once

#include "ctfbox/runtime/control_plane.hpp"
#include "ctfbox/utils/string_utils.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace ctfbox {
namespace test {

using utils::StringUtils;

/**
 * @class FakeIptables
 * @brief Filter-table chains of one container
 *
 * Rules are stored the way `iptables -S` lists them ("-A CHAIN ..."),
 * with `-d` destinations printed as network/prefix.
 */
class FakeIptables {
public:
    FakeIptables() { chains_["OUTPUT"]; }

    /// Run one iptables command line
    runtime::RawExecResult Run(const std::string& command) {
        auto tokens = StringUtils::SplitWhitespace(command);
        tokens.erase(std::remove(tokens.begin(), tokens.end(), "-w"), tokens.end());
        if (tokens.size() < 3 || tokens[0] != "iptables") {
            return Error("iptables: bad command");
        }

        const std::string op = tokens[1];
        const std::string chain = tokens[2];
        std::vector<std::string> rest(tokens.begin() + 3, tokens.end());

        if (op == "-N") {
            if (Exists(chain)) {
                return Error("iptables: Chain already exists.");
            }
            chains_[chain];
            return Ok();
        }
        if (op == "-S") {
            if (!Exists(chain)) {
                return Error("iptables: No chain/target/match by that name.");
            }
            std::string listing = chain == "OUTPUT" ? "-P OUTPUT ACCEPT\n" : "-N " + chain + "\n";
            for (const auto& rule : chains_[chain]) {
                listing += rule + "\n";
            }
            return Ok(listing);
        }
        if (op == "-A" || op == "-I") {
            if (!Exists(chain)) {
                return Error("iptables: No chain/target/match by that name.");
            }
            if (op == "-I" && !rest.empty() && std::all_of(rest[0].begin(), rest[0].end(), ::isdigit)) {
                rest.erase(rest.begin());
            }
            if (!JumpTargetValid(rest)) {
                return Error("iptables: No chain/target/match by that name.");
            }
            if (!CanonicalizeDestination(rest)) {
                return Error("iptables v1.8.7: host/network not found");
            }
            std::string rule = "-A " + chain + " " + StringUtils::Join(rest, " ");
            auto& rules = chains_[chain];
            if (op == "-A") {
                rules.push_back(rule);
            } else {
                rules.insert(rules.begin(), rule);
            }
            return Ok();
        }
        if (op == "-D") {
            if (!Exists(chain)) {
                return Error("iptables: No chain/target/match by that name.");
            }
            CanonicalizeDestination(rest);
            std::string rule = "-A " + chain + " " + StringUtils::Join(rest, " ");
            auto& rules = chains_[chain];
            auto it = std::find(rules.begin(), rules.end(), rule);
            if (it == rules.end()) {
                return Error("iptables: Bad rule (does a matching rule exist in that chain?).");
            }
            rules.erase(it);
            return Ok();
        }
        if (op == "-F") {
            if (!Exists(chain)) {
                return Error("iptables: No chain/target/match by that name.");
            }
            chains_[chain].clear();
            return Ok();
        }
        if (op == "-X") {
            if (!Exists(chain)) {
                return Error("iptables: No chain/target/match by that name.");
            }
            if (IsReferenced(chain)) {
                return Error("iptables: Too many links.");
            }
            if (!chains_[chain].empty()) {
                return Error("iptables: Directory not empty.");
            }
            chains_.erase(chain);
            return Ok();
        }
        if (op == "-E") {
            if (rest.empty() || !Exists(chain) || Exists(rest[0])) {
                return Error("iptables: File exists.");
            }
            Rename(chain, rest[0]);
            return Ok();
        }

        return Error("iptables: unknown option " + op);
    }

    bool Exists(const std::string& chain) const { return chains_.count(chain) > 0; }

    std::vector<std::string> Rules(const std::string& chain) const {
        auto it = chains_.find(chain);
        return it == chains_.end() ? std::vector<std::string>{} : it->second;
    }

    /// Overwrite a chain (for pre-existing state)
    void SetRules(const std::string& chain, std::vector<std::string> rules) {
        chains_[chain] = std::move(rules);
    }

    std::map<std::string, std::vector<std::string>> Snapshot() const { return chains_; }

    /**
     * @brief Verdict for a new outgoing connection to @p destination
     *
     * Walks OUTPUT and the chains it jumps to. Conntrack matches never hit
     * (the connection is new). Falls through to the ACCEPT policy.
     */
    std::string Evaluate(const std::string& destination, const std::string& protocol = "tcp") const {
        std::uint32_t address = 0;
        int prefix = 0;
        if (!ParseCidr(destination, address, prefix)) {
            return "INVALID";
        }
        auto verdict = Traverse("OUTPUT", address, protocol, 0);
        return verdict.empty() ? "ACCEPT" : verdict;
    }

private:
    /// Address and prefix of "a.b.c.d[/n]"; a bare address is /32
    static bool ParseCidr(const std::string& text, std::uint32_t& network, int& prefix) {
        auto slash = text.find('/');
        prefix = 32;
        if (slash != std::string::npos) {
            auto bits = text.substr(slash + 1);
            if (bits.empty() || !std::all_of(bits.begin(), bits.end(), ::isdigit) || std::stoi(bits) > 32) {
                return false;
            }
            prefix = std::stoi(bits);
        }
        in_addr parsed{};
        if (inet_pton(AF_INET, text.substr(0, slash).c_str(), &parsed) != 1) {
            return false;
        }
        network = ntohl(parsed.s_addr) & Mask(prefix);
        return true;
    }

    static std::uint32_t Mask(int prefix) {
        return prefix == 0 ? 0 : 0xFFFFFFFFu << (32 - prefix);
    }

    /// Rewrite the `-d` argument as iptables lists it back; false if unparsable
    static bool CanonicalizeDestination(std::vector<std::string>& spec) {
        for (std::size_t i = 0; i + 1 < spec.size(); ++i) {
            if (spec[i] == "-d") {
                std::uint32_t network = 0;
                int prefix = 0;
                if (!ParseCidr(spec[i + 1], network, prefix)) {
                    return false;
                }
                in_addr out{};
                out.s_addr = htonl(network);
                char text[INET_ADDRSTRLEN];
                inet_ntop(AF_INET, &out, text, sizeof(text));
                spec[i + 1] = std::string(text) + "/" + std::to_string(prefix);
            }
        }
        return true;
    }

    /// Terminal target reached from @p chain, or "" when the chain returns
    std::string Traverse(const std::string& chain, std::uint32_t address, const std::string& protocol,
                         int depth) const {
        auto it = chains_.find(chain);
        if (it == chains_.end() || depth > 8) {
            return "";
        }

        for (const auto& rule : it->second) {
            auto tokens = StringUtils::SplitWhitespace(rule);
            std::string target;
            bool matches = true;
            for (std::size_t i = 2; i + 1 < tokens.size(); ++i) {
                if (tokens[i] == "-d") {
                    std::uint32_t network = 0;
                    int prefix = 0;
                    matches = matches && ParseCidr(tokens[i + 1], network, prefix) &&
                              (address & Mask(prefix)) == network;
                } else if (tokens[i] == "-p") {
                    matches = matches && tokens[i + 1] == protocol;
                } else if (tokens[i] == "-m" && tokens[i + 1] == "conntrack") {
                    matches = false;
                } else if (tokens[i] == "-j") {
                    target = tokens[i + 1];
                }
            }
            if (!matches || target.empty()) {
                continue;
            }
            if (target == "RETURN") {
                return "";
            }
            if (target == "ACCEPT" || target == "REJECT" || target == "DROP") {
                return target;
            }
            auto verdict = Traverse(target, address, protocol, depth + 1);
            if (!verdict.empty()) {
                return verdict;
            }
        }
        return "";
    }

    static runtime::RawExecResult Ok(const std::string& output = "") {
        runtime::RawExecResult result;
        result.exit_code = 0;
        result.output = output;
        return result;
    }

    static runtime::RawExecResult Error(const std::string& message) {
        runtime::RawExecResult result;
        result.exit_code = 1;
        result.output = message + "\n";
        return result;
    }

    bool JumpTargetValid(const std::vector<std::string>& spec) const {
        static const std::set<std::string> builtin = {"ACCEPT", "REJECT", "DROP", "RETURN"};
        for (std::size_t i = 0; i + 1 < spec.size(); ++i) {
            if (spec[i] == "-j") {
                return builtin.count(spec[i + 1]) > 0 || Exists(spec[i + 1]);
            }
        }
        return true;
    }

    bool IsReferenced(const std::string& chain) const {
        const std::string jump = " -j " + chain;
        for (const auto& [name, rules] : chains_) {
            for (const auto& rule : rules) {
                if (StringUtils::EndsWith(rule, jump) || StringUtils::Contains(rule, jump + " ")) {
                    return true;
                }
            }
        }
        return false;
    }

    void Rename(const std::string& from, const std::string& to) {
        auto rules = chains_[from];
        chains_.erase(from);
        for (auto& rule : rules) {
            rule = "-A " + to + rule.substr(3 + from.size());
        }
        chains_[to] = rules;

        const std::string old_jump = " -j " + from;
        for (auto& [name, chain_rules] : chains_) {
            for (auto& rule : chain_rules) {
                if (StringUtils::EndsWith(rule, old_jump)) {
                    rule = rule.substr(0, rule.size() - old_jump.size()) + " -j " + to;
                }
            }
        }
    }

    std::map<std::string, std::vector<std::string>> chains_;
};

/**
 * @struct ExecCall
 * @brief One recorded exec
 */
struct ExecCall {
    std::string container_id;
    std::string command;
    runtime::ExecOptions options;
};

/**
 * @class FakeControlPlane
 * @brief Scriptable ControlPlane
 */
class FakeControlPlane : public runtime::ControlPlane {
public:
    /// Return nullopt to fall through to the default behavior
    using ExecHandler = std::function<std::optional<runtime::RawExecResult>(
        const std::string& container_id, const std::string& command,
        const runtime::ExecOptions& options, const runtime::OutputCallback& on_output)>;

    ~FakeControlPlane() override { ReleaseAll(); }

    // ========================================================================
    // Scripting
    // ========================================================================

    void SetExecHandler(ExecHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    /// Every exec on @p container_id blocks until SetHanging(id, false) or ReleaseAll()
    void SetHanging(const std::string& container_id, bool hanging) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (hanging) {
            hanging_.insert(container_id);
        } else {
            hanging_.erase(container_id);
        }
        cv_.notify_all();
    }

    /// Exec throws ControlPlaneError while set
    void SetUnreachable(bool unreachable) {
        std::lock_guard<std::mutex> lock(mutex_);
        unreachable_ = unreachable;
    }

    /// The next @p count CreateContainer calls throw
    void FailNextCreates(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        create_failures_ = count;
    }

    /// CreateContainer and ComposeUp sleep this long before doing anything
    void SetLaunchDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        launch_delay_ = delay;
    }

    /// Services returned by ComposeUp
    void SetComposeServices(std::vector<std::string> services) {
        std::lock_guard<std::mutex> lock(mutex_);
        compose_services_ = std::move(services);
    }

    /// RemoveNetwork reports ACTIVE_ENDPOINTS while the network has attachments
    void AttachToNetwork(const std::string& network, const std::string& container_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        attachments_[network].insert(container_id);
    }

    /// Wake every blocked exec
    void ReleaseAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        hanging_.clear();
        cv_.notify_all();
    }

    // ========================================================================
    // Inspection
    // ========================================================================

    std::vector<ExecCall> ExecCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return exec_calls_;
    }

    std::vector<std::string> ExecCommands(const std::string& container_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> commands;
        for (const auto& call : exec_calls_) {
            if (call.container_id == container_id) {
                commands.push_back(call.command);
            }
        }
        return commands;
    }

    /// Control-plane operations other than exec ("create <name>", "remove <id>", ...)
    std::vector<std::string> Operations() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return operations_;
    }

    FakeIptables Iptables(const std::string& container_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = iptables_.find(container_id);
        return it == iptables_.end() ? FakeIptables() : it->second;
    }

    void SetIptables(const std::string& container_id, FakeIptables tables) {
        std::lock_guard<std::mutex> lock(mutex_);
        iptables_[container_id] = std::move(tables);
    }

    bool HasContainer(const std::string& container_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return containers_.count(container_id) > 0;
    }

    std::size_t ContainerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return containers_.size();
    }

    std::optional<runtime::ContainerSpec> SpecOf(const std::string& container_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = containers_.find(container_id);
        if (it == containers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool HasNetwork(const std::string& network) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return networks_.count(network) > 0;
    }

    /// Contents of the manifest passed to the last ComposeUp
    std::string LastComposeManifest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_manifest_;
    }

    // ========================================================================
    // ControlPlane
    // ========================================================================

    std::string CreateContainer(const runtime::ContainerSpec& spec) override {
        std::this_thread::sleep_for(LaunchDelay());
        std::lock_guard<std::mutex> lock(mutex_);
        operations_.push_back("create " + spec.name);
        if (create_failures_ > 0) {
            create_failures_--;
            throw runtime::ControlPlaneError("Error response from daemon: create failed");
        }
        std::string id = "c" + std::to_string(++next_id_);
        containers_[id] = spec;
        for (const auto& attachment : spec.networks) {
            attachments_[attachment.network].insert(id);
        }
        return id;
    }

    runtime::RawExecResult Exec(const std::string& container_id,
                                const std::string& command,
                                const runtime::ExecOptions& options,
                                const runtime::OutputCallback& on_output) override {
        ExecHandler handler;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            exec_calls_.push_back({container_id, command, options});

            if (unreachable_) {
                throw runtime::ControlPlaneError("Cannot connect to the Docker daemon");
            }

            cv_.wait(lock, [this, &container_id]() {
                return released_ || hanging_.count(container_id) == 0;
            });
            handler = handler_;
        }

        if (handler) {
            if (auto result = handler(container_id, command, options, on_output)) {
                if (!result->output.empty() && on_output) {
                    on_output(result->output);
                }
                return *result;
            }
        }

        return DefaultExec(container_id, command, on_output);
    }

    bool RemoveContainer(const std::string& container_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        operations_.push_back("remove " + container_id);
        containers_.erase(container_id);
        for (auto& [network, ids] : attachments_) {
            ids.erase(container_id);
        }
        return true;
    }

    bool CopyToContainer(const std::string& container_id, const std::filesystem::path& host_path,
                         const std::string& container_path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        operations_.push_back("copy " + host_path.string() + " " + container_id + ":" + container_path);
        return containers_.count(container_id) > 0;
    }

    bool NetworkExists(const std::string& network) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return networks_.count(network) > 0;
    }

    bool CreateNetwork(const std::string& network) override {
        std::lock_guard<std::mutex> lock(mutex_);
        operations_.push_back("network create " + network);
        networks_.insert(network);
        return true;
    }

    runtime::NetworkRemoval RemoveNetwork(const std::string& network) override {
        std::lock_guard<std::mutex> lock(mutex_);
        operations_.push_back("network rm " + network);
        if (networks_.count(network) == 0) {
            return runtime::NetworkRemoval::NOT_FOUND;
        }
        if (!attachments_[network].empty()) {
            return runtime::NetworkRemoval::ACTIVE_ENDPOINTS;
        }
        networks_.erase(network);
        return runtime::NetworkRemoval::REMOVED;
    }

    bool ConnectNetwork(const std::string& network, const std::string& container_id,
                        const std::vector<std::string>& /*aliases*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        attachments_[network].insert(container_id);
        return true;
    }

    bool DisconnectNetwork(const std::string& network, const std::string& container_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        operations_.push_back("network disconnect " + network + " " + container_id);
        attachments_[network].erase(container_id);
        return true;
    }

    std::vector<std::string> ListNetworkContainers(const std::string& network) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& ids = attachments_[network];
        return std::vector<std::string>(ids.begin(), ids.end());
    }

    std::vector<std::string> ListNetworks(const std::string& prefix) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& network : networks_) {
            if (StringUtils::StartsWith(network, prefix)) {
                names.push_back(network);
            }
        }
        return names;
    }

    std::vector<runtime::ServiceContainer> ComposeUp(const std::filesystem::path& manifest,
                                                     const std::string& project) override {
        std::this_thread::sleep_for(LaunchDelay());
        std::lock_guard<std::mutex> lock(mutex_);
        operations_.push_back("compose up " + project);

        std::ifstream in(manifest);
        std::stringstream buffer;
        buffer << in.rdbuf();
        last_manifest_ = buffer.str();

        std::vector<runtime::ServiceContainer> services;
        for (const auto& service : compose_services_) {
            runtime::ServiceContainer container;
            container.service = service;
            container.id = "s" + std::to_string(++next_id_);
            container.name = project + "-" + service + "-1";
            runtime::ContainerSpec spec;
            spec.name = container.name;
            containers_[container.id] = spec;
            services.push_back(container);
        }
        return services;
    }

    bool ComposeDown(const std::filesystem::path& /*manifest*/, const std::string& project) override {
        std::lock_guard<std::mutex> lock(mutex_);
        operations_.push_back("compose down " + project);
        for (auto it = containers_.begin(); it != containers_.end();) {
            if (StringUtils::StartsWith(it->second.name, project + "-")) {
                it = containers_.erase(it);
            } else {
                ++it;
            }
        }
        return true;
    }

    runtime::ServiceContainer RecreateService(const std::filesystem::path& /*manifest*/,
                                              const std::string& project,
                                              const std::string& service) override {
        std::lock_guard<std::mutex> lock(mutex_);
        operations_.push_back("compose recreate " + service);
        runtime::ServiceContainer container;
        container.service = service;
        container.id = "s" + std::to_string(++next_id_);
        container.name = project + "-" + service + "-1";
        runtime::ContainerSpec spec;
        spec.name = container.name;
        containers_[container.id] = spec;
        return container;
    }

private:
    std::chrono::milliseconds LaunchDelay() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return launch_delay_;
    }

    runtime::RawExecResult DefaultExec(const std::string& container_id,
                                       const std::string& command,
                                       const runtime::OutputCallback& on_output) {
        runtime::RawExecResult result;

        if (StringUtils::StartsWith(command, "iptables")) {
            std::lock_guard<std::mutex> lock(mutex_);
            result = iptables_[container_id].Run(command);
        } else if (command == "pwd") {
            result.output = "/\n";
        } else if (StringUtils::StartsWith(command, "sleep ")) {
            double seconds = std::stod(command.substr(6));
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(static_cast<long long>(seconds * 1000)),
                         [this]() { return released_; });
        } else if (StringUtils::StartsWith(command, "echo ")) {
            result.output = command.substr(5) + "\n";
        } else if (StringUtils::StartsWith(command, "exit ")) {
            result.exit_code = std::stoi(command.substr(5));
        }

        if (!result.output.empty() && on_output) {
            on_output(result.output);
        }
        return result;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    ExecHandler handler_;
    std::set<std::string> hanging_;
    bool released_{false};
    bool unreachable_{false};
    int create_failures_{0};
    std::chrono::milliseconds launch_delay_{0};
    int next_id_{0};

    std::vector<ExecCall> exec_calls_;
    std::vector<std::string> operations_;
    std::map<std::string, runtime::ContainerSpec> containers_;
    std::map<std::string, FakeIptables> iptables_;
    std::set<std::string> networks_;
    std::map<std::string, std::set<std::string>> attachments_;
    std::vector<std::string> compose_services_;
    std::string last_manifest_;
};

} // namespace test
} // namespace ctfbox
