/**
 * @file main.cpp
 * @brief ctfbox - Command-line interface
 *
 * Operator entry point: loads the configuration, brings up one challenge
 * environment (single container or compose topology), runs the given
 * commands in it through the guarded executor, prints a session report and
 * tears everything down. SIGINT and SIGTERM cancel the session, interrupting
 * the in-flight command before teardown.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "ctfbox/core/config.hpp"
#include "ctfbox/core/environment_session.hpp"
#include "ctfbox/executor/guarded_executor.hpp"
#include "ctfbox/network/port_pool.hpp"
#include "ctfbox/network/topology_allocator.hpp"
#include "ctfbox/runtime/docker_cli.hpp"

#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

/*******************************************************************************
 * Shutdown Signals
 ******************************************************************************/

/**
 * @class ShutdownSignals
 * @brief Delivers SIGINT/SIGTERM to a callback on a watcher thread
 *
 * The signals are blocked in the calling thread before any other thread is
 * started, so every worker inherits the mask and only the signalfd sees them.
 */
class ShutdownSignals {
public:
    ShutdownSignals() {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGINT);
        sigaddset(&mask, SIGTERM);
        if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
            throw std::runtime_error("Cannot block shutdown signals");
        }
        signal_fd_ = signalfd(-1, &mask, SFD_CLOEXEC);
        if (signal_fd_ < 0 || pipe(stop_pipe_) != 0) {
            throw std::runtime_error(std::string("Cannot watch shutdown signals: ") + std::strerror(errno));
        }
    }

    ~ShutdownSignals() {
        Stop();
        close(signal_fd_);
        close(stop_pipe_[0]);
        close(stop_pipe_[1]);
    }

    ShutdownSignals(const ShutdownSignals&) = delete;
    ShutdownSignals& operator=(const ShutdownSignals&) = delete;

    /// Start watching; @p on_signal runs on the watcher thread, at most once
    void Watch(std::function<void()> on_signal) {
        watcher_ = std::thread([this, on_signal = std::move(on_signal)]() {
            pollfd fds[2] = {{signal_fd_, POLLIN, 0}, {stop_pipe_[0], POLLIN, 0}};
            while (true) {
                if (poll(fds, 2, -1) < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    spdlog::error("[ERROR] Signal watcher failed: {}", std::strerror(errno));
                    return;
                }
                if (fds[1].revents & POLLIN) {
                    return;
                }
                if (fds[0].revents & POLLIN) {
                    signalfd_siginfo info;
                    if (read(signal_fd_, &info, sizeof(info)) != sizeof(info)) {
                        continue;
                    }
                    spdlog::warn("[SIGNAL] Received {}, cancelling session", strsignal(static_cast<int>(info.ssi_signo)));
                    received_ = true;
                    on_signal();
                    return;
                }
            }
        });
    }

    /// Join the watcher (idempotent)
    void Stop() {
        if (watcher_.joinable()) {
            char byte = 0;
            if (write(stop_pipe_[1], &byte, 1) != 1) {
                spdlog::warn("[WARN] Cannot wake the signal watcher");
            }
            watcher_.join();
        }
    }

    bool Received() const { return received_; }

private:
    int signal_fd_{-1};
    int stop_pipe_[2]{-1, -1};
    std::thread watcher_;
    std::atomic<bool> received_{false};
};

/// Next line from stdin; false at end of input or once @p stop is set
bool ReadCommandLine(std::string& buffer, std::string& line, const ShutdownSignals& stop) {
    while (true) {
        auto newline = buffer.find('\n');
        if (newline != std::string::npos) {
            line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            return true;
        }
        if (stop.Received()) {
            return false;
        }

        pollfd fd{STDIN_FILENO, POLLIN, 0};
        int ready = poll(&fd, 1, 200);
        if (ready < 0 && errno != EINTR) {
            return false;
        }
        if (ready <= 0) {
            continue;
        }

        char chunk[4096];
        auto count = read(STDIN_FILENO, chunk, sizeof(chunk));
        if (count <= 0) {
            if (buffer.empty()) {
                return false;
            }
            line.swap(buffer);
            buffer.clear();
            return true;
        }
        buffer.append(chunk, static_cast<std::size_t>(count));
    }
}

/// Remove networks and manifests left behind by sessions that died
int RunCleanup(const ctfbox::core::EnvironmentConfig& config,
               std::shared_ptr<ctfbox::runtime::ControlPlane> docker,
               const std::vector<std::filesystem::path>& manifest_dirs) {
    ctfbox::network::PortPool pool(config.port_pool);
    ctfbox::executor::GuardedExecutor executor(docker, config.timeouts);
    ctfbox::network::TopologyAllocator allocator(pool, docker, executor, config);

    auto report = allocator.SweepOrphans(manifest_dirs);
    std::cout << report.ToJSON().dump(2) << std::endl;
    return report.errors == 0 ? 0 : 1;
}

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/


void PrintBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║    ██████╗████████╗███████╗██████╗  ██████╗ ██╗  ██╗          ║
║   ██╔════╝╚══██╔══╝██╔════╝██╔══██╗██╔═══██╗╚██╗██╔╝          ║
║   ██║        ██║   █████╗  ██████╔╝██║   ██║ ╚███╔╝           ║
║   ██║        ██║   ██╔══╝  ██╔══██╗██║   ██║ ██╔██╗           ║
║   ╚██████╗   ██║   ██║     ██████╔╝╚██████╔╝██╔╝ ██╗          ║
║    ╚═════╝   ╚═╝   ╚═╝     ╚═════╝  ╚═════╝ ╚═╝  ╚═╝          ║
║                                                               ║
║          Sandboxed Execution Environments for CTF Agents      ║
║                              v1.0.0                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}


void PrintResult(const std::string& command, const ctfbox::core::ExecutionResult& result) {
    std::cout << "\n$ " << command << "\n";
    if (!result.Output().empty()) {
        std::cout << result.Output();
        if (result.Output().back() != '\n') {
            std::cout << "\n";
        }
    }
    std::cout << "[" << ctfbox::core::Describe(result) << ", " << result.elapsed.count() << " ms]\n";
}


void PrintSessionSummary(const ctfbox::core::SessionReport& report) {
    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                      SESSION SUMMARY                          ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";
    std::cout << "  Session:     " << report.session << "\n";
    std::cout << "  State:       " << ctfbox::core::ToString(report.state) << "\n";

    if (report.failed_phase) {
        std::cout << "  Failed in:   " << ctfbox::core::ToString(*report.failed_phase) << "\n";
    }
    if (report.error_kind) {
        std::cout << "  Error:       [" << ctfbox::core::ToString(*report.error_kind) << "] "
                  << report.error_message << "\n";
    }

    std::cout << "  Recoveries:  " << report.recoveries << "\n";

    for (const auto& [name, outcome] : report.restriction) {
        std::cout << "  Firewall:    " << name << " " << (outcome.success ? "[OK]" : "[FAILED] " + outcome.cause)
                  << "\n";
    }

    if (report.allocation) {
        for (const auto& mapping : report.allocation->ports) {
            std::cout << "  Port:        " << mapping.service << " " << mapping.internal_port << "/"
                      << mapping.protocol << " -> " << mapping.host_port << "\n";
        }
        std::cout << "  Network:     " << report.allocation->network.name << "\n";
    }
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    PrintBanner();

    // Configure CLI parser
    CLI::App app{"ctfbox sandboxed execution environment"};
    app.footer("\nEnvironment variables CTFBOX_* supply defaults; flags override them.");

    std::string image;
    std::string compose_file;
    std::string primary_service;
    std::vector<std::uint16_t> challenge_ports;
    std::vector<std::string> setup_commands;
    std::vector<std::string> commands;
    std::vector<std::string> copies;
    std::string report_path;
    std::vector<std::string> manifest_dirs;
    bool read_stdin = false;
    bool cleanup = false;
    bool verbose = false;

    app.add_option("-i,--image", image, "Agent container image");
    app.add_option("-f,--compose", compose_file, "Compose manifest of the challenge")
        ->check(CLI::ExistingFile);
    app.add_option("--primary-service", primary_service, "Service receiving the challenge ports");
    app.add_option("-p,--port", challenge_ports, "Internal challenge port (repeatable)");
    app.add_option("-s,--setup", setup_commands, "Setup command run before restriction (repeatable)");
    app.add_option("-c,--command", commands, "Command to run in the agent container (repeatable)");
    app.add_option("--copy", copies, "HOST:CONTAINER path copied into the agent before setup (repeatable)");
    app.add_flag("--stdin", read_stdin, "Read further commands from stdin, one per line");
    app.add_option("-r,--report", report_path, "Write the JSON session report to this file");
    app.add_flag("--cleanup", cleanup, "Remove networks and manifests left by dead sessions, then exit");
    app.add_option("--manifest-dir", manifest_dirs, "Extra directory scanned by --cleanup (repeatable)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    int action_timeout = 0;
    int max_retries = 0;
    bool dynamic_ports = false;
    bool no_restriction = false;
    bool no_health_monitor = false;

    app.add_option("--timeout", action_timeout, "Per-command timeout in seconds");
    app.add_option("--max-retries", max_retries, "Probe, escalation and recovery bound");
    app.add_flag("--dynamic-ports", dynamic_ports, "Allocate host ports and a private network");
    app.add_flag("--no-restriction", no_restriction, "Keep full network egress (UNSAFE)");
    app.add_flag("--no-health-monitor", no_health_monitor, "Disable periodic health probes");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        auto config = ctfbox::core::LoadConfigFromEnvironment();

        if (action_timeout > 0) {
            config.timeouts.action_timeout = std::chrono::seconds(action_timeout);
        }
        if (max_retries > 0) {
            config.timeouts.max_retries = max_retries;
        }
        if (dynamic_ports) {
            config.enable_dynamic_ports = true;
        }
        if (no_restriction) {
            config.enable_network_restriction = false;
        }
        if (no_health_monitor) {
            config.enable_health_monitor = false;
        }
        ctfbox::core::ValidateConfig(config);

        // Before any thread exists, so every thread inherits the blocked mask
        ShutdownSignals signals;

        auto docker = std::make_shared<ctfbox::runtime::DockerCli>(config.docker_binary);
        if (!docker->IsDaemonAvailable()) {
            spdlog::error("[ERROR] Docker daemon is not reachable via '{}'", config.docker_binary);
            return 1;
        }

        if (cleanup) {
            std::vector<std::filesystem::path> dirs{std::filesystem::temp_directory_path()};
            if (!compose_file.empty()) {
                dirs.push_back(std::filesystem::absolute(compose_file).parent_path());
            }
            for (const auto& dir : manifest_dirs) {
                dirs.emplace_back(dir);
            }
            return RunCleanup(config, docker, dirs);
        }

        ctfbox::core::ChallengeSpec challenge;
        challenge.image = image;
        challenge.primary_service = primary_service;
        challenge.internal_ports = challenge_ports;
        if (!compose_file.empty()) {
            challenge.compose_manifest = std::filesystem::absolute(compose_file);
        }
        for (const auto& copy : copies) {
            auto colon = copy.rfind(':');
            if (colon == std::string::npos || colon == 0 || colon + 1 == copy.size()) {
                spdlog::error("[ERROR] --copy expects HOST:CONTAINER, got '{}'", copy);
                return 1;
            }
            challenge.files.push_back({std::filesystem::absolute(copy.substr(0, colon)), copy.substr(colon + 1)});
        }

        std::shared_ptr<ctfbox::core::Provisioner> provisioner;
        if (!setup_commands.empty()) {
            provisioner = std::make_shared<ctfbox::core::CommandProvisioner>(setup_commands);
        }

        spdlog::info("[INIT] Bringing up challenge environment...");
        ctfbox::core::EnvironmentSession session(config, challenge, docker, provisioner);
        signals.Watch([&session]() { session.Cancel(); });

        // The watcher must not outlive the session on any exit path
        struct WatchGuard {
            ShutdownSignals& signals;
            ~WatchGuard() { signals.Stop(); }
        } watch_guard{signals};

        int exit_status = 0;

        if (session.Start()) {
            spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");

            auto run = [&session, &exit_status](const std::string& command) {
                auto result = session.Execute(command);
                PrintResult(command, result);
                if (!result.Succeeded()) {
                    exit_status = 2;
                }
            };

            for (const auto& command : commands) {
                if (signals.Received()) {
                    break;
                }
                run(command);
            }

            if (read_stdin) {
                std::string buffer;
                std::string line;
                while (ReadCommandLine(buffer, line, signals)) {
                    if (line.empty()) {
                        continue;
                    }
                    run(line);
                    auto state = session.GetState();
                    if (state == ctfbox::core::SessionState::FAILED || state == ctfbox::core::SessionState::CLOSED) {
                        break;
                    }
                }
            }

            spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        } else {
            exit_status = 1;
        }

        // Joined before teardown so a late signal cannot race it
        signals.Stop();
        if (signals.Received()) {
            exit_status = 130;
        }

        auto report = session.GetReport();
        session.Teardown();
        report.state = session.GetState();

        PrintSessionSummary(report);

        if (!report_path.empty()) {
            std::ofstream out(report_path);
            if (out) {
                out << report.ToJSON().dump(2) << "\n";
                spdlog::info("[REPORT] Session report saved: {}", report_path);
            } else {
                spdlog::warn("[WARN] Failed to write session report to {}", report_path);
            }
        }

        return exit_status;

    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const ctfbox::core::ConfigError& e) {
        spdlog::error("[ERROR] Invalid configuration ({}): {}", e.Key(), e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
