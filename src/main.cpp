/**
 * @file main.cpp
 * @brief eggshell - Command-line interface
 *
 * Runs one shell command in a disposable sandboxed container built from a
 * local directory and Dockerfile. Settings come from an optional JSON file
 * and are overridden by command-line options.
 *
 * **Exit Status**:
 * ```
 * N     the command exited with N
 * 124   the command hit its timeout
 * 130   interrupted (SIGINT/SIGTERM) or --deadline reached
 * 1     configuration, build or engine error
 * ```
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "eggshell/core/config_loader.hpp"
#include "eggshell/core/errors.hpp"
#include "eggshell/core/executor.hpp"
#include "eggshell/engine/docker_cli_engine.hpp"
#include "eggshell/utils/output_sink.hpp"

#include <csignal>
#include <iostream>
#include <memory>

namespace {

constexpr int kExitTimeout = 124;
constexpr int kExitCancelled = 130;
constexpr int kExitFailure = 1;

eggshell::utils::CancellationToken* g_interrupt_token = nullptr;

void HandleInterrupt(int) {
    if (g_interrupt_token != nullptr) {
        g_interrupt_token->Cancel();
    }
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"eggshell - run a command in a disposable sandboxed container"};

    std::string config_path;
    std::string dockerfile;
    std::string context_dir;
    std::string command;
    long long timeout_seconds = 300;
    std::string network;
    std::string seccomp;
    std::string runtime;
    std::string docker_binary;
    bool keep_container = false;
    double deadline_seconds = 0;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON run configuration")
        ->check(CLI::ExistingFile);
    app.add_option("-f,--dockerfile", dockerfile, "Dockerfile to build the image from")
        ->check(CLI::ExistingFile);
    app.add_option("-C,--context", context_dir, "Directory whose files form the build context")
        ->check(CLI::ExistingDirectory);
    auto* cmd_option = app.add_option("--cmd", command, "Shell command to run in the container");
    auto* timeout_option = app.add_option("-t,--timeout", timeout_seconds,
                                          "Timeout in seconds (negative: none)");
    auto* network_option = app.add_option("--network", network, "Network mode")
        ->check(CLI::IsMember({"bridge", "none"}, CLI::ignore_case));
    auto* seccomp_option = app.add_option("--seccomp", seccomp,
                                          "Seccomp profile file, or \"unconfined\"");
    auto* runtime_option = app.add_option("--runtime", runtime,
                                          "OCI runtime (empty: engine default)");
    auto* docker_option = app.add_option("--docker", docker_binary, "Docker client executable");
    auto* keep_option = app.add_flag("--keep-container", keep_container,
                                     "Do not remove the container after the run");
    app.add_option("--deadline", deadline_seconds,
                   "Cancel the whole run after this many seconds")
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Container output owns stdout; diagnostics go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("eggshell"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto token = deadline_seconds > 0
        ? eggshell::utils::CancellationToken::WithTimeout(
              std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                  std::chrono::duration<double>(deadline_seconds)))
        : eggshell::utils::CancellationToken();
    g_interrupt_token = &token;
    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);

    try {
        eggshell::core::RunSettings settings;
        if (!config_path.empty()) {
            settings = eggshell::core::ConfigLoader::LoadFile(config_path);
            if (!verbose) {
                spdlog::set_level(spdlog::level::from_str(settings.log_level));
            }
        }

        // Command-line options override the file
        if (!dockerfile.empty()) {
            settings.dockerfile = dockerfile;
        }
        if (!context_dir.empty()) {
            settings.context_dir = context_dir;
        }
        if (cmd_option->count() > 0) {
            settings.command = command;
        }
        if (timeout_option->count() > 0) {
            settings.timeout = timeout_seconds < 0 ? eggshell::core::kNoTimeout
                                                   : std::chrono::seconds(timeout_seconds);
        }
        if (network_option->count() > 0) {
            settings.network_mode = *eggshell::core::ParseNetworkMode(network);
        }
        if (seccomp_option->count() > 0) {
            settings.seccomp_profile = seccomp;
        }
        if (runtime_option->count() > 0) {
            settings.runtime = runtime;
        }
        if (docker_option->count() > 0) {
            settings.docker_binary = docker_binary;
        }
        if (keep_option->count() > 0) {
            settings.keep_container = keep_container;
        }

        auto config = eggshell::core::ConfigLoader::ToExecutorConfig(settings);
        config.stdout_sink = std::make_shared<eggshell::utils::OstreamSink>(std::cout);
        config.stderr_sink = std::make_shared<eggshell::utils::OstreamSink>(std::cerr);

        auto engine = std::make_shared<eggshell::engine::DockerCliEngine>(settings.docker_binary);
        eggshell::core::Executor executor(engine, std::move(config));

        auto result = executor.Execute(token);

        spdlog::info("Exit code: {}", result.exit_code);
        spdlog::info("Duration: {} ms", result.duration.count());
        return result.exit_code;

    } catch (const eggshell::core::TimeoutError& e) {
        spdlog::error("{}", e.what());
        return kExitTimeout;
    } catch (const eggshell::core::CancelledError& e) {
        spdlog::error("Cancelled: {}", e.what());
        return kExitCancelled;
    } catch (const eggshell::core::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kExitFailure;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return kExitFailure;
    }
}
