/**
 * @file executor.hpp
 * @brief Runs one shell command in a disposable sandboxed container
 *
 * **Run Lifecycle**:
 * ```
 * assemble build context (files + Dockerfile + seccomp profile)
 *     ↓
 * build image <random tag>                    ── image removal scheduled
 *     ↓
 * create container <random name>              ── container removal scheduled
 *     ↓
 * start ──► log pump (stdout/stderr → sinks)
 *     ↓
 * stop (waits up to the stop timeout, then SIGKILL)
 *     ↓
 * wait for "die" event ──► exit code / TimeoutError (137)
 *     ↓
 * drain output, remove container, remove image
 * ```
 *
 * @date 2025
 */

#pragma once

#include "eggshell/core/build_context.hpp"
#include "eggshell/core/file_set.hpp"
#include "eggshell/core/network_mode.hpp"
#include "eggshell/engine/container_engine.hpp"
#include "eggshell/utils/cancellation.hpp"
#include "eggshell/utils/output_sink.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace eggshell {
namespace core {

/// Timeout value meaning "let the command run until it exits"
constexpr std::chrono::seconds kNoTimeout{-1};

/// Sandbox runtime used unless configured otherwise
inline const std::string kDefaultRuntime = "runsc";

/**
 * @struct ExecutorConfig
 * @brief Everything one run needs
 */
struct ExecutorConfig {
    // Image
    std::string dockerfile;                         ///< Dockerfile content
    std::shared_ptr<const FileSet> files;           ///< Build-context files (may be null)

    // Execution Settings
    std::string command;                            ///< Run as `sh -c <command>`
    std::chrono::seconds timeout{300};              ///< Stop timeout (5 min default); kNoTimeout waits forever
    NetworkMode network_mode{NetworkMode::BRIDGE};  ///< Network isolation level

    // Sandbox Settings
    std::string seccomp_profile{kDefaultSeccompProfile};  ///< "", "unconfined" or a JSON profile document
    std::string runtime{kDefaultRuntime};                 ///< OCI runtime; empty uses the engine default

    // Output Configuration
    std::shared_ptr<utils::OutputSink> stdout_sink;  ///< Container stdout (null discards)
    std::shared_ptr<utils::OutputSink> stderr_sink;  ///< Container stderr (null discards)
    bool keep_container{false};                      ///< Leave the exited container behind
};

/**
 * @struct ExecutionResult
 * @brief Outcome of a run that completed on its own
 */
struct ExecutionResult {
    int exit_code{0};                      ///< Command exit code (never 137)
    std::string image_tag;                 ///< Tag of the (already removed) image
    std::string container_id;              ///< Container name
    std::chrono::milliseconds duration{0}; ///< From container create to classification
};

/**
 * @class Executor
 * @brief Single-use orchestrator for one sandboxed command
 *
 * **Thread Safety**: NOT thread-safe. Independent instances may run
 * concurrently; their random identifiers keep them apart.
 *
 * **Usage Example**:
 * @code
 * auto files = std::make_shared<MemoryFileSet>();
 * files->Add("main.sh", "echo hi");
 *
 * auto out = std::make_shared<utils::StringSink>();
 * auto config = ExecutorBuilder()
 *     .WithDockerfile("FROM alpine\nCOPY main.sh /main.sh\n")
 *     .WithFiles(files)
 *     .WithCommand("sh /main.sh")
 *     .WithTimeout(std::chrono::seconds(5))
 *     .WithStdout(out)
 *     .Build();
 *
 * Executor executor(std::make_shared<engine::DockerCliEngine>(), config);
 * auto result = executor.Execute();
 * @endcode
 */
class Executor {
public:
    /**
     * @brief Construct executor
     * @param engine Container engine to drive
     * @param config Run configuration
     *
     * @throws std::invalid_argument if @p engine is null
     */
    Executor(std::shared_ptr<engine::ContainerEngine> engine, ExecutorConfig config);

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    /**
     * @brief Run the command
     * @param token Cancels the run; every engine call and the exit wait observe it
     * @return Exit code and run identifiers when the command finished by itself
     *
     * @throws TimeoutError if the command was killed at its timeout
     * @throws CancelledError if @p token fired
     * @throws IoError if the build context could not be assembled
     * @throws EngineError for build, create, start, log or event failures
     * @throws std::logic_error when called a second time
     */
    ExecutionResult Execute(const utils::CancellationToken& token = utils::CancellationToken());

    const ExecutorConfig& config() const { return config_; }

    /// Tag of the image of the current/last run (empty before Execute)
    const std::string& image_tag() const { return image_tag_; }

    /// Name of the container of the current/last run (empty before Execute)
    const std::string& container_id() const { return container_id_; }

    /// Generated seccomp profile name, if the run used one
    const std::optional<std::string>& profile_name() const { return profile_name_; }

private:
    std::shared_ptr<engine::ContainerEngine> engine_;
    ExecutorConfig config_;

    // Run state
    bool executed_{false};
    std::string image_tag_;
    std::string container_id_;
    std::optional<std::string> profile_name_;

    engine::ContainerSpec MakeContainerSpec(const BuildContext& context) const;
};

/**
 * @class ExecutorBuilder
 * @brief Fluent API for constructing executor configurations
 */
class ExecutorBuilder {
public:
    ExecutorBuilder& WithDockerfile(const std::string& dockerfile) {
        config_.dockerfile = dockerfile;
        return *this;
    }

    ExecutorBuilder& WithFiles(std::shared_ptr<const FileSet> files) {
        config_.files = std::move(files);
        return *this;
    }

    ExecutorBuilder& WithCommand(const std::string& command) {
        config_.command = command;
        return *this;
    }

    /**
     * @brief Set execution timeout
     * @param timeout Whole seconds, or kNoTimeout
     */
    ExecutorBuilder& WithTimeout(std::chrono::seconds timeout) {
        config_.timeout = timeout;
        return *this;
    }

    ExecutorBuilder& WithNetworkMode(NetworkMode mode) {
        config_.network_mode = mode;
        return *this;
    }

    /**
     * @brief Set seccomp profile
     * @param profile JSON document, kUnconfinedSeccompProfile, or
     *        kDefaultSeccompProfile for the engine's default
     */
    ExecutorBuilder& WithSeccompProfile(const std::string& profile) {
        config_.seccomp_profile = profile;
        return *this;
    }

    ExecutorBuilder& WithRuntime(const std::string& runtime) {
        config_.runtime = runtime;
        return *this;
    }

    ExecutorBuilder& WithStdout(std::shared_ptr<utils::OutputSink> sink) {
        config_.stdout_sink = std::move(sink);
        return *this;
    }

    ExecutorBuilder& WithStderr(std::shared_ptr<utils::OutputSink> sink) {
        config_.stderr_sink = std::move(sink);
        return *this;
    }

    /// Send both streams to one destination
    ExecutorBuilder& WithCombinedOutput(std::shared_ptr<utils::OutputSink> sink) {
        config_.stdout_sink = sink;
        config_.stderr_sink = std::move(sink);
        return *this;
    }

    ExecutorBuilder& KeepContainer(bool keep = true) {
        config_.keep_container = keep;
        return *this;
    }

    ExecutorConfig Build() const {
        return config_;
    }

private:
    ExecutorConfig config_;  ///< Configuration being built
};

} // namespace core
} // namespace eggshell
