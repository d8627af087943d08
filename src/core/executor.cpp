/**
 * @file executor.cpp
 * @brief Implementation of the sandboxed command executor
 *
 * **Cleanup Order** (reverse of acquisition, on every exit path):
 * ```
 * 1. Log pump       joined on success or timeout, aborted otherwise
 * 2. Container      stopped if it may still run, removed unless kept
 * 3. Image          removed once the build call has been issued
 * ```
 * Cleanup runs on its own bounded token so that a cancelled run still
 * releases what it created.
 *
 * @date 2025
 */

#include "eggshell/core/executor.hpp"
#include "eggshell/core/errors.hpp"
#include "eggshell/core/exit_classifier.hpp"
#include "eggshell/core/log_demuxer.hpp"
#include "eggshell/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <stdexcept>

namespace eggshell {
namespace core {

namespace {

/// Random bytes in image tags and container names
constexpr std::size_t kIdentifierBytes = 16;

/// Upper bound for each best-effort cleanup call
constexpr std::chrono::seconds kCleanupTimeout{60};

constexpr const char* kDieEvent = "die";

// ============================================================================
// CLEANUP GUARDS
// ============================================================================

class ImageGuard {
public:
    ImageGuard(engine::ContainerEngine& engine, std::string tag)
        : engine_(engine), tag_(std::move(tag)) {}

    ~ImageGuard() {
        try {
            engine_.RemoveImage(tag_, true,
                                utils::CancellationToken::WithTimeout(kCleanupTimeout));
            spdlog::debug("Removed image {}", tag_);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to remove image {}: {}", tag_, e.what());
        }
    }

    ImageGuard(const ImageGuard&) = delete;
    ImageGuard& operator=(const ImageGuard&) = delete;

private:
    engine::ContainerEngine& engine_;
    std::string tag_;
};

class ContainerGuard {
public:
    ContainerGuard(engine::ContainerEngine& engine, std::string id, bool keep)
        : engine_(engine), id_(std::move(id)), keep_(keep) {}

    ~ContainerGuard() {
        if (keep_) {
            if (may_be_running_) {
                StopNow();
            }
            spdlog::info("Container preserved for inspection: {}", id_);
            return;
        }

        // Forced removal also kills a container that is still running
        try {
            engine_.RemoveContainer(id_, true,
                                    utils::CancellationToken::WithTimeout(kCleanupTimeout));
            spdlog::debug("Removed container {}", id_);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to remove container {}: {}", id_, e.what());
        }
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

    void MarkStarting() { may_be_running_ = true; }
    void MarkExited() { may_be_running_ = false; }

    /// Stop without grace period; failures are logged
    void StopNow() noexcept {
        try {
            engine_.StopContainer(id_, std::chrono::seconds(0),
                                  utils::CancellationToken::WithTimeout(kCleanupTimeout));
        } catch (const std::exception& e) {
            spdlog::warn("Failed to stop container {}: {}", id_, e.what());
        }
    }

private:
    engine::ContainerEngine& engine_;
    std::string id_;
    bool keep_;
    bool may_be_running_{false};
};

void ThrowIfCancelled(const utils::CancellationToken& token) {
    if (token.IsCancelled()) {
        throw CancelledError();
    }
}

} // anonymous namespace

// ============================================================================
// EXECUTOR
// ============================================================================

Executor::Executor(std::shared_ptr<engine::ContainerEngine> engine, ExecutorConfig config)
    : engine_(std::move(engine)), config_(std::move(config)) {
    if (!engine_) {
        throw std::invalid_argument("Executor requires a container engine");
    }
}

ExecutionResult Executor::Execute(const utils::CancellationToken& token) {
    if (executed_) {
        throw std::logic_error("Executor instances are single-use");
    }
    executed_ = true;

    spdlog::info("Executing \"{}\" (timeout: {}s, network: {}, runtime: {})",
                 config_.command, config_.timeout.count(),
                 ToEngineNetworkMode(config_.network_mode),
                 config_.runtime.empty() ? "default" : config_.runtime);

    // Phase 1: build context. Nothing has touched the engine yet.
    const MemoryFileSet no_files;
    BuildContext context = BuildContextAssembler().Assemble(
        config_.files ? *config_.files : no_files,
        config_.dockerfile,
        config_.seccomp_profile);
    profile_name_ = context.profile_name;
    spdlog::debug("Build context: {} entries, {} bytes, sha256 {}",
                  context.entry_count, context.archive.size(),
                  utils::HashUtils::SHA256(context.archive));

    image_tag_ = utils::HashUtils::RandomHex(kIdentifierBytes);
    container_id_ = utils::HashUtils::RandomHex(kIdentifierBytes);
    ThrowIfCancelled(token);

    // Phase 2: image. Removal is owed from the moment the build is issued.
    ImageGuard image_guard(*engine_, image_tag_);
    {
        std::istringstream archive(context.archive);
        engine_->BuildImage(archive, image_tag_, token);
    }
    spdlog::info("Image built: {}", image_tag_);

    const auto since = std::chrono::system_clock::now();
    const auto started = std::chrono::steady_clock::now();
    auto sinks = utils::MakeOutputSinks(config_.stdout_sink, config_.stderr_sink);

    // Phase 3: container
    const std::string id = engine_->CreateContainer(MakeContainerSpec(context), token);
    container_id_ = id;
    ContainerGuard container_guard(*engine_, id, config_.keep_container);
    LogPump pump;

    container_guard.MarkStarting();
    try {
        engine_->StartContainer(id, token);
    } catch (const std::exception& e) {
        spdlog::error("Failed to start container {}: {}", id, e.what());
        container_guard.StopNow();
        throw;
    }
    spdlog::info("Container started: {}", id);

    pump.Start(engine_->OpenLogStream(id, token), LogDemuxer(sinks.first, sinks.second));

    // Phase 4: stop. Returns once the command exits or the stop timeout kills it.
    try {
        engine_->StopContainer(id, std::nullopt, token);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("Stop request for container {} failed: {}", id, e.what());
    }

    // Phase 5: classification
    engine::EventFilter filter;
    filter.since = since;
    filter.container = id;
    filter.image = image_tag_;
    filter.event = kDieEvent;

    auto subscription = engine_->SubscribeEvents(filter, token);
    ExitClassifier classifier(config_.command, id, image_tag_);
    ExitStatus status;
    try {
        status = classifier.Await(*subscription, token);
    } catch (const TimeoutError&) {
        container_guard.MarkExited();
        // Keep what the command printed before it was killed
        try {
            pump.Join();
        } catch (const std::exception& e) {
            spdlog::warn("Output of timed out container {} is incomplete: {}", id, e.what());
        }
        throw;
    } catch (const std::exception&) {
        if (classifier.exit_observed()) {
            container_guard.MarkExited();
        }
        throw;
    }
    container_guard.MarkExited();

    // Output is complete once the container is gone
    pump.Join();

    ExecutionResult result;
    result.exit_code = status.exit_code;
    result.image_tag = image_tag_;
    result.container_id = id;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::info("Execution complete: exit code {} in {} ms",
                 result.exit_code, result.duration.count());
    return result;
}

engine::ContainerSpec Executor::MakeContainerSpec(const BuildContext& context) const {
    engine::ContainerSpec spec;
    spec.name = container_id_;
    spec.image = image_tag_;
    spec.runtime = config_.runtime;
    spec.network_mode = ToEngineNetworkMode(config_.network_mode);
    spec.stop_timeout = config_.timeout.count() < 0 ? kNoTimeout : config_.timeout;
    spec.command = {"sh", "-c", config_.command};

    if (context.profile_name) {
        spec.security_opts.push_back("seccomp=" + *context.profile_name);
        if (context.profile_document) {
            spec.context_files[*context.profile_name] = *context.profile_document;
        }
    }
    return spec;
}

} // namespace core
} // namespace eggshell
