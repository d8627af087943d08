/**
 * @file docker_cli_engine.cpp
 * @brief Implementation of the docker CLI engine binding
 *
 * **Log Streaming**:
 * `docker logs --follow` writes the container's stdout to its own stdout and
 * the container's stderr to its own stderr, so the two client pipes already
 * carry the demultiplexed streams. The stream ends when the container exits.
 *
 * **Event Subscription**:
 * A reader thread owns the `docker events` process, splits its output into
 * JSON lines and publishes decoded events. Anything the client prints on
 * stderr, or an unexpected exit, goes to the error channel.
 *
 * @date 2025
 */

#include "eggshell/engine/docker_cli_engine.hpp"
#include "eggshell/core/errors.hpp"
#include "eggshell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <thread>

#include <unistd.h>

using json = nlohmann::json;

namespace eggshell {
namespace engine {

namespace {

constexpr const char* kSeccompOptionPrefix = "seccomp=";

// ============================================================================
// TEMPORARY PROFILE DIRECTORY
// ============================================================================
// The client reads seccomp profiles from disk at create time only.

class ScopedTempDir {
public:
    ScopedTempDir() {
        std::string pattern =
            (std::filesystem::temp_directory_path() / "eggshell-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw core::IoError("failed to create temporary directory " + pattern);
        }
        path_ = pattern;
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove {}: {}", path_.string(), ec.message());
        }
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    std::filesystem::path Write(const std::string& name, const std::string& contents) {
        std::filesystem::path file = path_ / std::filesystem::path(name).filename();
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.close();
        if (!out) {
            throw core::IoError("failed to write " + file.string());
        }
        return file;
    }

private:
    std::filesystem::path path_;
};

bool IsNotFoundOrStopped(const std::string& message) {
    std::string lower = utils::StringUtils::ToLower(message);
    return utils::StringUtils::Contains(lower, "no such container") ||
           utils::StringUtils::Contains(lower, "is not running");
}

// ============================================================================
// LOG STREAM
// ============================================================================

class DockerLogStream : public LogStream {
public:
    DockerLogStream(const std::vector<std::string>& argv,
                    const utils::CancellationToken& token)
        : child_(argv), token_(token) {}

    bool Next(LogChunk& chunk) override {
        while (!closed_.load()) {
            if (token_.IsCancelled()) {
                Close();
                break;
            }

            OutputStream origin;
            std::string data;
            switch (child_.Read(origin, data, utils::kCancellationPollInterval)) {
                case utils::Subprocess::ReadStatus::DATA:
                    chunk.stream = origin;
                    chunk.data = std::move(data);
                    return true;
                case utils::Subprocess::ReadStatus::TIMEOUT:
                    continue;
                case utils::Subprocess::ReadStatus::END: {
                    int code = child_.Wait();
                    if (code != 0 && !closed_.load()) {
                        throw core::EngineError("docker logs exited with code " +
                                                std::to_string(code));
                    }
                    return false;
                }
            }
        }
        return false;
    }

    void Close() noexcept override {
        if (!closed_.exchange(true)) {
            child_.Kill(SIGTERM);
        }
    }

private:
    utils::Subprocess child_;
    utils::CancellationToken token_;
    std::atomic<bool> closed_{false};
};

// ============================================================================
// EVENT SUBSCRIPTION
// ============================================================================

class DockerEventSubscription : public EventSubscription {
public:
    explicit DockerEventSubscription(const std::vector<std::string>& argv)
        : child_(argv) {
        reader_ = std::thread(&DockerEventSubscription::ReadLoop, this);
    }

    ~DockerEventSubscription() override {
        Cancel();
    }

    void Cancel() noexcept override {
        EventSubscription::Cancel();
        stopping_.store(true);
        child_.Kill(SIGTERM);
        if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
            reader_.join();
        }
    }

private:
    utils::Subprocess child_;
    std::thread reader_;
    std::atomic<bool> stopping_{false};

    void ReadLoop() {
        std::string pending;
        std::string diagnostics;

        try {
            while (!stopping_.load()) {
                OutputStream origin;
                std::string data;
                auto status = child_.Read(origin, data, utils::kCancellationPollInterval);
                if (status == utils::Subprocess::ReadStatus::TIMEOUT) {
                    continue;
                }
                if (status == utils::Subprocess::ReadStatus::END) {
                    break;
                }

                if (origin == OutputStream::STDERR) {
                    diagnostics += data;
                    continue;
                }

                pending += data;
                std::size_t newline;
                while ((newline = pending.find('\n')) != std::string::npos) {
                    std::string line = utils::StringUtils::Trim(pending.substr(0, newline));
                    pending.erase(0, newline + 1);
                    if (line.empty()) {
                        continue;
                    }
                    spdlog::debug("Event: {}", line);
                    PublishEvent(DockerCliEngine::ParseEvent(line));
                }
            }
        } catch (const std::exception& e) {
            PublishError(e.what());
            return;
        }

        if (stopping_.load()) {
            return;
        }

        int code = child_.Wait();
        std::string message = utils::StringUtils::Trim(diagnostics);
        if (message.empty()) {
            message = "docker events exited with code " + std::to_string(code);
        }
        PublishError(message);
    }
};

} // anonymous namespace

// ============================================================================
// CONSTRUCTION / AVAILABILITY
// ============================================================================

DockerCliEngine::DockerCliEngine(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {
    if (docker_binary_.empty()) {
        docker_binary_ = "docker";
    }
    spdlog::debug("Docker CLI engine using {}", docker_binary_);
}

bool DockerCliEngine::IsAvailable(const std::string& docker_binary) {
    try {
        auto result = utils::RunCommand(
            {docker_binary, "version", "--format", "{{.Server.Version}}"},
            utils::CancellationToken::WithTimeout(std::chrono::seconds(10)));
        if (result.success()) {
            spdlog::debug("Docker server version: {}",
                          utils::StringUtils::Trim(result.stdout_output));
            return true;
        }
        spdlog::debug("Docker unavailable: {}", utils::StringUtils::Trim(result.stderr_output));
    } catch (const std::exception& e) {
        spdlog::debug("Docker unavailable: {}", e.what());
    }
    return false;
}

// ============================================================================
// IMAGES
// ============================================================================

void DockerCliEngine::BuildImage(std::istream& context, const std::string& tag,
                                 const utils::CancellationToken& token) {
    spdlog::info("Building image {}", tag);
    auto result = RunDocker({"build", "-t", tag, "-"}, token, &context);
    spdlog::debug("Build output:\n{}", result.stdout_output);
}

void DockerCliEngine::RemoveImage(const std::string& tag, bool force,
                                  const utils::CancellationToken& token) {
    std::vector<std::string> args = {"rmi"};
    if (force) {
        args.push_back("-f");
    }
    args.push_back(tag);

    RunDocker(args, token);
    spdlog::debug("Image {} removed", tag);
}

// ============================================================================
// CONTAINERS
// ============================================================================

std::vector<std::string> DockerCliEngine::BuildCreateArgs(
    const ContainerSpec& spec,
    const std::map<std::string, std::string>& profile_paths) {
    std::vector<std::string> args = {"create"};

    if (!spec.name.empty()) {
        args.push_back("--name");
        args.push_back(spec.name);
    }

    if (!spec.runtime.empty()) {
        args.push_back("--runtime");
        args.push_back(spec.runtime);
    }

    if (!spec.network_mode.empty()) {
        args.push_back("--network");
        args.push_back(spec.network_mode);
    }

    args.push_back("--stop-timeout");
    args.push_back(std::to_string(spec.stop_timeout.count()));

    for (const auto& opt : spec.security_opts) {
        std::string value = opt;
        if (utils::StringUtils::StartsWith(opt, kSeccompOptionPrefix)) {
            auto it = profile_paths.find(opt.substr(std::strlen(kSeccompOptionPrefix)));
            if (it != profile_paths.end()) {
                value = kSeccompOptionPrefix + it->second;
            }
        }
        args.push_back("--security-opt");
        args.push_back(value);
    }

    if (spec.attach_stdout) {
        args.push_back("-a");
        args.push_back("stdout");
    }
    if (spec.attach_stderr) {
        args.push_back("-a");
        args.push_back("stderr");
    }

    // Image (must be last before command)
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    return args;
}

std::string DockerCliEngine::CreateContainer(const ContainerSpec& spec,
                                             const utils::CancellationToken& token) {
    spdlog::info("Creating container {} from {}", spec.name, spec.image);

    std::map<std::string, std::string> profile_paths;
    std::unique_ptr<ScopedTempDir> profile_dir;
    if (!spec.context_files.empty()) {
        profile_dir = std::make_unique<ScopedTempDir>();
        for (const auto& [name, document] : spec.context_files) {
            profile_paths[name] = profile_dir->Write(name, document).string();
        }
    }

    auto result = RunDocker(BuildCreateArgs(spec, profile_paths), token);

    std::string id = spec.name;
    if (id.empty()) {
        id = utils::StringUtils::Trim(result.stdout_output);
    }
    spdlog::debug("Container created: {}", id);
    return id;
}

void DockerCliEngine::StartContainer(const std::string& id,
                                     const utils::CancellationToken& token) {
    spdlog::info("Starting container {}", id);
    RunDocker({"start", id}, token);
}

void DockerCliEngine::StopContainer(const std::string& id,
                                    std::optional<std::chrono::seconds> grace,
                                    const utils::CancellationToken& token) {
    std::vector<std::string> args = {"stop"};
    if (grace) {
        args.push_back("-t");
        args.push_back(std::to_string(grace->count()));
    }
    args.push_back(id);

    try {
        RunDocker(args, token);
    } catch (const core::EngineError& e) {
        if (!IsNotFoundOrStopped(e.what())) {
            throw;
        }
        spdlog::debug("Container {} already stopped: {}", id, e.what());
    }
}

void DockerCliEngine::RemoveContainer(const std::string& id, bool force,
                                      const utils::CancellationToken& token) {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("-f");
    }
    args.push_back(id);

    RunDocker(args, token);
    spdlog::debug("Container {} removed", id);
}

// ============================================================================
// STREAMS
// ============================================================================

std::unique_ptr<LogStream> DockerCliEngine::OpenLogStream(const std::string& id,
                                                          const utils::CancellationToken& token) {
    auto argv = CommandLine({"logs", "--follow", id});
    spdlog::debug("Executing: {}", utils::StringUtils::FormatCommandLine(argv));
    return std::make_unique<DockerLogStream>(argv, token);
}

std::unique_ptr<EventSubscription> DockerCliEngine::SubscribeEvents(
    const EventFilter& filter, const utils::CancellationToken& token) {
    if (token.IsCancelled()) {
        throw core::CancelledError();
    }

    std::vector<std::string> args = {
        "events",
        "--since", std::to_string(std::chrono::system_clock::to_time_t(filter.since))
    };
    if (!filter.container.empty()) {
        args.push_back("--filter");
        args.push_back("container=" + filter.container);
    }
    if (!filter.image.empty()) {
        args.push_back("--filter");
        args.push_back("image=" + filter.image);
    }
    if (!filter.event.empty()) {
        args.push_back("--filter");
        args.push_back("event=" + filter.event);
    }
    args.push_back("--format");
    args.push_back("{{json .}}");

    auto argv = CommandLine(std::move(args));
    spdlog::debug("Executing: {}", utils::StringUtils::FormatCommandLine(argv));
    return std::make_unique<DockerEventSubscription>(argv);
}

// ============================================================================
// EVENT DECODING
// ============================================================================

ContainerEvent DockerCliEngine::ParseEvent(const std::string& line) {
    ContainerEvent event;
    try {
        json j = json::parse(line);
        if (!j.is_object()) {
            throw core::EngineError("malformed event from docker: " + line);
        }
        event.action = j.value("Action", j.value("status", std::string()));

        if (j.contains("Actor") && j["Actor"].is_object()) {
            const auto& actor = j["Actor"];
            event.actor_id = actor.value("ID", std::string());
            if (actor.contains("Attributes") && actor["Attributes"].is_object()) {
                for (const auto& [key, value] : actor["Attributes"].items()) {
                    event.attributes[key] = value.is_string() ? value.get<std::string>()
                                                              : value.dump();
                }
            }
        }
        if (event.actor_id.empty()) {
            event.actor_id = j.value("id", std::string());
        }

        if (j.contains("timeNano") && j["timeNano"].is_number_integer()) {
            auto nanos = std::chrono::nanoseconds(j["timeNano"].get<std::int64_t>());
            event.time = std::chrono::system_clock::time_point(
                std::chrono::duration_cast<std::chrono::system_clock::duration>(nanos));
        } else if (j.contains("time") && j["time"].is_number_integer()) {
            event.time = std::chrono::system_clock::from_time_t(
                static_cast<std::time_t>(j["time"].get<std::int64_t>()));
        }
    } catch (const json::exception& e) {
        throw core::EngineError("malformed event from docker: " + std::string(e.what()));
    }

    if (event.action.empty()) {
        throw core::EngineError("event without action from docker: " + line);
    }
    return event;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

std::vector<std::string> DockerCliEngine::CommandLine(std::vector<std::string> args) const {
    args.insert(args.begin(), docker_binary_);
    return args;
}

utils::CommandResult DockerCliEngine::RunDocker(const std::vector<std::string>& args,
                                                const utils::CancellationToken& token,
                                                std::istream* input) const {
    auto argv = CommandLine(args);
    spdlog::debug("Executing: {}", utils::StringUtils::FormatCommandLine(argv));

    auto result = utils::RunCommand(argv, token, input);
    if (!result.success()) {
        std::string message = utils::StringUtils::Trim(result.stderr_output);
        if (message.empty()) {
            message = "docker " + args.front() + " exited with code " +
                      std::to_string(result.exit_code);
        }
        throw core::EngineError(message);
    }
    return result;
}

} // namespace engine
} // namespace eggshell
