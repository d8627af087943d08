/**
 * @file docker_cli_engine.hpp
 * @brief ContainerEngine backed by the docker command-line client
 *
 * Each operation runs one docker client process; the daemon connection,
 * context and TLS settings come from the client's own environment
 * (DOCKER_HOST, DOCKER_CONTEXT, ...).
 *
 * **Command Mapping**:
 * ```
 * BuildImage       docker build -t TAG -          (context on stdin)
 * RemoveImage      docker rmi [-f] TAG
 * CreateContainer  docker create --name ... IMAGE CMD...
 * StartContainer   docker start ID
 * StopContainer    docker stop [-t N] ID
 * RemoveContainer  docker rm [-f] ID
 * OpenLogStream    docker logs --follow ID
 * SubscribeEvents  docker events --since T --filter ... --format '{{json .}}'
 * ```
 *
 * @date 2025
 */

#pragma once

#include "eggshell/engine/container_engine.hpp"

#include <string>
#include <vector>

namespace eggshell {
namespace engine {

/**
 * @class DockerCliEngine
 * @brief Drives Docker through its CLI
 *
 * **Usage Example**:
 * @code
 * auto engine = std::make_shared<DockerCliEngine>("/usr/bin/docker");
 * if (!DockerCliEngine::IsAvailable()) {
 *     // daemon unreachable
 * }
 * @endcode
 *
 * Security options of the form `seccomp=<name>` whose name is a key of
 * ContainerSpec::context_files are rewritten to point at a temporary copy
 * of that document for the duration of the create call.
 */
class DockerCliEngine : public ContainerEngine {
public:
    /**
     * @brief Construct engine binding
     * @param docker_binary Client executable, looked up in PATH when relative
     */
    explicit DockerCliEngine(std::string docker_binary = "docker");

    /**
     * @brief Check whether the client runs and reaches a daemon
     * @param docker_binary Client executable
     * @return true if `docker version` reports a server version
     */
    static bool IsAvailable(const std::string& docker_binary = "docker");

    void BuildImage(std::istream& context, const std::string& tag,
                    const utils::CancellationToken& token) override;

    void RemoveImage(const std::string& tag, bool force,
                     const utils::CancellationToken& token) override;

    std::string CreateContainer(const ContainerSpec& spec,
                                const utils::CancellationToken& token) override;

    void StartContainer(const std::string& id,
                        const utils::CancellationToken& token) override;

    void StopContainer(const std::string& id,
                       std::optional<std::chrono::seconds> grace,
                       const utils::CancellationToken& token) override;

    void RemoveContainer(const std::string& id, bool force,
                         const utils::CancellationToken& token) override;

    std::unique_ptr<LogStream> OpenLogStream(const std::string& id,
                                             const utils::CancellationToken& token) override;

    std::unique_ptr<EventSubscription> SubscribeEvents(
        const EventFilter& filter, const utils::CancellationToken& token) override;

    const std::string& docker_binary() const { return docker_binary_; }

    /**
     * @brief Argument list of `docker create` for @p spec
     * @param spec Container specification
     * @param profile_paths Replacement paths for context_files keys
     */
    static std::vector<std::string> BuildCreateArgs(
        const ContainerSpec& spec,
        const std::map<std::string, std::string>& profile_paths);

    /**
     * @brief Decode one line of `docker events --format '{{json .}}'`
     * @throws eggshell::core::EngineError if the line is not a valid event
     */
    static ContainerEvent ParseEvent(const std::string& line);

private:
    std::string docker_binary_;

    std::vector<std::string> CommandLine(std::vector<std::string> args) const;

    /// Run a client command; throws EngineError with its stderr on failure
    utils::CommandResult RunDocker(const std::vector<std::string>& args,
                                   const utils::CancellationToken& token,
                                   std::istream* input = nullptr) const;
};

} // namespace engine
} // namespace eggshell
