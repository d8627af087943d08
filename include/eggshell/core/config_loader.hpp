/**
 * @file config_loader.hpp
 * @brief JSON run configuration for the command-line harness
 *
 * **Example Document**:
 * ```json
 * {
 *   "dockerfile": "Dockerfile",
 *   "context_dir": "./src",
 *   "command": "sh main.sh",
 *   "timeout_seconds": 30,
 *   "network": "none",
 *   "seccomp_profile": "profiles/strict.json",
 *   "runtime": "runsc",
 *   "docker_binary": "/usr/bin/docker",
 *   "keep_container": false,
 *   "log_level": "info"
 * }
 * ```
 * Relative paths are resolved against the directory of the document.
 *
 * @date 2025
 */

#pragma once

#include "eggshell/core/executor.hpp"
#include "eggshell/core/network_mode.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace eggshell {
namespace core {

/**
 * @struct RunSettings
 * @brief Harness settings before files are read
 */
struct RunSettings {
    std::filesystem::path dockerfile;               ///< Dockerfile path
    std::filesystem::path context_dir;              ///< Build-context directory (empty: no files)
    std::string command;                            ///< Shell command
    std::chrono::seconds timeout{300};              ///< Negative disables the timeout
    NetworkMode network_mode{NetworkMode::BRIDGE};  ///< Network isolation level
    std::string seccomp_profile;                    ///< Profile path, "unconfined" or empty
    std::string runtime{kDefaultRuntime};           ///< OCI runtime
    std::string docker_binary{"docker"};            ///< Docker client executable
    bool keep_container{false};                     ///< Leave the container behind
    std::string log_level{"info"};                  ///< spdlog level name
};

/**
 * @class ConfigLoader
 * @brief Reads RunSettings from JSON and turns them into an ExecutorConfig
 */
class ConfigLoader {
public:
    /**
     * @brief Load settings from a JSON file
     * @throws ConfigError if the file is unreadable or invalid
     */
    static RunSettings LoadFile(const std::filesystem::path& path);

    /**
     * @brief Apply a parsed JSON object on top of @p defaults
     * @param document JSON object
     * @param base_dir Directory relative paths are resolved against
     * @param defaults Starting values
     *
     * Unknown keys are ignored with a warning.
     *
     * @throws ConfigError on wrong types or invalid values
     */
    static RunSettings FromJson(const nlohmann::json& document,
                                const std::filesystem::path& base_dir = {},
                                RunSettings defaults = RunSettings{});

    /**
     * @brief Read the files named by @p settings into an executor configuration
     *
     * Output sinks are left unset.
     *
     * @throws ConfigError if a required value is missing or a file is unreadable
     */
    static ExecutorConfig ToExecutorConfig(const RunSettings& settings);

    /// Check that @p level names an spdlog level
    static bool IsValidLogLevel(const std::string& level);
};

} // namespace core
} // namespace eggshell
