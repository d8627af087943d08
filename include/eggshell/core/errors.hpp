/**
 * @file errors.hpp
 * @brief Exception hierarchy reported by sandboxed executions
 *
 * Every failure surfaced by an Executor derives from eggshell::core::Error so
 * callers can branch on "the command ran too long" (TimeoutError) versus
 * "infrastructure failed" (EngineError, IoError) versus "caller gave up"
 * (CancelledError).
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace eggshell {
namespace core {

/**
 * @class Error
 * @brief Base class of all eggshell errors
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class IoError
 * @brief File, archive, pipe or process-spawn failure
 */
class IoError : public Error {
public:
    explicit IoError(const std::string& message)
        : Error(message) {}
};

/**
 * @class EngineError
 * @brief Container engine rejected a request or its event stream failed
 *
 * The message carries the engine's own diagnostic text verbatim.
 */
class EngineError : public Error {
public:
    explicit EngineError(const std::string& message)
        : Error(message) {}
};

/**
 * @class ConfigError
 * @brief Invalid or unreadable run configuration
 */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(message) {}
};

/**
 * @class CancelledError
 * @brief The caller's cancellation token fired before the run resolved
 */
class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& message = "execution cancelled")
        : Error(message) {}
};

/**
 * @class TimeoutError
 * @brief Command was force-stopped at the configured deadline
 *
 * Raised only when the container's main process exits with 128 + SIGKILL.
 */
class TimeoutError : public Error {
public:
    TimeoutError(const std::string& command,
                 const std::string& container_id,
                 const std::string& image_tag);

    const std::string& command() const { return command_; }
    const std::string& container_id() const { return container_id_; }
    const std::string& image_tag() const { return image_tag_; }

private:
    std::string command_;
    std::string container_id_;
    std::string image_tag_;
};

} // namespace core
} // namespace eggshell
