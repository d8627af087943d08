/**
 * @file errors.cpp
 * @brief Message formatting for eggshell errors
 *
 * @date 2025
 */

#include "eggshell/core/errors.hpp"

#include <spdlog/fmt/fmt.h>

namespace eggshell {
namespace core {

namespace {

std::string FormatTimeoutMessage(const std::string& command,
                                 const std::string& container_id,
                                 const std::string& image_tag) {
    return fmt::format("process \"{}\" in container {} from image {} has timed out",
                       command, container_id, image_tag);
}

} // anonymous namespace

TimeoutError::TimeoutError(const std::string& command,
                           const std::string& container_id,
                           const std::string& image_tag)
    : Error(FormatTimeoutMessage(command, container_id, image_tag))
    , command_(command)
    , container_id_(container_id)
    , image_tag_(image_tag) {
}

} // namespace core
} // namespace eggshell
