/**
 * @file network_mode.cpp
 * @brief Network mode mapping
 *
 * @date 2025
 */

#include "eggshell/core/network_mode.hpp"
#include "eggshell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace eggshell {
namespace core {

std::string ToEngineNetworkMode(NetworkMode mode) {
    switch (mode) {
        case NetworkMode::BRIDGE:
            return "bridge";
        case NetworkMode::NONE:
            return "none";
    }

    spdlog::critical("({}) doesn't have a corresponding network mode", static_cast<int>(mode));
    spdlog::shutdown();
    std::abort();
}

std::optional<NetworkMode> ParseNetworkMode(const std::string& text) {
    std::string mode = utils::StringUtils::ToLower(utils::StringUtils::Trim(text));
    if (mode == "bridge") {
        return NetworkMode::BRIDGE;
    }
    if (mode == "none") {
        return NetworkMode::NONE;
    }
    return std::nullopt;
}

} // namespace core
} // namespace eggshell
