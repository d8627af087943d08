/**
 * @file network_mode.hpp
 * @brief Sandbox network policies and their engine-native names
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>

namespace eggshell {
namespace core {

/**
 * @enum NetworkMode
 * @brief Network isolation policy for the sandbox container
 */
enum class NetworkMode {
    BRIDGE = 0,  ///< Default. No inbound exposure; other containers reachable by IP only
    NONE = 1     ///< No network access except loopback
};

/**
 * @brief Map a network mode to the engine's native mode identifier
 * @param mode Network mode
 * @return "bridge" or "none"
 *
 * A value outside the enum means the caller built an invalid configuration.
 * That is a programming defect: the process is aborted, nothing is returned.
 */
std::string ToEngineNetworkMode(NetworkMode mode);

/**
 * @brief Parse a configuration string into a network mode
 * @param text "bridge" or "none" (case-insensitive)
 * @return Mode, or std::nullopt for unrecognised input
 */
std::optional<NetworkMode> ParseNetworkMode(const std::string& text);

} // namespace core
} // namespace eggshell
