/**
 * @file config_loader.cpp
 * @brief Implementation of the JSON run configuration loader
 *
 * @date 2025
 */

#include "eggshell/core/config_loader.hpp"
#include "eggshell/core/errors.hpp"
#include "eggshell/core/file_set.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace eggshell {
namespace core {

namespace {

constexpr std::array<const char*, 10> kKnownKeys = {
    "dockerfile", "context_dir", "command", "timeout_seconds", "network",
    "seccomp_profile", "runtime", "docker_binary", "keep_container", "log_level"
};

std::string ReadTextFile(const std::filesystem::path& path, const std::string& what) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigError("cannot open " + what + ": " + path.string());
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw ConfigError("failed to read " + what + ": " + path.string());
    }
    return contents.str();
}

std::filesystem::path Resolve(const std::filesystem::path& base_dir, const std::string& value) {
    std::filesystem::path path(value);
    if (path.is_relative() && !base_dir.empty()) {
        return base_dir / path;
    }
    return path;
}

template <typename T>
T Get(const json& document, const char* key) {
    try {
        return document.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid value for \"") + key + "\": " + e.what());
    }
}

} // anonymous namespace

RunSettings ConfigLoader::LoadFile(const std::filesystem::path& path) {
    spdlog::debug("Loading configuration from {}", path.string());

    std::string text = ReadTextFile(path, "configuration file");
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError("malformed configuration file " + path.string() + ": " + e.what());
    }

    return FromJson(document, path.parent_path());
}

RunSettings ConfigLoader::FromJson(const json& document,
                                   const std::filesystem::path& base_dir,
                                   RunSettings defaults) {
    if (!document.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    RunSettings settings = std::move(defaults);

    for (const auto& item : document.items()) {
        bool known = false;
        for (const char* key : kKnownKeys) {
            known = known || item.key() == key;
        }
        if (!known) {
            spdlog::warn("Ignoring unknown configuration key \"{}\"", item.key());
        }
    }

    if (document.contains("dockerfile")) {
        settings.dockerfile = Resolve(base_dir, Get<std::string>(document, "dockerfile"));
    }
    if (document.contains("context_dir")) {
        settings.context_dir = Resolve(base_dir, Get<std::string>(document, "context_dir"));
    }
    if (document.contains("command")) {
        settings.command = Get<std::string>(document, "command");
    }
    if (document.contains("timeout_seconds")) {
        auto seconds = Get<long long>(document, "timeout_seconds");
        settings.timeout = seconds < 0 ? kNoTimeout : std::chrono::seconds(seconds);
    }
    if (document.contains("network")) {
        std::string network = Get<std::string>(document, "network");
        auto mode = ParseNetworkMode(network);
        if (!mode) {
            throw ConfigError("unknown network mode \"" + network + "\" (expected bridge or none)");
        }
        settings.network_mode = *mode;
    }
    if (document.contains("seccomp_profile")) {
        std::string profile = Get<std::string>(document, "seccomp_profile");
        if (profile.empty() || profile == kUnconfinedSeccompProfile) {
            settings.seccomp_profile = profile;
        } else {
            settings.seccomp_profile = Resolve(base_dir, profile).string();
        }
    }
    if (document.contains("runtime")) {
        settings.runtime = Get<std::string>(document, "runtime");
    }
    if (document.contains("docker_binary")) {
        settings.docker_binary = Get<std::string>(document, "docker_binary");
        if (settings.docker_binary.empty()) {
            throw ConfigError("\"docker_binary\" must not be empty");
        }
    }
    if (document.contains("keep_container")) {
        settings.keep_container = Get<bool>(document, "keep_container");
    }
    if (document.contains("log_level")) {
        settings.log_level = Get<std::string>(document, "log_level");
        if (!IsValidLogLevel(settings.log_level)) {
            throw ConfigError("unknown log level \"" + settings.log_level + "\"");
        }
    }

    return settings;
}

ExecutorConfig ConfigLoader::ToExecutorConfig(const RunSettings& settings) {
    if (settings.dockerfile.empty()) {
        throw ConfigError("no Dockerfile configured");
    }
    if (settings.command.empty()) {
        throw ConfigError("no command configured");
    }

    ExecutorConfig config;
    config.dockerfile = ReadTextFile(settings.dockerfile, "Dockerfile");
    config.command = settings.command;
    config.timeout = settings.timeout;
    config.network_mode = settings.network_mode;
    config.runtime = settings.runtime;
    config.keep_container = settings.keep_container;

    if (settings.seccomp_profile.empty() ||
        settings.seccomp_profile == kUnconfinedSeccompProfile) {
        config.seccomp_profile = settings.seccomp_profile;
    } else {
        config.seccomp_profile = ReadTextFile(settings.seccomp_profile, "seccomp profile");
        if (!json::accept(config.seccomp_profile)) {
            throw ConfigError("seccomp profile " + settings.seccomp_profile +
                              " is not valid JSON");
        }
    }

    if (!settings.context_dir.empty()) {
        try {
            config.files = std::make_shared<DirectoryFileSet>(settings.context_dir);
        } catch (const IoError& e) {
            throw ConfigError(std::string("invalid build context: ") + e.what());
        }
    }

    return config;
}

bool ConfigLoader::IsValidLogLevel(const std::string& level) {
    static const std::array<const char*, 7> kLevels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    for (const char* name : kLevels) {
        if (level == name) {
            return true;
        }
    }
    return false;
}

} // namespace core
} // namespace eggshell
