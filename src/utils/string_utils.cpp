/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "eggshell/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace eggshell {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::size_t start = 0;

    while (true) {
        std::size_t pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            tokens.push_back(str.substr(start));
            break;
        }
        tokens.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }

    return tokens;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// COMMAND LINE FORMATTING
// ============================================================================

std::string StringUtils::ShellQuote(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    bool safe = std::all_of(arg.begin(), arg.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' ||
               c == '/' || c == '=' || c == ':' || c == ',' || c == '@';
    });
    if (safe) {
        return arg;
    }

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string StringUtils::FormatCommandLine(const std::vector<std::string>& argv) {
    std::vector<std::string> quoted;
    quoted.reserve(argv.size());
    for (const auto& arg : argv) {
        quoted.push_back(ShellQuote(arg));
    }
    return Join(quoted, " ");
}

// ============================================================================
// ARCHIVE PATH NORMALIZATION
// ============================================================================
// Lexical only: the context is an archive, there is no filesystem to consult.

std::string StringUtils::NormalizeContextPath(const std::string& path) {
    std::vector<std::string> segments;

    for (const auto& segment : Split(path, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            // Never climb above the context root
            if (!segments.empty()) {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(segment);
    }

    return Join(segments, "/");
}

} // namespace utils
} // namespace eggshell
