/**
 * @file string_utils.hpp
 * @brief String helpers for command lines, engine output and archive paths
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace eggshell {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    static std::string Trim(const std::string& str);
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, keeping empty fields
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Command Lines
     ***************************************************************************/

    /**
     * @brief Quote an argument for display in a POSIX shell command line
     *
     * Only used for logging; eggshell never hands command lines to a shell.
     */
    static std::string ShellQuote(const std::string& arg);

    /**
     * @brief Render an argv vector as a copy-pasteable shell command line
     */
    static std::string FormatCommandLine(const std::vector<std::string>& argv);

    /***************************************************************************
     * Archive Paths
     ***************************************************************************/

    /**
     * @brief Lexically clean a path so it stays inside a build context
     *
     * Resolves "." and ".." segments, drops empty segments and leading
     * slashes. A ".." at the root is discarded instead of escaping it, so
     * "../../etc/passwd" becomes "etc/passwd". Idempotent.
     *
     * @param path Caller-supplied relative path
     * @return Normalized path, empty if nothing remains
     *
     * **Example**:
     * @code
     * StringUtils::NormalizeContextPath("./src//a/../main.sh");  // "src/main.sh"
     * @endcode
     */
    static std::string NormalizeContextPath(const std::string& path);
};

} // namespace utils
} // namespace eggshell
