/**
 * @file build_context.hpp
 * @brief Serializes caller files, a Dockerfile and a seccomp profile into a build context
 *
 * **Archive Contents** (in order):
 * ```
 * <file 0> ... <file N-1>     normalized caller paths, index order
 * Dockerfile                  the build recipe
 * <16 hex chars>.json         custom seccomp profile, only when supplied
 * ```
 *
 * @date 2025
 */

#pragma once

#include "eggshell/core/file_set.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace eggshell {
namespace core {

/// Profile value selecting the engine's built-in default seccomp profile
inline const std::string kDefaultSeccompProfile;

/// Profile value disabling seccomp filtering altogether
inline const std::string kUnconfinedSeccompProfile = "unconfined";

/// Name under which the engine recognises the unconfined pass-through profile
inline const std::string kUnconfinedProfileName = "unconfined";

/// Archive entry name of the build recipe
inline const std::string kDockerfileEntryName = "Dockerfile";

/**
 * @struct BuildContext
 * @brief An assembled build-context archive
 */
struct BuildContext {
    std::string archive;                          ///< Complete tar stream
    std::size_t entry_count{0};                   ///< Entries in the archive
    std::optional<std::string> profile_name;      ///< Name to reference in security options
    std::optional<std::string> profile_document;  ///< Embedded profile, if any
};

/**
 * @class BuildContextAssembler
 * @brief Produces the tar archive submitted to the engine's image build
 *
 * Every file is read completely before its header is written, so a read
 * failure never leaves a half-written entry behind; the whole assembly then
 * fails with IoError and nothing reaches the engine. File streams are
 * released as soon as they have been read, on every path.
 */
class BuildContextAssembler {
public:
    /**
     * @brief Assemble a build context
     * @param files Caller files, archived in index order
     * @param dockerfile Dockerfile content
     * @param seccomp_profile kDefaultSeccompProfile, kUnconfinedSeccompProfile
     *        or a JSON seccomp profile document
     * @return The archive and the profile name to reference, if any
     *
     * @throws IoError on read failure, unusable path, or archive write failure
     */
    BuildContext Assemble(const FileSet& files,
                          const std::string& dockerfile,
                          const std::string& seccomp_profile = kDefaultSeccompProfile) const;
};

} // namespace core
} // namespace eggshell
