/**
 * @file build_context.cpp
 * @brief Implementation of build-context assembly
 *
 * **Assembly Workflow**:
 * ```
 * 1. For each file: read fully → normalize path → header → body → release stream
 * 2. Append "Dockerfile"
 * 3. Append the seccomp profile under a random name (custom profiles only)
 * 4. Write end-of-archive blocks
 * ```
 *
 * @date 2025
 */

#include "eggshell/core/build_context.hpp"
#include "eggshell/core/errors.hpp"
#include "eggshell/utils/hash_utils.hpp"
#include "eggshell/utils/string_utils.hpp"
#include "eggshell/utils/tar_writer.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace eggshell {
namespace core {

namespace {

/// Random bytes in a generated profile filename
constexpr std::size_t kProfileNameBytes = 8;

std::string ReadAll(std::istream& stream, const std::string& path) {
    std::string contents;
    char buffer[8192];

    while (stream.read(buffer, sizeof(buffer)) || stream.gcount() > 0) {
        contents.append(buffer, static_cast<std::size_t>(stream.gcount()));
    }

    if (stream.bad()) {
        throw IoError("failed to read file: " + path);
    }
    return contents;
}

} // anonymous namespace

BuildContext BuildContextAssembler::Assemble(const FileSet& files,
                                             const std::string& dockerfile,
                                             const std::string& seccomp_profile) const {
    std::ostringstream archive;
    utils::TarWriter tar(archive);
    BuildContext context;

    const std::size_t count = files.Size();
    for (std::size_t i = 0; i < count; ++i) {
        std::string contents;
        std::string path;
        {
            // File (and its stream) is released at the end of this scope
            File file = files.At(i);
            if (!file.stream) {
                throw IoError("file has no readable stream: " + file.path);
            }
            contents = ReadAll(*file.stream, file.path);
            path = utils::StringUtils::NormalizeContextPath(file.path);
            if (path.empty()) {
                throw IoError("file path resolves outside the build context: \"" +
                              file.path + "\"");
            }
        }

        if (path == kDockerfileEntryName) {
            spdlog::warn("Context file \"{}\" is shadowed by the generated Dockerfile", path);
        }

        spdlog::debug("Context entry {} ({} bytes)", path, contents.size());
        tar.AddFile(path, contents);
    }

    tar.AddFile(kDockerfileEntryName, dockerfile);

    if (seccomp_profile == kUnconfinedSeccompProfile) {
        context.profile_name = kUnconfinedProfileName;
    } else if (seccomp_profile != kDefaultSeccompProfile) {
        std::string name = utils::HashUtils::RandomHex(kProfileNameBytes) + ".json";
        tar.AddFile(name, seccomp_profile);
        context.profile_name = name;
        context.profile_document = seccomp_profile;
    }

    tar.Close();

    context.archive = archive.str();
    context.entry_count = tar.entry_count();
    return context;
}

} // namespace core
} // namespace eggshell
