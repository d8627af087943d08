/**
 * @file file_set.cpp
 * @brief In-memory and directory-backed file sets
 *
 * @date 2025
 */

#include "eggshell/core/file_set.hpp"
#include "eggshell/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace eggshell {
namespace core {

// ============================================================================
// MEMORY FILE SET
// ============================================================================

MemoryFileSet::MemoryFileSet(std::vector<std::pair<std::string, std::string>> entries)
    : entries_(std::move(entries)) {
}

void MemoryFileSet::Add(const std::string& path, const std::string& contents) {
    entries_.emplace_back(path, contents);
}

File MemoryFileSet::At(std::size_t index) const {
    if (index >= entries_.size()) {
        throw IoError("file index out of range: " + std::to_string(index));
    }

    const auto& entry = entries_[index];
    return File{entry.first, std::make_unique<std::istringstream>(entry.second)};
}

// ============================================================================
// DIRECTORY FILE SET
// ============================================================================
// Walks the tree eagerly for names only; contents are opened on demand

DirectoryFileSet::DirectoryFileSet(const std::filesystem::path& root)
    : root_(root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        throw IoError("not a directory: " + root_.string());
    }

    std::filesystem::recursive_directory_iterator it(root_, ec);
    if (ec) {
        throw IoError("cannot read directory " + root_.string() + ": " + ec.message());
    }

    std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        if (it->is_regular_file(ec) && !it->is_symlink(ec)) {
            relative_paths_.push_back(
                std::filesystem::relative(it->path(), root_).generic_string());
        }
        it.increment(ec);
        if (ec) {
            throw IoError("cannot read directory " + root_.string() + ": " + ec.message());
        }
    }

    std::sort(relative_paths_.begin(), relative_paths_.end());
    spdlog::debug("Directory file set {}: {} files", root_.string(), relative_paths_.size());
}

File DirectoryFileSet::At(std::size_t index) const {
    if (index >= relative_paths_.size()) {
        throw IoError("file index out of range: " + std::to_string(index));
    }

    const auto& relative = relative_paths_[index];
    auto stream = std::make_unique<std::ifstream>(root_ / relative, std::ios::binary);
    if (!stream->is_open()) {
        throw IoError("failed to open file: " + (root_ / relative).string());
    }

    return File{relative, std::move(stream)};
}

} // namespace core
} // namespace eggshell
