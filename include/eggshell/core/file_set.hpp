/**
 * @file file_set.hpp
 * @brief Caller-supplied files that make up a container build context
 *
 * A FileSet is an index-addressable capability, not a container type: callers
 * back it with in-memory buffers, a lazily walked host directory, or anything
 * else that can hand out a File for index i. The build-context assembler walks
 * it once, in index order, and takes ownership of every File it receives.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace eggshell {
namespace core {

/**
 * @struct File
 * @brief A relative path paired with an open, readable byte stream
 *
 * The stream is owned by the File; it is closed when the File is destroyed.
 */
struct File {
    std::string path;                       ///< Path inside the build context
    std::unique_ptr<std::istream> stream;   ///< Contents, read exactly once
};

/**
 * @class FileSet
 * @brief Random-access collection of Files
 *
 * At(i) must describe the same file for the same index during one assembly.
 */
class FileSet {
public:
    virtual ~FileSet() = default;

    /**
     * @brief Open the file at @p index
     * @throws eggshell::core::IoError if the file cannot be opened
     */
    virtual File At(std::size_t index) const = 0;

    /// Number of files in the set
    virtual std::size_t Size() const = 0;
};

/**
 * @class MemoryFileSet
 * @brief FileSet backed by in-memory path/content pairs
 *
 * **Usage Example**:
 * @code
 * auto files = std::make_shared<MemoryFileSet>();
 * files->Add("main.sh", "echo hi");
 * @endcode
 */
class MemoryFileSet : public FileSet {
public:
    MemoryFileSet() = default;
    explicit MemoryFileSet(std::vector<std::pair<std::string, std::string>> entries);

    /// Append a file; later entries are archived after earlier ones
    void Add(const std::string& path, const std::string& contents);

    File At(std::size_t index) const override;
    std::size_t Size() const override { return entries_.size(); }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

/**
 * @class DirectoryFileSet
 * @brief FileSet over the regular files below a host directory
 *
 * The directory is walked once at construction and the relative paths are
 * sorted so indices are stable. File contents are opened lazily by At().
 * Symbolic links are not followed.
 */
class DirectoryFileSet : public FileSet {
public:
    /**
     * @param root Directory to walk
     * @throws eggshell::core::IoError if @p root is not a readable directory
     */
    explicit DirectoryFileSet(const std::filesystem::path& root);

    File At(std::size_t index) const override;
    std::size_t Size() const override { return relative_paths_.size(); }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::vector<std::string> relative_paths_;
};

} // namespace core
} // namespace eggshell
