/**
 * @file tar_writer.hpp
 * @brief Streaming POSIX ustar archive writer
 *
 * Produces archives accepted by container engines as image build contexts.
 * Entries are regular files only. Paths that do not fit the 100-byte ustar
 * name field are split across the 155-byte prefix field when possible and
 * otherwise carried in a PAX extended header.
 *
 * **Archive Layout**:
 * ```
 * [512-byte header][body padded to 512] ... [512 zero bytes][512 zero bytes]
 * ```
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace eggshell {
namespace utils {

/// Size of one tar block
constexpr std::size_t kTarBlockSize = 512;

/// Permission bits written for every entry
constexpr uint32_t kTarDefaultMode = 0666;

/**
 * @class TarWriter
 * @brief Writes regular-file entries to an output stream
 *
 * **Usage Example**:
 * @code
 * std::ostringstream out;
 * TarWriter tar(out);
 * tar.WriteHeader("main.sh", body.size());
 * tar.WriteData(body);
 * tar.Close();
 * @endcode
 *
 * WriteHeader must be followed by exactly the announced number of bytes
 * through WriteData before the next header or Close.
 *
 * @throws eggshell::core::IoError on any stream failure or protocol misuse
 */
class TarWriter {
public:
    explicit TarWriter(std::ostream& out);

    TarWriter(const TarWriter&) = delete;
    TarWriter& operator=(const TarWriter&) = delete;

    /**
     * @brief Start a new regular-file entry
     * @param name Entry path inside the archive
     * @param size Exact number of body bytes that will follow
     * @param mode Permission bits
     */
    void WriteHeader(const std::string& name, uint64_t size,
                     uint32_t mode = kTarDefaultMode);

    /**
     * @brief Append body bytes to the current entry
     */
    void WriteData(const char* data, std::size_t size);
    void WriteData(const std::string& data) { WriteData(data.data(), data.size()); }

    /**
     * @brief Convenience: header plus complete body
     */
    void AddFile(const std::string& name, const std::string& contents,
                 uint32_t mode = kTarDefaultMode);

    /**
     * @brief Pad the last entry and write the end-of-archive marker
     */
    void Close();

    /// Number of entries written so far (PAX headers not counted)
    std::size_t entry_count() const { return entry_count_; }

private:
    std::ostream& out_;
    uint64_t remaining_{0};   ///< Body bytes still owed for the current entry
    uint64_t written_{0};     ///< Body bytes written for the current entry
    std::size_t entry_count_{0};
    bool closed_{false};

    void FinishEntry();
    void WritePaxHeader(const std::string& name);
    void WriteRawHeader(const std::string& name, const std::string& prefix,
                        uint64_t size, uint32_t mode, char type_flag);
    void WriteBlock(const char* block);
    void Pad(uint64_t written);
};

} // namespace utils
} // namespace eggshell
