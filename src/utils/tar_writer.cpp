/**
 * @file tar_writer.cpp
 * @brief Implementation of the streaming ustar writer
 *
 * **Header Layout** (offsets in bytes):
 * ```
 *   0 name[100]      100 mode[8]      108 uid[8]       116 gid[8]
 * 124 size[12]       136 mtime[12]    148 chksum[8]    156 typeflag
 * 157 linkname[100]  257 magic[6]     263 version[2]   265 uname[32]
 * 297 gname[32]      329 devmajor[8]  337 devminor[8]  345 prefix[155]
 * ```
 * Numeric fields are zero-padded octal terminated by NUL. The checksum is the
 * byte sum of the header with the checksum field read as eight spaces.
 *
 * @date 2025
 */

#include "eggshell/utils/tar_writer.hpp"
#include "eggshell/core/errors.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace eggshell {
namespace utils {

namespace {

constexpr std::size_t kNameSize = 100;
constexpr std::size_t kPrefixSize = 155;
constexpr uint64_t kMaxOctalSize = 077777777777ULL;  // 11 octal digits

constexpr char kTypeRegular = '0';
constexpr char kTypePaxHeader = 'x';

// Write @p value as zero-padded octal filling width - 1 digits plus NUL
void WriteOctal(char* field, std::size_t width, uint64_t value) {
    field[width - 1] = '\0';
    for (std::size_t i = width - 1; i-- > 0;) {
        field[i] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

void CopyField(char* field, std::size_t width, const std::string& value) {
    std::memcpy(field, value.data(), std::min(width, value.size()));
}

// Find a '/' that splits @p name into a ustar prefix and name, or npos
std::size_t FindPrefixSplit(const std::string& name) {
    for (std::size_t pos = name.find('/'); pos != std::string::npos;
         pos = name.find('/', pos + 1)) {
        std::size_t rest = name.size() - pos - 1;
        if (pos <= kPrefixSize && rest > 0 && rest <= kNameSize) {
            return pos;
        }
    }
    return std::string::npos;
}

// PAX record "<len> <key>=<value>\n" where <len> counts the whole record
std::string MakePaxRecord(const std::string& key, const std::string& value) {
    std::string body = " " + key + "=" + value + "\n";
    std::size_t length = body.size() + 1;
    while (std::to_string(length).size() + body.size() != length) {
        length = std::to_string(length).size() + body.size();
    }
    return std::to_string(length) + body;
}

} // anonymous namespace

TarWriter::TarWriter(std::ostream& out)
    : out_(out) {
}

void TarWriter::WriteHeader(const std::string& name, uint64_t size, uint32_t mode) {
    if (closed_) {
        throw core::IoError("tar: header written after close");
    }
    if (name.empty()) {
        throw core::IoError("tar: empty entry name");
    }
    if (size > kMaxOctalSize) {
        throw core::IoError("tar: entry too large: " + name);
    }

    FinishEntry();

    if (name.size() <= kNameSize) {
        WriteRawHeader(name, "", size, mode, kTypeRegular);
    } else {
        std::size_t split = FindPrefixSplit(name);
        if (split != std::string::npos) {
            WriteRawHeader(name.substr(split + 1), name.substr(0, split),
                           size, mode, kTypeRegular);
        } else {
            WritePaxHeader(name);
            WriteRawHeader(name.substr(0, kNameSize), "", size, mode, kTypeRegular);
        }
    }

    remaining_ = size;
    written_ = 0;
    ++entry_count_;
}

void TarWriter::WriteData(const char* data, std::size_t size) {
    if (closed_) {
        throw core::IoError("tar: data written after close");
    }
    if (size > remaining_) {
        throw core::IoError("tar: write exceeds announced entry size");
    }

    out_.write(data, static_cast<std::streamsize>(size));
    if (!out_) {
        throw core::IoError("tar: failed to write entry body");
    }

    remaining_ -= size;
    written_ += size;
}

void TarWriter::AddFile(const std::string& name, const std::string& contents, uint32_t mode) {
    WriteHeader(name, contents.size(), mode);
    WriteData(contents);
}

void TarWriter::Close() {
    if (closed_) {
        return;
    }

    FinishEntry();

    std::array<char, kTarBlockSize> zero{};
    WriteBlock(zero.data());
    WriteBlock(zero.data());

    out_.flush();
    if (!out_) {
        throw core::IoError("tar: failed to flush archive");
    }
    closed_ = true;
}

void TarWriter::FinishEntry() {
    if (remaining_ != 0) {
        throw core::IoError("tar: entry body shorter than announced size");
    }
    Pad(written_);
    written_ = 0;
}

void TarWriter::WritePaxHeader(const std::string& name) {
    std::string records = MakePaxRecord("path", name);

    WriteRawHeader("PaxHeaders/" + name.substr(0, kNameSize - 11), "",
                   records.size(), 0644, kTypePaxHeader);
    out_.write(records.data(), static_cast<std::streamsize>(records.size()));
    if (!out_) {
        throw core::IoError("tar: failed to write PAX header");
    }
    Pad(records.size());
}

void TarWriter::WriteRawHeader(const std::string& name, const std::string& prefix,
                               uint64_t size, uint32_t mode, char type_flag) {
    std::array<char, kTarBlockSize> header{};

    CopyField(&header[0], kNameSize, name);
    WriteOctal(&header[100], 8, mode);
    WriteOctal(&header[108], 8, 0);            // uid
    WriteOctal(&header[116], 8, 0);            // gid
    WriteOctal(&header[124], 12, size);
    WriteOctal(&header[136], 12, 0);           // mtime
    header[156] = type_flag;
    std::memcpy(&header[257], "ustar", 6);     // magic incl. NUL
    std::memcpy(&header[263], "00", 2);        // version
    WriteOctal(&header[329], 8, 0);            // devmajor
    WriteOctal(&header[337], 8, 0);            // devminor
    CopyField(&header[345], kPrefixSize, prefix);

    std::memset(&header[148], ' ', 8);
    uint32_t checksum = 0;
    for (char c : header) {
        checksum += static_cast<unsigned char>(c);
    }
    WriteOctal(&header[148], 7, checksum);     // six digits + NUL
    header[155] = ' ';

    WriteBlock(header.data());
}

void TarWriter::WriteBlock(const char* block) {
    out_.write(block, static_cast<std::streamsize>(kTarBlockSize));
    if (!out_) {
        throw core::IoError("tar: failed to write block");
    }
}

void TarWriter::Pad(uint64_t written) {
    std::size_t tail = static_cast<std::size_t>(written % kTarBlockSize);
    if (tail == 0) {
        return;
    }
    std::array<char, kTarBlockSize> zero{};
    out_.write(zero.data(), static_cast<std::streamsize>(kTarBlockSize - tail));
    if (!out_) {
        throw core::IoError("tar: failed to write padding");
    }
}

} // namespace utils
} // namespace eggshell
