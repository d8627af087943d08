// Shared helpers for the eggshell test suite: a minimal tar reader,
// temporary directories and string predicates.
#pragma once

#include <gtest/gtest.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace eggshell_test {

/// Lowercase hex digits only; @p length 0 accepts any non-zero length
inline bool IsHexString(const std::string& str, std::size_t length = 0) {
    if (str.empty() || (length != 0 && str.size() != length)) {
        return false;
    }
    for (char c : str) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

inline bool EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

struct TarEntry {
    std::string name;
    std::string contents;
    char type{'0'};
};

inline std::string Field(const char* header, std::size_t offset, std::size_t width) {
    return std::string(header + offset, strnlen(header + offset, width));
}

inline unsigned long long Octal(const char* header, std::size_t offset, std::size_t width) {
    return std::strtoull(std::string(header + offset, width).c_str(), nullptr, 8);
}

inline unsigned long long Checksum(const char* header) {
    unsigned long long sum = 0;
    for (std::size_t i = 0; i < 512; ++i) {
        bool in_field = i >= 148 && i < 156;
        sum += in_field ? static_cast<unsigned char>(' ') : static_cast<unsigned char>(header[i]);
    }
    return sum;
}

// Value of the "path" record in a PAX extended header body
inline std::string PaxPath(const std::string& body) {
    std::size_t pos = 0;
    while (pos < body.size()) {
        std::size_t space = body.find(' ', pos);
        if (space == std::string::npos) {
            break;
        }
        std::size_t length = std::stoul(body.substr(pos, space - pos));
        std::string record = body.substr(space + 1, length - (space - pos) - 2);
        if (record.rfind("path=", 0) == 0) {
            return record.substr(5);
        }
        pos += length;
    }
    return {};
}

// Parses ustar archives written by TarWriter; fails the test on bad checksums
inline std::vector<TarEntry> ReadTar(const std::string& archive) {
    std::vector<TarEntry> entries;
    std::string pax_path;
    std::size_t pos = 0;

    while (pos + 512 <= archive.size()) {
        const char* header = archive.data() + pos;
        bool zero = true;
        for (std::size_t i = 0; i < 512 && zero; ++i) {
            zero = header[i] == '\0';
        }
        if (zero) {
            break;
        }

        EXPECT_EQ(Octal(header, 148, 7), Checksum(header));
        EXPECT_EQ(Field(header, 257, 6), "ustar");

        std::string name = Field(header, 0, 100);
        std::string prefix = Field(header, 345, 155);
        auto size = static_cast<std::size_t>(Octal(header, 124, 12));
        char type = header[156];

        pos += 512;
        std::string body = archive.substr(pos, size);
        pos += (size + 511) / 512 * 512;

        if (type == 'x') {
            pax_path = PaxPath(body);
            continue;
        }

        TarEntry entry;
        entry.name = prefix.empty() ? name : prefix + "/" + name;
        if (!pax_path.empty()) {
            entry.name = pax_path;
            pax_path.clear();
        }
        entry.contents = body;
        entry.type = type;
        entries.push_back(entry);
    }
    return entries;
}

class TempDir {
public:
    TempDir() {
        std::string pattern =
            (std::filesystem::temp_directory_path() / "eggshell-test-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            ADD_FAILURE() << "mkdtemp failed";
        }
        path_ = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path Write(const std::string& relative, const std::string& contents) const {
        std::filesystem::path file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << contents;
        return file;
    }

    std::filesystem::path WriteScript(const std::string& name, const std::string& body) const {
        auto file = Write(name, "#!/bin/sh\n" + body);
        std::filesystem::permissions(file, std::filesystem::perms::owner_all);
        return file;
    }

private:
    std::filesystem::path path_;
};

} // namespace eggshell_test
