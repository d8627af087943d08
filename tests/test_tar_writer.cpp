#include <gtest/gtest.h>
#include <eggshell/core/errors.hpp>
#include <eggshell/utils/tar_writer.hpp>

#include "test_support.hpp"

#include <sstream>

using namespace eggshell::utils;
using eggshell_test::ReadTar;

TEST(TarWriter, EmptyArchiveIsTwoZeroBlocks) {
    std::ostringstream out;
    TarWriter tar(out);
    tar.Close();
    EXPECT_EQ(out.str(), std::string(2 * kTarBlockSize, '\0'));
    EXPECT_EQ(tar.entry_count(), 0u);
}

TEST(TarWriter, EntriesArePaddedToBlocks) {
    std::ostringstream out;
    TarWriter tar(out);
    tar.AddFile("a.txt", "hello");
    tar.AddFile("b.txt", std::string(513, 'x'));
    tar.Close();

    // header + 1 block, header + 2 blocks, 2 end blocks
    EXPECT_EQ(out.str().size(), (2 + 3 + 2) * kTarBlockSize);
    auto entries = ReadTar(out.str());
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "a.txt");
    EXPECT_EQ(entries[0].contents, "hello");
    EXPECT_EQ(entries[1].contents.size(), 513u);
    EXPECT_EQ(tar.entry_count(), 2u);
}

TEST(TarWriter, EmptyFileHasHeaderOnly) {
    std::ostringstream out;
    TarWriter tar(out);
    tar.AddFile("empty", "");
    tar.Close();
    EXPECT_EQ(out.str().size(), 3 * kTarBlockSize);
    auto entries = ReadTar(out.str());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].contents.empty());
}

TEST(TarWriter, LongNameUsesPrefixField) {
    std::string dir(120, 'd');
    std::string name = dir + "/file.txt";
    std::ostringstream out;
    TarWriter tar(out);
    tar.AddFile(name, "x");
    tar.Close();

    auto entries = ReadTar(out.str());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, name);
    EXPECT_EQ(tar.entry_count(), 1u);
}

TEST(TarWriter, UnsplittableNameUsesPaxHeader) {
    std::string name = std::string(300, 'n') + ".txt";
    std::ostringstream out;
    TarWriter tar(out);
    tar.AddFile(name, "payload");
    tar.Close();

    auto entries = ReadTar(out.str());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, name);
    EXPECT_EQ(entries[0].contents, "payload");
    EXPECT_EQ(tar.entry_count(), 1u);
}

TEST(TarWriter, StreamedBodyMustMatchAnnouncedSize) {
    std::ostringstream out;
    TarWriter tar(out);
    tar.WriteHeader("f", 4);
    tar.WriteData("ab");
    EXPECT_THROW(tar.WriteData("abc"), eggshell::core::IoError);
}

TEST(TarWriter, ShortBodyIsRejected) {
    std::ostringstream out;
    TarWriter tar(out);
    tar.WriteHeader("f", 4);
    tar.WriteData("ab");
    EXPECT_THROW(tar.Close(), eggshell::core::IoError);
}

TEST(TarWriter, WritesAfterCloseAreRejected) {
    std::ostringstream out;
    TarWriter tar(out);
    tar.Close();
    EXPECT_THROW(tar.AddFile("late", "x"), eggshell::core::IoError);
}

TEST(TarWriter, EmptyNameIsRejected) {
    std::ostringstream out;
    TarWriter tar(out);
    EXPECT_THROW(tar.AddFile("", "x"), eggshell::core::IoError);
}

TEST(TarWriter, FailedStreamRaisesIoError) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    TarWriter tar(out);
    EXPECT_THROW(tar.AddFile("a", "b"), eggshell::core::IoError);
}
