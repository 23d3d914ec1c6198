/**
 * @file test_tar_archive.cpp
 * @brief Unit tests for TarArchive
 *
 * @date 2026
 */

#include "sandkit/utils/tar_archive.hpp"

#include <gtest/gtest.h>

#include <archive.h>
#include <archive_entry.h>

using sandkit::utils::ArchiveError;
using sandkit::utils::TarArchive;

namespace {

la_ssize_t AppendToString(struct archive*, void* client, const void* buffer, size_t length) {
    static_cast<std::string*>(client)->append(static_cast<const char*>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

/// Tar with a single directory entry, as `docker cp` produces for a directory path
std::string DirectoryArchive(const std::string& name) {
    std::string out;
    struct archive* writer = archive_write_new();
    archive_write_set_format_pax_restricted(writer);
    archive_write_open(writer, &out, nullptr, &AppendToString, nullptr);

    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, name.c_str());
    archive_entry_set_filetype(entry, AE_IFDIR);
    archive_entry_set_perm(entry, 0755);
    archive_write_header(writer, entry);
    archive_entry_free(entry);

    archive_write_close(writer);
    archive_write_free(writer);
    return out;
}

} // anonymous namespace

TEST(TarArchiveTest, PackThenExtractPreservesBytes) {
    std::string content("line1\n\0\x01\xfe\xff tail", 15);
    auto tar = TarArchive::PackSingleFile("c.txt", content, 0600);

    auto file = TarArchive::ExtractSingleFile(tar);
    EXPECT_EQ(file.name, "c.txt");
    EXPECT_EQ(file.content, content);
    EXPECT_EQ(file.mode, 0600);
}

TEST(TarArchiveTest, EmptyFile) {
    auto file = TarArchive::ExtractSingleFile(TarArchive::PackSingleFile("empty", ""));
    EXPECT_EQ(file.content, "");
}

TEST(TarArchiveTest, LargeFileSpansManyBlocks) {
    std::string content(3 * 1024 * 1024 + 17, 'z');
    auto file = TarArchive::ExtractSingleFile(TarArchive::PackSingleFile("big.bin", content));
    EXPECT_EQ(file.content.size(), content.size());
    EXPECT_EQ(file.content, content);
}

TEST(TarArchiveTest, EmptyNameRejected) {
    EXPECT_THROW(TarArchive::PackSingleFile("", "x"), ArchiveError);
}

TEST(TarArchiveTest, DirectoryEntryRejected) {
    try {
        TarArchive::ExtractSingleFile(DirectoryArchive("output"));
        FAIL() << "Expected ArchiveError";
    } catch (const ArchiveError& e) {
        EXPECT_NE(std::string(e.what()).find("not a regular file"), std::string::npos);
    }
}

TEST(TarArchiveTest, GarbageRejected) {
    EXPECT_THROW(TarArchive::ExtractSingleFile(std::string(1024, '\x07')), ArchiveError);
    EXPECT_THROW(TarArchive::ExtractSingleFile(""), ArchiveError);
}
