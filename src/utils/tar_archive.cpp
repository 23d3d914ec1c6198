/**
 * @file tar_archive.cpp
 * @brief libarchive-backed single-file tar packing and extraction
 *
 * @date 2026
 */

#include "sandkit/utils/tar_archive.hpp"

#include <spdlog/spdlog.h>

#include <archive.h>
#include <archive_entry.h>

#include <ctime>
#include <memory>

namespace sandkit {
namespace utils {

ArchiveError::ArchiveError(struct archive* source)
    : std::runtime_error(archive_error_string(source) ? archive_error_string(source)
                                                      : "unknown archive error") {
}

ArchiveError::ArchiveError(const std::string& message)
    : std::runtime_error(message) {
}

namespace {

struct WriterDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

struct ReaderDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

struct EntryDeleter {
    void operator()(archive_entry* e) const { archive_entry_free(e); }
};

using ArchiveWriter = std::unique_ptr<struct archive, WriterDeleter>;
using ArchiveReader = std::unique_ptr<struct archive, ReaderDeleter>;
using ArchiveEntry = std::unique_ptr<archive_entry, EntryDeleter>;

// libarchive write callbacks appending into a std::string
int OpenCallback(struct archive*, void*) {
    return ARCHIVE_OK;
}

la_ssize_t WriteCallback(struct archive*, void* client_data, const void* buffer, size_t length) {
    auto* sink = static_cast<std::string*>(client_data);
    sink->append(static_cast<const char*>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

int CloseCallback(struct archive*, void*) {
    return ARCHIVE_OK;
}

} // anonymous namespace

// ============================================================================
// PACKING
// ============================================================================

std::string TarArchive::PackSingleFile(const std::string& name,
                                       const std::string& content,
                                       int mode) {
    if (name.empty()) {
        throw ArchiveError("archive entry name must not be empty");
    }

    std::string output;
    ArchiveWriter writer(archive_write_new());
    if (!writer) {
        throw ArchiveError("archive_write_new failed");
    }

    if (archive_write_set_format_pax_restricted(writer.get()) != ARCHIVE_OK) {
        throw ArchiveError(writer.get());
    }
    // Single small entry; no need for tar's 10 KiB record padding
    archive_write_set_bytes_per_block(writer.get(), 0);

    if (archive_write_open(writer.get(), &output, OpenCallback, WriteCallback,
                           CloseCallback) != ARCHIVE_OK) {
        throw ArchiveError(writer.get());
    }

    ArchiveEntry entry(archive_entry_new());
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(content.size()));
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), static_cast<mode_t>(mode));
    archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);

    if (archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK) {
        throw ArchiveError(writer.get());
    }

    if (!content.empty()) {
        la_ssize_t written = archive_write_data(writer.get(), content.data(), content.size());
        if (written < 0 || static_cast<std::size_t>(written) != content.size()) {
            throw ArchiveError(writer.get());
        }
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        throw ArchiveError(writer.get());
    }

    spdlog::debug("Packed {} ({} bytes) into {} byte tar", name, content.size(), output.size());
    return output;
}

// ============================================================================
// EXTRACTION
// ============================================================================

ArchivedFile TarArchive::ExtractSingleFile(const std::string& tar_data) {
    ArchiveReader reader(archive_read_new());
    if (!reader) {
        throw ArchiveError("archive_read_new failed");
    }

    archive_read_support_format_tar(reader.get());

    if (archive_read_open_memory(reader.get(), tar_data.data(), tar_data.size()) != ARCHIVE_OK) {
        throw ArchiveError(reader.get());
    }

    archive_entry* entry = nullptr;
    int rv = archive_read_next_header(reader.get(), &entry);
    if (rv == ARCHIVE_EOF) {
        throw ArchiveError("archive contains no entries");
    }
    if (rv != ARCHIVE_OK && rv != ARCHIVE_WARN) {
        throw ArchiveError(reader.get());
    }

    ArchivedFile file;
    file.name = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
    file.mode = static_cast<int>(archive_entry_perm(entry));

    if (archive_entry_filetype(entry) != AE_IFREG) {
        throw ArchiveError("'" + file.name + "' is not a regular file");
    }

    const void* buffer = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;

    while (true) {
        rv = archive_read_data_block(reader.get(), &buffer, &size, &offset);
        if (rv == ARCHIVE_EOF) {
            break;
        }
        if (rv != ARCHIVE_OK && rv != ARCHIVE_WARN) {
            throw ArchiveError(reader.get());
        }
        // Sparse entries may report holes through the offset
        if (static_cast<std::size_t>(offset) > file.content.size()) {
            file.content.resize(static_cast<std::size_t>(offset), '\0');
        }
        file.content.append(static_cast<const char*>(buffer), size);
    }

    return file;
}

} // namespace utils
} // namespace sandkit
