/**
 * @file tar_archive.hpp
 * @brief In-memory single-file tar archives for container file transfer
 *
 * The container filesystem is only reachable through the engine's archive
 * endpoints (`docker cp` streams tar on stdin/stdout), so file content is
 * wrapped into and unwrapped from a one-entry tar built entirely in memory.
 *
 * @date 2026
 */

#pragma once

#include <string>
#include <stdexcept>

struct archive;

namespace sandkit {
namespace utils {

/**
 * @class ArchiveError
 * @brief libarchive failure carrying the library's error string
 */
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(struct archive* source);
    explicit ArchiveError(const std::string& message);
};

/**
 * @struct ArchivedFile
 * @brief The single regular-file entry extracted from an archive
 */
struct ArchivedFile {
    std::string name;      ///< Entry path as stored in the archive
    std::string content;   ///< Raw file bytes
    int mode{0644};        ///< Permission bits
};

/**
 * @class TarArchive
 * @brief Pack and unpack one-entry tar archives
 *
 * **Usage Example**:
 * @code
 * // Upload: docker cp - <id>:/workspace/a
 * std::string tar = TarArchive::PackSingleFile("c.txt", bytes);
 *
 * // Download: docker cp <id>:/workspace/a/c.txt -
 * ArchivedFile file = TarArchive::ExtractSingleFile(stdout_bytes);
 * @endcode
 */
class TarArchive {
public:
    /**
     * @brief Build a pax tar holding exactly one regular file
     * @param name Entry name (a base name, no directories)
     * @param content File bytes
     * @param mode Permission bits
     * @return Archive bytes
     * @throws ArchiveError on libarchive failure
     */
    static std::string PackSingleFile(const std::string& name,
                                      const std::string& content,
                                      int mode = 0644);

    /**
     * @brief Extract the first entry, which must be a regular file
     * @param tar_data Archive bytes
     * @return Extracted entry
     * @throws ArchiveError if the archive is malformed, empty, or its first
     *         entry is not a regular file (e.g. a directory)
     */
    static ArchivedFile ExtractSingleFile(const std::string& tar_data);
};

} // namespace utils
} // namespace sandkit
