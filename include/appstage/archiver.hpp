#pragma once

#include "appstage/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace appstage {

// ============================================================================
// Deterministic Tar+Gzip Archive
// ============================================================================
//
//   - Entry ordering: lexicographic by full path, directories before files
//   - Metadata: uid=0, gid=0, uname="", gname="", mtime=0
//   - Permissions: dirs=0755, files=0644 (or 0755 if executable)
//   - Gzip: mtime=0, no filename, OS=255
//   - Symlinks are stored as link entries and must stay inside the root

enum class TarEntryType {
    RegularFile,
    Directory,
    Symlink,
};

// Largest member the 11-digit octal ustar size field can describe
constexpr uint64_t MAX_TAR_MEMBER_SIZE = (1ull << 33) - 1;

struct TarEntry {
    std::string path;           // Relative path within archive
    TarEntryType type = TarEntryType::RegularFile;
    std::vector<uint8_t> data;  // File content (empty for directories)
    std::string link_target;    // Symlinks only
    bool executable = false;
};

struct PackResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> archive_data;
};

PackResult create_deterministic_archive(const std::vector<TarEntry>& entries,
                                        int compression_level = -1);

struct CollectResult {
    bool ok = false;
    std::string error;
    std::vector<TarEntry> entries;
    std::vector<std::string> unpacked;  // Relative paths left outside the archive
};

// Collect entries from a directory, honoring the unpack patterns in options.
// Entries are returned in traversal order; the archive sorts them.
CollectResult collect_directory_entries(const std::string& dir_path,
                                        const ArchiveOptions& options);

// ============================================================================
// Archiver (boundary to the compress-directory collaborator)
// ============================================================================

struct ArchiveResult {
    bool ok = false;
    std::string error;
    size_t entry_count = 0;
    std::vector<std::string> unpacked;
};

/**
 * @brief Compresses a directory into a single archive file
 *
 * Contract:
 * - src_dir must exist and be readable
 * - dest must not exist
 * - on success exactly one archive exists at dest
 * - on failure dest does not exist
 *
 * The source directory is never modified by the archiver.
 */
class Archiver {
public:
    virtual ~Archiver() = default;

    virtual ArchiveResult create_archive(const std::string& src_dir,
                                         const std::string& dest,
                                         const ArchiveOptions& options) = 0;
};

// Writes a deterministic .tar.gz. Files matched by the unpack patterns are
// copied to "<dest>.unpacked/" instead of being stored.
class TarGzArchiver : public Archiver {
public:
    ArchiveResult create_archive(const std::string& src_dir,
                                 const std::string& dest,
                                 const ArchiveOptions& options) override;
};

} // namespace appstage
