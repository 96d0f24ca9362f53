#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace appstage {

// ============================================================================
// Platform Detection
// ============================================================================

// Platform identifier of the running host, in packager terms:
// "darwin", "linux", "win32", or "unknown"
std::string get_host_platform();

// Architecture identifier of the running host: "x64", "ia32", "arm64",
// "armv7l", or "unknown"
std::string get_host_arch();

// ============================================================================
// Filesystem Operations
// ============================================================================

struct FsResult {
    bool ok = false;
    std::string error;
};

// Move a file or directory. Tries rename first and falls back to
// copy + remove when source and destination are on different filesystems.
// With overwrite, an existing destination is removed first; without it,
// an existing destination is an error. Parent directories are created.
FsResult move_path(const std::string& src, const std::string& dst, bool overwrite);

// Called with the absolute source path of every entry before it is copied.
// Returning false skips the entry (and, for directories, its subtree).
using CopyFilter = std::function<bool(const std::string&)>;

struct CopyOptions {
    CopyFilter filter;              // Empty filter accepts everything
    bool dereference = false;       // Follow symlinks instead of recreating them
    bool overwrite = true;
};

// Recursively copy src to dst, preserving file modes. src may be a file,
// a directory or a symlink. Exceptions thrown by the filter are reported
// as errors.
FsResult copy_tree(const std::string& src, const std::string& dst, const CopyOptions& options);

// Remove a file or directory tree. A missing path is not an error;
// any other failure is.
FsResult remove_if_exists(const std::string& path);

// Write content atomically using temp file + fsync + rename + fsync(dir)
FsResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);

std::string get_filename(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// $TMPDIR when set, otherwise the system temp directory
std::string get_temp_directory();

// Generate a UUID string
std::string generate_uuid();

} // namespace appstage
