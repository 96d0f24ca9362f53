#pragma once

#include "appstage/hooks.hpp"

#include <optional>
#include <string>
#include <vector>

namespace appstage {

// ============================================================================
// Archive Options
// ============================================================================

// Passed through to the Archiver untouched; the pipeline only checks
// whether archiving is enabled at all.
struct ArchiveOptions {
    int compression_level = -1;                 // zlib level, -1 = default
    std::vector<std::string> unpack;            // globs on relative file paths
    std::vector<std::string> unpack_dirs;       // globs on relative dir paths
};

// ============================================================================
// Packaging Configuration
// ============================================================================

struct PackagingConfig {
    std::string name;                   // Application name
    std::string executable_name;        // Defaults to name when empty
    std::string platform;               // darwin, mas, linux, win32
    std::string arch;                   // x64, ia32, arm64, armv7l, ...
    std::string runtime_version;

    std::string dir;                    // Source application directory
    std::string out;                    // Output root ("." when empty)
    std::string temp_root;              // Root for temp staging directories; required when tmpdir

    bool tmpdir = true;                 // Stage under temp_root, then relocate
    bool prune = true;
    bool deref_symlinks = true;
    bool junk = true;                   // Skip OS junk files (.DS_Store, Thumbs.db, ...)
    std::optional<ArchiveOptions> archive;

    std::vector<std::string> ignore;            // Regex patterns on app paths
    std::vector<std::string> extra_resources;   // Copied into resources/

    std::vector<Hook> after_copy;
    std::vector<Hook> after_prune;
};

// Executable name with the fallback to the app name applied
inline std::string effective_executable_name(const PackagingConfig& config) {
    return config.executable_name.empty() ? config.name : config.executable_name;
}

} // namespace appstage
