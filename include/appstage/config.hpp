#pragma once

#include "appstage/result.hpp"
#include "appstage/types.hpp"

#include <string>
#include <vector>

namespace appstage {

// ============================================================================
// Configuration File
// ============================================================================
//
// {
//   "name": "MyApp",
//   "executable_name": "myapp",
//   "platform": "linux,win32",          // string, comma list or array
//   "arch": ["x64", "arm64"],
//   "runtime_version": "1.4.3",
//   "dir": "./app",
//   "out": "./dist",
//   "tmpdir": true,
//   "temp_root": "/var/tmp",
//   "prune": true,
//   "asar": {"unpack": ["*.node"], "unpack_dir": ["native"]},   // or true/false
//   "deref_symlinks": true,
//   "junk": true,
//   "ignore": ["^/test($|/)"],
//   "extra_resource": ["./LICENSE"],
//   "after_copy": ["./scripts/stamp-version"],
//   "after_prune": []
// }

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    PackagingConfig config;              // platform/arch hold the first target
    std::vector<std::string> platforms;
    std::vector<std::string> archs;
    std::vector<std::string> warnings;
};

ConfigParseResult parse_packaging_config(const std::string& json_str,
                                         const std::string& source_path = "");

ConfigParseResult load_packaging_config(const std::string& path);

// Split "a, b,c" into {"a", "b", "c"}, dropping empty items
std::vector<std::string> split_list(const std::string& value);

const std::vector<std::string>& supported_platforms();
const std::vector<std::string>& supported_archs();

// One config per (platform, arch) combination, platform-major order
std::vector<PackagingConfig> expand_targets(const PackagingConfig& base,
                                            const std::vector<std::string>& platforms,
                                            const std::vector<std::string>& archs);

// Checks the fields the pipeline relies on: name, dir, platform, arch.
Result<void> validate_packaging_config(const PackagingConfig& config);

} // namespace appstage
