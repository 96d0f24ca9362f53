#pragma once

#include "appstage/types.hpp"

#include <string>

namespace appstage {

// ============================================================================
// Well-known names
// ============================================================================

inline constexpr const char* RESOURCES_DIR_NAME = "resources";
inline constexpr const char* APP_DIR_NAME = "app";
inline constexpr const char* ARCHIVE_FILENAME = "app.asar";
inline constexpr const char* TEMP_DIR_NAME = "appstage";

// ============================================================================
// Staging Context
// ============================================================================

struct StagingContext {
    std::string template_path;      // Consumed by the pipeline
    std::string staging_path;
    std::string final_path;
    std::string resources_dir;      // staging_path/resources
    std::string resources_app_dir;  // resources_dir/app
    std::string archive_path;       // resources_dir/app.asar
};

// ============================================================================
// Path Planning
// ============================================================================
//
// Pure functions: no filesystem access, no errors. Inputs are assumed to be
// validated by the caller.

// Make an app name safe to use as a single path component
std::string sanitize_basename(const std::string& name);

// <sanitized name>-<platform>-<arch>
std::string final_basename(const PackagingConfig& config);

// <out>/<final_basename>
std::string final_path(const PackagingConfig& config);

// <temp_root>/appstage
std::string base_temp_dir(const PackagingConfig& config);

// final_path when tmpdir is off, otherwise
// <base_temp_dir>/<platform>-<arch>/<final_basename>
std::string staging_path(const PackagingConfig& config);

StagingContext plan_staging(const PackagingConfig& config, const std::string& template_path);

} // namespace appstage
