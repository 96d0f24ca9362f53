#pragma once

#include "appstage/platform.hpp"
#include "appstage/types.hpp"

#include <string>
#include <vector>

namespace appstage {

// ============================================================================
// Resource Filter
// ============================================================================
//
// A predicate over source paths deciding what is copied into resources/app.
// The pipeline only calls it; which files belong in the app is the
// caller's policy.

using ResourceFilter = CopyFilter;

// Patterns always appended to the user's ignore list
const std::vector<std::string>& default_ignore_patterns();

// True if the basename is an OS junk file (.DS_Store, Thumbs.db, ...)
bool is_junk_file(const std::string& basename);

struct IgnoreFilterResult {
    bool ok = false;
    std::string error;
    ResourceFilter filter;
};

// Build the ignore-pattern filter for a config.
//
// Each pattern is an ECMAScript regex searched in the path relative to
// config.dir, written with a leading '/' ("/node_modules/.bin/foo").
// Paths listed in out_paths (the generated output directories) are always
// excluded so packaging into a directory inside the app does not recurse.
IgnoreFilterResult make_ignore_filter(const PackagingConfig& config,
                                      const std::vector<std::string>& out_paths = {});

} // namespace appstage
