#pragma once

#include <string>
#include <vector>

namespace appstage {

// Expand brace alternatives: "*.{node,dll}" -> {"*.node", "*.dll"}
std::vector<std::string> expand_braces(const std::string& pattern);

// Match a forward-slash relative path against a glob pattern.
//   *   any run of characters within one path segment
//   ?   one character within a segment
//   **  zero or more whole segments
//   {a,b} alternatives
// A pattern without '/' is matched against the last path segment only.
bool glob_match(const std::string& pattern, const std::string& path);

} // namespace appstage
