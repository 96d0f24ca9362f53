#include "appstage/glob.hpp"

#include <sstream>

namespace appstage {

namespace {

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        if (!current.empty()) parts.push_back(current);
    }
    return parts;
}

// Wildcard match within a single segment
bool segment_match(const std::string& pat, size_t pi, const std::string& str, size_t si) {
    while (pi < pat.size()) {
        char p = pat[pi];
        if (p == '*') {
            // Collapse runs of '*'
            while (pi < pat.size() && pat[pi] == '*') ++pi;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); ++k) {
                if (segment_match(pat, pi, str, k)) return true;
            }
            return false;
        }
        if (si >= str.size()) return false;
        if (p != '?' && p != str[si]) return false;
        ++pi;
        ++si;
    }
    return si == str.size();
}

bool segments_match(const std::vector<std::string>& pat, size_t pi,
                    const std::vector<std::string>& path, size_t si) {
    if (pi == pat.size()) return si == path.size();

    if (pat[pi] == "**") {
        for (size_t k = si; k <= path.size(); ++k) {
            if (segments_match(pat, pi + 1, path, k)) return true;
        }
        return false;
    }

    if (si == path.size()) return false;
    if (!segment_match(pat[pi], 0, path[si], 0)) return false;
    return segments_match(pat, pi + 1, path, si + 1);
}

bool match_expanded(const std::string& pattern, const std::string& path) {
    auto path_segments = split(path, '/');

    if (pattern.find('/') == std::string::npos) {
        if (path_segments.empty()) return false;
        return segment_match(pattern, 0, path_segments.back(), 0);
    }

    return segments_match(split(pattern, '/'), 0, path_segments, 0);
}

} // namespace

std::vector<std::string> expand_braces(const std::string& pattern) {
    size_t open = pattern.find('{');
    if (open == std::string::npos) return {pattern};

    // Find the matching close brace, honoring nesting
    int depth = 0;
    size_t close = std::string::npos;
    std::vector<size_t> commas;
    for (size_t i = open; i < pattern.size(); ++i) {
        if (pattern[i] == '{') {
            ++depth;
        } else if (pattern[i] == '}') {
            if (--depth == 0) {
                close = i;
                break;
            }
        } else if (pattern[i] == ',' && depth == 1) {
            commas.push_back(i);
        }
    }
    if (close == std::string::npos) return {pattern};

    std::string prefix = pattern.substr(0, open);
    std::string suffix = pattern.substr(close + 1);

    std::vector<std::string> alternatives;
    size_t start = open + 1;
    for (size_t comma : commas) {
        alternatives.push_back(pattern.substr(start, comma - start));
        start = comma + 1;
    }
    alternatives.push_back(pattern.substr(start, close - start));

    std::vector<std::string> result;
    for (const auto& alt : alternatives) {
        for (auto& expanded : expand_braces(prefix + alt + suffix)) {
            result.push_back(std::move(expanded));
        }
    }
    return result;
}

bool glob_match(const std::string& pattern, const std::string& path) {
    for (const auto& expanded : expand_braces(pattern)) {
        if (match_expanded(expanded, path)) return true;
    }
    return false;
}

} // namespace appstage
