#include "appstage/resource_filter.hpp"
#include "appstage/path_planner.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <regex>

namespace fs = std::filesystem;

namespace appstage {

namespace {

const std::vector<std::regex>& junk_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex("^npm-debug\\.log$"),
        std::regex("^\\..*\\.swp$"),
        std::regex("^\\.DS_Store$"),
        std::regex("^\\.AppleDouble$"),
        std::regex("^\\.LSOverride$"),
        std::regex("^Icon\\r$"),
        std::regex("^\\._.*"),
        std::regex("^\\.Spotlight-V100$"),
        std::regex("\\.Trashes"),
        std::regex("^__MACOSX$"),
        std::regex("~$"),
        std::regex("^Thumbs\\.db$"),
        std::regex("^ehthumbs\\.db$"),
        std::regex("^Desktop\\.ini$"),
        std::regex("@eaDir$"),
    };
    return patterns;
}

fs::path absolute_normal(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) abs = fs::path(path);
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

struct FilterState {
    fs::path source_root;
    std::vector<fs::path> out_paths;
    std::vector<std::regex> patterns;
    bool junk = true;
};

} // namespace

const std::vector<std::string>& default_ignore_patterns() {
    static const std::vector<std::string> patterns = {
        "/package-lock\\.json$",
        "/yarn\\.lock$",
        "/\\.git($|/)",
        "/node_modules/\\.bin($|/)",
        "\\.o(bj)?$",
    };
    return patterns;
}

bool is_junk_file(const std::string& basename) {
    for (const auto& pattern : junk_patterns()) {
        if (std::regex_search(basename, pattern)) return true;
    }
    return false;
}

IgnoreFilterResult make_ignore_filter(const PackagingConfig& config,
                                      const std::vector<std::string>& out_paths) {
    IgnoreFilterResult result;

    auto state = std::make_shared<FilterState>();
    state->source_root = absolute_normal(config.dir);
    state->junk = config.junk;

    std::vector<std::string> patterns = config.ignore;
    const auto& defaults = default_ignore_patterns();
    patterns.insert(patterns.end(), defaults.begin(), defaults.end());

    for (const auto& pattern : patterns) {
        try {
            state->patterns.emplace_back(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            result.error = "invalid ignore pattern '" + pattern + "': " + e.what();
            return result;
        }
    }

    state->out_paths.push_back(absolute_normal(final_path(config)));
    for (const auto& out : out_paths) {
        state->out_paths.push_back(absolute_normal(out));
    }

    result.filter = [state](const std::string& file) {
        fs::path abs = absolute_normal(file);

        if (std::find(state->out_paths.begin(), state->out_paths.end(), abs) != state->out_paths.end()) {
            return false;
        }

        std::string rel = to_portable_path(abs.lexically_relative(state->source_root).string());
        if (rel == ".") {
            return true;
        }

        if (state->junk && is_junk_file(abs.filename().string())) {
            return false;
        }

        std::string name = "/" + rel;
        for (const auto& pattern : state->patterns) {
            if (std::regex_search(name, pattern)) {
                return false;
            }
        }
        return true;
    };

    result.ok = true;
    return result;
}

} // namespace appstage
