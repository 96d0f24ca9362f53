#include "appstage/path_planner.hpp"
#include "appstage/platform.hpp"

#include <cctype>

namespace appstage {

namespace {

bool is_illegal_filename_char(unsigned char c) {
    if (c < 0x20 || c == 0x7f) return true;
    switch (c) {
        case '/': case '\\': case '?': case '<': case '>':
        case ':': case '*': case '|': case '"':
            return true;
        default:
            return false;
    }
}

} // namespace

std::string sanitize_basename(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char ch : name) {
        if (!is_illegal_filename_char(static_cast<unsigned char>(ch))) {
            result += ch;
        }
    }

    // Windows rejects trailing dots and spaces
    while (!result.empty() && (result.back() == '.' || result.back() == ' ')) {
        result.pop_back();
    }

    if (result == "." || result == "..") {
        result.clear();
    }
    return result;
}

std::string final_basename(const PackagingConfig& config) {
    return sanitize_basename(config.name) + "-" + config.platform + "-" + config.arch;
}

std::string final_path(const PackagingConfig& config) {
    std::string out = config.out.empty() ? "." : config.out;
    return join_path(out, final_basename(config));
}

std::string base_temp_dir(const PackagingConfig& config) {
    return join_path(config.temp_root, TEMP_DIR_NAME);
}

std::string staging_path(const PackagingConfig& config) {
    if (!config.tmpdir) {
        return final_path(config);
    }
    std::string target = config.platform + "-" + config.arch;
    return join_path(join_path(base_temp_dir(config), target), final_basename(config));
}

StagingContext plan_staging(const PackagingConfig& config, const std::string& template_path) {
    StagingContext ctx;
    ctx.template_path = template_path;
    ctx.staging_path = staging_path(config);
    ctx.final_path = final_path(config);
    ctx.resources_dir = join_path(ctx.staging_path, RESOURCES_DIR_NAME);
    ctx.resources_app_dir = join_path(ctx.resources_dir, APP_DIR_NAME);
    ctx.archive_path = join_path(ctx.resources_dir, ARCHIVE_FILENAME);
    return ctx;
}

} // namespace appstage
