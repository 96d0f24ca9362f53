#include "appstage/config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

namespace appstage {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Thrown internally for type errors; converted into ConfigParseResult.error
struct FieldError {
    std::string message;
};

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    if (!j[key].is_string()) {
        throw FieldError{key + " must be a string"};
    }
    return j[key].get<std::string>();
}

std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    if (!j[key].is_boolean()) {
        throw FieldError{key + " must be a boolean"};
    }
    return j[key].get<bool>();
}

// Accepts a single string or an array of strings
std::vector<std::string> get_string_list(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (!j.contains(key) || j[key].is_null()) {
        return result;
    }
    const auto& value = j[key];
    if (value.is_string()) {
        result.push_back(value.get<std::string>());
        return result;
    }
    if (!value.is_array()) {
        throw FieldError{key + " must be a string or an array of strings"};
    }
    for (const auto& elem : value) {
        if (!elem.is_string()) {
            throw FieldError{key + " must only contain strings"};
        }
        result.push_back(elem.get<std::string>());
    }
    return result;
}

// Targets may be "a,b", ["a", "b"] or ["a,b"]
std::vector<std::string> get_target_list(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    for (const auto& item : get_string_list(j, key)) {
        for (auto& part : split_list(item)) {
            result.push_back(std::move(part));
        }
    }
    return result;
}

std::optional<ArchiveOptions> get_archive_options(const nlohmann::json& j) {
    if (!j.contains("asar") || j["asar"].is_null()) {
        return std::nullopt;
    }
    const auto& value = j["asar"];
    if (value.is_boolean()) {
        if (value.get<bool>()) return ArchiveOptions{};
        return std::nullopt;
    }
    if (!value.is_object()) {
        throw FieldError{"asar must be a boolean or an object"};
    }

    ArchiveOptions options;
    options.unpack = get_string_list(value, "unpack");
    options.unpack_dirs = get_string_list(value, "unpack_dir");
    if (value.contains("compression_level")) {
        if (!value["compression_level"].is_number_integer()) {
            throw FieldError{"asar.compression_level must be an integer"};
        }
        int level = value["compression_level"].get<int>();
        if (level < -1 || level > 9) {
            throw FieldError{"asar.compression_level must be between -1 and 9"};
        }
        options.compression_level = level;
    }
    return options;
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

const std::vector<std::string>& supported_platforms() {
    static const std::vector<std::string> platforms = {"darwin", "linux", "mas", "win32"};
    return platforms;
}

const std::vector<std::string>& supported_archs() {
    static const std::vector<std::string> archs = {"ia32", "x64", "armv7l", "arm64", "mips64el"};
    return archs;
}

ConfigParseResult parse_packaging_config(const std::string& json_str,
                                         const std::string& source_path) {
    ConfigParseResult result;
    std::string where = source_path.empty() ? "config" : source_path;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = where + ": invalid JSON: " + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = where + ": JSON must be an object";
        return result;
    }

    static const std::vector<std::string> known_keys = {
        "name", "executable_name", "platform", "arch", "runtime_version", "dir", "out",
        "tmpdir", "temp_root", "prune", "asar", "deref_symlinks", "junk", "ignore",
        "extra_resource", "after_copy", "after_prune",
    };
    for (auto& [key, value] : j.items()) {
        (void)value;
        if (!contains(known_keys, key)) {
            result.warnings.push_back(where + ": unknown key '" + key + "' ignored");
        }
    }

    PackagingConfig& config = result.config;
    try {
        if (auto v = get_string(j, "name")) config.name = trim(*v);
        if (auto v = get_string(j, "executable_name")) config.executable_name = trim(*v);
        if (auto v = get_string(j, "runtime_version")) config.runtime_version = trim(*v);
        if (auto v = get_string(j, "dir")) config.dir = *v;
        if (auto v = get_string(j, "out")) config.out = *v;
        if (auto v = get_string(j, "temp_root")) config.temp_root = *v;

        if (auto v = get_bool(j, "tmpdir")) config.tmpdir = *v;
        if (auto v = get_bool(j, "prune")) config.prune = *v;
        if (auto v = get_bool(j, "deref_symlinks")) config.deref_symlinks = *v;
        if (auto v = get_bool(j, "junk")) config.junk = *v;

        config.archive = get_archive_options(j);
        config.ignore = get_string_list(j, "ignore");
        config.extra_resources = get_string_list(j, "extra_resource");

        for (const auto& command : get_string_list(j, "after_copy")) {
            config.after_copy.push_back(make_command_hook(command));
        }
        for (const auto& command : get_string_list(j, "after_prune")) {
            config.after_prune.push_back(make_command_hook(command));
        }

        result.platforms = get_target_list(j, "platform");
        result.archs = get_target_list(j, "arch");
    } catch (const FieldError& e) {
        result.error = where + ": " + e.message;
        return result;
    }

    if (!result.platforms.empty()) config.platform = result.platforms.front();
    if (!result.archs.empty()) config.arch = result.archs.front();

    result.ok = true;
    return result;
}

ConfigParseResult load_packaging_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.error = "failed to read config file: " + path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_packaging_config(ss.str(), path);
}

std::vector<PackagingConfig> expand_targets(const PackagingConfig& base,
                                            const std::vector<std::string>& platforms,
                                            const std::vector<std::string>& archs) {
    std::vector<PackagingConfig> targets;
    for (const auto& platform : platforms) {
        for (const auto& arch : archs) {
            PackagingConfig target = base;
            target.platform = platform;
            target.arch = arch;
            targets.push_back(std::move(target));
        }
    }
    return targets;
}

Result<void> validate_packaging_config(const PackagingConfig& config) {
    auto invalid = [](const std::string& message) {
        return Result<void>::err(Error(ErrorCode::CONFIG_INVALID, message));
    };

    if (config.name.empty()) {
        return invalid("name is required");
    }
    if (config.dir.empty()) {
        return invalid("source directory is required");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(config.dir, ec)) {
        return invalid("source directory does not exist: " + config.dir);
    }
    if (!contains(supported_platforms(), config.platform)) {
        return invalid("unsupported platform: " + config.platform);
    }
    if (!contains(supported_archs(), config.arch)) {
        return invalid("unsupported arch: " + config.arch);
    }
    if (config.platform == "darwin" || config.platform == "mas") {
        if (config.arch == "ia32" || config.arch == "armv7l" || config.arch == "mips64el") {
            return invalid("unsupported platform/arch combination: " +
                           config.platform + "/" + config.arch);
        }
    }
    if (config.tmpdir && config.temp_root.empty()) {
        return invalid("temp_root is required when staging in a temporary directory");
    }
    return Result<void>::ok();
}

} // namespace appstage
