#include "appstage/dependency_pruner.hpp"
#include "appstage/platform.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

namespace fs = std::filesystem;

namespace appstage {

namespace {

constexpr const char* NODE_MODULES = "node_modules";

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string relative_to(const fs::path& path, const fs::path& root) {
    return to_portable_path(path.lexically_relative(root).string());
}

fs::path normalize_root(const std::string& app_dir) {
    fs::path root = fs::path(app_dir).lexically_normal();
    if (!root.has_filename() && root.has_parent_path()) {
        root = root.parent_path();
    }
    return root;
}

bool is_runtime_module(const std::string& name) {
    const auto& names = runtime_module_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Dependency names declared by a package.json, in declaration order
std::vector<std::string> declared_dependencies(const nlohmann::json& manifest) {
    std::vector<std::string> names;
    for (const char* key : {"dependencies", "optionalDependencies"}) {
        if (manifest.contains(key) && manifest[key].is_object()) {
            for (auto& [name, version] : manifest[key].items()) {
                (void)version;
                names.push_back(name);
            }
        }
    }
    return names;
}

bool is_optional_dependency(const nlohmann::json& manifest, const std::string& name) {
    return manifest.contains("optionalDependencies") &&
           manifest["optionalDependencies"].is_object() &&
           manifest["optionalDependencies"].contains(name);
}

// Node module resolution: look in <dir>/node_modules/<name>, walking up
// from the requiring package until the app root is reached.
std::optional<fs::path> resolve_package(const fs::path& from_dir,
                                        const std::string& name,
                                        const fs::path& root) {
    fs::path dir = from_dir;
    while (true) {
        if (dir.filename() != NODE_MODULES) {
            fs::path candidate = dir / NODE_MODULES / fs::path(name);
            std::error_code ec;
            if (fs::is_directory(candidate, ec)) {
                return candidate.lexically_normal();
            }
        }
        if (dir == root || !dir.has_parent_path() || dir.parent_path() == dir) {
            break;
        }
        dir = dir.parent_path();
    }
    return std::nullopt;
}

void scan_node_modules(const fs::path& node_modules, const fs::path& root,
                       std::vector<std::string>& packages) {
    std::error_code ec;
    if (!fs::is_directory(node_modules, ec)) return;

    std::vector<fs::path> candidates;
    for (fs::directory_iterator it(node_modules, ec), end; it != end; it.increment(ec)) {
        if (ec) break;
        std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') continue;    // .bin, .package-lock.json

        if (name[0] == '@') {
            for (fs::directory_iterator sit(it->path(), ec), send; sit != send; sit.increment(ec)) {
                if (ec) break;
                candidates.push_back(sit->path());
            }
            continue;
        }
        candidates.push_back(it->path());
    }

    std::sort(candidates.begin(), candidates.end());
    for (const auto& pkg : candidates) {
        if (!fs::is_directory(pkg, ec)) continue;
        packages.push_back(relative_to(pkg, root));
        scan_node_modules(pkg / NODE_MODULES, root, packages);
    }
}

} // namespace

const std::vector<std::string>& runtime_module_names() {
    static const std::vector<std::string> names = {
        "electron",
        "electron-nightly",
        "electron-prebuilt",
        "electron-prebuilt-compile",
    };
    return names;
}

std::vector<std::string> list_installed_packages(const std::string& app_dir) {
    std::vector<std::string> packages;
    fs::path root = normalize_root(app_dir);
    scan_node_modules(root / NODE_MODULES, root, packages);
    return packages;
}

ProductionSetResult compute_production_set(const std::string& app_dir) {
    ProductionSetResult result;
    fs::path root = normalize_root(app_dir);

    auto root_content = read_file(root / "package.json");
    if (!root_content) {
        result.error = "package.json not found in " + app_dir;
        return result;
    }

    nlohmann::json root_manifest;
    try {
        root_manifest = nlohmann::json::parse(*root_content);
    } catch (const nlohmann::json::exception& e) {
        result.error = "invalid package.json in " + app_dir + ": " + e.what();
        return result;
    }
    if (!root_manifest.is_object()) {
        result.error = "package.json must contain an object: " + app_dir;
        return result;
    }

    struct Pending {
        fs::path dir;
        nlohmann::json manifest;
    };
    std::deque<Pending> queue;
    queue.push_back({root, root_manifest});

    while (!queue.empty()) {
        Pending current = std::move(queue.front());
        queue.pop_front();

        for (const auto& name : declared_dependencies(current.manifest)) {
            if (is_runtime_module(name)) {
                if (current.dir == root) {
                    result.warnings.push_back("Found '" + name +
                        "' but not as a devDependency, pruning anyway");
                }
                continue;
            }

            auto resolved = resolve_package(current.dir, name, root);
            if (!resolved) {
                if (!is_optional_dependency(current.manifest, name)) {
                    result.warnings.push_back("Dependency '" + name + "' of " +
                        (current.dir == root ? std::string("the app")
                                             : relative_to(current.dir, root)) +
                        " is not installed");
                }
                continue;
            }

            std::string rel = relative_to(*resolved, root);
            if (!result.packages.insert(rel).second) {
                continue;
            }

            nlohmann::json manifest = nlohmann::json::object();
            if (auto content = read_file(*resolved / "package.json")) {
                try {
                    manifest = nlohmann::json::parse(*content);
                } catch (const nlohmann::json::exception&) {
                    result.warnings.push_back("Ignoring unreadable package.json in " + rel);
                    manifest = nlohmann::json::object();
                }
            }
            if (!manifest.is_object()) {
                manifest = nlohmann::json::object();
            }
            queue.push_back({*resolved, std::move(manifest)});
        }
    }

    result.ok = true;
    return result;
}

PruneResult NpmPruner::prune(const std::string& app_dir) {
    PruneResult result;

    auto production = compute_production_set(app_dir);
    if (!production.ok) {
        result.error = production.error;
        return result;
    }
    for (const auto& warning : production.warnings) {
        spdlog::warn("{}", warning);
    }

    auto installed = list_installed_packages(app_dir);
    std::string last_removed;

    for (const auto& rel : installed) {
        // Nested packages of a removed package are already gone
        if (!last_removed.empty() && rel.rfind(last_removed + "/", 0) == 0) {
            continue;
        }
        if (production.packages.count(rel) > 0) {
            continue;
        }

        auto removed = remove_if_exists(join_path(app_dir, rel));
        if (!removed.ok) {
            result.error = "failed to prune " + rel + ": " + removed.error;
            return result;
        }
        spdlog::debug("Pruned {}", rel);
        result.removed.push_back(rel);
        last_removed = rel;
    }

    // Drop scope directories that pruning left empty
    for (const auto& rel : result.removed) {
        fs::path scope = fs::path(join_path(app_dir, rel)).parent_path();
        if (scope.filename().string().rfind('@', 0) != 0) continue;

        std::error_code ec;
        if (fs::is_directory(scope, ec) && fs::is_empty(scope, ec) && !ec) {
            fs::remove(scope, ec);
            if (ec) {
                result.error = "failed to remove empty scope " + scope.string() + ": " + ec.message();
                return result;
            }
        }
    }

    result.ok = true;
    return result;
}

} // namespace appstage
