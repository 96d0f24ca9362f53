#pragma once

#include <set>
#include <string>
#include <vector>

namespace appstage {

// ============================================================================
// Dependency Pruning
// ============================================================================

struct PruneResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> removed;   // Package dirs removed, relative to app dir
};

/**
 * @brief Removes non-production dependencies from an app directory in place
 *
 * The pipeline only looks at ok/error; the state of the directory after a
 * failure is undefined.
 */
class DependencyPruner {
public:
    virtual ~DependencyPruner() = default;

    virtual PruneResult prune(const std::string& app_dir) = 0;
};

// Packages that belong to the runtime itself; never shipped inside the app
const std::vector<std::string>& runtime_module_names();

// Installed package directories under <app_dir>/node_modules, including
// scoped and nested packages, relative to app_dir with forward slashes.
std::vector<std::string> list_installed_packages(const std::string& app_dir);

struct ProductionSetResult {
    bool ok = false;
    std::string error;
    std::set<std::string> packages;     // Relative package dirs to keep
    std::vector<std::string> warnings;
};

// Transitive closure of dependencies + optionalDependencies starting at
// <app_dir>/package.json, resolved through the nearest node_modules.
ProductionSetResult compute_production_set(const std::string& app_dir);

// npm-style pruner driven by package.json files
class NpmPruner : public DependencyPruner {
public:
    PruneResult prune(const std::string& app_dir) override;
};

} // namespace appstage
