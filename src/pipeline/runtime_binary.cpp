#include "appstage/runtime_binary.hpp"
#include "appstage/path_planner.hpp"

namespace appstage {

std::unique_ptr<RuntimeBinaryNaming> make_binary_naming(const PackagingConfig& config) {
    if (config.platform == "darwin" || config.platform == "mas") {
        return std::make_unique<AppBundleNaming>(sanitize_basename(config.name));
    }
    if (config.platform == "linux") {
        return std::make_unique<ExecutableNaming>(
            sanitize_basename(effective_executable_name(config)), "");
    }
    if (config.platform == "win32") {
        return std::make_unique<ExecutableNaming>(
            sanitize_basename(effective_executable_name(config)), ".exe");
    }
    return nullptr;
}

} // namespace appstage
