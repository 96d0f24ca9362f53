#pragma once

#include "appstage/types.hpp"

#include <memory>
#include <string>

namespace appstage {

// ============================================================================
// Runtime Binary Naming
// ============================================================================

/**
 * @brief Platform-specific names of the runtime binary inside the template
 *
 * The pipeline renames original_binary_name() to new_binary_name() within
 * the binary directory (the staging path) and knows nothing else about
 * the platform.
 */
class RuntimeBinaryNaming {
public:
    virtual ~RuntimeBinaryNaming() = default;

    virtual std::string original_binary_name() const = 0;
    virtual std::string new_binary_name() const = 0;
};

// macOS-style application bundle: "Electron.app" -> "<name>.app"
class AppBundleNaming : public RuntimeBinaryNaming {
public:
    explicit AppBundleNaming(std::string product_name)
        : product_name_(std::move(product_name)) {}

    std::string original_binary_name() const override { return "Electron.app"; }
    std::string new_binary_name() const override { return product_name_ + ".app"; }

private:
    std::string product_name_;
};

// Plain executable: "electron" -> "<name>", "electron.exe" -> "<name>.exe"
class ExecutableNaming : public RuntimeBinaryNaming {
public:
    ExecutableNaming(std::string executable_name, std::string suffix)
        : executable_name_(std::move(executable_name)), suffix_(std::move(suffix)) {}

    std::string original_binary_name() const override { return "electron" + suffix_; }
    std::string new_binary_name() const override { return executable_name_ + suffix_; }

private:
    std::string executable_name_;
    std::string suffix_;
};

// Pick the naming variant for config.platform. Returns nullptr for
// platforms without a known runtime layout.
std::unique_ptr<RuntimeBinaryNaming> make_binary_naming(const PackagingConfig& config);

} // namespace appstage
