#include "appstage/platform.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <random>

namespace appstage {

namespace fs = std::filesystem;

// ============================================================================
// Host Detection
// ============================================================================

std::string get_host_platform() {
#if defined(_WIN32)
    return "win32";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(__linux__)
    return "linux";
#else
    return "unknown";
#endif
}

std::string get_host_arch() {
#if defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#elif defined(__x86_64__) || defined(_M_X64)
    return "x64";
#elif defined(__arm__) || defined(_M_ARM)
    return "armv7l";
#elif defined(__i386__) || defined(_M_IX86)
    return "ia32";
#elif defined(__mips64)
    return "mips64el";
#else
    return "unknown";
#endif
}

// ============================================================================
// Paths
// ============================================================================

std::string to_portable_path(const std::string& path) {
    std::string portable(path);
    std::replace(portable.begin(), portable.end(), '\\', '/');
    return portable;
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    // "dir/" has an empty filename; use the last real component instead
    if (!p.has_filename() && p.has_parent_path()) {
        p = p.parent_path();
    }
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    return to_portable_path((fs::path(base) / rel).string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    auto type = fs::symlink_status(path, ec).type();
    return !ec && type != fs::file_type::not_found;
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* value = nullptr;
    size_t len = 0;
    if (_dupenv_s(&value, &len, name.c_str()) != 0 || value == nullptr) {
        return std::nullopt;
    }
    std::string copy(value);
    free(value);
    return copy;
#else
    if (const char* value = std::getenv(name.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
#endif
}

std::string get_temp_directory() {
    auto tmpdir = get_env("TMPDIR");
    if (tmpdir && !tmpdir->empty()) {
        return to_portable_path(*tmpdir);
    }

    std::error_code ec;
    fs::path system_tmp = fs::temp_directory_path(ec);
    return ec ? std::string("/tmp") : to_portable_path(system_tmp.string());
}

std::string generate_uuid() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};

    std::array<uint8_t, 16> bytes;
    for (size_t i = 0; i < bytes.size(); i += 8) {
        uint64_t chunk = engine();
        for (size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<uint8_t>(chunk >> (j * 8));
        }
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);   // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);   // RFC 4122 variant

    static const char* hex = "0123456789abcdef";
    std::string uuid;
    uuid.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) uuid += '-';
        uuid += hex[bytes[i] >> 4];
        uuid += hex[bytes[i] & 0x0f];
    }
    return uuid;
}

} // namespace appstage
