#include "appstage/platform.hpp"

#include <filesystem>
#include <system_error>

namespace appstage {

namespace fs = std::filesystem;

namespace {

FsResult fail(const std::string& what, const fs::path& path, const std::error_code& ec) {
    FsResult result;
    result.error = what + " " + to_portable_path(path.string()) + ": " + ec.message();
    return result;
}

FsResult succeed() {
    FsResult result;
    result.ok = true;
    return result;
}

FsResult copy_symlink_entry(const fs::path& src, const fs::path& dst, const CopyOptions& options) {
    std::error_code ec;
    auto target = fs::read_symlink(src, ec);
    if (ec) return fail("failed to read symlink", src, ec);

    if (fs::symlink_status(dst, ec).type() != fs::file_type::not_found) {
        if (!options.overwrite) {
            FsResult result;
            result.error = "destination already exists: " + to_portable_path(dst.string());
            return result;
        }
        fs::remove_all(dst, ec);
        if (ec) return fail("failed to replace", dst, ec);
    }

#ifdef _WIN32
    if (fs::is_directory(src, ec)) {
        fs::create_directory_symlink(target, dst, ec);
    } else {
        fs::create_symlink(target, dst, ec);
    }
#else
    fs::create_symlink(target, dst, ec);
#endif
    if (ec) return fail("failed to create symlink", dst, ec);
    return succeed();
}

FsResult copy_entry(const fs::path& src, const fs::path& dst, const CopyOptions& options) {
    if (options.filter) {
        bool keep = false;
        try {
            keep = options.filter(to_portable_path(src.string()));
        } catch (const std::exception& e) {
            FsResult result;
            result.error = "filter failed for " + to_portable_path(src.string()) + ": " + e.what();
            return result;
        } catch (...) {
            FsResult result;
            result.error = "filter failed for " + to_portable_path(src.string()) +
                           ": non-standard exception";
            return result;
        }
        if (!keep) return succeed();
    }

    std::error_code ec;
    auto link_status = fs::symlink_status(src, ec);
    if (ec) return fail("failed to stat", src, ec);

    if (fs::is_symlink(link_status) && !options.dereference) {
        return copy_symlink_entry(src, dst, options);
    }

    auto st = fs::is_symlink(link_status) ? fs::status(src, ec) : link_status;
    if (ec) return fail("failed to resolve symlink", src, ec);

    if (fs::is_directory(st)) {
        fs::create_directories(dst, ec);
        if (ec) return fail("failed to create directory", dst, ec);

        for (fs::directory_iterator it(src, ec), end; it != end; it.increment(ec)) {
            if (ec) break;
            auto child = copy_entry(it->path(), dst / it->path().filename(), options);
            if (!child.ok) return child;
        }
        if (ec) return fail("failed to list directory", src, ec);

        fs::permissions(dst, st.permissions(), ec);
        if (ec) return fail("failed to set permissions on", dst, ec);
        return succeed();
    }

    if (fs::is_regular_file(st)) {
        if (dst.has_parent_path()) {
            fs::create_directories(dst.parent_path(), ec);
            if (ec) return fail("failed to create directory", dst.parent_path(), ec);
        }

        auto copy_opts = options.overwrite ? fs::copy_options::overwrite_existing
                                           : fs::copy_options::none;
        fs::copy_file(src, dst, copy_opts, ec);
        if (ec) return fail("failed to copy", src, ec);

        fs::permissions(dst, st.permissions(), ec);
        if (ec) return fail("failed to set permissions on", dst, ec);
        return succeed();
    }

    FsResult result;
    result.error = "unsupported file type: " + to_portable_path(src.string());
    return result;
}

} // namespace

FsResult move_path(const std::string& src, const std::string& dst, bool overwrite) {
    std::error_code ec;

    if (!path_exists(src)) {
        FsResult result;
        result.error = "source does not exist: " + src;
        return result;
    }

    if (path_exists(dst)) {
        if (!overwrite) {
            FsResult result;
            result.error = "destination already exists: " + dst;
            return result;
        }
        fs::remove_all(dst, ec);
        if (ec) return fail("failed to remove existing", dst, ec);
    }

    fs::path dst_path(dst);
    if (dst_path.has_parent_path()) {
        fs::create_directories(dst_path.parent_path(), ec);
        if (ec) return fail("failed to create directory", dst_path.parent_path(), ec);
    }

    fs::rename(src, dst, ec);
    if (!ec) return succeed();

    if (ec != std::errc::cross_device_link) {
        return fail("failed to move " + src + " to", dst_path, ec);
    }

    // Different filesystems: copy, then remove the source
    CopyOptions copy_opts;
    copy_opts.dereference = false;
    auto copied = copy_tree(src, dst, copy_opts);
    if (!copied.ok) return copied;

    fs::remove_all(src, ec);
    if (ec) return fail("failed to remove moved source", fs::path(src), ec);
    return succeed();
}

FsResult copy_tree(const std::string& src, const std::string& dst, const CopyOptions& options) {
    if (!path_exists(src)) {
        FsResult result;
        result.error = "source does not exist: " + src;
        return result;
    }
    return copy_entry(fs::path(src), fs::path(dst), options);
}

FsResult remove_if_exists(const std::string& path) {
    std::error_code ec;
    auto st = fs::symlink_status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        return succeed();
    }
    if (ec) return fail("failed to stat", fs::path(path), ec);

    fs::remove_all(path, ec);
    if (ec) return fail("failed to remove", fs::path(path), ec);
    return succeed();
}

} // namespace appstage
