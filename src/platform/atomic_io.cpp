#include "appstage/platform.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace appstage {

namespace fs = std::filesystem;

namespace {

FsResult io_error(const std::string& what) {
    FsResult result;
    result.error = what;
    return result;
}

// Sibling of the destination so the final rename never crosses devices
std::string sibling_temp_path(const std::string& path) {
    return path + ".tmp-" + generate_uuid().substr(0, 8);
}

#ifndef _WIN32
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // Close now and report whether close succeeded
    bool reset() {
        if (fd_ < 0) return true;
        int rc = ::close(fd_);
        fd_ = -1;
        return rc == 0;
    }

private:
    int fd_;
};

bool sync_fd(int fd) {
#ifdef __APPLE__
    return ::fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return ::fsync(fd) == 0;
#endif
}

bool write_all(int fd, const std::vector<uint8_t>& content, std::string& error) {
    const uint8_t* cursor = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, cursor, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = std::strerror(errno);
            return false;
        }
        cursor += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

// Best effort: the rename is already visible, this only makes it durable
void sync_parent(const std::string& path) {
    std::string dir = get_parent_directory(path);
    ScopedFd dir_fd(::open(dir.empty() ? "." : dir.c_str(), O_RDONLY));
    if (dir_fd.valid()) {
        sync_fd(dir_fd.get());
    }
}
#endif

} // namespace

FsResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    std::string temp_path = sibling_temp_path(path);

#ifdef _WIN32
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return io_error("failed to create " + temp_path);
        }
        out.write(reinterpret_cast<const char*>(content.data()),
                  static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            return io_error("failed to write " + temp_path);
        }
    }
#else
    ScopedFd fd(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (!fd.valid()) {
        return io_error("failed to create " + temp_path + ": " + std::strerror(errno));
    }

    std::string reason;
    bool written = write_all(fd.get(), content, reason);
    if (written && !sync_fd(fd.get())) {
        reason = std::string("fsync: ") + std::strerror(errno);
        written = false;
    }
    if (written && !fd.reset()) {
        reason = std::string("close: ") + std::strerror(errno);
        written = false;
    }
    if (!written) {
        fd.reset();
        ::unlink(temp_path.c_str());
        return io_error("failed to write " + path + ": " + reason);
    }
#endif

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return io_error("failed to rename " + temp_path + " to " + path + ": " + ec.message());
    }

#ifndef _WIN32
    sync_parent(path);
#endif

    FsResult result;
    result.ok = true;
    return result;
}

} // namespace appstage
