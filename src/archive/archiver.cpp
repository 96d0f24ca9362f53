#include "appstage/archiver.hpp"
#include "appstage/glob.hpp"
#include "appstage/platform.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace appstage {

namespace {

// ============================================================================
// ustar Header Layout
// ============================================================================

constexpr size_t BLOCK = 512;

struct Field {
    size_t offset;
    size_t size;
};

constexpr Field F_NAME{0, 100};
constexpr Field F_MODE{100, 8};
constexpr Field F_UID{108, 8};
constexpr Field F_GID{116, 8};
constexpr Field F_SIZE{124, 12};
constexpr Field F_MTIME{136, 12};
constexpr Field F_CHECKSUM{148, 8};
constexpr size_t TYPEFLAG_OFFSET = 156;
constexpr Field F_LINKNAME{157, 100};
constexpr Field F_MAGIC{257, 6};
constexpr Field F_VERSION{263, 2};
constexpr Field F_PREFIX{345, 155};

using Block = std::array<char, BLOCK>;

void put_bytes(Block& block, Field field, const std::string& value) {
    std::memcpy(block.data() + field.offset, value.data(), std::min(value.size(), field.size));
}

// Zero-padded octal, NUL terminated
void put_octal(Block& block, Field field, uint64_t value) {
    char* dest = block.data() + field.offset;
    dest[field.size - 1] = '\0';
    for (size_t i = field.size - 1; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

char typeflag_for(TarEntryType type) {
    switch (type) {
        case TarEntryType::Directory: return '5';
        case TarEntryType::Symlink: return '2';
        case TarEntryType::RegularFile: break;
    }
    return '0';
}

uint32_t mode_for(const TarEntry& entry) {
    switch (entry.type) {
        case TarEntryType::Directory: return 0755;
        case TarEntryType::Symlink: return 0777;
        case TarEntryType::RegularFile: break;
    }
    return entry.executable ? 0755 : 0644;
}

// Directories are stored with a trailing '/'
std::string archive_path(const TarEntry& entry) {
    if (entry.type == TarEntryType::Directory && !entry.path.empty() && entry.path.back() != '/') {
        return entry.path + '/';
    }
    return entry.path;
}

// Name alone if it fits, else split at a '/' into prefix + name
bool put_path(Block& block, const std::string& path) {
    if (path.size() < F_NAME.size) {
        put_bytes(block, F_NAME, path);
        return true;
    }
    for (size_t split = path.rfind('/', F_PREFIX.size); split != std::string::npos && split > 0;
         split = path.rfind('/', split - 1)) {
        size_t name_len = path.size() - split - 1;
        if (name_len > 0 && name_len < F_NAME.size && split <= F_PREFIX.size) {
            put_bytes(block, F_PREFIX, path.substr(0, split));
            put_bytes(block, F_NAME, path.substr(split + 1));
            return true;
        }
    }
    return false;
}

void put_checksum(Block& block) {
    std::memset(block.data() + F_CHECKSUM.offset, ' ', F_CHECKSUM.size);
    uint32_t sum = 0;
    for (char c : block) {
        sum += static_cast<unsigned char>(c);
    }
    // Six octal digits, NUL, space
    Block digits{};
    put_octal(digits, Field{0, 7}, sum);
    std::memcpy(block.data() + F_CHECKSUM.offset, digits.data(), 7);
    block[F_CHECKSUM.offset + 7] = ' ';
}

// ============================================================================
// Tar Stream
// ============================================================================

class TarWriter {
public:
    bool add(const TarEntry& entry, std::string& error) {
        Block header{};
        std::string path = archive_path(entry);
        if (!put_path(header, path)) {
            error = "path too long for archive: " + entry.path;
            return false;
        }
        if (entry.type == TarEntryType::Symlink) {
            if (entry.link_target.size() >= F_LINKNAME.size) {
                error = "symlink target too long: " + entry.path;
                return false;
            }
            put_bytes(header, F_LINKNAME, entry.link_target);
        }

        uint64_t size = entry.type == TarEntryType::RegularFile ? entry.data.size() : 0;
        if (size > MAX_TAR_MEMBER_SIZE) {
            error = "file too large for ustar: " + entry.path;
            return false;
        }
        put_octal(header, F_MODE, mode_for(entry));
        put_octal(header, F_UID, 0);
        put_octal(header, F_GID, 0);
        put_octal(header, F_SIZE, size);
        put_octal(header, F_MTIME, 0);
        header[TYPEFLAG_OFFSET] = typeflag_for(entry.type);
        put_bytes(header, F_MAGIC, std::string("ustar\0", 6));
        put_bytes(header, F_VERSION, "00");
        put_checksum(header);

        out_.insert(out_.end(), header.begin(), header.end());
        if (size > 0) {
            out_.insert(out_.end(), entry.data.begin(), entry.data.end());
            out_.resize(out_.size() + (BLOCK - size % BLOCK) % BLOCK, 0);
        }
        return true;
    }

    // End-of-archive marker: two zero blocks
    std::vector<uint8_t> finish() {
        out_.resize(out_.size() + 2 * BLOCK, 0);
        return std::move(out_);
    }

private:
    std::vector<uint8_t> out_;
};

// ============================================================================
// Gzip
// ============================================================================

// zlib's gzip wrapper with a fixed header: mtime 0, no name, OS unknown
bool gzip(const std::vector<uint8_t>& input, int level, std::vector<uint8_t>& output) {
    z_stream stream{};
    if (deflateInit2(&stream, level, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    gz_header header{};
    header.os = 255;
    if (deflateSetHeader(&stream, &header) != Z_OK) {
        deflateEnd(&stream);
        return false;
    }

    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());

    std::array<uint8_t, 64 * 1024> chunk;
    int ret = Z_OK;
    while (ret == Z_OK) {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret = deflate(&stream, Z_FINISH);
        output.insert(output.end(), chunk.data(), chunk.data() + (chunk.size() - stream.avail_out));
    }
    deflateEnd(&stream);
    return ret == Z_STREAM_END;
}

// ============================================================================
// Entry Checks
// ============================================================================

// True if a link at rel_path pointing to target resolves inside the root
bool link_stays_inside(const std::string& rel_path, const std::string& target) {
    fs::path target_path(target);
    if (target_path.is_absolute() || target_path.has_root_name()) {
        return false;
    }
    fs::path resolved = (fs::path(rel_path).parent_path() / target_path).lexically_normal();
    auto first = resolved.begin();
    return first == resolved.end() || first->string() != "..";
}

bool matches_any(const std::vector<std::string>& patterns, const std::string& path) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&path](const std::string& pattern) { return glob_match(pattern, path); });
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

PackResult create_deterministic_archive(const std::vector<TarEntry>& entries,
                                        int compression_level) {
    PackResult result;

    // Stored paths sort parents before children
    std::vector<const TarEntry*> ordered;
    ordered.reserve(entries.size());
    for (const auto& entry : entries) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(), [](const TarEntry* a, const TarEntry* b) {
        return archive_path(*a) < archive_path(*b);
    });

    TarWriter tar;
    for (const TarEntry* entry : ordered) {
        if (entry->type == TarEntryType::Symlink &&
            !link_stays_inside(entry->path, entry->link_target)) {
            result.error = "symlink points outside the archive root: " + entry->path +
                           " -> " + entry->link_target;
            return result;
        }
        if (!tar.add(*entry, result.error)) {
            return result;
        }
    }

    if (!gzip(tar.finish(), compression_level, result.archive_data)) {
        result.archive_data.clear();
        result.error = "gzip compression failed";
        return result;
    }

    result.ok = true;
    return result;
}

CollectResult collect_directory_entries(const std::string& dir_path,
                                        const ArchiveOptions& options) {
    CollectResult result;

    std::error_code ec;
    if (!fs::is_directory(dir_path, ec)) {
        result.error = "directory not found: " + dir_path;
        return result;
    }

    fs::path base_path(dir_path);

    try {
        fs::recursive_directory_iterator it(dir_path), end;
        for (; it != end; ++it) {
            const auto& entry = *it;
            std::string path_str = to_portable_path(
                entry.path().lexically_relative(base_path).string());

            if (entry.is_symlink()) {
                TarEntry tar_entry;
                tar_entry.path = path_str;
                tar_entry.type = TarEntryType::Symlink;
                tar_entry.link_target = to_portable_path(fs::read_symlink(entry.path()).string());
                result.entries.push_back(std::move(tar_entry));
                continue;
            }

            if (entry.is_directory()) {
                if (matches_any(options.unpack_dirs, path_str)) {
                    result.unpacked.push_back(path_str);
                    it.disable_recursion_pending();
                    continue;
                }
                TarEntry tar_entry;
                tar_entry.path = path_str;
                tar_entry.type = TarEntryType::Directory;
                result.entries.push_back(std::move(tar_entry));
                continue;
            }

            if (!entry.is_regular_file()) {
                result.error = "unsupported file type: " + path_str;
                return result;
            }

            if (matches_any(options.unpack, path_str)) {
                result.unpacked.push_back(path_str);
                continue;
            }

            if (entry.file_size() > MAX_TAR_MEMBER_SIZE) {
                result.error = "file too large for ustar: " + path_str;
                return result;
            }

            TarEntry tar_entry;
            tar_entry.path = path_str;
            tar_entry.type = TarEntryType::RegularFile;

            std::ifstream file(entry.path(), std::ios::binary);
            if (!file) {
                result.error = "failed to read file: " + path_str;
                return result;
            }
            tar_entry.data = std::vector<uint8_t>(
                (std::istreambuf_iterator<char>(file)),
                std::istreambuf_iterator<char>());

            auto perms = entry.status().permissions();
            tar_entry.executable = (perms & fs::perms::owner_exec) != fs::perms::none ||
                                   (perms & fs::perms::group_exec) != fs::perms::none ||
                                   (perms & fs::perms::others_exec) != fs::perms::none;

            result.entries.push_back(std::move(tar_entry));
        }
    } catch (const fs::filesystem_error& e) {
        result.error = std::string("filesystem error: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

ArchiveResult TarGzArchiver::create_archive(const std::string& src_dir,
                                            const std::string& dest,
                                            const ArchiveOptions& options) {
    ArchiveResult result;

    if (path_exists(dest)) {
        result.error = "archive destination already exists: " + dest;
        return result;
    }

    auto collected = collect_directory_entries(src_dir, options);
    if (!collected.ok) {
        result.error = collected.error;
        return result;
    }

    auto packed = create_deterministic_archive(collected.entries, options.compression_level);
    if (!packed.ok) {
        result.error = packed.error;
        return result;
    }

    std::string unpacked_root = dest + ".unpacked";
    for (const auto& rel : collected.unpacked) {
        CopyOptions copy_opts;
        copy_opts.dereference = false;
        auto copied = copy_tree(join_path(src_dir, rel), join_path(unpacked_root, rel), copy_opts);
        if (!copied.ok) {
            auto cleanup = remove_if_exists(unpacked_root);
            if (!cleanup.ok) {
                spdlog::warn("Could not clean up {}: {}", unpacked_root, cleanup.error);
            }
            result.error = "failed to unpack " + rel + ": " + copied.error;
            return result;
        }
    }

    auto written = atomic_write_file(dest, packed.archive_data);
    if (!written.ok) {
        auto cleanup = remove_if_exists(unpacked_root);
        if (!cleanup.ok) {
            spdlog::warn("Could not clean up {}: {}", unpacked_root, cleanup.error);
        }
        result.error = "failed to write archive " + dest + ": " + written.error;
        return result;
    }

    spdlog::debug("Wrote {} entries to {} ({} bytes, {} unpacked)",
                  collected.entries.size(), dest, packed.archive_data.size(),
                  collected.unpacked.size());

    result.ok = true;
    result.entry_count = collected.entries.size();
    result.unpacked = std::move(collected.unpacked);
    return result;
}

} // namespace appstage
