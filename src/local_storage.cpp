#include "esmcache/storage.hpp"
#include "esmcache/errors.hpp"
#include "esmcache/operation.hpp"
#include "esmcache/staging_controller.hpp"

#include <algorithm>
#include <fstream>

namespace esmcache {

namespace fs = std::filesystem;

namespace {

std::chrono::system_clock::time_point to_system_time(fs::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

std::string normalize_key(const fs::path& rel) {
    std::string key = rel.generic_string();
    std::replace(key.begin(), key.end(), '\\', '/');
    return key;
}

}  // namespace

// ============================================================================
// LocalStorage
// ============================================================================

LocalStorage::LocalStorage(const fs::path& root)
    : root_(fs::absolute(root).lexically_normal()) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StorageError("cannot create storage root " + root_.string() + ": " + ec.message());
    }
}

fs::path LocalStorage::resolve(const std::string& path) const {
    fs::path rel(path);
    if (rel.is_absolute()) rel = rel.relative_path();
    for (const auto& part : rel) {
        if (part == "..") {
            throw StorageError("path escapes storage root: " + path);
        }
    }
    return (root_ / rel).lexically_normal();
}

std::optional<fs::path> LocalStorage::local_path(const std::string& path) const {
    return resolve(path);
}

bool LocalStorage::exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(resolve(path), ec);
}

std::optional<FileInfo> LocalStorage::info(const std::string& path) const {
    auto full = resolve(path);
    std::error_code ec;
    auto st = fs::status(full, ec);
    if (ec || !fs::exists(st)) return std::nullopt;

    FileInfo fi;
    fi.path = normalize_key(fs::relative(full, root_, ec));
    fi.is_directory = fs::is_directory(st);
    if (!fi.is_directory) {
        fi.size = fs::file_size(full, ec);
        if (ec) return std::nullopt;
    }
    auto ftime = fs::last_write_time(full, ec);
    if (!ec) fi.last_modified = to_system_time(ftime);
    return fi;
}

ListResult LocalStorage::list(const std::string& path, bool recursive) const {
    ListResult result;
    auto search_path = resolve(path);

    std::error_code ec;
    if (!fs::is_directory(search_path, ec)) {
        result.error_message = "not a directory: " + path;
        return result;
    }

    auto add_entry = [&](const fs::directory_entry& entry) {
        FileInfo fi;
        fi.path = normalize_key(fs::relative(entry.path(), root_));
        fi.is_directory = entry.is_directory();
        if (entry.is_regular_file()) {
            fi.size = entry.file_size();
            fi.last_modified = to_system_time(entry.last_write_time());
        }
        result.entries.push_back(std::move(fi));
    };

    try {
        if (recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(search_path)) {
                add_entry(entry);
            }
        } else {
            for (const auto& entry : fs::directory_iterator(search_path)) {
                add_entry(entry);
            }
        }
    } catch (const fs::filesystem_error& e) {
        result.error_message = e.what();
        return result;
    }

    std::sort(result.entries.begin(), result.entries.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.path < b.path; });
    result.success = true;
    return result;
}

std::unique_ptr<std::istream> LocalStorage::open(const std::string& path) const {
    auto stream = std::make_unique<std::ifstream>(resolve(path), std::ios::binary);
    if (!*stream) return nullptr;
    return stream;
}

ReadResult LocalStorage::read(const std::string& path, uint64_t offset, uint64_t length) const {
    ReadResult result;
    std::ifstream file(resolve(path), std::ios::binary | std::ios::ate);
    if (!file) {
        result.error_message = "file not found: " + path;
        return result;
    }

    auto tellg_val = file.tellg();
    if (tellg_val < 0) {
        result.error_message = "cannot determine file size: " + path;
        return result;
    }
    uint64_t file_size = static_cast<uint64_t>(tellg_val);
    if (offset > file_size) {
        result.error_message = "offset beyond end of file: " + path;
        return result;
    }

    uint64_t to_read = std::min(length, file_size - offset);
    result.data.resize(to_read);
    file.seekg(static_cast<std::streamoff>(offset));
    file.read(reinterpret_cast<char*>(result.data.data()), static_cast<std::streamsize>(to_read));
    if (!file) {
        result.data.clear();
        result.error_message = "failed to read " + path;
        return result;
    }

    result.success = true;
    return result;
}

WriteResult LocalStorage::write(const std::string& path, std::span<const uint8_t> data,
                                WriteMode mode) {
    WriteResult result;
    auto full = resolve(path);

    std::error_code ec;
    fs::create_directories(full.parent_path(), ec);
    if (ec) {
        result.error_message = "failed to create directory for " + path + ": " + ec.message();
        return result;
    }

    auto flags = std::ios::binary | (mode == WriteMode::Append ? std::ios::app : std::ios::trunc);
    std::ofstream file(full, flags);
    if (!file) {
        result.error_message = "failed to open " + path + " for writing";
        return result;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        result.error_message = "failed to write " + path;
        return result;
    }

    result.success = true;
    return result;
}

bool LocalStorage::move(const std::string& source, const std::string& destination) {
    auto src = resolve(source);
    auto dst = resolve(destination);

    std::error_code ec;
    fs::create_directories(dst.parent_path(), ec);
    fs::rename(src, dst, ec);
    return !ec;
}

bool LocalStorage::remove(const std::string& path) {
    std::error_code ec;
    return fs::remove(resolve(path), ec);
}

// ============================================================================
// StagedStorage
// ============================================================================

StagedStorage::StagedStorage(std::shared_ptr<StorageCapability> inner,
                             std::shared_ptr<StagingController> staging,
                             std::string hsm_root,
                             std::chrono::milliseconds stage_timeout)
    : inner_(std::move(inner))
    , staging_(std::move(staging))
    , hsm_root_(std::move(hsm_root))
    , stage_timeout_(stage_timeout) {
    while (hsm_root_.size() > 1 && hsm_root_.back() == '/') hsm_root_.pop_back();
}

std::string StagedStorage::hsm_path(const std::string& path) const {
    std::string rel = path;
    while (!rel.empty() && rel.front() == '/') rel.erase(rel.begin());
    if (rel.empty()) return hsm_root_;
    if (hsm_root_ == "/") return "/" + rel;
    return hsm_root_ + "/" + rel;
}

void StagedStorage::prepare(const std::string& path, const CancellationToken& token) {
    staging_->ensure_online(hsm_path(path), stage_timeout_, token);
}

std::unique_ptr<std::istream> StagedStorage::open(const std::string& path) const {
    staging_->ensure_online(hsm_path(path), stage_timeout_, CancellationToken{});
    return inner_->open(path);
}

ReadResult StagedStorage::read(const std::string& path, uint64_t offset, uint64_t length) const {
    staging_->ensure_online(hsm_path(path), stage_timeout_, CancellationToken{});
    return inner_->read(path, offset, length);
}

}  // namespace esmcache
