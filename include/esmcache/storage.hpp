#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace esmcache {

class CancellationToken;
class StagingController;

// Metadata about a stored file or directory
struct FileInfo {
    std::string path;             // relative to the storage root, '/' separated
    uint64_t size = 0;
    bool is_directory = false;
    std::chrono::system_clock::time_point last_modified;
    std::map<std::string, std::string> metadata;
};

// Result of a byte-range read
struct ReadResult {
    bool success = false;
    std::vector<uint8_t> data;
    std::string error_message;
};

// Result of a write
struct WriteResult {
    bool success = false;
    std::string error_message;
};

// Result of a directory listing
struct ListResult {
    bool success = false;
    std::vector<FileInfo> entries;
    std::string error_message;
};

enum class WriteMode { Truncate, Append };

/// Filesystem access for one storage location.
///
/// Paths are relative to the location root. Read-side failures are reported
/// through result structs or empty optionals; only programmer errors throw.
class StorageCapability {
public:
    virtual ~StorageCapability() = default;

    // Backend type name (for logging)
    virtual std::string type_name() const = 0;

    virtual bool exists(const std::string& path) const = 0;

    virtual std::optional<FileInfo> info(const std::string& path) const = 0;

    // Size of a regular file
    virtual std::optional<uint64_t> size(const std::string& path) const {
        auto fi = info(path);
        if (!fi || fi->is_directory) return std::nullopt;
        return fi->size;
    }

    // Direct children of `path`, or every descendant when recursive
    virtual ListResult list(const std::string& path, bool recursive = false) const = 0;

    // Sequential stream over a file; nullptr when it cannot be opened
    virtual std::unique_ptr<std::istream> open(const std::string& path) const = 0;

    // Read up to `length` bytes at `offset`
    virtual ReadResult read(const std::string& path, uint64_t offset,
                            uint64_t length) const = 0;

    virtual WriteResult write(const std::string& path, std::span<const uint8_t> data,
                              WriteMode mode = WriteMode::Truncate) = 0;

    // Rename within the location
    virtual bool move(const std::string& source, const std::string& destination) = 0;

    virtual bool remove(const std::string& path) = 0;

    // Make `path` readable before a long read. A no-op except on tiered
    // storage, where it may block until the data is staged.
    virtual void prepare(const std::string& path, const CancellationToken& token) {
        (void)path;
        (void)token;
    }

    // Absolute local path backing `path`, when there is one
    virtual std::optional<std::filesystem::path> local_path(const std::string& path) const {
        (void)path;
        return std::nullopt;
    }
};

/// StorageCapability over a local or NFS-mounted directory tree.
class LocalStorage : public StorageCapability {
public:
    explicit LocalStorage(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }

    std::string type_name() const override { return "local"; }
    bool exists(const std::string& path) const override;
    std::optional<FileInfo> info(const std::string& path) const override;
    ListResult list(const std::string& path, bool recursive = false) const override;
    std::unique_ptr<std::istream> open(const std::string& path) const override;
    ReadResult read(const std::string& path, uint64_t offset, uint64_t length) const override;
    WriteResult write(const std::string& path, std::span<const uint8_t> data,
                      WriteMode mode = WriteMode::Truncate) override;
    bool move(const std::string& source, const std::string& destination) override;
    bool remove(const std::string& path) override;
    std::optional<std::filesystem::path> local_path(const std::string& path) const override;

private:
    // Throws StorageError for paths that escape the root
    std::filesystem::path resolve(const std::string& path) const;

    std::filesystem::path root_;
};

/// Decorator for tape-backed locations: brings files online through the
/// StagingController before they are opened or read.
///
/// `hsm_root` is the path of the location root as the HSM sees it; the
/// HSM path of a file is hsm_root + "/" + relative path.
class StagedStorage : public StorageCapability {
public:
    StagedStorage(std::shared_ptr<StorageCapability> inner,
                  std::shared_ptr<StagingController> staging,
                  std::string hsm_root,
                  std::chrono::milliseconds stage_timeout);

    std::string type_name() const override { return "staged(" + inner_->type_name() + ")"; }
    bool exists(const std::string& path) const override { return inner_->exists(path); }
    std::optional<FileInfo> info(const std::string& path) const override { return inner_->info(path); }
    ListResult list(const std::string& path, bool recursive = false) const override {
        return inner_->list(path, recursive);
    }
    std::unique_ptr<std::istream> open(const std::string& path) const override;
    ReadResult read(const std::string& path, uint64_t offset, uint64_t length) const override;
    WriteResult write(const std::string& path, std::span<const uint8_t> data,
                      WriteMode mode = WriteMode::Truncate) override {
        return inner_->write(path, data, mode);
    }
    bool move(const std::string& source, const std::string& destination) override {
        return inner_->move(source, destination);
    }
    bool remove(const std::string& path) override { return inner_->remove(path); }
    void prepare(const std::string& path, const CancellationToken& token) override;
    std::optional<std::filesystem::path> local_path(const std::string& path) const override {
        return inner_->local_path(path);
    }

    std::string hsm_path(const std::string& path) const;

private:
    std::shared_ptr<StorageCapability> inner_;
    std::shared_ptr<StagingController> staging_;
    std::string hsm_root_;
    std::chrono::milliseconds stage_timeout_;
};

}  // namespace esmcache
