#pragma once

#include "esmcache/operation_router.hpp"
#include "esmcache/storage.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace esmcache {

class CacheStore;

/// Named storage locations available to handlers.
class LocationRegistry {
public:
    void add(const std::string& name, std::shared_ptr<StorageCapability> storage);

    /// Throws ValidationError for unknown names.
    std::shared_ptr<StorageCapability> get(const std::string& name) const;

    bool contains(const std::string& name) const { return locations_.count(name) > 0; }
    std::vector<std::string> names() const;

private:
    std::map<std::string, std::shared_ptr<StorageCapability>> locations_;
};

/// Where an archive lives: a location name and a path inside it.
struct ArchiveRef {
    std::string location;
    std::string path;
};

class ArchiveCatalog {
public:
    void add(const std::string& archive_id, ArchiveRef ref) { archives_[archive_id] = std::move(ref); }
    std::optional<ArchiveRef> find(const std::string& archive_id) const;
    size_t size() const { return archives_.size(); }

private:
    std::map<std::string, ArchiveRef> archives_;
};

/// Shell-style match of `name` against `pattern` (fnmatch semantics).
bool glob_match(const std::string& pattern, const std::string& name);

/// Copy one file between locations in `chunk_size` pieces, checking `token`
/// between chunks. Writes through `<dst_path>.partial` and renames on success.
/// Throws StorageError or OperationCancelled.
struct CopyResult {
    uint64_t bytes = 0;
    std::string sha256;
};
CopyResult copy_between(const StorageCapability& src, const std::string& src_path,
                        StorageCapability& dst, const std::string& dst_path,
                        size_t chunk_size, const CancellationToken& token);

/// SHA-256 of a stored file, hex encoded.
std::string sha256_of(const StorageCapability& storage, const std::string& path,
                      size_t chunk_size, const CancellationToken& token);

/// Bulk copy, move and extract of catalogued archives.
///
/// Archives are processed with at most `parallel_operations` in flight.
/// EXTRACT materializes into the CacheStore: a file archive becomes
/// `archive:<id>`, a directory-shaped archive has each member matching
/// `include_patterns` registered as `file:<id>:<member>`.
class ArchiveOperationHandler : public OperationHandler {
public:
    ArchiveOperationHandler(std::shared_ptr<LocationRegistry> locations,
                            std::shared_ptr<ArchiveCatalog> catalog,
                            std::shared_ptr<CacheStore> cache,
                            size_t chunk_size = 8 * 1024 * 1024);

    bool can_handle(const OperationPayload& payload) const override;
    OperationOutcome execute(const OperationPayload& payload, const CancellationToken& token) override;
    std::string operation_type() const override { return "bulk_archive"; }

private:
    struct ItemResult {
        uint64_t bytes = 0;
        std::vector<std::string> warnings;
    };

    ItemResult copy_archive(const BulkArchiveOperation& op, const ArchiveRef& ref,
                            const CancellationToken& token);
    ItemResult move_archive(const BulkArchiveOperation& op, const ArchiveRef& ref,
                            const CancellationToken& token);
    ItemResult extract_archive(const BulkArchiveOperation& op, const std::string& archive_id,
                               const ArchiveRef& ref, const CancellationToken& token);

    std::shared_ptr<LocationRegistry> locations_;
    std::shared_ptr<ArchiveCatalog> catalog_;
    std::shared_ptr<CacheStore> cache_;
    std::shared_ptr<LocalStorage> cache_storage_;
    size_t chunk_size_;
};

/// Single, batch and directory file transfers between locations.
class TransferOperationHandler : public OperationHandler {
public:
    explicit TransferOperationHandler(std::shared_ptr<LocationRegistry> locations);

    bool can_handle(const OperationPayload& payload) const override;
    OperationOutcome execute(const OperationPayload& payload, const CancellationToken& token) override;
    std::string operation_type() const override { return "file_transfer"; }

    /// One file; returns bytes written. Throws on any failure.
    uint64_t transfer(const FileTransfer& t, bool verify, const CancellationToken& token);

private:
    OperationOutcome run_batch(const std::vector<FileTransfer>& transfers, size_t parallel,
                               bool stop_on_error, bool verify_all, const CancellationToken& token);
    OperationOutcome run_directory(const DirectoryTransfer& op, const CancellationToken& token);

    std::shared_ptr<LocationRegistry> locations_;
};

}  // namespace esmcache
