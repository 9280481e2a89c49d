#include "esmcache/handlers.hpp"
#include "esmcache/cache_store.hpp"
#include "esmcache/errors.hpp"
#include "esmcache/log.hpp"
#include "meridian/core/thread_pool.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>

namespace esmcache {

// ============================================================================
// LocationRegistry / ArchiveCatalog
// ============================================================================

void LocationRegistry::add(const std::string& name, std::shared_ptr<StorageCapability> storage) {
    if (name.empty()) throw ValidationError("location name must not be empty");
    if (!storage) throw ValidationError("location '" + name + "' has no storage");
    locations_[name] = std::move(storage);
}

std::shared_ptr<StorageCapability> LocationRegistry::get(const std::string& name) const {
    auto it = locations_.find(name);
    if (it == locations_.end()) throw ValidationError("unknown location: " + name);
    return it->second;
}

std::vector<std::string> LocationRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(locations_.size());
    for (const auto& [name, storage] : locations_) out.push_back(name);
    return out;
}

std::optional<ArchiveRef> ArchiveCatalog::find(const std::string& archive_id) const {
    auto it = archives_.find(archive_id);
    if (it == archives_.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// ArchiveOperationHandler
// ============================================================================

namespace {

std::string base_name(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto pos = p.rfind('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string member_of(const std::string& full, const std::string& root) {
    std::string prefix = root;
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    if (full.size() > prefix.size() && full.compare(0, prefix.size(), prefix) == 0 &&
        full[prefix.size()] == '/') {
        return full.substr(prefix.size() + 1);
    }
    return full;
}

// Regular files of a directory-shaped archive, relative to the storage root
std::vector<FileInfo> archive_members(const StorageCapability& storage, const std::string& root) {
    auto listing = storage.list(root, true);
    if (!listing.success) {
        throw StorageError("cannot list archive " + root + ": " + listing.error_message);
    }
    std::vector<FileInfo> files;
    for (auto& e : listing.entries) {
        if (!e.is_directory) files.push_back(std::move(e));
    }
    return files;
}

}  // namespace

ArchiveOperationHandler::ArchiveOperationHandler(std::shared_ptr<LocationRegistry> locations,
                                                 std::shared_ptr<ArchiveCatalog> catalog,
                                                 std::shared_ptr<CacheStore> cache,
                                                 size_t chunk_size)
    : locations_(std::move(locations))
    , catalog_(std::move(catalog))
    , cache_(std::move(cache))
    , chunk_size_(chunk_size) {
    if (!locations_ || !catalog_) {
        throw ValidationError("archive handler requires locations and a catalog");
    }
    if (cache_) {
        cache_storage_ = std::make_shared<LocalStorage>(cache_->config().directory);
    }
}

bool ArchiveOperationHandler::can_handle(const OperationPayload& payload) const {
    return std::holds_alternative<BulkArchiveOperation>(payload);
}

OperationOutcome ArchiveOperationHandler::execute(const OperationPayload& payload,
                                                  const CancellationToken& token) {
    const auto& op = std::get<BulkArchiveOperation>(payload);
    if (op.kind == BulkArchiveKind::Extract && !cache_) {
        throw OperationNotAllowed("extract requires a cache store");
    }

    OperationOutcome outcome;
    std::mutex outcome_mutex;
    std::atomic<bool> halted{false};
    std::atomic<size_t> skipped{0};

    auto run_one = [&](const std::string& archive_id) {
        if (halted.load() || token.is_cancelled()) {
            skipped++;
            return;
        }
        try {
            auto ref = catalog_->find(archive_id);
            if (!ref) throw ValidationError("unknown archive: " + archive_id);

            ItemResult item;
            switch (op.kind) {
                case BulkArchiveKind::Copy: item = copy_archive(op, *ref, token); break;
                case BulkArchiveKind::Move: item = move_archive(op, *ref, token); break;
                case BulkArchiveKind::Extract:
                    item = extract_archive(op, archive_id, *ref, token);
                    break;
            }

            std::lock_guard lock(outcome_mutex);
            outcome.bytes_moved += item.bytes;
            outcome.succeeded_items.push_back(archive_id);
            for (auto& w : item.warnings) outcome.warnings.push_back(archive_id + ": " + w);
        } catch (const OperationCancelled&) {
            skipped++;
        } catch (const std::exception& e) {
            log_warn("%s of archive %s failed: %s", to_string(op.kind), archive_id.c_str(), e.what());
            std::lock_guard lock(outcome_mutex);
            outcome.failed_items.push_back(archive_id + ": " + e.what());
            outcome.sub_failures++;
            if (op.stop_on_error) halted = true;
        }
    };

    size_t workers = std::min(op.parallel_operations, op.archive_ids.size());
    if (workers <= 1) {
        for (const auto& id : op.archive_ids) run_one(id);
    } else {
        meridian::ThreadPool pool(workers);
        std::vector<std::future<void>> futures;
        futures.reserve(op.archive_ids.size());
        for (const auto& id : op.archive_ids) {
            futures.push_back(pool.submit([&run_one, &id] { run_one(id); }));
        }
        for (auto& f : futures) f.get();
    }

    token.throw_if_cancelled(std::string("bulk ") + to_string(op.kind));

    if (skipped > 0) {
        outcome.warnings.push_back("skipped " + std::to_string(skipped.load()) +
                                   " archives after a failure");
    }
    outcome.ok = true;
    outcome.message = std::string(to_string(op.kind)) + ": " +
                      std::to_string(outcome.succeeded_items.size()) + " succeeded, " +
                      std::to_string(outcome.failed_items.size()) + " failed";
    return outcome;
}

ArchiveOperationHandler::ItemResult ArchiveOperationHandler::copy_archive(
    const BulkArchiveOperation& op, const ArchiveRef& ref, const CancellationToken& token) {
    auto src = locations_->get(ref.location);
    auto dst = locations_->get(op.destination_location);

    auto fi = src->info(ref.path);
    if (!fi) throw StorageError("archive not found: " + ref.location + ":" + ref.path);

    std::string target = base_name(ref.path);
    if (!op.simulation_id.empty()) target = op.simulation_id + "/" + target;

    ItemResult result;
    if (!fi->is_directory) {
        src->prepare(ref.path, token);
        result.bytes = copy_between(*src, ref.path, *dst, target, chunk_size_, token).bytes;
        return result;
    }

    for (const auto& member : archive_members(*src, ref.path)) {
        src->prepare(member.path, token);
        auto dest = target + "/" + member_of(member.path, ref.path);
        result.bytes += copy_between(*src, member.path, *dst, dest, chunk_size_, token).bytes;
    }
    return result;
}

ArchiveOperationHandler::ItemResult ArchiveOperationHandler::move_archive(
    const BulkArchiveOperation& op, const ArchiveRef& ref, const CancellationToken& token) {
    auto src = locations_->get(ref.location);
    bool is_dir = src->info(ref.path).value_or(FileInfo{}).is_directory;

    // Removal list is taken before copying; the copy itself must succeed
    std::vector<std::string> to_remove;
    if (is_dir) {
        auto listing = src->list(ref.path, true);
        if (listing.success) {
            for (const auto& e : listing.entries) to_remove.push_back(e.path);
        }
        // Deepest first so directories are empty when reached
        std::sort(to_remove.rbegin(), to_remove.rend());
    }
    to_remove.push_back(ref.path);

    auto result = copy_archive(op, ref, token);

    for (const auto& path : to_remove) {
        if (!src->remove(path)) {
            result.warnings.push_back("could not remove source " + ref.location + ":" + path);
        }
    }
    return result;
}

ArchiveOperationHandler::ItemResult ArchiveOperationHandler::extract_archive(
    const BulkArchiveOperation& op, const std::string& archive_id, const ArchiveRef& ref,
    const CancellationToken& token) {
    auto src = locations_->get(ref.location);
    auto fi = src->info(ref.path);
    if (!fi) throw StorageError("archive not found: " + ref.location + ":" + ref.path);

    std::set<std::string> tags;
    if (!op.simulation_id.empty()) tags.insert(op.simulation_id);

    const auto& cache_dir = cache_->config().directory;
    ItemResult result;

    // Reserve in the cache, then materialize; a failed copy releases the entry
    auto materialize = [&](const std::string& key, const std::string& path, uint64_t size,
                           CacheEntryType type) {
        if (cache_->contains(key)) {
            cache_->touch(key);
            result.warnings.push_back("already cached: " + key);
            return;
        }
        auto put = cache_->put(key, size, type, tags);
        if (!put.success) {
            if (put.limit > 0) throw ResourceLimitExceeded(put.limit, put.attempted);
            throw StorageError(put.error_message);
        }
        auto rel = std::filesystem::relative(cache_->path_for(key), cache_dir).generic_string();
        try {
            src->prepare(path, token);
            result.bytes += copy_between(*src, path, *cache_storage_, rel, chunk_size_, token).bytes;
        } catch (const std::exception&) {
            cache_->remove(key);
            throw;
        }
    };

    if (!fi->is_directory) {
        if (!op.include_patterns.empty()) {
            result.warnings.push_back("member filters apply to directory archives only; "
                                      "extracting whole archive");
        }
        materialize(archive_cache_key(archive_id), ref.path, fi->size, CacheEntryType::Archive);
        return result;
    }

    size_t extracted = 0;
    for (const auto& member : archive_members(*src, ref.path)) {
        auto rel = member_of(member.path, ref.path);
        if (!op.include_patterns.empty()) {
            bool wanted = std::any_of(op.include_patterns.begin(), op.include_patterns.end(),
                                      [&](const std::string& p) {
                                          return glob_match(p, rel) || glob_match(p, base_name(rel));
                                      });
            if (!wanted) continue;
        }
        materialize(file_cache_key(archive_id, rel), member.path, member.size,
                    CacheEntryType::File);
        ++extracted;
    }
    if (extracted == 0) result.warnings.push_back("no members matched");
    return result;
}

}  // namespace esmcache
