#include "esmcache/cache_store.hpp"
#include "esmcache/cache_manifest.hpp"
#include "esmcache/errors.hpp"
#include "esmcache/log.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cstdlib>

namespace esmcache {

namespace fs = std::filesystem;

namespace {

// Hysteresis band: evict once past the trigger, stop at the target
constexpr double kCleanupTrigger = 0.8;
constexpr double kCleanupTarget = 0.7;

uint64_t fraction_of(uint64_t limit, double fraction) {
    return static_cast<uint64_t>(static_cast<double>(limit) * fraction);
}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        throw StorageError("SHA-256 digest failed");
    }
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

}  // namespace

// --- Enums ---

const char* to_string(CleanupPolicy policy) {
    switch (policy) {
        case CleanupPolicy::Lru: return "lru";
        case CleanupPolicy::SizeOnly: return "size_only";
        case CleanupPolicy::Manual: return "manual";
    }
    return "lru";
}

std::optional<CleanupPolicy> parse_cleanup_policy(const std::string& name) {
    if (name == "lru" || name == "LRU") return CleanupPolicy::Lru;
    if (name == "size_only" || name == "SIZE_ONLY" || name == "size") return CleanupPolicy::SizeOnly;
    if (name == "manual" || name == "MANUAL") return CleanupPolicy::Manual;
    return std::nullopt;
}

const char* to_string(CacheEntryType type) {
    return type == CacheEntryType::Archive ? "archive" : "file";
}

std::optional<CacheEntryType> parse_entry_type(const std::string& name) {
    if (name == "archive") return CacheEntryType::Archive;
    if (name == "file") return CacheEntryType::File;
    return std::nullopt;
}

// --- CacheConfiguration ---

fs::path CacheConfiguration::default_directory() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".cache" / "esm-cache";
    }
    return fs::path(".esm-cache");
}

std::string CacheConfiguration::validate() const {
    if (directory.empty()) return "cache directory is required";
    if (archive_size_limit == 0) return "archive_size_limit must be > 0";
    if (file_size_limit == 0) return "file_size_limit must be > 0";
    return {};
}

// ============================================================================
// CacheStore
// ============================================================================

CacheStore::CacheStore(CacheConfiguration config) : config_(std::move(config)) {
    if (config_.directory.empty()) config_.directory = CacheConfiguration::default_directory();
    auto err = config_.validate();
    if (!err.empty()) throw ValidationError(err);

    std::error_code ec;
    fs::create_directories(config_.directory, ec);
    if (ec) {
        throw StorageError("cannot create cache directory " + config_.directory.string() + ": " +
                           ec.message());
    }

    if (config_.persist_manifest) {
        manifest_ = std::make_unique<CacheManifest>(config_.directory / "manifest.db");
        for (auto& entry : manifest_->load_all()) {
            next_access_sequence_ = std::max(next_access_sequence_, entry.access_sequence + 1);
            entries_.emplace(entry.key, std::move(entry));
        }
        log_info("Cache manifest loaded: %zu entries from %s", entries_.size(),
                 manifest_->path().c_str());
    }
}

CacheStore::~CacheStore() = default;

CacheStore::Pool CacheStore::pool_of(CacheEntryType type) const {
    if (config_.unified_cache) return Pool::Shared;
    return type == CacheEntryType::Archive ? Pool::Archive : Pool::File;
}

uint64_t CacheStore::pool_limit(Pool pool) const {
    return pool == Pool::File ? config_.file_size_limit : config_.archive_size_limit;
}

std::vector<CacheStore::Pool> CacheStore::pools() const {
    if (config_.unified_cache) return {Pool::Shared};
    return {Pool::Archive, Pool::File};
}

uint64_t CacheStore::pool_used(Pool pool, const std::string& exclude_key) const {
    uint64_t used = 0;
    for (const auto& [key, entry] : entries_) {
        if (key == exclude_key) continue;
        if (pool_of(entry.entry_type) == pool) used += entry.size_bytes;
    }
    return used;
}

std::vector<std::map<std::string, CacheEntry>::iterator> CacheStore::eviction_order(
    Pool pool, const std::string& protected_key) {
    std::vector<std::map<std::string, CacheEntry>::iterator> order;
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == protected_key) continue;
        if (pool_of(it->second.entry_type) == pool) order.push_back(it);
    }

    auto older = [](const CacheEntry& a, const CacheEntry& b) {
        if (a.last_accessed_at != b.last_accessed_at) return a.last_accessed_at < b.last_accessed_at;
        return a.access_sequence < b.access_sequence;
    };

    if (config_.cleanup_policy == CleanupPolicy::SizeOnly) {
        std::sort(order.begin(), order.end(), [&](const auto& a, const auto& b) {
            if (a->second.size_bytes != b->second.size_bytes) {
                return a->second.size_bytes > b->second.size_bytes;
            }
            return older(a->second, b->second);
        });
    } else {
        std::sort(order.begin(), order.end(),
                  [&](const auto& a, const auto& b) { return older(a->second, b->second); });
    }
    return order;
}

void CacheStore::erase_entry(std::map<std::string, CacheEntry>::iterator it) {
    std::error_code ec;
    auto path = path_for(it->first);
    if (fs::remove(path, ec)) {
        log_debug("Deleted cached file %s", path.c_str());
    } else if (ec) {
        log_warn("Failed to delete cached file %s: %s", path.c_str(), ec.message().c_str());
    }
    if (manifest_) manifest_->erase(it->first);
    entries_.erase(it);
}

CleanupResult CacheStore::evict_to(Pool pool, const std::string& protected_key, uint64_t used,
                                   uint64_t target, bool force) {
    CleanupResult result;
    for (auto it : eviction_order(pool, protected_key)) {
        if (!force && used <= target) break;
        uint64_t size = it->second.size_bytes;
        log_debug("Evicting %s (%lu bytes, policy %s)", it->first.c_str(),
                  static_cast<unsigned long>(size), to_string(config_.cleanup_policy));
        erase_entry(it);
        used -= std::min(used, size);
        result.entries_removed++;
        result.bytes_removed += size;
    }
    stats_.evictions += result.entries_removed;
    stats_.evicted_bytes += result.bytes_removed;
    return result;
}

// --- Mutations ---

CachePutResult CacheStore::put(const std::string& key, uint64_t size_bytes, CacheEntryType type,
                               const std::set<std::string>& tags) {
    if (key.empty()) throw ValidationError("cache key must not be empty");

    CachePutResult result;
    std::lock_guard lock(mutex_);

    Pool pool = pool_of(type);
    uint64_t limit = pool_limit(pool);
    uint64_t used = pool_used(pool, key);

    auto reject = [&](uint64_t attempted) {
        ResourceLimitExceeded err(limit, attempted);
        result.success = false;
        result.error_message = err.what();
        result.limit = limit;
        result.attempted = attempted;
        stats_.rejected_puts++;
        log_error("Cache put %s rejected: %s", key.c_str(), result.error_message.c_str());
        return result;
    };

    // Cannot fit even in an empty pool; fail before evicting anything
    if (size_bytes > limit) return reject(used + size_bytes);

    if (used + size_bytes > limit && config_.cleanup_policy != CleanupPolicy::Manual) {
        // Projected usage drives the band so the incoming entry lands at or below the target
        auto evicted = evict_to(pool, key, used + size_bytes, fraction_of(limit, kCleanupTarget),
                                false);
        result.entries_evicted = evicted.entries_removed;
        result.bytes_evicted = evicted.bytes_removed;
        last_cleanup_ = std::chrono::system_clock::now();
        used = pool_used(pool, key);
    }

    if (used + size_bytes > limit) return reject(used + size_bytes);

    auto now = std::chrono::system_clock::now();
    CacheEntry entry;
    entry.key = key;
    entry.size_bytes = size_bytes;
    entry.created_at = now;
    entry.last_accessed_at = now;
    entry.access_count = 1;
    entry.entry_type = type;
    entry.tags = tags;
    entry.access_sequence = next_access_sequence_++;

    if (manifest_) manifest_->upsert(entry);
    entries_[key] = std::move(entry);
    stats_.puts++;

    result.success = true;
    return result;
}

bool CacheStore::touch(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        stats_.misses++;
        return false;
    }
    it->second.last_accessed_at = std::chrono::system_clock::now();
    it->second.access_count++;
    it->second.access_sequence = next_access_sequence_++;
    if (manifest_) manifest_->upsert(it->second);
    stats_.hits++;
    return true;
}

bool CacheStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    erase_entry(it);
    return true;
}

CleanupResult CacheStore::cleanup_pool(Pool pool, bool force) {
    uint64_t limit = pool_limit(pool);
    uint64_t used = pool_used(pool);
    if (!force && used <= fraction_of(limit, kCleanupTrigger)) return {};
    return evict_to(pool, {}, used, fraction_of(limit, kCleanupTarget), force);
}

CleanupResult CacheStore::cleanup(bool force) {
    CleanupResult total;
    std::lock_guard lock(mutex_);
    if (config_.cleanup_policy == CleanupPolicy::Manual) return total;

    for (Pool pool : pools()) {
        auto r = cleanup_pool(pool, force);
        total.entries_removed += r.entries_removed;
        total.bytes_removed += r.bytes_removed;
    }
    last_cleanup_ = std::chrono::system_clock::now();

    if (total.entries_removed > 0) {
        log_info("Cache cleanup (%s%s): removed %lu entries, %lu bytes",
                 to_string(config_.cleanup_policy), force ? ", forced" : "",
                 static_cast<unsigned long>(total.entries_removed),
                 static_cast<unsigned long>(total.bytes_removed));
    }
    return total;
}

CleanupResult CacheStore::clear() {
    CleanupResult result;
    std::lock_guard lock(mutex_);
    while (!entries_.empty()) {
        result.entries_removed++;
        result.bytes_removed += entries_.begin()->second.size_bytes;
        erase_entry(entries_.begin());
    }
    if (manifest_) manifest_->clear();
    return result;
}

// --- Queries ---

std::optional<CacheEntry> CacheStore::get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool CacheStore::contains(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(key) > 0;
}

std::vector<CacheEntry> CacheStore::entries() const {
    std::lock_guard lock(mutex_);
    std::vector<CacheEntry> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) result.push_back(entry);
    return result;
}

CacheStatus CacheStore::status() const {
    std::lock_guard lock(mutex_);
    CacheStatus s;
    s.total_limit = config_.unified_cache ? config_.archive_size_limit
                                          : config_.archive_size_limit + config_.file_size_limit;
    for (const auto& [key, entry] : entries_) {
        s.used += entry.size_bytes;
        if (entry.entry_type == CacheEntryType::Archive) {
            s.archive_count++;
        } else {
            s.file_count++;
        }
        if (!s.oldest_entry || entry.created_at < *s.oldest_entry) s.oldest_entry = entry.created_at;
        if (!s.newest_entry || entry.created_at > *s.newest_entry) s.newest_entry = entry.created_at;
    }
    s.entry_count = entries_.size();
    s.available = s.total_limit > s.used ? s.total_limit - s.used : 0;
    s.cleanup_policy = config_.cleanup_policy;
    s.last_cleanup = last_cleanup_;
    return s;
}

fs::path CacheStore::path_for(const std::string& key) const {
    std::string h = sha256_hex(key);
    return config_.directory / h.substr(0, 2) / h;
}

CacheStore::Stats CacheStore::get_stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

}  // namespace esmcache
