#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace esmcache {

class CacheManifest;

enum class CleanupPolicy { Lru, SizeOnly, Manual };

const char* to_string(CleanupPolicy policy);
std::optional<CleanupPolicy> parse_cleanup_policy(const std::string& name);

enum class CacheEntryType { Archive, File };

const char* to_string(CacheEntryType type);
std::optional<CacheEntryType> parse_entry_type(const std::string& name);

/// Policy for a CacheStore. Fixed for the store's lifetime.
struct CacheConfiguration {
    std::filesystem::path directory;                      // default: ~/.cache/esm-cache
    uint64_t archive_size_limit = 50ULL * 1024 * 1024 * 1024;  // 50 GiB
    uint64_t file_size_limit = 10ULL * 1024 * 1024 * 1024;     // 10 GiB
    CleanupPolicy cleanup_policy = CleanupPolicy::Lru;

    // One shared pool bounded by archive_size_limit instead of per-type pools
    bool unified_cache = false;

    // Journal entries to <directory>/manifest.db and reload them on startup
    bool persist_manifest = false;

    /// $HOME/.cache/esm-cache, or ./.esm-cache when HOME is unset.
    static std::filesystem::path default_directory();

    /// Returns error message or empty string.
    std::string validate() const;
};

using SystemTime = std::chrono::system_clock::time_point;

struct CacheEntry {
    std::string key;              // "archive:<id>" or "file:<archive>:<path>"
    uint64_t size_bytes = 0;
    SystemTime created_at;
    SystemTime last_accessed_at;
    uint64_t access_count = 0;
    CacheEntryType entry_type = CacheEntryType::Archive;
    std::set<std::string> tags;
    uint64_t access_sequence = 0;  // orders entries touched within one clock tick
};

struct CachePutResult {
    bool success = false;
    std::string error_message;
    uint64_t limit = 0;           // set on ResourceLimitExceeded
    uint64_t attempted = 0;
    uint64_t entries_evicted = 0;
    uint64_t bytes_evicted = 0;
};

struct CleanupResult {
    uint64_t entries_removed = 0;
    uint64_t bytes_removed = 0;
};

struct CacheStatus {
    uint64_t total_limit = 0;
    uint64_t used = 0;
    uint64_t available = 0;
    size_t entry_count = 0;
    size_t archive_count = 0;
    size_t file_count = 0;
    std::optional<SystemTime> oldest_entry;
    std::optional<SystemTime> newest_entry;
    CleanupPolicy cleanup_policy = CleanupPolicy::Lru;
    std::optional<SystemTime> last_cleanup;
};

inline std::string archive_cache_key(const std::string& archive_id) {
    return "archive:" + archive_id;
}

inline std::string file_cache_key(const std::string& archive_id, const std::string& path) {
    return "file:" + archive_id + ":" + path;
}

/// Bounded index of cached archives and extracted files.
///
/// Eviction runs when an insert would overflow its pool: once the pool
/// would pass 80% of its limit, entries are dropped in policy order until it
/// is back at 70%. Evicted entries have their materialized file deleted.
/// All methods are thread-safe.
class CacheStore {
public:
    explicit CacheStore(CacheConfiguration config);
    ~CacheStore();

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    /// Insert or replace `key`. All-or-nothing: on ResourceLimitExceeded
    /// nothing is inserted and success is false.
    CachePutResult put(const std::string& key, uint64_t size_bytes, CacheEntryType type,
                       const std::set<std::string>& tags = {});

    /// Record an access. Returns false for unknown keys.
    bool touch(const std::string& key);

    bool remove(const std::string& key);

    /// Evict per policy. Without `force`, nothing happens below the 80%
    /// trigger; with it, every entry is dropped. MANUAL never evicts.
    CleanupResult cleanup(bool force = false);

    /// Drop every entry and its materialized file.
    CleanupResult clear();

    std::optional<CacheEntry> get(const std::string& key) const;
    bool contains(const std::string& key) const;
    std::vector<CacheEntry> entries() const;
    CacheStatus status() const;

    /// Where the cached bytes of `key` live: <directory>/<h[0:2]>/<h>, h being
    /// the SHA-256 of the key in hex.
    std::filesystem::path path_for(const std::string& key) const;

    const CacheConfiguration& config() const { return config_; }

    struct Stats {
        uint64_t puts = 0;
        uint64_t rejected_puts = 0;
        uint64_t evictions = 0;
        uint64_t evicted_bytes = 0;
        uint64_t hits = 0;
        uint64_t misses = 0;
    };
    Stats get_stats() const;

private:
    enum class Pool { Archive, File, Shared };

    Pool pool_of(CacheEntryType type) const;
    uint64_t pool_limit(Pool pool) const;
    uint64_t pool_used(Pool pool, const std::string& exclude_key = {}) const;

    // Requires mutex_. Drops policy-ordered entries of `pool` (never
    // `protected_key`) until `used` falls to `target`, or all of them if forced.
    CleanupResult evict_to(Pool pool, const std::string& protected_key, uint64_t used,
                           uint64_t target, bool force);

    std::vector<std::map<std::string, CacheEntry>::iterator> eviction_order(
        Pool pool, const std::string& protected_key);
    void erase_entry(std::map<std::string, CacheEntry>::iterator it);
    CleanupResult cleanup_pool(Pool pool, bool force);
    std::vector<Pool> pools() const;

    CacheConfiguration config_;

    mutable std::mutex mutex_;
    std::map<std::string, CacheEntry> entries_;
    uint64_t next_access_sequence_ = 0;
    std::optional<SystemTime> last_cleanup_;
    mutable Stats stats_;

    std::unique_ptr<CacheManifest> manifest_;  // null unless persist_manifest
};

}  // namespace esmcache
