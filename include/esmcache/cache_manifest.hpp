#pragma once

#include "esmcache/cache_store.hpp"

#include <filesystem>
#include <string>
#include <vector>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace esmcache {

/// SQLite journal of CacheStore entries (WAL mode).
///
/// Not internally synchronized; the owning CacheStore serializes calls.
class CacheManifest {
public:
    /// Opens or creates the database. Throws StorageError on failure.
    explicit CacheManifest(const std::filesystem::path& db_path);
    ~CacheManifest();

    CacheManifest(const CacheManifest&) = delete;
    CacheManifest& operator=(const CacheManifest&) = delete;

    std::vector<CacheEntry> load_all();

    // Write failures are logged; the in-memory index stays authoritative
    bool upsert(const CacheEntry& entry);
    bool erase(const std::string& key);
    bool clear();

    const std::filesystem::path& path() const { return db_path_; }

private:
    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_erase_ = nullptr;
    sqlite3_stmt* stmt_load_ = nullptr;
};

}  // namespace esmcache
