#include "esmcache/cache_manifest.hpp"
#include "esmcache/errors.hpp"
#include "esmcache/log.hpp"

#include <sqlite3.h>

#include <sstream>
#include <thread>

namespace esmcache {

namespace {

constexpr const char* MANIFEST_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS cache_entries (
    key TEXT PRIMARY KEY,
    size INTEGER NOT NULL,
    entry_type TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    last_access INTEGER NOT NULL,
    access_count INTEGER NOT NULL DEFAULT 1,
    access_seq INTEGER NOT NULL DEFAULT 0,
    tags TEXT NOT NULL DEFAULT ''
) WITHOUT ROWID;
)";

int64_t to_epoch_ms(SystemTime t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

SystemTime from_epoch_ms(int64_t ms) {
    return SystemTime(std::chrono::duration_cast<SystemTime::duration>(std::chrono::milliseconds(ms)));
}

// Tags are stored newline separated
std::string join_tags(const std::set<std::string>& tags) {
    std::string out;
    for (const auto& t : tags) {
        if (!out.empty()) out.push_back('\n');
        out += t;
    }
    return out;
}

std::set<std::string> split_tags(const std::string& s) {
    std::set<std::string> tags;
    std::istringstream in(s);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) tags.insert(line);
    }
    return tags;
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

void prepare(sqlite3* db, const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db, sql, -1, stmt, nullptr) != SQLITE_OK) {
        throw StorageError(std::string("cannot prepare manifest statement: ") + sqlite3_errmsg(db));
    }
}

}  // namespace

CacheManifest::CacheManifest(const std::filesystem::path& db_path) : db_path_(db_path) {
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("cannot open manifest " + db_path_.string() + ": " + msg);
    }

    // WAL mode for concurrent readers
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, MANIFEST_SCHEMA)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("cannot create manifest schema in " + db_path_.string());
    }

    try {
        prepare(db_,
                "INSERT OR REPLACE INTO cache_entries "
                "(key, size, entry_type, created_at, last_access, access_count, access_seq, tags) "
                "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)",
                &stmt_upsert_);
        prepare(db_, "DELETE FROM cache_entries WHERE key = ?1", &stmt_erase_);
        prepare(db_,
                "SELECT key, size, entry_type, created_at, last_access, access_count, access_seq, tags "
                "FROM cache_entries",
                &stmt_load_);
    } catch (const StorageError&) {
        if (stmt_upsert_) sqlite3_finalize(stmt_upsert_);
        if (stmt_erase_) sqlite3_finalize(stmt_erase_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

CacheManifest::~CacheManifest() {
    if (stmt_upsert_) sqlite3_finalize(stmt_upsert_);
    if (stmt_erase_) sqlite3_finalize(stmt_erase_);
    if (stmt_load_) sqlite3_finalize(stmt_load_);

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

std::vector<CacheEntry> CacheManifest::load_all() {
    std::vector<CacheEntry> result;
    sqlite3_reset(stmt_load_);

    int rc;
    while ((rc = sql_step_retry(stmt_load_)) == SQLITE_ROW) {
        const char* key = reinterpret_cast<const char*>(sqlite3_column_text(stmt_load_, 0));
        const char* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt_load_, 2));
        const char* tags = reinterpret_cast<const char*>(sqlite3_column_text(stmt_load_, 7));
        if (!key || !type) continue;

        auto parsed_type = parse_entry_type(type);
        if (!parsed_type) {
            log_warn("Manifest entry %s has unknown type '%s', skipping", key, type);
            continue;
        }

        CacheEntry entry;
        entry.key = key;
        entry.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt_load_, 1));
        entry.entry_type = *parsed_type;
        entry.created_at = from_epoch_ms(sqlite3_column_int64(stmt_load_, 3));
        entry.last_accessed_at = from_epoch_ms(sqlite3_column_int64(stmt_load_, 4));
        entry.access_count = static_cast<uint64_t>(sqlite3_column_int64(stmt_load_, 5));
        entry.access_sequence = static_cast<uint64_t>(sqlite3_column_int64(stmt_load_, 6));
        if (tags) entry.tags = split_tags(tags);
        result.push_back(std::move(entry));
    }
    sqlite3_reset(stmt_load_);

    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("failed to read manifest: ") + sqlite3_errmsg(db_));
    }
    return result;
}

bool CacheManifest::upsert(const CacheEntry& entry) {
    std::string tags = join_tags(entry.tags);

    sqlite3_reset(stmt_upsert_);
    sqlite3_bind_text(stmt_upsert_, 1, entry.key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_upsert_, 2, static_cast<int64_t>(entry.size_bytes));
    sqlite3_bind_text(stmt_upsert_, 3, to_string(entry.entry_type), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt_upsert_, 4, to_epoch_ms(entry.created_at));
    sqlite3_bind_int64(stmt_upsert_, 5, to_epoch_ms(entry.last_accessed_at));
    sqlite3_bind_int64(stmt_upsert_, 6, static_cast<int64_t>(entry.access_count));
    sqlite3_bind_int64(stmt_upsert_, 7, static_cast<int64_t>(entry.access_sequence));
    sqlite3_bind_text(stmt_upsert_, 8, tags.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sql_step_retry(stmt_upsert_);
    if (rc != SQLITE_DONE) {
        log_error("Manifest write failed for %s: %s", entry.key.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool CacheManifest::erase(const std::string& key) {
    sqlite3_reset(stmt_erase_);
    sqlite3_bind_text(stmt_erase_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_erase_);
    if (rc != SQLITE_DONE) {
        log_error("Manifest delete failed for %s: %s", key.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool CacheManifest::clear() {
    return sql_exec(db_, "DELETE FROM cache_entries");
}

}  // namespace esmcache
