#pragma once

#include "esmcache/cache_store.hpp"
#include "esmcache/operation.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace esmcache {

/// One named storage location.
struct LocationConfig {
    std::filesystem::path path;   // local or NFS mount root
    bool tape = false;            // reads go through the HSM staging protocol
    std::string hsm_root;         // root as the HSM sees it; default: path

    /// Returns error message or empty string.
    std::string validate() const;
};

/// A catalogued archive: which location holds it and where.
struct ArchiveConfig {
    std::string location;
    std::string path;
};

/// Connection and polling settings for the HSM REST API.
struct HsmConfig {
    std::string api_url = "https://hsm.dmawi.de:8080/v1";
    std::string account;
    std::string password;         // or ESMCACHE_HSM_PASSWORD env
    bool verify_ssl = true;
    std::string ca_cert;
    size_t stage_timeout_secs = 180;
    size_t stage_poll_ms = 1000;
    size_t staging_threads = 2;
};

/// Configuration for the esm-cache batch runner.
struct ServiceConfig {
    // Queue
    size_t max_concurrent = 3;
    Priority default_priority = Priority::Normal;

    // Cache
    CacheConfiguration cache;

    // HSM staging
    HsmConfig hsm;

    // Storage
    std::map<std::string, LocationConfig> locations;
    std::map<std::string, ArchiveConfig> archives;

    // Jobs to run (JSON file with a "jobs" array)
    std::filesystem::path jobs_file;

    // Daemon
    bool verbose = false;
    std::filesystem::path log_file;
    size_t stats_interval_secs = 60;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;    // e.g. /var/lib/node_exporter/textfile/esmcache.prom
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<ServiceConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults (cache directory, hsm roots, env password).
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// Human-readable summary with secrets masked.
    std::string describe() const;

    bool has_tape_locations() const;
};

/// "name=path" as given to --location.
std::optional<std::pair<std::string, std::string>> split_assignment(const std::string& arg);

}  // namespace esmcache
