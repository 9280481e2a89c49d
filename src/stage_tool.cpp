// esm-cache-stage: Standalone tool for the HSM staging API and the cache.
//
// Usage: esm-cache-stage [options] <subcommand> [args]
//
// Subcommands:
//   filesystems                  HSM filesystems and their mount points
//   status <path>...             Online/offline blocks per file
//   request <path>...            Issue stage requests without waiting
//   stage <path>...              Stage files and wait until they are online
//   queues                       Raw HSM queue listing
//   cache-status                 Usage of a persistent cache directory
//   cache-cleanup [--force]      Run the eviction policy on it

#include "esmcache/cache_store.hpp"
#include "esmcache/errors.hpp"
#include "esmcache/http_transport.hpp"
#include "esmcache/log.hpp"
#include "esmcache/staging_controller.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <future>
#include <string>
#include <vector>

using namespace esmcache;

namespace {

void format_timestamp(SystemTime tp, char* buf, size_t buf_size) {
    time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    strftime(buf, buf_size, "%Y-%m-%dT%H:%M:%SZ", &tm_val);
}

void print_usage() {
    fprintf(stderr,
        "Usage: esm-cache-stage [options] <subcommand> [args]\n"
        "\n"
        "Subcommands:\n"
        "  filesystems                   HSM filesystems and their mount points\n"
        "  status <path>...              Online/offline blocks per file\n"
        "  request <path>...             Issue stage requests without waiting\n"
        "  stage <path>...               Stage files and wait until they are online\n"
        "  queues                        Raw HSM queue listing\n"
        "  cache-status                  Usage of a persistent cache directory\n"
        "  cache-cleanup                 Run the eviction policy on it\n"
        "\n"
        "Options:\n"
        "  --hsm-url <url>               HSM REST API (default: https://hsm.dmawi.de:8080/v1)\n"
        "  --account <name>              HSM account (or ESMCACHE_HSM_ACCOUNT env)\n"
        "  --password <pw>               HSM password (or ESMCACHE_HSM_PASSWORD env)\n"
        "  --no-verify-ssl               Skip SSL verification\n"
        "  --ca-cert <path>              CA certificate for SSL\n"
        "  --timeout <secs>              Stage wait limit (default: 180)\n"
        "  --poll-ms <N>                 Status poll interval (default: 1000)\n"
        "  --parallel <N>                Files staged at once (default: 2)\n"
        "  --cache-dir <path>            Cache directory (default: ~/.cache/esm-cache)\n"
        "  --cleanup-policy <p>          lru, size_only, manual (default: lru)\n"
        "  --force                       cache-cleanup: evict everything\n"
        "  --verbose                     Verbose output\n"
        "  --help                        Show this help\n"
    );
}

struct Options {
    HsmClientOptions hsm;
    CurlTransportOptions transport;
    StagingOptions staging;
    CacheConfiguration cache;
    bool force = false;
};

int run_filesystems(StagingController& sc) {
    for (const auto& fs : sc.filesystems()) {
        printf("%s\t%s\n", fs.fsid.c_str(), fs.mount.c_str());
    }
    return 0;
}

int run_status(StagingController& sc, const std::vector<std::string>& paths) {
    int rc = 0;
    for (const auto& path : paths) {
        try {
            auto st = sc.status(path);
            printf("%s\t%s\tonline=%llu\toffline=%llu\n", path.c_str(),
                   st.is_online() ? "ONLINE" : "OFFLINE",
                   static_cast<unsigned long long>(st.online_blocks),
                   static_cast<unsigned long long>(st.offline_blocks));
        } catch (const Error& e) {
            fprintf(stderr, "%s: %s\n", path.c_str(), e.what());
            rc = 1;
        }
    }
    return rc;
}

int run_request(StagingController& sc, const std::vector<std::string>& paths) {
    int rc = 0;
    for (const auto& path : paths) {
        try {
            sc.stage(path);
            printf("%s\trequested\n", path.c_str());
        } catch (const Error& e) {
            fprintf(stderr, "%s: %s\n", path.c_str(), e.what());
            rc = 1;
        }
    }
    return rc;
}

int run_stage(StagingController& sc, const std::vector<std::string>& paths) {
    std::vector<std::future<void>> futures;
    futures.reserve(paths.size());
    for (const auto& path : paths) {
        futures.push_back(sc.ensure_online_async(path));
    }

    int rc = 0;
    for (size_t i = 0; i < paths.size(); ++i) {
        try {
            futures[i].get();
            printf("%s\tONLINE\n", paths[i].c_str());
        } catch (const Error& e) {
            fprintf(stderr, "%s: %s\n", paths[i].c_str(), e.what());
            rc = 1;
        }
    }

    auto s = sc.get_stats();
    fprintf(stderr, "already online: %llu, staged: %llu, timeouts: %llu\n",
            static_cast<unsigned long long>(s.already_online),
            static_cast<unsigned long long>(s.staged_online),
            static_cast<unsigned long long>(s.timeouts));
    return rc;
}

int run_cache_status(const CacheConfiguration& config) {
    CacheStore store(config);
    auto s = store.status();
    char buf[32];

    printf("Directory:      %s\n", config.directory.c_str());
    printf("Policy:         %s%s\n", to_string(s.cleanup_policy),
           config.unified_cache ? " (unified)" : "");
    printf("Used:           %llu / %llu bytes\n",
           static_cast<unsigned long long>(s.used),
           static_cast<unsigned long long>(s.total_limit));
    printf("Entries:        %zu (%zu archives, %zu files)\n",
           s.entry_count, s.archive_count, s.file_count);
    if (s.oldest_entry) {
        format_timestamp(*s.oldest_entry, buf, sizeof(buf));
        printf("Oldest entry:   %s\n", buf);
    }
    if (s.newest_entry) {
        format_timestamp(*s.newest_entry, buf, sizeof(buf));
        printf("Newest entry:   %s\n", buf);
    }
    return 0;
}

int run_cache_cleanup(const CacheConfiguration& config, bool force) {
    CacheStore store(config);
    auto r = store.cleanup(force);
    printf("Removed %llu entries (%llu bytes)\n",
           static_cast<unsigned long long>(r.entries_removed),
           static_cast<unsigned long long>(r.bytes_removed));
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Options opts;
    opts.cache.directory = CacheConfiguration::default_directory();
    opts.cache.persist_manifest = true;
    if (const char* v = getenv("ESMCACHE_HSM_ACCOUNT")) opts.hsm.account = v;
    if (const char* v = getenv("ESMCACHE_HSM_PASSWORD")) opts.hsm.password = v;

    std::string subcommand;
    std::vector<std::string> args;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--hsm-url") {
            if (++i >= argc) { fprintf(stderr, "--hsm-url requires argument\n"); return 1; }
            opts.hsm.api_url = argv[i];
        } else if (arg == "--account") {
            if (++i >= argc) { fprintf(stderr, "--account requires argument\n"); return 1; }
            opts.hsm.account = argv[i];
        } else if (arg == "--password") {
            if (++i >= argc) { fprintf(stderr, "--password requires argument\n"); return 1; }
            opts.hsm.password = argv[i];
        } else if (arg == "--no-verify-ssl") {
            opts.transport.verify_ssl = false;
        } else if (arg == "--ca-cert") {
            if (++i >= argc) { fprintf(stderr, "--ca-cert requires argument\n"); return 1; }
            opts.transport.ca_bundle = argv[i];
        } else if (arg == "--timeout") {
            if (++i >= argc) { fprintf(stderr, "--timeout requires argument\n"); return 1; }
            opts.staging.default_timeout = std::chrono::seconds(strtoull(argv[i], nullptr, 10));
        } else if (arg == "--poll-ms") {
            if (++i >= argc) { fprintf(stderr, "--poll-ms requires argument\n"); return 1; }
            opts.staging.poll_interval = std::chrono::milliseconds(strtoull(argv[i], nullptr, 10));
        } else if (arg == "--parallel") {
            if (++i >= argc) { fprintf(stderr, "--parallel requires argument\n"); return 1; }
            opts.staging.staging_threads = strtoull(argv[i], nullptr, 10);
        } else if (arg == "--cache-dir") {
            if (++i >= argc) { fprintf(stderr, "--cache-dir requires argument\n"); return 1; }
            opts.cache.directory = argv[i];
        } else if (arg == "--cleanup-policy") {
            if (++i >= argc) { fprintf(stderr, "--cleanup-policy requires argument\n"); return 1; }
            auto p = parse_cleanup_policy(argv[i]);
            if (!p) { fprintf(stderr, "Unknown cleanup policy: %s\n", argv[i]); return 1; }
            opts.cache.cleanup_policy = *p;
        } else if (arg == "--force") {
            opts.force = true;
        } else if (arg == "--verbose") {
            set_verbose(true);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg[0] != '-' && subcommand.empty()) {
            subcommand = arg;
        } else if (arg[0] != '-') {
            args.push_back(arg);
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage();
            return 1;
        }
    }

    if (subcommand.empty()) {
        print_usage();
        return 1;
    }

    try {
        if (subcommand == "cache-status") return run_cache_status(opts.cache);
        if (subcommand == "cache-cleanup") return run_cache_cleanup(opts.cache, opts.force);

        if (opts.hsm.account.empty() || opts.hsm.password.empty()) {
            fprintf(stderr, "HSM account and password are required (--account, --password)\n");
            return 1;
        }
        if (opts.staging.poll_interval.count() == 0 || opts.staging.staging_threads == 0) {
            fprintf(stderr, "--poll-ms and --parallel must be > 0\n");
            return 1;
        }

        auto transport = std::make_shared<CurlHttpTransport>(opts.transport);
        auto client = std::make_shared<HsmClient>(opts.hsm, transport);
        StagingController sc(client, opts.staging);

        if (subcommand == "filesystems") return run_filesystems(sc);
        if (subcommand == "queues") {
            printf("%s\n", sc.queues().dump(2).c_str());
            return 0;
        }

        if (args.empty()) {
            fprintf(stderr, "%s requires at least one path\n", subcommand.c_str());
            return 1;
        }
        if (subcommand == "status") return run_status(sc, args);
        if (subcommand == "request") return run_request(sc, args);
        if (subcommand == "stage") return run_stage(sc, args);

        fprintf(stderr, "Unknown subcommand: %s\n", subcommand.c_str());
        print_usage();
        return 1;
    } catch (const Error& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
