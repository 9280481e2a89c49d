#include "esmcache/config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace esmcache {

namespace {

constexpr uint64_t GIB = 1024ULL * 1024 * 1024;

// Size given either in bytes ("x") or GiB ("x_gb")
void read_size(const nlohmann::json& j, const std::string& key, uint64_t& out) {
    if (j.contains(key)) out = j[key].get<uint64_t>();
    if (j.contains(key + "_gb")) out = j[key + "_gb"].get<uint64_t>() * GIB;
}

std::string mask(const std::string& secret) {
    return secret.empty() ? "(unset)" : "********";
}

}  // namespace

std::optional<std::pair<std::string, std::string>> split_assignment(const std::string& arg) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) return std::nullopt;
    return std::make_pair(arg.substr(0, eq), arg.substr(eq + 1));
}

// --- LocationConfig ---

std::string LocationConfig::validate() const {
    if (path.empty()) return "path is required";
    if (!std::filesystem::exists(path)) return "path does not exist: " + path.string();
    if (!std::filesystem::is_directory(path)) return "path is not a directory: " + path.string();
    return {};
}

// --- ServiceConfig ---

std::optional<ServiceConfig> ServiceConfig::from_args(int argc, char* argv[]) {
    ServiceConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--jobs") {
                auto* v = next_arg(i, "--jobs");
                if (!v) return std::nullopt;
                config.jobs_file = v;
            } else if (arg == "--max-concurrent") {
                auto* v = next_arg(i, "--max-concurrent");
                if (!v) return std::nullopt;
                config.max_concurrent = std::stoull(v);
            } else if (arg == "--default-priority") {
                auto* v = next_arg(i, "--default-priority");
                if (!v) return std::nullopt;
                auto p = parse_priority(v);
                if (!p) {
                    std::cerr << "Error: unknown priority: " << v << "\n";
                    return std::nullopt;
                }
                config.default_priority = *p;
            } else if (arg == "--cache-dir") {
                auto* v = next_arg(i, "--cache-dir");
                if (!v) return std::nullopt;
                config.cache.directory = v;
            } else if (arg == "--archive-limit-gb") {
                auto* v = next_arg(i, "--archive-limit-gb");
                if (!v) return std::nullopt;
                config.cache.archive_size_limit = std::stoull(v) * GIB;
            } else if (arg == "--archive-limit-bytes") {
                auto* v = next_arg(i, "--archive-limit-bytes");
                if (!v) return std::nullopt;
                config.cache.archive_size_limit = std::stoull(v);
            } else if (arg == "--file-limit-gb") {
                auto* v = next_arg(i, "--file-limit-gb");
                if (!v) return std::nullopt;
                config.cache.file_size_limit = std::stoull(v) * GIB;
            } else if (arg == "--file-limit-bytes") {
                auto* v = next_arg(i, "--file-limit-bytes");
                if (!v) return std::nullopt;
                config.cache.file_size_limit = std::stoull(v);
            } else if (arg == "--cleanup-policy") {
                auto* v = next_arg(i, "--cleanup-policy");
                if (!v) return std::nullopt;
                auto p = parse_cleanup_policy(v);
                if (!p) {
                    std::cerr << "Error: unknown cleanup policy: " << v << "\n";
                    return std::nullopt;
                }
                config.cache.cleanup_policy = *p;
            } else if (arg == "--unified-cache") {
                config.cache.unified_cache = true;
            } else if (arg == "--persist-manifest") {
                config.cache.persist_manifest = true;
            } else if (arg == "--hsm-url") {
                auto* v = next_arg(i, "--hsm-url");
                if (!v) return std::nullopt;
                config.hsm.api_url = v;
            } else if (arg == "--hsm-account") {
                auto* v = next_arg(i, "--hsm-account");
                if (!v) return std::nullopt;
                config.hsm.account = v;
            } else if (arg == "--hsm-password") {
                auto* v = next_arg(i, "--hsm-password");
                if (!v) return std::nullopt;
                config.hsm.password = v;
            } else if (arg == "--hsm-ca-cert") {
                auto* v = next_arg(i, "--hsm-ca-cert");
                if (!v) return std::nullopt;
                config.hsm.ca_cert = v;
            } else if (arg == "--hsm-no-verify-ssl") {
                config.hsm.verify_ssl = false;
            } else if (arg == "--stage-timeout") {
                auto* v = next_arg(i, "--stage-timeout");
                if (!v) return std::nullopt;
                config.hsm.stage_timeout_secs = std::stoull(v);
            } else if (arg == "--stage-poll-ms") {
                auto* v = next_arg(i, "--stage-poll-ms");
                if (!v) return std::nullopt;
                config.hsm.stage_poll_ms = std::stoull(v);
            } else if (arg == "--staging-threads") {
                auto* v = next_arg(i, "--staging-threads");
                if (!v) return std::nullopt;
                config.hsm.staging_threads = std::stoull(v);
            } else if (arg == "--location") {
                auto* v = next_arg(i, "--location");
                if (!v) return std::nullopt;
                auto kv = split_assignment(v);
                if (!kv) {
                    std::cerr << "Error: --location expects name=path, got: " << v << "\n";
                    return std::nullopt;
                }
                config.locations[kv->first].path = kv->second;
            } else if (arg == "--tape-location") {
                // name or name=hsm_root; the location itself comes from --location
                auto* v = next_arg(i, "--tape-location");
                if (!v) return std::nullopt;
                std::string name = v;
                if (auto kv = split_assignment(v)) {
                    name = kv->first;
                    config.locations[name].hsm_root = kv->second;
                }
                config.locations[name].tape = true;
            } else if (arg == "--archive") {
                // id=location:path
                auto* v = next_arg(i, "--archive");
                if (!v) return std::nullopt;
                auto kv = split_assignment(v);
                auto colon = kv ? kv->second.find(':') : std::string::npos;
                if (!kv || colon == std::string::npos || colon == 0) {
                    std::cerr << "Error: --archive expects id=location:path, got: " << v << "\n";
                    return std::nullopt;
                }
                config.archives[kv->first] = {kv->second.substr(0, colon), kv->second.substr(colon + 1)};
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--stats-interval") {
                auto* v = next_arg(i, "--stats-interval");
                if (!v) return std::nullopt;
                config.stats_interval_secs = std::stoull(v);
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                std::cerr <<
                    "Usage: esm-cache --jobs <file> [--config <file>] [options]\n"
                    "\n"
                    "Jobs:\n"
                    "  --jobs <path>                    JSON file with a \"jobs\" array\n"
                    "  --config <path>                  JSON config file\n"
                    "\n"
                    "Queue:\n"
                    "  --max-concurrent <N>             Operations run at once (default: 3)\n"
                    "  --default-priority <p>           low, normal, high, urgent (default: normal)\n"
                    "\n"
                    "Cache:\n"
                    "  --cache-dir <path>               Cache directory (default: ~/.cache/esm-cache)\n"
                    "  --archive-limit-gb <N>           Archive pool limit in GiB (default: 50)\n"
                    "  --file-limit-gb <N>              File pool limit in GiB (default: 10)\n"
                    "  --cleanup-policy <p>             lru, size_only, manual (default: lru)\n"
                    "  --unified-cache                  One pool bounded by the archive limit\n"
                    "  --persist-manifest               Keep cache entries in <cache-dir>/manifest.db\n"
                    "\n"
                    "Storage:\n"
                    "  --location <name=path>           Named storage location (repeatable)\n"
                    "  --tape-location <name[=root]>    Mark a location as HSM tape-backed,\n"
                    "                                   optionally with its path as the HSM sees it\n"
                    "  --archive <id=location:path>     Catalogue an archive (repeatable)\n"
                    "\n"
                    "HSM staging:\n"
                    "  --hsm-url <url>                  HSM REST API (default: https://hsm.dmawi.de:8080/v1)\n"
                    "  --hsm-account <name>             HSM account\n"
                    "  --hsm-password <pw>              HSM password (or ESMCACHE_HSM_PASSWORD env)\n"
                    "  --hsm-ca-cert <path>             CA certificate for SSL\n"
                    "  --hsm-no-verify-ssl              Skip SSL verification\n"
                    "  --stage-timeout <secs>           Stage wait limit (default: 180)\n"
                    "  --stage-poll-ms <N>              Status poll interval (default: 1000)\n"
                    "  --staging-threads <N>            Async staging workers (default: 2)\n"
                    "\n"
                    "Daemon:\n"
                    "  --verbose                        Verbose output\n"
                    "  --log-file <path>                Log file path\n"
                    "  --stats-interval <secs>          Stats reporting interval (default: 60)\n"
                    "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
                    "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
                    "  --help                           Show this help\n";
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool ServiceConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("queue") && j["queue"].is_object()) {
            auto& jq = j["queue"];
            if (jq.contains("max_concurrent")) max_concurrent = jq["max_concurrent"].get<size_t>();
            if (jq.contains("default_priority")) {
                auto name = jq["default_priority"].get<std::string>();
                auto p = parse_priority(name);
                if (!p) {
                    std::cerr << "Error parsing config: unknown priority '" << name << "'\n";
                    return false;
                }
                default_priority = *p;
            }
        }

        if (j.contains("cache") && j["cache"].is_object()) {
            auto& jc = j["cache"];
            if (jc.contains("directory")) cache.directory = jc["directory"].get<std::string>();
            read_size(jc, "archive_size_limit", cache.archive_size_limit);
            read_size(jc, "file_size_limit", cache.file_size_limit);
            if (jc.contains("cleanup_policy")) {
                auto name = jc["cleanup_policy"].get<std::string>();
                auto p = parse_cleanup_policy(name);
                if (!p) {
                    std::cerr << "Error parsing config: unknown cleanup policy '" << name << "'\n";
                    return false;
                }
                cache.cleanup_policy = *p;
            }
            if (jc.contains("unified_cache")) cache.unified_cache = jc["unified_cache"].get<bool>();
            if (jc.contains("persist_manifest")) cache.persist_manifest = jc["persist_manifest"].get<bool>();
        }

        if (j.contains("hsm") && j["hsm"].is_object()) {
            auto& jh = j["hsm"];
            if (jh.contains("api_url")) hsm.api_url = jh["api_url"].get<std::string>();
            if (jh.contains("account")) hsm.account = jh["account"].get<std::string>();
            if (jh.contains("password")) hsm.password = jh["password"].get<std::string>();
            if (jh.contains("verify_ssl")) hsm.verify_ssl = jh["verify_ssl"].get<bool>();
            if (jh.contains("ca_cert")) hsm.ca_cert = jh["ca_cert"].get<std::string>();
            if (jh.contains("stage_timeout_secs")) hsm.stage_timeout_secs = jh["stage_timeout_secs"].get<size_t>();
            if (jh.contains("stage_poll_ms")) hsm.stage_poll_ms = jh["stage_poll_ms"].get<size_t>();
            if (jh.contains("staging_threads")) hsm.staging_threads = jh["staging_threads"].get<size_t>();
        }

        // "name": "/path" or "name": {"path": ..., "tape": ..., "hsm_root": ...}
        if (j.contains("locations") && j["locations"].is_object()) {
            for (auto& [name, val] : j["locations"].items()) {
                auto& loc = locations[name];
                if (val.is_string()) {
                    loc.path = val.get<std::string>();
                    continue;
                }
                if (val.contains("path")) loc.path = val["path"].get<std::string>();
                if (val.contains("tape")) loc.tape = val["tape"].get<bool>();
                if (val.contains("hsm_root")) loc.hsm_root = val["hsm_root"].get<std::string>();
            }
        }

        if (j.contains("archives") && j["archives"].is_object()) {
            for (auto& [id, val] : j["archives"].items()) {
                archives[id] = {val.at("location").get<std::string>(), val.at("path").get<std::string>()};
            }
        }

        if (j.contains("jobs_file")) jobs_file = j["jobs_file"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("stats_interval")) stats_interval_secs = j["stats_interval"].get<size_t>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ServiceConfig::apply_defaults() {
    if (cache.directory.empty()) {
        cache.directory = CacheConfiguration::default_directory();
    }

    if (hsm.password.empty()) {
        if (const char* v = std::getenv("ESMCACHE_HSM_PASSWORD")) {
            hsm.password = v;
        }
    }

    for (auto& [name, loc] : locations) {
        if (loc.tape && loc.hsm_root.empty()) {
            loc.hsm_root = loc.path.string();
        }
    }
}

bool ServiceConfig::has_tape_locations() const {
    for (const auto& [name, loc] : locations) {
        if (loc.tape) return true;
    }
    return false;
}

std::string ServiceConfig::validate() const {
    if (max_concurrent == 0) return "max_concurrent must be > 0";
    auto err = cache.validate();
    if (!err.empty()) return "cache: " + err;

    for (const auto& [name, loc] : locations) {
        err = loc.validate();
        if (!err.empty()) return "location '" + name + "': " + err;
    }
    for (const auto& [id, archive] : archives) {
        if (locations.count(archive.location) == 0) {
            return "archive '" + id + "' refers to unknown location '" + archive.location + "'";
        }
        if (archive.path.empty()) return "archive '" + id + "' has no path";
    }

    if (has_tape_locations()) {
        if (hsm.api_url.empty()) return "tape locations require an HSM api_url";
        if (hsm.account.empty()) return "tape locations require an HSM account (--hsm-account)";
        if (hsm.password.empty()) return "tape locations require an HSM password";
    }
    if (hsm.stage_poll_ms == 0) return "stage_poll_ms must be > 0";
    if (hsm.staging_threads == 0) return "staging_threads must be > 0";
    return {};
}

std::string ServiceConfig::describe() const {
    std::ostringstream out;
    out << "  Queue:        max_concurrent=" << max_concurrent
        << " default_priority=" << to_string(default_priority) << "\n";
    out << "  Cache:        " << cache.directory.string()
        << " archive_limit=" << cache.archive_size_limit / GIB << "GiB"
        << " file_limit=" << cache.file_size_limit / GIB << "GiB"
        << " policy=" << to_string(cache.cleanup_policy)
        << (cache.unified_cache ? " unified" : "")
        << (cache.persist_manifest ? " persistent" : "") << "\n";
    for (const auto& [name, loc] : locations) {
        out << "  Location:     " << name << " -> " << loc.path.string();
        if (loc.tape) out << " (tape, hsm root " << loc.hsm_root << ")";
        out << "\n";
    }
    out << "  Archives:     " << archives.size() << " catalogued\n";
    if (has_tape_locations()) {
        out << "  HSM:          " << hsm.api_url << " account=" << hsm.account
            << " password=" << mask(hsm.password)
            << " timeout=" << hsm.stage_timeout_secs << "s"
            << (hsm.verify_ssl ? "" : " (no SSL verify)") << "\n";
    }
    return out.str();
}

}  // namespace esmcache
