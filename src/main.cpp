#include "esmcache/cache_store.hpp"
#include "esmcache/config.hpp"
#include "esmcache/errors.hpp"
#include "esmcache/handlers.hpp"
#include "esmcache/http_transport.hpp"
#include "esmcache/jobs.hpp"
#include "esmcache/log.hpp"
#include "esmcache/metrics.hpp"
#include "esmcache/operation_queue.hpp"
#include "esmcache/operation_router.hpp"
#include "esmcache/staging_controller.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <unistd.h>

using namespace esmcache;

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

void print_stats(const OperationQueue& queue, const CacheStore& cache) {
    auto qs = queue.stats();
    auto cs = cache.status();
    log_info("Stats: queued=%zu running=%zu completed=%zu failed=%zu cancelled=%zu "
             "bytes=%llu cache=%llu/%llu entries=%zu",
             qs.queued, qs.running, qs.completed, qs.failed, qs.cancelled,
             static_cast<unsigned long long>(qs.total_bytes_processed),
             static_cast<unsigned long long>(cs.used),
             static_cast<unsigned long long>(cs.total_limit), cs.entry_count);
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = ServiceConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }
    if (config.jobs_file.empty()) {
        std::cerr << "Configuration error: nothing to run (--jobs)\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        } else {
            std::cerr << "Cannot open log file " << config.log_file << ", logging to console\n";
        }
    }
    set_verbose(config.verbose);

    log_info("esm-cache starting...");
    std::cout << config.describe() << std::flush;

    std::vector<JobSpec> jobs;
    std::shared_ptr<CacheStore> cache;
    try {
        jobs = load_jobs(config.jobs_file);
        cache = std::make_shared<CacheStore>(config.cache);
    } catch (const Error& e) {
        log_error("%s", e.what());
        return 1;
    }

    // HSM staging, only when some location lives on tape
    std::shared_ptr<StagingController> staging;
    if (config.has_tape_locations()) {
        CurlTransportOptions topts;
        topts.verify_ssl = config.hsm.verify_ssl;
        topts.ca_bundle = config.hsm.ca_cert;
        auto transport = std::make_shared<CurlHttpTransport>(topts);

        HsmClientOptions hopts;
        hopts.api_url = config.hsm.api_url;
        hopts.account = config.hsm.account;
        hopts.password = config.hsm.password;
        auto client = std::make_shared<HsmClient>(hopts, transport);

        StagingOptions sopts;
        sopts.default_timeout = std::chrono::seconds(config.hsm.stage_timeout_secs);
        sopts.poll_interval = std::chrono::milliseconds(config.hsm.stage_poll_ms);
        sopts.staging_threads = config.hsm.staging_threads;
        staging = std::make_shared<StagingController>(client, sopts);
    }

    auto locations = std::make_shared<LocationRegistry>();
    for (const auto& [name, loc] : config.locations) {
        std::shared_ptr<StorageCapability> storage = std::make_shared<LocalStorage>(loc.path);
        if (loc.tape) {
            storage = std::make_shared<StagedStorage>(
                storage, staging, loc.hsm_root, std::chrono::seconds(config.hsm.stage_timeout_secs));
        }
        locations->add(name, storage);
    }

    auto catalog = std::make_shared<ArchiveCatalog>();
    for (const auto& [id, archive] : config.archives) {
        catalog->add(id, {archive.location, archive.path});
    }

    auto router = std::make_shared<OperationRouter>();
    router->register_handler(std::make_shared<ArchiveOperationHandler>(locations, catalog, cache));
    router->register_handler(std::make_shared<TransferOperationHandler>(locations));

    OperationQueue queue(router, config.max_concurrent, config.default_priority);

    // Prometheus metrics (optional)
    std::unique_ptr<MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.metrics_file.parent_path(), ec);
        metrics = std::make_unique<MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"cache_dir", config.cache.directory.string()}});
        metrics->set_queue(&queue);
        metrics->set_cache(cache.get());
        metrics->set_staging(staging.get());
        if (staging) {
            auto* m = metrics.get();
            staging->set_wait_listener([m](std::chrono::milliseconds waited, bool online) {
                m->observe_staging_wait(waited, online);
            });
        }
        metrics->start();
        log_info("Metrics: %s (every %zus)", config.metrics_file.c_str(), config.metrics_interval_secs);
    }

    queue.set_completion_hook([&metrics](const QueuedOperation& op) {
        if (op.status == OperationStatus::Failed) {
            log_error("Operation %s (%s) failed: %s", op.id.c_str(), payload_kind(op.payload).c_str(),
                      op.error_message.empty() && op.result ? op.result->message.c_str()
                                                            : op.error_message.c_str());
        } else {
            log_info("Operation %s (%s) %s", op.id.c_str(), payload_kind(op.payload).c_str(),
                     to_string(op.status));
        }
        if (op.result) {
            for (const auto& w : op.result->warnings) log_warn("  %s", w.c_str());
            for (const auto& f : op.result->failed_items) log_warn("  failed: %s", f.c_str());
        }
        if (metrics) metrics->observe_operation(op);
    });

    auto on_progress = [](const std::string& id, const ProgressEvent& ev) {
        log_debug("Operation %s: %s %s (%zu items)", id.c_str(), ev.operation_type.c_str(),
                  ev.status.c_str(), ev.item_count);
    };

    size_t submitted = 0;
    for (auto& job : jobs) {
        try {
            queue.submit(std::move(job.payload), job.priority, std::move(job.tags),
                         std::move(job.owner_id), on_progress);
            ++submitted;
        } catch (const ValidationError& e) {
            log_error("Rejected job: %s", e.what());
        }
    }
    log_info("Submitted %zu of %zu jobs", submitted, jobs.size());

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    queue.start();
    log_info("esm-cache running (PID %d)", static_cast<int>(getpid()));

    auto last_stats = std::chrono::steady_clock::now();
    bool cancelled_all = false;
    while (!queue.wait_idle(std::chrono::milliseconds(200))) {
        if (g_shutdown_requested && !cancelled_all) {
            log_warn("Shutdown requested, cancelling outstanding operations");
            for (const auto& op : queue.list_operations()) {
                if (!is_terminal(op.status)) queue.cancel(op.id);
            }
            cancelled_all = true;
        }
        if (config.stats_interval_secs > 0 &&
            std::chrono::steady_clock::now() - last_stats >=
                std::chrono::seconds(config.stats_interval_secs)) {
            print_stats(queue, *cache);
            last_stats = std::chrono::steady_clock::now();
        }
    }
    queue.stop();

    auto cleaned = cache->cleanup();
    if (cleaned.entries_removed > 0) {
        log_info("Cache cleanup removed %llu entries (%llu bytes)",
                 static_cast<unsigned long long>(cleaned.entries_removed),
                 static_cast<unsigned long long>(cleaned.bytes_removed));
    }
    print_stats(queue, *cache);

    if (metrics) metrics->stop();

    auto qs = queue.stats();
    log_info("esm-cache finished");
    return (qs.failed > 0 || qs.cancelled > 0) ? 2 : 0;
}
