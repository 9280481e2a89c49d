#include "esmcache/metrics.hpp"
#include "esmcache/cache_store.hpp"
#include "esmcache/log.hpp"
#include "esmcache/operation_queue.hpp"
#include "esmcache/staging_controller.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace esmcache {

namespace {

// Advance `counter` by how far `current` moved past `prev`
void add_delta(prometheus::Counter& counter, uint64_t current, uint64_t& prev) {
    if (current > prev) {
        counter.Increment(static_cast<double>(current - prev));
        prev = current;
    }
}

}  // namespace

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& ops_family = prometheus::BuildCounter()
        .Name("esmcache_operations_total")
        .Help("Operations finished, by result")
        .Labels(labels)
        .Register(*registry_);
    ops_completed_ = &ops_family.Add({{"result", "completed"}});
    ops_failed_ = &ops_family.Add({{"result", "failed"}});
    ops_cancelled_ = &ops_family.Add({{"result", "cancelled"}});

    bytes_processed_total_ = &prometheus::BuildCounter()
        .Name("esmcache_bytes_processed_total")
        .Help("Bytes moved by finished operations")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& puts_family = prometheus::BuildCounter()
        .Name("esmcache_cache_puts_total")
        .Help("Cache inserts, by result")
        .Labels(labels)
        .Register(*registry_);
    cache_puts_accepted_ = &puts_family.Add({{"result", "accepted"}});
    cache_puts_rejected_ = &puts_family.Add({{"result", "rejected"}});

    evictions_total_ = &prometheus::BuildCounter()
        .Name("esmcache_cache_evictions_total")
        .Help("Cache entries evicted")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    eviction_bytes_total_ = &prometheus::BuildCounter()
        .Name("esmcache_cache_eviction_bytes_total")
        .Help("Bytes evicted from the cache")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& lookups_family = prometheus::BuildCounter()
        .Name("esmcache_cache_lookups_total")
        .Help("Cache lookups, by result")
        .Labels(labels)
        .Register(*registry_);
    cache_hits_ = &lookups_family.Add({{"result", "hit"}});
    cache_misses_ = &lookups_family.Add({{"result", "miss"}});

    auto& hsm_family = prometheus::BuildCounter()
        .Name("esmcache_hsm_requests_total")
        .Help("HSM API requests, by type")
        .Labels(labels)
        .Register(*registry_);
    stage_requests_total_ = &hsm_family.Add({{"type", "stage"}});
    status_queries_total_ = &hsm_family.Add({{"type", "status"}});

    stage_timeouts_total_ = &prometheus::BuildCounter()
        .Name("esmcache_stage_timeouts_total")
        .Help("Staging waits that hit their deadline")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& waits_family = prometheus::BuildCounter()
        .Name("esmcache_staging_waits_total")
        .Help("ensure_online waits, by result")
        .Labels(labels)
        .Register(*registry_);
    staging_waits_online_ = &waits_family.Add({{"result", "online"}});
    staging_waits_failed_ = &waits_family.Add({{"result", "failed"}});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    queue_queued_ = &gauge_reg("esmcache_queue_queued", "Operations waiting in the queue");
    queue_running_ = &gauge_reg("esmcache_queue_running", "Operations currently running");
    queue_paused_ = &gauge_reg("esmcache_queue_paused", "1 while the queue is paused");
    queue_max_concurrent_ = &gauge_reg("esmcache_queue_max_concurrent", "Concurrency bound");
    cache_bytes_ = &gauge_reg("esmcache_cache_bytes", "Bytes held by cache entries");
    cache_limit_bytes_ = &gauge_reg("esmcache_cache_limit_bytes", "Total cache limit in bytes");
    cache_entries_ = &gauge_reg("esmcache_cache_entries", "Cache entries");

    // --- Histograms ---

    operation_duration_ = &prometheus::BuildHistogram()
        .Name("esmcache_operation_duration_seconds")
        .Help("Operation run time in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 5, 10, 30, 60, 300, 900, 1800, 3600, 7200});

    staging_wait_duration_ = &prometheus::BuildHistogram()
        .Name("esmcache_staging_wait_seconds")
        .Help("Time spent waiting for tape files to come online")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 1, 5, 10, 30, 60, 120, 180, 300, 600});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    flush();
}

void MetricsExporter::flush() {
    update_gauges();
    write_file();
}

void MetricsExporter::observe_operation(const QueuedOperation& op) {
    switch (op.status) {
        case OperationStatus::Completed: ops_completed_->Increment(); break;
        case OperationStatus::Failed: ops_failed_->Increment(); break;
        case OperationStatus::Cancelled: ops_cancelled_->Increment(); break;
        default: return;
    }
    if (op.result) {
        bytes_processed_total_->Increment(static_cast<double>(op.result->bytes_moved));
    }
    if (auto d = op.duration()) {
        operation_duration_->Observe(std::chrono::duration<double>(*d).count());
    }
}

void MetricsExporter::observe_staging_wait(std::chrono::milliseconds waited, bool online) {
    (online ? staging_waits_online_ : staging_waits_failed_)->Increment();
    staging_wait_duration_->Observe(std::chrono::duration<double>(waited).count());
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        flush();
    }
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(snapshot_mutex_);

    if (queue_) {
        auto qs = queue_->stats();
        queue_queued_->Set(static_cast<double>(qs.queued));
        queue_running_->Set(static_cast<double>(qs.running));
        queue_paused_->Set(qs.is_paused ? 1.0 : 0.0);
        queue_max_concurrent_->Set(static_cast<double>(qs.max_concurrent));
    }

    if (cache_) {
        auto status = cache_->status();
        cache_bytes_->Set(static_cast<double>(status.used));
        cache_limit_bytes_->Set(static_cast<double>(status.total_limit));
        cache_entries_->Set(static_cast<double>(status.entry_count));

        auto cs = cache_->get_stats();
        add_delta(*cache_puts_accepted_, cs.puts, prev_cache_puts_);
        add_delta(*cache_puts_rejected_, cs.rejected_puts, prev_cache_rejected_);
        add_delta(*evictions_total_, cs.evictions, prev_evictions_);
        add_delta(*eviction_bytes_total_, cs.evicted_bytes, prev_evicted_bytes_);
        add_delta(*cache_hits_, cs.hits, prev_cache_hits_);
        add_delta(*cache_misses_, cs.misses, prev_cache_misses_);
    }

    if (staging_) {
        auto ss = staging_->get_stats();
        add_delta(*stage_requests_total_, ss.stage_requests, prev_stage_requests_);
        add_delta(*status_queries_total_, ss.status_queries, prev_status_queries_);
        add_delta(*stage_timeouts_total_, ss.timeouts, prev_stage_timeouts_);
    }
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics to %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) {
        log_warn("Failed writing metrics to %s", tmp_path.c_str());
        return;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) log_warn("Cannot rename %s: %s", tmp_path.c_str(), ec.message().c_str());
}

}  // namespace esmcache
