#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace esmcache {

class CacheStore;
class OperationQueue;
class StagingController;
struct QueuedOperation;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports esm-cache metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename. Queue, cache and staging counters are taken as deltas of
/// their stats at each snapshot; per-operation results and durations arrive
/// through observe_operation().
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Set pointers for gauge snapshots (not owned).
    void set_queue(const OperationQueue* queue) { queue_ = queue; }
    void set_cache(const CacheStore* cache) { cache_ = cache; }
    void set_staging(const StagingController* staging) { staging_ = staging; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Record a finished operation. Safe from any thread.
    void observe_operation(const QueuedOperation& op);

    /// Record one ensure_online wait. Safe from any thread.
    void observe_staging_wait(std::chrono::milliseconds waited, bool online);

    /// Take a snapshot and write the file now.
    void flush();

    // --- Counter accessors ---
    prometheus::Counter& operations_completed() { return *ops_completed_; }
    prometheus::Counter& operations_failed() { return *ops_failed_; }
    prometheus::Counter& operations_cancelled() { return *ops_cancelled_; }
    prometheus::Counter& bytes_processed_total() { return *bytes_processed_total_; }

    // --- Histogram accessors ---
    prometheus::Histogram& operation_duration() { return *operation_duration_; }
    prometheus::Histogram& staging_wait_duration() { return *staging_wait_duration_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // Pointers for gauge snapshots (not owned)
    const OperationQueue* queue_ = nullptr;
    const CacheStore* cache_ = nullptr;
    const StagingController* staging_ = nullptr;

    // Previous stats for delta computation; guarded by snapshot_mutex_
    std::mutex snapshot_mutex_;
    uint64_t prev_cache_puts_ = 0;
    uint64_t prev_cache_rejected_ = 0;
    uint64_t prev_evictions_ = 0;
    uint64_t prev_evicted_bytes_ = 0;
    uint64_t prev_cache_hits_ = 0;
    uint64_t prev_cache_misses_ = 0;
    uint64_t prev_stage_requests_ = 0;
    uint64_t prev_stage_timeouts_ = 0;
    uint64_t prev_status_queries_ = 0;

    // --- Counters ---
    prometheus::Counter* ops_completed_;
    prometheus::Counter* ops_failed_;
    prometheus::Counter* ops_cancelled_;
    prometheus::Counter* bytes_processed_total_;
    prometheus::Counter* cache_puts_accepted_;
    prometheus::Counter* cache_puts_rejected_;
    prometheus::Counter* evictions_total_;
    prometheus::Counter* eviction_bytes_total_;
    prometheus::Counter* cache_hits_;
    prometheus::Counter* cache_misses_;
    prometheus::Counter* stage_requests_total_;
    prometheus::Counter* stage_timeouts_total_;
    prometheus::Counter* status_queries_total_;
    prometheus::Counter* staging_waits_online_;
    prometheus::Counter* staging_waits_failed_;

    // --- Gauges ---
    prometheus::Gauge* queue_queued_;
    prometheus::Gauge* queue_running_;
    prometheus::Gauge* queue_paused_;
    prometheus::Gauge* queue_max_concurrent_;
    prometheus::Gauge* cache_bytes_;
    prometheus::Gauge* cache_limit_bytes_;
    prometheus::Gauge* cache_entries_;

    // --- Histograms ---
    prometheus::Histogram* operation_duration_;
    prometheus::Histogram* staging_wait_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace esmcache
