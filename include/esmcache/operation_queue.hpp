#pragma once

#include "esmcache/operation.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace meridian {
class ThreadPool;
}  // namespace meridian

namespace esmcache {

class OperationRouter;

/// Prioritized, concurrency-bounded queue of archive and transfer operations.
///
/// A single scheduler thread pops the highest-priority pending operation
/// whenever a slot is free and runs it on a meridian::ThreadPool sized
/// `max_concurrent`. Operations stay in memory until clear_completed().
///
/// Ordering: strict priority, FIFO within a priority band. Running
/// operations complete in any order.
class OperationQueue {
public:
    OperationQueue(std::shared_ptr<OperationRouter> router, size_t max_concurrent = 3,
                   Priority default_priority = Priority::Normal);
    ~OperationQueue();

    OperationQueue(const OperationQueue&) = delete;
    OperationQueue& operator=(const OperationQueue&) = delete;

    /// Validate and enqueue, starting processing if it is not running, not
    /// paused and not stopped. Throws ValidationError for malformed payloads.
    /// @return the new operation id.
    std::string submit(OperationPayload payload,
                       std::optional<Priority> priority = std::nullopt,
                       std::set<std::string> tags = {},
                       std::optional<std::string> owner_id = std::nullopt,
                       ProgressCallback progress_callback = {});

    /// Start the scheduler thread and worker pool. No-op if already running.
    /// Clears a previous stop() so later submissions start processing again.
    void start();

    /// Stop dispatching and wait for in-flight operations to finish.
    /// Undispatched operations stay QUEUED and run after the next start();
    /// submit() and resume() do not restart a stopped queue.
    void stop();

    void pause();
    /// Re-enables dispatch and starts processing if work is pending.
    void resume();

    /// Cancel a QUEUED or RUNNING operation. Running handlers observe the
    /// cancellation through their token. False for unknown or finished ids.
    bool cancel(const std::string& id);

    std::optional<QueuedOperation> get_operation(const std::string& id) const;

    /// Snapshots, newest first. Filters combine; `tags` matches operations
    /// carrying any of the given tags.
    std::vector<QueuedOperation> list_operations(
        std::optional<OperationStatus> status = std::nullopt,
        const std::optional<std::string>& owner_id = std::nullopt,
        const std::set<std::string>& tags = {}) const;

    /// Forget all terminal operations. Returns how many were removed.
    size_t clear_completed();

    /// Block until nothing is queued or running, or until `timeout`.
    /// Returns true when the queue went idle.
    bool wait_idle(std::chrono::milliseconds timeout) const;

    /// Called once per operation after it reaches a terminal state on a worker.
    using CompletionHook = std::function<void(const QueuedOperation&)>;
    void set_completion_hook(CompletionHook hook);

    // --- Statistics ---

    /// Status counts partition `total_operations`. A cancelled operation whose
    /// handler has not yet returned counts in `cancelled` and `cancelling`,
    /// never in `running`.
    struct Stats {
        size_t total_operations = 0;
        size_t queued = 0;
        size_t running = 0;
        size_t completed = 0;
        size_t failed = 0;
        size_t cancelled = 0;
        size_t cancelling = 0;
        uint64_t total_processed = 0;
        uint64_t total_failed = 0;
        uint64_t total_bytes_processed = 0;
        bool is_processing = false;
        bool is_paused = false;
        size_t max_concurrent = 0;
        size_t queue_length = 0;
    };
    Stats stats() const;

    size_t max_concurrent() const { return max_concurrent_; }
    Priority default_priority() const { return default_priority_; }

private:
    void scheduler_loop();
    void run_operation(const std::string& id);
    bool can_dispatch() const;  // requires mutex_
    static void notify_progress(const ProgressCallback& callback, const std::string& id,
                                const ProgressEvent& event);

    std::shared_ptr<OperationRouter> router_;
    const size_t max_concurrent_;
    const Priority default_priority_;

    mutable std::mutex mutex_;
    std::condition_variable scheduler_cv_;
    mutable std::condition_variable idle_cv_;

    std::unordered_map<std::string, QueuedOperation> operations_;
    std::list<std::string> pending_;  // dispatch order
    std::unordered_set<std::string> in_flight_;  // dispatched to a worker
    uint64_t next_sequence_ = 0;

    bool processing_ = false;
    bool paused_ = false;
    bool stopped_ = false;

    uint64_t total_processed_ = 0;
    uint64_t total_failed_ = 0;
    uint64_t total_bytes_processed_ = 0;

    CompletionHook completion_hook_;

    std::thread scheduler_thread_;
    std::unique_ptr<meridian::ThreadPool> workers_;
};

}  // namespace esmcache
