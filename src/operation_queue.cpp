#include "esmcache/operation_queue.hpp"
#include "esmcache/errors.hpp"
#include "esmcache/log.hpp"
#include "esmcache/operation_router.hpp"
#include "meridian/core/thread_pool.hpp"

#include <algorithm>

namespace esmcache {

using meridian::ThreadPool;

namespace {

// Fallback wake-up for the scheduler; normal wake-ups come from the condvar.
constexpr auto kSchedulerIdleWait = std::chrono::seconds(1);

std::string summarize_failure(const OperationOutcome& outcome) {
    if (!outcome.failed_items.empty()) {
        return "Failed operations: " + std::to_string(outcome.failed_items.size());
    }
    if (outcome.sub_failures > 0) {
        return "Failed operations: " + std::to_string(outcome.sub_failures);
    }
    return outcome.message.empty() ? std::string("Operation failed") : outcome.message;
}

}  // namespace

OperationQueue::OperationQueue(std::shared_ptr<OperationRouter> router, size_t max_concurrent,
                               Priority default_priority)
    : router_(std::move(router))
    , max_concurrent_(max_concurrent)
    , default_priority_(default_priority) {
    if (!router_) throw ValidationError("operation queue requires a router");
    if (max_concurrent_ == 0) throw ValidationError("max_concurrent must be >= 1");
}

OperationQueue::~OperationQueue() {
    stop();
}

// --- Submission ---

std::string OperationQueue::submit(OperationPayload payload, std::optional<Priority> priority,
                                   std::set<std::string> tags,
                                   std::optional<std::string> owner_id,
                                   ProgressCallback progress_callback) {
    validate_payload(payload);

    QueuedOperation op;
    op.id = generate_operation_id();
    op.payload = std::move(payload);
    op.priority = priority.value_or(default_priority_);
    op.status = OperationStatus::Queued;
    op.created_at = std::chrono::steady_clock::now();
    op.tags = std::move(tags);
    op.owner_id = std::move(owner_id);
    op.progress_callback = std::move(progress_callback);

    std::string id = op.id;
    std::string kind = payload_kind(op.payload);
    Priority prio = op.priority;
    bool auto_start = false;
    {
        std::lock_guard lock(mutex_);
        op.sequence = next_sequence_++;

        // Before the first entry of strictly lower priority: FIFO inside a band
        auto pos = std::find_if(pending_.begin(), pending_.end(), [&](const std::string& other) {
            return operations_.at(other).priority < prio;
        });
        pending_.insert(pos, id);
        operations_.emplace(id, std::move(op));
        auto_start = !processing_ && !paused_ && !stopped_;
    }
    scheduler_cv_.notify_one();

    log_info("Queued %s operation %s (priority %s)", kind.c_str(), id.c_str(), to_string(prio));
    if (auto_start) start();
    return id;
}

// --- Lifecycle ---

void OperationQueue::start() {
    std::lock_guard lock(mutex_);
    // A concurrent stop() is still joining the previous scheduler
    if (processing_ || scheduler_thread_.joinable()) return;
    stopped_ = false;
    processing_ = true;
    workers_ = std::make_unique<ThreadPool>(max_concurrent_);
    scheduler_thread_ = std::thread(&OperationQueue::scheduler_loop, this);
    log_info("Queue processing started (max_concurrent=%zu)", max_concurrent_);
}

void OperationQueue::stop() {
    {
        std::lock_guard lock(mutex_);
        stopped_ = true;
        if (!processing_ && !scheduler_thread_.joinable()) return;
        processing_ = false;
    }
    scheduler_cv_.notify_all();

    if (scheduler_thread_.joinable()) scheduler_thread_.join();

    // Drains every dispatched operation before returning
    if (workers_) {
        workers_->shutdown(true);
        workers_.reset();
    }

    idle_cv_.notify_all();
    log_info("Queue processing stopped");
}

void OperationQueue::pause() {
    {
        std::lock_guard lock(mutex_);
        paused_ = true;
    }
    log_info("Queue processing paused");
}

void OperationQueue::resume() {
    bool auto_start = false;
    {
        std::lock_guard lock(mutex_);
        paused_ = false;
        auto_start = !processing_ && !stopped_ && !pending_.empty();
    }
    scheduler_cv_.notify_all();
    log_info("Queue processing resumed");
    if (auto_start) start();
}

bool OperationQueue::can_dispatch() const {
    return processing_ && !paused_ && !pending_.empty() && in_flight_.size() < max_concurrent_;
}

void OperationQueue::scheduler_loop() {
    std::unique_lock lock(mutex_);
    while (true) {
        scheduler_cv_.wait_for(lock, kSchedulerIdleWait,
                               [this] { return !processing_ || can_dispatch(); });
        if (!processing_) break;

        while (can_dispatch()) {
            std::string id = pending_.front();
            pending_.pop_front();

            auto& op = operations_.at(id);
            op.status = OperationStatus::Running;
            op.started_at = std::chrono::steady_clock::now();
            in_flight_.insert(id);

            workers_->execute([this, id] { run_operation(id); });
        }
    }
}

// --- Worker ---

void OperationQueue::notify_progress(const ProgressCallback& callback, const std::string& id,
                                     const ProgressEvent& event) {
    if (!callback) return;
    try {
        callback(id, event);
    } catch (const std::exception& e) {
        log_warn("Progress callback for %s threw: %s", id.c_str(), e.what());
    }
}

void OperationQueue::run_operation(const std::string& id) {
    OperationPayload payload;
    CancellationToken token;
    ProgressCallback callback;
    {
        std::lock_guard lock(mutex_);
        const auto& op = operations_.at(id);
        payload = op.payload;
        token = op.cancel_token;
        callback = op.progress_callback;
    }

    const std::string kind = payload_kind(payload);
    log_info("Starting %s operation %s", kind.c_str(), id.c_str());

    ProgressEvent started;
    started.status = "started";
    started.operation_type = kind;
    started.item_count = payload_item_count(payload);
    notify_progress(callback, id, started);

    std::optional<OperationOutcome> outcome;
    std::string error;
    try {
        outcome = router_->execute(payload, token);
    } catch (const std::exception& e) {
        error = e.what();
    }

    ProgressEvent finished;
    finished.operation_type = kind;
    finished.item_count = started.item_count;
    CompletionHook hook;
    std::optional<QueuedOperation> snapshot;
    {
        std::lock_guard lock(mutex_);
        auto& op = operations_.at(id);
        auto now = std::chrono::steady_clock::now();
        in_flight_.erase(id);

        if (outcome) {
            total_bytes_processed_ += outcome->bytes_moved;
            finished.bytes_moved = outcome->bytes_moved;
        }

        if (op.status == OperationStatus::Cancelled) {
            // Cancelled while running; keep whatever partial outcome exists
            if (outcome) op.result = outcome;
            if (!op.completed_at) op.completed_at = now;
            finished.error = error.empty() ? "cancelled" : error;
            log_info("%s operation %s cancelled", kind.c_str(), id.c_str());
        } else if (!outcome) {
            op.status = OperationStatus::Failed;
            op.error_message = error;
            op.completed_at = now;
            ++total_failed_;
            finished.error = error;
            log_error("%s operation %s failed: %s", kind.c_str(), id.c_str(), error.c_str());
        } else if (!outcome->succeeded()) {
            op.status = OperationStatus::Failed;
            op.result = outcome;
            op.completed_at = now;
            ++total_failed_;
            finished.error = summarize_failure(*outcome);
            log_error("%s operation %s failed: %s", kind.c_str(), id.c_str(),
                      finished.error.c_str());
        } else {
            op.status = OperationStatus::Completed;
            op.result = outcome;
            op.completed_at = now;
            ++total_processed_;
            log_info("%s operation %s completed (%lu bytes)", kind.c_str(), id.c_str(),
                     static_cast<unsigned long>(outcome->bytes_moved));
        }

        finished.status = to_string(op.status);
        finished.duration = op.duration();
        hook = completion_hook_;
        if (hook) snapshot = op;
    }
    scheduler_cv_.notify_one();
    idle_cv_.notify_all();

    notify_progress(callback, id, finished);
    if (hook && snapshot) {
        try {
            hook(*snapshot);
        } catch (const std::exception& e) {
            log_warn("Completion hook for %s threw: %s", id.c_str(), e.what());
        }
    }
}

// --- Control ---

bool OperationQueue::cancel(const std::string& id) {
    CancellationToken token;
    {
        std::lock_guard lock(mutex_);
        auto it = operations_.find(id);
        if (it == operations_.end()) return false;

        auto& op = it->second;
        if (op.status == OperationStatus::Queued) {
            op.status = OperationStatus::Cancelled;
            op.completed_at = std::chrono::steady_clock::now();
            pending_.remove(id);
            log_info("Cancelled queued operation %s", id.c_str());
        } else if (op.status == OperationStatus::Running) {
            op.status = OperationStatus::Cancelled;
            op.completed_at = std::chrono::steady_clock::now();
            log_info("Marked running operation %s for cancellation", id.c_str());
        } else {
            return false;
        }
        token = op.cancel_token;
    }
    token.cancel();
    idle_cv_.notify_all();
    return true;
}

std::optional<QueuedOperation> OperationQueue::get_operation(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = operations_.find(id);
    if (it == operations_.end()) return std::nullopt;
    return it->second;
}

std::vector<QueuedOperation> OperationQueue::list_operations(
    std::optional<OperationStatus> status, const std::optional<std::string>& owner_id,
    const std::set<std::string>& tags) const {
    std::vector<QueuedOperation> result;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, op] : operations_) {
            if (status && op.status != *status) continue;
            if (owner_id && op.owner_id != owner_id) continue;
            if (!tags.empty()) {
                bool any = std::any_of(tags.begin(), tags.end(),
                                       [&](const std::string& t) { return op.tags.count(t) > 0; });
                if (!any) continue;
            }
            result.push_back(op);
        }
    }
    std::sort(result.begin(), result.end(), [](const QueuedOperation& a, const QueuedOperation& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.sequence > b.sequence;
    });
    return result;
}

size_t OperationQueue::clear_completed() {
    size_t removed = 0;
    {
        std::lock_guard lock(mutex_);
        for (auto it = operations_.begin(); it != operations_.end();) {
            // A cancelled operation still on a worker is kept until it returns
            if (is_terminal(it->second.status) && in_flight_.count(it->first) == 0) {
                it = operations_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    log_info("Cleared %zu completed operations from queue", removed);
    return removed;
}

bool OperationQueue::wait_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout,
                             [this] { return pending_.empty() && in_flight_.empty(); });
}

void OperationQueue::set_completion_hook(CompletionHook hook) {
    std::lock_guard lock(mutex_);
    completion_hook_ = std::move(hook);
}

OperationQueue::Stats OperationQueue::stats() const {
    std::lock_guard lock(mutex_);
    Stats s;
    s.total_operations = operations_.size();
    for (const auto& [id, op] : operations_) {
        switch (op.status) {
            case OperationStatus::Queued: ++s.queued; break;
            case OperationStatus::Running: ++s.running; break;
            case OperationStatus::Completed: ++s.completed; break;
            case OperationStatus::Failed: ++s.failed; break;
            case OperationStatus::Cancelled: ++s.cancelled; break;
        }
    }
    for (const auto& id : in_flight_) {
        if (operations_.at(id).status == OperationStatus::Cancelled) ++s.cancelling;
    }
    s.total_processed = total_processed_;
    s.total_failed = total_failed_;
    s.total_bytes_processed = total_bytes_processed_;
    s.is_processing = processing_;
    s.is_paused = paused_;
    s.max_concurrent = max_concurrent_;
    s.queue_length = pending_.size();
    return s;
}

}  // namespace esmcache
