// Tests for OperationQueue and OperationRouter.
//
// Tests:
//   1. Router dispatch and NoHandlerFound
//   2. Submission validation and priority ordering
//   3. Concurrency bound and end-to-end completion
//   4. Cancellation (queued, running, terminal)
//   5. Failure capture (exceptions, partial outcomes, missing handler)
//   6. Pause/resume, listing filters, clear_completed, progress events
//
// Submission starts processing on its own; tests that need operations to
// stay QUEUED pause the queue first.

#include "esmcache/errors.hpp"
#include "esmcache/operation_queue.hpp"
#include "esmcache/operation_router.hpp"

#include "test_harness.hpp"

#include <atomic>
#include <mutex>
#include <vector>

using namespace esmcache;

namespace {

/// Handles FileTransfer payloads; `source_path` scripts the behaviour:
///   "sleep:<ms>"  succeed after sleeping
///   "block"       wait until cancelled
///   "throw"       raise a StorageError
///   "partial"     return an outcome with one failed item
class ScriptedHandler : public OperationHandler {
public:
    bool can_handle(const OperationPayload& payload) const override {
        return std::holds_alternative<FileTransfer>(payload);
    }

    OperationOutcome execute(const OperationPayload& payload, const CancellationToken& token) override {
        const auto& t = std::get<FileTransfer>(payload);
        int now = ++active;
        int seen = max_active.load();
        while (now > seen && !max_active.compare_exchange_weak(seen, now)) {}
        {
            std::lock_guard lock(mutex);
            order.push_back(t.dest_path);
        }

        OperationOutcome outcome;
        const auto& script = t.source_path;
        if (script.rfind("sleep:", 0) == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(std::stoi(script.substr(6))));
        } else if (script == "block") {
            while (!token.wait_for(std::chrono::milliseconds(10))) {}
            observed_cancel = true;
        } else if (script == "throw") {
            --active;
            throw StorageError("disk on fire");
        } else if (script == "partial") {
            outcome.failed_items.push_back("b.nc: missing");
            outcome.succeeded_items.push_back("a.nc");
            outcome.sub_failures = 1;
        }
        outcome.ok = true;
        outcome.bytes_moved = 100;
        --active;
        return outcome;
    }

    std::string operation_type() const override { return "file_transfer"; }

    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
    std::atomic<bool> observed_cancel{false};
    std::mutex mutex;
    std::vector<std::string> order;
};

FileTransfer job(const std::string& script, const std::string& name) {
    FileTransfer t;
    t.source_location = "src";
    t.source_path = script;
    t.dest_location = "dst";
    t.dest_path = name;
    return t;
}

struct Fixture {
    std::shared_ptr<ScriptedHandler> handler = std::make_shared<ScriptedHandler>();
    std::shared_ptr<OperationRouter> router = std::make_shared<OperationRouter>();

    Fixture() { router->register_handler(handler); }
};

}  // namespace

// ---------------------------------------------------------------------------
// 1. Router
// ---------------------------------------------------------------------------

static void test_router() {
    std::cout << "\n=== OperationRouter ===" << std::endl;

    {
        TEST(routes_to_first_matching_handler);
        Fixture f;
        auto h = f.router->route(job("sleep:0", "a"));
        ASSERT_EQ(h->operation_type(), std::string("file_transfer"), "handler type");
        ASSERT_EQ(f.router->handler_count(), size_t{1}, "handler count");
        PASS();
    }
    {
        TEST(unmatched_payload_raises_no_handler_found);
        Fixture f;
        BulkArchiveOperation op;
        op.archive_ids = {"a1"};
        op.destination_location = "x";
        ASSERT_THROWS(f.router->route(op), NoHandlerFound, "should throw NoHandlerFound");
        PASS();
    }
    {
        TEST(null_handler_rejected);
        OperationRouter router;
        ASSERT_THROWS(router.register_handler(nullptr), ValidationError, "null handler");
        PASS();
    }
    {
        TEST(execute_delegates);
        Fixture f;
        CancellationToken token;
        auto outcome = f.router->execute(job("sleep:0", "a"), token);
        ASSERT_TRUE(outcome.succeeded(), "outcome should succeed");
        ASSERT_EQ(outcome.bytes_moved, uint64_t{100}, "bytes");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Submission and ordering
// ---------------------------------------------------------------------------

static void test_submission() {
    std::cout << "\n=== Submission ===" << std::endl;

    {
        TEST(malformed_payload_rejected);
        Fixture f;
        OperationQueue queue(f.router);
        ASSERT_THROWS(queue.submit(FileTransfer{}), ValidationError, "empty transfer");
        BatchFileTransfer empty_batch;
        ASSERT_THROWS(queue.submit(empty_batch), ValidationError, "empty batch");
        ASSERT_EQ(queue.stats().total_operations, size_t{0}, "nothing stored");
        PASS();
    }
    {
        TEST(constructor_rejects_bad_arguments);
        Fixture f;
        ASSERT_THROWS(OperationQueue(nullptr), ValidationError, "null router");
        ASSERT_THROWS(OperationQueue(f.router, 0), ValidationError, "zero concurrency");
        PASS();
    }
    {
        TEST(submitted_operation_is_queued);
        Fixture f;
        OperationQueue queue(f.router);
        queue.pause();
        auto id = queue.submit(job("sleep:0", "a"), std::nullopt, {"nightly"}, "alice");
        auto op = queue.get_operation(id);
        ASSERT_TRUE(op.has_value(), "operation should exist");
        ASSERT_EQ(to_string(op->status), std::string("queued"), "status");
        ASSERT_EQ(to_string(op->priority), std::string("NORMAL"), "default priority");
        ASSERT_TRUE(op->owner_id == std::optional<std::string>("alice"), "owner");
        ASSERT_TRUE(!op->started_at && !op->completed_at, "no timestamps yet");
        ASSERT_EQ(id.size(), size_t{36}, "uuid text form");
        ASSERT_EQ(id[14], '4', "uuid version");
        PASS();
    }
    {
        TEST(priority_order_fifo_within_band);
        Fixture f;
        OperationQueue queue(f.router, 1);
        queue.pause();
        queue.submit(job("sleep:0", "n1"), Priority::Normal);
        queue.submit(job("sleep:0", "h1"), Priority::High);
        queue.submit(job("sleep:0", "l1"), Priority::Low);
        queue.submit(job("sleep:0", "h2"), Priority::High);
        queue.submit(job("sleep:0", "u1"), Priority::Urgent);
        queue.resume();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)), "queue should drain");
        queue.stop();

        std::vector<std::string> expected = {"u1", "h1", "h2", "n1", "l1"};
        ASSERT_TRUE(f.handler->order == expected, "dispatch order");
        PASS();
    }
    {
        TEST(queue_default_priority_applies);
        Fixture f;
        OperationQueue queue(f.router, 1, Priority::High);
        queue.pause();
        auto id = queue.submit(job("sleep:0", "a"));
        ASSERT_EQ(to_string(queue.get_operation(id)->priority), std::string("HIGH"), "priority");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Concurrency
// ---------------------------------------------------------------------------

static void test_concurrency() {
    std::cout << "\n=== Concurrency ===" << std::endl;

    {
        TEST(five_operations_two_slots);
        Fixture f;
        OperationQueue queue(f.router, 2);
        std::vector<std::string> ids;
        for (int i = 0; i < 5; ++i) {
            ids.push_back(queue.submit(job("sleep:80", "op" + std::to_string(i))));
        }
        queue.start();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(10)), "queue should drain");

        ASSERT_TRUE(f.handler->max_active.load() <= 2, "never more than two running");
        ASSERT_EQ(f.handler->max_active.load(), 2, "both slots used");

        auto s = queue.stats();
        ASSERT_EQ(s.completed, size_t{5}, "completed");
        ASSERT_EQ(s.total_processed, uint64_t{5}, "total_processed");
        ASSERT_EQ(s.total_bytes_processed, uint64_t{500}, "bytes");
        ASSERT_EQ(s.running, size_t{0}, "nothing running");
        ASSERT_EQ(s.max_concurrent, size_t{2}, "max_concurrent");
        ASSERT_TRUE(s.is_processing, "still processing");

        for (const auto& id : ids) {
            auto op = queue.get_operation(id);
            ASSERT_TRUE(op->started_at && op->completed_at, "timestamps set");
            ASSERT_TRUE(*op->started_at >= op->created_at, "started after created");
            ASSERT_TRUE(*op->completed_at >= *op->started_at, "completed after started");
            ASSERT_TRUE(op->result.has_value() && op->error_message.empty(), "result only");
        }
        queue.stop();
        ASSERT_TRUE(!queue.stats().is_processing, "stopped");
        PASS();
    }
    {
        TEST(stop_then_restart_runs_pending);
        Fixture f;
        OperationQueue queue(f.router, 1);
        queue.start();
        queue.stop();
        auto id = queue.submit(job("sleep:0", "late"));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ASSERT_EQ(to_string(queue.get_operation(id)->status), std::string("queued"), "not run while stopped");
        queue.start();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)), "drains after restart");
        ASSERT_EQ(to_string(queue.get_operation(id)->status), std::string("completed"), "status");
        PASS();
    }
    {
        TEST(submit_starts_processing);
        Fixture f;
        OperationQueue queue(f.router, 1);
        ASSERT_TRUE(!queue.stats().is_processing, "idle before first submit");
        auto id = queue.submit(job("sleep:0", "a"));
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(2)), "drains without start()");
        ASSERT_EQ(to_string(queue.get_operation(id)->status), std::string("completed"), "status");
        ASSERT_TRUE(queue.stats().is_processing, "processing");
        PASS();
    }
    {
        TEST(resume_starts_processing);
        Fixture f;
        OperationQueue queue(f.router, 1);
        queue.pause();
        auto id = queue.submit(job("sleep:0", "a"));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ASSERT_TRUE(!queue.stats().is_processing, "paused submit does not start");
        ASSERT_EQ(to_string(queue.get_operation(id)->status), std::string("queued"), "held");
        queue.resume();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(2)), "drains after resume");
        ASSERT_EQ(to_string(queue.get_operation(id)->status), std::string("completed"), "status");
        PASS();
    }
    {
        TEST(stopped_queue_stays_stopped);
        Fixture f;
        OperationQueue queue(f.router, 1);
        queue.submit(job("sleep:0", "a"));
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(2)), "first op drains");
        queue.stop();
        auto id = queue.submit(job("sleep:0", "b"));
        queue.pause();
        queue.resume();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ASSERT_EQ(to_string(queue.get_operation(id)->status), std::string("queued"),
                  "neither submit nor resume restarts");
        ASSERT_TRUE(!queue.stats().is_processing, "not processing");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. Cancellation
// ---------------------------------------------------------------------------

static void test_cancellation() {
    std::cout << "\n=== Cancellation ===" << std::endl;

    {
        TEST(cancel_queued);
        Fixture f;
        OperationQueue queue(f.router);
        queue.pause();
        auto id = queue.submit(job("sleep:0", "a"));
        ASSERT_TRUE(queue.cancel(id), "first cancel succeeds");
        ASSERT_TRUE(!queue.cancel(id), "second cancel is a no-op");
        auto op = queue.get_operation(id);
        ASSERT_EQ(to_string(op->status), std::string("cancelled"), "status");
        ASSERT_TRUE(op->completed_at.has_value(), "completed_at set");
        ASSERT_TRUE(!queue.cancel("no-such-id"), "unknown id");

        queue.resume();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(2)), "idle");
        ASSERT_TRUE(f.handler->order.empty(), "cancelled op never dispatched");
        PASS();
    }
    {
        TEST(cancel_running);
        Fixture f;
        OperationQueue queue(f.router, 1);
        auto id = queue.submit(job("block", "a"));
        queue.start();
        bool running = wait_for([&] {
            return queue.get_operation(id)->status == OperationStatus::Running;
        });
        ASSERT_TRUE(running, "operation should start");
        ASSERT_TRUE(queue.cancel(id), "cancel running");
        auto s = queue.stats();
        ASSERT_EQ(s.cancelled, size_t{1}, "counted as cancelled");
        ASSERT_EQ(s.running, size_t{0}, "not also counted as running");
        ASSERT_EQ(s.queued + s.running + s.completed + s.failed + s.cancelled, s.total_operations,
                  "status counts partition the total");
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)), "worker returns");
        ASSERT_TRUE(f.handler->observed_cancel.load(), "handler saw the token");
        auto op = queue.get_operation(id);
        ASSERT_EQ(to_string(op->status), std::string("cancelled"), "stays cancelled");
        ASSERT_TRUE(!queue.cancel(id), "terminal cancel is a no-op");
        PASS();
    }
    {
        TEST(cancel_completed_returns_false);
        Fixture f;
        OperationQueue queue(f.router);
        auto id = queue.submit(job("sleep:0", "a"));
        queue.start();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)), "idle");
        ASSERT_TRUE(!queue.cancel(id), "completed op");
        ASSERT_EQ(to_string(queue.get_operation(id)->status), std::string("completed"), "unchanged");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Failures
// ---------------------------------------------------------------------------

static void test_failures() {
    std::cout << "\n=== Failure capture ===" << std::endl;

    {
        TEST(handler_exception_marks_failed);
        Fixture f;
        OperationQueue queue(f.router);
        auto bad = queue.submit(job("throw", "a"));
        auto good = queue.submit(job("sleep:0", "b"));
        queue.start();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)), "idle");

        auto op = queue.get_operation(bad);
        ASSERT_EQ(to_string(op->status), std::string("failed"), "status");
        ASSERT_TRUE(op->error_message.find("disk on fire") != std::string::npos, "error message");
        ASSERT_TRUE(!op->result.has_value(), "no result");
        ASSERT_EQ(to_string(queue.get_operation(good)->status), std::string("completed"),
                  "scheduler kept running");
        ASSERT_EQ(queue.stats().total_failed, uint64_t{1}, "total_failed");
        PASS();
    }
    {
        TEST(partial_outcome_marks_failed);
        Fixture f;
        OperationQueue queue(f.router);
        std::string terminal_error;
        std::mutex m;
        auto id = queue.submit(job("partial", "a"), std::nullopt, {}, std::nullopt,
                               [&](const std::string&, const ProgressEvent& ev) {
                                   if (ev.status != "started") {
                                       std::lock_guard lock(m);
                                       terminal_error = ev.error;
                                   }
                               });
        queue.start();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)), "idle");
        auto op = queue.get_operation(id);
        ASSERT_EQ(to_string(op->status), std::string("failed"), "status");
        ASSERT_TRUE(op->result.has_value(), "result kept");
        ASSERT_EQ(op->result->failed_items.size(), size_t{1}, "failed items");
        ASSERT_TRUE(op->error_message.empty(), "no error message alongside result");
        bool seen = wait_for([&] {
            std::lock_guard lock(m);
            return !terminal_error.empty();
        });
        ASSERT_TRUE(seen, "terminal event delivered");
        std::lock_guard lock(m);
        ASSERT_EQ(terminal_error, std::string("Failed operations: 1"), "event error");
        PASS();
    }
    {
        TEST(missing_handler_marks_failed);
        Fixture f;
        OperationQueue queue(f.router);
        DirectoryTransfer d;
        d.source_location = "a";
        d.source_path = "in";
        d.dest_location = "b";
        d.dest_path = "out";
        auto id = queue.submit(d);
        queue.start();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)), "idle");
        auto op = queue.get_operation(id);
        ASSERT_EQ(to_string(op->status), std::string("failed"), "status");
        ASSERT_TRUE(op->error_message.find("no handler found") != std::string::npos,
                    "NoHandlerFound message");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. Control and introspection
// ---------------------------------------------------------------------------

static void test_control() {
    std::cout << "\n=== Control and introspection ===" << std::endl;

    {
        TEST(pause_blocks_dispatch_until_resume);
        Fixture f;
        OperationQueue queue(f.router);
        queue.start();
        queue.pause();
        auto id = queue.submit(job("sleep:0", "a"));
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        ASSERT_EQ(to_string(queue.get_operation(id)->status), std::string("queued"), "held while paused");
        ASSERT_TRUE(queue.stats().is_paused, "is_paused");
        queue.resume();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)), "drains after resume");
        ASSERT_EQ(to_string(queue.get_operation(id)->status), std::string("completed"), "ran");
        PASS();
    }
    {
        TEST(list_filters_and_order);
        Fixture f;
        OperationQueue queue(f.router);
        queue.pause();
        auto a = queue.submit(job("sleep:0", "a"), std::nullopt, {"cmip6", "daily"}, "alice");
        auto b = queue.submit(job("sleep:0", "b"), std::nullopt, {"cmip6"}, "bob");
        auto c = queue.submit(job("sleep:0", "c"), std::nullopt, {"monthly"}, "alice");
        queue.cancel(b);

        auto all = queue.list_operations();
        ASSERT_EQ(all.size(), size_t{3}, "all");
        ASSERT_EQ(all.front().id, c, "newest first");
        ASSERT_EQ(all.back().id, a, "oldest last");

        ASSERT_EQ(queue.list_operations(std::nullopt, std::string("alice")).size(), size_t{2}, "owner");
        ASSERT_EQ(queue.list_operations(OperationStatus::Cancelled).size(), size_t{1}, "status");
        ASSERT_EQ(queue.list_operations(std::nullopt, std::nullopt, {"cmip6"}).size(), size_t{2}, "tag");
        ASSERT_EQ(queue.list_operations(std::nullopt, std::nullopt, {"daily", "monthly"}).size(),
                  size_t{2}, "any tag matches");
        ASSERT_EQ(queue.list_operations(OperationStatus::Queued, std::string("alice"), {"monthly"}).size(),
                  size_t{1}, "filters combine");
        PASS();
    }
    {
        TEST(clear_completed_keeps_live_operations);
        Fixture f;
        OperationQueue queue(f.router, 1);
        queue.submit(job("sleep:0", "a"));
        queue.submit(job("throw", "b"));
        queue.start();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)), "idle");
        queue.pause();
        auto pending = queue.submit(job("sleep:0", "c"));

        ASSERT_EQ(queue.clear_completed(), size_t{2}, "two terminal ops removed");
        ASSERT_EQ(queue.stats().total_operations, size_t{1}, "queued op kept");
        ASSERT_TRUE(queue.get_operation(pending).has_value(), "pending op present");
        ASSERT_EQ(queue.stats().total_processed, uint64_t{1}, "lifetime counters kept");
        PASS();
    }
    {
        TEST(progress_events_and_hook);
        Fixture f;
        OperationQueue queue(f.router);
        std::mutex m;
        std::vector<ProgressEvent> events;
        std::atomic<int> hooks{0};
        queue.set_completion_hook([&](const QueuedOperation& op) {
            if (op.status == OperationStatus::Completed) ++hooks;
        });
        queue.submit(job("sleep:0", "a"), std::nullopt, {}, std::nullopt,
                     [&](const std::string&, const ProgressEvent& ev) {
                         std::lock_guard lock(m);
                         events.push_back(ev);
                     });
        queue.start();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)), "idle");
        ASSERT_TRUE(wait_for([&] { return hooks.load() == 1; }), "hook called once");

        std::lock_guard lock(m);
        ASSERT_EQ(events.size(), size_t{2}, "two events");
        ASSERT_EQ(events[0].status, std::string("started"), "first event");
        ASSERT_EQ(events[0].item_count, size_t{1}, "item count");
        ASSERT_EQ(events[0].operation_type, std::string("file_transfer"), "operation type");
        ASSERT_EQ(events[1].status, std::string("completed"), "terminal event");
        ASSERT_EQ(events[1].bytes_moved, uint64_t{100}, "bytes in terminal event");
        ASSERT_TRUE(events[1].duration.has_value(), "duration");
        PASS();
    }
    {
        TEST(throwing_callback_does_not_stop_queue);
        Fixture f;
        OperationQueue queue(f.router);
        auto id = queue.submit(job("sleep:0", "a"), std::nullopt, {}, std::nullopt,
                               [](const std::string&, const ProgressEvent&) {
                                   throw std::runtime_error("observer bug");
                               });
        queue.start();
        ASSERT_TRUE(queue.wait_idle(std::chrono::seconds(5)), "idle");
        ASSERT_EQ(to_string(queue.get_operation(id)->status), std::string("completed"), "status");
        PASS();
    }
}

int main() {
    std::cout << "esm-cache queue tests" << std::endl;
    std::cout << "=====================" << std::endl;

    test_router();
    test_submission();
    test_concurrency();
    test_cancellation();
    test_failures();
    test_control();

    return report("Results");
}
