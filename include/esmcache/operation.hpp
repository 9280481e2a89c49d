#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace esmcache {

using SteadyTime = std::chrono::steady_clock::time_point;

enum class Priority { Low = 1, Normal = 2, High = 3, Urgent = 4 };

enum class OperationStatus { Queued, Running, Completed, Failed, Cancelled };

const char* to_string(Priority priority);
const char* to_string(OperationStatus status);
std::optional<Priority> parse_priority(const std::string& name);
std::optional<OperationStatus> parse_status(const std::string& name);

inline bool is_terminal(OperationStatus status) {
    return status == OperationStatus::Completed || status == OperationStatus::Failed ||
           status == OperationStatus::Cancelled;
}

// --- Payloads ---

enum class BulkArchiveKind { Copy, Move, Extract };

const char* to_string(BulkArchiveKind kind);
std::optional<BulkArchiveKind> parse_bulk_kind(const std::string& name);

/// Copy, move or extract a set of archives to another storage location.
struct BulkArchiveOperation {
    BulkArchiveKind kind = BulkArchiveKind::Copy;
    std::vector<std::string> archive_ids;
    std::string destination_location;
    std::string simulation_id;               // optional, used as destination subdirectory
    bool stop_on_error = false;
    size_t parallel_operations = 3;
    std::vector<std::string> include_patterns;  // EXTRACT member filter
};

/// Single file copy between two storage locations.
struct FileTransfer {
    std::string source_location;
    std::string source_path;
    std::string dest_location;
    std::string dest_path;
    bool overwrite = false;
    bool verify_checksum = true;
    size_t chunk_size = 8 * 1024 * 1024;
};

struct BatchFileTransfer {
    std::vector<FileTransfer> transfers;
    size_t parallel_transfers = 3;
    bool stop_on_error = false;
    bool verify_all_checksums = true;
};

struct DirectoryTransfer {
    std::string source_location;
    std::string source_path;
    std::string dest_location;
    std::string dest_path;
    bool recursive = true;
    bool overwrite = false;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
};

using OperationPayload =
    std::variant<BulkArchiveOperation, FileTransfer, BatchFileTransfer, DirectoryTransfer>;

/// Short type name of a payload ("bulk_copy", "file_transfer", ...).
std::string payload_kind(const OperationPayload& payload);

/// Number of archives or transfers the payload describes.
size_t payload_item_count(const OperationPayload& payload);

/// Throws ValidationError when the payload cannot be executed as given.
void validate_payload(const OperationPayload& payload);

// --- Outcome ---

/// Result every handler reports, whatever the payload kind.
struct OperationOutcome {
    bool ok = false;
    uint64_t sub_failures = 0;
    uint64_t bytes_moved = 0;
    std::string message;
    std::vector<std::string> succeeded_items;
    std::vector<std::string> failed_items;   // "<item>: <reason>"
    std::vector<std::string> warnings;

    /// Success when the handler says ok and no sub-operation failed.
    bool succeeded() const { return ok && sub_failures == 0; }
};

// --- Cancellation ---

/// Shared cancellation flag threaded from the queue into handlers and
/// staging waits. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel();
    bool is_cancelled() const;

    /// Sleep up to `timeout`, returning early (true) if cancelled.
    bool wait_for(std::chrono::milliseconds timeout) const;

    /// Throws OperationCancelled naming `what` if cancelled.
    void throw_if_cancelled(const std::string& what) const;

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };
    std::shared_ptr<State> state_;
};

// --- Queue records ---

struct ProgressEvent {
    std::string status;           // "started", or the terminal status name
    std::string operation_type;
    size_t item_count = 0;
    uint64_t bytes_moved = 0;
    std::string error;
    std::optional<std::chrono::milliseconds> duration;
};

using ProgressCallback =
    std::function<void(const std::string& operation_id, const ProgressEvent& event)>;

/// One unit of scheduled work. Owned by the OperationQueue; callers get copies.
struct QueuedOperation {
    std::string id;
    OperationPayload payload;
    Priority priority = Priority::Normal;
    OperationStatus status = OperationStatus::Queued;
    SteadyTime created_at;
    std::optional<SteadyTime> started_at;
    std::optional<SteadyTime> completed_at;
    std::optional<OperationOutcome> result;
    std::string error_message;
    std::set<std::string> tags;
    std::optional<std::string> owner_id;
    ProgressCallback progress_callback;
    uint64_t sequence = 0;        // submission order, ties broken by this
    CancellationToken cancel_token;

    std::optional<std::chrono::milliseconds> duration() const;
};

/// Random RFC 4122 version-4 identifier.
std::string generate_operation_id();

}  // namespace esmcache
