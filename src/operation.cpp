#include "esmcache/operation.hpp"
#include "esmcache/errors.hpp"

#include <array>
#include <cstdio>
#include <openssl/rand.h>
#include <random>

namespace esmcache {

const char* to_string(Priority priority) {
    switch (priority) {
        case Priority::Low: return "LOW";
        case Priority::Normal: return "NORMAL";
        case Priority::High: return "HIGH";
        case Priority::Urgent: return "URGENT";
    }
    return "NORMAL";
}

const char* to_string(OperationStatus status) {
    switch (status) {
        case OperationStatus::Queued: return "queued";
        case OperationStatus::Running: return "running";
        case OperationStatus::Completed: return "completed";
        case OperationStatus::Failed: return "failed";
        case OperationStatus::Cancelled: return "cancelled";
    }
    return "queued";
}

std::optional<Priority> parse_priority(const std::string& name) {
    if (name == "low" || name == "LOW") return Priority::Low;
    if (name == "normal" || name == "NORMAL") return Priority::Normal;
    if (name == "high" || name == "HIGH") return Priority::High;
    if (name == "urgent" || name == "URGENT") return Priority::Urgent;
    return std::nullopt;
}

std::optional<OperationStatus> parse_status(const std::string& name) {
    if (name == "queued") return OperationStatus::Queued;
    if (name == "running") return OperationStatus::Running;
    if (name == "completed") return OperationStatus::Completed;
    if (name == "failed") return OperationStatus::Failed;
    if (name == "cancelled") return OperationStatus::Cancelled;
    return std::nullopt;
}

const char* to_string(BulkArchiveKind kind) {
    switch (kind) {
        case BulkArchiveKind::Copy: return "bulk_copy";
        case BulkArchiveKind::Move: return "bulk_move";
        case BulkArchiveKind::Extract: return "bulk_extract";
    }
    return "bulk_copy";
}

std::optional<BulkArchiveKind> parse_bulk_kind(const std::string& name) {
    if (name == "copy" || name == "bulk_copy") return BulkArchiveKind::Copy;
    if (name == "move" || name == "bulk_move") return BulkArchiveKind::Move;
    if (name == "extract" || name == "bulk_extract") return BulkArchiveKind::Extract;
    return std::nullopt;
}

// --- Payload helpers ---

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void validate_transfer(const FileTransfer& t, const std::string& where) {
    if (t.source_location.empty()) throw ValidationError(where + ": source_location is required");
    if (t.source_path.empty()) throw ValidationError(where + ": source_path is required");
    if (t.dest_location.empty()) throw ValidationError(where + ": dest_location is required");
    if (t.dest_path.empty()) throw ValidationError(where + ": dest_path is required");
    if (t.chunk_size == 0) throw ValidationError(where + ": chunk_size must be > 0");
}

}  // namespace

std::string payload_kind(const OperationPayload& payload) {
    return std::visit(overloaded{
        [](const BulkArchiveOperation& op) { return std::string(to_string(op.kind)); },
        [](const FileTransfer&) { return std::string("file_transfer"); },
        [](const BatchFileTransfer&) { return std::string("batch_file_transfer"); },
        [](const DirectoryTransfer&) { return std::string("directory_transfer"); },
    }, payload);
}

size_t payload_item_count(const OperationPayload& payload) {
    return std::visit(overloaded{
        [](const BulkArchiveOperation& op) { return op.archive_ids.size(); },
        [](const FileTransfer&) { return size_t{1}; },
        [](const BatchFileTransfer& op) { return op.transfers.size(); },
        [](const DirectoryTransfer&) { return size_t{1}; },
    }, payload);
}

void validate_payload(const OperationPayload& payload) {
    std::visit(overloaded{
        [](const BulkArchiveOperation& op) {
            if (op.archive_ids.empty()) throw ValidationError("bulk operation needs at least one archive id");
            for (const auto& id : op.archive_ids) {
                if (id.empty()) throw ValidationError("archive id must not be empty");
            }
            if (op.kind != BulkArchiveKind::Extract && op.destination_location.empty()) {
                throw ValidationError("bulk copy/move requires destination_location");
            }
            if (op.parallel_operations == 0) throw ValidationError("parallel_operations must be >= 1");
        },
        [](const FileTransfer& op) { validate_transfer(op, "file transfer"); },
        [](const BatchFileTransfer& op) {
            if (op.transfers.empty()) throw ValidationError("batch transfer needs at least one transfer");
            if (op.parallel_transfers == 0) throw ValidationError("parallel_transfers must be >= 1");
            for (size_t i = 0; i < op.transfers.size(); ++i) {
                validate_transfer(op.transfers[i], "batch transfer #" + std::to_string(i));
            }
        },
        [](const DirectoryTransfer& op) {
            if (op.source_location.empty() || op.source_path.empty()) {
                throw ValidationError("directory transfer requires source_location and source_path");
            }
            if (op.dest_location.empty() || op.dest_path.empty()) {
                throw ValidationError("directory transfer requires dest_location and dest_path");
            }
        },
    }, payload);
}

// --- CancellationToken ---

void CancellationToken::cancel() {
    {
        std::lock_guard lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

void CancellationToken::throw_if_cancelled(const std::string& what) const {
    if (is_cancelled()) throw OperationCancelled(what);
}

// --- QueuedOperation ---

std::optional<std::chrono::milliseconds> QueuedOperation::duration() const {
    if (!started_at) return std::nullopt;
    auto end = completed_at.value_or(std::chrono::steady_clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - *started_at);
}

std::string generate_operation_id() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        // RNG not seeded; fall back to the platform device
        std::random_device rd;
        for (auto& b : bytes) b = static_cast<unsigned char>(rd() & 0xFF);
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
             bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buf);
}

}  // namespace esmcache
