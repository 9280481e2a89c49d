#include "esmcache/handlers.hpp"
#include "esmcache/errors.hpp"
#include "esmcache/log.hpp"
#include "meridian/core/thread_pool.hpp"

#include <openssl/evp.h>

#include <fnmatch.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>

namespace esmcache {

namespace {

using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestCtx new_sha256() {
    DigestCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw Error("failed to initialise SHA-256");
    }
    return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        throw Error("failed to finalise SHA-256");
    }
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return rel;
    std::string out = base;
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out + "/" + rel;
}

// Member path of `full` below `prefix`, or `full` itself for an empty prefix
std::string strip_prefix(const std::string& full, std::string prefix) {
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    if (prefix.empty() || prefix == ".") return full;
    if (full.size() > prefix.size() && full.compare(0, prefix.size(), prefix) == 0 &&
        full[prefix.size()] == '/') {
        return full.substr(prefix.size() + 1);
    }
    return full;
}

std::string base_name(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

bool matches_any(const std::vector<std::string>& patterns, const std::string& rel) {
    auto name = base_name(rel);
    return std::any_of(patterns.begin(), patterns.end(), [&](const std::string& p) {
        return glob_match(p, rel) || glob_match(p, name);
    });
}

}  // namespace

bool glob_match(const std::string& pattern, const std::string& name) {
    return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

// ============================================================================
// Chunked copy
// ============================================================================

CopyResult copy_between(const StorageCapability& src, const std::string& src_path,
                        StorageCapability& dst, const std::string& dst_path,
                        size_t chunk_size, const CancellationToken& token) {
    auto total = src.size(src_path);
    if (!total) throw StorageError("cannot stat source " + src_path);

    const uint64_t chunk = std::max<size_t>(chunk_size, 1);
    const std::string partial = dst_path + ".partial";
    auto abandon = [&] { dst.remove(partial); };

    auto ctx = new_sha256();
    CopyResult result;
    bool first = true;

    do {
        if (token.is_cancelled()) {
            abandon();
            throw OperationCancelled("copy of " + src_path);
        }

        uint64_t want = std::min(chunk, *total - result.bytes);
        std::vector<uint8_t> data;
        if (want > 0) {
            auto rr = src.read(src_path, result.bytes, want);
            if (!rr.success) {
                abandon();
                throw StorageError(rr.error_message);
            }
            if (rr.data.empty()) {
                abandon();
                throw StorageError("unexpected end of file in " + src_path);
            }
            data = std::move(rr.data);
        }

        auto wr = dst.write(partial, data, first ? WriteMode::Truncate : WriteMode::Append);
        if (!wr.success) {
            abandon();
            throw StorageError(wr.error_message);
        }
        EVP_DigestUpdate(ctx.get(), data.data(), data.size());
        result.bytes += data.size();
        first = false;
    } while (result.bytes < *total);

    if (!dst.move(partial, dst_path)) {
        abandon();
        throw StorageError("cannot rename " + partial + " to " + dst_path);
    }
    result.sha256 = finish_hex(ctx.get());
    return result;
}

std::string sha256_of(const StorageCapability& storage, const std::string& path,
                      size_t chunk_size, const CancellationToken& token) {
    auto total = storage.size(path);
    if (!total) throw StorageError("cannot stat " + path);

    const uint64_t chunk = std::max<size_t>(chunk_size, 1);
    auto ctx = new_sha256();
    uint64_t offset = 0;
    while (offset < *total) {
        token.throw_if_cancelled("checksum of " + path);
        auto rr = storage.read(path, offset, std::min(chunk, *total - offset));
        if (!rr.success) throw StorageError(rr.error_message);
        if (rr.data.empty()) throw StorageError("unexpected end of file in " + path);
        EVP_DigestUpdate(ctx.get(), rr.data.data(), rr.data.size());
        offset += rr.data.size();
    }
    return finish_hex(ctx.get());
}

// ============================================================================
// TransferOperationHandler
// ============================================================================

TransferOperationHandler::TransferOperationHandler(std::shared_ptr<LocationRegistry> locations)
    : locations_(std::move(locations)) {
    if (!locations_) throw ValidationError("transfer handler requires a location registry");
}

bool TransferOperationHandler::can_handle(const OperationPayload& payload) const {
    return std::holds_alternative<FileTransfer>(payload) ||
           std::holds_alternative<BatchFileTransfer>(payload) ||
           std::holds_alternative<DirectoryTransfer>(payload);
}

OperationOutcome TransferOperationHandler::execute(const OperationPayload& payload,
                                                   const CancellationToken& token) {
    if (const auto* t = std::get_if<FileTransfer>(&payload)) {
        OperationOutcome outcome;
        outcome.bytes_moved = transfer(*t, t->verify_checksum, token);
        outcome.ok = true;
        outcome.succeeded_items.push_back(t->dest_path);
        outcome.message = "transferred " + std::to_string(outcome.bytes_moved) + " bytes";
        return outcome;
    }
    if (const auto* b = std::get_if<BatchFileTransfer>(&payload)) {
        return run_batch(b->transfers, b->parallel_transfers, b->stop_on_error,
                         b->verify_all_checksums, token);
    }
    if (const auto* d = std::get_if<DirectoryTransfer>(&payload)) {
        return run_directory(*d, token);
    }
    throw NoHandlerFound(payload_kind(payload));
}

uint64_t TransferOperationHandler::transfer(const FileTransfer& t, bool verify,
                                            const CancellationToken& token) {
    auto src = locations_->get(t.source_location);
    auto dst = locations_->get(t.dest_location);

    auto fi = src->info(t.source_path);
    if (!fi) throw StorageError("source not found: " + t.source_location + ":" + t.source_path);
    if (fi->is_directory) throw StorageError("source is a directory: " + t.source_path);

    if (!t.overwrite && dst->exists(t.dest_path)) {
        throw OperationNotAllowed("destination exists: " + t.dest_location + ":" + t.dest_path);
    }

    src->prepare(t.source_path, token);
    auto copied = copy_between(*src, t.source_path, *dst, t.dest_path, t.chunk_size, token);

    if (verify) {
        auto written = dst->size(t.dest_path);
        if (!written || *written != copied.bytes) {
            dst->remove(t.dest_path);
            throw StorageError("size mismatch after copying " + t.source_path);
        }
        if (sha256_of(*dst, t.dest_path, t.chunk_size, token) != copied.sha256) {
            dst->remove(t.dest_path);
            throw StorageError("checksum mismatch after copying " + t.source_path);
        }
    }

    log_debug("Transferred %s:%s -> %s:%s (%llu bytes)", t.source_location.c_str(),
              t.source_path.c_str(), t.dest_location.c_str(), t.dest_path.c_str(),
              static_cast<unsigned long long>(copied.bytes));
    return copied.bytes;
}

OperationOutcome TransferOperationHandler::run_batch(const std::vector<FileTransfer>& transfers,
                                                     size_t parallel, bool stop_on_error,
                                                     bool verify_all,
                                                     const CancellationToken& token) {
    OperationOutcome outcome;
    std::mutex outcome_mutex;
    std::atomic<bool> halted{false};
    std::atomic<size_t> skipped{0};

    auto run_one = [&](const FileTransfer& t) {
        if (halted.load() || token.is_cancelled()) {
            skipped++;
            return;
        }
        try {
            uint64_t bytes = transfer(t, t.verify_checksum || verify_all, token);
            std::lock_guard lock(outcome_mutex);
            outcome.bytes_moved += bytes;
            outcome.succeeded_items.push_back(t.dest_path);
        } catch (const OperationCancelled&) {
            skipped++;
        } catch (const std::exception& e) {
            log_warn("Transfer of %s failed: %s", t.source_path.c_str(), e.what());
            std::lock_guard lock(outcome_mutex);
            outcome.failed_items.push_back(t.source_path + ": " + e.what());
            outcome.sub_failures++;
            if (stop_on_error) halted = true;
        }
    };

    size_t workers = std::min(parallel, transfers.size());
    if (workers <= 1) {
        for (const auto& t : transfers) run_one(t);
    } else {
        meridian::ThreadPool pool(workers);
        std::vector<std::future<void>> futures;
        futures.reserve(transfers.size());
        for (const auto& t : transfers) {
            futures.push_back(pool.submit([&run_one, &t] { run_one(t); }));
        }
        for (auto& f : futures) f.get();
    }

    token.throw_if_cancelled("batch transfer");

    if (skipped > 0) {
        outcome.warnings.push_back("skipped " + std::to_string(skipped.load()) +
                                   " transfers after a failure");
    }
    outcome.ok = true;
    outcome.message = std::to_string(outcome.succeeded_items.size()) + " transferred, " +
                      std::to_string(outcome.failed_items.size()) + " failed";
    return outcome;
}

OperationOutcome TransferOperationHandler::run_directory(const DirectoryTransfer& op,
                                                         const CancellationToken& token) {
    auto src = locations_->get(op.source_location);
    auto listing = src->list(op.source_path, op.recursive);
    if (!listing.success) {
        throw StorageError("cannot list " + op.source_location + ":" + op.source_path + ": " +
                           listing.error_message);
    }

    std::vector<FileTransfer> transfers;
    for (const auto& entry : listing.entries) {
        if (entry.is_directory) continue;
        auto rel = strip_prefix(entry.path, op.source_path);
        if (!op.include_patterns.empty() && !matches_any(op.include_patterns, rel)) continue;
        if (matches_any(op.exclude_patterns, rel)) continue;

        FileTransfer t;
        t.source_location = op.source_location;
        t.source_path = entry.path;
        t.dest_location = op.dest_location;
        t.dest_path = join_path(op.dest_path, rel);
        t.overwrite = op.overwrite;
        transfers.push_back(std::move(t));
    }

    if (transfers.empty()) {
        OperationOutcome outcome;
        outcome.ok = true;
        outcome.message = "no files matched in " + op.source_path;
        return outcome;
    }
    log_info("Directory transfer %s:%s -> %s:%s (%zu files)", op.source_location.c_str(),
             op.source_path.c_str(), op.dest_location.c_str(), op.dest_path.c_str(),
             transfers.size());
    return run_batch(transfers, 1, false, true, token);
}

}  // namespace esmcache
