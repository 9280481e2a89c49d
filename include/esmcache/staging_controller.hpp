#pragma once

#include "esmcache/http_transport.hpp"
#include "esmcache/operation.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meridian {
class ThreadPool;
}  // namespace meridian

namespace esmcache {

/// One HSM-managed filesystem and where it is mounted.
struct HsmFilesystem {
    std::string fsid;
    std::string mount;
};

/// Block residency of one file as reported by the HSM.
struct StagingStatus {
    uint64_t online_blocks = 0;
    uint64_t offline_blocks = 0;

    // Partially staged files count as offline
    bool is_online() const { return online_blocks > 0 && offline_blocks == 0; }
};

/// Pick the filesystem whose mount point is the longest path-component
/// prefix of `path`. Throws AmbiguousFilesystemError when none matches or
/// when two mounts of the same length match.
const HsmFilesystem& match_filesystem(const std::vector<HsmFilesystem>& filesystems,
                                      const std::string& path);

struct HsmClientOptions {
    std::string api_url = "https://hsm.dmawi.de:8080/v1";
    std::string account;
    std::string password;
};

/// Client for the ScoutFS HSM REST API.
///
/// The bearer token is fetched on first use and kept for the client's
/// lifetime. A 401 on an authenticated call discards it, logs in again and
/// retries that call once.
class HsmClient {
public:
    HsmClient(HsmClientOptions options, std::shared_ptr<HttpTransport> transport);

    /// POST /security/login. Throws AuthenticationError on rejection.
    std::string login();

    /// GET /filesystems
    std::vector<HsmFilesystem> filesystems();

    /// GET /file?fsid=&path=
    nlohmann::json file(const std::string& fsid, const std::string& path);

    /// POST /request/{command}?fsid=&path=
    nlohmann::json request(const std::string& command, const std::string& fsid,
                           const std::string& path);

    /// GET /queues
    nlohmann::json queues();

    const std::string& api_url() const { return options_.api_url; }
    uint64_t login_count() const { return login_count_.load(); }

private:
    std::string token();
    nlohmann::json authed_call(HttpMethod method, const std::string& endpoint,
                               const std::string& body = {});
    HttpRequest make_request(HttpMethod method, const std::string& endpoint,
                             const std::string& body) const;

    HsmClientOptions options_;
    std::shared_ptr<HttpTransport> transport_;

    std::mutex token_mutex_;
    std::optional<std::string> token_;
    std::atomic<uint64_t> login_count_{0};
};

struct StagingOptions {
    std::chrono::milliseconds default_timeout{std::chrono::minutes(3)};
    std::chrono::milliseconds poll_interval{std::chrono::seconds(1)};
    size_t staging_threads = 2;  // pool behind ensure_online_async
};

/// Brings tape-resident files online before they are read.
class StagingController {
public:
    explicit StagingController(std::shared_ptr<HsmClient> client, StagingOptions options = {});
    ~StagingController();

    StagingController(const StagingController&) = delete;
    StagingController& operator=(const StagingController&) = delete;

    /// Current block residency of `path`.
    StagingStatus status(const std::string& path);

    bool is_online(const std::string& path) { return status(path).is_online(); }

    /// Issue a stage request. Idempotent on the HSM side.
    nlohmann::json stage(const std::string& path);

    /// Return once `path` is online, staging it first if needed.
    ///
    /// Polls every `poll_interval`. Throws StagingTimeoutError when the
    /// deadline passes and OperationCancelled when `token` fires.
    void ensure_online(const std::string& path,
                       std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                       const CancellationToken& token = CancellationToken{});

    /// ensure_online on the controller's staging pool.
    std::future<void> ensure_online_async(const std::string& path,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                          CancellationToken token = CancellationToken{});

    /// fsid owning `path`. The filesystem list is fetched once.
    std::string resolve_fsid(const std::string& path);

    std::vector<HsmFilesystem> filesystems();
    nlohmann::json queues();

    struct Stats {
        uint64_t status_queries = 0;
        uint64_t stage_requests = 0;
        uint64_t already_online = 0;
        uint64_t staged_online = 0;
        uint64_t timeouts = 0;
        uint64_t cancelled = 0;
    };
    Stats get_stats() const;

    /// Observes every completed or failed ensure_online wait.
    using WaitListener = std::function<void(std::chrono::milliseconds waited, bool online)>;
    void set_wait_listener(WaitListener listener);

    const StagingOptions& options() const { return options_; }

private:
    void report_wait(std::chrono::steady_clock::time_point start, bool online);

    std::shared_ptr<HsmClient> client_;
    StagingOptions options_;

    std::mutex fs_mutex_;
    std::optional<std::vector<HsmFilesystem>> filesystems_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
    WaitListener wait_listener_;

    std::unique_ptr<meridian::ThreadPool> pool_;
};

}  // namespace esmcache
