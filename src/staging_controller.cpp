#include "esmcache/staging_controller.hpp"
#include "esmcache/errors.hpp"
#include "esmcache/log.hpp"
#include "meridian/core/thread_pool.hpp"

#include <algorithm>

namespace esmcache {

using json = nlohmann::json;

namespace {

std::string strip_trailing_slashes(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

bool mount_contains(const std::string& mount, const std::string& path) {
    if (mount == "/") return !path.empty() && path.front() == '/';
    if (path.compare(0, mount.size(), mount) != 0) return false;
    return path.size() == mount.size() || path[mount.size()] == '/';
}

// Block counts arrive as numbers, numeric strings or "" (unknown)
uint64_t parse_blocks(const json& obj, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        if (s.empty()) return 0;
        try {
            return std::stoull(s);
        } catch (const std::exception&) {
            throw RemoteServiceError(std::string("malformed ") + field + " value: " + s, 200);
        }
    }
    return 0;
}

json parse_body(const HttpResponse& response, const std::string& what) {
    if (response.body.empty()) return json::object();
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw RemoteServiceError(what + ": invalid JSON reply: " + e.what(),
                                 static_cast<int>(response.status_code));
    }
}

}  // namespace

const HsmFilesystem& match_filesystem(const std::vector<HsmFilesystem>& filesystems,
                                      const std::string& path) {
    const HsmFilesystem* best = nullptr;
    size_t best_len = 0;
    size_t ties = 0;

    for (const auto& fs : filesystems) {
        std::string mount = strip_trailing_slashes(fs.mount);
        if (mount.empty() || !mount_contains(mount, path)) continue;

        if (!best || mount.size() > best_len) {
            best = &fs;
            best_len = mount.size();
            ties = 1;
        } else if (mount.size() == best_len) {
            ++ties;
        }
    }

    if (!best) throw AmbiguousFilesystemError(path, 0);
    if (ties > 1) throw AmbiguousFilesystemError(path, ties);
    return *best;
}

// ============================================================================
// HsmClient
// ============================================================================

HsmClient::HsmClient(HsmClientOptions options, std::shared_ptr<HttpTransport> transport)
    : options_(std::move(options))
    , transport_(std::move(transport)) {
    options_.api_url = strip_trailing_slashes(options_.api_url);
    if (!transport_) throw ValidationError("HSM client requires a transport");
}

HttpRequest HsmClient::make_request(HttpMethod method, const std::string& endpoint,
                                    const std::string& body) const {
    HttpRequest req;
    req.method = method;
    req.url = options_.api_url + endpoint;
    req.headers["Accept"] = "application/json";
    req.headers["Content-Type"] = "application/json";
    req.body = body;
    return req;
}

std::string HsmClient::login() {
    json creds = {{"acct", options_.account}, {"pass", options_.password}};
    auto resp = transport_->execute(make_request(HttpMethod::Post, "/security/login", creds.dump()));
    login_count_++;

    if (resp.is_network_error) {
        throw RemoteServiceError("HSM login: " + resp.error, 0);
    }
    if (!resp.ok()) {
        throw AuthenticationError("HSM login rejected with HTTP " + std::to_string(resp.status_code));
    }

    json body = parse_body(resp, "HSM login");
    auto it = body.find("response");
    if (it == body.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        throw AuthenticationError("HSM login reply carries no token");
    }
    log_debug("Logged in to HSM API at %s as %s", options_.api_url.c_str(),
              options_.account.c_str());
    return it->get<std::string>();
}

std::string HsmClient::token() {
    std::lock_guard lock(token_mutex_);
    if (!token_) token_ = login();
    return *token_;
}

json HsmClient::authed_call(HttpMethod method, const std::string& endpoint,
                            const std::string& body) {
    std::string what = (method == HttpMethod::Get ? "GET " : "POST ") + endpoint;

    for (int attempt = 0; attempt < 2; ++attempt) {
        std::string bearer = token();
        auto req = make_request(method, endpoint, body);
        req.headers["Authorization"] = "Bearer " + bearer;

        auto resp = transport_->execute(req);
        if (resp.is_network_error) {
            throw RemoteServiceError(what + ": " + resp.error, 0);
        }
        if (resp.status_code == 401 && attempt == 0) {
            log_info("HSM token rejected, logging in again");
            std::lock_guard lock(token_mutex_);
            if (token_ && *token_ == bearer) token_.reset();
            continue;
        }
        if (!resp.ok()) {
            throw RemoteServiceError(what + " failed with HTTP " + std::to_string(resp.status_code),
                                     static_cast<int>(resp.status_code));
        }
        return parse_body(resp, what);
    }
    throw RemoteServiceError(what + " failed with HTTP 401 after re-login", 401);
}

std::vector<HsmFilesystem> HsmClient::filesystems() {
    json body = authed_call(HttpMethod::Get, "/filesystems");
    std::vector<HsmFilesystem> result;

    auto it = body.find("fsids");
    if (it == body.end() || !it->is_array()) return result;

    for (const auto& entry : *it) {
        if (!entry.is_object() || !entry.contains("fsid") || !entry.contains("mount")) continue;
        HsmFilesystem fs;
        const auto& id = entry["fsid"];
        fs.fsid = id.is_string() ? id.get<std::string>() : id.dump();
        fs.mount = entry["mount"].get<std::string>();
        result.push_back(std::move(fs));
    }
    return result;
}

json HsmClient::file(const std::string& fsid, const std::string& path) {
    return authed_call(HttpMethod::Get, "/file?fsid=" + url_encode(fsid) + "&path=" + url_encode(path));
}

json HsmClient::request(const std::string& command, const std::string& fsid,
                        const std::string& path) {
    json body = {{"path", path}};
    return authed_call(HttpMethod::Post,
                       "/request/" + command + "?fsid=" + url_encode(fsid) + "&path=" + url_encode(path),
                       body.dump());
}

json HsmClient::queues() {
    return authed_call(HttpMethod::Get, "/queues");
}

// ============================================================================
// StagingController
// ============================================================================

StagingController::StagingController(std::shared_ptr<HsmClient> client, StagingOptions options)
    : client_(std::move(client))
    , options_(options) {
    if (!client_) throw ValidationError("staging controller requires an HSM client");
    if (options_.poll_interval.count() <= 0) throw ValidationError("poll interval must be > 0");
    pool_ = std::make_unique<meridian::ThreadPool>(std::max<size_t>(1, options_.staging_threads));
}

StagingController::~StagingController() {
    if (pool_) pool_->shutdown(true);
}

std::vector<HsmFilesystem> StagingController::filesystems() {
    std::lock_guard lock(fs_mutex_);
    if (!filesystems_) {
        filesystems_ = client_->filesystems();
        log_debug("HSM reports %zu filesystems", filesystems_->size());
    }
    return *filesystems_;
}

std::string StagingController::resolve_fsid(const std::string& path) {
    auto all = filesystems();
    return match_filesystem(all, path).fsid;
}

StagingStatus StagingController::status(const std::string& path) {
    std::string fsid = resolve_fsid(path);
    json reply = client_->file(fsid, path);
    {
        std::lock_guard lock(stats_mutex_);
        stats_.status_queries++;
    }

    const json* info = &reply;
    if (!reply.contains("onlineblocks") && !reply.contains("offlineblocks")) {
        auto nested = reply.find("response");
        if (nested != reply.end() && nested->is_object()) info = &*nested;
    }

    StagingStatus st;
    st.online_blocks = parse_blocks(*info, "onlineblocks");
    st.offline_blocks = parse_blocks(*info, "offlineblocks");
    return st;
}

json StagingController::stage(const std::string& path) {
    std::string fsid = resolve_fsid(path);
    json reply = client_->request("stage", fsid, path);
    {
        std::lock_guard lock(stats_mutex_);
        stats_.stage_requests++;
    }
    log_info("Stage requested: %s (fsid %s)", path.c_str(), fsid.c_str());
    return reply;
}

json StagingController::queues() {
    return client_->queues();
}

void StagingController::report_wait(std::chrono::steady_clock::time_point start, bool online) {
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    WaitListener listener;
    {
        std::lock_guard lock(stats_mutex_);
        listener = wait_listener_;
    }
    if (listener) listener(waited, online);
}

void StagingController::ensure_online(const std::string& path,
                                      std::optional<std::chrono::milliseconds> timeout,
                                      const CancellationToken& token) {
    token.throw_if_cancelled(path);

    auto start = std::chrono::steady_clock::now();
    auto deadline = start + timeout.value_or(options_.default_timeout);

    auto current = status(path);
    if (current.is_online()) {
        std::lock_guard lock(stats_mutex_);
        stats_.already_online++;
        return;
    }

    stage(path);
    log_debug("%s: online_blocks=%lu offline_blocks=%lu", path.c_str(),
              static_cast<unsigned long>(current.online_blocks),
              static_cast<unsigned long>(current.offline_blocks));

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            {
                std::lock_guard lock(stats_mutex_);
                stats_.timeouts++;
            }
            report_wait(start, false);
            log_error("Timed out waiting for %s to be staged", path.c_str());
            throw StagingTimeoutError(path);
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (token.wait_for(std::min(options_.poll_interval, remaining))) {
            {
                std::lock_guard lock(stats_mutex_);
                stats_.cancelled++;
            }
            report_wait(start, false);
            throw OperationCancelled("staging " + path);
        }

        current = status(path);
        if (current.is_online()) {
            {
                std::lock_guard lock(stats_mutex_);
                stats_.staged_online++;
            }
            report_wait(start, true);
            log_info("%s is online", path.c_str());
            return;
        }
    }
}

std::future<void> StagingController::ensure_online_async(const std::string& path,
                                                         std::optional<std::chrono::milliseconds> timeout,
                                                         CancellationToken token) {
    return pool_->submit([this, path, timeout, token] { ensure_online(path, timeout, token); });
}

StagingController::Stats StagingController::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

void StagingController::set_wait_listener(WaitListener listener) {
    std::lock_guard lock(stats_mutex_);
    wait_listener_ = std::move(listener);
}

}  // namespace esmcache
