// Tests for HsmClient, StagingController and StagedStorage against a
// scripted in-process HSM.
//
// Tests:
//   1. Filesystem matching (longest prefix, ties, no match, "/")
//   2. Login and token handling (401 re-login, rejected credentials)
//   3. Status parsing
//   4. ensure_online (already online, staged after polls, timeout, cancel)
//   5. StagedStorage path mapping and prepare()

#include "esmcache/errors.hpp"
#include "esmcache/http_transport.hpp"
#include "esmcache/operation.hpp"
#include "esmcache/staging_controller.hpp"
#include "esmcache/storage.hpp"

#include "test_harness.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <vector>

using namespace esmcache;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

const std::string kApi = "https://hsm.test/v1";

std::string percent_decode(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else if (s[i] == '+') {
            out += ' ';
        } else {
            out += s[i];
        }
    }
    return out;
}

std::string query_param(const std::string& url, const std::string& name) {
    auto q = url.find('?');
    if (q == std::string::npos) return {};
    std::string query = url.substr(q + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == name) {
            return percent_decode(pair.substr(eq + 1));
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return {};
}

HttpResponse reply(long code, const json& body) {
    HttpResponse r;
    r.status_code = code;
    r.body = body.dump();
    return r;
}

/// Scripted ScoutFS API. A file listed in `offline_polls` reports offline
/// until it has been staged and then polled that many more times.
class FakeHsm : public HttpTransport {
public:
    HttpResponse execute(const HttpRequest& req) override {
        std::lock_guard lock(mutex_);
        std::string endpoint = req.url.substr(kApi.size());
        std::string route = endpoint.substr(0, endpoint.find('?'));

        if (route == "/security/login") {
            ++logins;
            auto creds = json::parse(req.body);
            if (creds.value("acct", "") != "alice" || creds.value("pass", "") != "secret") {
                return reply(401, {{"response", "bad credentials"}});
            }
            current_token = "tok-" + std::to_string(logins);
            return reply(200, {{"response", current_token}});
        }

        auto auth = req.headers.find("Authorization");
        if (auth == req.headers.end() || auth->second != "Bearer " + current_token ||
            expire_next) {
            expire_next = false;
            ++unauthorized;
            return reply(401, json::object());
        }

        if (route == "/filesystems") {
            ++filesystem_calls;
            json list = json::array();
            for (const auto& [fsid, mount] : mounts) list.push_back({{"fsid", fsid}, {"mount", mount}});
            return reply(200, {{"fsids", list}});
        }
        if (route == "/file") {
            std::string path = query_param(req.url, "path");
            last_fsid = query_param(req.url, "fsid");
            status_calls[path]++;
            if (raw_status.count(path)) return reply(200, raw_status[path]);

            bool online = !offline_polls.count(path);
            auto due = online_at.find(path);
            if (due != online_at.end()) {
                online = std::chrono::steady_clock::now() >= due->second;
            }
            if (!online && staged.count(path)) {
                int& left = offline_polls[path];
                if (left <= 0) {
                    offline_polls.erase(path);
                    online = true;
                } else {
                    --left;
                }
            }
            json info = online ? json{{"onlineblocks", "8"}, {"offlineblocks", "0"}}
                               : json{{"onlineblocks", 0}, {"offlineblocks", 8}};
            return reply(200, info);
        }
        if (route == "/request/stage") {
            std::string path = query_param(req.url, "path");
            stage_calls[path]++;
            staged.insert(path);
            return reply(200, {{"response", "queued"}});
        }
        if (route == "/queues") {
            return reply(200, {{"response", json::array()}});
        }
        return reply(404, {{"response", "unknown endpoint"}});
    }

    std::mutex mutex_;
    std::vector<std::pair<std::string, std::string>> mounts{
        {"1", "/hs"}, {"2", "/hs/D-P"}, {"3", "/archive/"}};
    std::map<std::string, int> offline_polls;
    std::map<std::string, std::chrono::steady_clock::time_point> online_at;
    std::map<std::string, json> raw_status;
    std::set<std::string> staged;
    std::map<std::string, int> status_calls;
    std::map<std::string, int> stage_calls;
    std::string current_token;
    std::string last_fsid;
    int logins = 0;
    int unauthorized = 0;
    int filesystem_calls = 0;
    bool expire_next = false;
};

struct Fixture {
    std::shared_ptr<FakeHsm> hsm = std::make_shared<FakeHsm>();
    std::shared_ptr<HsmClient> client;
    std::shared_ptr<StagingController> staging;

    explicit Fixture(std::string password = "secret",
                     std::chrono::milliseconds poll_interval = 10ms) {
        HsmClientOptions opts;
        opts.api_url = kApi + "/";
        opts.account = "alice";
        opts.password = std::move(password);
        client = std::make_shared<HsmClient>(opts, hsm);

        StagingOptions sopts;
        sopts.default_timeout = 2s;
        sopts.poll_interval = poll_interval;
        staging = std::make_shared<StagingController>(client, sopts);
    }
};

}  // namespace

// ---------------------------------------------------------------------------
// 1. Filesystem matching
// ---------------------------------------------------------------------------

static void test_match_filesystem() {
    std::cout << "\n=== match_filesystem ===" << std::endl;

    std::vector<HsmFilesystem> fss{{"1", "/hs"}, {"2", "/hs/D-P"}, {"3", "/archive/"}};

    {
        TEST(longest_prefix_wins);
        ASSERT_EQ(match_filesystem(fss, "/hs/D-P/exp01/out.tar").fsid, std::string("2"), "nested mount");
        ASSERT_EQ(match_filesystem(fss, "/hs/other/x").fsid, std::string("1"), "outer mount");
        PASS();
    }
    {
        TEST(component_boundary);
        ASSERT_EQ(match_filesystem(fss, "/hs/D-Pool/x").fsid, std::string("1"),
                  "/hs/D-P is not a prefix of /hs/D-Pool");
        ASSERT_EQ(match_filesystem(fss, "/archive/a").fsid, std::string("3"), "trailing slash mount");
        PASS();
    }
    {
        TEST(no_match_throws);
        try {
            match_filesystem(fss, "/scratch/x");
            FAIL("expected AmbiguousFilesystemError");
            return;
        } catch (const AmbiguousFilesystemError& e) {
            ASSERT_EQ(e.matches(), size_t{0}, "zero matches");
        }
        PASS();
    }
    {
        TEST(tie_throws);
        std::vector<HsmFilesystem> dup{{"1", "/hs"}, {"9", "/hs/"}};
        try {
            match_filesystem(dup, "/hs/x");
            FAIL("expected AmbiguousFilesystemError");
            return;
        } catch (const AmbiguousFilesystemError& e) {
            ASSERT_EQ(e.matches(), size_t{2}, "two matches");
        }
        PASS();
    }
    {
        TEST(root_mount_matches_everything);
        std::vector<HsmFilesystem> root{{"0", "/"}, {"1", "/hs"}};
        ASSERT_EQ(match_filesystem(root, "/scratch/x").fsid, std::string("0"), "root");
        ASSERT_EQ(match_filesystem(root, "/hs/x").fsid, std::string("1"), "longer wins over root");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Authentication
// ---------------------------------------------------------------------------

static void test_authentication() {
    std::cout << "\n=== Authentication ===" << std::endl;

    {
        TEST(token_reused_across_calls);
        Fixture fx;
        fx.client->filesystems();
        fx.client->queues();
        ASSERT_EQ(fx.hsm->logins, 1, "one login");
        ASSERT_EQ(fx.client->login_count(), uint64_t{1}, "login counter");
        PASS();
    }
    {
        TEST(expired_token_relogin_once);
        Fixture fx;
        fx.client->queues();
        fx.hsm->expire_next = true;
        auto fss = fx.client->filesystems();
        ASSERT_EQ(fss.size(), size_t{3}, "call retried");
        ASSERT_EQ(fx.hsm->logins, 2, "logged in again");
        ASSERT_EQ(fx.hsm->unauthorized, 1, "one 401");
        PASS();
    }
    {
        TEST(bad_credentials);
        Fixture fx("wrong");
        ASSERT_THROWS(fx.client->filesystems(), AuthenticationError, "login rejected");
        PASS();
    }
    {
        TEST(unknown_endpoint_is_remote_error);
        Fixture fx;
        try {
            fx.client->request("bogus", "1", "/hs/x");
            FAIL("expected RemoteServiceError");
            return;
        } catch (const RemoteServiceError& e) {
            ASSERT_EQ(e.status_code(), 404, "status code");
        }
        PASS();
    }
    {
        TEST(null_transport_rejected);
        ASSERT_THROWS(HsmClient(HsmClientOptions{}, nullptr), ValidationError, "null transport");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Status
// ---------------------------------------------------------------------------

static void test_status() {
    std::cout << "\n=== Status ===" << std::endl;

    {
        TEST(online_file);
        Fixture fx;
        auto st = fx.staging->status("/hs/D-P/exp01/a.tar");
        ASSERT_TRUE(st.is_online(), "online");
        ASSERT_EQ(st.online_blocks, uint64_t{8}, "string block count parsed");
        ASSERT_EQ(fx.hsm->last_fsid, std::string("2"), "fsid resolved");
        PASS();
    }
    {
        TEST(filesystem_list_cached);
        Fixture fx;
        fx.staging->status("/hs/a");
        fx.staging->status("/hs/b");
        ASSERT_EQ(fx.hsm->filesystem_calls, 1, "fetched once");
        PASS();
    }
    {
        TEST(empty_string_counts_as_zero);
        Fixture fx;
        fx.hsm->raw_status["/hs/x"] = {{"onlineblocks", ""}, {"offlineblocks", "4"}};
        auto st = fx.staging->status("/hs/x");
        ASSERT_EQ(st.online_blocks, uint64_t{0}, "online");
        ASSERT_EQ(st.offline_blocks, uint64_t{4}, "offline");
        ASSERT_TRUE(!st.is_online(), "offline file");
        PASS();
    }
    {
        TEST(nested_response_object);
        Fixture fx;
        fx.hsm->raw_status["/hs/y"] = {{"response", {{"onlineblocks", 3}, {"offlineblocks", 0}}}};
        ASSERT_TRUE(fx.staging->is_online("/hs/y"), "online");
        PASS();
    }
    {
        TEST(partial_is_offline);
        StagingStatus st;
        st.online_blocks = 5;
        st.offline_blocks = 1;
        ASSERT_TRUE(!st.is_online(), "partially staged");
        StagingStatus empty;
        ASSERT_TRUE(!empty.is_online(), "no blocks");
        PASS();
    }
    {
        TEST(malformed_block_count);
        Fixture fx;
        fx.hsm->raw_status["/hs/z"] = {{"onlineblocks", "many"}, {"offlineblocks", "0"}};
        ASSERT_THROWS(fx.staging->status("/hs/z"), RemoteServiceError, "bad number");
        PASS();
    }
    {
        TEST(path_outside_mounts);
        Fixture fx;
        ASSERT_THROWS(fx.staging->status("/scratch/x"), AmbiguousFilesystemError, "no mount");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. ensure_online
// ---------------------------------------------------------------------------

static void test_ensure_online() {
    std::cout << "\n=== ensure_online ===" << std::endl;

    {
        TEST(already_online_skips_stage);
        Fixture fx;
        fx.staging->ensure_online("/hs/a.tar");
        ASSERT_EQ(fx.hsm->stage_calls["/hs/a.tar"], 0, "no stage request");
        ASSERT_EQ(fx.staging->get_stats().already_online, uint64_t{1}, "stats");
        PASS();
    }
    {
        TEST(staged_after_polls);
        Fixture fx;
        fx.hsm->offline_polls["/hs/b.tar"] = 3;
        std::atomic<int> waits{0};
        std::atomic<bool> reported_online{false};
        fx.staging->set_wait_listener([&](std::chrono::milliseconds, bool online) {
            ++waits;
            reported_online = online;
        });
        auto start = std::chrono::steady_clock::now();
        fx.staging->ensure_online("/hs/b.tar");
        auto elapsed = std::chrono::steady_clock::now() - start;
        ASSERT_TRUE(elapsed >= 4 * 10ms, "four poll intervals before online");
        ASSERT_TRUE(elapsed < 4 * 10ms + 10ms + 200ms, "returned on the first online poll");
        ASSERT_EQ(fx.hsm->stage_calls["/hs/b.tar"], 1, "one stage request");
        ASSERT_TRUE(fx.hsm->status_calls["/hs/b.tar"] >= 5, "polled until online");
        auto s = fx.staging->get_stats();
        ASSERT_EQ(s.staged_online, uint64_t{1}, "staged counter");
        ASSERT_EQ(s.stage_requests, uint64_t{1}, "request counter");
        ASSERT_EQ(waits.load(), 1, "listener called");
        ASSERT_TRUE(reported_online.load(), "listener saw online");
        PASS();
    }
    {
        TEST(timeout_fires_at_deadline);
        Fixture fx("secret", 100ms);
        fx.hsm->offline_polls["/hs/c.tar"] = 1000000;
        auto start = std::chrono::steady_clock::now();
        try {
            fx.staging->ensure_online("/hs/c.tar", 300ms);
            FAIL("expected StagingTimeoutError");
            return;
        } catch (const StagingTimeoutError& e) {
            ASSERT_EQ(e.path(), std::string("/hs/c.tar"), "path");
            ASSERT_TRUE(std::string(e.what()).find("to be staged") != std::string::npos, "message");
        }
        auto elapsed = std::chrono::steady_clock::now() - start;
        ASSERT_TRUE(elapsed >= 300ms, "not before the deadline");
        ASSERT_TRUE(elapsed < 300ms + 100ms + 200ms, "within one poll interval of the deadline");
        ASSERT_EQ(fx.staging->get_stats().timeouts, uint64_t{1}, "timeout counter");
        PASS();
    }
    {
        TEST(returns_within_one_poll_of_going_online);
        Fixture fx("secret", 100ms);
        auto start = std::chrono::steady_clock::now();
        fx.hsm->online_at["/hs/g.tar"] = start + 350ms;
        fx.staging->ensure_online("/hs/g.tar", 5s);
        auto elapsed = std::chrono::steady_clock::now() - start;
        ASSERT_TRUE(elapsed >= 350ms, "waited for the file");
        ASSERT_TRUE(elapsed < 350ms + 100ms + 200ms, "noticed on the next poll");
        ASSERT_EQ(fx.hsm->stage_calls["/hs/g.tar"], 1, "one stage request");
        ASSERT_EQ(fx.staging->get_stats().staged_online, uint64_t{1}, "staged counter");
        PASS();
    }
    {
        TEST(cancel_during_wait);
        Fixture fx;
        fx.hsm->offline_polls["/hs/d.tar"] = 1000000;
        CancellationToken token;
        auto fut = fx.staging->ensure_online_async("/hs/d.tar", 10s, token);
        wait_for([&] {
            std::lock_guard lock(fx.hsm->mutex_);
            return fx.hsm->stage_calls["/hs/d.tar"] > 0;
        });
        token.cancel();
        ASSERT_THROWS(fut.get(), OperationCancelled, "cancelled");
        ASSERT_EQ(fx.staging->get_stats().cancelled, uint64_t{1}, "cancel counter");
        PASS();
    }
    {
        TEST(cancelled_before_start);
        Fixture fx;
        CancellationToken token;
        token.cancel();
        ASSERT_THROWS(fx.staging->ensure_online("/hs/e.tar", std::nullopt, token),
                      OperationCancelled, "cancelled up front");
        ASSERT_EQ(fx.hsm->status_calls["/hs/e.tar"], 0, "no status query");
        PASS();
    }
    {
        TEST(async_in_parallel);
        Fixture fx;
        fx.hsm->offline_polls["/hs/f1"] = 1;
        fx.hsm->offline_polls["/hs/f2"] = 1;
        auto a = fx.staging->ensure_online_async("/hs/f1");
        auto b = fx.staging->ensure_online_async("/hs/f2");
        a.get();
        b.get();
        ASSERT_EQ(fx.staging->get_stats().staged_online, uint64_t{2}, "both staged");
        PASS();
    }
    {
        TEST(bad_poll_interval_rejected);
        Fixture fx;
        StagingOptions bad;
        bad.poll_interval = 0ms;
        ASSERT_THROWS(StagingController(fx.client, bad), ValidationError, "zero poll interval");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. StagedStorage
// ---------------------------------------------------------------------------

static void test_staged_storage() {
    std::cout << "\n=== StagedStorage ===" << std::endl;
    auto tmp = make_temp_dir("esmcache-staged");
    write_file(tmp / "exp01" / "out.tar", "tape bytes");

    {
        TEST(hsm_path_mapping);
        Fixture fx;
        StagedStorage s(std::make_shared<LocalStorage>(tmp), fx.staging, "/hs/D-P/", 1s);
        ASSERT_EQ(s.hsm_path("exp01/out.tar"), std::string("/hs/D-P/exp01/out.tar"), "joined");
        ASSERT_EQ(s.hsm_path("/exp01/out.tar"), std::string("/hs/D-P/exp01/out.tar"), "leading slash");
        ASSERT_EQ(s.hsm_path(""), std::string("/hs/D-P"), "root");
        PASS();
    }
    {
        TEST(prepare_stages_file);
        Fixture fx;
        fx.hsm->offline_polls["/hs/D-P/exp01/out.tar"] = 1;
        StagedStorage s(std::make_shared<LocalStorage>(tmp), fx.staging, "/hs/D-P", 1s);
        s.prepare("exp01/out.tar", CancellationToken{});
        ASSERT_EQ(fx.hsm->stage_calls["/hs/D-P/exp01/out.tar"], 1, "staged");
        auto r = s.read("exp01/out.tar", 0, 4);
        ASSERT_TRUE(r.success, "read after staging");
        ASSERT_EQ(std::string(r.data.begin(), r.data.end()), std::string("tape"), "data");
        PASS();
    }
    {
        TEST(metadata_does_not_stage);
        Fixture fx;
        StagedStorage s(std::make_shared<LocalStorage>(tmp), fx.staging, "/hs/D-P", 1s);
        ASSERT_TRUE(s.exists("exp01/out.tar"), "exists");
        ASSERT_EQ(s.size("exp01/out.tar").value_or(0), uint64_t{10}, "size");
        ASSERT_EQ(fx.hsm->status_calls.size(), size_t{0}, "no HSM traffic");
        PASS();
    }

    fs::remove_all(tmp);
}

int main() {
    std::cout << "esm-cache staging tests" << std::endl;
    std::cout << "=======================" << std::endl;

    test_match_filesystem();
    test_authentication();
    test_status();
    test_ensure_online();
    test_staged_storage();

    return report("Results");
}
