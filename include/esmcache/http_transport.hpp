#pragma once

#include <chrono>
#include <map>
#include <string>

namespace esmcache {

enum class HttpMethod { Get, Post };

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error;             // transport-level failure, empty on success
    bool is_network_error = false;

    bool ok() const { return !is_network_error && status_code >= 200 && status_code < 300; }
};

/// Blocking request/response transport used by the HSM client.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

struct CurlTransportOptions {
    bool verify_ssl = true;
    std::string ca_bundle;                 // empty: system default
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{60000};
    size_t max_response_size = 16 * 1024 * 1024;
    std::string user_agent = "esm-cache/1.0";
};

/// libcurl binding. One easy handle per request; safe to share across threads.
class CurlHttpTransport : public HttpTransport {
public:
    explicit CurlHttpTransport(CurlTransportOptions options = {});

    HttpResponse execute(const HttpRequest& request) override;

private:
    CurlTransportOptions options_;
};

/// Percent-encode a query parameter value.
std::string url_encode(const std::string& value);

}  // namespace esmcache
