#include "esmcache/http_transport.hpp"
#include "esmcache/log.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace esmcache {

namespace {

// Bounded response accumulation
struct WriteContext {
    std::string* body;
    size_t max_size;
    bool size_exceeded;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_size > 0 && ctx->body->size() + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // abort transfer
    }
    ctx->body->append(ptr, bytes);
    return bytes;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

CurlHttpTransport::CurlHttpTransport(CurlTransportOptions options)
    : options_(std::move(options)) {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });

    if (!options_.verify_ssl) {
        log_warn("SSL verification disabled for HSM API. "
                 "This exposes connections to man-in-the-middle attacks.");
    }
}

HttpResponse CurlHttpTransport::execute(const HttpRequest& request) {
    HttpResponse response;

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        response.error = "failed to create curl handle";
        response.is_network_error = true;
        return response;
    }
    CURL* h = curl.get();

    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Post:
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            break;
    }

    curl_slist* raw_headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string header = name + ": " + value;
        raw_headers = curl_slist_append(raw_headers, header.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);
    if (headers) curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());

    if (!options_.user_agent.empty()) {
        curl_easy_setopt(h, CURLOPT_USERAGENT, options_.user_agent.c_str());
    }

    WriteContext write_ctx{&response.body, options_.max_response_size, false};
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &write_ctx);

    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.total_timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    if (options_.verify_ssl) {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    } else {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (!options_.ca_bundle.empty()) {
        curl_easy_setopt(h, CURLOPT_CAINFO, options_.ca_bundle.c_str());
    }

    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);

    CURLcode res = curl_easy_perform(h);
    if (res == CURLE_OK) {
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
        response.error = "response body exceeded maximum size of " +
                         std::to_string(options_.max_response_size) + " bytes";
        response.status_code = 413;
        response.body.clear();
    } else {
        response.error = curl_easy_strerror(res);
        response.is_network_error = true;
    }

    log_debug("HTTP %s %s -> %ld", request.method == HttpMethod::Get ? "GET" : "POST",
              request.url.c_str(), response.status_code);
    return response;
}

}  // namespace esmcache
