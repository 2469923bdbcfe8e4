/*
 * gcrdl/src/http/http_client_curl.cpp
 *
 * libcurl easy-API client. One easy handle per request; response headers are captured for
 * Retry-After and friends. Per-request timeout bounds the whole transfer.
 */

#include <gcrdl/http/http_client.h>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace gcrdl::http {

namespace {

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Error makeCurlError(CURLcode code, std::string_view url) {
    Error err{ErrorCode::Unknown, fmt::format("{}: {}", url, curl_easy_strerror(code))};
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
            err.code = ErrorCode::PermissionDenied;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            break;
    }
    return err;
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* headers = static_cast<std::vector<Header>*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    // A new status line (redirect, 100-continue) starts a fresh header block.
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        headers->push_back(Header{trim(line.substr(0, colon)), trim(line.substr(colon + 1))});
    }
    return total;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* body = static_cast<ByteVector*>(userdata);
    const auto* bytes = reinterpret_cast<const std::byte*>(ptr);
    body->insert(body->end(), bytes, bytes + total);
    return total;
}

void globalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlHttpClient final : public IHttpClient {
public:
    CurlHttpClient() { globalInit(); }

    Result<HttpResponse> send(const HttpRequest& request) override {
        if (request.url.empty()) {
            return Error{ErrorCode::InvalidArgument, "HTTP request without URL"};
        }

        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                                 &curl_easy_cleanup);
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        curl_slist* rawList = nullptr;
        for (const auto& h : request.headers) {
            rawList = curl_slist_append(rawList, fmt::format("{}: {}", h.name, h.value).c_str());
        }
        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> list(rawList,
                                                                         &curl_slist_free_all);

        HttpResponse response;
        CURL* h = curl.get();
        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min<long>(request.timeout.count(), 30000)));
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);

        if (request.method == "POST") {
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        } else if (request.method != "GET") {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        } else {
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        }

        const CURLcode rc = curl_easy_perform(h);
        if (rc != CURLE_OK) {
            spdlog::debug("HTTP {} {} failed: {}", request.method, request.url,
                          curl_easy_strerror(rc));
            return makeCurlError(rc, request.url);
        }
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
        spdlog::debug("HTTP {} {} -> {} ({} bytes)", request.method, request.url, response.status,
                      response.body.size());
        return response;
    }
};

} // namespace

std::unique_ptr<IHttpClient> makeCurlHttpClient() {
    return std::make_unique<CurlHttpClient>();
}

} // namespace gcrdl::http
