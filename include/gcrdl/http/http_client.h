#pragma once

/*
 * Minimal HTTP client seam. Non-2xx statuses are returned as responses, not errors; only
 * transport failures (DNS, connect, TLS, timeout) come back as Error.
 */

#include <gcrdl/core/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gcrdl::http {

struct Header {
    std::string name;
    std::string value;
};

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<Header> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    long status{0};
    std::vector<Header> headers;
    ByteVector body;

    // Case-insensitive lookup of the last header with this name.
    std::optional<std::string> header(std::string_view name) const;
    std::string bodyText() const;
    bool ok() const noexcept { return status >= 200 && status < 300; }
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

std::unique_ptr<IHttpClient> makeCurlHttpClient();

// RFC 3986 percent-encoding of everything outside the unreserved set.
std::string urlEncode(std::string_view s);

// Replaces malformed UTF-8 with U+FFFD and cuts at a character boundary within maxBytes.
std::string toValidUtf8(std::string_view s, std::size_t maxBytes = std::string::npos);

// Error for a non-2xx response: status mapped to an ErrorCode, Retry-After carried along.
Error errorFromResponse(const HttpResponse& response, std::string_view what);

} // namespace gcrdl::http
