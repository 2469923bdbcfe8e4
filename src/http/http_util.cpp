/*
 * gcrdl/src/http/http_util.cpp
 *
 * Transport-independent helpers for the HTTP seam.
 */

#include <gcrdl/http/http_client.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace gcrdl::http {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Length of the well-formed UTF-8 sequence starting at s[i], or 0 if it is malformed.
std::size_t sequenceLength(std::string_view s, std::size_t i) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) {
        return 1;
    }
    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) {
            lo = 0xA0;
        } else if (b0 == 0xED) {
            hi = 0x9F;
        }
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) {
            lo = 0x90;
        } else if (b0 == 0xF4) {
            hi = 0x8F;
        }
    } else {
        return 0;
    }
    if (i + len > s.size()) {
        return 0;
    }
    for (std::size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if (b < (k == 1 ? lo : 0x80) || b > (k == 1 ? hi : 0xBF)) {
            return 0;
        }
    }
    return len;
}

} // namespace

std::string toValidUtf8(std::string_view s, std::size_t maxBytes) {
    static constexpr std::string_view kReplacement{"\xEF\xBF\xBD"};
    std::string out;
    out.reserve(std::min(s.size(), maxBytes));
    std::size_t i = 0;
    while (i < s.size()) {
        const std::size_t len = sequenceLength(s, i);
        const std::string_view piece = len ? s.substr(i, len) : kReplacement;
        if (out.size() + piece.size() > maxBytes) {
            break;
        }
        out.append(piece);
        i += len ? len : 1;
    }
    return out;
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    const auto wanted = to_lower(name);
    for (auto it = headers.rbegin(); it != headers.rend(); ++it) {
        if (to_lower(it->name) == wanted) {
            return it->value;
        }
    }
    return std::nullopt;
}

std::string HttpResponse::bodyText() const {
    return std::string(reinterpret_cast<const char*>(body.data()), body.size());
}

std::string urlEncode(std::string_view s) {
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

Error errorFromResponse(const HttpResponse& response, std::string_view what) {
    const auto text = toValidUtf8(response.bodyText(), 200);
    return errorFromHttpStatus(static_cast<int>(response.status),
                               fmt::format("{}: HTTP {} {}", what, response.status, trim(text)),
                               response.header("Retry-After"));
}

} // namespace gcrdl::http
