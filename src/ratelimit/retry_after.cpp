/*
 * gcrdl/src/ratelimit/retry_after.cpp
 *
 * Retry-After header parsing (RFC 9110 section 10.2.3): either delta-seconds or an HTTP-date.
 * All three historical date forms are accepted; dates are always GMT.
 */

#include <gcrdl/ratelimit/rate_limiter.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <string>

namespace gcrdl::ratelimit {

namespace {

std::string_view trimmed(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<std::chrono::system_clock::time_point> parseHttpDate(std::string_view value) {
    // IMF-fixdate, RFC 850, asctime
    static constexpr const char* kFormats[] = {"%a, %d %b %Y %H:%M:%S", "%A, %d-%b-%y %H:%M:%S",
                                               "%a %b %d %H:%M:%S %Y"};
    for (const char* fmt : kFormats) {
        std::tm tm{};
        std::istringstream in{std::string(value)};
        in.imbue(std::locale::classic());
        in >> std::get_time(&tm, fmt);
        if (in.fail()) {
            continue;
        }
        const std::time_t t = ::timegm(&tm);
        if (t == static_cast<std::time_t>(-1)) {
            continue;
        }
        return std::chrono::system_clock::from_time_t(t);
    }
    return std::nullopt;
}

} // namespace

std::optional<std::chrono::milliseconds> parseRetryAfter(std::string_view value,
                                                         std::chrono::system_clock::time_point now) {
    value = trimmed(value);
    if (value.empty()) {
        return std::nullopt;
    }

    if (std::all_of(value.begin(), value.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
        long long seconds = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
        if (ec == std::errc::result_out_of_range) {
            seconds = std::numeric_limits<long long>::max();
        } else if (ec != std::errc{} || ptr != value.data() + value.size()) {
            return std::nullopt;
        }
        // Clamp absurd values before converting; callers cap further.
        seconds = std::min<long long>(seconds, 24LL * 3600LL);
        return std::chrono::milliseconds(seconds * 1000);
    }

    if (auto date = parseHttpDate(value)) {
        if (*date <= now) {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::ceil<std::chrono::milliseconds>(*date - now);
    }
    return std::nullopt;
}

} // namespace gcrdl::ratelimit
