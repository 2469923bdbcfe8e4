#pragma once

/*
 * gcrdl RateLimiter - priority token bucket with server-driven backoff
 *
 * Every outbound call to the remote APIs passes through acquire(). The bucket holds up to
 * `capacity` permits and refills continuously at `refillPerSecond`. A 429 response opens a
 * backoff window during which no permits are issued at all; the next successful response
 * closes it again. The limiter never fails a caller, it only delays.
 */

#include <gcrdl/core/types.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string_view>
#include <utility>

namespace gcrdl::storage {
class IKeyValueStore;
}

namespace gcrdl::ratelimit {

// Lower value = served first.
enum class Priority : int { Critical = 0, High = 1, Normal = 2, Low = 3 };

struct RateLimiterConfig {
    double capacity{90.0};
    double refillPerSecond{1.5};
    std::chrono::milliseconds defaultBackoff{2000}; // unparseable or missing Retry-After
    std::chrono::milliseconds maxBackoff{64000};
};

struct RateLimiterStats {
    double availableTokens{0.0};
    double capacity{0.0};
    double refillPerSecond{0.0};
    std::size_t waiting{0};
    bool inBackoff{false};
    std::chrono::milliseconds backoffRemaining{0};
    std::uint64_t granted{0};
};

/**
 * Parse a Retry-After header value: delta-seconds or an HTTP-date (IMF-fixdate, RFC 850,
 * asctime). Dates in the past yield zero. Returns nullopt when the value is neither.
 */
std::optional<std::chrono::milliseconds>
parseRetryAfter(std::string_view value,
                std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

class RateLimiter {
public:
    /**
     * @param store optional durable store; when given, bucket and backoff state survive
     *        process restarts (saved on grants and backoff changes, restored here).
     */
    explicit RateLimiter(RateLimiterConfig config = {}, storage::IKeyValueStore* store = nullptr);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Blocks until a permit is available for `priority`.
    void acquire(Priority priority = Priority::Normal);

    // Caller saw a 429. Opens (or extends) the backoff window.
    void report429(std::optional<std::string_view> retryAfter = std::nullopt);

    // Caller saw a success.
    void clearBackoff();

    RateLimiterStats stats() const;

    // Full bucket, no backoff.
    void reset();

    const RateLimiterConfig& config() const noexcept { return config_; }

private:
    using Clock = std::chrono::steady_clock;
    using Waiter = std::pair<int, std::uint64_t>; // (priority, arrival ticket)

    void refillLocked(Clock::time_point now);
    void persistLocked();
    void restore();

    RateLimiterConfig config_;
    storage::IKeyValueStore* store_{nullptr};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    double tokens_{0.0};
    Clock::time_point lastRefill_{};
    Clock::time_point backoffUntil_{};
    std::set<Waiter> waiters_;
    std::uint64_t nextTicket_{0};
    std::uint64_t granted_{0};
};

} // namespace gcrdl::ratelimit
