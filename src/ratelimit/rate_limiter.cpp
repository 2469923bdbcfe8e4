/*
 * gcrdl/src/ratelimit/rate_limiter.cpp
 *
 * Priority token bucket.
 * - Tokens are doubles refilled continuously from elapsed steady-clock time
 * - Waiters form an ordered set keyed by (priority, arrival); only the head may take a token,
 *   which gives priority order across classes and FIFO within one
 * - A backoff window blocks the head (and so everyone) until it expires or is cleared
 */

#include <gcrdl/ratelimit/rate_limiter.h>
#include <gcrdl/storage/key_value_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace gcrdl::ratelimit {

namespace {

constexpr std::string_view kStateKey = "gcrdl_rate_limiter_state";

} // namespace

RateLimiter::RateLimiter(RateLimiterConfig config, storage::IKeyValueStore* store)
    : config_(config), store_(store) {
    if (config_.capacity < 1.0) {
        config_.capacity = 1.0;
    }
    if (config_.refillPerSecond <= 0.0) {
        config_.refillPerSecond = 1.0;
    }
    tokens_ = config_.capacity;
    lastRefill_ = Clock::now();
    backoffUntil_ = lastRefill_;
    restore();
}

void RateLimiter::acquire(Priority priority) {
    std::unique_lock lk(mutex_);
    const Waiter self{static_cast<int>(priority), nextTicket_++};
    waiters_.insert(self);

    while (true) {
        if (*waiters_.begin() != self) {
            cv_.wait(lk);
            continue;
        }

        const auto now = Clock::now();
        if (now < backoffUntil_) {
            cv_.wait_until(lk, backoffUntil_);
            continue;
        }

        refillLocked(now);
        if (tokens_ >= 1.0) {
            tokens_ -= 1.0;
            ++granted_;
            waiters_.erase(self);
            persistLocked();
            cv_.notify_all();
            return;
        }

        const auto deficit = std::chrono::duration<double>((1.0 - tokens_) / config_.refillPerSecond);
        cv_.wait_for(lk, std::chrono::duration_cast<std::chrono::microseconds>(deficit) +
                             std::chrono::microseconds(1));
    }
}

void RateLimiter::report429(std::optional<std::string_view> retryAfter) {
    std::chrono::milliseconds delay = config_.defaultBackoff;
    if (retryAfter) {
        if (auto parsed = parseRetryAfter(*retryAfter)) {
            delay = *parsed;
        } else {
            spdlog::debug("RateLimiter: unparseable Retry-After '{}', using default {}ms",
                          *retryAfter, config_.defaultBackoff.count());
        }
    }
    delay = std::min(delay, config_.maxBackoff);

    std::lock_guard lk(mutex_);
    const auto until = Clock::now() + delay;
    if (until > backoffUntil_) {
        backoffUntil_ = until;
        spdlog::warn("RateLimiter: throttled by server, backing off {}ms", delay.count());
        persistLocked();
    }
    cv_.notify_all();
}

void RateLimiter::clearBackoff() {
    std::lock_guard lk(mutex_);
    const auto now = Clock::now();
    if (backoffUntil_ > now) {
        backoffUntil_ = now;
        spdlog::debug("RateLimiter: backoff cleared");
        persistLocked();
    }
    cv_.notify_all();
}

RateLimiterStats RateLimiter::stats() const {
    std::lock_guard lk(mutex_);
    const auto now = Clock::now();
    // Project the refill without mutating the bucket.
    const double elapsed = std::chrono::duration<double>(now - lastRefill_).count();
    RateLimiterStats s;
    s.availableTokens =
        std::min(config_.capacity, tokens_ + std::max(0.0, elapsed) * config_.refillPerSecond);
    s.capacity = config_.capacity;
    s.refillPerSecond = config_.refillPerSecond;
    s.waiting = waiters_.size();
    s.inBackoff = now < backoffUntil_;
    if (s.inBackoff) {
        s.backoffRemaining =
            std::chrono::ceil<std::chrono::milliseconds>(backoffUntil_ - now);
    }
    s.granted = granted_;
    return s;
}

void RateLimiter::reset() {
    std::lock_guard lk(mutex_);
    tokens_ = config_.capacity;
    lastRefill_ = Clock::now();
    backoffUntil_ = lastRefill_;
    persistLocked();
    cv_.notify_all();
}

void RateLimiter::refillLocked(Clock::time_point now) {
    const double elapsed = std::chrono::duration<double>(now - lastRefill_).count();
    if (elapsed <= 0.0) {
        return;
    }
    tokens_ = std::min(config_.capacity, tokens_ + elapsed * config_.refillPerSecond);
    lastRefill_ = now;
}

void RateLimiter::persistLocked() {
    if (!store_) {
        return;
    }
    // Steady time is meaningless across restarts; store wall-clock equivalents.
    const auto steadyNow = Clock::now();
    const auto wallNow = std::chrono::system_clock::now();
    auto toWall = [&](Clock::time_point tp) {
        return toEpochMillis(wallNow + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                                           tp - steadyNow));
    };
    nlohmann::json state{{"tokens", tokens_},
                         {"last_refill", toWall(lastRefill_)},
                         {"backoff_until", toWall(backoffUntil_)}};
    auto r = store_->set(kStateKey, state);
    if (!r) {
        spdlog::debug("RateLimiter: failed to persist state: {}", r.error().message);
    }
}

void RateLimiter::restore() {
    if (!store_) {
        return;
    }
    auto r = store_->get(kStateKey);
    if (!r) {
        spdlog::warn("RateLimiter: failed to read persisted state: {}", r.error().message);
        return;
    }
    if (!r.value() || !r.value()->is_object()) {
        return;
    }
    const auto& state = *r.value();
    const auto steadyNow = Clock::now();
    const auto wallNowMs = toEpochMillis(std::chrono::system_clock::now());

    if (auto it = state.find("tokens"); it != state.end() && it->is_number()) {
        tokens_ = std::clamp(it->get<double>(), 0.0, config_.capacity);
        if (auto lr = state.find("last_refill"); lr != state.end() && lr->is_number_integer()) {
            const auto ageMs = std::max<std::int64_t>(0, wallNowMs - lr->get<std::int64_t>());
            tokens_ = std::min(config_.capacity,
                               tokens_ + static_cast<double>(ageMs) / 1000.0 * config_.refillPerSecond);
        }
    }
    if (auto it = state.find("backoff_until"); it != state.end() && it->is_number_integer()) {
        const auto remainingMs = it->get<std::int64_t>() - wallNowMs;
        if (remainingMs > 0) {
            backoffUntil_ =
                steadyNow + std::min(std::chrono::milliseconds(remainingMs), config_.maxBackoff);
            spdlog::info("RateLimiter: resuming persisted backoff ({}ms left)", remainingMs);
        }
    }
    lastRefill_ = steadyNow;
}

} // namespace gcrdl::ratelimit
