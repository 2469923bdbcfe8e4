/*
 * gcrdl/src/auth/refresh_lock.cpp
 */

#include <gcrdl/auth/refresh_lock.h>
#include <gcrdl/storage/key_value_store.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <random>
#include <thread>

namespace gcrdl::auth {

using json = nlohmann::json;

namespace {

// Serializes the read-check-write-verify step between threads of this process.
std::mutex& leaseMutex() {
    static std::mutex m;
    return m;
}

std::string makeOwnerId(TimePoint now) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return fmt::format("lock_{}_{:016x}", toEpochMillis(now), rng());
}

} // namespace

RefreshLock::RefreshLock(storage::IKeyValueStore& store, RefreshLockConfig config,
                         std::function<TimePoint()> clock)
    : store_(store), config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
    ownerId_ = makeOwnerId(clock_());
}

RefreshLock::~RefreshLock() {
    if (held_) {
        release();
    }
}

Result<bool> RefreshLock::acquire() {
    if (held_) {
        return true;
    }
    const auto deadline = std::chrono::steady_clock::now() + config_.maxWait;
    while (true) {
        auto r = tryAcquireOnce();
        if (!r) {
            return r.error();
        }
        if (r.value()) {
            held_ = true;
            return true;
        }
        contended_ = true;
        if (std::chrono::steady_clock::now() + config_.pollInterval > deadline) {
            spdlog::warn("RefreshLock: gave up after {}ms", config_.maxWait.count());
            return false;
        }
        std::this_thread::sleep_for(config_.pollInterval);
    }
}

Result<bool> RefreshLock::tryAcquireOnce() {
    std::lock_guard lk(leaseMutex());
    const auto now = toEpochMillis(clock_());
    bool seizing = false;

    auto current = store_.get(kRefreshLockKey);
    if (!current) {
        return current.error();
    }
    if (current.value() && current.value()->is_object()) {
        const auto& lease = *current.value();
        const auto holder = lease.value("lock_id", std::string{});
        const auto age = now - lease.value("acquired_at", std::int64_t{0});
        if (holder == ownerId_) {
            return true;
        }
        if (age < config_.staleAfter.count()) {
            return false;
        }
        spdlog::warn("RefreshLock: seizing stale lease '{}' ({}ms old)", holder, age);
        seizing = true;
    }

    auto wr = store_.set(kRefreshLockKey, json{{"lock_id", ownerId_}, {"acquired_at", now}});
    if (!wr) {
        return wr.error();
    }

    auto verify = store_.get(kRefreshLockKey);
    if (!verify) {
        return verify.error();
    }
    const bool mine = verify.value() && verify.value()->is_object() &&
                      verify.value()->value("lock_id", std::string{}) == ownerId_;
    if (!mine) {
        spdlog::debug("RefreshLock: lost the race for the lease");
    } else if (seizing) {
        seizedStale_ = true;
    }
    return mine;
}

void RefreshLock::release() {
    std::lock_guard lk(leaseMutex());
    held_ = false;
    auto current = store_.get(kRefreshLockKey);
    if (!current) {
        spdlog::warn("RefreshLock: release could not read lease: {}", current.error().message);
        return;
    }
    if (!current.value() || !current.value()->is_object() ||
        current.value()->value("lock_id", std::string{}) != ownerId_) {
        return;
    }
    if (auto rr = store_.remove(kRefreshLockKey); !rr) {
        spdlog::warn("RefreshLock: release failed: {}", rr.error().message);
    }
}

} // namespace gcrdl::auth
