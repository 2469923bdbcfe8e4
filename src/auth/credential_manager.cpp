/*
 * gcrdl/src/auth/credential_manager.cpp
 */

#include <gcrdl/auth/credential_manager.h>
#include <gcrdl/platform/timer_service.h>
#include <gcrdl/storage/key_value_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <thread>

namespace gcrdl::auth {

namespace {

constexpr std::string_view kTokenKey = "gcrdl_auth_token";
constexpr std::string_view kTimestampKey = "gcrdl_auth_timestamp";
constexpr std::string_view kGenerationKey = "gcrdl_auth_generation";

bool containsAny(const std::string& haystack, std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view n) {
        return haystack.find(n) != std::string::npos;
    });
}

} // namespace

ErrorCode classifyCredentialError(std::string_view message) {
    std::string lower(message);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (containsAny(lower, {"cancel", "did not approve", "user denied", "access_denied",
                            "interaction required", "not signed in"})) {
        return ErrorCode::AuthCancelled;
    }
    if (containsAny(lower, {"network", "connection", "timed out", "timeout", "could not resolve",
                            "offline", "unreachable"})) {
        return ErrorCode::NetworkError;
    }
    if (containsAny(lower, {"oauth2", "client id", "client_id", "invalid_client", "scope",
                            "command not found", "not configured", "configuration"})) {
        return ErrorCode::AuthConfigError;
    }
    return ErrorCode::Unknown;
}

CredentialManager::CredentialManager(CredentialConfig config, Dependencies deps)
    : config_(config), deps_(std::move(deps)) {
    if (!deps_.provider || !deps_.store) {
        throw std::invalid_argument("CredentialManager requires a provider and a store");
    }
    if (!deps_.clock) {
        deps_.clock = [] { return std::chrono::system_clock::now(); };
    }
}

CredentialManager::~CredentialManager() {
    stopProactiveRefresh();
}

Result<std::string> CredentialManager::getToken(bool interactive) {
    if (auto stored = loadStored(); stored && isFresh(*stored)) {
        return stored->token;
    }
    spdlog::debug("CredentialManager: no fresh token, requesting (interactive={})", interactive);
    return requestAndStore(interactive);
}

Result<std::string> CredentialManager::refresh(bool interactive) {
    const auto generationAtStart = generation();

    RefreshLock lock(*deps_.store, config_.lock, deps_.clock);
    auto acquired = lock.acquire();
    if (!acquired) {
        return acquired.error();
    }

    if (!acquired.value()) {
        // Someone else is mid-refresh; let them finish and take what they produce.
        std::this_thread::sleep_for(config_.contendedWait);
        if (auto stored = loadStored()) {
            return stored->token;
        }
        return getToken(interactive);
    }

    // A live holder we waited behind dropped the old token before renewing, so whatever is
    // stored now is its result.
    const bool renewedByHolder = lock.contended() && !lock.seizedStale();
    if (renewedByHolder || generation() != generationAtStart) {
        if (auto stored = loadStored()) {
            spdlog::debug("CredentialManager: reusing token refreshed while waiting");
            return stored->token;
        }
    }

    if (auto previous = loadStored()) {
        if (auto rv = deps_.provider->revokeToken(previous->token); !rv) {
            spdlog::warn("CredentialManager: revoke failed (continuing): {}", rv.error().message);
        }
        if (auto rr = deps_.store->remove(kTokenKey); !rr) {
            spdlog::warn("CredentialManager: failed to drop old token: {}", rr.error().message);
        }
    }

    auto fresh = requestAndStore(interactive);
    if (!fresh) {
        return fresh.error();
    }

    bool reschedule = false;
    {
        std::lock_guard lk(proactiveMutex_);
        reschedule = proactiveEnabled_;
    }
    if (reschedule) {
        startProactiveRefresh();
    }
    spdlog::info("CredentialManager: token refreshed");
    return fresh;
}

Result<void> CredentialManager::ensureValidForBatch() {
    auto token = getToken(false);
    if (!token) {
        token = getToken(true);
    }
    if (!token) {
        spdlog::error("CredentialManager: no credential available for batch: {}",
                      token.error().message);
        return token.error();
    }

    auto remaining = deps_.provider->remainingLifetime(token.value());
    if (!remaining) {
        const auto code = remaining.error().code;
        if (code != ErrorCode::Unauthorized && code != ErrorCode::InvalidArgument) {
            return remaining.error();
        }
        spdlog::info("CredentialManager: token rejected by introspection, refreshing");
    } else if (remaining.value() >= config_.minBatchValidity) {
        return Result<void>();
    } else {
        spdlog::info("CredentialManager: token expires in {}s, refreshing before batch",
                     remaining.value().count());
    }

    auto refreshed = refresh(true);
    if (!refreshed) {
        return refreshed.error();
    }
    return Result<void>();
}

Result<void> CredentialManager::signOut() {
    stopProactiveRefresh();
    if (auto stored = loadStored()) {
        if (auto rv = deps_.provider->revokeToken(stored->token); !rv) {
            spdlog::warn("CredentialManager: revoke failed: {}", rv.error().message);
        }
    }
    if (auto rr = deps_.store->remove(kTokenKey); !rr) {
        return rr;
    }
    return deps_.store->remove(kTimestampKey);
}

void CredentialManager::startProactiveRefresh() {
    if (!deps_.timers) {
        spdlog::debug("CredentialManager: no timer service, proactive refresh disabled");
        return;
    }
    {
        std::lock_guard lk(proactiveMutex_);
        proactiveEnabled_ = true;
    }
    deps_.timers->scheduleRecurring(
        kProactiveRefreshTimer,
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.proactiveRefreshInterval),
        [this] { onProactiveTimer(); });
}

void CredentialManager::stopProactiveRefresh() {
    {
        std::lock_guard lk(proactiveMutex_);
        proactiveEnabled_ = false;
    }
    if (deps_.timers) {
        deps_.timers->cancel(kProactiveRefreshTimer);
    }
}

std::optional<std::string> CredentialManager::storedToken() const {
    if (auto s = loadStored()) {
        return s->token;
    }
    return std::nullopt;
}

std::optional<TimePoint> CredentialManager::issuedAt() const {
    if (auto s = loadStored()) {
        return s->issuedAt;
    }
    return std::nullopt;
}

std::optional<CredentialManager::Stored> CredentialManager::loadStored() const {
    auto token = deps_.store->get(kTokenKey);
    auto stamp = deps_.store->get(kTimestampKey);
    if (!token || !stamp) {
        spdlog::warn("CredentialManager: credential store unreadable");
        return std::nullopt;
    }
    if (!token.value() || !stamp.value() || !token.value()->is_string() ||
        !stamp.value()->is_number_integer()) {
        return std::nullopt;
    }
    return Stored{token.value()->get<std::string>(),
                  fromEpochMillis(stamp.value()->get<std::int64_t>())};
}

std::int64_t CredentialManager::generation() const {
    auto g = deps_.store->get(kGenerationKey);
    if (!g || !g.value() || !g.value()->is_number_integer()) {
        return 0;
    }
    return g.value()->get<std::int64_t>();
}

Result<void> CredentialManager::persist(const std::string& token, TimePoint issued) {
    if (auto r = deps_.store->set(kTokenKey, token); !r) {
        return r;
    }
    if (auto r = deps_.store->set(kTimestampKey, toEpochMillis(issued)); !r) {
        return r;
    }
    return deps_.store->set(kGenerationKey, generation() + 1);
}

Result<std::string> CredentialManager::requestAndStore(bool interactive) {
    auto r = deps_.provider->requestToken(interactive);
    if (!r) {
        Error err = r.error();
        if (err.code == ErrorCode::Unknown) {
            err.code = classifyCredentialError(err.message);
        }
        spdlog::warn("CredentialManager: provider failed ({}): {}", err.code, err.message);
        return err;
    }
    if (r.value().empty()) {
        return Error{ErrorCode::AuthConfigError, "Credential provider returned an empty token"};
    }
    if (auto pr = persist(r.value(), deps_.clock()); !pr) {
        spdlog::warn("CredentialManager: failed to persist token: {}", pr.error().message);
    }
    return r;
}

bool CredentialManager::isFresh(const Stored& s) const {
    const auto usable = config_.assumedLifetime - config_.expiryBuffer;
    return deps_.clock() - s.issuedAt < usable;
}

void CredentialManager::onProactiveTimer() {
    if (!loadStored()) {
        spdlog::debug("CredentialManager: proactive refresh skipped, not signed in");
        return;
    }
    auto r = refresh(false);
    if (!r) {
        spdlog::warn("CredentialManager: proactive refresh failed: {}", r.error().message);
    }
}

} // namespace gcrdl::auth
