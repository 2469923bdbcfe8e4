#pragma once

/*
 * gcrdl CredentialManager - bearer tokens for every remote call
 *
 * - getToken: stored token while it is believed fresh (issued < lifetime - buffer ago),
 *   otherwise a new one from the provider
 * - refresh: forced renewal under the durable RefreshLock; a caller that waited behind
 *   another refresh reuses that result instead of renewing again
 * - proactive refresh on a recurring timer, ahead of expiry
 * - ensureValidForBatch: pre-flight before a long download batch
 */

#include <gcrdl/auth/refresh_lock.h>
#include <gcrdl/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace gcrdl::storage {
class IKeyValueStore;
}

namespace gcrdl::platform {
class ITimerService;
}

namespace gcrdl::http {
class IHttpClient;
}

namespace gcrdl::auth {

/**
 * Source of bearer tokens. Failures are classified:
 *   AuthCancelled (user declined), NetworkError, AuthConfigError; anything else is Unknown.
 */
class ICredentialProvider {
public:
    virtual ~ICredentialProvider() = default;

    virtual Result<std::string> requestToken(bool interactive) = 0;

    // Best effort; callers log and continue on failure.
    virtual Result<void> revokeToken(const std::string& token) = 0;

    // Introspection: seconds the token remains valid. Unauthorized/InvalidArgument when the
    // token is rejected outright.
    virtual Result<std::chrono::seconds> remainingLifetime(const std::string& token) = 0;
};

// Map provider error text onto AuthCancelled / NetworkError / AuthConfigError / Unknown.
ErrorCode classifyCredentialError(std::string_view message);

// Runs `command` (e.g. "gcloud auth print-access-token") for tokens; revocation and
// introspection go to the OAuth2 endpoints through `http`.
std::unique_ptr<ICredentialProvider> makeCommandCredentialProvider(std::string command,
                                                                   http::IHttpClient& http);

struct CredentialConfig {
    std::chrono::minutes assumedLifetime{60};
    std::chrono::minutes expiryBuffer{5};
    std::chrono::minutes proactiveRefreshInterval{50};
    std::chrono::minutes minBatchValidity{10};
    std::chrono::milliseconds contendedWait{2000};
    RefreshLockConfig lock{};
};

inline constexpr const char* kProactiveRefreshTimer = "gcrdl-proactive-token-refresh";

class CredentialManager {
public:
    struct Dependencies {
        ICredentialProvider* provider{nullptr};
        storage::IKeyValueStore* store{nullptr};
        platform::ITimerService* timers{nullptr}; // optional
        std::function<TimePoint()> clock{};       // defaults to system_clock
    };

    CredentialManager(CredentialConfig config, Dependencies deps);
    ~CredentialManager();

    CredentialManager(const CredentialManager&) = delete;
    CredentialManager& operator=(const CredentialManager&) = delete;

    Result<std::string> getToken(bool interactive);
    Result<std::string> refresh(bool interactive);
    Result<void> ensureValidForBatch();

    // Revoke (best effort) and forget the stored token; stops proactive refresh.
    Result<void> signOut();

    void startProactiveRefresh();
    void stopProactiveRefresh();

    // Stored token and its issuance time, without contacting the provider.
    std::optional<std::string> storedToken() const;
    std::optional<TimePoint> issuedAt() const;

    const CredentialConfig& config() const noexcept { return config_; }

private:
    struct Stored {
        std::string token;
        TimePoint issuedAt;
    };

    std::optional<Stored> loadStored() const;
    // Bumped on every persisted token; 0 before the first one.
    std::int64_t generation() const;
    Result<void> persist(const std::string& token, TimePoint issued);
    Result<std::string> requestAndStore(bool interactive);
    bool isFresh(const Stored& s) const;
    void onProactiveTimer();

    CredentialConfig config_;
    Dependencies deps_;
    std::mutex proactiveMutex_;
    bool proactiveEnabled_{false};
};

} // namespace gcrdl::auth
