#pragma once

/*
 * RefreshLock - a lease record in the durable store ({lock_id, acquired_at}).
 *
 * Lives in the store rather than in memory so a process that restarts mid-refresh still sees
 * (and eventually seizes) the abandoned lease. Ownership is confirmed by re-reading after the
 * write. Scoped: the destructor releases a held lease.
 */

#include <gcrdl/core/types.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace gcrdl::storage {
class IKeyValueStore;
}

namespace gcrdl::auth {

struct RefreshLockConfig {
    std::chrono::milliseconds staleAfter{10000};
    std::chrono::milliseconds maxWait{15000};
    std::chrono::milliseconds pollInterval{500};
};

class RefreshLock {
public:
    RefreshLock(storage::IKeyValueStore& store, RefreshLockConfig config,
                std::function<TimePoint()> clock = {});
    ~RefreshLock();

    RefreshLock(const RefreshLock&) = delete;
    RefreshLock& operator=(const RefreshLock&) = delete;

    // Polls until the lease is ours or maxWait elapses. Returns false on timeout.
    Result<bool> acquire();

    // Releases only if the stored lease is still ours.
    void release();

    bool held() const noexcept { return held_; }

    // True when acquire() had to wait behind another holder first.
    bool contended() const noexcept { return contended_; }

    // True when the lease was taken over from a holder that stopped renewing it.
    bool seizedStale() const noexcept { return seizedStale_; }

    const std::string& ownerId() const noexcept { return ownerId_; }

private:
    Result<bool> tryAcquireOnce();

    storage::IKeyValueStore& store_;
    RefreshLockConfig config_;
    std::function<TimePoint()> clock_;
    std::string ownerId_;
    bool held_{false};
    bool contended_{false};
    bool seizedStale_{false};
};

// Store key of the lease record.
inline constexpr const char* kRefreshLockKey = "gcrdl_token_refresh_lock";

} // namespace gcrdl::auth
