#pragma once

/*
 * gcrdl offline retry queue
 *
 * Content jobs that ran out of attempts on a network-class failure (NetworkError, Timeout) are
 * parked here instead of being forgotten. The queue is one JSON array in the durable store,
 * oldest first, unique by file id and capped at maxEntries (the oldest entry is dropped to
 * make room). DownloadOrchestrator::retryOffline() replays it as a batch.
 */

#include <gcrdl/downloader/downloader.hpp>

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace gcrdl::storage {
class IKeyValueStore;
}

namespace gcrdl::downloader {

inline constexpr const char* kOfflineQueueKey = "gcrdl_offline_queue";

struct OfflineItem {
    catalog::DriveFile file;
    std::string displayName;
    std::string folder;
    std::string reason;
    TimePoint queuedAt{};
    int retryCount{0};
};

nlohmann::json toJson(const OfflineItem& item);
Result<OfflineItem> offlineItemFromJson(const nlohmann::json& j);

class OfflineQueue {
public:
    explicit OfflineQueue(storage::IKeyValueStore& store, std::size_t maxEntries = 100)
        : store_(store), maxEntries_(maxEntries == 0 ? 1 : maxEntries) {}

    // false when an item with the same file id is already queued.
    Result<bool> add(OfflineItem item);
    Result<std::vector<OfflineItem>> items() const;
    Result<void> remove(std::string_view fileId);
    Result<void> clear();

    // Increments the item's retry count; drops it once the count reaches `limit`.
    // Returns true when the item was dropped.
    Result<bool> recordFailedRetry(std::string_view fileId, int limit);

private:
    Result<std::vector<OfflineItem>> loadLocked() const;
    Result<void> saveLocked(const std::vector<OfflineItem>& queue);

    storage::IKeyValueStore& store_;
    std::size_t maxEntries_;
    mutable std::mutex mutex_;
};

} // namespace gcrdl::downloader
