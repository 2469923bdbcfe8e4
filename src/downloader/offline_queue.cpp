/*
 * gcrdl/src/downloader/offline_queue.cpp
 */

#include <gcrdl/downloader/offline_queue.hpp>
#include <gcrdl/storage/key_value_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace gcrdl::downloader {

using json = nlohmann::json;

json toJson(const OfflineItem& item) {
    return json{{"source", catalog::Attachment{item.file}},
                {"display_name", item.displayName},
                {"folder", item.folder},
                {"reason", item.reason},
                {"queued_at", toEpochMillis(item.queuedAt)},
                {"retry_count", item.retryCount}};
}

Result<OfflineItem> offlineItemFromJson(const json& j) {
    try {
        OfflineItem item;
        auto a = j.at("source").get<catalog::Attachment>();
        if (!std::holds_alternative<catalog::DriveFile>(a)) {
            return Error{ErrorCode::InvalidData, "Offline item source is not a Drive file"};
        }
        item.file = std::get<catalog::DriveFile>(std::move(a));
        item.displayName = j.value("display_name", item.file.title);
        item.folder = j.value("folder", std::string{});
        item.reason = j.value("reason", std::string{});
        item.queuedAt = fromEpochMillis(j.value("queued_at", std::int64_t{0}));
        item.retryCount = j.value("retry_count", 0);
        return item;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed offline item: ") + e.what()};
    } catch (const std::invalid_argument& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed offline item: ") + e.what()};
    }
}

Result<bool> OfflineQueue::add(OfflineItem item) {
    std::lock_guard lk(mutex_);
    auto queue = loadLocked();
    if (!queue) {
        return queue.error();
    }
    auto& q = queue.value();
    const bool exists = std::any_of(q.begin(), q.end(), [&](const OfflineItem& i) {
        return i.file.id == item.file.id;
    });
    if (exists) {
        spdlog::debug("OfflineQueue: '{}' already queued", item.displayName);
        return false;
    }
    while (q.size() >= maxEntries_) {
        spdlog::warn("OfflineQueue: full ({} items), dropping '{}'", q.size(),
                     q.front().displayName);
        q.erase(q.begin());
    }
    spdlog::info("OfflineQueue: queued '{}' ({})", item.displayName, item.reason);
    q.push_back(std::move(item));
    if (auto r = saveLocked(q); !r) {
        return r.error();
    }
    return true;
}

Result<std::vector<OfflineItem>> OfflineQueue::items() const {
    std::lock_guard lk(mutex_);
    return loadLocked();
}

Result<void> OfflineQueue::remove(std::string_view fileId) {
    std::lock_guard lk(mutex_);
    auto queue = loadLocked();
    if (!queue) {
        return queue.error();
    }
    auto& q = queue.value();
    const auto before = q.size();
    q.erase(std::remove_if(q.begin(), q.end(),
                           [&](const OfflineItem& i) { return i.file.id == fileId; }),
            q.end());
    if (q.size() == before) {
        return Result<void>();
    }
    return saveLocked(q);
}

Result<void> OfflineQueue::clear() {
    std::lock_guard lk(mutex_);
    return store_.remove(kOfflineQueueKey);
}

Result<bool> OfflineQueue::recordFailedRetry(std::string_view fileId, int limit) {
    std::lock_guard lk(mutex_);
    auto queue = loadLocked();
    if (!queue) {
        return queue.error();
    }
    auto& q = queue.value();
    auto it = std::find_if(q.begin(), q.end(),
                           [&](const OfflineItem& i) { return i.file.id == fileId; });
    if (it == q.end()) {
        return false;
    }
    bool dropped = false;
    if (++it->retryCount >= limit) {
        spdlog::warn("OfflineQueue: giving up on '{}' after {} retries", it->displayName,
                     it->retryCount);
        q.erase(it);
        dropped = true;
    }
    if (auto r = saveLocked(q); !r) {
        return r.error();
    }
    return dropped;
}

Result<std::vector<OfflineItem>> OfflineQueue::loadLocked() const {
    auto stored = store_.get(kOfflineQueueKey);
    if (!stored) {
        return stored.error();
    }
    std::vector<OfflineItem> out;
    if (!stored.value() || !stored.value()->is_array()) {
        return out;
    }
    for (const auto& j : *stored.value()) {
        auto item = offlineItemFromJson(j);
        if (!item) {
            spdlog::warn("OfflineQueue: skipping entry: {}", item.error().message);
            continue;
        }
        out.push_back(std::move(item).value());
    }
    return out;
}

Result<void> OfflineQueue::saveLocked(const std::vector<OfflineItem>& queue) {
    json arr = json::array();
    for (const auto& item : queue) {
        arr.push_back(toJson(item));
    }
    return store_.set(kOfflineQueueKey, arr);
}

} // namespace gcrdl::downloader
