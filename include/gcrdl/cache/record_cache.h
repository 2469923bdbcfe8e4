#pragma once

/*
 * gcrdl RecordCache - persistent LRU over the durable key-value store
 *
 * Holds catalog documents keyed by collection (course) id. Bounded by entry count and by the
 * total serialized size; the least recently used entry is evicted first. Entries older than
 * maxAge are dropped on read.
 *
 * Layout in the store:
 *   gcrdl_course_data_<id>  -> {"collection_id", "created_at", "version", "truncated", "payload"}
 *   gcrdl_cache_metadata    -> {"version", "next_sequence", "total_size", "entries": {...}}
 */

#include <gcrdl/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gcrdl::storage {
class IKeyValueStore;
}

namespace gcrdl::cache {

struct CacheConfig {
    std::size_t maxEntries{5};
    std::size_t maxBytes{4718592}; // 4.5 MiB
    std::chrono::hours maxAge{24 * 30};
    double truncateThreshold{0.9}; // fraction of maxBytes
    std::size_t maxAnnouncements{50};
    std::size_t maxMaterials{100};
    std::size_t maxAssignments{100};
};

struct CacheEntrySummary {
    std::string collectionId;
    std::string name;
    std::size_t sizeBytes{0};
    std::uint64_t accessCount{0};
    TimePoint lastAccessTime{};
    TimePoint createdAt{};
};

struct CacheStats {
    std::size_t count{0};
    std::size_t totalSizeBytes{0};
    std::size_t maxEntries{0};
    std::size_t maxBytes{0};
    double utilizationPercent{0.0};
    std::vector<CacheEntrySummary> entries; // most recently used first
};

class RecordCache {
public:
    using ClockFn = std::function<TimePoint()>;

    RecordCache(storage::IKeyValueStore& store, CacheConfig config = {}, ClockFn clock = {});

    RecordCache(const RecordCache&) = delete;
    RecordCache& operator=(const RecordCache&) = delete;

    // Payload if present and fresh. A stale entry is removed. Recency is left untouched.
    Result<std::optional<nlohmann::json>> get(std::string_view collectionId);

    // Record a use; no-op for unknown ids.
    Result<void> touch(std::string_view collectionId);

    // Insert or replace, evicting LRU entries until both bounds hold. Oversized payloads are
    // truncated first. `name` is kept for diagnostics only.
    Result<void> set(std::string_view collectionId, nlohmann::json payload,
                     std::string_view name = {});

    // Remove the least recently used entry. False when the cache is empty.
    Result<bool> evictLRU();

    Result<void> clear(std::string_view collectionId);
    Result<void> clearAll();

    Result<CacheStats> stats();

    // True when the stored document for this id was truncated on write.
    Result<bool> isTruncated(std::string_view collectionId);

    const CacheConfig& config() const noexcept { return config_; }

private:
    struct EntryMeta {
        std::string name;
        std::size_t sizeBytes{0};
        std::int64_t lastAccess{0}; // epoch ms
        std::uint64_t accessCount{0};
        std::int64_t createdAt{0};
        std::uint64_t sequence{0};
    };

    struct Metadata {
        std::map<std::string, EntryMeta> entries;
        std::size_t totalSize{0};
        std::uint64_t nextSequence{0};
    };

    Result<Metadata> loadMetadataLocked();
    Result<void> saveMetadataLocked(const Metadata& meta);
    Result<bool> evictOneLocked(Metadata& meta);
    Result<void> removeEntryLocked(Metadata& meta, const std::string& id);
    nlohmann::json truncate(nlohmann::json payload, std::size_t budget,
                            std::size_t& serializedSize) const;
    std::int64_t nowMillis() const;

    storage::IKeyValueStore& store_;
    CacheConfig config_;
    ClockFn clock_;
    std::mutex mutex_;
};

// Store key of the cached document for a collection id.
std::string cacheDataKey(std::string_view collectionId);

} // namespace gcrdl::cache
