/*
 * gcrdl/src/cache/record_cache.cpp
 *
 * Dual-bounded LRU on top of IKeyValueStore.
 * - Metadata is the index; the data keys hold the documents
 * - Metadata totals are recomputed from the per-entry sizes on every load, so a crash between
 *   the data write and the metadata write heals on the next operation
 * - Eviction order: oldest last access, then oldest insertion sequence
 */

#include <gcrdl/cache/record_cache.h>
#include <gcrdl/storage/key_value_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <utility>

namespace gcrdl::cache {

using json = nlohmann::json;

namespace {

constexpr std::string_view kDataPrefix = "gcrdl_course_data_";
constexpr std::string_view kMetadataKey = "gcrdl_cache_metadata";
constexpr int kVersion = 2;

json makeDocument(std::string_view id, const json& payload, std::int64_t now, bool truncated) {
    return json{{"collection_id", id},
                {"created_at", now},
                {"version", kVersion},
                {"truncated", truncated},
                {"payload", payload}};
}

std::size_t dumpedSize(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace).size();
}

} // namespace

std::string cacheDataKey(std::string_view collectionId) {
    return std::string(kDataPrefix) + std::string(collectionId);
}

RecordCache::RecordCache(storage::IKeyValueStore& store, CacheConfig config, ClockFn clock)
    : store_(store), config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
    if (config_.maxEntries == 0) {
        config_.maxEntries = 1;
    }
}

std::int64_t RecordCache::nowMillis() const {
    return toEpochMillis(clock_());
}

Result<std::optional<json>> RecordCache::get(std::string_view collectionId) {
    std::lock_guard lk(mutex_);
    auto r = store_.get(cacheDataKey(collectionId));
    if (!r) {
        return r.error();
    }

    if (!r.value()) {
        // Index entry without data: drop it so the accounting stays honest.
        auto meta = loadMetadataLocked();
        if (meta && meta.value().entries.count(std::string(collectionId)) != 0) {
            auto& m = meta.value();
            m.entries.erase(std::string(collectionId));
            if (auto sr = saveMetadataLocked(m); !sr) {
                spdlog::warn("RecordCache: failed to heal metadata: {}", sr.error().message);
            }
        }
        return std::optional<json>{std::nullopt};
    }

    const json& doc = *r.value();
    const std::int64_t createdAt = doc.value("created_at", std::int64_t{0});
    const auto maxAgeMs = std::chrono::duration_cast<std::chrono::milliseconds>(config_.maxAge);
    if (nowMillis() - createdAt > maxAgeMs.count()) {
        spdlog::info("RecordCache: entry '{}' expired, removing", collectionId);
        auto meta = loadMetadataLocked();
        if (!meta) {
            return meta.error();
        }
        if (auto rr = removeEntryLocked(meta.value(), std::string(collectionId)); !rr) {
            return rr.error();
        }
        if (auto sr = saveMetadataLocked(meta.value()); !sr) {
            return sr.error();
        }
        return std::optional<json>{std::nullopt};
    }

    if (!doc.contains("payload")) {
        return Error{ErrorCode::InvalidData,
                     "Cached document for '" + std::string(collectionId) + "' has no payload"};
    }
    return std::optional<json>{doc["payload"]};
}

Result<void> RecordCache::touch(std::string_view collectionId) {
    std::lock_guard lk(mutex_);
    auto meta = loadMetadataLocked();
    if (!meta) {
        return meta.error();
    }
    auto it = meta.value().entries.find(std::string(collectionId));
    if (it == meta.value().entries.end()) {
        return Result<void>();
    }
    it->second.lastAccess = std::max(it->second.lastAccess, nowMillis());
    ++it->second.accessCount;
    return saveMetadataLocked(meta.value());
}

Result<void> RecordCache::set(std::string_view collectionId, json payload, std::string_view name) {
    if (collectionId.empty()) {
        return Error{ErrorCode::InvalidArgument, "RecordCache.set: empty collection id"};
    }
    const std::string id(collectionId);

    std::lock_guard lk(mutex_);
    const std::int64_t now = nowMillis();

    json doc = makeDocument(id, payload, now, false);
    std::size_t size = dumpedSize(doc);
    const auto threshold =
        static_cast<std::size_t>(static_cast<double>(config_.maxBytes) * config_.truncateThreshold);
    if (size > threshold) {
        const std::size_t overhead = size - dumpedSize(payload);
        const std::size_t budget = threshold > overhead ? threshold - overhead : 0;
        std::size_t payloadSize = 0;
        payload = truncate(std::move(payload), budget, payloadSize);
        doc = makeDocument(id, payload, now, true);
        const std::size_t before = size;
        size = dumpedSize(doc);
        spdlog::warn("RecordCache: '{}' is {} bytes, truncated to {} bytes", id, before, size);
    }

    auto metaR = loadMetadataLocked();
    if (!metaR) {
        return metaR.error();
    }
    Metadata& meta = metaR.value();

    auto fits = [&] {
        auto it = meta.entries.find(id);
        const bool isNew = it == meta.entries.end();
        const std::size_t existing = isNew ? 0 : it->second.sizeBytes;
        const bool overBytes = meta.totalSize - existing + size > config_.maxBytes;
        const bool overCount = isNew && meta.entries.size() >= config_.maxEntries;
        return !overBytes && !overCount;
    };
    while (!fits()) {
        auto ev = evictOneLocked(meta);
        if (!ev) {
            return ev.error();
        }
        if (!ev.value()) {
            break;
        }
    }

    auto wr = store_.set(cacheDataKey(id), doc);
    if (!wr && wr.error().code == ErrorCode::StorageFull) {
        spdlog::warn("RecordCache: store quota hit writing '{}', evicting down to one entry", id);
        while (meta.entries.size() > 1) {
            auto ev = evictOneLocked(meta);
            if (!ev) {
                return ev.error();
            }
            if (!ev.value()) {
                break;
            }
        }
        wr = store_.set(cacheDataKey(id), doc);
    }
    if (!wr) {
        // Persist whatever evictions already happened before reporting.
        if (auto sr = saveMetadataLocked(meta); !sr) {
            spdlog::warn("RecordCache: failed to save metadata: {}", sr.error().message);
        }
        return wr.error();
    }

    auto [it, inserted] = meta.entries.try_emplace(id);
    EntryMeta& entry = it->second;
    if (inserted) {
        entry.sequence = meta.nextSequence++;
        entry.accessCount = 1;
        entry.lastAccess = now;
    } else {
        ++entry.accessCount;
        entry.lastAccess = std::max(entry.lastAccess, now);
    }
    if (!name.empty()) {
        entry.name = std::string(name);
    }
    entry.createdAt = now;
    entry.sizeBytes = size;

    meta.totalSize = 0;
    for (const auto& [k, e] : meta.entries) {
        meta.totalSize += e.sizeBytes;
    }
    spdlog::debug("RecordCache: stored '{}' ({} bytes, {} entries, {} bytes total)", id, size,
                  meta.entries.size(), meta.totalSize);
    return saveMetadataLocked(meta);
}

Result<bool> RecordCache::evictLRU() {
    std::lock_guard lk(mutex_);
    auto meta = loadMetadataLocked();
    if (!meta) {
        return meta.error();
    }
    auto ev = evictOneLocked(meta.value());
    if (!ev) {
        return ev.error();
    }
    if (ev.value()) {
        if (auto sr = saveMetadataLocked(meta.value()); !sr) {
            return sr.error();
        }
    }
    return ev.value();
}

Result<void> RecordCache::clear(std::string_view collectionId) {
    std::lock_guard lk(mutex_);
    auto meta = loadMetadataLocked();
    if (!meta) {
        return meta.error();
    }
    if (auto rr = removeEntryLocked(meta.value(), std::string(collectionId)); !rr) {
        return rr;
    }
    return saveMetadataLocked(meta.value());
}

Result<void> RecordCache::clearAll() {
    std::lock_guard lk(mutex_);
    auto all = store_.getAll();
    if (!all) {
        return all.error();
    }
    std::size_t removed = 0;
    for (const auto& [key, value] : all.value()) {
        if (key.rfind(kDataPrefix, 0) == 0) {
            if (auto rr = store_.remove(key); !rr) {
                return rr;
            }
            ++removed;
        }
    }
    if (auto rr = store_.remove(kMetadataKey); !rr) {
        return rr;
    }
    spdlog::info("RecordCache: cleared {} entries", removed);
    return Result<void>();
}

Result<CacheStats> RecordCache::stats() {
    std::lock_guard lk(mutex_);
    auto meta = loadMetadataLocked();
    if (!meta) {
        return meta.error();
    }
    CacheStats s;
    s.count = meta.value().entries.size();
    s.totalSizeBytes = meta.value().totalSize;
    s.maxEntries = config_.maxEntries;
    s.maxBytes = config_.maxBytes;
    s.utilizationPercent = config_.maxBytes == 0 ? 0.0
                                                 : 100.0 * static_cast<double>(s.totalSizeBytes) /
                                                       static_cast<double>(config_.maxBytes);
    for (const auto& [id, e] : meta.value().entries) {
        s.entries.push_back(CacheEntrySummary{id, e.name, e.sizeBytes, e.accessCount,
                                              fromEpochMillis(e.lastAccess),
                                              fromEpochMillis(e.createdAt)});
    }
    std::sort(s.entries.begin(), s.entries.end(), [](const auto& a, const auto& b) {
        return a.lastAccessTime > b.lastAccessTime;
    });
    return s;
}

Result<bool> RecordCache::isTruncated(std::string_view collectionId) {
    std::lock_guard lk(mutex_);
    auto r = store_.get(cacheDataKey(collectionId));
    if (!r) {
        return r.error();
    }
    if (!r.value()) {
        return false;
    }
    return r.value()->value("truncated", false);
}

Result<RecordCache::Metadata> RecordCache::loadMetadataLocked() {
    auto r = store_.get(kMetadataKey);
    if (!r) {
        return r.error();
    }
    Metadata meta;
    if (!r.value()) {
        return meta;
    }
    const json& root = *r.value();
    if (!root.is_object() || root.value("version", 0) != kVersion) {
        spdlog::warn("RecordCache: discarding metadata with unknown layout");
        return meta;
    }
    meta.nextSequence = root.value("next_sequence", std::uint64_t{0});
    if (auto it = root.find("entries"); it != root.end() && it->is_object()) {
        for (auto e = it->begin(); e != it->end(); ++e) {
            const json& v = e.value();
            EntryMeta m;
            m.name = v.value("name", std::string{});
            m.sizeBytes = v.value("size_bytes", std::size_t{0});
            m.lastAccess = v.value("access_time", std::int64_t{0});
            m.accessCount = v.value("access_count", std::uint64_t{0});
            m.createdAt = v.value("created_at", std::int64_t{0});
            m.sequence = v.value("sequence", std::uint64_t{0});
            meta.nextSequence = std::max(meta.nextSequence, m.sequence + 1);
            meta.totalSize += m.sizeBytes;
            meta.entries.emplace(e.key(), std::move(m));
        }
    }
    return meta;
}

Result<void> RecordCache::saveMetadataLocked(const Metadata& meta) {
    json entries = json::object();
    std::size_t total = 0;
    for (const auto& [id, m] : meta.entries) {
        entries[id] = json{{"name", m.name},
                           {"size_bytes", m.sizeBytes},
                           {"access_time", m.lastAccess},
                           {"access_count", m.accessCount},
                           {"created_at", m.createdAt},
                           {"sequence", m.sequence}};
        total += m.sizeBytes;
    }
    json root{{"version", kVersion},
              {"next_sequence", meta.nextSequence},
              {"total_size", total},
              {"entries", std::move(entries)}};
    return store_.set(kMetadataKey, root);
}

Result<bool> RecordCache::evictOneLocked(Metadata& meta) {
    if (meta.entries.empty()) {
        return false;
    }
    auto victim = std::min_element(meta.entries.begin(), meta.entries.end(),
                                   [](const auto& a, const auto& b) {
                                       if (a.second.lastAccess != b.second.lastAccess) {
                                           return a.second.lastAccess < b.second.lastAccess;
                                       }
                                       return a.second.sequence < b.second.sequence;
                                   });
    const std::string id = victim->first;
    spdlog::info("RecordCache: evicting '{}' ({} bytes)", id, victim->second.sizeBytes);
    if (auto rr = removeEntryLocked(meta, id); !rr) {
        return rr.error();
    }
    return true;
}

Result<void> RecordCache::removeEntryLocked(Metadata& meta, const std::string& id) {
    if (auto rr = store_.remove(cacheDataKey(id)); !rr) {
        return rr;
    }
    auto it = meta.entries.find(id);
    if (it != meta.entries.end()) {
        meta.totalSize -= std::min(meta.totalSize, it->second.sizeBytes);
        meta.entries.erase(it);
    }
    return Result<void>();
}

json RecordCache::truncate(json payload, std::size_t budget, std::size_t& serializedSize) const {
    if (!payload.is_object()) {
        serializedSize = dumpedSize(payload);
        return payload;
    }

    // Lowest priority first.
    const std::array<std::pair<const char*, std::size_t>, 3> collections{{
        {"announcements", config_.maxAnnouncements},
        {"materials", config_.maxMaterials},
        {"assignments", config_.maxAssignments},
    }};

    for (const auto& [key, limit] : collections) {
        auto it = payload.find(key);
        if (it != payload.end() && it->is_array() && it->size() > limit) {
            it->erase(it->begin() + static_cast<std::ptrdiff_t>(limit), it->end());
        }
    }
    serializedSize = dumpedSize(payload);

    for (const auto& [key, limit] : collections) {
        if (serializedSize <= budget) {
            break;
        }
        auto it = payload.find(key);
        if (it != payload.end() && it->is_array() && !it->empty()) {
            *it = json::array();
            serializedSize = dumpedSize(payload);
        }
    }
    return payload;
}

} // namespace gcrdl::cache
