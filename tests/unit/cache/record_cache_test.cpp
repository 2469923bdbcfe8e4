#include <gtest/gtest.h>

#include <gcrdl/cache/record_cache.h>
#include <gcrdl/storage/key_value_store.h>

#include "support/fakes.hpp"

using namespace gcrdl;
using namespace gcrdl::cache;
using json = nlohmann::json;
using namespace std::chrono_literals;

class RecordCacheTest : public ::testing::Test {
protected:
    void SetUp() override { store_ = storage::makeInMemoryKeyValueStore(); }

    RecordCache makeCache(CacheConfig cfg = {}) {
        return RecordCache(*store_, cfg, clock_.fn());
    }

    static json catalogPayload(const std::string& id, std::size_t padding = 10) {
        return json{{"course_id", id},
                    {"course_name", "Course " + id},
                    {"materials", json::array({json{{"title", std::string(padding, 'm')}}})}};
    }

    std::vector<std::string> ids(RecordCache& cache) {
        std::vector<std::string> out;
        for (const auto& e : cache.stats().value().entries) {
            out.push_back(e.collectionId);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    std::unique_ptr<storage::IKeyValueStore> store_;
    test_support::ManualClock clock_;
};

TEST_F(RecordCacheTest, StoresAndReturnsPayload) {
    auto cache = makeCache();
    ASSERT_TRUE(cache.set("c1", catalogPayload("c1"), "Algebra"));

    auto got = cache.get("c1");
    ASSERT_TRUE(got);
    ASSERT_TRUE(got.value().has_value());
    EXPECT_EQ((*got.value())["course_id"], "c1");

    auto stats = cache.stats().value();
    ASSERT_EQ(stats.count, 1u);
    EXPECT_EQ(stats.entries[0].name, "Algebra");
    EXPECT_GT(stats.totalSizeBytes, 0u);

    auto doc = store_->get(cacheDataKey("c1")).value();
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ((*doc)["collection_id"], "c1");
    EXPECT_EQ((*doc)["truncated"], false);
}

TEST_F(RecordCacheTest, MissReturnsEmpty) {
    auto cache = makeCache();
    auto got = cache.get("nope");
    ASSERT_TRUE(got);
    EXPECT_FALSE(got.value().has_value());
}

TEST_F(RecordCacheTest, GetLeavesRecencyAloneAndTouchRecordsUse) {
    auto cache = makeCache();
    ASSERT_TRUE(cache.set("c1", catalogPayload("c1")));
    const auto before = cache.stats().value().entries[0];

    clock_.advance(1min);
    ASSERT_TRUE(cache.get("c1"));
    auto afterGet = cache.stats().value().entries[0];
    EXPECT_EQ(afterGet.accessCount, before.accessCount);
    EXPECT_EQ(afterGet.lastAccessTime, before.lastAccessTime);

    ASSERT_TRUE(cache.touch("c1"));
    auto afterTouch = cache.stats().value().entries[0];
    EXPECT_EQ(afterTouch.accessCount, before.accessCount + 1);
    EXPECT_GT(afterTouch.lastAccessTime, before.lastAccessTime);

    // Unknown ids are ignored.
    EXPECT_TRUE(cache.touch("unknown"));
}

TEST_F(RecordCacheTest, EvictsLeastRecentlyUsedWhenEntryBoundIsHit) {
    CacheConfig cfg;
    cfg.maxEntries = 3;
    auto cache = makeCache(cfg);

    for (const auto* id : {"a", "b", "c"}) {
        ASSERT_TRUE(cache.set(id, catalogPayload(id)));
        clock_.advance(1s);
    }
    ASSERT_TRUE(cache.touch("a"));
    clock_.advance(1s);
    ASSERT_TRUE(cache.set("d", catalogPayload("d")));

    EXPECT_EQ(ids(cache), (std::vector<std::string>{"a", "c", "d"}));
    EXPECT_FALSE(store_->get(cacheDataKey("b")).value().has_value());
}

TEST_F(RecordCacheTest, EvictsUntilByteBoundHolds) {
    CacheConfig cfg;
    cfg.maxEntries = 10;
    cfg.maxBytes = 2500;
    auto cache = makeCache(cfg);

    for (const auto* id : {"a", "b", "c", "d"}) {
        ASSERT_TRUE(cache.set(id, catalogPayload(id, 600)));
        clock_.advance(1s);
    }
    auto stats = cache.stats().value();
    EXPECT_LE(stats.totalSizeBytes, cfg.maxBytes);
    EXPECT_LT(stats.count, 4u);
    EXPECT_EQ(ids(cache).back(), "d");
    EXPECT_FALSE(store_->get(cacheDataKey("a")).value().has_value());
}

TEST_F(RecordCacheTest, ReplacingAnEntryDoesNotEvictOthers) {
    CacheConfig cfg;
    cfg.maxEntries = 2;
    auto cache = makeCache(cfg);
    ASSERT_TRUE(cache.set("a", catalogPayload("a")));
    ASSERT_TRUE(cache.set("b", catalogPayload("b")));
    ASSERT_TRUE(cache.set("a", catalogPayload("a", 50)));
    EXPECT_EQ(ids(cache), (std::vector<std::string>{"a", "b"}));
}

TEST_F(RecordCacheTest, OversizedPayloadIsTruncatedAndFlagged) {
    CacheConfig cfg;
    cfg.maxBytes = 4000;
    cfg.maxAnnouncements = 50;
    auto cache = makeCache(cfg);

    json payload = catalogPayload("big");
    payload["announcements"] = json::array();
    for (int i = 0; i < 200; ++i) {
        payload["announcements"].push_back(std::string(30, 'x'));
    }
    ASSERT_TRUE(cache.set("big", payload));

    EXPECT_TRUE(cache.isTruncated("big").value());
    auto stored = cache.get("big").value();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ((*stored)["announcements"].size(), 50u);
    EXPECT_LE(cache.stats().value().totalSizeBytes,
              static_cast<std::size_t>(cfg.maxBytes * cfg.truncateThreshold));
}

TEST_F(RecordCacheTest, TruncationDropsWholeCollectionsWhenCapsAreNotEnough) {
    CacheConfig cfg;
    cfg.maxBytes = 3000;
    auto cache = makeCache(cfg);

    json payload = catalogPayload("big");
    payload["announcements"] = json::array();
    payload["materials"] = json::array();
    for (int i = 0; i < 45; ++i) {
        payload["announcements"].push_back(std::string(60, 'a'));
        payload["materials"].push_back(std::string(60, 'm'));
    }
    payload["assignments"] = json::array({"keep me"});
    ASSERT_TRUE(cache.set("big", payload));

    auto stored = cache.get("big").value().value();
    EXPECT_TRUE(stored["announcements"].empty());
    EXPECT_TRUE(stored["materials"].empty());
    EXPECT_EQ(stored["assignments"].size(), 1u);
}

TEST_F(RecordCacheTest, StaleEntryIsRemovedOnGet) {
    CacheConfig cfg;
    cfg.maxAge = std::chrono::hours(1);
    auto cache = makeCache(cfg);
    ASSERT_TRUE(cache.set("old", catalogPayload("old")));

    clock_.advance(2h);
    auto got = cache.get("old");
    ASSERT_TRUE(got);
    EXPECT_FALSE(got.value().has_value());
    EXPECT_EQ(cache.stats().value().count, 0u);
    EXPECT_FALSE(store_->get(cacheDataKey("old")).value().has_value());
}

TEST_F(RecordCacheTest, QuotaFailureEvictsDownToOneEntryAndRetries) {
    store_ = storage::makeInMemoryKeyValueStore(3200);
    auto cache = makeCache();

    ASSERT_TRUE(cache.set("a", catalogPayload("a", 1000)));
    clock_.advance(1s);
    ASSERT_TRUE(cache.set("b", catalogPayload("b", 1000)));
    clock_.advance(1s);
    auto r = cache.set("c", catalogPayload("c", 1000));
    ASSERT_TRUE(r) << r.error().message;

    EXPECT_EQ(ids(cache), (std::vector<std::string>{"b", "c"}));
}

TEST_F(RecordCacheTest, QuotaFailureThatPersistsIsReturned) {
    store_ = storage::makeInMemoryKeyValueStore(600);
    auto cache = makeCache();
    auto r = cache.set("huge", catalogPayload("huge", 2000));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::StorageFull);
}

TEST_F(RecordCacheTest, MissingDataHealsMetadata) {
    auto cache = makeCache();
    ASSERT_TRUE(cache.set("a", catalogPayload("a")));
    ASSERT_TRUE(store_->remove(cacheDataKey("a")));

    EXPECT_FALSE(cache.get("a").value().has_value());
    EXPECT_EQ(cache.stats().value().count, 0u);
}

TEST_F(RecordCacheTest, EvictLruOnEmptyCacheReturnsFalse) {
    auto cache = makeCache();
    auto r = cache.evictLRU();
    ASSERT_TRUE(r);
    EXPECT_FALSE(r.value());

    ASSERT_TRUE(cache.set("a", catalogPayload("a")));
    clock_.advance(1s);
    ASSERT_TRUE(cache.set("b", catalogPayload("b")));
    EXPECT_TRUE(cache.evictLRU().value());
    EXPECT_EQ(ids(cache), (std::vector<std::string>{"b"}));
}

TEST_F(RecordCacheTest, ClearAllRemovesOrphans) {
    auto cache = makeCache();
    ASSERT_TRUE(cache.set("a", catalogPayload("a")));
    ASSERT_TRUE(store_->set(cacheDataKey("orphan"), json::object()));
    ASSERT_TRUE(store_->set("unrelated", 1));

    ASSERT_TRUE(cache.clearAll());
    auto all = store_->getAll().value();
    EXPECT_EQ(all.size(), 1u);
    EXPECT_EQ(all.count("unrelated"), 1u);
    EXPECT_EQ(cache.stats().value().count, 0u);
}

TEST_F(RecordCacheTest, ClearRemovesOneEntry) {
    auto cache = makeCache();
    ASSERT_TRUE(cache.set("a", catalogPayload("a")));
    ASSERT_TRUE(cache.set("b", catalogPayload("b")));
    ASSERT_TRUE(cache.clear("a"));
    EXPECT_EQ(ids(cache), (std::vector<std::string>{"b"}));
}

TEST_F(RecordCacheTest, StatsListMostRecentlyUsedFirst) {
    auto cache = makeCache();
    ASSERT_TRUE(cache.set("a", catalogPayload("a")));
    clock_.advance(1s);
    ASSERT_TRUE(cache.set("b", catalogPayload("b")));
    clock_.advance(1s);
    ASSERT_TRUE(cache.touch("a"));

    auto stats = cache.stats().value();
    ASSERT_EQ(stats.entries.size(), 2u);
    EXPECT_EQ(stats.entries[0].collectionId, "a");
    EXPECT_GT(stats.utilizationPercent, 0.0);
}
