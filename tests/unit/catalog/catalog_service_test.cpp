#include <gtest/gtest.h>

#include <gcrdl/auth/credential_manager.h>
#include <gcrdl/cache/record_cache.h>
#include <gcrdl/catalog/catalog_service.h>
#include <gcrdl/ratelimit/rate_limiter.h>
#include <gcrdl/storage/key_value_store.h>

#include "support/fakes.hpp"
#include "support/sample_catalog.hpp"
#include "support/temp_dir_scope.hpp"

#include <deque>

using namespace gcrdl;
using namespace gcrdl::catalog;
using namespace std::chrono_literals;

namespace {

class ScriptedCatalogApi final : public ICatalogApi {
public:
    Result<CourseCatalog> fetchCollection(std::string_view courseId,
                                          std::string_view token) override {
        ++calls;
        tokens.emplace_back(token);
        if (!script.empty()) {
            auto e = script.front();
            script.pop_front();
            return e;
        }
        auto c = test_support::sampleCatalog();
        c.courseId = std::string(courseId);
        return c;
    }

    int calls{0};
    std::vector<std::string> tokens;
    std::deque<Error> script;
};

Error rateLimited(std::string retryAfter) {
    Error e{ErrorCode::RateLimited, "HTTP 429"};
    e.httpStatus = 429;
    e.retryAfter = std::move(retryAfter);
    return e;
}

} // namespace

class CatalogServiceTest : public ::testing::Test {
protected:
    CatalogServiceTest()
        : store_(storage::makeInMemoryKeyValueStore()),
          limiter_(ratelimit::RateLimiterConfig{100, 100, 50ms, 200ms}),
          credentials_(auth::CredentialConfig{},
                       auth::CredentialManager::Dependencies{&provider_, store_.get(), nullptr,
                                                             clock_.fn()}),
          cache_(*store_, cache::CacheConfig{}, clock_.fn()),
          service_(api_, limiter_, credentials_, cache_) {}

    test_support::ManualClock clock_;
    std::unique_ptr<storage::IKeyValueStore> store_;
    test_support::FakeCredentialProvider provider_;
    ScriptedCatalogApi api_;
    ratelimit::RateLimiter limiter_;
    auth::CredentialManager credentials_;
    cache::RecordCache cache_;
    CatalogService service_;
};

TEST_F(CatalogServiceTest, MissFetchesAndCaches) {
    auto r = service_.load("course-1");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(api_.calls, 1);
    EXPECT_EQ(api_.tokens.front(), "token-1");

    auto stats = cache_.stats().value();
    ASSERT_EQ(stats.count, 1u);
    EXPECT_EQ(stats.entries[0].name, "Physics 101: Mechanics");
}

TEST_F(CatalogServiceTest, HitIsServedFromCacheAndCountsAsUse) {
    ASSERT_TRUE(service_.load("course-1"));
    const auto before = cache_.stats().value().entries[0].accessCount;

    clock_.advance(1s);
    auto r = service_.load("course-1");
    ASSERT_TRUE(r);
    EXPECT_EQ(api_.calls, 1);
    EXPECT_EQ(r.value().materials.size(), 1u);
    EXPECT_EQ(cache_.stats().value().entries[0].accessCount, before + 1);
}

TEST_F(CatalogServiceTest, ForceRefreshBypassesCache) {
    ASSERT_TRUE(service_.load("course-1"));
    ASSERT_TRUE(service_.load("course-1", true));
    EXPECT_EQ(api_.calls, 2);
}

TEST_F(CatalogServiceTest, RateLimitedFetchBacksOffAndRetries) {
    api_.script = {rateLimited("0"), rateLimited("0")};
    auto r = service_.load("course-1");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(api_.calls, 3);
    EXPECT_FALSE(limiter_.stats().inBackoff);
}

TEST_F(CatalogServiceTest, GivesUpAfterRepeatedRateLimiting) {
    api_.script = {rateLimited("0"), rateLimited("0"), rateLimited("0"), rateLimited("0")};
    auto r = service_.load("course-1");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::RateLimited);
    EXPECT_EQ(api_.calls, 4);
    EXPECT_EQ(cache_.stats().value().count, 0u);
}

TEST_F(CatalogServiceTest, FinalRateLimitStillOpensLimiterBackoff) {
    CatalogService noRetry(api_, limiter_, credentials_, cache_, 0);
    api_.script = {rateLimited("30")};

    auto r = noRetry.load("course-1");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::RateLimited);
    EXPECT_EQ(api_.calls, 1);
    EXPECT_TRUE(limiter_.stats().inBackoff);
}

TEST_F(CatalogServiceTest, UnauthorizedTriggersOneRefresh) {
    api_.script = {Error{ErrorCode::Unauthorized, "HTTP 401"}};
    auto r = service_.load("course-1");
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(api_.tokens.size(), 2u);
    EXPECT_EQ(api_.tokens[0], "token-1");
    EXPECT_EQ(api_.tokens[1], "token-2");
    EXPECT_EQ(provider_.revoked, (std::vector<std::string>{"token-1"}));
}

TEST_F(CatalogServiceTest, TerminalErrorIsReturned) {
    api_.script = {Error{ErrorCode::NotFound, "HTTP 404"}};
    auto r = service_.load("course-1");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(api_.calls, 1);
}

TEST_F(CatalogServiceTest, StoreRequiresCourseId) {
    auto c = test_support::sampleCatalog();
    c.courseId.clear();
    EXPECT_FALSE(service_.store(c));
}

TEST(JsonDirectoryCatalogApiTest, ReadsExportFiles) {
    test_support::TempDirScope tmp{"gcrdl-catalogs"};
    tmp.writeCatalogExport("bio", R"({"course_id": "bio", "course_name": "Biology", "materials": []})");
    auto api = makeJsonDirectoryCatalogApi(tmp.catalogsDir());

    auto ok = api->fetchCollection("bio", "");
    ASSERT_TRUE(ok) << ok.error().message;
    EXPECT_EQ(ok.value().courseName, "Biology");

    auto missing = api->fetchCollection("chem", "");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto escape = api->fetchCollection("../etc/passwd", "");
    ASSERT_FALSE(escape);
    EXPECT_EQ(escape.error().code, ErrorCode::InvalidArgument);
}
