/*
 * gcrdl/src/catalog/catalog_service.cpp
 */

#include <gcrdl/auth/credential_manager.h>
#include <gcrdl/cache/record_cache.h>
#include <gcrdl/catalog/catalog_service.h>
#include <gcrdl/ratelimit/rate_limiter.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace gcrdl::catalog {

using json = nlohmann::json;

namespace {

class JsonDirectoryCatalogApi final : public ICatalogApi {
public:
    explicit JsonDirectoryCatalogApi(std::filesystem::path dir) : dir_(std::move(dir)) {}

    Result<CourseCatalog> fetchCollection(std::string_view courseId,
                                          std::string_view /*token*/) override {
        if (courseId.empty() || courseId.find('/') != std::string_view::npos ||
            courseId.find("..") != std::string_view::npos) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Invalid course id '{}'", courseId)};
        }
        const auto path = dir_ / (std::string(courseId) + ".json");
        std::ifstream in(path);
        if (!in) {
            return Error{ErrorCode::NotFound, "No catalog export at " + path.string()};
        }
        auto doc = json::parse(in, nullptr, false);
        if (doc.is_discarded()) {
            return Error{ErrorCode::InvalidData, "Invalid JSON in " + path.string()};
        }
        auto catalog = parseCatalog(doc);
        if (catalog && catalog.value().courseId.empty()) {
            catalog.value().courseId = std::string(courseId);
        }
        return catalog;
    }

private:
    std::filesystem::path dir_;
};

} // namespace

std::unique_ptr<ICatalogApi> makeJsonDirectoryCatalogApi(std::filesystem::path dir) {
    return std::make_unique<JsonDirectoryCatalogApi>(std::move(dir));
}

CatalogService::CatalogService(ICatalogApi& api, ratelimit::RateLimiter& limiter,
                               auth::CredentialManager& credentials, cache::RecordCache& cache,
                               int maxRateLimitRetries)
    : api_(api), limiter_(limiter), credentials_(credentials), cache_(cache),
      maxRateLimitRetries_(std::max(0, maxRateLimitRetries)) {}

Result<CourseCatalog> CatalogService::load(std::string_view courseId, bool forceRefresh) {
    if (courseId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Course id is empty"};
    }

    if (!forceRefresh) {
        auto cached = cache_.get(courseId);
        if (!cached) {
            spdlog::warn("Catalog: cache read failed for {}: {}", courseId,
                         cached.error().message);
        } else if (cached.value()) {
            if (auto t = cache_.touch(courseId); !t) {
                spdlog::warn("Catalog: failed to record use of {}: {}", courseId,
                             t.error().message);
            }
            auto parsed = parseCatalog(*cached.value());
            if (parsed) {
                spdlog::debug("Catalog: cache hit for {}", courseId);
                return parsed;
            }
            spdlog::warn("Catalog: dropping unreadable cache entry {}: {}", courseId,
                         parsed.error().message);
            if (auto c = cache_.clear(courseId); !c) {
                spdlog::warn("Catalog: failed to drop {}: {}", courseId, c.error().message);
            }
        }
    }

    auto fetched = fetchRemote(courseId);
    if (!fetched) {
        return fetched;
    }
    if (auto s = store(fetched.value()); !s) {
        // The fetched catalog is still usable.
        spdlog::warn("Catalog: failed to cache {}: {}", courseId, s.error().message);
    }
    return fetched;
}

Result<void> CatalogService::store(const CourseCatalog& catalog) {
    if (catalog.courseId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Catalog has no course id"};
    }
    return cache_.set(catalog.courseId, json(catalog), catalog.courseName);
}

Result<CourseCatalog> CatalogService::fetchRemote(std::string_view courseId) {
    bool reauthorized = false;
    int rateLimited = 0;

    while (true) {
        limiter_.acquire(ratelimit::Priority::High);

        auto token = credentials_.getToken(false);
        if (!token) {
            return token.error();
        }

        auto result = api_.fetchCollection(courseId, token.value());
        if (result) {
            limiter_.clearBackoff();
            spdlog::info("Catalog: fetched {} ({} assignments, {} materials, {} announcements)",
                         courseId, result.value().assignments.size(),
                         result.value().materials.size(), result.value().announcements.size());
            return result;
        }

        const Error& err = result.error();
        if (err.code == ErrorCode::RateLimited) {
            if (err.retryAfter) {
                limiter_.report429(std::string_view(*err.retryAfter));
            } else {
                limiter_.report429();
            }
        }
        if (err.code == ErrorCode::RateLimited && rateLimited < maxRateLimitRetries_) {
            ++rateLimited;
            spdlog::info("Catalog: rate limited fetching {}, retry {}/{}", courseId, rateLimited,
                         maxRateLimitRetries_);
            continue;
        }
        if (err.code == ErrorCode::Unauthorized && !reauthorized) {
            reauthorized = true;
            spdlog::info("Catalog: token rejected, refreshing");
            if (auto r = credentials_.refresh(false); !r) {
                return r.error();
            }
            continue;
        }
        return err;
    }
}

} // namespace gcrdl::catalog
