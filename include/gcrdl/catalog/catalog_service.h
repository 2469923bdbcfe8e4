#pragma once

/*
 * gcrdl CatalogService - cache first, then a rate-limited, authorized remote fetch
 */

#include <gcrdl/catalog/catalog.h>
#include <gcrdl/core/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace gcrdl::ratelimit {
class RateLimiter;
}
namespace gcrdl::auth {
class CredentialManager;
}
namespace gcrdl::cache {
class RecordCache;
}
namespace gcrdl::http {
class IHttpClient;
}

namespace gcrdl::catalog {

/**
 * Remote source of course catalogs. Errors follow the HTTP mapping and carry Retry-After
 * on 429.
 */
class ICatalogApi {
public:
    virtual ~ICatalogApi() = default;
    virtual Result<CourseCatalog> fetchCollection(std::string_view courseId,
                                                  std::string_view token) = 0;
};

// Reads <dir>/<courseId>.json exports; the token is ignored.
std::unique_ptr<ICatalogApi> makeJsonDirectoryCatalogApi(std::filesystem::path dir);

// Classroom v1 REST: course name plus course work, materials and announcements, following
// nextPageToken until the last page.
std::unique_ptr<ICatalogApi>
makeClassroomCatalogApi(http::IHttpClient& http,
                        std::string baseUrl = "https://classroom.googleapis.com/v1",
                        std::chrono::milliseconds requestTimeout = std::chrono::milliseconds(30000),
                        int pageSize = 50);

class CatalogService {
public:
    CatalogService(ICatalogApi& api, ratelimit::RateLimiter& limiter,
                   auth::CredentialManager& credentials, cache::RecordCache& cache,
                   int maxRateLimitRetries = 3);

    // Cached catalog when present (and counted as a use); otherwise fetched and cached.
    Result<CourseCatalog> load(std::string_view courseId, bool forceRefresh = false);

    // Store a catalog obtained elsewhere (e.g. an exported file).
    Result<void> store(const CourseCatalog& catalog);

private:
    Result<CourseCatalog> fetchRemote(std::string_view courseId);

    ICatalogApi& api_;
    ratelimit::RateLimiter& limiter_;
    auth::CredentialManager& credentials_;
    cache::RecordCache& cache_;
    int maxRateLimitRetries_;
};

} // namespace gcrdl::catalog
