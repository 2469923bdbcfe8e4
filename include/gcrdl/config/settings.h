#pragma once

/*
 * gcrdl settings: the config file mapped onto each component's config struct.
 * Missing keys keep defaults; malformed values are logged and ignored.
 */

#include <gcrdl/auth/credential_manager.h>
#include <gcrdl/cache/record_cache.h>
#include <gcrdl/downloader/downloader.hpp>
#include <gcrdl/ratelimit/rate_limiter.h>

#include <chrono>
#include <filesystem>
#include <string>

namespace gcrdl::config {

struct Settings {
    std::filesystem::path dataDir;
    std::string logLevel{"info"};

    ratelimit::RateLimiterConfig rateLimit{};
    cache::CacheConfig cache{};
    downloader::DownloaderConfig download{};
    std::chrono::milliseconds requestTimeout{30000};
    std::filesystem::path outputDir;

    // "classroom" (REST) or "directory" (<catalogDir>/<courseId>.json exports)
    std::string catalogSource{"classroom"};
    std::filesystem::path catalogDir; // default: <dataDir>/catalogs
    std::string classroomUrl{"https://classroom.googleapis.com/v1"};

    auth::CredentialConfig auth{};
    std::string tokenCommand{"gcloud auth print-access-token"};
};

// Defaults, then values from `path` (when it exists).
Settings loadSettings(const std::filesystem::path& path);

} // namespace gcrdl::config
