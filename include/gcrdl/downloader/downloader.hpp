#pragma once

/*
 * gcrdl Downloader - public types and collaborator interfaces
 *
 * A batch turns a set of requested attachment ids into download jobs: Drive files are fetched
 * (or exported) one job each; links, videos and forms are gathered into a single manifest
 * file written at the end. Progress is persisted so a restarted process can report and resume.
 *
 * This header contains no implementation details.
 */

#include <gcrdl/catalog/catalog.h>
#include <gcrdl/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gcrdl::http {
class IHttpClient;
}

namespace gcrdl::downloader {

// ===================
// Small data objects
// ===================

/**
 * Retry/backoff policy. Delay before attempt n+1 is
 * initialBackoff * multiplier^(n-1) plus uniform jitter in [0, jitter * delay], capped.
 */
struct RetryPolicy {
    int maxAttempts{3};
    std::chrono::milliseconds initialBackoff{2000};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
    double jitter{0.2};
};

struct DownloaderConfig {
    int maxConcurrent{5};
    RetryPolicy retry{};
    std::uint64_t maxFileBytes{2ull * 1024ull * 1024ull * 1024ull}; // 2 GiB, refused
    std::uint64_t warnFileBytes{500ull * 1024ull * 1024ull};        // 500 MiB, logged
    std::string defaultFolder{"Downloads"};
    std::string manifestName{"_Links_and_Resources.txt"};
    std::size_t maxOfflineQueue{100};
    int maxOfflineRetries{3}; // replays before an offline item is dropped
};

enum class JobState { Pending, Active, Succeeded, Failed };

const char* jobStateName(JobState s);

enum class JobKind { Content, Manifest };

/**
 * One unit of work. Content jobs carry the Drive file they fetch; the manifest job carries
 * the gathered link-type attachments with the title of the record each came from.
 */
struct DownloadJob {
    struct LinkItem {
        catalog::Attachment attachment;
        std::string parentTitle;
    };

    JobKind kind{JobKind::Content};
    std::string fileId;
    std::string displayName; // resolved, collision-free file name
    std::optional<catalog::DriveFile> source;
    std::vector<LinkItem> links;
    std::string parentTitle;
    std::string folder; // empty: the batch folder
    JobState state{JobState::Pending};
    int attemptCount{0};
    std::string savedPath;
    std::string lastError;
};

struct BatchProgress {
    std::string batchId;
    std::size_t total{0};
    std::size_t completed{0};
    std::size_t failed{0};
    std::string currentFile;
    std::string folder;
    bool active{false};
    bool interrupted{false};
    bool cancelled{false};
    TimePoint startedAt{};
    std::optional<TimePoint> finishedAt;
};

/**
 * Result of planning: content jobs in walk order plus the link items for the manifest.
 */
struct BatchPlan {
    std::vector<DownloadJob> contentJobs;
    std::vector<DownloadJob::LinkItem> links;
};

// ===================
// Planning & naming
// ===================

// Dedupe by id, split content from link-type. NothingSelected / NothingMatched on empty.
Result<BatchPlan> planBatch(const catalog::CourseCatalog& catalog,
                            const std::vector<std::string>& requestedIds);

/**
 * Export target for Google Workspace types. Returns nullopt for regular files. Workspace
 * types without an export mapping yield an ExportFormat with empty mimeType.
 */
struct ExportFormat {
    std::string mimeType;
    std::string extension; // without dot
};
bool isWorkspaceType(std::string_view mimeType);
std::optional<ExportFormat> exportFormatFor(std::string_view mimeType);

// Replace characters outside [A-Za-z0-9 ._-] with '_', collapse whitespace, cap length.
std::string sanitizeFilename(std::string_view name, std::size_t maxLength = 200);

// File name for a Drive file: sanitized title with an extension fitting its type. An export
// replaces the title's extension. The whole name, extension included, fits in maxLength.
std::string filenameFor(const catalog::DriveFile& file, std::size_t maxLength = 200);

// Allocates collision-free names within one batch: name.ext, name(1).ext, name(2).ext...
class UniqueNameAllocator {
public:
    std::string allocate(std::string_view name);

private:
    std::set<std::string> taken_;
};

// Text of the links manifest, grouped by kind (YouTube videos, forms, links).
std::string renderLinksManifest(std::string_view courseName,
                                const std::vector<DownloadJob::LinkItem>& links);

// ===================
// Persistence
// ===================

nlohmann::json toJson(const BatchProgress& p);
BatchProgress progressFromJson(const nlohmann::json& j);
nlohmann::json toJson(const DownloadJob& job);
Result<DownloadJob> jobFromJson(const nlohmann::json& j);

// ===================
// Collaborators
// ===================

/**
 * Remote content service. Errors follow the HTTP mapping (see errorFromHttpStatus) and carry
 * Retry-After on 429.
 */
class IContentApi {
public:
    virtual ~IContentApi() = default;

    virtual Result<ByteVector> fetchContent(std::string_view fileId, std::string_view token) = 0;
    virtual Result<ByteVector> convertAndFetch(std::string_view fileId,
                                               std::string_view targetMime,
                                               std::string_view token) = 0;
};

/**
 * Host file-save facility. pathHint is relative (folder/name); the saver decides the final
 * location and returns it.
 */
class IFileSaver {
public:
    virtual ~IFileSaver() = default;

    virtual Result<std::filesystem::path> save(const std::filesystem::path& pathHint,
                                               std::span<const std::byte> bytes) = 0;
};

// Drive v3 REST adapter over an HTTP client.
std::unique_ptr<IContentApi>
makeDriveContentApi(http::IHttpClient& http,
                    std::string baseUrl = "https://www.googleapis.com/drive/v3",
                    std::chrono::milliseconds requestTimeout = std::chrono::milliseconds(30000));

// Writes under `root` through a .part staging file and atomic rename; never overwrites an
// existing file (applies the (n) suffix instead).
std::unique_ptr<IFileSaver> makeDiskFileSaver(std::filesystem::path root);

} // namespace gcrdl::downloader
