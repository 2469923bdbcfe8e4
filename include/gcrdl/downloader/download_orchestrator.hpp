#pragma once

/*
 * gcrdl DownloadOrchestrator
 *
 * Runs one batch at a time (idle -> running -> completed | cancelled). submit() plans the
 * batch, runs the credential pre-flight, persists the initial progress and returns; a driver
 * thread then feeds content jobs in submission order to a pool of at most maxConcurrent
 * workers, and writes the links manifest last.
 *
 * Per-item failures are counted in BatchProgress::failed and never stop the batch. Only setup
 * failures (no credential, store unavailable) come back from submit(). Items that exhaust
 * their attempts on a network-class failure are also parked in the offline queue.
 */

#include <gcrdl/downloader/downloader.hpp>
#include <gcrdl/downloader/offline_queue.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace gcrdl::ratelimit {
class RateLimiter;
}
namespace gcrdl::auth {
class CredentialManager;
}
namespace gcrdl::storage {
class IKeyValueStore;
}

namespace gcrdl::downloader {

inline constexpr const char* kProgressKey = "gcrdl_download_progress";
inline constexpr const char* kJobsKey = "gcrdl_download_jobs";

class DownloadOrchestrator {
public:
    struct Dependencies {
        ratelimit::RateLimiter* limiter{nullptr};
        auth::CredentialManager* credentials{nullptr};
        IContentApi* content{nullptr};
        IFileSaver* saver{nullptr};
        storage::IKeyValueStore* store{nullptr};
    };

    DownloadOrchestrator(DownloaderConfig config, Dependencies deps);
    ~DownloadOrchestrator();

    DownloadOrchestrator(const DownloadOrchestrator&) = delete;
    DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;

    // Returns the batch id. OperationInProgress while another batch runs.
    Result<std::string> submit(const catalog::CourseCatalog& catalog,
                               const std::vector<std::string>& requestedIds);

    // Continue the persisted batch (interrupted or cancelled). NotFound if nothing is left.
    Result<std::string> resume();

    // Run the offline queue as a batch. Successes leave the queue; failures count a retry and
    // are dropped after maxOfflineRetries. NotFound when the queue is empty.
    Result<std::string> retryOffline();

    OfflineQueue& offlineQueue() noexcept { return offline_; }

    // Stop dequeuing; in-flight transfers finish.
    void cancel();

    BatchProgress progress() const;
    std::vector<DownloadJob> jobs() const;
    bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    // Poll until the batch is inactive or `ceiling` passes (Timeout).
    Result<BatchProgress>
    waitForCompletion(std::chrono::milliseconds pollInterval = std::chrono::milliseconds(300),
                      std::chrono::milliseconds ceiling = std::chrono::minutes(30),
                      const std::function<void(const BatchProgress&)>& onProgress = {}) const;

private:
    Result<void> start(std::vector<DownloadJob> jobs, std::string courseName, std::string folder,
                       std::string batchId, bool offlineRetry);
    void runBatch();
    void runContentJob(std::size_t index);
    void runManifestJob(std::size_t index);
    Result<std::filesystem::path> attemptOnce(const DownloadJob& job,
                                              const std::optional<ExportFormat>& exportFormat);
    void finishJob(std::size_t index, const Result<std::filesystem::path>& outcome);
    void updateOfflineQueueLocked(const DownloadJob& job, const Result<std::filesystem::path>& outcome);
    std::chrono::milliseconds backoffFor(int attempt) const;
    Result<void> persistLocked();
    void joinDriver();

    DownloaderConfig config_;
    Dependencies deps_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    BatchProgress progress_;
    std::vector<DownloadJob> jobs_;
    std::string courseName_;
    bool offlineRetry_{false};
    std::size_t inFlight_{0};
    OfflineQueue offline_;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancelRequested_{false};
    std::thread driver_;
};

} // namespace gcrdl::downloader
