/*
 * gcrdl/src/downloader/download_orchestrator.cpp
 *
 * Batch driver.
 * - A driver thread dequeues content jobs in order; a boost::asio::thread_pool of
 *   maxConcurrent workers runs them, and the driver blocks while the pool is full
 * - Each attempt: limiter permit -> token -> fetch/export -> save
 * - Terminal-per-item errors stop retries at once; others back off exponentially with jitter
 * - Every state change is written to the store (progress + job list) so a restarted process
 *   can report and resume
 */

#include <gcrdl/auth/credential_manager.h>
#include <gcrdl/downloader/download_orchestrator.hpp>
#include <gcrdl/ratelimit/rate_limiter.h>
#include <gcrdl/storage/key_value_store.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace gcrdl::downloader {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

bool isTerminal(JobState s) {
    return s == JobState::Succeeded || s == JobState::Failed;
}

bool isNetworkClass(ErrorCode code) {
    return code == ErrorCode::NetworkError || code == ErrorCode::Timeout;
}

storage::IKeyValueStore& requireDependencies(const DownloadOrchestrator::Dependencies& deps) {
    if (!deps.limiter || !deps.credentials || !deps.content || !deps.saver || !deps.store) {
        throw std::invalid_argument("DownloadOrchestrator: missing dependency");
    }
    return *deps.store;
}

} // namespace

DownloadOrchestrator::DownloadOrchestrator(DownloaderConfig config, Dependencies deps)
    : config_(std::move(config)), deps_(deps),
      offline_(requireDependencies(deps), config_.maxOfflineQueue) {
    config_.maxConcurrent = std::max(1, config_.maxConcurrent);
    config_.retry.maxAttempts = std::max(1, config_.retry.maxAttempts);

    auto persisted = deps_.store->get(kProgressKey);
    if (!persisted) {
        spdlog::warn("Downloader: cannot read persisted progress: {}", persisted.error().message);
        return;
    }
    if (!persisted.value()) {
        return;
    }
    progress_ = progressFromJson(*persisted.value());
    if (progress_.active) {
        // The process that owned this batch is gone.
        spdlog::warn("Downloader: batch {} was interrupted ({}/{} done)", progress_.batchId,
                     progress_.completed + progress_.failed, progress_.total);
        progress_.active = false;
        progress_.interrupted = true;
        progress_.currentFile.clear();
        std::lock_guard lk(mutex_);
        if (auto r = deps_.store->set(kProgressKey, toJson(progress_)); !r) {
            spdlog::warn("Downloader: failed to mark batch interrupted: {}", r.error().message);
        }
    }
}

DownloadOrchestrator::~DownloadOrchestrator() {
    if (running()) {
        cancel();
    }
    joinDriver();
}

Result<std::string> DownloadOrchestrator::submit(const catalog::CourseCatalog& catalog,
                                                 const std::vector<std::string>& requestedIds) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return Error{ErrorCode::OperationInProgress, "A download batch is already active"};
    }

    auto plan = planBatch(catalog, requestedIds);
    if (!plan) {
        running_.store(false, std::memory_order_release);
        spdlog::info("Downloader: batch rejected: {}", plan.error().message);
        return plan.error();
    }

    if (auto pre = deps_.credentials->ensureValidForBatch(); !pre) {
        running_.store(false, std::memory_order_release);
        spdlog::error("Downloader: batch failed to start, no usable credential: {}",
                      pre.error().message);
        Error err = pre.error();
        err.message = "Batch failed to start: " + err.message;
        return err;
    }

    UniqueNameAllocator names;
    std::vector<DownloadJob> jobs = std::move(plan.value().contentJobs);
    for (auto& job : jobs) {
        job.displayName = names.allocate(filenameFor(*job.source));
    }
    if (!plan.value().links.empty()) {
        DownloadJob manifest;
        manifest.kind = JobKind::Manifest;
        manifest.fileId = "links-manifest";
        manifest.displayName = names.allocate(config_.manifestName);
        manifest.links = std::move(plan.value().links);
        jobs.push_back(std::move(manifest));
    }

    std::string folder = catalog.courseName.empty() ? config_.defaultFolder
                                                    : sanitizeFilename(catalog.courseName);
    const auto batchId =
        fmt::format("batch_{}", toEpochMillis(std::chrono::system_clock::now()));

    auto started =
        start(std::move(jobs), catalog.courseName, std::move(folder), batchId, false);
    if (!started) {
        return started.error();
    }
    return batchId;
}

Result<std::string> DownloadOrchestrator::resume() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return Error{ErrorCode::OperationInProgress, "A download batch is already active"};
    }
    auto release = [this](Error e) {
        running_.store(false, std::memory_order_release);
        return e;
    };

    auto persisted = deps_.store->get(kJobsKey);
    if (!persisted) {
        return release(persisted.error());
    }
    if (!persisted.value() || !persisted.value()->is_object()) {
        return release(Error{ErrorCode::NotFound, "No batch to resume"});
    }
    const json& doc = *persisted.value();

    std::vector<DownloadJob> jobs;
    if (auto it = doc.find("jobs"); it != doc.end() && it->is_array()) {
        for (const auto& j : *it) {
            auto job = jobFromJson(j);
            if (!job) {
                return release(job.error());
            }
            jobs.push_back(std::move(job).value());
        }
    }
    const bool anythingLeft = std::any_of(jobs.begin(), jobs.end(), [](const DownloadJob& j) {
        return !isTerminal(j.state);
    });
    if (!anythingLeft) {
        return release(Error{ErrorCode::NotFound, "Nothing left to resume"});
    }

    if (auto pre = deps_.credentials->ensureValidForBatch(); !pre) {
        Error err = pre.error();
        err.message = "Batch failed to resume: " + err.message;
        return release(err);
    }

    for (auto& job : jobs) {
        if (job.state == JobState::Active) {
            job.state = JobState::Pending;
        }
    }
    const auto batchId = doc.value("batch_id", std::string{});
    auto started = start(std::move(jobs), doc.value("course_name", std::string{}),
                         doc.value("folder", config_.defaultFolder), batchId,
                         doc.value("offline_retry", false));
    if (!started) {
        return started.error();
    }
    spdlog::info("Downloader: resumed batch {}", batchId);
    return batchId;
}

Result<std::string> DownloadOrchestrator::retryOffline() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return Error{ErrorCode::OperationInProgress, "A download batch is already active"};
    }
    auto release = [this](Error e) {
        running_.store(false, std::memory_order_release);
        return e;
    };

    auto queued = offline_.items();
    if (!queued) {
        return release(queued.error());
    }
    if (queued.value().empty()) {
        return release(Error{ErrorCode::NotFound, "Offline queue is empty"});
    }

    if (auto pre = deps_.credentials->ensureValidForBatch(); !pre) {
        Error err = pre.error();
        err.message = "Batch failed to start: " + err.message;
        return release(err);
    }

    std::vector<DownloadJob> jobs;
    jobs.reserve(queued.value().size());
    for (auto& item : queued.value()) {
        DownloadJob job;
        job.fileId = item.file.id;
        job.displayName = std::move(item.displayName);
        job.folder = item.folder.empty() ? config_.defaultFolder : std::move(item.folder);
        job.source = std::move(item.file);
        jobs.push_back(std::move(job));
    }
    const auto batchId =
        fmt::format("offline_{}", toEpochMillis(std::chrono::system_clock::now()));
    spdlog::info("Downloader: retrying {} offline item(s)", jobs.size());

    auto started = start(std::move(jobs), std::string{}, config_.defaultFolder, batchId, true);
    if (!started) {
        return started.error();
    }
    return batchId;
}

Result<void> DownloadOrchestrator::start(std::vector<DownloadJob> jobs, std::string courseName,
                                         std::string folder, std::string batchId,
                                         bool offlineRetry) {
    joinDriver();

    {
        std::lock_guard lk(mutex_);
        jobs_ = std::move(jobs);
        courseName_ = std::move(courseName);
        offlineRetry_ = offlineRetry;
        inFlight_ = 0;

        BatchProgress p;
        p.batchId = std::move(batchId);
        p.total = jobs_.size();
        p.completed = static_cast<std::size_t>(
            std::count_if(jobs_.begin(), jobs_.end(),
                          [](const auto& j) { return j.state == JobState::Succeeded; }));
        p.failed = static_cast<std::size_t>(
            std::count_if(jobs_.begin(), jobs_.end(),
                          [](const auto& j) { return j.state == JobState::Failed; }));
        p.folder = std::move(folder);
        p.active = true;
        p.startedAt = std::chrono::system_clock::now();
        progress_ = std::move(p);

        if (auto r = persistLocked(); !r) {
            progress_.active = false;
            running_.store(false, std::memory_order_release);
            spdlog::error("Downloader: cannot persist batch state, aborting: {}",
                          r.error().message);
            Error err = r.error();
            err.message = "Batch failed to start: " + err.message;
            return err;
        }
    }

    cancelRequested_.store(false, std::memory_order_release);
    spdlog::info("Downloader: batch {} started ({} jobs into '{}')", progress_.batchId,
                 progress_.total, progress_.folder);
    driver_ = std::thread([this] { runBatch(); });
    return Result<void>();
}

void DownloadOrchestrator::cancel() {
    if (!running()) {
        return;
    }
    spdlog::info("Downloader: cancellation requested");
    cancelRequested_.store(true, std::memory_order_release);
    std::lock_guard lk(mutex_);
    cv_.notify_all();
}

BatchProgress DownloadOrchestrator::progress() const {
    std::lock_guard lk(mutex_);
    return progress_;
}

std::vector<DownloadJob> DownloadOrchestrator::jobs() const {
    std::lock_guard lk(mutex_);
    return jobs_;
}

Result<BatchProgress>
DownloadOrchestrator::waitForCompletion(std::chrono::milliseconds pollInterval,
                                        std::chrono::milliseconds ceiling,
                                        const std::function<void(const BatchProgress&)>& onProgress) const {
    const auto deadline = std::chrono::steady_clock::now() + ceiling;
    while (true) {
        auto snapshot = progress();
        if (onProgress) {
            onProgress(snapshot);
        }
        if (!snapshot.active) {
            return snapshot;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return Error{ErrorCode::Timeout,
                         fmt::format("Batch still running after {}s", ceiling.count() / 1000)};
        }
        std::this_thread::sleep_for(pollInterval);
    }
}

void DownloadOrchestrator::runBatch() {
    std::optional<std::size_t> manifestIndex;
    {
        boost::asio::thread_pool pool(static_cast<std::size_t>(config_.maxConcurrent));
        std::size_t count = 0;
        {
            std::lock_guard lk(mutex_);
            count = jobs_.size();
        }

        for (std::size_t i = 0; i < count; ++i) {
            std::unique_lock lk(mutex_);
            if (jobs_[i].kind == JobKind::Manifest) {
                if (jobs_[i].state == JobState::Pending) {
                    manifestIndex = i;
                }
                continue;
            }
            if (jobs_[i].state != JobState::Pending) {
                continue;
            }
            cv_.wait(lk, [this] {
                return inFlight_ < static_cast<std::size_t>(config_.maxConcurrent) ||
                       cancelRequested_.load(std::memory_order_acquire);
            });
            if (cancelRequested_.load(std::memory_order_acquire)) {
                break;
            }
            ++inFlight_;
            jobs_[i].state = JobState::Active;
            progress_.currentFile = jobs_[i].displayName;
            if (auto r = persistLocked(); !r) {
                spdlog::warn("Downloader: failed to persist progress: {}", r.error().message);
            }
            lk.unlock();

            boost::asio::post(pool, [this, i] {
                runContentJob(i);
                std::lock_guard done(mutex_);
                --inFlight_;
                cv_.notify_all();
            });
        }
        pool.join();
    }

    const bool cancelled = cancelRequested_.load(std::memory_order_acquire);
    if (manifestIndex && !cancelled) {
        runManifestJob(*manifestIndex);
    }

    std::lock_guard lk(mutex_);
    progress_.active = false;
    progress_.cancelled = cancelled;
    progress_.currentFile.clear();
    progress_.finishedAt = std::chrono::system_clock::now();
    if (auto r = persistLocked(); !r) {
        spdlog::warn("Downloader: failed to persist final progress: {}", r.error().message);
    }
    spdlog::info("Downloader: batch {} {} ({} completed, {} failed, {} total)", progress_.batchId,
                 cancelled ? "cancelled" : "finished", progress_.completed, progress_.failed,
                 progress_.total);
    running_.store(false, std::memory_order_release);
    cv_.notify_all();
}

void DownloadOrchestrator::runContentJob(std::size_t index) {
    DownloadJob job;
    {
        std::lock_guard lk(mutex_);
        job = jobs_[index];
    }
    const catalog::DriveFile& file = *job.source;

    if (file.sizeBytes && *file.sizeBytes >= config_.maxFileBytes) {
        finishJob(index, Error{ErrorCode::PolicyViolation,
                               fmt::format("'{}' is {} bytes, over the {} byte limit",
                                           file.title, *file.sizeBytes, config_.maxFileBytes)});
        return;
    }
    if (file.sizeBytes && *file.sizeBytes >= config_.warnFileBytes) {
        spdlog::warn("Downloader: '{}' is large ({} MiB)", file.title,
                     *file.sizeBytes / (1024 * 1024));
    }

    const auto exportFormat = exportFormatFor(file.mimeType);
    if (exportFormat && exportFormat->mimeType.empty()) {
        finishJob(index, Error{ErrorCode::NotSupported,
                               fmt::format("Cannot export this file type ({})", file.mimeType)});
        return;
    }

    Error lastError{ErrorCode::Unknown, "no attempt made"};
    for (int attempt = 1; attempt <= config_.retry.maxAttempts; ++attempt) {
        {
            std::lock_guard lk(mutex_);
            jobs_[index].attemptCount = attempt;
        }
        auto outcome = attemptOnce(job, exportFormat);
        if (outcome) {
            finishJob(index, outcome);
            return;
        }
        lastError = outcome.error();

        if (isTerminalForItem(lastError.code)) {
            spdlog::warn("Downloader: '{}' failed ({}), not retrying: {}", job.displayName,
                         lastError.code, lastError.message);
            break;
        }
        if (attempt == config_.retry.maxAttempts) {
            break;
        }

        const auto delay = backoffFor(attempt);
        spdlog::info("Downloader: '{}' attempt {}/{} failed ({}); retrying in {}ms",
                     job.displayName, attempt, config_.retry.maxAttempts, lastError.code,
                     delay.count());
        std::unique_lock lk(mutex_);
        if (cv_.wait_for(lk, delay,
                         [this] { return cancelRequested_.load(std::memory_order_acquire); })) {
            lastError = Error{ErrorCode::OperationCancelled,
                              "Cancelled before retry: " + lastError.message};
            break;
        }
    }
    finishJob(index, lastError);
}

Result<fs::path>
DownloadOrchestrator::attemptOnce(const DownloadJob& job,
                                  const std::optional<ExportFormat>& exportFormat) {
    deps_.limiter->acquire(ratelimit::Priority::Normal);

    auto token = deps_.credentials->getToken(false);
    if (!token) {
        return token.error();
    }

    auto bytes = exportFormat
                     ? deps_.content->convertAndFetch(job.fileId, exportFormat->mimeType,
                                                      token.value())
                     : deps_.content->fetchContent(job.fileId, token.value());
    if (!bytes) {
        const Error& err = bytes.error();
        if (err.code == ErrorCode::RateLimited) {
            if (err.retryAfter) {
                deps_.limiter->report429(std::string_view(*err.retryAfter));
            } else {
                deps_.limiter->report429();
            }
        }
        return err;
    }
    deps_.limiter->clearBackoff();

    std::string folder = job.folder;
    if (folder.empty()) {
        std::lock_guard lk(mutex_);
        folder = progress_.folder;
    }
    return deps_.saver->save(fs::path(folder) / job.displayName, bytes.value());
}

void DownloadOrchestrator::runManifestJob(std::size_t index) {
    DownloadJob job;
    std::string courseName;
    std::string folder;
    {
        std::lock_guard lk(mutex_);
        jobs_[index].state = JobState::Active;
        jobs_[index].attemptCount = 1;
        progress_.currentFile = jobs_[index].displayName;
        job = jobs_[index];
        courseName = courseName_;
        folder = progress_.folder;
    }
    const auto text = renderLinksManifest(courseName, job.links);
    const auto* data = reinterpret_cast<const std::byte*>(text.data());
    finishJob(index, deps_.saver->save(fs::path(folder) / job.displayName,
                                       std::span<const std::byte>(data, text.size())));
}

void DownloadOrchestrator::finishJob(std::size_t index, const Result<fs::path>& outcome) {
    std::lock_guard lk(mutex_);
    DownloadJob& job = jobs_[index];
    if (outcome) {
        job.state = JobState::Succeeded;
        job.savedPath = outcome.value().string();
        job.lastError.clear();
        ++progress_.completed;
        spdlog::debug("Downloader: saved {}", job.savedPath);
    } else {
        job.state = JobState::Failed;
        job.lastError = outcome.error().message;
        ++progress_.failed;
        spdlog::warn("Downloader: '{}' failed after {} attempt(s): {}", job.displayName,
                     job.attemptCount, job.lastError);
    }
    if (job.kind == JobKind::Content) {
        updateOfflineQueueLocked(job, outcome);
    }
    if (auto r = persistLocked(); !r) {
        spdlog::warn("Downloader: failed to persist progress: {}", r.error().message);
    }
}

void DownloadOrchestrator::updateOfflineQueueLocked(const DownloadJob& job,
                                                    const Result<fs::path>& outcome) {
    Result<void> r;
    if (offlineRetry_) {
        if (outcome || isTerminalForItem(outcome.error().code)) {
            r = offline_.remove(job.fileId);
        } else if (outcome.error().code != ErrorCode::OperationCancelled) {
            auto dropped = offline_.recordFailedRetry(job.fileId, config_.maxOfflineRetries);
            if (!dropped) {
                r = dropped.error();
            }
        }
    } else if (!outcome && isNetworkClass(outcome.error().code) && job.source) {
        std::string folder = job.folder.empty() ? progress_.folder : job.folder;
        auto added = offline_.add(OfflineItem{*job.source, job.displayName, std::move(folder),
                                              outcome.error().message,
                                              std::chrono::system_clock::now(), 0});
        if (!added) {
            r = added.error();
        }
    }
    if (!r) {
        spdlog::warn("Downloader: offline queue update for '{}' failed: {}", job.displayName,
                     r.error().message);
    }
}

std::chrono::milliseconds DownloadOrchestrator::backoffFor(int attempt) const {
    const auto& p = config_.retry;
    double base = static_cast<double>(p.initialBackoff.count()) *
                  std::pow(p.multiplier, static_cast<double>(std::max(0, attempt - 1)));
    base = std::min(base, static_cast<double>(p.maxBackoff.count()));

    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> jitter(0.0, std::max(0.0, p.jitter) * base);
    const double total = std::min(base + jitter(rng), static_cast<double>(p.maxBackoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(total));
}

Result<void> DownloadOrchestrator::persistLocked() {
    if (auto r = deps_.store->set(kProgressKey, toJson(progress_)); !r) {
        return r;
    }
    json jobs = json::array();
    for (const auto& job : jobs_) {
        jobs.push_back(toJson(job));
    }
    return deps_.store->set(kJobsKey, json{{"batch_id", progress_.batchId},
                                           {"course_name", courseName_},
                                           {"folder", progress_.folder},
                                           {"offline_retry", offlineRetry_},
                                           {"jobs", std::move(jobs)}});
}

void DownloadOrchestrator::joinDriver() {
    if (driver_.joinable() && driver_.get_id() != std::this_thread::get_id()) {
        driver_.join();
    }
}

} // namespace gcrdl::downloader
