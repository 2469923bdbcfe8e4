/*
 * gcrdl/src/downloader/job_serialization.cpp
 *
 * JSON form of BatchProgress and DownloadJob for the durable store.
 */

#include <gcrdl/downloader/downloader.hpp>

#include <stdexcept>

namespace gcrdl::downloader {

using json = nlohmann::json;

const char* jobStateName(JobState s) {
    switch (s) {
        case JobState::Pending:
            return "pending";
        case JobState::Active:
            return "active";
        case JobState::Succeeded:
            return "succeeded";
        case JobState::Failed:
            return "failed";
    }
    return "pending";
}

namespace {

JobState jobStateFromName(std::string_view s) {
    if (s == "active")
        return JobState::Active;
    if (s == "succeeded")
        return JobState::Succeeded;
    if (s == "failed")
        return JobState::Failed;
    return JobState::Pending;
}

} // namespace

json toJson(const BatchProgress& p) {
    json j{{"batch_id", p.batchId},
           {"total", p.total},
           {"completed", p.completed},
           {"failed", p.failed},
           {"current_file", p.currentFile},
           {"folder", p.folder},
           {"active", p.active},
           {"interrupted", p.interrupted},
           {"cancelled", p.cancelled},
           {"started_at", toEpochMillis(p.startedAt)}};
    if (p.finishedAt) {
        j["finished_at"] = toEpochMillis(*p.finishedAt);
    }
    return j;
}

BatchProgress progressFromJson(const json& j) {
    BatchProgress p;
    if (!j.is_object()) {
        return p;
    }
    p.batchId = j.value("batch_id", std::string{});
    p.total = j.value("total", std::size_t{0});
    p.completed = j.value("completed", std::size_t{0});
    p.failed = j.value("failed", std::size_t{0});
    p.currentFile = j.value("current_file", std::string{});
    p.folder = j.value("folder", std::string{});
    p.active = j.value("active", false);
    p.interrupted = j.value("interrupted", false);
    p.cancelled = j.value("cancelled", false);
    p.startedAt = fromEpochMillis(j.value("started_at", std::int64_t{0}));
    if (auto it = j.find("finished_at"); it != j.end() && it->is_number_integer()) {
        p.finishedAt = fromEpochMillis(it->get<std::int64_t>());
    }
    return p;
}

json toJson(const DownloadJob& job) {
    json links = json::array();
    for (const auto& item : job.links) {
        links.push_back(json{{"attachment", item.attachment}, {"parent_title", item.parentTitle}});
    }
    json j{{"kind", job.kind == JobKind::Manifest ? "manifest" : "content"},
           {"file_id", job.fileId},
           {"display_name", job.displayName},
           {"parent_title", job.parentTitle},
           {"state", jobStateName(job.state)},
           {"attempt_count", job.attemptCount},
           {"saved_path", job.savedPath},
           {"last_error", job.lastError},
           {"links", std::move(links)}};
    if (job.source) {
        j["source"] = catalog::Attachment{*job.source};
    }
    if (!job.folder.empty()) {
        j["folder"] = job.folder;
    }
    return j;
}

Result<DownloadJob> jobFromJson(const json& j) {
    try {
        DownloadJob job;
        job.kind = j.value("kind", std::string{"content"}) == "manifest" ? JobKind::Manifest
                                                                         : JobKind::Content;
        job.fileId = j.at("file_id").get<std::string>();
        job.displayName = j.at("display_name").get<std::string>();
        job.parentTitle = j.value("parent_title", std::string{});
        job.state = jobStateFromName(j.value("state", std::string{"pending"}));
        job.attemptCount = j.value("attempt_count", 0);
        job.savedPath = j.value("saved_path", std::string{});
        job.lastError = j.value("last_error", std::string{});
        job.folder = j.value("folder", std::string{});
        if (auto it = j.find("source"); it != j.end() && it->is_object()) {
            auto a = it->get<catalog::Attachment>();
            if (!std::holds_alternative<catalog::DriveFile>(a)) {
                return Error{ErrorCode::InvalidData, "Persisted job source is not a Drive file"};
            }
            job.source = std::get<catalog::DriveFile>(std::move(a));
        }
        if (auto it = j.find("links"); it != j.end() && it->is_array()) {
            for (const auto& l : *it) {
                job.links.push_back(DownloadJob::LinkItem{l.at("attachment").get<catalog::Attachment>(),
                                                          l.value("parent_title", std::string{})});
            }
        }
        if (job.kind == JobKind::Content && !job.source) {
            return Error{ErrorCode::InvalidData, "Persisted content job without source"};
        }
        return job;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed persisted job: ") + e.what()};
    } catch (const std::invalid_argument& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed persisted job: ") + e.what()};
    }
}

} // namespace gcrdl::downloader
