/*
 * gcrdl/src/downloader/batch_plan.cpp
 *
 * Turning a catalog plus a selection into jobs, and rendering the links manifest.
 */

#include <gcrdl/downloader/downloader.hpp>

#include <fmt/format.h>

#include <unordered_set>

namespace gcrdl::downloader {

Result<BatchPlan> planBatch(const catalog::CourseCatalog& catalog,
                            const std::vector<std::string>& requestedIds) {
    if (requestedIds.empty()) {
        return Error{ErrorCode::NothingSelected, "No attachments selected"};
    }
    const std::unordered_set<std::string> wanted(requestedIds.begin(), requestedIds.end());
    std::unordered_set<std::string> seen;

    BatchPlan plan;
    for (const auto* list : {&catalog.assignments, &catalog.materials, &catalog.announcements}) {
        for (const auto& record : *list) {
            for (const auto& attachment : record.attachments) {
                const auto& id = catalog::attachmentId(attachment);
                if (wanted.count(id) == 0 || !seen.insert(id).second) {
                    continue;
                }
                if (catalog::isLinkType(attachment)) {
                    plan.links.push_back(DownloadJob::LinkItem{attachment, record.title});
                    continue;
                }
                DownloadJob job;
                job.kind = JobKind::Content;
                job.fileId = id;
                job.source = std::get<catalog::DriveFile>(attachment);
                job.parentTitle = record.title;
                plan.contentJobs.push_back(std::move(job));
            }
        }
    }

    if (plan.contentJobs.empty() && plan.links.empty()) {
        return Error{ErrorCode::NothingMatched,
                     fmt::format("None of the {} selected ids exist in course '{}'",
                                 requestedIds.size(), catalog.courseId)};
    }
    return plan;
}

std::string renderLinksManifest(std::string_view courseName,
                                const std::vector<DownloadJob::LinkItem>& links) {
    std::vector<const DownloadJob::LinkItem*> videos;
    std::vector<const DownloadJob::LinkItem*> forms;
    std::vector<const DownloadJob::LinkItem*> others;
    for (const auto& item : links) {
        if (std::holds_alternative<catalog::YouTubeVideo>(item.attachment)) {
            videos.push_back(&item);
        } else if (std::holds_alternative<catalog::Form>(item.attachment)) {
            forms.push_back(&item);
        } else {
            others.push_back(&item);
        }
    }

    auto urlOf = [](const catalog::Attachment& a) -> std::string {
        if (const auto* v = std::get_if<catalog::YouTubeVideo>(&a)) {
            return v->url;
        }
        if (const auto* f = std::get_if<catalog::Form>(&a)) {
            return f->formUrl;
        }
        if (const auto* l = std::get_if<catalog::Link>(&a)) {
            return l->url;
        }
        return std::get<catalog::DriveFile>(a).alternateLink;
    };

    const std::string heading =
        courseName.empty() ? std::string("Links and Resources")
                           : fmt::format("Links and Resources - {}", courseName);
    std::string out = heading + "\n" + std::string(heading.size(), '=') + "\n";

    auto section = [&](std::string_view title,
                       const std::vector<const DownloadJob::LinkItem*>& items) {
        if (items.empty()) {
            return;
        }
        out += fmt::format("\n{}\n{}\n", title, std::string(title.size(), '-'));
        for (const auto* item : items) {
            const auto& name = catalog::attachmentTitle(item->attachment);
            out += fmt::format("\n{}\n{}\n", name.empty() ? "Untitled" : name,
                               urlOf(item->attachment));
            if (!item->parentTitle.empty()) {
                out += fmt::format("From: {}\n", item->parentTitle);
            }
        }
    };
    section("YouTube Videos", videos);
    section("Google Forms", forms);
    section("Links", others);
    return out;
}

} // namespace gcrdl::downloader
