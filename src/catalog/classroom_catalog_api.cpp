/*
 * gcrdl/src/catalog/classroom_catalog_api.cpp
 *
 * Classroom v1 REST source for course catalogs:
 *   GET {base}/courses/{id}
 *   GET {base}/courses/{id}/courseWork?pageSize=N[&pageToken=T]
 *   GET {base}/courses/{id}/courseWorkMaterials?...
 *   GET {base}/courses/{id}/announcements?...
 * A 404 on a list endpoint means the course has none of that kind.
 */

#include <gcrdl/catalog/catalog_service.h>
#include <gcrdl/http/http_client.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <set>
#include <utility>

namespace gcrdl::catalog {

using json = nlohmann::json;

namespace {

constexpr std::size_t kAnnouncementTitleBytes = 50;

std::string stringField(const json& j, const char* key, std::string fallback = {}) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::optional<Attachment> attachmentFromMaterial(const json& m) {
    if (auto it = m.find("driveFile"); it != m.end() && it->is_object()) {
        const json& f = it->contains("driveFile") ? it->at("driveFile") : *it;
        DriveFile file;
        file.id = stringField(f, "id");
        file.title = stringField(f, "title", "Untitled File");
        file.mimeType = stringField(f, "mimeType", "application/octet-stream");
        file.alternateLink = stringField(f, "alternateLink");
        if (file.id.empty()) {
            return std::nullopt;
        }
        return Attachment{std::move(file)};
    }
    if (auto it = m.find("youtubeVideo"); it != m.end() && it->is_object()) {
        YouTubeVideo v;
        v.id = stringField(*it, "id");
        v.title = stringField(*it, "title", "YouTube Video");
        v.url = stringField(*it, "alternateLink");
        if (v.id.empty()) {
            return std::nullopt;
        }
        return Attachment{std::move(v)};
    }
    if (auto it = m.find("link"); it != m.end() && it->is_object()) {
        // Links have no id of their own; the URL identifies them.
        Link l;
        l.url = stringField(*it, "url");
        l.id = l.url;
        l.title = stringField(*it, "title", l.url);
        if (l.url.empty()) {
            return std::nullopt;
        }
        return Attachment{std::move(l)};
    }
    if (auto it = m.find("form"); it != m.end() && it->is_object()) {
        Form f;
        f.formUrl = stringField(*it, "formUrl");
        f.id = f.formUrl;
        f.title = stringField(*it, "title", "Google Form");
        if (f.formUrl.empty()) {
            return std::nullopt;
        }
        return Attachment{std::move(f)};
    }
    return std::nullopt;
}

std::string announcementTitle(const std::string& text) {
    if (text.empty()) {
        return "Announcement";
    }
    auto title = http::toValidUtf8(text, kAnnouncementTitleBytes);
    if (title.size() < text.size()) {
        title += "...";
    }
    return title;
}

CatalogRecord recordFrom(const json& item, RecordKind kind) {
    CatalogRecord r;
    r.id = stringField(item, "id");
    r.kind = kind;
    switch (kind) {
        case RecordKind::Assignment:
            r.title = stringField(item, "title", "Untitled Assignment");
            break;
        case RecordKind::Material:
            r.title = stringField(item, "title", "Untitled Material");
            break;
        case RecordKind::Announcement:
            r.title = announcementTitle(stringField(item, "text"));
            break;
    }
    if (auto it = item.find("materials"); it != item.end() && it->is_array()) {
        for (const auto& m : *it) {
            if (auto a = attachmentFromMaterial(m)) {
                r.attachments.push_back(std::move(*a));
            }
        }
    }
    return r;
}

class ClassroomCatalogApi final : public ICatalogApi {
public:
    ClassroomCatalogApi(http::IHttpClient& http, std::string baseUrl,
                        std::chrono::milliseconds timeout, int pageSize)
        : http_(http), baseUrl_(std::move(baseUrl)), timeout_(timeout),
          pageSize_(pageSize > 0 ? pageSize : 50) {
        while (!baseUrl_.empty() && baseUrl_.back() == '/') {
            baseUrl_.pop_back();
        }
    }

    Result<CourseCatalog> fetchCollection(std::string_view courseId,
                                          std::string_view token) override {
        if (courseId.empty()) {
            return Error{ErrorCode::InvalidArgument, "Course id is empty"};
        }
        const std::string coursePath = baseUrl_ + "/courses/" + http::urlEncode(courseId);

        auto course = getJson(coursePath, token, "course");
        if (!course) {
            return course.error();
        }

        CourseCatalog catalog;
        catalog.courseId = std::string(courseId);
        catalog.courseName = stringField(course.value(), "name");

        if (auto r = listAll(coursePath + "/courseWork", "courseWork", RecordKind::Assignment,
                             token, catalog.assignments);
            !r) {
            return r.error();
        }
        if (auto r = listAll(coursePath + "/courseWorkMaterials", "courseWorkMaterial",
                             RecordKind::Material, token, catalog.materials);
            !r) {
            return r.error();
        }
        if (auto r = listAll(coursePath + "/announcements", "announcements",
                             RecordKind::Announcement, token, catalog.announcements);
            !r) {
            return r.error();
        }
        return catalog;
    }

private:
    Result<void> listAll(const std::string& url, const char* field, RecordKind kind,
                         std::string_view token, std::vector<CatalogRecord>& out) {
        std::string pageToken;
        std::set<std::string> seenTokens;
        do {
            std::string pageUrl = fmt::format("{}?pageSize={}", url, pageSize_);
            if (!pageToken.empty()) {
                pageUrl += "&pageToken=" + http::urlEncode(pageToken);
            }
            auto page = getJson(pageUrl, token, field);
            if (!page) {
                if (page.error().code == ErrorCode::NotFound) {
                    spdlog::debug("Classroom: no {} for this course", field);
                    return Result<void>();
                }
                return page.error();
            }
            if (auto it = page.value().find(field); it != page.value().end() && it->is_array()) {
                for (const auto& item : *it) {
                    auto record = recordFrom(item, kind);
                    if (!record.id.empty()) {
                        out.push_back(std::move(record));
                    }
                }
            }
            pageToken = stringField(page.value(), "nextPageToken");
            if (!pageToken.empty() && !seenTokens.insert(pageToken).second) {
                return Error{ErrorCode::InvalidData,
                             fmt::format("Classroom {} pagination repeated a page token", field)};
            }
        } while (!pageToken.empty());
        return Result<void>();
    }

    Result<json> getJson(const std::string& url, std::string_view token, std::string_view what) {
        http::HttpRequest req;
        req.url = url;
        req.timeout = timeout_;
        req.headers.push_back({"Authorization", "Bearer " + std::string(token)});
        req.headers.push_back({"Accept", "application/json"});

        auto res = http_.send(req);
        if (!res) {
            return res.error();
        }
        const auto& response = res.value();
        if (!response.ok()) {
            spdlog::debug("Classroom {} returned HTTP {}", what, response.status);
            return http::errorFromResponse(response, fmt::format("Classroom {}", what));
        }
        auto doc = json::parse(response.bodyText(), nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Classroom {} response is not a JSON object", what)};
        }
        return doc;
    }

    http::IHttpClient& http_;
    std::string baseUrl_;
    std::chrono::milliseconds timeout_;
    int pageSize_;
};

} // namespace

std::unique_ptr<ICatalogApi> makeClassroomCatalogApi(http::IHttpClient& http, std::string baseUrl,
                                                     std::chrono::milliseconds requestTimeout,
                                                     int pageSize) {
    return std::make_unique<ClassroomCatalogApi>(http, std::move(baseUrl), requestTimeout,
                                                 pageSize);
}

} // namespace gcrdl::catalog
