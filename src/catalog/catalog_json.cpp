/*
 * gcrdl/src/catalog/catalog_json.cpp
 *
 * JSON mapping for the catalog model. Attachments are discriminated by "type":
 *   drive_file | link | youtube | form
 */

#include <gcrdl/catalog/catalog.h>

#include <stdexcept>

namespace gcrdl::catalog {

using json = nlohmann::json;

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const char* kindName(RecordKind k) {
    switch (k) {
        case RecordKind::Assignment:
            return "assignment";
        case RecordKind::Material:
            return "material";
        case RecordKind::Announcement:
            return "announcement";
    }
    return "material";
}

void readRecords(const json& j, const char* key, RecordKind kind,
                 std::vector<CatalogRecord>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    for (const auto& item : it->get_ref<const json::array_t&>()) {
        CatalogRecord r = item.get<CatalogRecord>();
        r.kind = kind;
        out.push_back(std::move(r));
    }
}

} // namespace

const std::string& attachmentId(const Attachment& a) {
    return std::visit([](const auto& v) -> const std::string& { return v.id; }, a);
}

const std::string& attachmentTitle(const Attachment& a) {
    return std::visit([](const auto& v) -> const std::string& { return v.title; }, a);
}

bool isLinkType(const Attachment& a) {
    return !std::holds_alternative<DriveFile>(a);
}

std::vector<std::string> allAttachmentIds(const CourseCatalog& catalog) {
    std::vector<std::string> ids;
    for (const auto* list : {&catalog.assignments, &catalog.materials, &catalog.announcements}) {
        for (const auto& record : *list) {
            for (const auto& a : record.attachments) {
                ids.push_back(attachmentId(a));
            }
        }
    }
    return ids;
}

void to_json(json& j, const Attachment& a) {
    std::visit(overloaded{
                   [&](const DriveFile& f) {
                       j = json{{"type", "drive_file"},
                                {"id", f.id},
                                {"title", f.title},
                                {"mime_type", f.mimeType},
                                {"alternate_link", f.alternateLink}};
                       if (f.sizeBytes) {
                           j["size_bytes"] = *f.sizeBytes;
                       }
                   },
                   [&](const Link& l) {
                       j = json{{"type", "link"}, {"id", l.id}, {"title", l.title}, {"url", l.url}};
                   },
                   [&](const YouTubeVideo& v) {
                       j = json{
                           {"type", "youtube"}, {"id", v.id}, {"title", v.title}, {"url", v.url}};
                   },
                   [&](const Form& f) {
                       j = json{{"type", "form"},
                                {"id", f.id},
                                {"title", f.title},
                                {"form_url", f.formUrl}};
                   },
               },
               a);
}

void from_json(const json& j, Attachment& a) {
    const auto type = j.at("type").get<std::string>();
    if (type == "drive_file") {
        DriveFile f;
        j.at("id").get_to(f.id);
        f.title = j.value("title", std::string{});
        f.mimeType = j.value("mime_type", std::string{});
        f.alternateLink = j.value("alternate_link", std::string{});
        if (auto it = j.find("size_bytes"); it != j.end() && it->is_number_unsigned()) {
            f.sizeBytes = it->get<std::uint64_t>();
        }
        a = std::move(f);
    } else if (type == "link") {
        Link l;
        j.at("id").get_to(l.id);
        l.title = j.value("title", std::string{});
        l.url = j.value("url", std::string{});
        a = std::move(l);
    } else if (type == "youtube") {
        YouTubeVideo v;
        j.at("id").get_to(v.id);
        v.title = j.value("title", std::string{});
        v.url = j.value("url", std::string{});
        a = std::move(v);
    } else if (type == "form") {
        Form f;
        j.at("id").get_to(f.id);
        f.title = j.value("title", std::string{});
        f.formUrl = j.value("form_url", std::string{});
        a = std::move(f);
    } else {
        throw std::invalid_argument("unknown attachment type '" + type + "'");
    }
}

void to_json(json& j, const CatalogRecord& r) {
    j = json{{"id", r.id},
             {"title", r.title},
             {"kind", kindName(r.kind)},
             {"attachments", r.attachments}};
}

void from_json(const json& j, CatalogRecord& r) {
    j.at("id").get_to(r.id);
    r.title = j.value("title", std::string{});
    r.attachments.clear();
    if (auto it = j.find("attachments"); it != j.end() && !it->is_null()) {
        it->get_to(r.attachments);
    }
}

void to_json(json& j, const CourseCatalog& c) {
    j = json{{"course_id", c.courseId},
             {"course_name", c.courseName},
             {"assignments", c.assignments},
             {"materials", c.materials},
             {"announcements", c.announcements}};
}

void from_json(const json& j, CourseCatalog& c) {
    j.at("course_id").get_to(c.courseId);
    c.courseName = j.value("course_name", std::string{});
    c.assignments.clear();
    c.materials.clear();
    c.announcements.clear();
    readRecords(j, "assignments", RecordKind::Assignment, c.assignments);
    readRecords(j, "materials", RecordKind::Material, c.materials);
    readRecords(j, "announcements", RecordKind::Announcement, c.announcements);
}

Result<CourseCatalog> parseCatalog(const json& j) {
    try {
        return j.get<CourseCatalog>();
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed catalog: ") + e.what()};
    } catch (const std::invalid_argument& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed catalog: ") + e.what()};
    }
}

} // namespace gcrdl::catalog
