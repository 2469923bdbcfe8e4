#pragma once

/*
 * gcrdl catalog model
 *
 * A course catalog is three record lists (assignments, materials, announcements); each record
 * carries attachments of one of four shapes. The shapes are a closed std::variant; the JSON
 * form names the alternative in a "type" field.
 */

#include <gcrdl/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gcrdl::catalog {

struct DriveFile {
    std::string id;
    std::string title;
    std::string mimeType;
    std::optional<std::uint64_t> sizeBytes;
    std::string alternateLink;
};

struct Link {
    std::string id;
    std::string title;
    std::string url;
};

struct YouTubeVideo {
    std::string id;
    std::string title;
    std::string url;
};

struct Form {
    std::string id;
    std::string title;
    std::string formUrl;
};

using Attachment = std::variant<DriveFile, Link, YouTubeVideo, Form>;

const std::string& attachmentId(const Attachment& a);
const std::string& attachmentTitle(const Attachment& a);

// Links, videos and forms are listed in the manifest instead of being downloaded.
bool isLinkType(const Attachment& a);

enum class RecordKind { Assignment, Material, Announcement };

struct CatalogRecord {
    std::string id;
    std::string title;
    RecordKind kind{RecordKind::Material};
    std::vector<Attachment> attachments;
};

struct CourseCatalog {
    std::string courseId;
    std::string courseName;
    std::vector<CatalogRecord> assignments;
    std::vector<CatalogRecord> materials;
    std::vector<CatalogRecord> announcements;
};

// Every attachment id in walk order (assignments, materials, announcements), duplicates kept.
std::vector<std::string> allAttachmentIds(const CourseCatalog& catalog);

// nlohmann ADL hooks. from_json throws (nlohmann::json::exception, or std::invalid_argument
// for an unknown attachment type) on malformed input; parseCatalog wraps that into a Result.
void to_json(nlohmann::json& j, const Attachment& a);
void from_json(const nlohmann::json& j, Attachment& a);
void to_json(nlohmann::json& j, const CatalogRecord& r);
void from_json(const nlohmann::json& j, CatalogRecord& r);
void to_json(nlohmann::json& j, const CourseCatalog& c);
void from_json(const nlohmann::json& j, CourseCatalog& c);

Result<CourseCatalog> parseCatalog(const nlohmann::json& j);

} // namespace gcrdl::catalog
