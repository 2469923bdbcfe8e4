#include <gtest/gtest.h>

#include <gcrdl/catalog/catalog.h>

#include "support/sample_catalog.hpp"

using namespace gcrdl;
using namespace gcrdl::catalog;
using json = nlohmann::json;

TEST(CatalogJsonTest, AttachmentTypesMapToTaggedObjects) {
    json j = test_support::sampleCatalog();
    const auto& first = j["assignments"][0]["attachments"];
    EXPECT_EQ(first[0]["type"], "drive_file");
    EXPECT_EQ(first[0]["mime_type"], "application/pdf");
    EXPECT_EQ(first[0]["size_bytes"], 1024);
    EXPECT_EQ(first[1]["type"], "form");
    EXPECT_EQ(first[1]["form_url"], "https://forms.gle/quiz1");
    EXPECT_EQ(j["materials"][0]["attachments"][2]["type"], "youtube");
    EXPECT_EQ(j["materials"][0]["attachments"][3]["type"], "link");
}

TEST(CatalogJsonTest, ParsesExportDocument) {
    const auto doc = json::parse(R"({
        "course_id": "c9",
        "course_name": "Chemistry",
        "materials": [
            {"id": "m1", "title": "Lab",
             "attachments": [
                {"type": "drive_file", "id": "d1", "title": "Safety", "mime_type": "application/pdf"},
                {"type": "link", "id": "l1", "url": "https://example.org"}
             ]}
        ]
    })");
    auto parsed = parseCatalog(doc);
    ASSERT_TRUE(parsed) << parsed.error().message;
    const auto& c = parsed.value();
    EXPECT_EQ(c.courseId, "c9");
    EXPECT_TRUE(c.assignments.empty());
    ASSERT_EQ(c.materials.size(), 1u);
    EXPECT_EQ(c.materials[0].kind, RecordKind::Material);
    ASSERT_EQ(c.materials[0].attachments.size(), 2u);
    const auto& file = std::get<DriveFile>(c.materials[0].attachments[0]);
    EXPECT_FALSE(file.sizeBytes.has_value());
    EXPECT_TRUE(isLinkType(c.materials[0].attachments[1]));
    EXPECT_EQ(attachmentTitle(c.materials[0].attachments[1]), "");
}

TEST(CatalogJsonTest, UnknownAttachmentTypeIsInvalidData) {
    const auto doc = json::parse(R"({"course_id": "c", "materials": [
        {"id": "m", "attachments": [{"type": "hologram", "id": "h"}]}]})");
    auto parsed = parseCatalog(doc);
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidData);
}

TEST(CatalogJsonTest, MissingCourseIdIsInvalidData) {
    auto parsed = parseCatalog(json{{"course_name", "x"}});
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidData);
}

TEST(CatalogJsonTest, AllAttachmentIdsWalksEveryListInOrder) {
    const auto ids = allAttachmentIds(test_support::sampleCatalog());
    EXPECT_EQ(ids, (std::vector<std::string>{"f1", "form1", "f2", "f3", "yt1", "l1", "f1"}));
}

TEST(CatalogJsonTest, SurvivesSerializationThroughJson) {
    const auto original = test_support::sampleCatalog();
    auto parsed = parseCatalog(json(original));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().courseName, original.courseName);
    EXPECT_EQ(allAttachmentIds(parsed.value()), allAttachmentIds(original));
    EXPECT_EQ(parsed.value().announcements[0].kind, RecordKind::Announcement);
}
