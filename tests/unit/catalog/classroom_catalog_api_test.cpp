#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <gcrdl/catalog/catalog_service.h>

#include "support/fakes.hpp"

#include <map>

using namespace gcrdl;
using namespace gcrdl::catalog;
using test_support::makeResponse;
using ::testing::_;
using ::testing::Invoke;

namespace {

constexpr const char* kBase = "https://classroom.test/v1/courses/c1";

} // namespace

class ClassroomCatalogApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(http_, send(_)).WillByDefault(Invoke([this](const http::HttpRequest& req) {
            return route(req);
        }));
    }

    Result<http::HttpResponse> route(const http::HttpRequest& req) {
        requests_.push_back(req);
        auto it = responses_.find(req.url);
        if (it == responses_.end()) {
            return makeResponse(404, R"({"error":{"status":"NOT_FOUND"}})");
        }
        return it->second;
    }

    void respond(const std::string& url, http::HttpResponse response) {
        responses_[url] = std::move(response);
    }

    ::testing::NiceMock<test_support::MockHttpClient> http_;
    std::unique_ptr<ICatalogApi> api_ = makeClassroomCatalogApi(
        http_, "https://classroom.test/v1/", std::chrono::milliseconds(999), 2);
    std::map<std::string, http::HttpResponse> responses_;
    std::vector<http::HttpRequest> requests_;
};

TEST_F(ClassroomCatalogApiTest, FollowsPageTokensAndSendsBearerToken) {
    respond(kBase, makeResponse(200, R"({"id":"c1","name":"Physics 101"})"));
    respond(std::string(kBase) + "/courseWork?pageSize=2", makeResponse(200, R"({
        "courseWork":[{"id":"w1","title":"Week 1"},{"id":"w2","title":"Week 2"}],
        "nextPageToken":"p/2"})"));
    respond(std::string(kBase) + "/courseWork?pageSize=2&pageToken=p%2F2",
            makeResponse(200, R"({"courseWork":[{"id":"w3"}]})"));
    respond(std::string(kBase) + "/courseWorkMaterials?pageSize=2",
            makeResponse(200, R"({"courseWorkMaterial":[{"id":"m1","title":"Syllabus"}]})"));
    respond(std::string(kBase) + "/announcements?pageSize=2", makeResponse(200, "{}"));

    auto r = api_->fetchCollection("c1", "tok");
    ASSERT_TRUE(r) << r.error().message;
    const auto& c = r.value();
    EXPECT_EQ(c.courseId, "c1");
    EXPECT_EQ(c.courseName, "Physics 101");
    ASSERT_EQ(c.assignments.size(), 3u);
    EXPECT_EQ(c.assignments[1].title, "Week 2");
    EXPECT_EQ(c.assignments[2].id, "w3");
    EXPECT_EQ(c.assignments[2].title, "Untitled Assignment");
    EXPECT_EQ(c.assignments[0].kind, RecordKind::Assignment);
    ASSERT_EQ(c.materials.size(), 1u);
    EXPECT_EQ(c.materials[0].kind, RecordKind::Material);
    EXPECT_TRUE(c.announcements.empty());

    ASSERT_EQ(requests_.size(), 5u);
    for (const auto& req : requests_) {
        EXPECT_EQ(req.method, "GET");
        EXPECT_EQ(req.timeout, std::chrono::milliseconds(999));
        ASSERT_FALSE(req.headers.empty());
        EXPECT_EQ(req.headers[0].name, "Authorization");
        EXPECT_EQ(req.headers[0].value, "Bearer tok");
    }
}

TEST_F(ClassroomCatalogApiTest, MapsEveryMaterialKind) {
    respond(kBase, makeResponse(200, R"({"name":"Course"})"));
    respond(std::string(kBase) + "/courseWork?pageSize=2", makeResponse(200, R"({
        "courseWork":[{"id":"w1","title":"Lab","materials":[
            {"driveFile":{"driveFile":{"id":"d1","title":"Lab.pdf","mimeType":"application/pdf",
                                       "alternateLink":"https://drive/d1"}}},
            {"driveFile":{"id":"d2"}},
            {"youtubeVideo":{"id":"yt1","title":"Demo","alternateLink":"https://youtu.be/yt1"}},
            {"link":{"url":"https://example.org/notes","title":"Notes"}},
            {"form":{"formUrl":"https://forms/f1","title":"Quiz"}},
            {"link":{"title":"no url"}},
            {"unknown":{}}
        ]}]})"));

    auto r = api_->fetchCollection("c1", "tok");
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().assignments.size(), 1u);
    const auto& a = r.value().assignments[0].attachments;
    ASSERT_EQ(a.size(), 5u);

    const auto& nested = std::get<DriveFile>(a[0]);
    EXPECT_EQ(nested.id, "d1");
    EXPECT_EQ(nested.title, "Lab.pdf");
    EXPECT_EQ(nested.mimeType, "application/pdf");
    EXPECT_EQ(nested.alternateLink, "https://drive/d1");

    const auto& flat = std::get<DriveFile>(a[1]);
    EXPECT_EQ(flat.id, "d2");
    EXPECT_EQ(flat.title, "Untitled File");
    EXPECT_EQ(flat.mimeType, "application/octet-stream");

    const auto& video = std::get<YouTubeVideo>(a[2]);
    EXPECT_EQ(video.id, "yt1");
    EXPECT_EQ(video.url, "https://youtu.be/yt1");

    const auto& link = std::get<Link>(a[3]);
    EXPECT_EQ(link.id, "https://example.org/notes");
    EXPECT_EQ(link.title, "Notes");

    const auto& form = std::get<Form>(a[4]);
    EXPECT_EQ(form.id, "https://forms/f1");
    EXPECT_EQ(form.title, "Quiz");
}

TEST_F(ClassroomCatalogApiTest, AnnouncementTitleComesFromText) {
    respond(kBase, makeResponse(200, R"({"name":"Course"})"));
    const std::string longText(80, 'x');
    respond(std::string(kBase) + "/announcements?pageSize=2",
            makeResponse(200, R"({"announcements":[{"id":"a1","text":"Exam moved"},{"id":"a2","text":")" +
                                  longText + R"("},{"id":"a3"}]})"));

    auto r = api_->fetchCollection("c1", "tok");
    ASSERT_TRUE(r) << r.error().message;
    const auto& ann = r.value().announcements;
    ASSERT_EQ(ann.size(), 3u);
    EXPECT_EQ(ann[0].title, "Exam moved");
    EXPECT_EQ(ann[0].kind, RecordKind::Announcement);
    EXPECT_EQ(ann[1].title, std::string(50, 'x') + "...");
    EXPECT_EQ(ann[2].title, "Announcement");
}

TEST_F(ClassroomCatalogApiTest, MissingCourseIsNotFound) {
    auto r = api_->fetchCollection("c1", "tok");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(requests_.size(), 1u);
}

TEST_F(ClassroomCatalogApiTest, ThrottledListCarriesRetryAfter) {
    respond(kBase, makeResponse(200, R"({"name":"Course"})"));
    respond(std::string(kBase) + "/courseWork?pageSize=2",
            makeResponse(429, "quota", {{"Retry-After", "30"}}));

    auto r = api_->fetchCollection("c1", "tok");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::RateLimited);
    EXPECT_EQ(r.error().retryAfter, std::optional<std::string>("30"));
    EXPECT_EQ(r.error().httpStatus, std::optional<int>(429));
}

TEST_F(ClassroomCatalogApiTest, RejectedTokenIsUnauthorized) {
    respond(kBase, makeResponse(401, R"({"error":{"status":"UNAUTHENTICATED"}})"));

    auto r = api_->fetchCollection("c1", "stale");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Unauthorized);
}

TEST_F(ClassroomCatalogApiTest, RepeatedPageTokenStopsPaging) {
    respond(kBase, makeResponse(200, R"({"name":"Course"})"));
    respond(std::string(kBase) + "/courseWork?pageSize=2",
            makeResponse(200, R"({"courseWork":[{"id":"w1"}],"nextPageToken":"again"})"));
    respond(std::string(kBase) + "/courseWork?pageSize=2&pageToken=again",
            makeResponse(200, R"({"courseWork":[{"id":"w2"}],"nextPageToken":"again"})"));

    auto r = api_->fetchCollection("c1", "tok");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);
    EXPECT_EQ(requests_.size(), 3u);
}

TEST_F(ClassroomCatalogApiTest, NonObjectBodyIsInvalidData) {
    respond(kBase, makeResponse(200, "[1,2,3]"));

    auto r = api_->fetchCollection("c1", "tok");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);
}

TEST_F(ClassroomCatalogApiTest, EmptyCourseIdIsRejectedWithoutARequest) {
    EXPECT_CALL(http_, send(_)).Times(0);
    auto r = api_->fetchCollection("", "tok");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}
