#include <gtest/gtest.h>

#include <gcrdl/cli/gcrdl_cli.h>
#include <gcrdl/downloader/download_orchestrator.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "support/temp_dir_scope.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace gcrdl;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kBiologyExport = R"({
    "course_id": "bio",
    "course_name": "Biology",
    "materials": [
        {"id": "m1", "title": "Week 1",
         "attachments": [
            {"type": "drive_file", "id": "d1", "title": "Cells", "mime_type": "application/pdf"}
         ]}
    ]
})";

struct CliRun {
    int exitCode{0};
    std::string out;
    std::string err;
};

} // namespace

class GcrdlCliTest : public ::testing::Test {
protected:
    void SetUp() override { setenv("GCRDL_LOG_LEVEL", "off", 1); }

    void TearDown() override {
        unsetenv("GCRDL_LOG_LEVEL");
        spdlog::set_level(spdlog::level::info);
    }

    // Runs one command against the scratch data dir with a config file that does not exist.
    CliRun run(std::vector<std::string> args) {
        std::vector<std::string> full{"gcrdl", "--config", (tmp_.path() / "absent.toml").string(),
                                      "--data-dir", tmp_.path().string()};
        full.insert(full.end(), args.begin(), args.end());
        std::vector<char*> argv;
        for (auto& a : full) {
            argv.push_back(a.data());
        }

        CliRun result;
        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        {
            cli::GcrdlCLI app;
            result.exitCode = app.run(static_cast<int>(argv.size()), argv.data());
        }
        std::cout.flush();
        std::cerr.flush();
        std::fflush(stdout);
        result.out = testing::internal::GetCapturedStdout();
        result.err = testing::internal::GetCapturedStderr();
        return result;
    }

    CliRun importBiology() {
        const auto file = tmp_.writeFile("bio-export.json", kBiologyExport);
        return run({"catalog", "import", file.string()});
    }

    test_support::TempDirScope tmp_{"gcrdl-cli"};
};

TEST_F(GcrdlCliTest, DownloadRequiresCourse) {
    auto r = run({"download", "--ids", "d1"});
    EXPECT_EQ(r.exitCode, 1);
    EXPECT_NE(r.err.find("--course is required"), std::string::npos);
    // Rejected before any state was opened.
    EXPECT_FALSE(fs::exists(tmp_.stateFile()));
}

TEST_F(GcrdlCliTest, DownloadRequiresIdsOrAll) {
    auto r = run({"download", "--course", "bio"});
    EXPECT_EQ(r.exitCode, 1);
    EXPECT_NE(r.err.find("Pass --ids or --all"), std::string::npos);
}

TEST_F(GcrdlCliTest, IdsAndAllAreMutuallyExclusive) {
    auto r = run({"download", "--course", "bio", "--ids", "d1", "--all"});
    EXPECT_NE(r.exitCode, 0);
    EXPECT_FALSE(fs::exists(tmp_.stateFile()));
}

TEST_F(GcrdlCliTest, UnknownCommandIsAParseError) {
    auto r = run({"upload"});
    EXPECT_NE(r.exitCode, 0);
}

TEST_F(GcrdlCliTest, ImportThenDownloadUnknownIdReportsNothingMatched) {
    auto imported = importBiology();
    ASSERT_EQ(imported.exitCode, 0) << imported.err;
    EXPECT_NE(imported.out.find("Imported Biology (bio)"), std::string::npos);

    auto r = run({"download", "--course", "bio", "--ids", "nope"});
    EXPECT_EQ(r.exitCode, 1);
    EXPECT_NE(r.err.find("Nothing matched"), std::string::npos);
}

TEST_F(GcrdlCliTest, ResumeWithNothingRecordedFails) {
    auto r = run({"download", "resume"});
    EXPECT_EQ(r.exitCode, 1);
    EXPECT_NE(r.err.find("No batch to resume"), std::string::npos);
}

TEST_F(GcrdlCliTest, StatusWithNothingRecorded) {
    auto r = run({"download", "status"});
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_NE(r.out.find("No batch recorded"), std::string::npos);
}

TEST_F(GcrdlCliTest, StatusReportsBatchLeftActiveAsInterrupted) {
    tmp_.writeState(json{{downloader::kProgressKey,
                          {{"batch_id", "batch_1"},
                           {"total", 3},
                           {"completed", 1},
                           {"folder", "Biology"},
                           {"active", true}}}}
                        .dump());

    auto text = run({"download", "status"});
    EXPECT_EQ(text.exitCode, 1);
    EXPECT_NE(text.out.find("Batch batch_1: interrupted"), std::string::npos);

    auto structured = run({"--json", "download", "status"});
    EXPECT_EQ(structured.exitCode, 1);
    auto doc = json::parse(structured.out, nullptr, false);
    ASSERT_TRUE(doc.is_object()) << structured.out;
    EXPECT_EQ(doc["batch_id"], "batch_1");
    EXPECT_EQ(doc["interrupted"], true);
    EXPECT_EQ(doc["active"], false);
}

TEST_F(GcrdlCliTest, CacheClearByIdRemovesImportedCatalog) {
    ASSERT_EQ(importBiology().exitCode, 0);

    auto before = run({"--json", "cache", "stats"});
    ASSERT_EQ(before.exitCode, 0);
    EXPECT_EQ(json::parse(before.out)["count"], 1);

    auto cleared = run({"cache", "clear", "--id", "bio"});
    EXPECT_EQ(cleared.exitCode, 0);
    EXPECT_NE(cleared.out.find("Removed bio"), std::string::npos);

    auto after = run({"--json", "cache", "stats"});
    ASSERT_EQ(after.exitCode, 0);
    EXPECT_EQ(json::parse(after.out)["count"], 0);
}

TEST_F(GcrdlCliTest, CacheClearWithoutIdEmptiesCache) {
    ASSERT_EQ(importBiology().exitCode, 0);
    auto r = run({"cache", "clear"});
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_NE(r.out.find("Cache cleared"), std::string::npos);
}

TEST_F(GcrdlCliTest, OfflineQueueListAndRetryWhenEmpty) {
    auto list = run({"download", "offline", "list"});
    EXPECT_EQ(list.exitCode, 0);
    EXPECT_NE(list.out.find("Offline queue is empty"), std::string::npos);

    auto retry = run({"download", "offline", "retry"});
    EXPECT_EQ(retry.exitCode, 1);
    EXPECT_NE(retry.err.find("Offline queue is empty"), std::string::npos);
}
