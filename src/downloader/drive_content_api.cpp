/*
 * gcrdl/src/downloader/drive_content_api.cpp
 *
 * Drive v3 content endpoints:
 *   GET {base}/files/{id}?alt=media
 *   GET {base}/files/{id}/export?mimeType={mime}
 */

#include <gcrdl/downloader/downloader.hpp>
#include <gcrdl/http/http_client.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace gcrdl::downloader {

namespace {

class DriveContentApi final : public IContentApi {
public:
    DriveContentApi(http::IHttpClient& http, std::string baseUrl,
                    std::chrono::milliseconds timeout)
        : http_(http), baseUrl_(std::move(baseUrl)), timeout_(timeout) {
        while (!baseUrl_.empty() && baseUrl_.back() == '/') {
            baseUrl_.pop_back();
        }
    }

    Result<ByteVector> fetchContent(std::string_view fileId, std::string_view token) override {
        return get(baseUrl_ + "/files/" + http::urlEncode(fileId) + "?alt=media", token,
                   "download");
    }

    Result<ByteVector> convertAndFetch(std::string_view fileId, std::string_view targetMime,
                                       std::string_view token) override {
        return get(baseUrl_ + "/files/" + http::urlEncode(fileId) +
                       "/export?mimeType=" + http::urlEncode(targetMime),
                   token, "export");
    }

private:
    Result<ByteVector> get(std::string url, std::string_view token, std::string_view what) {
        http::HttpRequest req;
        req.url = std::move(url);
        req.timeout = timeout_;
        req.headers.push_back({"Authorization", "Bearer " + std::string(token)});

        auto res = http_.send(req);
        if (!res) {
            return res.error();
        }
        auto& response = res.value();
        if (!response.ok()) {
            spdlog::debug("Drive {} returned HTTP {}", what, response.status);
            return http::errorFromResponse(response, what);
        }
        return std::move(response.body);
    }

    http::IHttpClient& http_;
    std::string baseUrl_;
    std::chrono::milliseconds timeout_;
};

} // namespace

std::unique_ptr<IContentApi> makeDriveContentApi(http::IHttpClient& http, std::string baseUrl,
                                                 std::chrono::milliseconds requestTimeout) {
    return std::make_unique<DriveContentApi>(http, std::move(baseUrl), requestTimeout);
}

} // namespace gcrdl::downloader
