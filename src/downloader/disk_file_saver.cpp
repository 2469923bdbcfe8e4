/*
 * gcrdl/src/downloader/disk_file_saver.cpp
 *
 * Local file saver:
 * - Writes <root>/<folder>/<name>.part, fsyncs, then renames into place
 * - Never replaces an existing file; picks name(1).ext, name(2).ext... instead
 * - Cross-device rename is not expected (staging file sits beside the target)
 */

#include <gcrdl/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <mutex>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace gcrdl::downloader {

namespace fs = std::filesystem;

namespace {

Result<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Result<void>();
}

fs::path freeTarget(const fs::path& wanted) {
    if (!fs::exists(wanted)) {
        return wanted;
    }
    const auto stem = wanted.stem().string();
    const auto ext = wanted.extension().string();
    for (int n = 1;; ++n) {
        fs::path candidate = wanted.parent_path() / (stem + "(" + std::to_string(n) + ")" + ext);
        if (!fs::exists(candidate)) {
            return candidate;
        }
    }
}

class DiskFileSaver final : public IFileSaver {
public:
    explicit DiskFileSaver(fs::path root) : root_(std::move(root)) {}

    Result<fs::path> save(const fs::path& pathHint, std::span<const std::byte> bytes) override {
        if (pathHint.empty() || pathHint.is_absolute()) {
            return Error{ErrorCode::InvalidArgument, "Save path must be relative: " +
                                                         pathHint.string()};
        }
        for (const auto& part : pathHint) {
            if (part == "..") {
                return Error{ErrorCode::InvalidArgument,
                             "Save path escapes the output directory: " + pathHint.string()};
            }
        }

        const fs::path wanted = root_ / pathHint;
        std::error_code ec;
        fs::create_directories(wanted.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Failed to create directory " +
                                                 wanted.parent_path().string() + ": " +
                                                 ec.message()};
        }

        std::lock_guard lk(mutex_);
        const fs::path target = freeTarget(wanted);
        fs::path staging = target;
        staging += ".part";

        {
            std::ofstream os(staging, std::ios::binary | std::ios::out | std::ios::trunc);
            if (!os.good()) {
                return Error{ErrorCode::IoError,
                             "Failed to create staging file: " + staging.string()};
            }
            os.write(reinterpret_cast<const char*>(bytes.data()),
                     static_cast<std::streamsize>(bytes.size()));
            if (!os.good()) {
                os.close();
                cleanup(staging);
                return Error{ErrorCode::IoError, "write failed on: " + staging.string()};
            }
        }

        if (auto r = fsync_file(staging); !r) {
            cleanup(staging);
            return r.error();
        }

        fs::rename(staging, target, ec);
        if (ec) {
            cleanup(staging);
            return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                                 staging.string() + " to " + target.string()};
        }
        if (target != wanted) {
            spdlog::info("{} exists, saved as {}", wanted.filename().string(),
                         target.filename().string());
        }
        return target;
    }

private:
    static void cleanup(const fs::path& staging) noexcept {
        std::error_code ec;
        fs::remove(staging, ec);
        if (ec) {
            spdlog::debug("cleanup: failed to remove staging file {}: {}", staging.string(),
                          ec.message());
        }
    }

    fs::path root_;
    std::mutex mutex_;
};

} // namespace

std::unique_ptr<IFileSaver> makeDiskFileSaver(fs::path root) {
    return std::make_unique<DiskFileSaver>(std::move(root));
}

} // namespace gcrdl::downloader
