/*
 * gcrdl/src/downloader/filename_utils.cpp
 *
 * File naming: sanitizing titles, picking extensions from MIME types and Workspace export
 * targets, and keeping names unique within a batch.
 */

#include <gcrdl/downloader/downloader.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace gcrdl::downloader {

namespace {

constexpr std::string_view kWorkspacePrefix = "application/vnd.google-apps.";

struct MimeExtension {
    std::string_view mime;
    std::string_view ext;
};

constexpr std::array<MimeExtension, 20> kMimeExtensions{{
    {"application/pdf", "pdf"},
    {"application/msword", "doc"},
    {"application/vnd.openxmlformats-officedocument.wordprocessingml.document", "docx"},
    {"application/vnd.ms-excel", "xls"},
    {"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", "xlsx"},
    {"application/vnd.ms-powerpoint", "ppt"},
    {"application/vnd.openxmlformats-officedocument.presentationml.presentation", "pptx"},
    {"application/zip", "zip"},
    {"application/json", "json"},
    {"text/plain", "txt"},
    {"text/csv", "csv"},
    {"text/html", "html"},
    {"image/png", "png"},
    {"image/jpeg", "jpg"},
    {"image/gif", "gif"},
    {"image/svg+xml", "svg"},
    {"image/webp", "webp"},
    {"video/mp4", "mp4"},
    {"audio/mpeg", "mp3"},
    {"audio/wav", "wav"},
}};

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Split "name.ext" at the last dot; a leading dot is not an extension separator.
std::pair<std::string, std::string> splitExtension(std::string_view name) {
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
        return {std::string(name), std::string{}};
    }
    return {std::string(name.substr(0, dot)), std::string(name.substr(dot))};
}

// ".pdf", ".docx", ".mp3"; not ". Intro" or ".2".
bool looksLikeExtension(std::string_view ext) {
    if (ext.size() < 2 || ext.size() > 6 || ext.front() != '.') {
        return false;
    }
    const auto body = ext.substr(1);
    return std::all_of(body.begin(), body.end(),
                       [](unsigned char c) { return std::isalnum(c) != 0; }) &&
           std::any_of(body.begin(), body.end(),
                       [](unsigned char c) { return std::isalpha(c) != 0; });
}

// Trim the stem so stem + ext fits in maxLength.
std::string fitFilename(std::string stem, const std::string& ext, std::size_t maxLength) {
    if (ext.size() >= maxLength) {
        stem.resize(std::min(stem.size(), maxLength));
        return stem.empty() ? std::string("file") : stem;
    }
    if (stem.size() + ext.size() > maxLength) {
        stem.resize(maxLength - ext.size());
        while (!stem.empty() && (stem.back() == ' ' || stem.back() == '.')) {
            stem.pop_back();
        }
    }
    if (stem.empty()) {
        stem = "file";
    }
    return stem + ext;
}

} // namespace

bool isWorkspaceType(std::string_view mimeType) {
    return mimeType.rfind(kWorkspacePrefix, 0) == 0;
}

std::optional<ExportFormat> exportFormatFor(std::string_view mimeType) {
    if (!isWorkspaceType(mimeType)) {
        return std::nullopt;
    }
    const auto kind = mimeType.substr(kWorkspacePrefix.size());
    if (kind == "document") {
        return ExportFormat{"application/pdf", "pdf"};
    }
    if (kind == "spreadsheet") {
        return ExportFormat{"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
                            "xlsx"};
    }
    if (kind == "presentation") {
        return ExportFormat{"application/pdf", "pdf"};
    }
    if (kind == "drawing") {
        return ExportFormat{"image/png", "png"};
    }
    // forms, sites, folders, shortcuts ...
    return ExportFormat{};
}

std::string sanitizeFilename(std::string_view name, std::size_t maxLength) {
    std::string out;
    out.reserve(name.size());
    bool lastSpace = false;
    for (unsigned char c : name) {
        if (std::isspace(c)) {
            if (!lastSpace && !out.empty()) {
                out.push_back(' ');
            }
            lastSpace = true;
            continue;
        }
        lastSpace = false;
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-' || c == ' ') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('_');
        }
    }
    while (!out.empty() && (out.back() == ' ' || out.back() == '.')) {
        out.pop_back();
    }
    while (!out.empty() && out.front() == '.') {
        out.erase(out.begin());
    }
    if (out.size() > maxLength) {
        auto [stem, ext] = splitExtension(out);
        if (ext.size() < maxLength) {
            stem.resize(maxLength - ext.size());
            out = stem + ext;
        } else {
            out.resize(maxLength);
        }
    }
    if (out.empty()) {
        out = "file";
    }
    return out;
}

std::string filenameFor(const catalog::DriveFile& file, std::size_t maxLength) {
    const std::string base =
        sanitizeFilename(file.title.empty() ? file.id : file.title, std::string::npos);
    auto [stem, ext] = splitExtension(base);
    if (!looksLikeExtension(ext)) {
        stem = base;
        ext.clear();
    }

    if (auto fmtFor = exportFormatFor(file.mimeType); fmtFor && !fmtFor->extension.empty()) {
        // The exported bytes are in the export format, whatever the title claims.
        if (lower(ext) != "." + fmtFor->extension) {
            ext = "." + fmtFor->extension;
        }
    } else if (ext.empty()) {
        for (const auto& m : kMimeExtensions) {
            if (m.mime == file.mimeType) {
                ext = "." + std::string(m.ext);
                break;
            }
        }
    }
    return fitFilename(std::move(stem), ext, maxLength);
}

std::string UniqueNameAllocator::allocate(std::string_view name) {
    std::string candidate(name);
    if (taken_.insert(candidate).second) {
        return candidate;
    }
    const auto [stem, ext] = splitExtension(name);
    for (int n = 1;; ++n) {
        candidate = fmt::format("{}({}){}", stem, n, ext);
        if (taken_.insert(candidate).second) {
            return candidate;
        }
    }
}

} // namespace gcrdl::downloader
