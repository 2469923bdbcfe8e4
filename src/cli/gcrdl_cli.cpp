/*
 * gcrdl/src/cli/gcrdl_cli.cpp
 *
 * Command-line front end. Components are built lazily after option parsing so that
 * --config and --data-dir take effect.
 */

#include <gcrdl/auth/credential_manager.h>
#include <gcrdl/cache/record_cache.h>
#include <gcrdl/catalog/catalog_service.h>
#include <gcrdl/cli/gcrdl_cli.h>
#include <gcrdl/config/config_helpers.h>
#include <gcrdl/downloader/download_orchestrator.hpp>
#include <gcrdl/http/http_client.h>
#include <gcrdl/platform/timer_service.h>
#include <gcrdl/ratelimit/rate_limiter.h>
#include <gcrdl/storage/key_value_store.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>

namespace gcrdl::cli {

namespace fs = std::filesystem;
using json = nlohmann::json;

struct GcrdlCLI::Runtime {
    std::unique_ptr<storage::IKeyValueStore> store;
    std::unique_ptr<ratelimit::RateLimiter> limiter;
    std::unique_ptr<http::IHttpClient> http;
    std::unique_ptr<auth::ICredentialProvider> provider;
    std::unique_ptr<platform::ITimerService> timers;
    std::unique_ptr<auth::CredentialManager> credentials;
    std::unique_ptr<cache::RecordCache> cache;
    std::unique_ptr<catalog::ICatalogApi> catalogApi;
    std::unique_ptr<catalog::CatalogService> catalogs;
    std::unique_ptr<downloader::IContentApi> content;
    std::unique_ptr<downloader::IFileSaver> saver;
    std::unique_ptr<downloader::DownloadOrchestrator> orchestrator;
};

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "off" || v == "none")
        return spdlog::level::off;
    return std::nullopt;
}

int fail(const Error& e) {
    std::cerr << "[FAIL] " << errorToString(e.code) << ": " << e.message << "\n";
    return 1;
}

json progressJson(const downloader::BatchProgress& p) {
    return downloader::toJson(p);
}

void printProgressLine(const downloader::BatchProgress& p) {
    std::cerr << fmt::format("\r[{}/{}] failed: {}  {}", p.completed + p.failed, p.total,
                             p.failed, p.currentFile)
              << std::flush;
}

} // namespace

GcrdlCLI::GcrdlCLI()
    : app_(std::make_unique<CLI::App>("Course resource downloader", "gcrdl")) {
    app_->require_subcommand(1);
    app_->add_option("--config", configPath_, "Config file (default: $GCRDL_CONFIG or XDG)");
    app_->add_option("--data-dir", dataDirOverride_, "Directory for persisted state");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");

    registerCatalogCommands();
    registerCacheCommands();
    registerDownloadCommands();
    registerAuthCommands();
}

GcrdlCLI::~GcrdlCLI() = default;

void GcrdlCLI::registerCatalogCommands() {
    auto* cmd = app_->add_subcommand("catalog", "Course catalogs");
    cmd->require_subcommand(1);

    auto* importCmd = cmd->add_subcommand("import", "Store a catalog JSON document in the cache");
    importCmd->add_option("file", importFile_, "Catalog JSON file")
        ->required()
        ->check(CLI::ExistingFile);
    handlers_.push_back({importCmd, [this] { return catalogImport(); }});

    auto* show = cmd->add_subcommand("show", "Print a catalog (cache first)");
    show->add_option("course", courseId_, "Course id")->required();
    handlers_.push_back({show, [this] { return catalogShow(); }});
}

void GcrdlCLI::registerCacheCommands() {
    auto* cmd = app_->add_subcommand("cache", "Catalog cache");
    cmd->require_subcommand(1);

    handlers_.push_back(
        {cmd->add_subcommand("stats", "Show cache usage"), [this] { return cacheStats(); }});

    auto* clear = cmd->add_subcommand("clear", "Remove one or all cached catalogs");
    clear->add_option("--id", clearId_, "Course id (default: everything)");
    handlers_.push_back({clear, [this] { return cacheClear(); }});
}

void GcrdlCLI::registerDownloadCommands() {
    auto* cmd = app_->add_subcommand("download", "Download course attachments");
    cmd->require_subcommand(0, 1);
    cmd->add_option("--course", courseId_, "Course id");
    auto* ids = cmd->add_option("--ids", downloadIds_, "Attachment ids")->delimiter(',');
    auto* all = cmd->add_flag("--all", downloadAll_, "Every attachment in the course");
    ids->excludes(all);
    cmd->add_option("--out", outDir_, "Output directory");

    handlers_.push_back(
        {cmd->add_subcommand("resume", "Resume the last interrupted batch"), [this] { return downloadResume(); }});
    handlers_.push_back(
        {cmd->add_subcommand("status", "Show the last batch"), [this] { return downloadStatus(); }});

    auto* offline = cmd->add_subcommand("offline", "Items parked after network failures");
    offline->require_subcommand(1);
    handlers_.push_back(
        {offline->add_subcommand("list", "Show queued items"), [this] { return offlineList(); }});
    handlers_.push_back({offline->add_subcommand("retry", "Download queued items again"),
                         [this] { return offlineRetry(); }});
    handlers_.push_back(
        {offline->add_subcommand("clear", "Empty the queue"), [this] { return offlineClear(); }});
    // Bare `download` submits; checked after its subcommands.
    handlers_.push_back({cmd, [this] { return downloadSubmit(); }});
}

void GcrdlCLI::registerAuthCommands() {
    auto* cmd = app_->add_subcommand("auth", "Credentials");
    cmd->require_subcommand(1);
    handlers_.push_back(
        {cmd->add_subcommand("token", "Print a valid token"), [this] { return authToken(); }});
    handlers_.push_back(
        {cmd->add_subcommand("refresh", "Force a token refresh"), [this] { return authRefresh(); }});
    handlers_.push_back(
        {cmd->add_subcommand("check", "Verify the token lasts a batch"), [this] { return authCheck(); }});
    handlers_.push_back(
        {cmd->add_subcommand("signout", "Revoke and forget the token"), [this] { return authSignOut(); }});
}

int GcrdlCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    settings_ = config::loadSettings(config::get_config_path(configPath_));
    if (!dataDirOverride_.empty()) {
        settings_.dataDir = config::expand_tilde(dataDirOverride_);
    }
    if (!outDir_.empty()) {
        settings_.outputDir = config::expand_tilde(outDir_);
    }
    applyLogLevel();

    for (const auto& [command, handler] : handlers_) {
        if (command->parsed()) {
            return handler();
        }
    }
    std::cerr << app_->help();
    return 1;
}

void GcrdlCLI::applyLogLevel() {
    if (const char* envLvl = std::getenv("GCRDL_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
    } else if (auto lvl = parseLevel(settings_.logLevel)) {
        spdlog::set_level(*lvl);
    }
}

GcrdlCLI::Runtime& GcrdlCLI::runtime() {
    if (runtime_) {
        return *runtime_;
    }
    std::error_code ec;
    fs::create_directories(settings_.dataDir, ec);
    if (ec) {
        spdlog::warn("Cannot create data dir {}: {}", settings_.dataDir.string(), ec.message());
    }
    spdlog::debug("Data dir: {}", settings_.dataDir.string());

    auto rt = std::make_unique<Runtime>();
    rt->store = storage::makeJsonFileKeyValueStore(settings_.dataDir / "state.json");
    rt->limiter = std::make_unique<ratelimit::RateLimiter>(settings_.rateLimit, rt->store.get());
    rt->http = http::makeCurlHttpClient();
    rt->provider = auth::makeCommandCredentialProvider(settings_.tokenCommand, *rt->http);
    rt->timers = platform::makeAsioTimerService();
    rt->credentials = std::make_unique<auth::CredentialManager>(
        settings_.auth, auth::CredentialManager::Dependencies{rt->provider.get(), rt->store.get(),
                                                              rt->timers.get(), {}});
    rt->cache = std::make_unique<cache::RecordCache>(*rt->store, settings_.cache);
    if (settings_.catalogSource == "directory") {
        rt->catalogApi = catalog::makeJsonDirectoryCatalogApi(
            settings_.catalogDir.empty() ? settings_.dataDir / "catalogs" : settings_.catalogDir);
    } else {
        rt->catalogApi = catalog::makeClassroomCatalogApi(*rt->http, settings_.classroomUrl,
                                                          settings_.requestTimeout);
    }
    rt->catalogs = std::make_unique<catalog::CatalogService>(*rt->catalogApi, *rt->limiter,
                                                             *rt->credentials, *rt->cache);
    rt->content = downloader::makeDriveContentApi(
        *rt->http, "https://www.googleapis.com/drive/v3", settings_.requestTimeout);
    rt->saver = downloader::makeDiskFileSaver(settings_.outputDir);
    rt->orchestrator = std::make_unique<downloader::DownloadOrchestrator>(
        settings_.download,
        downloader::DownloadOrchestrator::Dependencies{rt->limiter.get(), rt->credentials.get(),
                                                       rt->content.get(), rt->saver.get(),
                                                       rt->store.get()});
    runtime_ = std::move(rt);
    return *runtime_;
}

int GcrdlCLI::catalogImport() {
    std::ifstream in(importFile_);
    auto doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return fail(Error{ErrorCode::InvalidData, "Not valid JSON: " + importFile_});
    }
    auto parsed = catalog::parseCatalog(doc);
    if (!parsed) {
        return fail(parsed.error());
    }
    if (auto r = runtime().catalogs->store(parsed.value()); !r) {
        return fail(r.error());
    }
    const auto& c = parsed.value();
    if (jsonOutput_) {
        std::cout << json{{"course_id", c.courseId}, {"course_name", c.courseName}}.dump(2)
                  << "\n";
    } else {
        std::cout << "Imported " << c.courseName << " (" << c.courseId << ")\n";
    }
    return 0;
}

int GcrdlCLI::catalogShow() {
    auto& rt = runtime();
    auto loaded = rt.catalogs->load(courseId_);
    if (!loaded) {
        return fail(loaded.error());
    }
    const auto& c = loaded.value();
    auto truncated = rt.cache->isTruncated(c.courseId);
    if (!truncated) {
        spdlog::warn("Cannot tell whether {} was truncated: {}", c.courseId,
                     truncated.error().message);
    }
    const bool partial = truncated && truncated.value();
    if (jsonOutput_) {
        json doc = c;
        doc["truncated"] = partial;
        std::cout << doc.dump(2) << "\n";
        return 0;
    }
    std::cout << c.courseName << " (" << c.courseId << ")\n";
    if (partial) {
        std::cout << "  (cached copy was truncated to fit the cache)\n";
    }
    auto section = [](const char* title, const std::vector<catalog::CatalogRecord>& records) {
        std::cout << "\n" << title << " (" << records.size() << ")\n";
        for (const auto& r : records) {
            std::cout << "  " << r.title << "\n";
            for (const auto& a : r.attachments) {
                std::cout << "    - " << catalog::attachmentTitle(a) << "  ["
                          << catalog::attachmentId(a) << "]"
                          << (catalog::isLinkType(a) ? " (link)" : "") << "\n";
            }
        }
    };
    section("Assignments", c.assignments);
    section("Materials", c.materials);
    section("Announcements", c.announcements);
    return 0;
}

int GcrdlCLI::cacheStats() {
    auto stats = runtime().cache->stats();
    if (!stats) {
        return fail(stats.error());
    }
    const auto& s = stats.value();
    if (jsonOutput_) {
        json entries = json::array();
        for (const auto& e : s.entries) {
            entries.push_back({{"collection_id", e.collectionId},
                               {"name", e.name},
                               {"size_bytes", e.sizeBytes},
                               {"access_count", e.accessCount},
                               {"last_access_time", toEpochMillis(e.lastAccessTime)},
                               {"created_at", toEpochMillis(e.createdAt)}});
        }
        std::cout << json{{"count", s.count},
                          {"total_size_bytes", s.totalSizeBytes},
                          {"max_entries", s.maxEntries},
                          {"max_bytes", s.maxBytes},
                          {"utilization_percent", s.utilizationPercent},
                          {"entries", std::move(entries)}}
                         .dump(2)
                  << "\n";
        return 0;
    }
    std::cout << fmt::format("{} of {} entries, {} of {} bytes ({:.1f}%)\n", s.count,
                             s.maxEntries, s.totalSizeBytes, s.maxBytes, s.utilizationPercent);
    for (const auto& e : s.entries) {
        std::cout << fmt::format("  {:<24} {:>10} bytes  used {}x  {}\n", e.collectionId,
                                 e.sizeBytes, e.accessCount, e.name);
    }
    return 0;
}

int GcrdlCLI::cacheClear() {
    auto& cache = *runtime().cache;
    auto r = clearId_.empty() ? cache.clearAll() : cache.clear(clearId_);
    if (!r) {
        return fail(r.error());
    }
    std::cout << (clearId_.empty() ? std::string("Cache cleared") : "Removed " + clearId_) << "\n";
    return 0;
}

int GcrdlCLI::downloadSubmit() {
    if (courseId_.empty()) {
        return fail(Error{ErrorCode::InvalidArgument, "--course is required"});
    }
    if (!downloadAll_ && downloadIds_.empty()) {
        return fail(Error{ErrorCode::InvalidArgument, "Pass --ids or --all"});
    }
    auto& rt = runtime();
    auto loaded = rt.catalogs->load(courseId_);
    if (!loaded) {
        return fail(loaded.error());
    }
    const auto ids = downloadAll_ ? catalog::allAttachmentIds(loaded.value()) : downloadIds_;

    rt.credentials->startProactiveRefresh();
    auto batch = rt.orchestrator->submit(loaded.value(), ids);
    if (!batch) {
        rt.credentials->stopProactiveRefresh();
        return fail(batch.error());
    }
    spdlog::info("Batch {} submitted", batch.value());
    return downloadStatus();
}

int GcrdlCLI::downloadResume() {
    auto& rt = runtime();
    rt.credentials->startProactiveRefresh();
    auto batch = rt.orchestrator->resume();
    if (!batch) {
        rt.credentials->stopProactiveRefresh();
        return fail(batch.error());
    }
    return downloadStatus();
}

int GcrdlCLI::downloadStatus() {
    auto& rt = runtime();
    auto& orch = *rt.orchestrator;

    downloader::BatchProgress p;
    if (orch.running()) {
        auto done = orch.waitForCompletion(
            std::chrono::milliseconds(300), std::chrono::minutes(30),
            jsonOutput_ ? std::function<void(const downloader::BatchProgress&)>{}
                        : std::function<void(const downloader::BatchProgress&)>(printProgressLine));
        rt.credentials->stopProactiveRefresh();
        if (!jsonOutput_) {
            std::cerr << "\n";
        }
        if (!done) {
            return fail(done.error());
        }
        p = done.value();
    } else {
        p = orch.progress();
    }

    if (jsonOutput_) {
        std::cout << progressJson(p).dump(2) << "\n";
    } else if (p.batchId.empty()) {
        std::cout << "No batch recorded\n";
        return 0;
    } else {
        std::string state = p.active        ? "running"
                            : p.interrupted ? "interrupted (run `gcrdl download resume`)"
                            : p.cancelled   ? "cancelled"
                                            : "finished";
        std::cout << fmt::format("Batch {}: {}\n  {} completed, {} failed, {} total\n  folder: {}\n",
                                 p.batchId, state, p.completed, p.failed, p.total,
                                 (settings_.outputDir / p.folder).string());
        for (const auto& job : orch.jobs()) {
            if (job.state == downloader::JobState::Failed) {
                std::cout << "  [FAIL] " << job.displayName << ": " << job.lastError << "\n";
            }
        }
    }
    return (p.failed > 0 || p.interrupted || p.cancelled) ? 1 : 0;
}

int GcrdlCLI::offlineList() {
    auto items = runtime().orchestrator->offlineQueue().items();
    if (!items) {
        return fail(items.error());
    }
    if (jsonOutput_) {
        json arr = json::array();
        for (const auto& item : items.value()) {
            arr.push_back(downloader::toJson(item));
        }
        std::cout << arr.dump(2) << "\n";
        return 0;
    }
    if (items.value().empty()) {
        std::cout << "Offline queue is empty\n";
        return 0;
    }
    for (const auto& item : items.value()) {
        std::cout << fmt::format("  {:<32} {:<20} retries {}  {}\n", item.displayName, item.folder,
                                 item.retryCount, item.reason);
    }
    return 0;
}

int GcrdlCLI::offlineRetry() {
    auto& rt = runtime();
    rt.credentials->startProactiveRefresh();
    auto batch = rt.orchestrator->retryOffline();
    if (!batch) {
        rt.credentials->stopProactiveRefresh();
        return fail(batch.error());
    }
    return downloadStatus();
}

int GcrdlCLI::offlineClear() {
    if (auto r = runtime().orchestrator->offlineQueue().clear(); !r) {
        return fail(r.error());
    }
    std::cout << "Offline queue cleared\n";
    return 0;
}

int GcrdlCLI::authToken() {
    auto token = runtime().credentials->getToken(true);
    if (!token) {
        return fail(token.error());
    }
    std::cout << token.value() << "\n";
    return 0;
}

int GcrdlCLI::authRefresh() {
    auto token = runtime().credentials->refresh(true);
    if (!token) {
        return fail(token.error());
    }
    std::cout << "Token refreshed\n";
    return 0;
}

int GcrdlCLI::authCheck() {
    auto& creds = *runtime().credentials;
    if (auto r = creds.ensureValidForBatch(); !r) {
        return fail(r.error());
    }
    auto issued = creds.issuedAt();
    if (jsonOutput_) {
        std::cout << json{{"valid", true},
                          {"issued_at", issued ? toEpochMillis(*issued) : 0}}
                         .dump(2)
                  << "\n";
    } else {
        std::cout << "Token valid for a batch\n";
    }
    return 0;
}

int GcrdlCLI::authSignOut() {
    if (auto r = runtime().credentials->signOut(); !r) {
        return fail(r.error());
    }
    std::cout << "Signed out\n";
    return 0;
}

} // namespace gcrdl::cli
