#pragma once

#include <CLI/CLI.hpp>

#include <gcrdl/config/settings.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gcrdl::cli {

class GcrdlCLI {
public:
    GcrdlCLI();
    ~GcrdlCLI();

    int run(int argc, char* argv[]);

private:
    struct Runtime;

    void registerCatalogCommands();
    void registerCacheCommands();
    void registerDownloadCommands();
    void registerAuthCommands();

    void applyLogLevel();
    Runtime& runtime();

    int catalogImport();
    int catalogShow();
    int cacheStats();
    int cacheClear();
    int downloadSubmit();
    int downloadResume();
    int downloadStatus();
    int offlineList();
    int offlineRetry();
    int offlineClear();
    int authToken();
    int authRefresh();
    int authCheck();
    int authSignOut();

    std::unique_ptr<CLI::App> app_;
    std::string configPath_;
    std::string dataDirOverride_;
    bool verbose_{false};
    bool jsonOutput_{false};

    std::string importFile_;
    std::string courseId_;
    std::string clearId_;
    std::vector<std::string> downloadIds_;
    bool downloadAll_{false};
    std::string outDir_;

    config::Settings settings_;
    std::unique_ptr<Runtime> runtime_;
    std::vector<std::pair<CLI::App*, std::function<int()>>> handlers_;
};

} // namespace gcrdl::cli
