#include <gcrdl/cli/gcrdl_cli.h>

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        // GcrdlCLI::run() adjusts the level from config and flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        gcrdl::cli::GcrdlCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
