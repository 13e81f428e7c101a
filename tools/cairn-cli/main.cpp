#include <cairn/cli/cairn_cli.h>

#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char* argv[]) {
    try {
        // CairnCLI::run() adjusts the level from flags and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        cairn::cli::CairnCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
