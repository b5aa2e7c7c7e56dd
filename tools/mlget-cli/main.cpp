#include <spdlog/spdlog.h>
#include <mlget/cli/mlget_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; MlgetCLI::run() adjusts based on flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        mlget::cli::MlgetCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    } catch (...) {
        spdlog::error("Unknown fatal error");
        return 1;
    }
}
