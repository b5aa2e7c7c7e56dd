#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <mlget/cli/command_registry.h>
#include <mlget/cli/mlget_cli.h>
#include <mlget/config/config_helpers.h>
#include <mlget/config/downloader_config.h>
#include <mlget/version.hpp>

namespace mlget::cli {

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
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

MlgetCLI::MlgetCLI() {
    // Finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("mlget - resumable multi-file downloader", "mlget");
    app_->require_subcommand(1);
    app_->set_version_flag("--version", MLGET_VERSION_STRING);

    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
    app_->add_option("--config", configPath_,
                     "Config file (default: $XDG_CONFIG_HOME/mlget/config.toml)");
    app_->add_option("--log-file", logFile_, "Also write log output to this file");
}

MlgetCLI::~MlgetCLI() = default;

void MlgetCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void MlgetCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

void MlgetCLI::registerBuiltinCommands() {
    CommandRegistry::registerAllCommands(this);
}

Result<downloader::DownloaderConfig> MlgetCLI::loadDownloaderConfig() const {
    auto path = config::get_config_path(configPath_);
    if (!configPath_.empty() && !std::filesystem::exists(path)) {
        return Error{ErrorCode::InvalidArgument, "Config file not found"}.withPath(path);
    }
    auto loaded = config::load_downloader_config(path, config::default_downloader_config());
    if (!loaded)
        return loaded.error();
    return config::apply_environment(std::move(loaded).value());
}

Result<void> MlgetCLI::configureLogging() {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!logFile_.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile_));
        } catch (const spdlog::spdlog_ex& e) {
            return Error{ErrorCode::FilesystemError,
                         std::string("Cannot open log file: ") + e.what()}
                .withPath(logFile_);
        }
    }
    auto logger = std::make_shared<spdlog::logger>("mlget", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    // Precedence: env MLGET_LOG_LEVEL > --verbose > warn
    if (const char* envLvl = std::getenv("MLGET_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return Result<void>{};
        }
        spdlog::set_level(spdlog::level::warn);
        spdlog::warn("Ignoring unknown MLGET_LOG_LEVEL '{}'", envLvl);
        return Result<void>{};
    }
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
    return Result<void>{};
}

int MlgetCLI::run(int argc, char* argv[]) {
    try {
        registerBuiltinCommands();
        app_->parse(argc, argv);

        if (auto logging = configureLogging(); !logging) {
            std::cerr << "[FAIL] " << logging.error().describe() << "\n";
            return 1;
        }

        if (pendingCommand_) {
            auto result = pendingCommand_->execute();
            if (!result) {
                spdlog::error("{} failed: {}", pendingCommand_->getName(),
                              result.error().describe());
                return 1;
            }
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace mlget::cli
