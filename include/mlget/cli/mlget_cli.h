#pragma once

#include <memory>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <mlget/cli/command.h>
#include <mlget/downloader/downloader.hpp>

namespace mlget::cli {

/**
 * Main CLI application class
 */
class MlgetCLI {
public:
    MlgetCLI();
    ~MlgetCLI();

    /**
     * Run the CLI with given arguments; returns the process exit code
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing and logging setup
     */
    void setPendingCommand(ICommand* cmd);

    bool getVerbose() const { return verbose_; }

    /**
     * Downloader settings from defaults, the config file and the environment.
     * Command line flags are applied on top by each command.
     */
    Result<downloader::DownloaderConfig> loadDownloaderConfig() const;

private:
    void registerBuiltinCommands();
    Result<void> configureLogging();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    bool verbose_{false};
    std::string configPath_;
    std::string logFile_;
};

} // namespace mlget::cli
