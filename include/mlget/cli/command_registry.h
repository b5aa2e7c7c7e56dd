#pragma once

#include <memory>
#include <mlget/cli/command.h>

namespace mlget::cli {

class MlgetCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(MlgetCLI* cli);

    static std::unique_ptr<ICommand> createDownloadFileCommand();
    static std::unique_ptr<ICommand> createPlanCommand();
    static std::unique_ptr<ICommand> createDownloadMetalinkCommand();
};

} // namespace mlget::cli
