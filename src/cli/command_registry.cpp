#include <mlget/cli/command_registry.h>
#include <mlget/cli/mlget_cli.h>

namespace mlget::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createDownloadFileCommand();
std::unique_ptr<ICommand> createPlanCommand();
std::unique_ptr<ICommand> createDownloadMetalinkCommand();

void CommandRegistry::registerAllCommands(MlgetCLI* cli) {
    cli->registerCommand(CommandRegistry::createDownloadFileCommand());
    cli->registerCommand(CommandRegistry::createPlanCommand());
    cli->registerCommand(CommandRegistry::createDownloadMetalinkCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createDownloadFileCommand() {
    return ::mlget::cli::createDownloadFileCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createPlanCommand() {
    return ::mlget::cli::createPlanCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createDownloadMetalinkCommand() {
    return ::mlget::cli::createDownloadMetalinkCommand();
}

} // namespace mlget::cli
