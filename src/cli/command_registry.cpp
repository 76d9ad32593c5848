#include <vigil/cli/command_registry.h>
#include <vigil/cli/vigil_cli.h>

namespace vigil::cli {

void CommandRegistry::registerAllCommands(VigilCLI* cli) {
    cli->registerCommand(createEnabledCommand());
    cli->registerCommand(createRefreshCommand());
    cli->registerCommand(createClearDataCommand());
    cli->registerCommand(createStatusCommand());
}

} // namespace vigil::cli
