#pragma once

#include <vigil/cli/command.h>

#include <memory>

namespace vigil::cli {

class VigilCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(VigilCLI* cli);
};

std::unique_ptr<ICommand> createEnabledCommand();
std::unique_ptr<ICommand> createRefreshCommand();
std::unique_ptr<ICommand> createClearDataCommand();
std::unique_ptr<ICommand> createStatusCommand();

} // namespace vigil::cli
