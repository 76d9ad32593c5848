#pragma once

#include <vigil/core/types.h>

#include <boost/asio/awaitable.hpp>
#include <CLI/CLI.hpp>

#include <memory>
#include <string>

namespace vigil::cli {

class VigilCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "status", "refresh")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, VigilCLI* cli) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;

    // Default bridges to execute().
    virtual boost::asio::awaitable<Result<void>> executeAsync() { co_return execute(); }
};

} // namespace vigil::cli
