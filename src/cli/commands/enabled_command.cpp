#include <vigil/cli/command.h>
#include <vigil/cli/vigil_cli.h>

#include <iostream>

namespace vigil::cli {

class EnabledCommand : public ICommand {
public:
    std::string getName() const override { return "enabled"; }

    std::string getDescription() const override {
        return "Report whether the engine is enabled (exit status 0 when enabled)";
    }

    void registerCommand(CLI::App& app, VigilCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("enabled", getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (auto loaded = cli_->ensureConfigLoaded(); !loaded) {
            return loaded;
        }
        const bool enabled = cli_->getConfig().enabled;
        std::cout << (enabled ? "Vigil is enabled" : "Vigil is not enabled") << "\n";
        cli_->setExitCode(enabled ? 0 : 1);
        return {};
    }

private:
    VigilCLI* cli_{nullptr};
};

std::unique_ptr<ICommand> createEnabledCommand() {
    return std::make_unique<EnabledCommand>();
}

} // namespace vigil::cli
