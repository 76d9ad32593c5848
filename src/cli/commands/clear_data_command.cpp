#include <vigil/cli/command.h>
#include <vigil/cli/vigil_cli.h>

#include <iostream>

namespace vigil::cli {

class ClearDataCommand : public ICommand {
public:
    std::string getName() const override { return "clear-data"; }

    std::string getDescription() const override {
        return "Forget all reports, refresh state and dismissals";
    }

    void registerCommand(CLI::App& app, VigilCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("clear-data", getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (auto init = cli_->ensureEngineInitialized(); !init) {
            return init;
        }

        std::cout << "Clearing all data…\n";
        auto* hub = cli_->getHub();
        {
            auto guard = hub->lock().acquire();
            hub->clearAllData(guard);
            hub->markDismissalsPersisted(guard);
        }
        return cli_->getDismissalStore()->remove();
    }

private:
    VigilCLI* cli_{nullptr};
};

std::unique_ptr<ICommand> createClearDataCommand() {
    return std::make_unique<ClearDataCommand>();
}

} // namespace vigil::cli
