#include <vigil/cli/command.h>
#include <vigil/cli/vigil_cli.h>
#include <vigil/engine/refresh_types.h>

#include <spdlog/spdlog.h>

#include <iostream>

namespace vigil::cli {

class RefreshCommand : public ICommand {
public:
    std::string getName() const override { return "refresh"; }

    std::string getDescription() const override {
        return "Ask every source for fresh data and wait for the answers";
    }

    void registerCommand(CLI::App& app, VigilCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("refresh", getDescription());
        cmd->add_option("--reason", reason_,
                        "PAGE_OPEN, BUTTON_CLICK, REBOOT, LOCALE_CHANGE, SAFETY_CENTER_ENABLED "
                        "or OTHER")
            ->default_val("OTHER");
        VigilCLI::addUserOptions(cmd, users_);
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto reason = engine::parseRefreshReason(reason_);
        if (!reason) {
            return Error{ErrorCode::InvalidArgument, "Unknown refresh reason '" + reason_ + "'"};
        }

        std::cout << "Starting refresh…\n";
        auto run = cli_->runRefresh(*reason, users_.toGroup());
        if (!run) {
            return run.error();
        }

        const auto& outcome = run.value();
        if (!outcome.sessionId) {
            std::cout << "Asked " << outcome.requested << " untracked source(s)\n";
        } else if (outcome.timedOut) {
            std::cout << "Refresh timed out; unanswered sources are marked as errored\n";
        } else {
            std::cout << "Refresh finished: " << outcome.requested << " source(s) asked\n";
        }
        if (outcome.rejected > 0) {
            spdlog::warn("{} report(s) were rejected", outcome.rejected);
        }
        return {};
    }

private:
    VigilCLI* cli_{nullptr};
    std::string reason_{"OTHER"};
    VigilCLI::UserOptions users_;
};

std::unique_ptr<ICommand> createRefreshCommand() {
    return std::make_unique<RefreshCommand>();
}

} // namespace vigil::cli
