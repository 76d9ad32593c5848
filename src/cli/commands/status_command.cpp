#include <vigil/cli/command.h>
#include <vigil/cli/vigil_cli.h>
#include <vigil/core/severity.h>
#include <vigil/engine/json_codec.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <type_traits>
#include <variant>

namespace vigil::cli {

namespace {

void printEntry(const engine::Entry& entry, const char* indent) {
    std::cout << indent << "[" << core::toString(entry.severity) << "] " << entry.title;
    if (entry.summary) {
        std::cout << " - " << *entry.summary;
    }
    if (!entry.enabled) {
        std::cout << " (disabled)";
    }
    std::cout << "\n";
}

void printView(const engine::AggregatedView& view) {
    std::cout << view.status.title << "\n" << view.status.summary << "\n";
    std::cout << "Overall: " << core::toString(view.status.severity) << "\n";

    if (!view.issues.empty()) {
        std::cout << "\nIssues:\n";
        for (const auto& issue : view.issues) {
            std::cout << "  [" << core::toString(issue.severity) << "] " << issue.title << " - "
                      << issue.summary << "\n";
            for (const auto& action : issue.actions) {
                std::cout << "      action: " << action.label << "\n";
            }
        }
    }

    if (!view.entriesOrGroups.empty()) {
        std::cout << "\nSettings:\n";
    }
    for (const auto& item : view.entriesOrGroups) {
        std::visit(
            [](const auto& value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, engine::Entry>) {
                    printEntry(value, "  ");
                } else {
                    std::cout << "  " << value.title;
                    if (value.summary) {
                        std::cout << " - " << *value.summary;
                    }
                    std::cout << "\n";
                    for (const auto& entry : value.entries) {
                        printEntry(entry, "    ");
                    }
                }
            },
            item);
    }

    for (const auto& group : view.staticEntryGroups) {
        std::cout << "\n" << group.title << ":\n";
        for (const auto& entry : group.entries) {
            std::cout << "  " << entry.title;
            if (entry.summary) {
                std::cout << " - " << *entry.summary;
            }
            std::cout << "\n";
        }
    }
}

} // namespace

class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Refresh all sources and show the aggregated safety status";
    }

    void registerCommand(CLI::App& app, VigilCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("status", getDescription());
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");
        cmd->add_flag("--no-refresh", noRefresh_, "Skip asking the sources for data");
        cmd->add_flag("--snapshot", snapshot_, "Also emit and print the telemetry snapshot");
        VigilCLI::addUserOptions(cmd, users_);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (auto init = cli_->ensureEngineInitialized(); !init) {
            return init;
        }

        const auto users = users_.toGroup();
        if (!noRefresh_) {
            auto run = cli_->runRefresh(engine::RefreshReason::PageOpen, users);
            if (!run) {
                return run.error();
            }
            if (run.value().timedOut) {
                spdlog::info("Some sources did not answer before the refresh timeout");
            }
        }

        auto* hub = cli_->getHub();
        engine::AggregatedView view;
        std::optional<engine::SafetySnapshot> snapshot;
        {
            auto guard = hub->lock().acquire();
            view = hub->view(guard, users);
            if (snapshot_) {
                snapshot = hub->pullSnapshot(guard, users);
            }
        }

        if (jsonOutput_) {
            nlohmann::json out;
            out["view"] = engine::toJson(view);
            if (snapshot) {
                out["snapshot"] = engine::toJson(*snapshot);
            }
            std::cout << out.dump(2) << std::endl;
            return {};
        }

        printView(view);
        if (snapshot_) {
            if (snapshot) {
                std::cout << "\nSnapshot: " << core::toString(snapshot->state.overallSeverity)
                          << ", " << snapshot->state.openIssueCount << " open, "
                          << snapshot->state.dismissedIssueCount << " dismissed\n";
            } else {
                std::cout << "\nSnapshot: telemetry disabled\n";
            }
        }
        return {};
    }

private:
    VigilCLI* cli_{nullptr};
    bool jsonOutput_{false};
    bool noRefresh_{false};
    bool snapshot_{false};
    VigilCLI::UserOptions users_;
};

std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace vigil::cli
