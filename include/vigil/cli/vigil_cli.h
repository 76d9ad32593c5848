#pragma once

#include <vigil/cli/command.h>
#include <vigil/config/engine_config.h>
#include <vigil/core/types.h>
#include <vigil/core/user_profile_group.h>
#include <vigil/engine/refresh_types.h>
#include <vigil/engine/safety_hub.h>
#include <vigil/persistence/dismissal_store.h>

#include <boost/asio/any_io_executor.hpp>
#include <CLI/CLI.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vigil::cli {

// Outcome of one refresh driven through the spool directory.
struct RefreshRun {
    std::optional<std::string> sessionId;
    std::size_t requested{0};
    bool timedOut{false};
    std::uint64_t rejected{0};
};

/**
 * Main CLI application class
 */
class VigilCLI {
public:
    explicit VigilCLI(boost::asio::any_io_executor executor);
    ~VigilCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);
    void setPendingCommand(ICommand* cmd);

    // Loads the engine config once; commands that only need settings stop here.
    Result<void> ensureConfigLoaded();

    // Loads the source registry, builds the hub and restores persisted dismissals.
    Result<void> ensureEngineInitialized();

    // Runs one refresh against the spool directory and waits for it to finish or time out.
    Result<RefreshRun> runRefresh(engine::RefreshReason reason,
                                  const core::UserProfileGroup& users);

    const config::EngineConfig& getConfig() const { return config_; }
    engine::SafetyHub* getHub() const { return hub_.get(); }
    persistence::DismissalStore* getDismissalStore() const { return dismissalStore_.get(); }
    boost::asio::any_io_executor getExecutor() const { return executor_; }

    bool getVerbose() const { return verbose_; }
    void setExitCode(int code) { exitCode_ = code; }

    // --user, --work-profile and --paused-profile shared by the commands that take users.
    struct UserOptions {
        core::UserId user{0};
        std::vector<core::UserId> workProfiles;
        std::vector<core::UserId> pausedProfiles;

        core::UserProfileGroup toGroup() const;
    };
    static void addUserOptions(CLI::App* cmd, UserOptions& options);

private:
    void applyLogLevel();
    void restoreDismissals();

    boost::asio::any_io_executor executor_;
    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    std::string configPath_;
    bool verbose_{false};
    int exitCode_{0};

    bool configLoaded_{false};
    config::EngineConfig config_;
    std::unique_ptr<engine::SafetyHub> hub_;
    std::unique_ptr<persistence::DismissalStore> dismissalStore_;
};

} // namespace vigil::cli
