#include <vigil/cli/command_registry.h>
#include <vigil/cli/spool_transport.h>
#include <vigil/cli/vigil_cli.h>
#include <vigil/config/config_helpers.h>
#include <vigil/config/source_registry.h>
#include <vigil/engine/refresh_inbox.h>
#include <vigil/version.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>

namespace vigil::cli {

VigilCLI::VigilCLI(boost::asio::any_io_executor executor) : executor_(std::move(executor)) {
    // Finalized after parsing flags and loading the config
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Vigil safety source aggregation engine", "vigil");
    app_->set_version_flag("--version", VIGIL_VERSION_LONG_STRING);
    app_->require_subcommand(1);

    app_->add_option("--config", configPath_, "Path to config.toml (overrides VIGIL_CONFIG_PATH)");
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
}

VigilCLI::~VigilCLI() = default;

void VigilCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

void VigilCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

int VigilCLI::run(int argc, char* argv[]) {
    try {
        CommandRegistry::registerAllCommands(this);
        app_->parse(argc, argv);

        // The config level (or VIGIL_LOG_LEVEL) replaces this once a command loads it
        if (verbose_) {
            spdlog::set_level(spdlog::level::debug);
        }

        if (pendingCommand_) {
            std::promise<Result<void>> prom;
            auto fut = prom.get_future();
            boost::asio::co_spawn(
                executor_,
                [this, &prom]() -> boost::asio::awaitable<void> {
                    auto r = co_await pendingCommand_->executeAsync();
                    prom.set_value(std::move(r));
                    co_return;
                },
                boost::asio::detached);
            auto status = fut.wait_for(std::chrono::minutes(10));
            if (status != std::future_status::ready) {
                spdlog::error("Command timed out");
                std::cerr << "[FAIL] Command timed out\n";
                return 1;
            }
            auto result = fut.get();
            if (!result) {
                std::cerr << "[FAIL] " << result.error().message << "\n";
                return 1;
            }
        }

        return exitCode_;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        return 1;
    }
}

Result<void> VigilCLI::ensureConfigLoaded() {
    if (configLoaded_) {
        return {};
    }

    auto path = config::get_config_path(configPath_);
    auto loaded = config::EngineConfig::load(path);
    if (!loaded) {
        return Error{loaded.error().code,
                     fmt::format("Failed to load {}: {}", path.string(), loaded.error().message)};
    }
    config_ = std::move(loaded).value();
    if (auto env = config_.applyEnvironmentOverrides(); !env) {
        return env.error();
    }

    applyLogLevel();
    configLoaded_ = true;
    spdlog::debug("[VigilCLI] Loaded config from {}", path.string());
    return {};
}

void VigilCLI::applyLogLevel() {
    // --verbose only yields to an explicit environment level
    const char* envLvl = std::getenv("VIGIL_LOG_LEVEL");
    if (verbose_ && !(envLvl && *envLvl)) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    spdlog::set_level(spdlog::level::from_str(config_.logLevel));
}

Result<void> VigilCLI::ensureEngineInitialized() {
    if (hub_) {
        return {};
    }
    if (auto loaded = ensureConfigLoaded(); !loaded) {
        return loaded;
    }

    auto registry = config::SourceRegistry::loadFromFile(config_.sourcesConfigPath);
    if (!registry) {
        return Error{registry.error().code,
                     fmt::format("Failed to load sources from {}: {}",
                                 config_.sourcesConfigPath.string(), registry.error().message)};
    }

    engine::SafetyHub::Config hubConfig;
    hubConfig.untrackedSourceIds = config_.untrackedSources;
    hubConfig.telemetryEnabled = config_.allowTelemetry;

    engine::SafetyHub::Dependencies deps;
    deps.registry = std::make_shared<const config::SourceRegistry>(std::move(registry).value());

    hub_ = std::make_unique<engine::SafetyHub>(std::move(hubConfig), std::move(deps));
    dismissalStore_ = std::make_unique<persistence::DismissalStore>(config_.dismissalsPath);
    restoreDismissals();
    return {};
}

void VigilCLI::restoreDismissals() {
    auto records = dismissalStore_->loadRecords();
    if (!records) {
        // Unreadable history only costs re-showing dismissed issues
        spdlog::warn("[VigilCLI] Ignoring dismissals in {}: {}",
                     dismissalStore_->path().string(), records.error().message);
        return;
    }

    auto guard = hub_->lock().acquire();
    auto imported = hub_->importDismissals(guard, std::move(records).value());
    if (!imported) {
        spdlog::warn("[VigilCLI] Failed to restore dismissals: {}", imported.error().message);
        return;
    }
    hub_->markDismissalsPersisted(guard);
}

Result<RefreshRun> VigilCLI::runRefresh(engine::RefreshReason reason,
                                        const core::UserProfileGroup& users) {
    if (auto init = ensureEngineInitialized(); !init) {
        return init.error();
    }

    // Private context: run() returns once no reply is queued and no timeout is armed.
    boost::asio::io_context io;
    SpoolTransport transport(config_.spoolDir);
    RefreshRun run;

    engine::RefreshInbox::Dependencies deps;
    deps.hub = hub_.get();
    deps.transport = &transport;
    deps.executor = io.get_executor();
    deps.dismissalStore = dismissalStore_.get();
    deps.onRefreshStarted = [&run](const engine::RefreshPlan& plan) {
        run.sessionId = plan.sessionId;
        run.requested = plan.sources.size();
    };
    deps.onSessionFinished = [&run](const std::string&, bool timedOut) {
        run.timedOut = timedOut;
    };

    engine::RefreshInbox inbox(engine::RefreshInbox::Config{config_.refreshTimeout},
                               std::move(deps));
    transport.setInbox(&inbox);

    inbox.requestRefresh(reason, users);
    io.run();

    run.rejected = inbox.rejectedReports();
    return run;
}

core::UserProfileGroup VigilCLI::UserOptions::toGroup() const {
    std::vector<core::ManagedProfile> managed;
    for (auto id : workProfiles) {
        managed.push_back(core::ManagedProfile{id, true});
    }
    for (auto id : pausedProfiles) {
        managed.push_back(core::ManagedProfile{id, false});
    }
    return core::UserProfileGroup(user, std::move(managed));
}

void VigilCLI::addUserOptions(CLI::App* cmd, UserOptions& options) {
    cmd->add_option("--user", options.user, "Profile parent user id")->default_val(0);
    cmd->add_option("--work-profile", options.workProfiles, "Running managed profile user id");
    cmd->add_option("--paused-profile", options.pausedProfiles,
                    "Managed profile user id in quiet mode");
}

} // namespace vigil::cli
