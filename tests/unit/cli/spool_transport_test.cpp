#include <gtest/gtest.h>
#include <vigil/cli/spool_transport.h>

#include "../../common/test_helpers.h"

#include <boost/asio/io_context.hpp>

#include <filesystem>

using namespace vigil;
using namespace vigil::engine;
using vigil::cli::SpoolTransport;
using vigil::config::GroupType;
using vigil::config::SourceRegistry;
using vigil::core::UserProfileGroup;
using vigil::tests::dynamicSource;
using vigil::tests::makeGroup;

namespace {

class SpoolTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        spool_ = tests::make_temp_dir("vigil_spool_");
        auto registry = SourceRegistry::create(
            {makeGroup("g", GroupType::Collapsible,
                       {dynamicSource("good"), dynamicSource("failed"), dynamicSource("broken"),
                        dynamicSource("absent")})});
        ASSERT_TRUE(registry) << registry.error().message;

        SafetyHub::Dependencies hubDeps;
        hubDeps.registry = std::make_shared<const SourceRegistry>(std::move(registry).value());
        hubDeps.telemetry = &telemetry_;
        hub_ = std::make_unique<SafetyHub>(SafetyHub::Config{}, std::move(hubDeps));

        transport_ = std::make_unique<SpoolTransport>(spool_);
        RefreshInbox::Dependencies deps;
        deps.hub = hub_.get();
        deps.transport = transport_.get();
        deps.executor = io_.get_executor();
        deps.onSessionFinished = [this](const std::string&, bool timedOut) {
            timedOut_ = timedOut;
        };
        inbox_ = std::make_unique<RefreshInbox>(RefreshInbox::Config{std::chrono::milliseconds(20)},
                                                std::move(deps));
        transport_->setInbox(inbox_.get());
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(spool_, ec);
    }

    std::filesystem::path spool_;
    boost::asio::io_context io_;
    tests::RecordingTelemetrySink telemetry_;
    std::unique_ptr<SafetyHub> hub_;
    std::unique_ptr<SpoolTransport> transport_;
    std::unique_ptr<RefreshInbox> inbox_;
    std::optional<bool> timedOut_;
};

} // namespace

TEST_F(SpoolTransportTest, ReportPathNamesSourceAndUser) {
    EXPECT_EQ(transport_->reportPath({"good", 10}), spool_ / "good.10.json");
}

TEST_F(SpoolTransportTest, ReadsReportsAndFailuresFromSpool) {
    tests::write_file(spool_ / "good.0.json",
                      R"({"status": {"title": "Good", "summary": "All fine",
                                     "severity": "INFORMATION"}})");
    tests::write_file(spool_ / "failed.0.json", R"({"error": true})");
    tests::write_file(spool_ / "broken.0.json", "{ nope");

    inbox_->requestRefresh(RefreshReason::Other, UserProfileGroup(0));
    io_.run();

    ASSERT_TRUE(timedOut_.has_value());
    EXPECT_TRUE(*timedOut_);

    auto guard = hub_->lock().acquire();
    const auto& store = hub_->store();
    auto good = store.get(guard, {"good", 0});
    ASSERT_TRUE(good.has_value());
    EXPECT_EQ(good->status->summary, "All fine");
    EXPECT_TRUE(store.hasError(guard, {"failed", 0}));
    EXPECT_TRUE(store.hasError(guard, {"broken", 0}));
    EXPECT_TRUE(store.hasError(guard, {"absent", 0}));
}

TEST_F(SpoolTransportTest, CompleteSpoolFinishesWithoutTimeout) {
    for (const char* id : {"good", "failed", "broken", "absent"}) {
        tests::write_file(spool_ / (std::string(id) + ".0.json"),
                          R"({"status": {"title": "T", "severity": 200}})");
    }
    inbox_->requestRefresh(RefreshReason::RescanButton, UserProfileGroup(0));
    io_.run();

    ASSERT_TRUE(timedOut_.has_value());
    EXPECT_FALSE(*timedOut_);
    auto guard = hub_->lock().acquire();
    EXPECT_EQ(hub_->store().size(guard), 4u);
}
