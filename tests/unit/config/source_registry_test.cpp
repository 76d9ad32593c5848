#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <vigil/config/source_registry.h>

#include "../../common/test_helpers.h"

using namespace vigil;
using namespace vigil::config;
using vigil::tests::dynamicSource;
using vigil::tests::issueOnlySource;
using vigil::tests::makeGroup;
using vigil::tests::staticSource;

namespace {

nlohmann::json sampleConfig() {
    return nlohmann::json::parse(R"({
      "groups": [
        {"id": "device", "title": "Device", "summary": "Device settings", "type": "collapsible",
         "sources": [
           {"id": "lock", "type": "dynamic", "profile": "primary", "package_name": "p.lock",
            "title": "Screen lock", "summary": "Not set", "intent_action": "open.lock",
            "max_severity_level": "RECOMMENDATION", "refresh_on_page_open_allowed": true},
           {"id": "backup", "type": "dynamic", "profile": "all", "package_name": "p.backup",
            "title": "Backup", "title_for_work": "Work backup", "summary": "Off",
            "intent_action": "open.backup", "logging_allowed": false}
         ]},
        {"id": "extras", "type": "hidden",
         "sources": [{"id": "scanner", "type": "issue_only", "profile": "primary",
                      "package_name": "p.scanner", "max_severity_level": 400}]},
        {"id": "more", "title": "More", "type": "rigid", "stateless_icon": "privacy",
         "sources": [{"id": "privacy", "type": "static", "profile": "primary",
                      "title": "Privacy", "intent_action": "open.privacy"}]}
      ],
      "allow_telemetry": false
    })");
}

} // namespace

TEST(SourceRegistry, LoadsGroupsInOrder) {
    auto registry = SourceRegistry::fromJson(sampleConfig());
    ASSERT_TRUE(registry) << registry.error().message;
    const auto& r = registry.value();

    ASSERT_EQ(r.groups().size(), 3u);
    EXPECT_EQ(r.groups()[0].id, "device");
    EXPECT_EQ(r.groups()[1].type, GroupType::Hidden);
    EXPECT_EQ(r.groups()[2].statelessIconType, StatelessIconType::Privacy);
    EXPECT_EQ(r.sourceCount(), 4u);
    EXPECT_FALSE(r.allowsTelemetry());

    const auto* lock = r.find("lock");
    ASSERT_NE(lock, nullptr);
    EXPECT_EQ(lock->maxSeverityLevel, 300);
    EXPECT_TRUE(lock->refreshOnPageOpenAllowed);
    EXPECT_TRUE(lock->allowsSeverity(core::SeverityLevel::Recommendation));
    EXPECT_FALSE(lock->allowsSeverity(core::SeverityLevel::CriticalWarning));

    const auto* backup = r.find("backup");
    ASSERT_NE(backup, nullptr);
    EXPECT_TRUE(backup->supportsManagedProfiles());
    EXPECT_FALSE(backup->loggingAllowed);

    ASSERT_NE(r.find("scanner"), nullptr);
    EXPECT_EQ(r.find("missing"), nullptr);
}

TEST(SourceRegistry, UnknownGroupTypeDegradesToHidden) {
    auto j = sampleConfig();
    j["groups"][0]["type"] = "carousel";
    auto registry = SourceRegistry::fromJson(j);
    ASSERT_TRUE(registry);
    EXPECT_EQ(registry.value().groups()[0].type, GroupType::Hidden);
}

TEST(SourceRegistry, RejectsDuplicateSourceIds) {
    auto registry = SourceRegistry::create(
        {makeGroup("a", GroupType::Collapsible, {dynamicSource("x")}),
         makeGroup("b", GroupType::Collapsible, {dynamicSource("x")})});
    ASSERT_FALSE(registry);
    EXPECT_EQ(registry.error().code, ErrorCode::ValidationError);
}

TEST(SourceRegistry, EnforcesAttributeRulesPerType) {
    auto dyn = dynamicSource("dyn");
    dyn.packageName.clear();
    EXPECT_FALSE(dyn.validate());

    auto hiddenDyn = dynamicSource("hidden");
    hiddenDyn.initialDisplayState = InitialDisplayState::Hidden;
    hiddenDyn.title.clear();
    hiddenDyn.summary.clear();
    EXPECT_TRUE(hiddenDyn.validate());

    auto work = dynamicSource("work", ProfileScope::All);
    work.titleForWork.clear();
    EXPECT_FALSE(work.validate());

    auto primaryWithWorkTitle = dynamicSource("primary");
    primaryWithWorkTitle.titleForWork = "Work";
    EXPECT_FALSE(primaryWithWorkTitle.validate());

    auto issueOnly = issueOnlySource("io");
    EXPECT_TRUE(issueOnly.validate());
    issueOnly.title = "Not allowed";
    EXPECT_FALSE(issueOnly.validate());

    auto st = staticSource("st");
    EXPECT_TRUE(st.validate());
    st.maxSeverityLevel = 300;
    EXPECT_FALSE(st.validate());
}

TEST(SourceRegistry, RejectsStructuralProblems) {
    EXPECT_FALSE(SourceRegistry::fromJson(nlohmann::json::parse(R"({"groups": {}})")));
    EXPECT_FALSE(SourceRegistry::fromJson(
        nlohmann::json::parse(R"({"groups": [{"id": "empty", "title": "E", "sources": []}]})")));

    auto noTitle = sampleConfig();
    noTitle["groups"][0].erase("title");
    EXPECT_FALSE(SourceRegistry::fromJson(noTitle));

    auto wrongType = sampleConfig();
    wrongType["groups"][0]["sources"][0]["logging_allowed"] = "yes";
    auto result = SourceRegistry::fromJson(wrongType);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ValidationError);
}

TEST(SourceRegistry, LoadFromFileReportsMissingAndMalformed) {
    auto missing = SourceRegistry::loadFromFile("/nonexistent/sources.json");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);

    auto dir = vigil::tests::make_temp_dir("vigil_registry_");
    vigil::tests::write_file(dir / "bad.json", "{ not json");
    auto malformed = SourceRegistry::loadFromFile(dir / "bad.json");
    ASSERT_FALSE(malformed);
    EXPECT_EQ(malformed.error().code, ErrorCode::ValidationError);

    vigil::tests::write_file(dir / "good.json", sampleConfig().dump());
    EXPECT_TRUE(SourceRegistry::loadFromFile(dir / "good.json"));
    std::filesystem::remove_all(dir);
}
