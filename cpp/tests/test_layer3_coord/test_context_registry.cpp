// tests/test_layer3_coord/test_context_registry.cpp
/**
 * @file test_context_registry.cpp
 * @brief ContextRegistry: built-in set, JSON parsing, rule table and path helpers.
 */
#include "context_registry.hpp"
#include "ctxhub_service.hpp"
#include "shared_test_helpers.h"
#include "gtest/gtest.h"

#include <stdexcept>

using namespace ctxhub::coord;
using namespace ctxhub::tests::helper;
using nlohmann::json;

TEST(ContextRegistryTest, DefaultsHaveFiveContextsAndOracleCoordinates)
{
    const auto reg = ContextRegistry::defaults();
    EXPECT_EQ(reg.ids(), (std::vector<std::string>{"oracle", "dev", "dash", "crank", "pocket"}));
    EXPECT_EQ(reg.coordinator(), "oracle");
    EXPECT_TRUE(reg.is_coordinator("oracle"));
    EXPECT_FALSE(reg.is_coordinator("dev"));
    EXPECT_FALSE(reg.contains("all"));

    ASSERT_NE(reg.find("dash"), nullptr);
    EXPECT_EQ(reg.find("dash")->prefix, "B");
    EXPECT_EQ(reg.find("dash")->file, "DASHBOARD_CONTEXT.md");
    EXPECT_EQ(reg.context_path(), "oracle/docs/context/");

    EXPECT_EQ(reg.ports(false).backend, 5001);
    EXPECT_EQ(reg.ports(false).frontend, 5173);
    EXPECT_EQ(reg.ports(true).backend, 5002);
    EXPECT_EQ(reg.ports(true).frontend, 5174);
}

TEST(ContextRegistryTest, DefaultRuleTable)
{
    const auto reg = ContextRegistry::defaults();
    EXPECT_TRUE(reg.rule_allows("dev", "dash", "new_feature_available"));
    EXPECT_TRUE(reg.rule_allows("dash", "dev", "backend_bug"));
    EXPECT_FALSE(reg.rule_allows("dash", "dev", "new_feature_available"));
    EXPECT_FALSE(reg.rule_allows("pocket", "dev", "sync_complete"));
    EXPECT_EQ(reg.allowed_types("pocket", "oracle"),
              (std::vector<std::string>{"sync_complete", "fallback_active"}));
    EXPECT_TRUE(reg.allowed_types("pocket", "dash").empty());
}

TEST(ContextRegistryTest, ContextFileAndWatchDirs)
{
    const auto reg = ContextRegistry::defaults();
    const fs::path root = "/srv/project";
    EXPECT_EQ(reg.context_file(root, "dev"), root / "oracle/docs/context/" / "DEV_CONTEXT.md");
    EXPECT_TRUE(reg.context_file(root, "nobody").empty());

    const auto dirs = reg.watch_dirs(root, "dash");
    ASSERT_EQ(dirs.size(), 2u);
    EXPECT_EQ(dirs[0], root / "app/frontend/");
    EXPECT_EQ(dirs[1], root / "app/api/");
    EXPECT_TRUE(reg.watch_dirs(root, "pocket").empty());
}

TEST(ContextRegistryTest, ParsesContextsRulesAndPorts)
{
    const json doc = json::parse(R"({
        "context_path": "docs/ctx/",
        "contexts": [
            {"id": "lead", "file": "LEAD.md", "prefix": "L", "is_coordinator": true},
            {"id": "api", "watch_dirs": ["server/"], "resume_prompt": "Start with the API."},
            {"id": "ui"}
        ],
        "handoff_rules": {
            "api": {"to": ["ui"], "types": ["endpoint_ready"]},
            "ui": [{"to": ["api"], "types": ["bug"]}, {"to": ["api"], "types": ["feature", "bug"]}],
            "lead": {"to": ["*"], "types": ["priority_change"]}
        },
        "ports": {"normal": {"backend": 8000}, "fallback": {"frontend": 9999}}
    })");
    const auto reg = ContextRegistry::from_json(doc);

    EXPECT_EQ(reg.ids(), (std::vector<std::string>{"lead", "api", "ui"}));
    EXPECT_EQ(reg.coordinator(), "lead");
    EXPECT_EQ(reg.context_path(), "docs/ctx/");

    const ContextInfo *api = reg.find("api");
    ASSERT_NE(api, nullptr);
    EXPECT_EQ(api->file, "API_CONTEXT.md");
    EXPECT_EQ(api->prefix, "A");
    ASSERT_TRUE(api->resume_prompt.has_value());
    EXPECT_EQ(*api->resume_prompt, "Start with the API.");
    EXPECT_EQ(reg.watch_dirs("/p", "api"), (std::vector<fs::path>{fs::path("/p") / "server/"}));

    EXPECT_TRUE(reg.rule_allows("api", "ui", "endpoint_ready"));
    EXPECT_EQ(reg.allowed_types("ui", "api"), (std::vector<std::string>{"bug", "feature"}));
    EXPECT_TRUE(reg.rule_allows("lead", "api", "priority_change"));
    EXPECT_TRUE(reg.rule_allows("lead", "ui", "priority_change"));
    EXPECT_FALSE(reg.rule_allows("lead", "lead", "priority_change"));

    EXPECT_EQ(reg.ports(false).backend, 8000);
    EXPECT_EQ(reg.ports(false).frontend, 5173);
    EXPECT_EQ(reg.ports(true).backend, 5002);
    EXPECT_EQ(reg.ports(true).frontend, 9999);
}

TEST(ContextRegistryTest, EmptyContextListFallsBackToDefaults)
{
    const auto reg = ContextRegistry::from_json(json{{"contexts", json::array()}});
    EXPECT_EQ(reg.ids().size(), 5u);
    EXPECT_EQ(reg.coordinator(), "oracle");
    EXPECT_TRUE(reg.rule_allows("dev", "dash", "api_updated"));
}

TEST(ContextRegistryTest, RegistryContextWithoutWatchDirsWatchesNothing)
{
    const auto reg = ContextRegistry::from_json(json::parse(R"({
        "contexts": [
            {"id": "oracle", "is_coordinator": true},
            {"id": "dev", "watch_dirs": []},
            {"id": "dash"}
        ]})"));
    EXPECT_TRUE(reg.watch_dirs("/p", "dev").empty());
    EXPECT_TRUE(reg.watch_dirs("/p", "dash").empty());
    EXPECT_TRUE(reg.watch_dirs("/p", "oracle").empty());

    // A context list left empty still yields the built-in set with its directories.
    const auto fallback = ContextRegistry::from_json(json{{"contexts", json::array()}});
    EXPECT_FALSE(fallback.watch_dirs("/p", "dev").empty());
}

TEST(ContextRegistryTest, BuiltinRulesAreRestrictedToKnownContexts)
{
    const auto reg = ContextRegistry::from_json(
        json{{"contexts", json::array({json{{"id", "dev"}}, json{{"id", "dash"}}})}});
    EXPECT_EQ(reg.coordinator(), "");
    EXPECT_TRUE(reg.rule_allows("dash", "dev", "custom_preset_request"));
    EXPECT_TRUE(reg.allowed_types("dev", "crank").empty());
    EXPECT_EQ(reg.rules().count("oracle"), 0u);
}

TEST(ContextRegistryTest, OracleBecomesCoordinatorWhenNoneIsFlagged)
{
    const auto reg = ContextRegistry::from_json(
        json{{"contexts", json::array({json{{"id", "oracle"}}, json{{"id", "dev"}}})}});
    EXPECT_EQ(reg.coordinator(), "oracle");
    EXPECT_TRUE(reg.find("oracle")->is_coordinator);
}

TEST(ContextRegistryTest, MalformedDocumentsThrow)
{
    EXPECT_THROW(ContextRegistry::from_json(json::array()), std::runtime_error);
    EXPECT_THROW(ContextRegistry::from_json(json{{"contexts", json{{"dev", 1}}}}),
                 std::runtime_error);
    EXPECT_THROW(ContextRegistry::from_json(json{{"contexts", json::array({json{{"file", "X"}}})}}),
                 std::runtime_error);
    EXPECT_THROW(ContextRegistry::from_json(
                     json{{"contexts", json::array({json{{"id", "a"}}, json{{"id", "a"}}})}}),
                 std::runtime_error);
    EXPECT_THROW(ContextRegistry::from_json(json{{"contexts", json::array({json{{"id", "all"}}})}}),
                 std::runtime_error);
    EXPECT_THROW(ContextRegistry::from_json(json{
                     {"contexts", json::array({json{{"id", "a"}, {"is_coordinator", true}},
                                               json{{"id", "b"}, {"is_coordinator", true}}})}}),
                 std::runtime_error);
}

TEST(ContextRegistryTest, RulesNamingUnknownContextsThrow)
{
    const char *contexts = R"("contexts": [{"id": "a"}, {"id": "b"}])";
    auto doc = [&](const char *rules)
    { return json::parse(fmt::format(R"({{{}, "handoff_rules": {}}})", contexts, rules)); };

    EXPECT_NO_THROW(ContextRegistry::from_json(doc(R"({"a": {"to": ["b"], "types": ["x"]}})")));
    EXPECT_THROW(ContextRegistry::from_json(doc(R"({"ghost": {"to": ["a"], "types": ["x"]}})")),
                 std::runtime_error);
    EXPECT_THROW(ContextRegistry::from_json(doc(R"({"a": {"to": ["ghost"], "types": ["x"]}})")),
                 std::runtime_error);
    EXPECT_THROW(ContextRegistry::from_json(doc(R"({"a": {"to": "b", "types": ["x"]}})")),
                 std::runtime_error);
    EXPECT_THROW(ContextRegistry::from_json(doc(R"({"a": {"types": ["x"]}})")),
                 std::runtime_error);
}

TEST(ContextRegistryTest, FileLoading)
{
    TempDir dir("registry");
    const auto missing = ContextRegistry::from_json_file(dir / "absent.json");
    EXPECT_EQ(missing.ids().size(), 5u);

    ASSERT_TRUE(write_file_contents(dir / "bad.json", "{\"contexts\": ["));
    EXPECT_THROW(ContextRegistry::from_json_file(dir / "bad.json"), std::runtime_error);

    ASSERT_TRUE(write_file_contents(dir / "good.json",
                                    R"({"contexts": [{"id": "solo", "is_coordinator": true}]})"));
    const auto reg = ContextRegistry::from_json_file(dir / "good.json");
    EXPECT_EQ(reg.ids(), (std::vector<std::string>{"solo"}));
    EXPECT_EQ(reg.coordinator(), "solo");
}

TEST(ContextRegistryTest, ToJsonReloadsToTheSameRegistry)
{
    const auto reg = ContextRegistry::defaults();
    const auto again = ContextRegistry::from_json(reg.to_json());
    EXPECT_EQ(again.ids(), reg.ids());
    EXPECT_EQ(again.coordinator(), reg.coordinator());
    EXPECT_EQ(again.rules(), reg.rules());
    EXPECT_EQ(again.ports(true).backend, reg.ports(true).backend);
}
