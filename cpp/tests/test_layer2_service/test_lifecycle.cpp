// tests/test_layer2_service/test_lifecycle.cpp
/**
 * @file test_lifecycle.cpp
 * @brief Dependency resolution of lifecycle modules and the state of the
 *        process-wide lifecycle owned by test_entrypoint.cpp.
 */
#include "ctxhub_service.hpp"
#include "utils/ctxhub_config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <algorithm>
#include <stdexcept>

using namespace ctxhub::utils;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace
{
ModuleDef module(const char *name, std::initializer_list<const char *> deps = {})
{
    ModuleDef m(name);
    for (const char *d : deps)
        m.add_dependency(d);
    return m;
}

size_t index_of(const std::vector<std::string> &order, const std::string &name)
{
    return static_cast<size_t>(std::find(order.begin(), order.end(), name) - order.begin());
}
} // namespace

TEST(LifecycleTest, AppIsInitializedByEntrypoint)
{
    EXPECT_TRUE(IsAppInitialized());
    EXPECT_TRUE(Logger::lifecycle_initialized());
    EXPECT_TRUE(FileLock::lifecycle_initialized());
    EXPECT_TRUE(JsonStore::lifecycle_initialized());
    EXPECT_TRUE(ctxhub::CtxhubConfig::lifecycle_initialized());
}

TEST(LifecycleTest, SecondGuardIsNotOwner)
{
    LifecycleGuard nested(MakeModDefList(Logger::GetLifecycleModule()));
    EXPECT_FALSE(nested.is_owner());
    EXPECT_TRUE(IsAppInitialized());
}

TEST(LifecycleTest, StartupOrderRespectsDependencies)
{
    const auto order = LifecycleManager::resolve_startup_order(
        MakeModDefList(module("Config", {"Store", "Logger"}), module("Store", {"Lock"}),
                       module("Lock", {"Logger"}), module("Logger")));
    ASSERT_EQ(order.size(), 4u);
    EXPECT_LT(index_of(order, "Logger"), index_of(order, "Lock"));
    EXPECT_LT(index_of(order, "Lock"), index_of(order, "Store"));
    EXPECT_LT(index_of(order, "Store"), index_of(order, "Config"));
}

TEST(LifecycleTest, IndependentModulesKeepNameOrder)
{
    const auto order = LifecycleManager::resolve_startup_order(
        MakeModDefList(module("b"), module("a"), module("c")));
    EXPECT_THAT(order, ElementsAre("a", "b", "c"));
}

TEST(LifecycleTest, CircularDependencyThrows)
{
    try
    {
        (void)LifecycleManager::resolve_startup_order(
            MakeModDefList(module("A", {"B"}), module("B", {"C"}), module("C", {"A"})));
        FAIL() << "expected a circular dependency error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("Circular dependency"));
    }
}

TEST(LifecycleTest, UndefinedDependencyThrows)
{
    EXPECT_THROW((void)LifecycleManager::resolve_startup_order(
                     MakeModDefList(module("A", {"logger"}), module("Logger"))),
                 std::runtime_error);
}

TEST(LifecycleTest, DuplicateModuleThrows)
{
    EXPECT_THROW((void)LifecycleManager::resolve_startup_order(
                     MakeModDefList(module("A"), module("A"))),
                 std::runtime_error);
}

TEST(LifecycleTest, EmptyModuleNameRejected)
{
    EXPECT_THROW(ModuleDef(""), std::invalid_argument);
}
