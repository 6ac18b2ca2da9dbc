// tests/test_layer3_coord/test_activity_tracker.cpp
/**
 * @file test_activity_tracker.cpp
 * @brief ActivityTracker with an injected clock: window, tie-break, buffers, summaries.
 */
#include "activity_tracker.hpp"
#include "ctxhub_service.hpp"
#include "gtest/gtest.h"

#include <memory>

using namespace ctxhub::coord;
using namespace std::chrono_literals;
using nlohmann::json;

namespace
{
struct ManualClock
{
    std::shared_ptr<std::chrono::system_clock::time_point> now =
        std::make_shared<std::chrono::system_clock::time_point>(
            std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50));

    ActivityTracker::Clock fn() const
    {
        auto p = now;
        return [p] { return *p; };
    }
    void advance(std::chrono::system_clock::duration d) { *now += d; }
};
} // namespace

class ActivityTrackerTest : public ::testing::Test
{
  protected:
    ContextRegistry registry_ = ContextRegistry::defaults();
    ManualClock clock_;
};

TEST_F(ActivityTrackerTest, NoActivityMeansNoActiveContext)
{
    ActivityTracker tracker(registry_, 300s, 100, clock_.fn());
    EXPECT_FALSE(tracker.active_context().has_value());
}

TEST_F(ActivityTrackerTest, UnknownContextIsRejected)
{
    ActivityTracker tracker(registry_, 300s, 100, clock_.fn());
    EXPECT_FALSE(tracker.record("intruder", "x.py", ActivityKind::Modified));
    EXPECT_TRUE(tracker.recent_events("intruder").empty());
    EXPECT_FALSE(tracker.active_context().has_value());
}

TEST_F(ActivityTrackerTest, MostRecentContextInsideWindowIsActive)
{
    ActivityTracker tracker(registry_, 300s, 100, clock_.fn());
    ASSERT_TRUE(tracker.record("dev", "app/core/a.py", ActivityKind::Modified));
    clock_.advance(10s);
    ASSERT_TRUE(tracker.record("dash", "app/api/b.ts", ActivityKind::Created));
    EXPECT_EQ(tracker.active_context(), "dash");

    clock_.advance(10s);
    ASSERT_TRUE(tracker.record("dev", "app/core/a.py", ActivityKind::Modified));
    EXPECT_EQ(tracker.active_context(), "dev");
}

TEST_F(ActivityTrackerTest, ActivityOlderThanWindowIsIgnored)
{
    ActivityTracker tracker(registry_, 300s, 100, clock_.fn());
    ASSERT_TRUE(tracker.record("dev", "a.py", ActivityKind::Modified));
    clock_.advance(299s);
    EXPECT_EQ(tracker.active_context(), "dev");
    clock_.advance(1s);
    EXPECT_FALSE(tracker.active_context().has_value());

    ASSERT_TRUE(tracker.record("crank", "content/c.md", ActivityKind::Modified));
    EXPECT_EQ(tracker.active_context(), "crank");
}

TEST_F(ActivityTrackerTest, EqualTimesResolveToSmallestId)
{
    ActivityTracker tracker(registry_, 300s, 100, clock_.fn());
    ASSERT_TRUE(tracker.record("pocket", "p", ActivityKind::Modified));
    ASSERT_TRUE(tracker.record("dev", "d", ActivityKind::Modified));
    ASSERT_TRUE(tracker.record("oracle", "o", ActivityKind::Modified));
    EXPECT_EQ(tracker.active_context(), "dev");
}

TEST_F(ActivityTrackerTest, BufferKeepsNewestEvents)
{
    ActivityTracker tracker(registry_, 300s, 3, clock_.fn());
    for (int i = 0; i < 5; ++i)
    {
        ASSERT_TRUE(tracker.record("dev", fmt::format("f{}.py", i), ActivityKind::Modified));
        clock_.advance(1s);
    }
    const auto events = tracker.recent_events("dev");
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].path, "f2.py");
    EXPECT_EQ(events[2].path, "f4.py");
    EXPECT_EQ(events[2].context, "dev");
}

TEST_F(ActivityTrackerTest, SummaryFollowsRegistryOrderAndCountsWindow)
{
    ActivityTracker tracker(registry_, 60s, 100, clock_.fn());
    ASSERT_TRUE(tracker.record("dash", "old.ts", ActivityKind::Modified));
    clock_.advance(50s);
    ASSERT_TRUE(tracker.record("dash", "new.ts", ActivityKind::Deleted));
    clock_.advance(20s);

    const auto summary = tracker.activity_summary();
    ASSERT_EQ(summary.size(), 5u);
    EXPECT_EQ(summary[0].first, "oracle");
    EXPECT_FALSE(summary[0].second.last_activity.has_value());
    EXPECT_EQ(summary[0].second.recent_files, 0u);

    EXPECT_EQ(summary[2].first, "dash");
    const ContextActivity &dash = summary[2].second;
    ASSERT_TRUE(dash.seconds_ago.has_value());
    EXPECT_EQ(*dash.seconds_ago, 20);
    EXPECT_EQ(dash.recent_files, 1u);
}

TEST_F(ActivityTrackerTest, SummaryJsonUsesNullsForIdleContexts)
{
    ActivityTracker tracker(registry_, 300s, 100, clock_.fn());
    ASSERT_TRUE(tracker.record("dev", "a.py", ActivityKind::Modified));
    clock_.advance(5s);

    const json j = tracker.summary_json();
    ASSERT_TRUE(j.contains("dev"));
    EXPECT_TRUE(j["dev"]["last_activity"].is_string());
    EXPECT_EQ(j["dev"]["seconds_ago"], 5);
    EXPECT_EQ(j["dev"]["recent_files"], 1);
    EXPECT_TRUE(j["pocket"]["last_activity"].is_null());
    EXPECT_TRUE(j["pocket"]["seconds_ago"].is_null());
    EXPECT_EQ(j["pocket"]["recent_files"], 0);
}

TEST(ActivityKindTest, Names)
{
    EXPECT_STREQ(to_string(ActivityKind::Created), "created");
    EXPECT_STREQ(to_string(ActivityKind::Modified), "modified");
    EXPECT_STREQ(to_string(ActivityKind::Deleted), "deleted");
}
