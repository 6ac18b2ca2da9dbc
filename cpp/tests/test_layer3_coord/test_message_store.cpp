// tests/test_layer3_coord/test_message_store.cpp
/**
 * @file test_message_store.cpp
 * @brief Message JSON mapping, inbox ordering, FileMessageStore and retention.
 */
#include "message_store.hpp"
#include "ctxhub_service.hpp"
#include "shared_test_helpers.h"
#include "gtest/gtest.h"

#include <algorithm>
#include <thread>
#include <vector>

using namespace ctxhub::coord;
using namespace ctxhub::tests::helper;
using nlohmann::json;

namespace
{
Message draft(std::string from, std::string to, Priority p = Priority::Normal,
              std::string created_at = {})
{
    Message m;
    m.from = std::move(from);
    m.to = std::move(to);
    m.type = "info";
    m.subject = "subject";
    m.content = "content";
    m.priority = p;
    m.created_at = std::move(created_at);
    return m;
}
} // namespace

TEST(MessageTest, PriorityNames)
{
    EXPECT_STREQ(to_string(Priority::Urgent), "urgent");
    EXPECT_STREQ(to_string(Priority::Low), "low");
    EXPECT_EQ(parse_priority("high"), Priority::High);
    EXPECT_FALSE(parse_priority("critical").has_value());
    EXPECT_FALSE(parse_priority("").has_value());
}

TEST(MessageTest, JsonMappingKeepsEveryField)
{
    Message m = draft("dev", "dash", Priority::High, "2026-01-02T03:04:05.000000");
    m.id = 7;
    m.read_at = "2026-01-02T04:00:00.000000";

    const json j = m.to_json();
    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["priority"], "high");
    EXPECT_EQ(j["read_at"], "2026-01-02T04:00:00.000000");

    const auto back = Message::from_json(j);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->id, 7u);
    EXPECT_EQ(back->from, "dev");
    EXPECT_EQ(back->to, "dash");
    EXPECT_EQ(back->priority, Priority::High);
    EXPECT_TRUE(back->is_read());

    Message unread = draft("dev", "dash");
    unread.id = 1;
    EXPECT_TRUE(unread.to_json()["read_at"].is_null());
}

TEST(MessageTest, DecodingToleratesOddEntries)
{
    EXPECT_FALSE(Message::from_json(json::array()).has_value());
    EXPECT_FALSE(Message::from_json(json{{"from", "dev"}}).has_value());
    EXPECT_FALSE(Message::from_json(json{{"id", "3"}}).has_value());

    const auto m = Message::from_json(json{{"id", 3u}, {"priority", "shouting"}, {"read_at", 5}});
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->priority, Priority::Normal);
    EXPECT_FALSE(m->is_read());
}

TEST(MessageTest, InboxOrderIsPriorityThenAgeThenId)
{
    std::vector<Message> v;
    auto add = [&](uint64_t id, Priority p, const char *at)
    {
        Message m = draft("a", "b", p, at);
        m.id = id;
        v.push_back(m);
    };
    add(1, Priority::Low, "2026-01-01T00:00:00.000000");
    add(2, Priority::Normal, "2026-01-01T00:00:05.000000");
    add(3, Priority::Urgent, "2026-01-01T00:00:09.000000");
    add(4, Priority::Normal, "2026-01-01T00:00:01.000000");
    add(5, Priority::High, "2026-01-01T00:00:02.000000");
    add(6, Priority::Normal, "2026-01-01T00:00:01.000000");

    sort_for_inbox(v);
    std::vector<uint64_t> ids;
    for (const auto &m : v)
        ids.push_back(m.id);
    EXPECT_EQ(ids, (std::vector<uint64_t>{3, 5, 4, 6, 2, 1}));
}

TEST(RetentionTest, ReadMessagesGoFirstThenOldestUnread)
{
    json log = json::array();
    for (uint64_t id = 1; id <= 6; ++id)
    {
        Message m = draft("a", "b");
        m.id = id;
        if (id == 4 || id == 5)
            m.read_at = "2026-01-01T00:00:00.000000";
        log.push_back(m.to_json());
    }

    EXPECT_EQ(apply_retention(log, 10), 0u);
    EXPECT_EQ(apply_retention(log, 0), 0u);
    EXPECT_EQ(log.size(), 6u);

    EXPECT_EQ(apply_retention(log, 3), 3u);
    ASSERT_EQ(log.size(), 3u);
    // 4 and 5 (read) went first, then 1 (oldest unread); survivors keep log order.
    EXPECT_EQ(log[0]["id"], 2);
    EXPECT_EQ(log[1]["id"], 3);
    EXPECT_EQ(log[2]["id"], 6);
}

class FileMessageStoreTest : public ::testing::Test
{
  protected:
    TempDir dir_{"msgstore"};
    fs::path log_path() const { return dir_ / "data" / ".ctxhub_messages.json"; }
};

TEST_F(FileMessageStoreTest, AppendAssignsIncreasingIdsAndTimestamps)
{
    FileMessageStore store(log_path());
    std::error_code ec;
    auto a = store.append(draft("dev", "dash"), &ec);
    ASSERT_TRUE(a.has_value()) << ec.message();
    auto b = store.append(draft("dash", "dev"), &ec);
    ASSERT_TRUE(b.has_value()) << ec.message();

    EXPECT_EQ(a->id, 1u);
    EXPECT_EQ(b->id, 2u);
    EXPECT_FALSE(a->created_at.empty());
    EXPECT_FALSE(a->is_read());

    const auto all = store.all(&ec);
    EXPECT_FALSE(ec);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].from, "dev");
    EXPECT_EQ(all[1].from, "dash");
}

TEST_F(FileMessageStoreTest, InboxIncludesBroadcastsAndFiltersRead)
{
    FileMessageStore store(log_path());
    ASSERT_TRUE(store.append(draft("oracle", "dev", Priority::Low)).has_value());
    ASSERT_TRUE(store.append(draft("oracle", "all", Priority::Urgent)).has_value());
    ASSERT_TRUE(store.append(draft("dev", "dash")).has_value());
    ASSERT_TRUE(store.append(draft("dash", "dev", Priority::High)).has_value());

    auto inbox = store.inbox("dev", true);
    ASSERT_EQ(inbox.size(), 3u);
    EXPECT_EQ(inbox[0].to, "all");
    EXPECT_EQ(inbox[1].priority, Priority::High);
    EXPECT_EQ(inbox[2].priority, Priority::Low);

    ASSERT_TRUE(store.mark_read(inbox[1].id));
    EXPECT_EQ(store.inbox("dev", true).size(), 2u);
    EXPECT_EQ(store.inbox("dev", false).size(), 3u);
    EXPECT_EQ(store.inbox("dash", true).size(), 2u);
}

TEST_F(FileMessageStoreTest, MarkReadIsIdempotent)
{
    FileMessageStore store(log_path());
    auto m = store.append(draft("dev", "dash"));
    ASSERT_TRUE(m.has_value());

    std::error_code ec;
    EXPECT_TRUE(store.mark_read(m->id, &ec));
    const auto first = store.all();
    ASSERT_TRUE(first[0].read_at.has_value());

    EXPECT_FALSE(store.mark_read(m->id, &ec));
    EXPECT_FALSE(ec);
    EXPECT_EQ(store.all()[0].read_at, first[0].read_at);

    EXPECT_FALSE(store.mark_read(999, &ec));
    EXPECT_FALSE(ec);
}

TEST_F(FileMessageStoreTest, RetentionBoundHoldsAfterAppend)
{
    FileMessageStore store(log_path(), 5);
    for (int i = 0; i < 8; ++i)
        ASSERT_TRUE(store.append(draft("dev", "dash")).has_value());

    const auto all = store.all();
    ASSERT_EQ(all.size(), 5u);
    EXPECT_EQ(all.front().id, 4u);
    EXPECT_EQ(all.back().id, 8u);
}

TEST_F(FileMessageStoreTest, MissingLogReadsAsEmpty)
{
    FileMessageStore store(log_path());
    std::error_code ec;
    EXPECT_TRUE(store.all(&ec).empty());
    EXPECT_FALSE(ec);
    EXPECT_TRUE(store.inbox("dev", true).empty());
}

TEST_F(FileMessageStoreTest, CorruptLogIsReportedThenQuarantinedOnAppend)
{
    ASSERT_TRUE(write_file_contents(log_path(), "[{\"id\": 1, \"from\": "));
    FileMessageStore store(log_path());

    std::error_code ec;
    EXPECT_TRUE(store.all(&ec).empty());
    EXPECT_EQ(ec, std::make_error_code(std::errc::illegal_byte_sequence));

    auto m = store.append(draft("dev", "dash"), &ec);
    ASSERT_TRUE(m.has_value()) << ec.message();
    EXPECT_EQ(m->id, 2u);
    EXPECT_EQ(store.all().size(), 1u);

    size_t quarantined = 0;
    for (const auto &entry : fs::directory_iterator(log_path().parent_path()))
    {
        if (entry.path().filename().string().starts_with(".ctxhub_messages.json.corrupt-"))
            ++quarantined;
    }
    EXPECT_EQ(quarantined, 1u);
}

TEST_F(FileMessageStoreTest, IdsContinuePastTheQuarantinedLog)
{
    ASSERT_TRUE(write_file_contents(
        log_path(), R"([{"id": 7, "from": "dev", "to": "dash"}, {"id":41, "from": "dash", "to)"));
    {
        FileMessageStore store(log_path());
        std::error_code ec;
        auto first = store.append(draft("dev", "dash"), &ec);
        ASSERT_TRUE(first.has_value()) << ec.message();
        EXPECT_EQ(first->id, 42u);
        auto second = store.append(draft("dash", "dev"), &ec);
        ASSERT_TRUE(second.has_value()) << ec.message();
        EXPECT_EQ(second->id, 43u);
    }

    // A later process sees only the fresh log and still continues the sequence.
    FileMessageStore reopened(log_path());
    auto third = reopened.append(draft("dev", "crank"));
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->id, 44u);
}

TEST_F(FileMessageStoreTest, NonArrayLogIsQuarantinedOnAppend)
{
    ASSERT_TRUE(write_file_contents(log_path(), "{\"messages\": []}"));
    FileMessageStore store(log_path());
    std::error_code ec;
    EXPECT_TRUE(store.all(&ec).empty());
    EXPECT_EQ(ec, std::make_error_code(std::errc::illegal_byte_sequence));

    ASSERT_TRUE(store.append(draft("dev", "dash"), &ec).has_value()) << ec.message();
    EXPECT_EQ(store.all().size(), 1u);
}

TEST_F(FileMessageStoreTest, MalformedEntriesAreSkipped)
{
    ASSERT_TRUE(write_file_contents(
        log_path(), R"([{"id": 1, "from": "dev", "to": "dash"}, "junk", {"no_id": true}])"));
    FileMessageStore store(log_path());
    EXPECT_EQ(store.all().size(), 1u);

    auto m = store.append(draft("dash", "dev"));
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->id, 2u);
}

TEST_F(FileMessageStoreTest, ConcurrentAppendsKeepEveryMessage)
{
    FileMessageStore store(log_path(), 0);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 10;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [&store]
            {
                for (int i = 0; i < kPerThread; ++i)
                    EXPECT_TRUE(store.append(draft("dev", "dash")).has_value());
            });
    }
    for (auto &t : threads)
        t.join();

    const auto all = store.all();
    ASSERT_EQ(all.size(), static_cast<size_t>(kThreads * kPerThread));
    std::vector<uint64_t> ids;
    for (const auto &m : all)
        ids.push_back(m.id);
    std::sort(ids.begin(), ids.end());
    for (size_t i = 0; i < ids.size(); ++i)
        EXPECT_EQ(ids[i], i + 1);
}
