// tests/test_layer3_coord/test_status_store.cpp
/**
 * @file test_status_store.cpp
 * @brief DaemonStatus JSON mapping, StatusStore and PidFile.
 */
#include "status_store.hpp"
#include "ctxhub_service.hpp"
#include "shared_test_helpers.h"
#include "gtest/gtest.h"

using namespace ctxhub::coord;
using namespace ctxhub::tests::helper;
using nlohmann::json;

TEST(DaemonStatusTest, StateNames)
{
    for (DaemonState s : {DaemonState::Stopped, DaemonState::Starting, DaemonState::Running,
                          DaemonState::Stopping, DaemonState::Error})
    {
        EXPECT_EQ(parse_daemon_state(to_string(s)), s);
    }
    EXPECT_FALSE(parse_daemon_state("paused").has_value());
}

TEST(DaemonStatusTest, DecodingFallsBackFieldByField)
{
    const auto st = DaemonStatus::from_json(
        json{{"state", "bogus"}, {"pid", "12"}, {"started_at", 5}, {"data", json::array()}});
    EXPECT_EQ(st.state, DaemonState::Error);
    EXPECT_EQ(st.pid, 0u);
    EXPECT_TRUE(st.started_at.empty());
    EXPECT_TRUE(st.data.is_object());

    const auto none = DaemonStatus::from_json(json::array());
    EXPECT_EQ(none.state, DaemonState::Stopped);
}

class StatusStoreTest : public ::testing::Test
{
  protected:
    TempDir dir_{"status"};
};

TEST_F(StatusStoreTest, WriteThenReadKeepsFields)
{
    StatusStore store(dir_ / "data" / ".ctxhub_status.json");
    DaemonStatus st;
    st.state = DaemonState::Running;
    st.pid = 4321;
    st.started_at = "2026-03-01T10:00:00.000000";
    st.data = json{{"active_context", "dev"}, {"health_score", 85}};

    std::error_code ec;
    ASSERT_TRUE(store.write(st, &ec)) << ec.message();

    const auto back = store.read(&ec);
    ASSERT_TRUE(back.has_value());
    EXPECT_FALSE(ec);
    EXPECT_EQ(back->state, DaemonState::Running);
    EXPECT_EQ(back->pid, 4321u);
    EXPECT_EQ(back->started_at, st.started_at);
    EXPECT_FALSE(back->last_update.empty());
    EXPECT_EQ(back->data["active_context"], "dev");
    EXPECT_EQ(back->data["health_score"], 85);
}

TEST_F(StatusStoreTest, LastWriterWins)
{
    StatusStore store(dir_ / ".ctxhub_status.json");
    DaemonStatus st;
    st.state = DaemonState::Starting;
    ASSERT_TRUE(store.write(st));
    st.state = DaemonState::Stopped;
    st.data = json::object();
    ASSERT_TRUE(store.write(st));

    const auto back = store.read();
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->state, DaemonState::Stopped);
    EXPECT_TRUE(back->data.empty());
}

TEST_F(StatusStoreTest, AbsentAndCorruptDocuments)
{
    StatusStore store(dir_ / ".ctxhub_status.json");
    std::error_code ec;
    EXPECT_FALSE(store.read(&ec).has_value());
    EXPECT_FALSE(ec);

    ASSERT_TRUE(write_file_contents(store.path(), "{\"state\": "));
    EXPECT_FALSE(store.read(&ec).has_value());
    EXPECT_EQ(ec, std::make_error_code(std::errc::illegal_byte_sequence));

    ASSERT_TRUE(write_file_contents(store.path(), "[1, 2]"));
    EXPECT_FALSE(store.read(&ec).has_value());
    EXPECT_EQ(ec, std::make_error_code(std::errc::illegal_byte_sequence));
}

class PidFileTest : public ::testing::Test
{
  protected:
    TempDir dir_{"pidfile"};
};

TEST_F(PidFileTest, WriteReadRemove)
{
    PidFile pid(dir_ / "run" / ".ctxhub_daemon.pid");
    EXPECT_FALSE(pid.read_pid().has_value());

    std::error_code ec;
    ASSERT_TRUE(pid.write_pid(98765, &ec)) << ec.message();
    EXPECT_EQ(pid.read_pid(), 98765u);

    std::string text;
    ASSERT_TRUE(read_file_contents(pid.path(), text));
    EXPECT_EQ(text, "98765\n");
    size_t entries = 0;
    for (const auto &entry : fs::directory_iterator(pid.path().parent_path()))
    {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u) << "temporary file left behind";

    EXPECT_TRUE(pid.remove(&ec));
    EXPECT_FALSE(fs::exists(pid.path()));
    EXPECT_TRUE(pid.remove(&ec));
    EXPECT_FALSE(ec);
}

TEST_F(PidFileTest, UnparsableContentReadsAsNoPid)
{
    PidFile pid(dir_ / ".ctxhub_daemon.pid");
    for (const char *content : {"", "abc\n", "12x\n", "0\n", "-5\n"})
    {
        ASSERT_TRUE(write_file_contents(pid.path(), content));
        EXPECT_FALSE(pid.read_pid().has_value()) << "content: '" << content << "'";
    }
    ASSERT_TRUE(write_file_contents(pid.path(), "  321  \n"));
    EXPECT_EQ(pid.read_pid(), 321u);
}

TEST_F(PidFileTest, RewriteKeepsModeAndRefusesSymlinkTarget)
{
    PidFile pid(dir_ / ".ctxhub_daemon.pid");
    ASSERT_TRUE(pid.write_pid(100));
    fs::permissions(pid.path(), fs::perms::owner_read | fs::perms::owner_write |
                                    fs::perms::group_read);
    ASSERT_TRUE(pid.write_pid(200));
    EXPECT_EQ(pid.read_pid(), 200u);
    EXPECT_EQ(fs::status(pid.path()).permissions() & fs::perms::all,
              fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);

    const fs::path elsewhere = dir_ / "elsewhere.pid";
    ASSERT_TRUE(write_file_contents(elsewhere, "7\n"));
    PidFile linked(dir_ / "linked.pid");
    fs::create_symlink(elsewhere, linked.path());

    std::error_code ec;
    EXPECT_FALSE(linked.write_pid(300, &ec));
    EXPECT_EQ(ec, std::make_error_code(std::errc::operation_not_permitted));
    std::string text;
    ASSERT_TRUE(read_file_contents(elsewhere, text));
    EXPECT_EQ(text, "7\n");
}
