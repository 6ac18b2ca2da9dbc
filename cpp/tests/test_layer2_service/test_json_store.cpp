// tests/test_layer2_service/test_json_store.cpp
/**
 * @file test_json_store.cpp
 * @brief JsonStore: locked read/modify/write of a single JSON document with
 *        atomic replacement.
 */
#include "ctxhub_service.hpp"
#include "shared_test_helpers.h"
#include "gtest/gtest.h"

#include <thread>
#include <vector>

#include <sys/stat.h>

using namespace ctxhub::utils;
using namespace ctxhub::tests::helper;
using nlohmann::json;

class JsonStoreTest : public ::testing::Test
{
  protected:
    TempDir dir_{"jsonstore"};
};

TEST_F(JsonStoreTest, MissingFileYieldsFallbackWithoutError)
{
    JsonStore store(dir_ / "absent.json");
    std::error_code ec = std::make_error_code(std::errc::io_error);
    const json doc = store.read_or(json::array(), &ec);
    EXPECT_FALSE(ec);
    EXPECT_TRUE(doc.is_array());
    EXPECT_FALSE(store.exists());
}

TEST_F(JsonStoreTest, WriteCreatesParentsAndReadsBack)
{
    JsonStore store(dir_ / "nested" / "deeper" / "status.json");
    std::error_code ec;
    ASSERT_TRUE(store.write(json{{"state", "running"}, {"pid", 42}}, &ec)) << ec.message();

    const json doc = store.read_or(json::object(), &ec);
    EXPECT_FALSE(ec);
    EXPECT_EQ(doc["state"], "running");
    EXPECT_EQ(doc["pid"], 42);
}

TEST_F(JsonStoreTest, CorruptDocumentReportsIllegalByteSequence)
{
    const fs::path p = dir_ / "bad.json";
    ASSERT_TRUE(write_file_contents(p, "{\"unterminated\": "));
    JsonStore store(p);
    std::error_code ec;
    const json doc = store.read_or(json{{"fallback", true}}, &ec);
    EXPECT_EQ(ec, std::make_error_code(std::errc::illegal_byte_sequence));
    EXPECT_TRUE(doc["fallback"].get<bool>());
}

TEST_F(JsonStoreTest, MutatorReturningFalseLeavesFileUntouched)
{
    const fs::path p = dir_ / "log.json";
    JsonStore store(p);
    ASSERT_TRUE(store.write(json::array({1, 2})));

    std::error_code ec;
    EXPECT_FALSE(store.with_json_write(
        json::array(),
        [](json &doc)
        {
            doc.push_back(3);
            return false;
        },
        &ec));
    EXPECT_FALSE(ec);
    EXPECT_EQ(store.read_or(json::array()).size(), 2u);
}

TEST_F(JsonStoreTest, ThrowingMutatorReportsInvalidArgument)
{
    JsonStore store(dir_ / "throws.json");
    std::error_code ec;
    EXPECT_FALSE(store.with_json_write(
        json::object(),
        [](json &doc) -> bool
        {
            (void)doc.at("missing");
            return true;
        },
        &ec));
    EXPECT_EQ(ec, std::make_error_code(std::errc::invalid_argument));
    EXPECT_FALSE(store.exists());
}

TEST_F(JsonStoreTest, ConcurrentAppendsAreNotLost)
{
    const fs::path p = dir_ / "appends.json";
    constexpr int kThreads = 4;
    constexpr int kPerThread = 20;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [&p, t]()
            {
                JsonStore store(p);
                for (int i = 0; i < kPerThread; ++i)
                {
                    store.with_json_write(json::array(),
                                          [&](json &doc)
                                          {
                                              doc.push_back(t * 1000 + i);
                                              return true;
                                          });
                }
            });
    }
    for (auto &th : threads)
        th.join();

    JsonStore store(p);
    EXPECT_EQ(store.read_or(json::array()).size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(JsonStoreTest, AtomicWriteKeepsExistingPermissions)
{
    const fs::path p = dir_ / "perm.json";
    ASSERT_TRUE(write_file_contents(p, "{}"));
    ASSERT_EQ(::chmod(p.c_str(), 0640), 0);

    std::error_code ec;
    JsonStore::atomic_write_json(p, json{{"k", 1}}, &ec);
    ASSERT_FALSE(ec) << ec.message();

    struct stat st{};
    ASSERT_EQ(::stat(p.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0640u);
}

TEST_F(JsonStoreTest, AtomicWriteRefusesSymlinkTarget)
{
    const fs::path real = dir_ / "real.json";
    const fs::path link = dir_ / "link.json";
    ASSERT_TRUE(write_file_contents(real, "{}"));
    fs::create_symlink(real, link);

    std::error_code ec;
    JsonStore::atomic_write_json(link, json{{"k", 1}}, &ec);
    EXPECT_EQ(ec, std::make_error_code(std::errc::operation_not_permitted));
}
