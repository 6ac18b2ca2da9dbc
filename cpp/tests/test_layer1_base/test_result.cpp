/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E>, the value-or-error type returned by the
 *        mailbox, daemon and session APIs.
 */

#include "utils/result.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>

using ctxhub::utils::Result;
using ctxhub::utils::Unit;

enum class TestError
{
    NotFound,
    InvalidInput,
    Timeout
};

TEST(ResultTest, ConstructionOk)
{
    auto result = Result<int, TestError>::ok(42);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.content(), 42);
}

TEST(ResultTest, ConstructionErrorCarriesMessageAndCode)
{
    auto result = Result<int, TestError>::error(TestError::NotFound, "no such thing", 123);
    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), TestError::NotFound);
    EXPECT_EQ(result.error_message(), "no such thing");
    EXPECT_EQ(result.error_code(), 123);
}

TEST(ResultTest, ConstructionErrorDefaults)
{
    auto result = Result<int, TestError>::error(TestError::Timeout);
    EXPECT_EQ(result.error(), TestError::Timeout);
    EXPECT_EQ(result.error_code(), 0);
    EXPECT_TRUE(result.error_message().empty());
}

TEST(ResultTest, DefaultConstructedIsError)
{
    Result<std::string, TestError> result;
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), TestError::NotFound);
}

TEST(ResultTest, MutableContentAccess)
{
    auto result = Result<std::string, TestError>::ok("hello");
    result.content() += " world";
    EXPECT_EQ(result.content(), "hello world");
}

TEST(ResultTest, WrongSideAccessThrowsLogicError)
{
    auto ok = Result<int, TestError>::ok(1);
    auto err = Result<int, TestError>::error(TestError::InvalidInput);
    EXPECT_THROW((void)ok.error(), std::logic_error);
    EXPECT_THROW((void)ok.error_message(), std::logic_error);
    EXPECT_THROW((void)err.content(), std::logic_error);
}

TEST(ResultTest, ValueOr)
{
    auto ok = Result<int, TestError>::ok(5);
    auto err = Result<int, TestError>::error(TestError::Timeout);
    EXPECT_EQ(ok.value_or(9), 5);
    EXPECT_EQ(err.value_or(9), 9);
}

TEST(ResultTest, MoveOnlyPayload)
{
    auto result = Result<std::unique_ptr<int>, TestError>::ok(std::make_unique<int>(7));
    std::unique_ptr<int> taken = std::move(result).content();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 7);
}

TEST(ResultTest, MoveConstructionPreservesError)
{
    auto a = Result<int, TestError>::error(TestError::InvalidInput, "bad", 4);
    auto b = std::move(a);
    EXPECT_EQ(b.error(), TestError::InvalidInput);
    EXPECT_EQ(b.error_message(), "bad");
}

TEST(ResultTest, UnitPayload)
{
    auto r = Result<Unit, TestError>::ok(Unit{});
    EXPECT_TRUE(r.is_ok());
}
