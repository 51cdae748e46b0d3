/**
 * @file test_result.cpp
 * @brief Unit tests for the Result<T, E> type.
 */
#include "utils/result.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

using zonechat::utils::Result;

enum class TestError
{
    NotFound,
    InvalidInput,
    Timeout
};

// ============================================================================
// Construction
// ============================================================================

TEST(ResultTest, ConstructionOk)
{
    auto result = Result<int, TestError>::ok(42);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.content(), 42);
}

TEST(ResultTest, ConstructionErrorWithDetail)
{
    auto result = Result<int, TestError>::error(TestError::InvalidInput, "name is empty");
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), TestError::InvalidInput);
    EXPECT_EQ(result.error_detail(), "name is empty");
}

TEST(ResultTest, ConstructionErrorDefaultDetail)
{
    auto result = Result<int, TestError>::error(TestError::Timeout);
    EXPECT_EQ(result.error(), TestError::Timeout);
    EXPECT_TRUE(result.error_detail().empty());
}

TEST(ResultTest, DefaultConstructedIsFirstError)
{
    Result<int, TestError> result;
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), TestError::NotFound);
}

// ============================================================================
// Access
// ============================================================================

TEST(ResultTest, ContentOnErrorThrows)
{
    auto result = Result<std::string, TestError>::error(TestError::NotFound);
    EXPECT_THROW((void)result.content(), std::logic_error);
}

TEST(ResultTest, ErrorOnSuccessThrows)
{
    auto result = Result<std::string, TestError>::ok("hello");
    EXPECT_THROW((void)result.error(), std::logic_error);
    EXPECT_THROW((void)result.error_detail(), std::logic_error);
}

TEST(ResultTest, ContentIsMutable)
{
    auto result = Result<std::string, TestError>::ok("hello");
    result.content() += " world";
    EXPECT_EQ(result.content(), "hello world");
}

TEST(ResultTest, ValueOr)
{
    auto good = Result<int, TestError>::ok(7);
    auto bad = Result<int, TestError>::error(TestError::Timeout);
    EXPECT_EQ(good.value_or(-1), 7);
    EXPECT_EQ(bad.value_or(-1), -1);
}

// ============================================================================
// Move semantics
// ============================================================================

TEST(ResultTest, MoveOnlyPayload)
{
    auto result = Result<std::unique_ptr<int>, TestError>::ok(std::make_unique<int>(5));
    auto moved = std::move(result);
    ASSERT_TRUE(moved.is_ok());
    std::unique_ptr<int> p = std::move(moved).content();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 5);
}

TEST(ResultTest, NotCopyable)
{
    static_assert(!std::is_copy_constructible_v<Result<int, TestError>>);
    static_assert(std::is_move_constructible_v<Result<int, TestError>>);
    SUCCEED();
}
