#include <gtest/gtest.h>
#include <string>

#include "Quarry/Core/Error.hpp"
#include "Quarry/Core/Result.hpp"

using namespace Quarry;

namespace
{
    Result<int> Parse(bool ok)
    {
        if (!ok)
            return Err(ErrorCode::InvalidArgument, "bad input");
        return 42;
    }

    Result<void> Check(bool ok)
    {
        if (!ok)
            return Err(ErrorCode::InvalidState);
        return Ok();
    }
}

class ResultTest : public ::testing::Test
{
};

TEST_F(ResultTest, HoldsValue)
{
    auto result = Parse(true);

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.IsOk());
    EXPECT_FALSE(result.IsErr());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(result.ValueOr(0), 42);
}

TEST_F(ResultTest, HoldsError)
{
    auto result = Parse(false);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.Error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(result.Error(), ErrorCode::InvalidArgument);
    EXPECT_STREQ(result.Error().message, "bad input");
    EXPECT_EQ(result.ValueOr(-1), -1);
}

TEST_F(ResultTest, DefaultMessageIsFilledIn)
{
    Error error(ErrorCode::UnknownNetworkId);
    EXPECT_STREQ(error.message, "Unknown network id");
    EXPECT_STREQ(Error(ErrorCode::AlreadyAttached).message, "Component already attached");
}

TEST_F(ResultTest, VoidResult)
{
    EXPECT_TRUE(Check(true));
    auto failed = Check(false);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.Error(), ErrorCode::InvalidState);
}

TEST_F(ResultTest, CopyAndMoveKeepState)
{
    Result<std::string> value = std::string("quarry");
    Result<std::string> copy = value;
    Result<std::string> moved = std::move(value);

    ASSERT_TRUE(copy);
    ASSERT_TRUE(moved);
    EXPECT_EQ(*copy, "quarry");
    EXPECT_EQ(*moved, "quarry");

    Result<std::string> error = Err(ErrorCode::ComponentNotFound);
    copy = error;
    ASSERT_FALSE(copy);
    EXPECT_EQ(copy.Error(), ErrorCode::ComponentNotFound);
}
