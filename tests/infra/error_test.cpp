#include <gtest/gtest.h>

#include <cerrno>
#include "infra/error_handler/error.hpp"

using namespace dbxfer::infra;

TEST(ErrorTest, FatalCodes)
{
    EXPECT_TRUE(make_error(ErrorCode::SpawnFailed, "x").is_fatal());
    EXPECT_TRUE(make_error(ErrorCode::InvalidArgument, "x").is_fatal());
    EXPECT_TRUE(make_error(ErrorCode::UnsupportedAlgorithm, "x").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::DigestFailed, "x").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::Cancelled, "x").is_fatal());
}

TEST(ErrorTest, ExitCodes)
{
    EXPECT_EQ(make_error(ErrorCode::Cancelled, "x").to_exit_code(), 130);
    EXPECT_EQ(make_error(ErrorCode::StreamFailed, "x").to_exit_code(), 20);
    EXPECT_EQ(make_error(ErrorCode::CommandFailed, "x").to_exit_code(), 21);
    EXPECT_EQ(make_error(ErrorCode::DigestFailed, "x").to_exit_code(), 22);
    EXPECT_EQ(make_error(ErrorCode::SpawnFailed, "x").to_exit_code(), 1);
}

TEST(ErrorTest, CapturesLocation)
{
    const auto err = make_error(ErrorCode::Unknown, "boom");
    EXPECT_EQ(err.message, "boom");
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
    EXPECT_GT(err.line, 0);
}

TEST(ErrorTest, SystemErrorAppendsOsText)
{
    const auto err = make_system_error(ErrorCode::SpawnFailed, "Cannot start adb", ENOENT);
    EXPECT_EQ(err.code, ErrorCode::SpawnFailed);
    EXPECT_EQ(err.message.rfind("Cannot start adb: ", 0), 0u);
    EXPECT_GT(err.message.size(), std::string("Cannot start adb: ").size());
}

TEST(ErrorTest, CancellationIsDistinct)
{
    EXPECT_TRUE(make_error(ErrorCode::Cancelled, "x").is_cancellation());
    EXPECT_FALSE(make_error(ErrorCode::CommandFailed, "x").is_cancellation());
    EXPECT_EQ(to_string(ErrorCode::AlreadyRunning), "AlreadyRunning");
}
