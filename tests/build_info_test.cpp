#include <gtest/gtest.h>

#include <git_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    constexpr auto git = dbxfer::build_info::get_git_info();
    EXPECT_FALSE(git.branch.empty());
    EXPECT_FALSE(git.commit.empty());
    EXPECT_FALSE(git.commit_short.empty());
    // вне git-репозитория все поля "unknown"
    EXPECT_LE(git.commit_short.size(), git.commit.size());
}

TEST(BuildInfoTest, TimestampIsUtc)
{
    const auto ts = dbxfer::build_info::build_timestamp;
    ASSERT_FALSE(ts.empty());
    EXPECT_EQ(ts.back(), 'Z');
}
