#include <gtest/gtest.h>

#include <vector>
#include "cli/args_parser/args_parser.hpp"

using dbxfer::args_parser::parse_args;

namespace {

auto parse(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "dbxfer");
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(ArgsParserTest, Pull)
{
    auto args = parse({"-s", "emulator-5554", "--dedup", "pull", "/sdcard/DCIM", "/tmp/out"});
    ASSERT_TRUE(args);
    EXPECT_EQ(args->command, "pull");
    EXPECT_EQ(args->source, "/sdcard/DCIM");
    EXPECT_EQ(args->destination, "/tmp/out");
    EXPECT_EQ(args->device, "emulator-5554");
    EXPECT_TRUE(args->dedup);
    EXPECT_TRUE(args->progress);
}

TEST(ArgsParserTest, PushWithOptions)
{
    auto args = parse({"--algorithm", "md5", "--threads", "3", "--grace-ms", "500",
                       "--no-progress", "-q", "push", "a.txt", "/sdcard/"});
    ASSERT_TRUE(args);
    EXPECT_EQ(args->command, "push");
    EXPECT_EQ(args->algorithm, "md5");
    EXPECT_EQ(args->threads, 3u);
    EXPECT_EQ(args->grace_ms, 500u);
    EXPECT_FALSE(args->progress);
    EXPECT_TRUE(args->quiet);
}

TEST(ArgsParserTest, OptionsAfterSubcommand)
{
    auto args = parse({"pull", "--dedup", "-v", "/sdcard/a", "/tmp"});
    ASSERT_TRUE(args);
    EXPECT_TRUE(args->dedup);
    EXPECT_TRUE(args->verbose);
}

TEST(ArgsParserTest, Plan)
{
    auto args = parse({"plan", "a.txt", "b.txt", "--target", "/sdcard/r1.txt", "--target-remote"});
    ASSERT_TRUE(args);
    EXPECT_EQ(args->command, "plan");
    EXPECT_EQ(args->sources, (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(args->targets, (std::vector<std::string>{"/sdcard/r1.txt"}));
    EXPECT_FALSE(args->source_remote);
    EXPECT_TRUE(args->target_remote);
}

TEST(ArgsParserTest, Rejections)
{
    EXPECT_FALSE(parse({}));
    EXPECT_FALSE(parse({"pull", "/sdcard/a"}));
    EXPECT_FALSE(parse({"--algorithm", "crc32", "pull", "a", "b"}));
    EXPECT_FALSE(parse({"--threads", "0", "pull", "a", "b"}));
}
