#include <gtest/gtest.h>

#include <algorithm>
#include <future>
#include <thread>
#include "core/transfer/process_controller.hpp"
#include "core/transfer/transfer_executor.hpp"
#include "core/recording_observer.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using namespace dbxfer::core;
using dbxfer::testing::FakeCommandRunner;
using dbxfer::testing::RecordingObserver;
using dbxfer::testing::TempDir;

namespace {

const TransferRequest kPullFolder{
    .direction = Direction::Pull,
    .source_path = "/sdcard/DCIM",
    .destination_path = "/tmp/out",
    .is_single_file = false,
};

} // namespace

TEST(TransferExecutorTest, BuildArgs)
{
    EXPECT_EQ(TransferExecutor::build_args(kPullFolder),
              (std::vector<std::string>{"pull", "/sdcard/DCIM", "/tmp/out"}));

    TransferRequest push{.direction = Direction::Push, .source_path = "a.txt",
                         .destination_path = "/sdcard/", .is_single_file = true};
    EXPECT_EQ(TransferExecutor::build_args(push),
              (std::vector<std::string>{"push", "a.txt", "/sdcard/"}));
}

TEST(TransferExecutorTest, UnlabelledOutputEndsAtExactly100)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("bridge.sh",
        "i=1\n"
        "while [ $i -le 101 ]; do echo \"line $i\"; i=$((i+1)); done\n"
        "echo '3 files pulled. (100%)'\n"
        "exit 0").string());
    ProcessController controller;
    TransferExecutor executor(runner, controller);
    RecordingObserver observer;

    const auto result = executor.run(kPullFolder, 1, observer, 3);

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.message, "Pull completed successfully.");

    const auto progress = observer.progress();
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.front(), 0);
    EXPECT_EQ(progress.back(), 100);
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));

    const auto statuses = observer.statuses();
    ASSERT_GE(statuses.size(), 3u);
    EXPECT_EQ(statuses.front(), "Starting pull...");
    EXPECT_EQ(statuses[1], "line 1");
    EXPECT_EQ(statuses.back(), "Pull completed successfully.");

    const auto files = observer.files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], (std::pair<std::uint64_t, std::uint64_t>{3, 3}));
    ASSERT_TRUE(result.stats);
    EXPECT_EQ(result.stats->files_transferred, 3u);

    EXPECT_EQ(runner.spawned().front(), (std::vector<std::string>{"pull", "/sdcard/DCIM", "/tmp/out"}));
}

TEST(TransferExecutorTest, CarriageReturnProgress)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("bridge.sh",
        "printf '[ 10%%] a.bin (10%%)\\r[ 50%%] a.bin (50%%)\\r[ 90%%] a.bin (90%%)\\n'").string());
    ProcessController controller;
    TransferExecutor executor(runner, controller);
    RecordingObserver observer;

    const auto result = executor.run(kPullFolder, 1, observer);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(observer.progress(), (std::vector<int>{0, 10, 50, 90, 100}));
}

TEST(TransferExecutorTest, NonZeroExitCarriesLastLine)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("bridge.sh",
        "echo 'adb: error: remote object does not exist' 1>&2\nexit 1").string());
    ProcessController controller;
    TransferExecutor executor(runner, controller);
    RecordingObserver observer;

    const auto result = executor.run(kPullFolder, 1, observer);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.message, "Pull failed with code 1. Error: adb: error: remote object does not exist");
    EXPECT_NE(observer.progress().back(), 100);
}

TEST(TransferExecutorTest, SilentFailure)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("bridge.sh", "exit 2").string());
    ProcessController controller;
    TransferExecutor executor(runner, controller);
    RecordingObserver observer;

    TransferRequest push{.direction = Direction::Push, .source_path = "/tmp/a",
                         .destination_path = "/sdcard/", .is_single_file = true};
    const auto result = executor.run(push, 1, observer);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Push failed with code 2");
}

TEST(TransferExecutorTest, SpawnFailure)
{
    FakeCommandRunner runner("/nonexistent/dbxfer-bridge");
    ProcessController controller;
    TransferExecutor executor(runner, controller);
    RecordingObserver observer;

    const auto result = executor.run(kPullFolder, 1, observer);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.cancelled);
    EXPECT_NE(result.message.find("Pull error"), std::string::npos);
    EXPECT_FALSE(controller.is_running());
}

TEST(TransferExecutorTest, SingleFileCountsOne)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("bridge.sh",
        "echo '/sdcard/a.jpg: 1 file pulled, 0 skipped. 2.1 MB/s (4096 bytes in 0.002s)'").string());
    ProcessController controller;
    TransferExecutor executor(runner, controller);
    RecordingObserver observer;

    TransferRequest single{.direction = Direction::Pull, .source_path = "/sdcard/a.jpg",
                           .destination_path = "/tmp/out", .is_single_file = true};
    const auto result = executor.run(single, 4, observer, 1);
    EXPECT_TRUE(result.success);

    const auto files = observer.files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], (std::pair<std::uint64_t, std::uint64_t>{1, 1}));
    for (auto gen : observer.generations()) {
        EXPECT_EQ(gen, 4u);
    }
}

TEST(TransferExecutorTest, CancelMidStream)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("bridge.sh", "echo started\nexec sleep 30").string());
    ProcessController controller(1s);
    TransferExecutor executor(runner, controller);
    RecordingObserver observer;

    std::promise<void> started;
    auto started_future = started.get_future();
    bool signalled = false;
    observer.set_status_hook([&](const std::string& message) {
        if (message == "started" && !signalled) {
            signalled = true;
            started.set_value();
        }
    });

    auto run = std::async(std::launch::async, [&] { return executor.run(kPullFolder, 1, observer); });

    ASSERT_EQ(started_future.wait_for(10s), std::future_status::ready);
    EXPECT_TRUE(controller.cancel());

    ASSERT_EQ(run.wait_for(10s), std::future_status::ready);
    const auto result = run.get();
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.message, "Transfer cancelled by user.");
    EXPECT_FALSE(controller.is_running());
}
