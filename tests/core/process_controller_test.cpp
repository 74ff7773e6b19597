#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <stop_token>
#include "core/transfer/process_controller.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using dbxfer::core::ProcessController;
using dbxfer::infra::ErrorCode;
using dbxfer::testing::FakeCommandRunner;
using dbxfer::testing::TempDir;

TEST(ProcessControllerTest, CancelWithoutProcess)
{
    ProcessController controller;
    EXPECT_FALSE(controller.cancel());
    EXPECT_FALSE(controller.is_running());
    EXPECT_FALSE(controller.last_exit().has_value());
}

TEST(ProcessControllerTest, CancelAfterExitReturnsFalse)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("bridge.sh", "exit 0").string());
    ProcessController controller;

    auto child = controller.start(runner, {"pull", "/sdcard/a", "/tmp"});
    ASSERT_TRUE(child) << child.error().message;
    EXPECT_EQ((*child)->wait(), 0);

    // процесс уже собран: отмены нет
    EXPECT_NO_THROW({ EXPECT_FALSE(controller.cancel()); });
    EXPECT_FALSE(controller.is_running());
    auto exit = controller.last_exit();
    ASSERT_TRUE(exit);
    EXPECT_EQ(exit->exit_code, 0);
    EXPECT_FALSE(exit->cancelled);
}

TEST(ProcessControllerTest, SecondStartIsRejected)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("bridge.sh", "exec sleep 30").string());
    ProcessController controller;

    auto first = controller.start(runner, {"pull", "a", "b"});
    ASSERT_TRUE(first);
    auto second = controller.start(runner, {"pull", "a", "b"});
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::AlreadyRunning);

    EXPECT_TRUE(controller.cancel());
    auto exit = controller.last_exit();
    ASSERT_TRUE(exit);
    EXPECT_TRUE(exit->cancelled);
    EXPECT_EQ(exit->exit_code, -SIGTERM);
    EXPECT_EQ(runner.spawned().size(), 1u);
}

TEST(ProcessControllerTest, KillAfterGracePeriod)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("stubborn.sh", "trap '' TERM\necho ready\nexec sleep 30").string());
    ProcessController controller(200ms);

    auto child = controller.start(runner, {"pull", "a", "b"});
    ASSERT_TRUE(child);
    auto line = (*child)->read_line();
    ASSERT_TRUE(line && *line);
    EXPECT_EQ(**line, "ready");

    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(controller.cancel());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 10s);
    auto exit = controller.last_exit();
    ASSERT_TRUE(exit);
    EXPECT_TRUE(exit->cancelled);
    EXPECT_EQ(exit->exit_code, -SIGKILL);
}

TEST(ProcessControllerTest, StartAfterCancelIsLegal)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("bridge.sh", "exec sleep 30").string());
    ProcessController controller(500ms);

    ASSERT_TRUE(controller.start(runner, {"push", "a", "b"}));
    EXPECT_TRUE(controller.cancel());
    EXPECT_FALSE(controller.is_running());

    ASSERT_TRUE(controller.start(runner, {"push", "a", "b"}));
    EXPECT_TRUE(controller.is_running());
    EXPECT_TRUE(controller.cancel());
}

TEST(ProcessControllerTest, FinishReportsExitCode)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("bridge.sh", "echo failing\nexit 7").string());
    ProcessController controller;

    auto child = controller.start(runner, {"pull", "a", "b"});
    ASSERT_TRUE(child);
    EXPECT_EQ(controller.finish(*child), 7);
    EXPECT_FALSE(controller.is_running());

    auto exit = controller.last_exit();
    ASSERT_TRUE(exit);
    EXPECT_EQ(exit->exit_code, 7);
    EXPECT_FALSE(exit->cancelled);
    EXPECT_FALSE(controller.cancel());
}

TEST(ProcessControllerTest, SpawnFailureLeavesSlotEmpty)
{
    FakeCommandRunner runner("/nonexistent/dbxfer-bridge");
    ProcessController controller;

    auto child = controller.start(runner, {"pull", "a", "b"});
    ASSERT_FALSE(child);
    EXPECT_EQ(child.error().code, ErrorCode::SpawnFailed);
    EXPECT_FALSE(controller.is_running());
}

TEST(ProcessControllerTest, StopRequestedBeforeStart)
{
    TempDir dir;
    FakeCommandRunner runner(dir.script("bridge.sh", "exit 0").string());
    ProcessController controller;

    std::stop_source source;
    source.request_stop();
    auto child = controller.start(runner, {"pull", "a", "b"}, source.get_token());
    ASSERT_FALSE(child);
    EXPECT_EQ(child.error().code, ErrorCode::Cancelled);
    EXPECT_TRUE(runner.spawned().empty());
}
