#include <chrono>
#include <core/util/process.h>
#include <gtest/gtest.h>
#include <thread>

using namespace bucketpull::core;
using namespace std::chrono_literals;

TEST(ProcessRunnerTest, CapturesStdoutAndStderr) {
    ProcessRunner runner(10ms);
    auto result = runner.Run("/bin/sh", {"-c", "echo hello; echo oops 1>&2"});
    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.terminated);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("hello"), std::string::npos);
    EXPECT_NE(result.output.find("oops"), std::string::npos);
}

TEST(ProcessRunnerTest, ReportsExitCode) {
    ProcessRunner runner(10ms);
    EXPECT_EQ(runner.Run("/bin/sh", {"-c", "exit 3"}).exit_code, 3);
}

TEST(ProcessRunnerTest, FindsExecutableOnPath) {
    ProcessRunner runner(10ms);
    auto result = runner.Run("sh", {"-c", "printf ok"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "ok\n");
}

TEST(ProcessRunnerTest, MissingExecutableIsNotLaunched) {
    ProcessRunner runner(10ms);
    auto result = runner.Run("bucketpull-no-such-tool", {});
    EXPECT_FALSE(result.launched);
    EXPECT_EQ(result.exit_code, 127);
}

TEST(ProcessRunnerTest, StopTerminatesTheProcessGroup) {
    ProcessRunner runner(10ms);
    std::stop_source stop;
    std::jthread canceller([&stop]() {
        std::this_thread::sleep_for(100ms);
        stop.request_stop();
    });

    auto started = std::chrono::steady_clock::now();
    // the backgrounded sleep shares the group and must die too
    auto result = runner.Run("/bin/sh", {"-c", "sleep 30 & sleep 30; wait"}, stop.get_token());
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.terminated);
    EXPECT_LT(elapsed, 5s);
}

TEST(ProcessRunnerTest, AlreadyStoppedTokenTerminatesPromptly) {
    ProcessRunner runner(10ms);
    std::stop_source stop;
    stop.request_stop();

    auto started = std::chrono::steady_clock::now();
    auto result = runner.Run("/bin/sh", {"-c", "sleep 30"}, stop.get_token());
    EXPECT_TRUE(result.terminated);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}
