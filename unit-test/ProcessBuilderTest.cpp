#include <signal.h>

#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/scoped_directory.hpp"
#include "common/utils.hpp"

using namespace std;
using namespace passk;

class ProcessBuilderTest : public ::testing::Test {
};

TEST_F(ProcessBuilderTest, CapturesOutputAndExitCode) {
    process_result result = process_builder().run("sh", "-c", "echo out; echo err >&2; exit 3");
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.signal, 0);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
}

TEST_F(ProcessBuilderTest, ArithmeticArguments) {
    process_result result = process_builder().run("sh", "-c", "exit $0", 7);
    EXPECT_EQ(result.exit_code, 7);
}

TEST_F(ProcessBuilderTest, StandardInputIsEmpty) {
    process_result result = process_builder().timeout(5).run("cat");
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "");
}

TEST_F(ProcessBuilderTest, SignalDeath) {
    process_result result = process_builder().run("sh", "-c", "kill -9 $$");
    EXPECT_EQ(result.signal, 9);
    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST_F(ProcessBuilderTest, WorkingDirectory) {
    scoped_directory dir;
    process_result result = process_builder().directory(dir.path()).run("pwd");
    EXPECT_EQ(result.exit_code, 0);
    ASSERT_FALSE(result.stdout_text.empty());
    EXPECT_EQ(filesystem::canonical(result.stdout_text.substr(0, result.stdout_text.size() - 1)).string(),
              filesystem::canonical(dir.path()).string());
}

TEST_F(ProcessBuilderTest, Timeout) {
    elapsed_time elapsed;
    process_result result = process_builder().timeout(0.5).run("sleep", "30");
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_LT(elapsed.seconds(), 10);
}

TEST_F(ProcessBuilderTest, TimeoutKillsBackgroundProcesses) {
    elapsed_time elapsed;
    // 后台进程继承了输出管道，如果没有被杀死，读取输出会一直等到它退出
    process_result result = process_builder().timeout(0.5).run("sh", "-c", "sleep 30 & sleep 30");
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(elapsed.seconds(), 10);
}

TEST_F(ProcessBuilderTest, BackgroundProcessAfterExit) {
    elapsed_time elapsed;
    process_result result = process_builder().timeout(20).run("sh", "-c", "sleep 30 & exit 0");
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_LT(elapsed.seconds(), 10);
}

TEST_F(ProcessBuilderTest, OutputIsBounded) {
    process_result result = process_builder().timeout(10).output_limit(100).run("sh", "-c", "yes | head -c 1000000");
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_TRUE(result.output_truncated);
    string mark = "<...truncated>";
    ASSERT_EQ(result.stdout_text.size(), 100 + mark.size());
    EXPECT_EQ(result.stdout_text.substr(0, 4), "y\ny\n");
    EXPECT_EQ(result.stdout_text.substr(100), mark);
}

TEST_F(ProcessBuilderTest, OutputWithinLimitIsNotMarked) {
    process_result result = process_builder().output_limit(100).run("printf", "abc");
    EXPECT_FALSE(result.output_truncated);
    EXPECT_EQ(result.stdout_text, "abc");
}

TEST_F(ProcessBuilderTest, MissingProgram) {
    EXPECT_THROW(process_builder().run("passk-no-such-program"), sandbox_unavailable);
}

TEST_F(ProcessBuilderTest, MissingWorkingDirectory) {
    EXPECT_THROW(process_builder().directory("/passk/no/such/directory").run("true"), sandbox_unavailable);
}

TEST_F(ProcessBuilderTest, BestEffortNetworkIsolation) {
    process_result result = process_builder().isolate_network(network_isolation::BEST_EFFORT).run("true");
    EXPECT_EQ(result.exit_code, 0);
}

TEST_F(ProcessBuilderTest, HugeTimeout) {
    process_result result = process_builder().timeout(1e20).run("sh", "-c", "exit 0");
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
}

TEST_F(ProcessBuilderTest, BlockedSignalsAreNotInherited) {
    sigset_t signals, old;
    sigemptyset(&signals);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, &old);
    process_result result = process_builder().timeout(10).run("sh", "-c", "kill -TERM $$; exit 0");
    pthread_sigmask(SIG_SETMASK, &old, nullptr);

    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.signal, SIGTERM);
}
