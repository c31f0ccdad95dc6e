#include <signal.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <thread>
#include "common/io_utils.hpp"
#include "common/process.hpp"
#include "gtest/gtest.h"
#include "test/temp_dir.hpp"

using namespace std;
using namespace runner;

static process_options bash(const string &script, chrono::milliseconds timeout = chrono::seconds(10)) {
    process_options opt;
    opt.argv = {"bash", "-c", script};
    opt.timeout = timeout;
    return opt;
}

/**
 * @brief 进程是否仍然存活（僵尸进程视为已经结束）
 */
static bool process_alive(pid_t pid) {
    string stat;
    try {
        stat = read_file_content("/proc/" + to_string(pid) + "/stat", "");
    } catch (system_error &) {
        return false;  // 进程在 exists 与 open 之间退出
    }
    if (stat.empty()) return false;
    size_t pos = stat.rfind(')');
    return pos == string::npos || pos + 2 >= stat.size() || stat[pos + 2] != 'Z';
}

TEST(ProcessTest, CapturesOutputAndExitCode) {
    auto result = run_supervised(bash("echo out; echo err >&2; exit 3"));
    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.out, "out\n");
    EXPECT_EQ(result.err, "err\n");
    EXPECT_FALSE(result.out_truncated);
    EXPECT_FALSE(result.err_truncated);
}

TEST(ProcessTest, PassesArgumentsWithoutShellExpansion) {
    process_options opt;
    opt.argv = {"bash", "-c", "printf '%s|' \"$@\"", "runner", "a b", "$(id)", ";rm"};
    opt.timeout = chrono::seconds(10);
    auto result = run_supervised(opt);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, "a b|$(id)|;rm|");
}

TEST(ProcessTest, RunsInWorkingDirectory) {
    test::temp_dir dir;
    write_file_content(dir / "input.txt", "hello");
    auto opt = bash("cat input.txt");
    opt.work_dir = dir.path();
    auto result = run_supervised(opt);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, "hello");
}

TEST(ProcessTest, StdinIsEmpty) {
    auto result = run_supervised(bash("cat; echo done"));
    EXPECT_EQ(result.out, "done\n");
}

TEST(ProcessTest, SignalExitCode) {
    auto result = run_supervised(bash("kill -SEGV $$"));
    EXPECT_TRUE(result.launched);
    EXPECT_EQ(result.term_signal, SIGSEGV);
    EXPECT_EQ(result.exit_code, 128 + SIGSEGV);
}

TEST(ProcessTest, ExecFailureIsNotLaunched) {
    process_options opt;
    opt.argv = {"/nonexistent/code-runner-binary"};
    opt.timeout = chrono::seconds(10);
    auto result = run_supervised(opt);
    EXPECT_FALSE(result.launched);
    EXPECT_NE(result.launch_error.find("/nonexistent/code-runner-binary"), string::npos);
}

TEST(ProcessTest, TruncatesLargeOutput) {
    auto opt = bash("head -c 100000 /dev/zero | tr '\\0' 'a'; echo tail >&2");
    opt.stream_limit = 1000;
    auto result = run_supervised(opt);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, string(1000, 'a'));
    EXPECT_TRUE(result.out_truncated);
    EXPECT_EQ(result.err, "tail\n");
    EXPECT_FALSE(result.err_truncated);
}

TEST(ProcessTest, WatchdogKillsProcessGroup) {
    int hooked = 0;
    auto opt = bash("sleep 30 & echo $!; wait", chrono::milliseconds(500));
    opt.on_timeout = [&] { ++hooked; };

    auto start = chrono::steady_clock::now();
    auto result = run_supervised(opt);
    auto elapsed = chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.launched);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(hooked, 1);
    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
    EXPECT_LT(elapsed, chrono::seconds(5));

    // 后台进程与 bash 在同一个进程组中，应当同时被杀死
    pid_t background = boost::lexical_cast<pid_t>(boost::algorithm::trim_copy(result.out));
    bool alive = true;
    for (int i = 0; i < 40 && alive; ++i) {
        alive = process_alive(background);
        if (alive) this_thread::sleep_for(chrono::milliseconds(50));
    }
    EXPECT_FALSE(alive);
}

TEST(ProcessTest, KillsBackgroundProcessesAfterExit) {
    auto result = run_supervised(bash("sleep 30 & echo $!"));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);

    pid_t background = boost::lexical_cast<pid_t>(boost::algorithm::trim_copy(result.out));
    bool alive = true;
    for (int i = 0; i < 40 && alive; ++i) {
        alive = process_alive(background);
        if (alive) this_thread::sleep_for(chrono::milliseconds(50));
    }
    EXPECT_FALSE(alive);
}

TEST(ProcessTest, ThrowingTimeoutHookStillKills) {
    auto opt = bash("sleep 30", chrono::milliseconds(200));
    opt.on_timeout = [] { throw runtime_error("hook failed"); };
    auto result = run_supervised(opt);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
}
