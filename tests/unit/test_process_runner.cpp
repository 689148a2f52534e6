#include <chrono>
#include <filesystem>
#include <future>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "runtime/process_runner.hpp"

namespace {

using cortex::core::errors::get_error;
using cortex::core::errors::get_value;
using cortex::core::errors::is_error;
using cortex::runtime::PosixProcessRunner;

TEST(ProcessRunnerTest, CapturesStdoutStderrAndExitCode) {
    PosixProcessRunner runner;
    auto ran = runner.run({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, 5000);
    ASSERT_FALSE(is_error(ran));
    const auto& capture = get_value(ran);
    EXPECT_EQ(capture.stdout_text, "out\n");
    EXPECT_EQ(capture.stderr_text, "err\n");
    EXPECT_EQ(capture.exit_code, 3);
    EXPECT_FALSE(capture.timed_out);
}

TEST(ProcessRunnerTest, PassesArgumentsVerbatim) {
    PosixProcessRunner runner;
    auto ran = runner.run({"/bin/sh", "-c", "printf '%s' \"$1\"", "sh", "it's \"quoted\" $HOME"},
                          5000);
    ASSERT_FALSE(is_error(ran));
    EXPECT_EQ(get_value(ran).stdout_text, "it's \"quoted\" $HOME");
}

TEST(ProcessRunnerTest, KillsProcessOnTimeout) {
    PosixProcessRunner runner;
    const auto started = std::chrono::steady_clock::now();
    auto ran = runner.run({"/bin/sh", "-c", "sleep 10"}, 200);
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    ASSERT_FALSE(is_error(ran));
    EXPECT_TRUE(get_value(ran).timed_out);
    EXPECT_LT(elapsed, 5.0);
}

TEST(ProcessRunnerTest, MissingBinaryIsSpawnError) {
    PosixProcessRunner runner;
    auto ran = runner.run({"/nonexistent/cortex-agent-binary"}, 1000);
    ASSERT_TRUE(is_error(ran));
    EXPECT_EQ(get_error(ran).code, "spawn_failed");
}

TEST(ProcessRunnerTest, EmptyCommandIsRejected) {
    PosixProcessRunner runner;
    auto ran = runner.run({}, 1000);
    ASSERT_TRUE(is_error(ran));
    EXPECT_EQ(get_error(ran).code, "empty_command");
}

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

TEST(ProcessRunnerTest, ConcurrentChildrenDoNotInheritSiblingPipes) {
    if (!std::filesystem::exists("/proc/self/fd")) {
        GTEST_SKIP() << "/proc is not available";
    }
    const std::vector<std::string> argv = {"/bin/sh", "-c", "sleep 0.2; ls /proc/$$/fd"};
    PosixProcessRunner runner;

    auto solo = runner.run(argv, 5000);
    ASSERT_FALSE(is_error(solo));
    const auto baseline = split_words(get_value(solo).stdout_text);
    ASSERT_FALSE(baseline.empty());

    std::vector<std::future<cortex::core::errors::Result<cortex::runtime::ProcessCapture>>>
        pending;
    for (int i = 0; i < 8; ++i) {
        pending.push_back(std::async(std::launch::async,
                                     [&runner, &argv]() { return runner.run(argv, 5000); }));
    }
    for (auto& future : pending) {
        auto ran = future.get();
        ASSERT_FALSE(is_error(ran));
        EXPECT_EQ(split_words(get_value(ran).stdout_text), baseline);
    }
}

TEST(ProcessRunnerTest, FastChildFinishesWhileSiblingRuns) {
    PosixProcessRunner runner;
    auto slow = std::async(std::launch::async, [&runner]() {
        return runner.run({"/bin/sh", "-c", "sleep 3"}, 10000);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto started = std::chrono::steady_clock::now();
    auto fast = runner.run({"/bin/sh", "-c", "echo quick"}, 10000);
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    ASSERT_FALSE(is_error(fast));
    EXPECT_EQ(get_value(fast).stdout_text, "quick\n");
    EXPECT_LT(elapsed, 2.0);
    EXPECT_FALSE(is_error(slow.get()));
}

TEST(ProcessRunnerTest, StreamDeliversLinesInOrder) {
    PosixProcessRunner runner;
    std::vector<std::string> lines;
    auto streamed = runner.stream({"/bin/sh", "-c", "echo one; sleep 0.1; echo two; printf three"},
                                  [&lines](const std::string& line) { lines.push_back(line); });
    ASSERT_FALSE(is_error(streamed));
    EXPECT_EQ(get_value(streamed), 0);
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three"}));
}

}  // namespace
