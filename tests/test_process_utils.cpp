#include "quantlab/utils/process_utils.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>

using namespace quantlab::utils;

TEST(ProcessUtilsTest, CapturesStdoutAndExitCode) {
    auto result = RunProcess({"sh", "-c", "echo hello; exit 3"});
    EXPECT_TRUE(result.launched);
    EXPECT_EQ(3, result.exit_code);
    EXPECT_EQ("hello\n", result.output);
    EXPECT_FALSE(result.Succeeded());
}

TEST(ProcessUtilsTest, CapturesStderrSeparately) {
    auto result = RunProcess({"sh", "-c", "echo out; echo err 1>&2"});
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ("out\n", result.output);
    EXPECT_EQ("err\n", result.error);
}

TEST(ProcessUtilsTest, FeedsStdin) {
    ProcessOptions options;
    options.stdin_data = std::string("piped input");
    auto result = RunProcess({"cat"}, options);
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ("piped input", result.output);
}

TEST(ProcessUtilsTest, RunsInWorkingDirectory) {
    auto dir = quantlab::fakes::ScratchDir("cwd");
    std::ofstream(dir / "marker.txt") << "x";

    ProcessOptions options;
    options.working_dir = dir;
    auto result = RunProcess({"ls"}, options);
    EXPECT_TRUE(result.Succeeded());
    EXPECT_NE(std::string::npos, result.output.find("marker.txt"));

    std::filesystem::remove_all(dir);
}

TEST(ProcessUtilsTest, MissingExecutableIsNotLaunched) {
    auto result = RunProcess({"quantlab-definitely-not-installed"});
    EXPECT_FALSE(result.launched);
    EXPECT_EQ(127, result.exit_code);
    EXPECT_NE(std::string::npos, result.error.find("Failed to execute"));
}

TEST(ProcessUtilsTest, DeadlineKillsChild) {
    ProcessOptions options;
    options.timeout = std::chrono::milliseconds(200);

    auto start = std::chrono::steady_clock::now();
    auto result = RunProcess({"sh", "-c", "echo started; exec sleep 10"}, options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.Succeeded());
    EXPECT_EQ(128 + 9, result.exit_code);
    EXPECT_EQ("started\n", result.output);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessUtilsTest, DeadlineLeavesFastCommandsAlone) {
    ProcessOptions options;
    options.timeout = std::chrono::seconds(10);

    auto result = RunProcess({"sh", "-c", "echo quick"}, options);
    EXPECT_FALSE(result.timed_out);
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ("quick\n", result.output);
}

TEST(ProcessUtilsTest, EmptyArgvThrows) {
    EXPECT_THROW(RunProcess({}), std::invalid_argument);
}

TEST(ProcessUtilsTest, ExecutableLookup) {
    EXPECT_TRUE(IsExecutableAvailable("sh"));
    EXPECT_FALSE(IsExecutableAvailable("quantlab-definitely-not-installed"));
    EXPECT_FALSE(IsExecutableAvailable(""));
}

TEST(ProcessUtilsTest, FormatCommandLineQuotesSpaces) {
    EXPECT_EQ("docker exec 'a b'", FormatCommandLine({"docker", "exec", "a b"}));
}
