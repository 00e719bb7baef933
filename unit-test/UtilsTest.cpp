#include <filesystem>
#include <system_error>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace codejudge;

TEST(UtilsTest, CallProcessTest) {
    process_options options;
    auto result = call_process(options, "/bin/sh", "-c", "echo out; echo err >&2; exit 7");
    EXPECT_EQ(result.out, "out\n");
    EXPECT_EQ(result.err, "err\n");
    EXPECT_EQ(result.exitcode, 7);
    EXPECT_EQ(result.signal, -1);
    EXPECT_FALSE(result.timed_out);

    vector<string> args = {"-c", "printf '%s' \"$1\"", "sh", "a b"};
    EXPECT_EQ(call_process(options, "/bin/sh", args).out, "a b");
}

TEST(UtilsTest, CallProcessTimeoutTest) {
    bool notified = false;
    process_options options;
    options.timeout = chrono::milliseconds(200);
    options.kill_grace = chrono::milliseconds(500);
    options.on_timeout = [&]() { notified = true; };

    // 子进程也会被杀死，不会因为管道未关闭而阻塞
    auto result = call_process(options, "/bin/sh", "-c", "sleep 10 & sleep 10");
    EXPECT_TRUE(result.timed_out);
    EXPECT_TRUE(notified);
    EXPECT_LT(result.elapsed.count(), 5000);
}

TEST(UtilsTest, CallProcessMissingTest) {
    process_options options;
    EXPECT_THROW(call_process(options, "/nonexistent/program"), system_error);
}

TEST(UtilsTest, SafePathTest) {
    EXPECT_EQ(assert_safe_path("Main.java"), "Main.java");
    EXPECT_THROW(assert_safe_path("../Main.java"), runtime_error);
    EXPECT_THROW(assert_safe_path("src/../../Main.java"), runtime_error);
    EXPECT_THROW(assert_safe_path(".."), runtime_error);
}

TEST(UtilsTest, WorkspaceTest) {
    filesystem::path parent("/tmp/codejudge-test/workspace");
    filesystem::create_directories(parent);

    filesystem::path path;
    {
        auto workspace = make_workspace(parent, "code-execution");
        path = workspace.path();
        EXPECT_TRUE(filesystem::is_directory(path));
        EXPECT_EQ(path.parent_path(), parent);
        EXPECT_EQ(path.filename().string().rfind("code-execution-", 0), 0);

        auto moved = move(workspace);
        EXPECT_TRUE(filesystem::is_directory(moved.path()));
    }
    EXPECT_FALSE(filesystem::exists(path));

    {
        auto kept = make_workspace(parent, "code-execution", true);
        path = kept.path();
    }
    EXPECT_TRUE(filesystem::exists(path));
    filesystem::remove_all(path);
}
