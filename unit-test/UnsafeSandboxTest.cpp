#include <signal.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "sandbox/unsafe_sandbox.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::filesystem;
using namespace mjudge;

class UnsafeSandboxTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        fresh_temp_dir();
        cacher = make_unique<local_file_cacher>(STORAGE_DIR);
    }

    static process_options shell(const string &script, double time_limit = 1) {
        process_options options;
        options.command = {"/bin/bash", "-c", script};
        options.time_limit = time_limit;
        options.wall_time_limit = 2 * time_limit + 1;
        options.memory_limit = 256 << 20;
        options.multiprocess = true;
        return options;
    }

    unique_ptr<local_file_cacher> cacher;
};

TEST_F(UnsafeSandboxTest, RunTest) {
    unsafe_sandbox box(*cacher, "test");
    box.create_file("input.txt", "1 2\n");
    process_options options = shell("read a b; echo $((a + b))");
    options.stdin_redirect = "input.txt";
    options.stdout_redirect = "output.txt";

    auto result = box.run(options);
    EXPECT_TRUE(result.box_success);
    EXPECT_TRUE(result.evaluation_success);
    EXPECT_EQ(result.stats.status, exit_status::OK);
    EXPECT_EQ(box.get_file_to_string("output.txt"), "3\n");
    box.cleanup(true);
    EXPECT_FALSE(exists(box.root_path()));
}

TEST_F(UnsafeSandboxTest, NonzeroReturnTest) {
    unsafe_sandbox box(*cacher, "test");
    auto result = box.run(shell("exit 43"));
    EXPECT_TRUE(result.box_success);
    EXPECT_FALSE(result.evaluation_success);
    EXPECT_EQ(result.stats.status, exit_status::NONZERO_RETURN);
    EXPECT_EQ(result.stats.exit_code, 43);
}

TEST_F(UnsafeSandboxTest, SignalTest) {
    unsafe_sandbox box(*cacher, "test");
    auto result = box.run(shell("kill -SEGV $$"));
    EXPECT_EQ(result.stats.status, exit_status::SIGNAL);
    EXPECT_EQ(result.stats.signal, SIGSEGV);
}

TEST_F(UnsafeSandboxTest, CpuTimeLimitTest) {
    unsafe_sandbox box(*cacher, "test");
    auto result = box.run(shell("while true; do :; done"));
    EXPECT_EQ(result.stats.status, exit_status::TIMEOUT);
}

TEST_F(UnsafeSandboxTest, WallTimeLimitTest) {
    unsafe_sandbox box(*cacher, "test");
    elapsed_time timer;
    auto result = box.run(shell("sleep 30", 0.5));
    EXPECT_EQ(result.stats.status, exit_status::TIMEOUT_WALL);
    // 整个进程组都被杀死，不会等待 sleep 结束
    EXPECT_LT(timer.seconds(), 10);
}

TEST_F(UnsafeSandboxTest, MissingExecutableTest) {
    unsafe_sandbox box(*cacher, "test");
    process_options options;
    options.command = {"./not-exist"};
    auto result = box.run(options);
    EXPECT_FALSE(result.box_success);
    EXPECT_EQ(result.stats.status, exit_status::SANDBOX_ERROR);
}

TEST_F(UnsafeSandboxTest, MountTest) {
    path host = fresh_temp_dir() / "shared";
    create_directories(host);
    unsafe_sandbox box(*cacher, "test");
    process_options options = shell("echo mounted > shared/result.txt");
    options.mounts = {{host, "shared", true}};
    auto result = box.run(options);
    EXPECT_TRUE(result.evaluation_success);
    EXPECT_EQ(read_file_content(host / "result.txt"), "mounted\n");
}

TEST_F(UnsafeSandboxTest, StartProcessDoesNotBlockTest) {
    unsafe_sandbox box(*cacher, "test");
    elapsed_time timer;
    auto handle = box.start_process(shell("sleep 1"));
    EXPECT_LT(timer.seconds(), 0.5);
    EXPECT_FALSE(handle->finished());
    EXPECT_THROW(box.collect_result(), sandbox_error);
    EXPECT_THROW(box.start_process(shell("true")), sandbox_error);

    wait_for_all({handle});
    EXPECT_TRUE(handle->finished());
    EXPECT_TRUE(box.collect_result().evaluation_success);
}

TEST_F(UnsafeSandboxTest, UnsafeFilenameTest) {
    unsafe_sandbox box(*cacher, "test");
    path outside = box.root_path() / "escape.txt";
    EXPECT_THROW(box.create_file("../escape.txt", ""), sandbox_error);
    EXPECT_THROW(box.create_file("sub/../../escape.txt", ""), sandbox_error);
    EXPECT_THROW(box.create_file(outside.string(), ""), sandbox_error);
    EXPECT_THROW(box.create_file("", ""), sandbox_error);
    EXPECT_THROW(box.create_file_from_storage(outside.string(), sha1_digest("")), sandbox_error);
    EXPECT_FALSE(exists(outside));

    // 文件名中的 ".." 只要不是单独的路径分量就是安全的
    EXPECT_NO_THROW(box.create_file("a..b.txt", ""));
}

TEST_F(UnsafeSandboxTest, CreateSandboxTest) {
    EXPECT_NO_THROW(create_sandbox(*cacher, "unsafe"));
    SANDBOX_BACKEND = "docker";
    EXPECT_THROW(create_sandbox(*cacher, "docker"), internal_error);
    SANDBOX_BACKEND = "unsafe";
}
