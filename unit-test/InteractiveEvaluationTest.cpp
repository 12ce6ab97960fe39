#include <glog/logging.h>
#include <chrono>
#include <future>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/channel.hpp"
#include "judge/evaluation.hpp"
#include "judge/outcome.hpp"
#include "test/environment.hpp"
#include "test/mock_sandbox.hpp"

using namespace std;
using namespace std::filesystem;
using namespace mjudge;

static const string sum_manager = R"SH(#!/bin/bash
cat "$1"
read result
if [ "$result" == "$(cat "$2")" ]; then exit 42; else exit 43; fi
)SH";

static const string sum_user = R"(read a b
echo $((a + b))
)";

class InteractiveEvaluationTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        temp = fresh_temp_dir();
        cacher = make_unique<local_file_cacher>(STORAGE_DIR);
    }

    /**
     * @brief 在另一个线程中评测，评测发生死锁时测试直接失败
     */
    outcome_record evaluate(const evaluation_job &job, sandbox_factory factory = create_sandbox) {
        kattis_task task("interactive", *cacher, languages, factory);
        auto future = async(launch::async, [&] { return task.evaluate(job); });
        if (future.wait_for(chrono::seconds(60)) != future_status::ready)
            LOG(FATAL) << "Evaluation of " << job.info << " deadlocked";
        return future.get();
    }

    path temp;
    language_registry languages;
    unique_ptr<local_file_cacher> cacher;
};

TEST_F(InteractiveEvaluationTest, AcceptedTest) {
    auto record = evaluate(make_job(*cacher, sum_manager, sum_user));
    EXPECT_TRUE(record.success());
    ASSERT_TRUE(record.outcome());
    EXPECT_DOUBLE_EQ(*record.outcome(), 1.0);
    EXPECT_EQ(*record.text(), vector<string>{"success"});
    ASSERT_TRUE(record.stats());
    EXPECT_EQ(record.stats()->status, exit_status::OK);

    // fifo 目录、feedback 目录和两个沙箱都被删除
    EXPECT_EQ(count_entries(temp), 0);
}

TEST_F(InteractiveEvaluationTest, WrongAnswerTest) {
    auto record = evaluate(make_job(*cacher, sum_manager, "read a b\necho $((a - b))\n"));
    EXPECT_TRUE(record.success());
    EXPECT_DOUBLE_EQ(*record.outcome(), 0.0);
    EXPECT_EQ(*record.text(), vector<string>{"wrong"});
}

TEST_F(InteractiveEvaluationTest, LargeOutputEchoTest) {
    // 输出超过管道缓冲区的大小
    auto record = evaluate(make_job(*cacher, R"(#!/bin/bash
head -c 70000 /dev/zero | tr '\0' 'a'
exec 1>&-
cat > /dev/null
exit 42
)", "cat\n"));
    EXPECT_TRUE(record.success());
    EXPECT_DOUBLE_EQ(*record.outcome(), 1.0);
    EXPECT_EQ(*record.text(), vector<string>{"success"});
}

TEST_F(InteractiveEvaluationTest, LargeOutputThenExitTest) {
    auto record = evaluate(make_job(*cacher, R"(#!/bin/bash
head -c 70000 /dev/zero
exit 42
)", "cat > /dev/null\n"));
    EXPECT_TRUE(record.success());
    EXPECT_DOUBLE_EQ(*record.outcome(), 1.0);
}

TEST_F(InteractiveEvaluationTest, PartialScoreTest) {
    auto record = evaluate(make_job(*cacher, R"(#!/bin/bash
echo 0.5 > "$3/score_multiplier.txt"
exit 42
)", "cat > /dev/null\n"));
    EXPECT_TRUE(record.success());
    EXPECT_DOUBLE_EQ(*record.outcome(), 0.5);
    EXPECT_EQ(*record.text(), vector<string>{"partial"});
}

TEST_F(InteractiveEvaluationTest, WrongAnswerIgnoresMultiplierTest) {
    auto record = evaluate(make_job(*cacher, R"(#!/bin/bash
echo 0.5 > "$3/score_multiplier.txt"
exit 43
)", "cat > /dev/null\n"));
    EXPECT_TRUE(record.success());
    EXPECT_DOUBLE_EQ(*record.outcome(), 0.0);
    EXPECT_EQ(*record.text(), vector<string>{"wrong"});
}

TEST_F(InteractiveEvaluationTest, UserWallTimeLimitTest) {
    auto job = make_job(*cacher, R"(#!/bin/bash
cat > /dev/null
exit 42
)", "sleep 30\n");
    job.time_limit = 0.5;
    auto record = evaluate(job);

    // manager 接受了，但选手程序超时
    EXPECT_TRUE(record.success());
    EXPECT_DOUBLE_EQ(*record.outcome(), 0.0);
    EXPECT_EQ(*record.text(), vector<string>{"Execution timed out (wall clock limit exceeded)"});
    EXPECT_EQ(record.stats()->status, exit_status::TIMEOUT_WALL);
}

TEST_F(InteractiveEvaluationTest, UserCrashTest) {
    auto record = evaluate(make_job(*cacher, R"(#!/bin/bash
cat > /dev/null
exit 42
)", "kill -SEGV $$\n"));
    EXPECT_TRUE(record.success());
    EXPECT_DOUBLE_EQ(*record.outcome(), 0.0);
    EXPECT_EQ(record.stats()->status, exit_status::SIGNAL);
}

TEST_F(InteractiveEvaluationTest, ManagerBadExitCodeTest) {
    auto record = evaluate(make_job(*cacher, R"(#!/bin/bash
cat > /dev/null
exit 0
)", "echo 3\n"));
    EXPECT_FALSE(record.success());
    EXPECT_FALSE(record.outcome());
    EXPECT_FALSE(record.text());

    // 评测失败时保留 fifo 目录、feedback 目录和两个沙箱
    EXPECT_EQ(count_entries(temp), 4);
}

TEST_F(InteractiveEvaluationTest, ManagerMalformedMultiplierTest) {
    auto record = evaluate(make_job(*cacher, R"(#!/bin/bash
echo lots > "$3/score_multiplier.txt"
exit 42
)", "cat > /dev/null\n"));
    EXPECT_FALSE(record.success());
    EXPECT_FALSE(record.outcome());
}

TEST_F(InteractiveEvaluationTest, KeepSandboxTest) {
    auto job = make_job(*cacher, sum_manager, sum_user);
    job.keep_sandbox = true;
    auto record = evaluate(job);
    EXPECT_TRUE(record.success());
    EXPECT_EQ(count_entries(temp), 4);
}

TEST_F(InteractiveEvaluationTest, OnlyExecutionTest) {
    auto job = make_job(*cacher, sum_manager, "read a b\necho 0\n");
    job.only_execution = true;
    auto record = evaluate(job);
    EXPECT_TRUE(record.success());
    EXPECT_DOUBLE_EQ(*record.outcome(), 0.0);
    EXPECT_EQ(*record.text(), vector<string>{"Execution completed successfully"});
}

TEST_F(InteractiveEvaluationTest, ChannelWiringTest) {
    mock::mock_sandbox_factory mock;
    mock.on_start = [](mock::mock_sandbox &box, const process_options &options) -> shared_ptr<process_handle> {
        // 两个进程启动时 fifo 都已经存在
        path fifo_dir = options.mounts.at(0).host_path;
        EXPECT_TRUE(is_fifo(fifo_dir / "u_to_m"));
        EXPECT_TRUE(is_fifo(fifo_dir / "m_to_u"));
        if (box.get_name() == "manager_evaluate")
            return mock::fake_process::exited(42);
        return mock::fake_process::exited(0);
    };

    auto record = evaluate(make_job(*cacher, sum_manager, sum_user), mock.factory());
    EXPECT_TRUE(record.success());
    EXPECT_DOUBLE_EQ(*record.outcome(), 1.0);

    ASSERT_EQ(mock.started.size(), 2);
    auto &manager = mock.started[0];
    auto &user = mock.started[1];
    EXPECT_EQ(manager.sandbox_name, "manager_evaluate");
    EXPECT_EQ(user.sandbox_name, "user_evaluate");

    EXPECT_EQ(manager.options.command, vector<string>({"./manager", "input.txt", "answer.txt", "feedback"}));
    EXPECT_EQ(manager.options.stdin_redirect, path("fifo/u_to_m"));
    EXPECT_EQ(manager.options.stdout_redirect, path("fifo/m_to_u"));
    EXPECT_EQ(manager.options.order, redirect_order::STDIN_FIRST);
    ASSERT_EQ(manager.options.mounts.size(), 2);
    EXPECT_EQ(manager.options.mounts[0].inside_path, path(FIFO_MOUNT));
    EXPECT_EQ(manager.options.mounts[1].inside_path, path("feedback"));

    EXPECT_EQ(user.options.command, vector<string>({"/bin/bash", "user.sh"}));
    EXPECT_EQ(user.options.stdin_redirect, path("fifo/m_to_u"));
    EXPECT_EQ(user.options.stdout_redirect, path("fifo/u_to_m"));
    EXPECT_EQ(user.options.order, redirect_order::STDOUT_FIRST);
    ASSERT_EQ(user.options.mounts.size(), 1);
    EXPECT_EQ(user.options.mounts[0].host_path, manager.options.mounts[0].host_path);
}

TEST_F(InteractiveEvaluationTest, ResourceLimitsTest) {
    mock::mock_sandbox_factory mock;
    mock.on_start = [](mock::mock_sandbox &box, const process_options &) -> shared_ptr<process_handle> {
        return mock::fake_process::exited(box.get_name() == "manager_evaluate" ? 43 : 0);
    };

    auto job = make_job(*cacher, sum_manager, sum_user);
    job.time_limit = 2;
    job.memory_limit = 64 << 20;
    evaluate(job, mock.factory());
    ASSERT_EQ(mock.started.size(), 2);
    auto &manager = mock.started[0].options;
    auto &user = mock.started[1].options;
    EXPECT_DOUBLE_EQ(manager.time_limit, TRUSTED_SANDBOX_MAX_TIME);
    EXPECT_DOUBLE_EQ(manager.wall_time_limit, TRUSTED_SANDBOX_MAX_TIME);
    EXPECT_EQ(manager.memory_limit, TRUSTED_SANDBOX_MAX_MEMORY_KIB * 1024);
    EXPECT_DOUBLE_EQ(user.time_limit, 2);
    EXPECT_DOUBLE_EQ(user.wall_time_limit, 5);
    EXPECT_EQ(user.memory_limit, 64 << 20);

    // 选手时间限制很长时 manager 的时间限制随之增加
    mock.started.clear();
    job.time_limit = 200;
    evaluate(job, mock.factory());
    EXPECT_DOUBLE_EQ(mock.started[0].options.time_limit, 201);
}

TEST_F(InteractiveEvaluationTest, ManagerWritesMultiplierTest) {
    mock::mock_sandbox_factory mock;
    mock.on_start = [](mock::mock_sandbox &box, const process_options &options) -> shared_ptr<process_handle> {
        if (box.get_name() != "manager_evaluate")
            return mock::fake_process::exited(0);
        write_file_content(options.mounts.at(1).host_path / SCORE_MULTIPLIER_FILENAME, "0.75\n");
        return mock::fake_process::exited(42);
    };
    auto record = evaluate(make_job(*cacher, sum_manager, sum_user), mock.factory());
    EXPECT_TRUE(record.success());
    EXPECT_DOUBLE_EQ(*record.outcome(), 0.75);
    EXPECT_EQ(*record.text(), vector<string>{"partial"});
    EXPECT_EQ(count_entries(temp), 0);
}

TEST_F(InteractiveEvaluationTest, SandboxFailureTest) {
    mock::mock_sandbox_factory mock;
    mock.on_start = [](mock::mock_sandbox &box, const process_options &) -> shared_ptr<process_handle> {
        if (box.get_name() == "manager_evaluate")
            return mock::fake_process::exited(42);
        return mock::fake_process::with_status(exit_status::SANDBOX_ERROR);
    };
    auto record = evaluate(make_job(*cacher, sum_manager, sum_user), mock.factory());
    EXPECT_FALSE(record.success());
    EXPECT_EQ(count_entries(temp), 4);
}
