#include "sandbox/runguard_sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include "common/utils.hpp"
#include "config.hpp"

namespace mjudge {
using namespace std;
namespace fs = std::filesystem;

execution_stats runguard_stats(const runguard_result &result, double wall_time_limit) {
    execution_stats stats;
    stats.execution_time = max(result.cpu_time, 0.0);
    stats.execution_wall_clock_time = max(result.wall_time, 0.0);
    stats.execution_memory = max<int64_t>(result.memory, 0);
    stats.exit_code = result.exitcode;
    stats.signal = max(result.signal, 0);

    if (!result.valid || !result.internal_error.empty()) {
        stats.status = exit_status::SANDBOX_ERROR;
    } else if (result.time_result.find("timelimit") != string::npos) {
        if (wall_time_limit > 0 && result.wall_time >= wall_time_limit)
            stats.status = exit_status::TIMEOUT_WALL;
        else
            stats.status = exit_status::TIMEOUT;
    } else if (stats.signal > 0) {
        stats.status = exit_status::SIGNAL;
    } else if (result.exitcode != 0) {
        stats.status = exit_status::NONZERO_RETURN;
    } else {
        stats.status = exit_status::OK;
    }
    return stats;
}

struct runguard_process : public forked_process {
    runguard_process(const fs::path &box, const fs::path &side_file, const process_options &options, const vector<string> &argv)
        : forked_process(box, side_file.string() + ".log", options), metafile(side_file.string() + ".meta"), argv(argv) {}

    /**
     * @brief 第一次调用时发送 SIGTERM，runguard 会杀死被监控的程序并写入 meta 文件
     * 之后的调用发送 SIGKILL
     */
    void kill() override {
        if (done || child <= 0) return;
        if (!terminated) {
            terminated = true;
            ::kill(child, SIGTERM);
        } else {
            forked_process::kill();
        }
    }

protected:
    vector<string> build_argv() const override {
        return argv;
    }

    execution_stats summarize(int status, const struct rusage &, const string &child_error) override {
        execution_stats stats;
        if (!child_error.empty()) {
            stats.status = exit_status::SANDBOX_ERROR;
            return stats;
        }
        runguard_result result = read_runguard_result(metafile);
        if (!result.internal_error.empty())
            LOG(ERROR) << "runguard internal error: " << result.internal_error;
        else if (!result.valid)
            LOG(ERROR) << "runguard exited with status " << status << " without writing " << metafile;
        return runguard_stats(result, options.wall_time_limit);
    }

private:
    fs::path metafile;
    vector<string> argv;
    bool terminated = false;
};

runguard_sandbox::runguard_sandbox(file_cacher &cacher, const string &name)
    : sandbox(cacher, name),
      runguard(get_env("RUNGUARD", "runguard")),
      run_user(get_env("RUNUSER", "")),
      run_group(get_env("RUNGROUP", "")) {}

shared_ptr<process_handle> runguard_sandbox::do_start(const process_options &options, const fs::path &side_file) {
    vector<string> argv;
    to_string_list(argv, runguard);
    if (!run_user.empty()) to_string_list(argv, "-u", run_user);
    if (!run_group.empty()) to_string_list(argv, "-g", run_group);
    if (options.wall_time_limit > 0) to_string_list(argv, "-T", fmt::format("{:.3f}", options.wall_time_limit));
    if (options.time_limit > 0) to_string_list(argv, "-t", fmt::format("{:.3f}", options.time_limit));
    if (options.memory_limit > 0) to_string_list(argv, "-m", options.memory_limit / 1024);
    if (!options.multiprocess) to_string_list(argv, "-p", 1);
    to_string_list(argv, "--no-core-dumps",
                   "-V", fmt::format("E_ACCEPTED={}", (int)E_ACCEPTED),
                   "-V", fmt::format("E_WRONG_ANSWER={}", (int)E_WRONG_ANSWER),
                   "-M", side_file.string() + ".meta");
    if (options.stderr_redirect.empty())
        to_string_list(argv, "-e", side_file.string() + ".err");
    to_string_list(argv, "--", options.command);

    auto process = make_shared<runguard_process>(box, side_file, options, argv);
    // runguard 自己负责时钟时间限制，这里只是防止 runguard 本身没有结束
    if (options.wall_time_limit > 0)
        process->deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(options.wall_time_limit + 2));
    process->start();
    return process;
}

}  // namespace mjudge
