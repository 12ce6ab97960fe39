#include "sandbox/unsafe_sandbox.hpp"
#include <signal.h>
#include <sys/wait.h>
#include <cmath>

namespace mjudge {
using namespace std;
namespace fs = std::filesystem;

struct unsafe_process : public forked_process {
    using forked_process::forked_process;

protected:
    vector<string> build_argv() const override {
        return options.command;
    }

    const char *prepare_child() override {
        struct rlimit rlim;
        if (options.memory_limit > 0) {
            rlim.rlim_cur = rlim.rlim_max = options.memory_limit;
            if (setrlimit(RLIMIT_AS, &rlim) == -1) return "setrlimit AS";
        }
        if (options.time_limit > 0) {
            // 软限制到达时进程收到 SIGXCPU，硬限制多给一秒
            rlim.rlim_cur = (rlim_t)ceil(options.time_limit);
            rlim.rlim_max = rlim.rlim_cur + 1;
            if (setrlimit(RLIMIT_CPU, &rlim) == -1) return "setrlimit CPU";
        }
        rlim.rlim_cur = rlim.rlim_max = 0;
        if (setrlimit(RLIMIT_CORE, &rlim) == -1) return "setrlimit CORE";
        return nullptr;
    }

    execution_stats summarize(int status, const struct rusage &usage, const string &child_error) override {
        execution_stats stats;
        stats.execution_wall_clock_time = wall_time;
        stats.execution_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec * 1e-6 +
                               usage.ru_stime.tv_sec + usage.ru_stime.tv_usec * 1e-6;
        stats.execution_memory = (int64_t)usage.ru_maxrss * 1024;
        bool cpu_exceeded = options.time_limit > 0 && stats.execution_time > options.time_limit;

        if (WIFEXITED(status)) {
            stats.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            stats.signal = WTERMSIG(status);
            stats.exit_code = 128 + stats.signal;
        }

        if (!child_error.empty()) {
            stats.status = exit_status::SANDBOX_ERROR;
        } else if (killed) {
            stats.status = exit_status::TIMEOUT_WALL;
        } else if (cpu_exceeded || stats.signal == SIGXCPU) {
            stats.status = exit_status::TIMEOUT;
        } else if (stats.signal != 0) {
            stats.status = exit_status::SIGNAL;
        } else if (stats.exit_code != 0) {
            stats.status = exit_status::NONZERO_RETURN;
        } else {
            stats.status = exit_status::OK;
        }
        return stats;
    }
};

unsafe_sandbox::unsafe_sandbox(file_cacher &cacher, const string &name)
    : sandbox(cacher, name) {}

shared_ptr<process_handle> unsafe_sandbox::do_start(const process_options &options, const fs::path &side_file) {
    auto process = make_shared<unsafe_process>(box, side_file.string() + ".err", options);
    if (options.wall_time_limit > 0)
        process->deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(options.wall_time_limit));
    process->start();
    return process;
}

}  // namespace mjudge
