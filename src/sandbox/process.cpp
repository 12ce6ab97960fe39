#include "sandbox/process.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace mjudge {
using namespace std;
namespace fs = std::filesystem;

bool process_handle::finished() const {
    return done;
}

const execution_stats &process_handle::stats() const {
    return result;
}

forked_process::forked_process(const fs::path &box, const fs::path &stderr_file, const process_options &options)
    : box(box), stderr_file(stderr_file), options(options) {}

forked_process::~forked_process() {
    if (!done && child > 0) {
        LOG(WARNING) << "Process " << child << " released without being waited, killing";
        kill();
        waitpid(child, nullptr, 0);
    }
    if (error_fd != -1) close(error_fd);
}

// 子进程中只使用 write 报告错误
[[noreturn]] static void die(int fd, const char *operation) {
    const char *reason = strerror(errno);
    if (write(fd, operation, strlen(operation)) < 0 ||
        write(fd, ": ", 2) < 0 ||
        write(fd, reason, strlen(reason)) < 0) {
        // 父进程将只看到部分错误信息
    }
    _exit(127);
}

static int open_redirect(int error_fd, const fs::path &path, int flags, const char *what) {
    int fd = open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd == -1) die(error_fd, what);
    return fd;
}

void forked_process::start() {
    vector<string> args = build_argv();
    if (args.empty())
        throw sandbox_error("empty command");
    vector<char *> argv;
    for (auto &arg : args)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    fs::path stdin_path = options.stdin_redirect.empty() ? fs::path("/dev/null") : options.stdin_redirect;
    fs::path stdout_path = options.stdout_redirect.empty() ? fs::path("/dev/null") : options.stdout_redirect;
    fs::path stderr_path = options.stderr_redirect.empty() ? stderr_file : options.stderr_redirect;

    int pipe_fds[2];
    if (pipe2(pipe_fds, O_CLOEXEC) == -1)
        throw sandbox_error(string("unable to create error pipe: ") + strerror(errno));
    scoped_guard close_pipe([&] {
        close(pipe_fds[0]);
        close(pipe_fds[1]);
    });

    started = elapsed_time();
    pid_t pid = fork();
    if (pid == -1)
        throw sandbox_error(string("fork: ") + strerror(errno));

    if (pid == 0) {
        close(pipe_fds[0]);
        int fd = pipe_fds[1];
        if (setpgid(0, 0) == -1) die(fd, "setpgid");
        if (chdir(box.c_str()) == -1) die(fd, "chdir");

        int stdin_fd, stdout_fd;
        if (options.order == redirect_order::STDIN_FIRST) {
            stdin_fd = open_redirect(fd, stdin_path, O_RDONLY, "open stdin");
            stdout_fd = open_redirect(fd, stdout_path, O_WRONLY | O_CREAT | O_TRUNC, "open stdout");
        } else {
            stdout_fd = open_redirect(fd, stdout_path, O_WRONLY | O_CREAT | O_TRUNC, "open stdout");
            stdin_fd = open_redirect(fd, stdin_path, O_RDONLY, "open stdin");
        }
        int stderr_fd = open_redirect(fd, stderr_path, O_WRONLY | O_CREAT | O_TRUNC, "open stderr");

        if (dup2(stdin_fd, STDIN_FILENO) == -1) die(fd, "dup2 stdin");
        if (dup2(stdout_fd, STDOUT_FILENO) == -1) die(fd, "dup2 stdout");
        if (dup2(stderr_fd, STDERR_FILENO) == -1) die(fd, "dup2 stderr");

        signal(SIGPIPE, SIG_DFL);
        if (const char *failed = prepare_child()) die(fd, failed);

        execvp(argv[0], argv.data());
        die(fd, "execvp");
    }

    setpgid(pid, pid);  // 与子进程中的 setpgid 竞争，失败时子进程已经设置好
    close(pipe_fds[1]);
    close_pipe.dismiss();
    child = pid;
    error_fd = pipe_fds[0];
    LOG(INFO) << "Started process " << child << ": " << args[0];
}

bool forked_process::try_wait() {
    if (done) return true;
    if (child <= 0)
        throw sandbox_error("process is not started");

    int status = 0;
    struct rusage usage;
    pid_t ret = wait4(child, &status, WNOHANG, &usage);
    if (ret == 0) return false;
    if (ret == -1) {
        if (errno == EINTR) return false;
        throw sandbox_error(string("wait4: ") + strerror(errno));
    }
    wall_time = started.seconds();

    string child_error;
    {
        defer {
            close(error_fd);
            error_fd = -1;
        };
        char buf[512];
        ssize_t len;
        while ((len = read(error_fd, buf, sizeof(buf))) > 0)
            child_error.append(buf, len);
    }

    result = summarize(status, usage, child_error);
    done = true;
    if (!child_error.empty())
        LOG(ERROR) << "Process " << child << " failed to start: " << child_error;
    return true;
}

void forked_process::kill() {
    if (done || child <= 0) return;
    killed = true;
    if (::kill(-child, SIGKILL) == -1 && errno != ESRCH)
        ::kill(child, SIGKILL);
}

pid_t forked_process::pid() const {
    return child;
}

void wait_for_all(const vector<shared_ptr<process_handle>> &handles) {
    while (true) {
        bool all_finished = true;
        auto now = chrono::steady_clock::now();
        for (auto &handle : handles) {
            if (handle->try_wait()) continue;
            all_finished = false;
            if (handle->deadline && now >= *handle->deadline) {
                LOG(WARNING) << "Process exceeded its wall clock deadline, killing";
                handle->kill();
                handle->deadline = now + chrono::seconds(1);
            }
        }
        if (all_finished) return;
        this_thread::sleep_for(chrono::milliseconds(5));
    }
}

}  // namespace mjudge
