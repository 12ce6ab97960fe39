#pragma once

#include <sys/resource.h>
#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "common/utils.hpp"

namespace mjudge {

/**
 * @brief 进程打开重定向文件的顺序
 * 两个进程通过一对命名管道通信时，如果双方都先打开 stdin（读端），
 * 则双方都会阻塞在 open 上等待对方打开写端，从而死锁。
 * 因此交互模式下 manager 先打开 stdin，选手程序先打开 stdout。
 */
enum class redirect_order {
    STDIN_FIRST,
    STDOUT_FIRST
};

/**
 * @brief 将沙箱外的文件夹挂载到沙箱内
 */
struct directory_mount {
    /**
     * @brief 沙箱外的文件夹路径
     */
    std::filesystem::path host_path;

    /**
     * @brief 沙箱内的路径，相对于沙箱的工作目录
     */
    std::filesystem::path inside_path;

    bool writable = true;
};

/**
 * @brief 启动沙箱内进程的参数
 */
struct process_options {
    /**
     * @brief 命令及参数，command[0] 为要执行的程序
     */
    std::vector<std::string> command;

    /**
     * @brief CPU 时间限制，单位为秒，0 表示不限制
     */
    double time_limit = 0;

    /**
     * @brief 时钟时间限制，单位为秒，0 表示不限制
     */
    double wall_time_limit = 0;

    /**
     * @brief 内存限制，单位为字节，0 表示不限制
     */
    size_t memory_limit = 0;

    std::vector<directory_mount> mounts;

    /**
     * @brief 重定向文件，相对于沙箱的工作目录，为空表示不重定向
     * 重定向文件由沙箱内的子进程打开，调用方永远不会打开这些文件
     */
    std::filesystem::path stdin_redirect, stdout_redirect, stderr_redirect;

    redirect_order order = redirect_order::STDIN_FIRST;

    /**
     * @brief 是否允许创建多个进程或线程
     */
    bool multiprocess = false;
};

/**
 * @brief 进程结束后的运行信息
 */
struct execution_stats {
    /**
     * @brief CPU 时间，单位为秒
     */
    double execution_time = 0;

    /**
     * @brief 时钟时间，单位为秒
     */
    double execution_wall_clock_time = 0;

    /**
     * @brief 内存峰值，单位为字节
     */
    int64_t execution_memory = 0;

    exit_status status = exit_status::OK;

    int exit_code = 0;

    int signal = 0;
};

/**
 * @brief 表示沙箱内正在运行的进程
 * 每个进程只会被回收一次，回收之后 finished() 为真，stats() 可用
 */
struct process_handle {
    virtual ~process_handle() = default;

    /**
     * @brief 非阻塞地检查进程是否结束
     * @return 进程已经结束并被回收时返回真
     */
    virtual bool try_wait() = 0;

    /**
     * @brief 强制结束进程
     */
    virtual void kill() = 0;

    bool finished() const;

    /**
     * @brief 进程的运行信息，只有 finished() 为真时有效
     */
    const execution_stats &stats() const;

    /**
     * @brief 超过这个时间点仍未结束的进程将被 wait_for_all 杀死
     */
    std::optional<std::chrono::steady_clock::time_point> deadline;

protected:
    bool done = false;
    execution_stats result;
};

/**
 * @brief 通过 fork/exec 启动的进程
 * 子进程在 exec 之前切换到沙箱工作目录，并按照 redirect_order 打开重定向文件，
 * 子进程 exec 之前的错误通过带 O_CLOEXEC 的管道传回，在回收进程时读取，
 * 因此 start 不会因为命名管道的 open 而阻塞。
 */
struct forked_process : public process_handle {
    forked_process(const std::filesystem::path &box, const std::filesystem::path &stderr_file, const process_options &options);
    ~forked_process() override;

    void start();

    bool try_wait() override;

    /**
     * @brief 向整个进程组发送 SIGKILL
     */
    void kill() override;

    pid_t pid() const;

protected:
    /**
     * @brief 实际 exec 的命令
     */
    virtual std::vector<std::string> build_argv() const = 0;

    /**
     * @brief 在子进程中 exec 之前执行
     * @return 失败时返回失败的操作名（errno 需要被设置），成功时返回 nullptr
     */
    virtual const char *prepare_child() { return nullptr; }

    /**
     * @brief 根据 wait4 的结果计算运行信息
     * @param status wait4 返回的进程状态
     * @param usage 进程的资源使用情况
     * @param child_error 子进程 exec 之前出现的错误，为空表示没有错误
     */
    virtual execution_stats summarize(int status, const struct rusage &usage, const std::string &child_error) = 0;

    std::filesystem::path box, stderr_file;
    process_options options;
    pid_t child = -1;
    int error_fd = -1;
    elapsed_time started;
    double wall_time = 0;
    bool killed = false;
};

/**
 * @brief 等待所有进程结束
 * 只轮询进程状态，永远不会读写任何进程的标准输入输出，
 * 命名管道中的数据只由通信双方自己读写。
 * @param handles 要等待的进程
 */
void wait_for_all(const std::vector<std::shared_ptr<process_handle>> &handles);

}  // namespace mjudge
