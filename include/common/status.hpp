#pragma once

namespace mjudge {

/**
 * @brief 表示沙箱内一个进程的结束状态
 */
enum class exit_status {
    /**
     * @brief 进程正常退出，且返回值为 0
     */
    OK = 0,

    /**
     * @brief 进程的 CPU 时间超出限制
     */
    TIMEOUT = 1,

    /**
     * @brief 进程的时钟时间超出限制，被沙箱杀死
     * 交互题中选手程序等待 manager 而不消耗 CPU 时间时，通常会得到这个结果
     */
    TIMEOUT_WALL = 2,

    /**
     * @brief 进程因为信号而终止
     * 内存超限时进程通常会因为 SIGSEGV 或 SIGKILL 终止，因此也会是这个结果
     */
    SIGNAL = 3,

    /**
     * @brief 进程正常退出，但是返回值不为 0
     * 对于 manager，返回值 42 和 43 是约定的评测结果而不是错误
     */
    NONZERO_RETURN = 4,

    /**
     * @brief 沙箱本身出错，比如 runguard 内部错误或者进程无法启动
     */
    SANDBOX_ERROR = 5
};

/**
 * @brief 获得面向选手的结束状态描述
 */
const char *get_display_message(exit_status);

/**
 * @brief 获得结束状态的名称，用于日志与 JSON
 */
const char *get_status_name(exit_status);

}  // namespace mjudge
