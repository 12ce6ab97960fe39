#pragma once

#include <filesystem>
#include <string>

namespace mjudge {

/**
 * @brief 评测系统与 manager 之间约定的退出码
 * manager 只能以 E_ACCEPTED 或 E_WRONG_ANSWER 退出，其他退出码均视为 manager 故障
 */
enum error_codes {
    E_SUCCESS = 0,
    E_INTERNAL_ERROR = 2,

    E_ACCEPTED = 42,
    E_WRONG_ANSWER = 43,
    E_COMPILER_ERROR = 45
};

/**
 * @brief manager（可信程序）的最长运行时间，单位为秒
 * manager 的实际时间限制为 max(选手时间限制 + 1, TRUSTED_SANDBOX_MAX_TIME)
 */
extern double TRUSTED_SANDBOX_MAX_TIME;

/**
 * @brief manager（可信程序）的内存限制，单位为 KiB
 * 与题目配置的内存限制无关
 */
extern size_t TRUSTED_SANDBOX_MAX_MEMORY_KIB;

/**
 * @brief 编译命令的 CPU 时间限制，单位为秒
 */
extern double COMPILATION_MAX_TIME;

/**
 * @brief 编译命令的内存限制，单位为 KiB
 */
extern size_t COMPILATION_MAX_MEMORY_KIB;

/**
 * @brief 评测时产生的临时文件的根目录
 *
 * TEMP_DIR
 * ├── manager_evaluate-[uuid] // manager 的沙箱
 * │   ├── box // 沙箱内程序的工作目录
 * │   │   ├── manager
 * │   │   ├── input.txt
 * │   │   ├── answer.txt
 * │   │   ├── fifo -> TEMP_DIR/fifo-[uuid] // 交互模式下挂载的管道文件夹
 * │   │   └── feedback -> TEMP_DIR/feedback-[uuid]
 * │   ├── program.meta // runguard 的运行信息
 * │   └── program.err // 程序的 stderr 输出
 * ├── user_evaluate-[uuid] // 选手程序的沙箱
 * ├── fifo-[uuid] // 交互模式下的两个命名管道 u_to_m 和 m_to_u
 * ├── feedback-[uuid] // manager 可以写入 score_multiplier.txt
 * └── output-[uuid] // 非交互模式下选手程序的输出 output.txt
 */
extern std::filesystem::path TEMP_DIR;

/**
 * @brief 按内容寻址的文件存储目录，文件名为文件内容的 SHA-1
 */
extern std::filesystem::path STORAGE_DIR;

/**
 * @brief 沙箱实现，可以为 runguard 或 unsafe
 * unsafe 仅通过 setrlimit 限制资源，只能用于调试和单元测试
 */
extern std::string SANDBOX_BACKEND;

/**
 * @brief 是否保留所有沙箱和临时文件夹
 */
extern bool KEEP_SANDBOX;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统将不再检查程序是否在特权模式下执行。
 */
extern bool DEBUG;

}  // namespace mjudge
