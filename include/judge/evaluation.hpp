#pragma once

#include <string>
#include <variant>
#include "judge/job.hpp"
#include "judge/language.hpp"
#include "sandbox/sandbox.hpp"
#include "storage/file_cacher.hpp"

/**
 * 这个头文件包含 Kattis 题型的评测流程
 * manager 是出题人提供的可信程序，调用方式为 ./manager input.txt answer.txt feedback，
 * 以 E_ACCEPTED(42) 退出表示通过，以 E_WRONG_ANSWER(43) 退出表示错误，
 * 通过时可以在 feedback/score_multiplier.txt 中写入部分分。
 *
 * 交互模式：manager 与选手程序同时运行，通过一对命名管道通信
 * 非交互模式：先运行选手程序得到输出，再将输出作为 manager 的 stdin
 */
namespace mjudge {

extern const char *const MANAGER_FILENAME;
extern const char *const INPUT_FILENAME;
extern const char *const ANSWER_FILENAME;

/**
 * @brief 交互模式的评测状态，严格按顺序转移，每个评测任务只执行一次
 */
enum class interactive_state {
    INIT,
    CHANNELS_READY,
    MANAGER_STARTED,
    USER_STARTED,
    BOTH_RUNNING,
    COLLECTED,
    CLEANED_UP
};

const char *get_state_name(interactive_state state);

/**
 * @brief 评测需要的外部依赖
 */
struct evaluation_context {
    file_cacher &cacher;
    const sandbox_factory &factory;
    const language &lang;
};

/**
 * @brief 交互模式
 * 1. 创建命名管道 u_to_m、m_to_u 和 feedback 文件夹
 * 2. 启动 manager，stdin 为 u_to_m，stdout 为 m_to_u
 * 3. 启动选手程序，stdin 为 m_to_u，stdout 为 u_to_m
 * 4. 同时等待两个进程结束，评测系统不会读写管道
 * 5. 分别收集两个沙箱的结果并合并
 */
struct interactive_evaluation {
    outcome_record evaluate(const evaluation_job &job, const evaluation_context &context) const;
};

/**
 * @brief 非交互模式
 * 1. 运行选手程序，stdin 为 input.txt，stdout 为 output/output.txt，等待其结束
 * 2. 之后才启动 manager，stdin 为选手程序的输出
 */
struct noninteractive_evaluation {
    outcome_record evaluate(const evaluation_job &job, const evaluation_context &context) const;
};

using evaluation_mode = std::variant<interactive_evaluation, noninteractive_evaluation>;

/**
 * @param parameter "interactive" 或 "non-interactive"
 * @throw std::invalid_argument 参数不合法
 */
evaluation_mode make_evaluation_mode(const std::string &parameter);

/**
 * @brief Kattis 题型
 * 评测模式在构造时确定
 */
struct kattis_task {
    /**
     * @param parameter "interactive" 或 "non-interactive"
     * @param cacher 文件存储
     * @param languages 可用的编程语言
     * @param factory 沙箱工厂，默认根据 SANDBOX_BACKEND 创建沙箱
     */
    kattis_task(const std::string &parameter, file_cacher &cacher, const language_registry &languages, sandbox_factory factory = create_sandbox);

    const char *name() const;

    bool is_interactive() const;

    /**
     * @brief 编译选手程序
     * 沙箱或文件存储出错时返回 success 为假的结果
     */
    compilation_result compile(const compilation_job &job) const;

    /**
     * @brief 评测选手程序
     * 评测任务不合法、基础设施出错、manager 故障时返回 outcome_record::failure()，不会重试
     */
    outcome_record evaluate(const evaluation_job &job) const;

private:
    evaluation_mode mode;
    file_cacher &cacher;
    const language_registry &languages;
    sandbox_factory factory;
};

}  // namespace mjudge
