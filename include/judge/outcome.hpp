#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "judge/job.hpp"
#include "sandbox/sandbox.hpp"

namespace mjudge {

/**
 * @brief manager 可以在 feedback 文件夹中写入的部分分文件
 * 文件内容为 [0, 1] 之间的小数，仅在 manager 返回 E_ACCEPTED 时生效
 */
extern const char *const SCORE_MULTIPLIER_FILENAME;

/**
 * @brief manager 给出的评测结果
 * manager 故障时 outcome 和 text 均为空
 */
struct manager_verdict {
    std::optional<double> outcome;
    std::optional<std::vector<std::string>> text;
};

/**
 * @brief 返回值是否为 manager 约定的评测结果（E_ACCEPTED 或 E_WRONG_ANSWER）
 */
bool is_manager_verdict(int exit_code);

/**
 * @brief 根据 manager 的返回值和 feedback 文件夹计算分数
 * 1. 返回值不是 42 或 43：manager 故障，返回空结果
 * 2. 返回值为 43：0 分，"wrong"，忽略部分分文件
 * 3. 返回值为 42 且存在部分分文件：分数为文件内容，在 (0, 1) 之间时为 "partial"，否则为 "success"
 * 4. 返回值为 42：1 分，"success"
 * @param stats manager 的运行信息
 * @param feedback_dir manager 的 feedback 文件夹
 * @throw manager_error 部分分文件无法解析或者不在 [0, 1] 之间
 */
manager_verdict extract_outcome(const execution_stats &stats, const std::filesystem::path &feedback_dir);

/**
 * @brief 合并选手程序和 manager 的结果，生成最终的评测结果
 * 按顺序判断：
 * 1. 任一沙箱出错，或者 manager 没有返回约定的评测结果：评测失败
 * 2. 只运行模式：0 分，"Execution completed successfully"
 * 3. 选手程序超时、崩溃或返回值非 0：0 分，不再查看 manager 的结果
 * 4. 由 extract_outcome 计算分数
 * @param user 选手程序的结果
 * @param manager manager 的结果
 * @param only_execution 是否为只运行模式
 * @param feedback_dir manager 的 feedback 文件夹
 * @throw manager_error 部分分文件无法解析
 */
outcome_record reduce_results(const sandbox_result &user, const sandbox_result &manager, bool only_execution, const std::filesystem::path &feedback_dir);

}  // namespace mjudge
