#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/process.hpp"

/**
 * 这个头文件包含评测任务的数据结构
 * 1. compilation_job / compilation_result：编译任务及其结果
 * 2. evaluation_job：评测任务
 * 3. outcome_record：评测任务的最终结果
 */
namespace mjudge {

/**
 * @brief 表示存放在文件存储中的文件，比如编译好的选手程序或者 manager
 */
struct executable {
    std::string filename;

    /**
     * @brief 文件内容的摘要
     */
    std::string digest;
};

struct compilation_job {
    std::string language;

    /**
     * @brief 提交的文件，codename（如 "solution.%l"）到文件摘要
     */
    std::map<std::string, std::string> files;

    bool keep_sandbox = false;

    /**
     * @brief 任务描述，仅用于日志
     */
    std::string info;
};

struct compilation_result {
    /**
     * @brief 沙箱是否正常工作
     */
    bool success = false;

    /**
     * @brief 是否编译通过
     */
    bool compilation_success = false;

    std::vector<std::string> text;

    std::optional<execution_stats> stats;

    std::map<std::string, executable> executables;
};

struct evaluation_job {
    std::string language;

    /**
     * @brief 选手程序的 CPU 时间限制，单位为秒
     */
    double time_limit = 1;

    /**
     * @brief 选手程序的内存限制，单位为字节
     */
    size_t memory_limit = 256 << 20;

    /**
     * @brief 输入数据的摘要
     */
    std::string input;

    /**
     * @brief 标准答案的摘要
     */
    std::string output;

    /**
     * @brief 选手程序，必须恰好有一个
     */
    std::map<std::string, executable> executables;

    /**
     * @brief 出题人提供的程序，必须包含 manager
     */
    std::map<std::string, executable> managers;

    /**
     * @brief 选手自测时只需要知道程序是否正常运行，不需要评测结果
     */
    bool only_execution = false;

    bool keep_sandbox = false;

    bool multithreaded_sandbox = false;

    std::string info;
};

/**
 * @brief 一次评测的最终结果，在评测结束时一次性生成，之后不可修改
 */
struct outcome_record {
    outcome_record(bool success, std::optional<double> outcome, std::optional<std::vector<std::string>> text, std::optional<execution_stats> stats);

    /**
     * @brief 评测基础设施或者 manager 出错时的结果
     */
    static outcome_record failure();

    /**
     * @brief 评测是否完成，为假时表示出现了基础设施错误或者 manager 故障
     */
    bool success() const;

    /**
     * @brief [0, 1] 之间的分数，评测未完成时为空
     */
    const std::optional<double> &outcome() const;

    const std::optional<std::vector<std::string>> &text() const;

    /**
     * @brief 选手程序的运行信息，评测未完成时为空
     */
    const std::optional<execution_stats> &stats() const;

private:
    bool success_;
    std::optional<double> outcome_;
    std::optional<std::vector<std::string>> text_;
    std::optional<execution_stats> stats_;
};

void to_json(nlohmann::json &j, const execution_stats &stats);
void to_json(nlohmann::json &j, const executable &exe);
void from_json(const nlohmann::json &j, executable &exe);
void from_json(const nlohmann::json &j, compilation_job &job);
void to_json(nlohmann::json &j, const compilation_result &result);
void from_json(const nlohmann::json &j, evaluation_job &job);
void to_json(nlohmann::json &j, const outcome_record &record);

}  // namespace mjudge
