#pragma once

#include <string>
#include <vector>
#include "judge/job.hpp"
#include "judge/language.hpp"
#include "sandbox/sandbox.hpp"

namespace mjudge {

/**
 * @brief 计算可执行文件名
 * 将所有 codename 去掉 ".%l" 后排序，用 "_" 连接，再加上语言的可执行文件扩展名。
 * 比如 {"solution.%l", "grader.%l"} 在 C++ 下为 "grader_solution"
 * @param codenames 提交的文件名，可能包含 ".%l"
 * @param lang 编程语言
 */
std::string executable_filename(const std::vector<std::string> &codenames, const language &lang);

/**
 * @brief 在沙箱中编译选手程序，编译成功时将可执行文件放入文件存储
 * 编译失败不是错误，会体现在 compilation_success 和 text 中
 * @param job 编译任务
 * @param lang 编程语言
 * @param cacher 文件存储
 * @param factory 沙箱工厂
 */
compilation_result compile(const compilation_job &job, const language &lang, file_cacher &cacher, const sandbox_factory &factory);

}  // namespace mjudge
