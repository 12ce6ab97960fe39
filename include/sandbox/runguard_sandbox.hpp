#pragma once

#include "runguard.hpp"
#include "sandbox/sandbox.hpp"

namespace mjudge {

/**
 * @brief 通过 runguard 运行程序的沙箱
 * runguard 的路径由环境变量 RUNGUARD 指定，运行用户和用户组由 RUNUSER 和 RUNGROUP 指定。
 * runguard 负责限制时间、内存和进程数，并将运行信息写入 meta 文件。
 * 重定向文件由 exec runguard 之前的子进程打开，runguard 继承这些文件描述符。
 */
struct runguard_sandbox : public sandbox {
    runguard_sandbox(file_cacher &cacher, const std::string &name);

protected:
    std::shared_ptr<process_handle> do_start(const process_options &options, const std::filesystem::path &side_file) override;

private:
    std::string runguard, run_user, run_group;
};

/**
 * @brief 将 runguard 的 meta 文件内容转换为运行信息
 * @param result runguard 的 meta 文件内容
 * @param wall_time_limit 时钟时间限制，用于区分 CPU 超时和时钟超时
 */
execution_stats runguard_stats(const runguard_result &result, double wall_time_limit);

}  // namespace mjudge
