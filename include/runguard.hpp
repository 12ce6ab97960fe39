#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace mjudge {

/**
 * @brief runguard 写入 meta 文件的运行信息
 * meta 文件每行的格式为 "key: value"
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double cpu_time = -1;

    int exitcode = -1;

    int signal = -1;

    std::string internal_error;

    /**
     * @brief 实际内存使用（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief 为空，或者是 soft-timelimit、hard-timelimit
     */
    std::string time_result;

    /**
     * @brief meta 文件中是否至少包含退出码
     */
    bool valid = false;
};

/**
 * @brief 读入并解析 runguard 产生的 meta 文件
 * @param metafile meta 文件路径，不存在时返回的结果 valid 为假
 */
runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace mjudge
