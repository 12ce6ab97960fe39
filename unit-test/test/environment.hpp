#pragma once

#include <filesystem>
#include <string>
#include "judge/job.hpp"
#include "storage/file_cacher.hpp"

/**
 * 测试用的评测环境
 * 用法：
 * 1. 在 SetUpTestCase 中调用 setup_test_environment()
 * 2. 每个测试调用 fresh_temp_dir() 获得独立的临时目录，以便检查评测后目录是否被清理
 * 3. 用 make_job 构造一个 Bash 语言的评测任务
 */
namespace mjudge {

void setup_test_environment();

/**
 * @brief 创建一个新的临时目录并将 TEMP_DIR 指向它
 */
std::filesystem::path fresh_temp_dir();

/**
 * @brief 统计目录下的条目数
 */
size_t count_entries(const std::filesystem::path &dir);

/**
 * @brief 构造评测任务，manager 和选手程序都是 bash 脚本
 * @param manager manager 脚本，需要包含 #!/bin/bash
 * @param user 选手脚本，通过 /bin/bash 运行
 */
evaluation_job make_job(file_cacher &cacher, const std::string &manager, const std::string &user,
                        const std::string &input = "1 2\n", const std::string &answer = "3\n");

}  // namespace mjudge
