#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace mjudge {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 比如任务配置不合法、找不到编程语言
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示评测基础设施的错误
 * 创建命名管道、临时文件夹、沙箱失败，或者无法启动沙箱内的进程。
 * 这类错误不会产生选手可见的分数，评测结果为 success=false
 */
struct sandbox_error : public judge_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 表示 manager 出现故障
 * manager 是出题人提供的可信程序，因此这个错误意味着题目配置有问题，而非选手的错误。
 * 对选手的效果与 sandbox_error 相同，但是日志中会单独标记
 */
struct manager_error : public judge_exception {
    manager_error();
    explicit manager_error(const std::string &message);
};

/**
 * @brief 表示文件存储错误，通常是找不到摘要对应的文件
 */
struct storage_error : public judge_exception {
    storage_error();
    explicit storage_error(const std::string &message);
};

}  // namespace mjudge
