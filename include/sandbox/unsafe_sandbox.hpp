#pragma once

#include "sandbox/sandbox.hpp"

namespace mjudge {

/**
 * @brief 只通过 setrlimit 限制资源的沙箱
 * 不切换用户，也不限制文件系统的访问，只能用于调试和单元测试。
 * 内存限制通过 RLIMIT_AS 实现，CPU 时间限制通过 RLIMIT_CPU 实现，
 * 时钟时间限制由 wait_for_all 杀死整个进程组实现。
 */
struct unsafe_sandbox : public sandbox {
    unsafe_sandbox(file_cacher &cacher, const std::string &name);

protected:
    std::shared_ptr<process_handle> do_start(const process_options &options, const std::filesystem::path &side_file) override;
};

}  // namespace mjudge
