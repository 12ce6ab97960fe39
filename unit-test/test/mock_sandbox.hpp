#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "gmock/gmock.h"
#include "sandbox/sandbox.hpp"

/**
 * 测试用的沙箱，不真正启动进程
 * 用法：
 * 1. mock_sandbox_factory factory;
 * 2. factory.on_start = [](mock_sandbox &box, const process_options &options) { return fake_process::exited(42); };
 * 3. 将 factory.factory() 传给 kattis_task 或 compile
 * 4. 检查 factory.started 中记录的启动顺序和参数
 */
namespace mjudge::mock {

/**
 * @brief 创建即结束的进程，try_wait 总是返回 true
 */
struct fake_process : public process_handle {
    explicit fake_process(const execution_stats &stats);

    bool try_wait() override;

    void kill() override;

    static std::shared_ptr<fake_process> exited(int exit_code);

    static std::shared_ptr<fake_process> with_status(exit_status status);
};

struct mock_sandbox : public sandbox {
    using sandbox::sandbox;

    MOCK_METHOD(std::shared_ptr<process_handle>, do_start, (const process_options &options, const std::filesystem::path &side_file), (override));
};

struct started_process {
    std::string sandbox_name;
    process_options options;
    std::filesystem::path box;
};

struct mock_sandbox_factory {
    std::function<std::shared_ptr<process_handle>(mock_sandbox &, const process_options &)> on_start;

    std::vector<started_process> started;

    std::vector<std::filesystem::path> created;

    sandbox_factory factory();
};

}  // namespace mjudge::mock
