#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include "sandbox/process.hpp"
#include "storage/file_cacher.hpp"

namespace mjudge {

/**
 * @brief 沙箱内进程的评测结果
 */
struct sandbox_result {
    /**
     * @brief 沙箱本身是否正常工作
     */
    bool box_success = false;

    /**
     * @brief 进程是否正常退出（返回值为 0，且没有超出限制）
     */
    bool evaluation_success = false;

    execution_stats stats;
};

/**
 * @brief 一个隔离的运行环境，每次评测中每个程序各使用一个沙箱
 *
 * 沙箱的文件结构：
 * root
 * ├── box // 沙箱内进程的工作目录，也是其唯一可见的目录
 * ├── run0.err // 第一个进程的 stderr
 * ├── run0.meta // 第一个进程的 runguard 运行信息
 * └── ...
 */
struct sandbox {
    /**
     * @param cacher 文件存储，用于放入和取出沙箱内的文件
     * @param name 沙箱名，如 manager_evaluate、user_evaluate、compile
     */
    sandbox(file_cacher &cacher, const std::string &name);
    virtual ~sandbox();

    sandbox(const sandbox &) = delete;
    sandbox &operator=(const sandbox &) = delete;

    const std::string &get_name() const;

    /**
     * @brief 沙箱的根目录
     */
    const std::filesystem::path &root_path() const;

    /**
     * @brief 沙箱内进程的工作目录
     */
    const std::filesystem::path &box_path() const;

    /**
     * @brief 计算沙箱内文件在沙箱外的路径
     * @param filename 相对于工作目录的文件名，不能包含 "../"
     */
    std::filesystem::path relative_path(const std::string &filename) const;

    void create_file(const std::string &filename, const std::string &content, bool executable = false);

    /**
     * @brief 从文件存储中取出文件放入沙箱
     * @param filename 沙箱内的文件名
     * @param digest 文件摘要
     * @param executable 是否设置可执行权限
     */
    void create_file_from_storage(const std::string &filename, const std::string &digest, bool executable = false);

    /**
     * @brief 将沙箱内的文件放入文件存储
     * @return 文件摘要
     */
    std::string get_file_to_storage(const std::string &filename, const std::string &description);

    /**
     * @brief 读取沙箱内的文件，最多读取 max_size 字节
     */
    std::string get_file_to_string(const std::string &filename, size_t max_size = 1 << 16) const;

    /**
     * @brief 启动进程，不等待进程结束
     * 会先将 options.mounts 挂载到工作目录下，之后由具体的沙箱实现启动进程。
     * 这个函数永远不会打开 options 中的重定向文件。
     * @return 进程句柄，需要通过 wait_for_all 等待结束
     * @throw sandbox_error 无法挂载文件夹或者无法启动进程
     */
    std::shared_ptr<process_handle> start_process(const process_options &options);

    /**
     * @brief 获得最近一个进程的评测结果
     * @throw sandbox_error 没有进程或者进程还没有被等待
     */
    sandbox_result collect_result() const;

    /**
     * @brief 启动进程，等待进程结束，并返回结果
     * 用于编译和运行可信命令
     */
    sandbox_result run(const process_options &options);

    /**
     * @brief 释放沙箱，如果进程还没有结束则杀死进程
     * @param remove 是否删除沙箱文件夹
     */
    void cleanup(bool remove);

protected:
    /**
     * @brief 启动进程的具体实现
     * @param options 启动参数
     * @param side_file 本次运行的辅助文件前缀，位于沙箱根目录下（如 root/run0）
     */
    virtual std::shared_ptr<process_handle> do_start(const process_options &options, const std::filesystem::path &side_file) = 0;

    file_cacher &cacher;
    std::string name;
    std::filesystem::path root, box;
    std::shared_ptr<process_handle> process;
    int run_count = 0;

private:
    void mount(const directory_mount &mount);
};

using sandbox_factory = std::function<std::unique_ptr<sandbox>(file_cacher &, const std::string &)>;

/**
 * @brief 根据 SANDBOX_BACKEND 创建沙箱
 * @throw internal_error SANDBOX_BACKEND 不合法
 */
std::unique_ptr<sandbox> create_sandbox(file_cacher &cacher, const std::string &name);

/**
 * @brief 释放沙箱
 * 只有在评测成功、评测任务与全局配置都不要求保留时才删除沙箱文件夹
 */
void delete_sandbox(sandbox &box, bool success, bool keep);

}  // namespace mjudge
