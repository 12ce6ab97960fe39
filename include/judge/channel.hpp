#pragma once

#include <filesystem>
#include <string>

namespace mjudge {

/**
 * @brief 一次评测独占的临时文件夹，比如管道文件夹、feedback 文件夹和 output 文件夹
 * 文件夹在所有进程结束之后由 release 决定是否删除，
 * 没有调用 release 的文件夹（比如评测中途出错）会保留下来以便排查问题。
 */
struct scratch_directory {
    /**
     * @brief 在 root 下创建 prefix-[uuid] 文件夹
     * @param perms 文件夹权限
     * @throw sandbox_error 无法创建文件夹
     */
    scratch_directory(const std::filesystem::path &root, const std::string &prefix, std::filesystem::perms perms);

    const std::filesystem::path &path() const;

    /**
     * @brief 评测结束后释放文件夹
     * 只有评测成功，且评测任务和全局配置都不要求保留时才删除文件夹
     * @param success 评测是否成功
     * @param keep 评测任务是否要求保留
     */
    void release(bool success, bool keep);

private:
    std::filesystem::path dir;
};

/**
 * @brief manager 与选手程序之间的一对命名管道
 * 两个管道在同一个文件夹下同时创建，同时删除
 */
struct fifo_channel {
    scratch_directory dir;

    /**
     * @brief 选手程序写、manager 读的管道
     */
    std::filesystem::path user_to_manager;

    /**
     * @brief manager 写、选手程序读的管道
     */
    std::filesystem::path manager_to_user;
};

/**
 * @brief 管道文件夹挂载到沙箱内的路径
 */
extern const char *const FIFO_MOUNT;

/**
 * @brief 在 root 下创建管道文件夹及两个命名管道 u_to_m 和 m_to_u
 * 文件夹权限为 0755，管道权限为 0666，沙箱内的进程只能通过挂载访问这两个管道。
 * 创建失败时已经创建的部分会被删除。
 * @throw sandbox_error 无法创建文件夹或管道
 */
fifo_channel create_channel_pair(const std::filesystem::path &root);

}  // namespace mjudge
