#pragma once

#include <filesystem>
#include <string>

namespace mjudge {

/**
 * @brief 按内容寻址的文件存储
 * 文件以其内容的摘要（digest）作为索引，编译产物、manager、测试数据都通过摘要传递
 */
struct file_cacher {
    virtual ~file_cacher() = default;

    /**
     * @brief 保存文件
     * @param path 要保存的文件
     * @param description 文件描述，仅用于日志
     * @return 文件内容的摘要
     */
    virtual std::string put_file_from_path(const std::filesystem::path &path, const std::string &description) = 0;

    /**
     * @brief 保存字符串内容
     * @return 内容的摘要
     */
    virtual std::string put_file_content(const std::string &content, const std::string &description) = 0;

    /**
     * @brief 将摘要对应的文件复制到 path
     * @throw storage_error 摘要不存在
     */
    virtual void get_file_to_path(const std::string &digest, const std::filesystem::path &path) = 0;

    /**
     * @brief 读取摘要对应的文件内容
     * @throw storage_error 摘要不存在
     */
    virtual std::string get_file_content(const std::string &digest) = 0;

    virtual bool exists(const std::string &digest) = 0;
};

/**
 * @brief 本地文件夹实现的文件存储
 * 文件保存为 dir/[sha1]，写入时先写临时文件再重命名，因此多个评测进程可以共享同一个文件夹
 */
struct local_file_cacher : public file_cacher {
    explicit local_file_cacher(const std::filesystem::path &dir);

    std::string put_file_from_path(const std::filesystem::path &path, const std::string &description) override;
    std::string put_file_content(const std::string &content, const std::string &description) override;
    void get_file_to_path(const std::string &digest, const std::filesystem::path &path) override;
    std::string get_file_content(const std::string &digest) override;
    bool exists(const std::string &digest) override;

private:
    std::filesystem::path dir;

    std::filesystem::path path_of(const std::string &digest) const;
};

/**
 * @brief 计算内容的 SHA-1 摘要
 * @return 40 位小写十六进制字符串
 */
std::string sha1_digest(const std::string &content);

}  // namespace mjudge
