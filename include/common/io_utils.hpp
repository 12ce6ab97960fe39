#pragma once

#include <filesystem>
#include <string>

namespace mjudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，由于评测系统
 * 运行时需要 root 权限，如果拿到的文件名包含 "../"，那么
 * 最后有可能导致系统重要文件被覆盖导致安全问题。
 * 绝对路径同样会被拒绝。
 * @param subpath 被检查的文件名
 * @throw sandbox_error 文件名为空、为绝对路径或含有 ".." 时抛出
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 在 root 下创建一个名为 prefix-[uuid] 的新文件夹
 * @param root 父文件夹，不存在时会被创建
 * @param prefix 文件夹名前缀
 * @param perms 新文件夹的权限，不受 umask 影响
 * @return 新文件夹的路径
 */
std::filesystem::path create_unique_directory(const std::filesystem::path &root, const std::string &prefix, std::filesystem::perms perms);

}  // namespace mjudge
