#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mjudge {

/**
 * @brief 编程语言，负责生成编译命令和运行命令
 * 命令模板中可以使用以下占位符：
 * {sources}: 所有源文件，每个源文件为一个参数
 * {executable}: 可执行文件名
 * {main}: 去掉扩展名的可执行文件名
 *
 * @code{.json}
 * {
 *     "name": "C++17 / g++",
 *     "source_extension": ".cpp",
 *     "executable_extension": "",
 *     "compile": [["/usr/bin/g++", "-DEVAL", "-std=gnu++17", "-O2", "-pipe", "-static", "-s", "-o", "{executable}", "{sources}"]],
 *     "evaluate": [["./{executable}"]]
 * }
 * @endcode
 */
struct language {
    std::string name;

    /**
     * @brief 源文件的扩展名，用于替换提交文件名中的 ".%l"
     */
    std::string source_extension;

    /**
     * @brief 可执行文件的扩展名，比如 Java 为 ".jar"
     */
    std::string executable_extension;

    /**
     * @brief 编译命令模板，按顺序执行
     */
    std::vector<std::vector<std::string>> compile;

    /**
     * @brief 运行命令模板
     * 除最后一条以外的命令都是运行前在选手沙箱中执行的准备命令，最后一条命令运行选手程序
     */
    std::vector<std::vector<std::string>> evaluate;

    std::vector<std::vector<std::string>> get_compilation_commands(const std::vector<std::string> &source_filenames, const std::string &executable_filename) const;

    std::vector<std::vector<std::string>> get_evaluation_commands(const std::string &executable_filename, const std::string &main) const;
};

void from_json(const nlohmann::json &j, language &lang);

/**
 * @brief 所有可用的编程语言
 */
struct language_registry {
    /**
     * @brief 包含内置语言：C11 / gcc、C++17 / g++、Bash
     */
    language_registry();

    /**
     * @brief 从 JSON 文件中读取编程语言，同名的语言会被覆盖
     * @param path JSON 文件，内容为 language 的数组
     */
    void load(const std::filesystem::path &path);

    void add(const language &lang);

    /**
     * @throw internal_error 找不到编程语言
     */
    const language &get(const std::string &name) const;

    bool contains(const std::string &name) const;

private:
    std::map<std::string, language> languages;
};

}  // namespace mjudge
