#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 输入数据在工作目录中的文件名
 */
extern const char *STDIN_FILE;

/**
 * @brief 语言类别
 * 决定评测结果分类时使用哪一组特征字符串
 */
enum class language_family {
    COMPILED,    // 需要编译的语言，非正常退出时需要区分编译错误和运行时错误
    INTERPRETED  // 解释执行的语言
};

/**
 * @brief 一种语言的编译运行方式
 */
struct language_profile {
    /**
     * @brief 语言 id，如：python, java, cpp
     */
    std::string id;

    /**
     * @brief 选手代码在工作目录中的文件名
     * 对于 Java，必须是 Main.java
     */
    std::string source;

    /**
     * @brief 沙箱使用的容器镜像
     */
    std::string image;

    /**
     * @brief 编译并运行的命令模板，由 sh -c 执行
     * 可以使用的占位符：
     * {dir}: 工作目录在沙箱内的路径
     * {source}: 选手代码的文件名
     * {stdin}: 若存在输入数据则为 "< {dir}/input.txt"，否则为空
     * @code
     * g++ -o {dir}/a.out {dir}/{source} && {dir}/a.out {stdin}
     * @endcode
     */
    std::string command;

    language_family family = language_family::INTERPRETED;

    /**
     * @brief 是否是评测系统支持的语言
     * 不支持的语言仍然会进入沙箱执行，但是命令只会报告语言不受支持并非正常退出
     */
    bool supported = true;

    /**
     * @brief 生成沙箱内执行的命令
     * @param dir 工作目录在沙箱内的路径
     * @param has_stdin 工作目录中是否存在输入数据文件
     * @return 命令的 argv
     */
    std::vector<std::string> render(const std::string &dir, bool has_stdin) const;
};

void from_json(const nlohmann::json &j, language_profile &profile);

/**
 * @brief 语言 id 到编译运行方式的映射表
 * 添加语言只需要添加一条记录，评测流程中的其他部分不依赖具体有哪些语言。
 * 注册只会在评测开始前进行，之后只读，因此 resolve 可以并发调用。
 */
struct language_registry {
    /**
     * @brief 构造包含内置语言的注册表
     */
    language_registry();

    /**
     * @brief 添加或者覆盖一种语言
     * @throw configuration_error 若命令模板或者文件名不合法
     */
    void add(const language_profile &profile);

    /**
     * @brief 从 JSON 文件加载语言配置，同 id 的语言将被覆盖
     * @code{.json}
     * [
     *     {
     *         "id": "rust",
     *         "source": "main.rs",
     *         "image": "rust:1.78-slim",
     *         "command": "rustc -o {dir}/main {dir}/{source} && {dir}/main {stdin}",
     *         "compiled": true
     *     }
     * ]
     * @endcode
     * @throw configuration_error 若文件不存在或者格式不正确
     */
    void load(const std::filesystem::path &path);

    /**
     * @brief 查找语言对应的编译运行方式
     * @return 语言不存在时返回一个 supported = false 的配置，而不是抛出异常
     */
    language_profile resolve(const std::string &language) const;

    bool contains(const std::string &language) const;

    std::vector<std::string> languages() const;

private:
    std::map<std::string, language_profile> profiles;
};

}  // namespace codejudge
