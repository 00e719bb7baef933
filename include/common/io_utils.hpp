#pragma once

#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将内容写入文本文件，文件存在时覆盖
 * @throw std::system_error 若文件无法打开或者写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，
 * 如果语言配置中的文件名包含 "../"，那么选手代码可能被写到工作目录以外。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 一次执行独占的工作目录
 * 析构时删除整个目录，保证超时、崩溃等任何情况下都不会留下选手代码和输入数据
 */
struct scoped_workspace {
    scoped_workspace();
    scoped_workspace(const std::filesystem::path &dir, bool keep);
    scoped_workspace(scoped_workspace &&);
    ~scoped_workspace();

    scoped_workspace &operator=(scoped_workspace &&);

    const std::filesystem::path &path() const;

    /**
     * @brief 立即删除工作目录
     */
    void release();

private:
    std::filesystem::path dir;
    bool valid;

    // DEBUG 模式下保留工作目录以便手动检查
    bool keep;
};

/**
 * @brief 在 parent 下创建名为 [prefix]-[uuid] 的工作目录
 * @param parent 存放所有工作目录的文件夹
 * @param prefix 工作目录名前缀
 * @param keep 若为真，析构时不删除工作目录
 * @throw std::filesystem::filesystem_error 若无法创建目录
 */
scoped_workspace make_workspace(const std::filesystem::path &parent, const std::string &prefix, bool keep = false);

}  // namespace codejudge
