#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace codejudge {

struct codejudge_exception : std::exception {
    codejudge_exception();
    explicit codejudge_exception(const std::string &message);

    /**
     * @brief 输出异常信息以及抛出异常时的调用栈
     */
    friend std::ostream &operator<<(std::ostream &os, const codejudge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是评测机环境的问题，比如无法创建工作目录、无法写入文件、无法启动容器，
 * 和选手提交的代码无关
 */
struct internal_error : public codejudge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示测试数据存储读取失败（存储不可用或者数据格式损坏）
 */
struct database_error : public codejudge_exception {
    database_error();
    explicit database_error(const std::string &message);
};

/**
 * @brief 表示题目不存在，或者题目没有任何测试数据
 */
struct not_found_error : public codejudge_exception {
    not_found_error();
    explicit not_found_error(const std::string &message);
};

/**
 * @brief 表示评测系统的配置不合法，比如语言配置文件格式错误
 */
struct configuration_error : public codejudge_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

}  // namespace codejudge
