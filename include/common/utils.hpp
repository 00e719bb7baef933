#pragma once

#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 外部命令的运行选项
 */
struct process_options {
    /**
     * @brief 时钟时间限制，为 0 表示不限制
     * 超时后将杀死外部命令所在的整个进程组
     */
    std::chrono::milliseconds timeout{0};

    /**
     * @brief stdout 和 stderr 各自最多保存多少字节，为 0 表示不限制
     * 超出部分会被读出并丢弃，避免外部命令因为管道写满而阻塞
     */
    std::size_t output_limit = 0;

    /**
     * @brief 杀死进程组后最多再等待多久让管道关闭
     * 进程组外的子孙进程可能还持有管道，我们不能无限等待
     */
    std::chrono::milliseconds kill_grace{1000};

    /**
     * @brief 超时杀死进程组后的回调
     * 比如 docker 客户端被杀死后容器仍在运行，需要在这里额外停止容器
     */
    std::function<void()> on_timeout;
};

/**
 * @brief 外部命令的运行结果
 */
struct process_result {
    std::string out;

    std::string err;

    /**
     * @brief 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则为 -1
     */
    int exitcode = -1;

    /**
     * @brief 导致外部命令终止的信号，正常退出时为 -1
     */
    int signal = -1;

    bool timed_out = false;

    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief 执行外部命令，并收集 stdout 和 stderr
 * 外部命令运行在新的进程组中，stdin 重定向为 /dev/null
 * @param options 运行选项
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)，以 nullptr 结尾
 * @return 外部命令的运行结果
 * @throw std::system_error 若无法创建管道、fork 失败或者外部命令无法执行
 */
process_result exec_program(const process_options &options, const char **argv);

/**
 * @brief 调用外部程序
 * @note 与 exec_program(argv) 的区别是，这个函数是类型安全的，而且会自动执行类型转换
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param options 运行选项
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径，
 *             也可以传入 vector<string> 来表示一组参数
 * @code{.cpp}
 *     process_options options;
 *     options.timeout = std::chrono::seconds(10);
 *     // 相当于 system("docker kill name");
 *     process_result result = call_process(options, "docker", "kill", name);
 * @endcode
 */
template <typename... Args>
process_result call_process(const process_options &options, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv;
    for (auto &arg : list)
        argv.push_back(arg.c_str());
    argv.push_back(nullptr);

#ifndef NDEBUG
    std::stringstream ss;
    for (auto &arg : list)
        ss << arg << ' ';
    DLOG(INFO) << ss.str();
#endif

    return exec_program(options, argv.data());
}

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};
