#pragma once

#include <string>
#include "config.hpp"
#include "judge/language.hpp"
#include "judge/runtime.hpp"
#include "judge/submission.hpp"

namespace codejudge {

/**
 * @brief 一次沙箱执行的原始结果
 * 由 sandbox_runner 产生，交给 classify 分类后即丢弃
 */
struct execution_outcome {
    std::string out;

    std::string err;

    /**
     * @brief 是否以返回值 0 正常退出
     */
    bool exited_normally = false;

    /**
     * @brief 是否因为超出时钟时间限制而被杀死
     * 超时时无论是否已经产生了部分输出，都视为超时
     */
    bool timed_out = false;

    /**
     * @brief 返回值，被信号杀死时为 -1
     */
    int exitcode = -1;

    /**
     * @brief 导致进程终止的信号，正常退出时为 -1
     */
    int signal = -1;

    long long elapsed_ms = 0;
};

/**
 * @brief 在沙箱中执行一次选手程序
 * 每次执行都会创建一个独占的工作目录，挂载进沙箱后执行，执行结束后删除。
 * 不同测试点的执行不共享任何文件，因此可以并发调用 run。
 */
struct sandbox_runner {
    /**
     * @param config 全局配置，提供工作目录根目录、输出限制等
     * @param runtime 隔离运行环境
     */
    sandbox_runner(const configuration &config, const container_runtime &runtime);

    /**
     * @brief 执行一次选手程序
     * 编译和运行共享同一个时间限制。
     * 选手程序的任何失败（编译错误、崩溃、超时被杀死）都通过返回值报告。
     * @param source 选手代码
     * @param profile 选手代码的语言配置
     * @param input 输入数据，为空时不创建输入文件
     * @param limits 资源限制，调用方需要填充默认值
     * @return 执行结果
     * @throw internal_error 若无法创建工作目录、无法写入文件或者无法启动隔离环境，
     *                       包括宿主机命令以 runtime.failure_exitcode() 退出
     */
    execution_outcome run(const std::string &source,
                          const language_profile &profile,
                          const std::string &input,
                          const resource_limits &limits) const;

private:
    const configuration &config;
    const container_runtime &runtime;
};

}  // namespace codejudge
