#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "judge/language.hpp"
#include "judge/submission.hpp"

namespace codejudge {

/**
 * @brief 表示一种隔离运行环境（容器运行时）
 * 隔离运行环境需要保证：
 * 1. 没有网络访问
 * 2. 只能写入挂载进来的工作目录
 * 3. 内存硬限制，进程数限制
 * 4. 不能提权
 * 实现必须是无状态的，以便多个 worker 并发调用。
 */
struct container_runtime {
    virtual ~container_runtime();

    /**
     * @brief 工作目录在隔离环境内的路径
     * @param workspace 工作目录在宿主机上的路径
     */
    virtual std::string mount_point(const std::filesystem::path &workspace) const = 0;

    /**
     * @brief 生成在隔离环境中运行 program 的宿主机命令
     * @param workspace 工作目录在宿主机上的路径
     * @param profile 选手代码的语言配置，决定使用的镜像
     * @param limits 资源限制（已经填充了默认值）
     * @param name 本次执行的唯一名称，用于超时后停止隔离环境
     * @param program 在隔离环境中执行的命令
     * @return 宿主机上执行的命令的 argv
     */
    virtual std::vector<std::string> command(const std::filesystem::path &workspace,
                                             const language_profile &profile,
                                             const resource_limits &limits,
                                             const std::string &name,
                                             const std::vector<std::string> &program) const = 0;

    /**
     * @brief 强制停止名为 name 的隔离环境
     * 在宿主机命令超时被杀死后调用，不抛出异常
     */
    virtual void terminate(const std::string &name) const = 0;

    /**
     * @brief 宿主机命令自身失败时使用的返回值
     * 比如无法连接容器服务、无法拉取镜像，此时隔离环境中的程序根本没有运行，
     * sandbox_runner 将其作为内部错误而不是选手程序的运行时错误报告。
     * @return -1 表示宿主机命令没有这样的返回值
     */
    virtual int failure_exitcode() const;
};

/**
 * @brief 通过 docker 客户端运行容器
 * 相当于执行：
 * docker run --rm --name [name] --network=none --memory=[m]m --memory-swap=[m]m
 *     --cpu-shares=[c] --pids-limit=[p] --security-opt=no-new-privileges --cap-drop=ALL
 *     -v [workspace]:/app [image] sh -c [command]
 */
struct docker_runtime : public container_runtime {
    /**
     * @param docker docker 客户端的路径
     * @param pids_limit 容器内的进程数限制，避免 fork 炸弹
     */
    docker_runtime(const std::string &docker, int pids_limit);

    std::string mount_point(const std::filesystem::path &workspace) const override;

    std::vector<std::string> command(const std::filesystem::path &workspace,
                                     const language_profile &profile,
                                     const resource_limits &limits,
                                     const std::string &name,
                                     const std::vector<std::string> &program) const override;

    void terminate(const std::string &name) const override;

    /**
     * @return 125，docker run 自身出错时的返回值
     */
    int failure_exitcode() const override;

private:
    std::string docker;
    int pids_limit;
};

}  // namespace codejudge
