#pragma once

#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 汇总测试点结果时如何决定整个提交的评测结果
 */
enum class aggregation_policy {
    FIRST_FAILURE,  // 按测试点顺序，第一个未通过的测试点的结果
    MOST_SEVERE     // 所有未通过的测试点中最严重的结果
};

/**
 * @brief 评测系统的全局配置
 * 在 main 中根据命令行参数和环境变量构造一次，之后传给 dispatcher 和 sandbox_runner 使用，
 * 评测过程中不再读取环境变量。
 */
struct configuration {
    configuration();

    /**
     * @brief docker 客户端的路径
     * @defaultValue docker，从 PATH 中查找
     */
    std::string docker;

    /**
     * @brief 存放工作目录的根目录
     * 每个测试点执行时会在这里创建一个独占的工作目录，执行结束后删除
     *
     * RUN_DIR
     * ├── code-execution-[uuid] // 一次执行的工作目录，挂载到容器的 /app
     * │   ├── main.cpp // 选手程序的代码（文件名由语言决定）
     * │   ├── input.txt // 测试点的输入数据，作为选手程序的 stdin
     * │   └── a.out // 编译产物
     * └── ...
     * @defaultValue 系统临时目录
     */
    std::filesystem::path run_dir;

    /**
     * @brief 本地测试数据目录，为空表示不支持通过题目 id 评测
     *
     * PROBLEM_DIR
     * ├── 1001.json // 题目 1001 的测试数据
     * └── ...
     */
    std::filesystem::path problem_dir;

    /**
     * @brief 额外的语言配置文件，为空表示只使用内置的语言
     */
    std::filesystem::path languages_file;

    /**
     * @brief 同时运行的沙箱数量上限
     * @defaultValue CPU 核心数
     */
    std::size_t workers;

    /**
     * @brief 容器内的进程数限制
     */
    int pids_limit = 100;

    /**
     * @brief stdout、stderr 各自最多收集多少字节
     */
    std::size_t output_limit = 1 << 20;

    /**
     * @brief 超时杀死沙箱后最多再等待多少毫秒
     */
    int kill_grace_ms = 1000;

    int default_timeout_ms = 5000;

    int default_memory_mb = 128;

    int default_cpu_shares = 512;

    aggregation_policy aggregation = aggregation_policy::FIRST_FAILURE;

    /**
     * @brief 是否开启 DEBUG 模式
     * 如果开启 DEBUG 模式，评测系统将不会删除工作目录，
     * 以便手动检查写入的代码和输入数据是否符合预期。
     */
    bool debug = false;
};

/**
 * @brief 解析汇总策略名
 * @param name first_failure 或者 most_severe
 * @throw configuration_error 若策略名不合法
 */
aggregation_policy parse_aggregation_policy(const std::string &name);

}  // namespace codejudge
