#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

/**
 * 这个头文件包含评测请求和评测结果
 * 包含：
 * 1. test_case 类（表示一个测试点的输入和标准输出）
 * 2. resource_limits 类（表示一次执行的资源限制）
 * 3. execution_request 类（表示一个评测请求）
 * 4. test_result 类（表示一个测试点的评测结果）
 * 5. execution_result 类（表示整个评测请求的评测结果）
 */
namespace codejudge {

/**
 * @brief 表示一个测试点
 */
struct test_case {
    /**
     * @brief 测试点 id
     * 为空时使用测试点在请求中的位置（从 1 开始）作为 id
     */
    std::optional<int> id;

    /**
     * @brief 输入数据，作为选手程序的 stdin
     */
    std::string input;

    /**
     * @brief 标准输出
     * 为空（或者为空字符串）时只要求选手程序正常运行结束，不比较输出
     */
    std::optional<std::string> expected_output;

    /**
     * @brief 是否需要比较标准输出
     */
    bool has_expected_output() const;
};

/**
 * @brief 一次执行的资源限制
 * 值为 0 表示使用默认值
 */
struct resource_limits {
    /**
     * @brief 时钟时间限制，包括编译时间和运行时间
     * @note 单位为毫秒
     */
    int timeout_ms = 0;

    /**
     * @brief 内存限制，同时作为 swap 限制，不允许使用 swap 绕过内存限制
     * @note 单位为 MB
     */
    int memory_mb = 0;

    /**
     * @brief CPU 权重
     */
    int cpu_shares = 0;
};

/**
 * @brief 评测请求
 * 测试数据来源为以下三者之一：problem_id、input、test_cases，
 * 同时存在时优先级为 test_cases > input > problem_id
 */
struct execution_request {
    /**
     * @brief 题目 id，从测试数据存储中获取该题的测试点
     */
    std::optional<int> problem_id;

    /**
     * @brief 自定义输入，评测一个没有标准输出的测试点
     */
    std::optional<std::string> input;

    /**
     * @brief 请求直接携带的测试点
     */
    std::optional<std::vector<test_case>> test_cases;

    /**
     * @brief 选手代码
     */
    std::string source;

    /**
     * @brief 选手代码的语言，如：python, java, cpp, go, javascript
     */
    std::string language;

    resource_limits limits;
};

/**
 * @brief 一个测试点的评测结果
 */
struct test_result {
    int id = 0;

    std::string input;

    std::optional<std::string> expected_output;

    /**
     * @brief 选手程序的 stdout（已去掉首尾空白字符）
     */
    std::string actual_output;

    status result = status::SYSTEM_ERROR;

    bool is_correct = false;

    /**
     * @brief 执行时间（毫秒），包括编译时间
     */
    long long elapsed_ms = 0;

    /**
     * @brief 诊断信息，选手程序的 stderr，或者内部错误的原因
     */
    std::string error;
};

/**
 * @brief 整个评测请求的评测结果
 * test_results 和请求的测试点一一对应，顺序和请求中的测试点顺序一致
 */
struct execution_result {
    status overall_status = status::ACCEPTED;

    std::size_t total_tests = 0;

    std::size_t passed_tests = 0;

    std::vector<test_result> test_results;

    /**
     * @brief 请求级错误的说明，比如测试数据获取失败的原因
     */
    std::string message;
};

}  // namespace codejudge
