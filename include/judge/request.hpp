#pragma once

#include <nlohmann/json.hpp>
#include "judge/submission.hpp"

/**
 * 评测请求和评测结果的 JSON 格式
 *
 * 评测请求示例：
 * @code{.json}
 * {
 *     "problem_id": 1001,              // 三选一：题目 id
 *     "input": "2 2",                  // 三选一：自定义输入
 *     "test_cases": [                  // 三选一：直接给出测试点
 *         {"id": 1, "input_text": "2 2", "output_text": "4"}
 *     ],
 *     "language": "cpp",
 *     "code": "...",
 *     "timeout_ms": 5000,              // 可选，0 或缺省时使用默认值
 *     "memory_mb": 128,
 *     "cpu_shares": 512
 * }
 * @endcode
 *
 * 评测结果示例：
 * @code{.json}
 * {
 *     "overall_status": "Wrong Answer",
 *     "total_tests": 1,
 *     "passed_tests": 0,
 *     "test_results": [
 *         {
 *             "id": 1,
 *             "input_text": "2 2",
 *             "output_text": "4",
 *             "actual": "5",
 *             "is_correct": false,
 *             "time_ms": 812,
 *             "error": "",
 *             "status": "Wrong Answer"
 *         }
 *     ]
 * }
 * @endcode
 */
namespace codejudge {

void from_json(const nlohmann::json &j, test_case &kase);

void from_json(const nlohmann::json &j, execution_request &request);

void to_json(nlohmann::json &j, const test_result &result);

void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 将评测结果序列化为单行 JSON
 * 选手程序的输出可能不是合法的 UTF-8（比如输出了任意字节，或者被输出限制截断在多字节字符中间），
 * 非法字节替换为 U+FFFD，保证总能输出评测结果
 */
std::string dump_result(const execution_result &result);

}  // namespace codejudge
