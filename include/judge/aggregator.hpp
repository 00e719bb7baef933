#pragma once

#include <vector>
#include "common/status.hpp"
#include "config.hpp"
#include "judge/submission.hpp"

namespace codejudge {

/**
 * @brief 评测结果的严重程度，用于 MOST_SEVERE 汇总策略
 * SYSTEM_ERROR > COMPILATION_ERROR > MEMORY_LIMIT_EXCEEDED > TIME_LIMIT_EXCEEDED > RUNTIME_ERROR > WRONG_ANSWER，
 * 通过的结果为 0
 */
int severity(status stat);

/**
 * @brief 汇总所有测试点的评测结果
 * 所有测试点都通过时为 ACCEPTED。
 * 否则 FIRST_FAILURE 策略取测试点顺序中第一个未通过的测试点的结果，因此结果和测试点顺序有关；
 * MOST_SEVERE 策略取最严重的结果，严重程度相同时取靠前的测试点。
 * @param results 按请求顺序排列的测试点结果
 * @param policy 汇总策略
 */
status aggregate(const std::vector<test_result> &results, aggregation_policy policy = aggregation_policy::FIRST_FAILURE);

}  // namespace codejudge
