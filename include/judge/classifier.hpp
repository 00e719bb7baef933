#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/language.hpp"
#include "judge/sandbox.hpp"

namespace codejudge {

/**
 * @brief 一类语言用于判断失败原因的特征字符串
 * 特征字符串匹配本身是启发式的，因此按语言类别分组维护，而不是散落在判断逻辑中
 */
struct marker_table {
    /**
     * @brief stderr 包含这些字符串时认为是编译错误
     */
    std::vector<std::string> compile_markers;

    /**
     * @brief stderr 包含这些字符串时认为是内存超限
     */
    std::vector<std::string> memory_markers;
};

/**
 * @brief 获取语言类别对应的特征字符串表
 */
const marker_table &get_marker_table(language_family family);

/**
 * @brief text 是否包含 markers 中的任何一个字符串
 */
bool contains_marker(const std::string &text, const std::vector<std::string> &markers);

/**
 * @brief 去掉首尾的空白字符，中间的空白字符保持不变
 */
std::string trim_output(const std::string &text);

/**
 * @brief 根据执行结果判断测试点的评测结果
 * 判断顺序（先匹配先返回）：
 * 1. 超时：TIME_LIMIT_EXCEEDED
 * 2. 非正常退出：stderr 包含内存超限特征，或者被 SIGKILL 杀死（返回值 137）为 MEMORY_LIMIT_EXCEEDED；
 *    需要编译的语言且 stderr 包含编译错误特征为 COMPILATION_ERROR；否则为 RUNTIME_ERROR
 * 3. 正常退出：没有标准输出为 EXECUTED；去掉首尾空白字符后和标准输出完全一致为 ACCEPTED，否则为 WRONG_ANSWER
 * @param outcome 沙箱执行结果
 * @param family 选手代码的语言类别
 * @param expected_output 标准输出，为空表示不比较输出
 */
status classify(const execution_outcome &outcome, language_family family, const std::optional<std::string> &expected_output);

}  // namespace codejudge
