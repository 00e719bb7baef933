#pragma once

#include <filesystem>
#include <vector>
#include "judge/submission.hpp"

namespace codejudge::server {

/**
 * @brief 表示测试数据存储
 * 评测请求只给出题目 id 时，dispatcher 通过它获取题目的测试点
 */
struct test_case_fetcher {
    virtual ~test_case_fetcher();

    /**
     * @brief 获取题目的所有测试点
     * 这个函数可能被多个请求并发调用
     * @param problem_id 题目 id
     * @return 按测试点 id 排序的测试点
     * @throw not_found_error 若题目不存在或者没有测试点
     * @throw database_error 若存储不可用或者数据格式损坏
     */
    virtual std::vector<test_case> fetch(int problem_id) = 0;
};

/**
 * @brief 从本地文件夹读取测试数据
 * 每道题的测试数据保存为 [problem_dir]/[problem_id].json：
 * @code{.json}
 * [
 *     {"id": 1, "input_text": "2 2", "output_text": "4"},
 *     {"id": 2, "input_text": "1 5", "output_text": "6"}
 * ]
 * @endcode
 */
struct local_test_case_fetcher : public test_case_fetcher {
    explicit local_test_case_fetcher(const std::filesystem::path &problem_dir);

    std::vector<test_case> fetch(int problem_id) override;

private:
    std::filesystem::path problem_dir;
};

}  // namespace codejudge::server
