#pragma once

#include <vector>
#include "common/worker_pool.hpp"
#include "config.hpp"
#include "judge/language.hpp"
#include "judge/runtime.hpp"
#include "judge/sandbox.hpp"
#include "judge/submission.hpp"
#include "server/test_case_fetcher.hpp"

namespace codejudge {

/**
 * @brief 评测请求的调度器
 * 负责确定请求的测试点，把每个测试点作为一个子任务分发给 worker_pool，
 * 等待所有子任务完成后汇总评测结果。
 *
 * 每个子任务只写入结果数组中属于自己的位置，dispatcher 在所有子任务完成后才读取结果，
 * 因此结果数组不需要加锁。
 */
struct dispatcher {
    /**
     * @param config 全局配置
     * @param languages 语言注册表
     * @param runtime 隔离运行环境
     * @param pool 执行子任务的线程池，所有请求共享
     * @param fetcher 测试数据存储，为 nullptr 时不支持通过题目 id 评测
     */
    dispatcher(const configuration &config,
               const language_registry &languages,
               const container_runtime &runtime,
               worker_pool &pool,
               server::test_case_fetcher *fetcher = nullptr);

    /**
     * @brief 评测一个请求
     * 不会抛出异常。确定测试点之后，返回的 test_results 数量一定等于测试点数量，
     * 单个测试点的内部错误只会导致该测试点为 SYSTEM_ERROR。
     * 不能在 pool 的 worker 线程中调用，否则可能死锁。
     * @param request 评测请求
     * @return 评测结果
     */
    execution_result execute(const execution_request &request) const;

    /**
     * @brief 填充资源限制中未设置（为 0）的值
     */
    resource_limits effective_limits(const resource_limits &limits) const;

private:
    test_result judge_test_case(const execution_request &request,
                                const language_profile &profile,
                                const resource_limits &limits,
                                const test_case &kase,
                                std::size_t index) const;

    const configuration &config;
    const language_registry &languages;
    worker_pool &pool;
    server::test_case_fetcher *fetcher;
    sandbox_runner runner;
};

}  // namespace codejudge
