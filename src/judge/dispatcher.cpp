#include "judge/dispatcher.hpp"
#include <glog/logging.h>
#include <boost/thread/latch.hpp>
#include "common/exceptions.hpp"
#include "judge/aggregator.hpp"
#include "judge/classifier.hpp"

namespace codejudge {
using namespace std;

dispatcher::dispatcher(const configuration &config,
                       const language_registry &languages,
                       const container_runtime &runtime,
                       worker_pool &pool,
                       server::test_case_fetcher *fetcher)
    : config(config), languages(languages), pool(pool), fetcher(fetcher), runner(config, runtime) {}

resource_limits dispatcher::effective_limits(const resource_limits &limits) const {
    resource_limits result = limits;
    if (result.timeout_ms <= 0) result.timeout_ms = config.default_timeout_ms;
    if (result.memory_mb <= 0) result.memory_mb = config.default_memory_mb;
    if (result.cpu_shares <= 0) result.cpu_shares = config.default_cpu_shares;
    return result;
}

static execution_result request_failure(status stat, const string &message) {
    execution_result result;
    result.overall_status = stat;
    result.message = message;
    return result;
}

/**
 * @brief 执行一个测试点
 * 不会抛出异常，内部错误转换为 SYSTEM_ERROR
 */
test_result dispatcher::judge_test_case(const execution_request &request,
                                        const language_profile &profile,
                                        const resource_limits &limits,
                                        const test_case &kase,
                                        size_t index) const {
    test_result result;
    // 没有 id 的测试点（比如自定义输入）使用位置作为 id，保证显示顺序确定
    result.id = kase.id.value_or((int)index + 1);
    result.input = kase.input;
    result.expected_output = kase.expected_output;

    optional<string> expected_output;
    if (kase.has_expected_output()) expected_output = kase.expected_output;

    try {
        execution_outcome outcome = runner.run(request.source, profile, kase.input, limits);
        result.result = classify(outcome, profile.family, expected_output);
        result.actual_output = trim_output(outcome.out);
        result.elapsed_ms = outcome.elapsed_ms;
        result.error = move(outcome.err);
    } catch (internal_error &ex) {
        LOG(ERROR) << "Test case " << result.id << " failed with internal error: " << ex;
        result.result = status::SYSTEM_ERROR;
        result.error = ex.what();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Test case " << result.id << " failed: " << ex.what();
        result.result = status::SYSTEM_ERROR;
        result.error = ex.what();
    }

    result.is_correct = is_correct(result.result);
    DLOG(INFO) << "Test case [" << request.language << "-" << result.id
               << "], status: " << get_display_message(result.result)
               << ", time: " << result.elapsed_ms << "ms";
    return result;
}

execution_result dispatcher::execute(const execution_request &request) const {
    // 确定测试点来源，优先级：test_cases > input > problem_id
    vector<test_case> test_cases;
    if (request.test_cases) {
        test_cases = *request.test_cases;
    } else if (request.input) {
        test_case kase;
        kase.input = *request.input;
        test_cases.push_back(kase);
    } else if (request.problem_id) {
        if (!fetcher)
            return request_failure(status::CONFIGURATION_ERROR, "Judging by problem id is not enabled");
        try {
            test_cases = fetcher->fetch(*request.problem_id);
        } catch (not_found_error &ex) {
            LOG(WARNING) << "Fetching test cases of problem " << *request.problem_id << ": " << ex.what();
            return request_failure(status::NO_TEST_CASES, ex.what());
        } catch (std::exception &ex) {
            LOG(ERROR) << "Fetching test cases of problem " << *request.problem_id << ": " << ex.what();
            return request_failure(status::DATABASE_ERROR, ex.what());
        }
        LOG(INFO) << "Found " << test_cases.size() << " test cases for problem " << *request.problem_id;
    } else {
        LOG(WARNING) << "Request does not specify problem_id, input or test_cases";
        return request_failure(status::CONFIGURATION_ERROR, "One of problem_id, input or test_cases is required");
    }

    if (test_cases.empty())
        return request_failure(status::NO_TEST_CASES, "No test cases to judge");

    language_profile profile = languages.resolve(request.language);
    if (!profile.supported)
        LOG(WARNING) << "Unsupported language " << request.language;
    resource_limits limits = effective_limits(request.limits);

    LOG(INFO) << "Judging " << request.language << " submission with " << test_cases.size() << " test cases, "
              << "time limit: " << limits.timeout_ms << "ms, memory limit: " << limits.memory_mb << "MB";

    execution_result result;
    result.total_tests = test_cases.size();
    result.test_results.resize(test_cases.size());

    // 每个子任务完成后 count_down，全部完成后才读取结果
    boost::latch finished(test_cases.size());
    for (size_t i = 0; i < test_cases.size(); ++i) {
        auto task = [&, i]() {
            result.test_results[i] = judge_test_case(request, profile, limits, test_cases[i], i);
            finished.count_down();
        };
        // 线程池已经停止时在当前线程执行，保证每个测试点都有结果
        if (!pool.submit(task)) task();
    }
    finished.wait();

    for (auto &test : result.test_results)
        if (test.is_correct) ++result.passed_tests;
    result.overall_status = aggregate(result.test_results, config.aggregation);

    LOG(INFO) << "Judged " << request.language << " submission: " << get_display_message(result.overall_status)
              << ", passed " << result.passed_tests << "/" << result.total_tests;
    return result;
}

}  // namespace codejudge
