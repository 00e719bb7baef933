#include <filesystem>
#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/dispatcher.hpp"
#include "test/local_runtime.hpp"

using namespace std;
using namespace codejudge;
using ::testing::Return;
using ::testing::Throw;

struct mock_test_case_fetcher : public server::test_case_fetcher {
    MOCK_METHOD(std::vector<test_case>, fetch, (int), (override));
};

static test_case make_test_case(optional<int> id, const string &input, optional<string> expected_output) {
    test_case kase;
    kase.id = id;
    kase.input = input;
    kase.expected_output = expected_output;
    return kase;
}

class DispatcherTest : public ::testing::Test {
protected:
    DispatcherTest() : config(test::test_configuration()), pool(config.workers) {
        languages.add(test::shell_profile());
        languages.add(test::compiled_shell_profile());
    }

    execution_request make_request(const string &language, const string &source) {
        execution_request request;
        request.language = language;
        request.source = source;
        return request;
    }

    configuration config;
    language_registry languages;
    test::local_runtime runtime;
    worker_pool pool;
};

TEST_F(DispatcherTest, AcceptedTest) {
    dispatcher d(config, languages, runtime, pool);
    auto request = make_request("shell", "read a b; echo $((a + b))");
    request.test_cases = vector<test_case>{make_test_case(1, "2 2", "4")};

    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::ACCEPTED);
    EXPECT_EQ(result.total_tests, 1);
    EXPECT_EQ(result.passed_tests, 1);
    ASSERT_EQ(result.test_results.size(), 1);
    EXPECT_EQ(result.test_results[0].result, status::ACCEPTED);
    EXPECT_TRUE(result.test_results[0].is_correct);
    EXPECT_EQ(result.test_results[0].actual_output, "4");
    EXPECT_EQ(result.test_results[0].input, "2 2");
}

TEST_F(DispatcherTest, WrongAnswerTest) {
    dispatcher d(config, languages, runtime, pool);
    auto request = make_request("shell", "read a b; echo $((a + b + 1))");
    request.test_cases = vector<test_case>{make_test_case(1, "2 2", "4")};

    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::WRONG_ANSWER);
    EXPECT_EQ(result.passed_tests, 0);
    ASSERT_EQ(result.test_results.size(), 1);
    EXPECT_EQ(result.test_results[0].result, status::WRONG_ANSWER);
    EXPECT_FALSE(result.test_results[0].is_correct);
    EXPECT_EQ(result.test_results[0].actual_output, "5");
}

TEST_F(DispatcherTest, CompilationErrorTest) {
    dispatcher d(config, languages, runtime, pool);
    auto request = make_request("compiled-shell", "echo 4 # syntax-error");
    request.test_cases = vector<test_case>{make_test_case(1, "2 2", "4"), make_test_case(2, "1 3", "4")};

    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::COMPILATION_ERROR);
    ASSERT_EQ(result.test_results.size(), 2);
    for (auto &test : result.test_results) {
        EXPECT_EQ(test.result, status::COMPILATION_ERROR);
        EXPECT_FALSE(test.is_correct);
        EXPECT_EQ(test.actual_output, "");
        EXPECT_NE(test.error.find("error:"), string::npos);
    }
}

TEST_F(DispatcherTest, ExecutedTest) {
    dispatcher d(config, languages, runtime, pool);
    auto request = make_request("shell", "read line; echo \"got $line\"");
    request.input = "hello";

    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::ACCEPTED);
    EXPECT_EQ(result.passed_tests, 1);
    ASSERT_EQ(result.test_results.size(), 1);
    EXPECT_EQ(result.test_results[0].id, 1);
    EXPECT_EQ(result.test_results[0].result, status::EXECUTED);
    EXPECT_TRUE(result.test_results[0].is_correct);
    EXPECT_EQ(result.test_results[0].actual_output, "got hello");
}

TEST_F(DispatcherTest, NoTestCaseSourceTest) {
    dispatcher d(config, languages, runtime, pool);
    auto result = d.execute(make_request("shell", "echo 4"));

    EXPECT_EQ(result.overall_status, status::CONFIGURATION_ERROR);
    EXPECT_EQ(result.total_tests, 0);
    EXPECT_TRUE(result.test_results.empty());
    EXPECT_EQ(runtime.launches, 0);
}

TEST_F(DispatcherTest, EmptyExpectedOutputTest) {
    dispatcher d(config, languages, runtime, pool);
    auto request = make_request("shell", "echo whatever");
    request.test_cases = vector<test_case>{make_test_case(1, "", ""), make_test_case(2, "", nullopt)};

    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::ACCEPTED);
    ASSERT_EQ(result.test_results.size(), 2);
    EXPECT_EQ(result.test_results[0].result, status::EXECUTED);
    EXPECT_EQ(result.test_results[1].result, status::EXECUTED);
}

TEST_F(DispatcherTest, OrderTest) {
    dispatcher d(config, languages, runtime, pool);
    // 输入越小运行越久，保证完成顺序和请求顺序不同
    auto request = make_request("shell", "read n; sleep 0.$((5 - n)); echo $n");
    vector<test_case> test_cases;
    for (int i = 1; i <= 5; ++i)
        test_cases.push_back(make_test_case(10 + i, to_string(i), to_string(i)));
    test_cases[2].expected_output = "wrong";
    request.test_cases = test_cases;

    auto result = d.execute(request);
    ASSERT_EQ(result.test_results.size(), 5);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(result.test_results[i].id, 11 + i);
        EXPECT_EQ(result.test_results[i].actual_output, to_string(i + 1));
    }
    EXPECT_EQ(result.passed_tests, 4);
    EXPECT_EQ(result.overall_status, status::WRONG_ANSWER);
    EXPECT_EQ(runtime.launches, 5);
}

TEST_F(DispatcherTest, FirstFailureTest) {
    dispatcher d(config, languages, runtime, pool);
    auto request = make_request("shell", "read n; if [ $n -eq 2 ]; then exit 1; fi; echo $n");
    request.test_cases = vector<test_case>{
        make_test_case(1, "1", "1"),
        make_test_case(2, "2", "2"),
        make_test_case(3, "3", "4")};

    EXPECT_EQ(d.execute(request).overall_status, status::RUNTIME_ERROR);

    config.aggregation = aggregation_policy::MOST_SEVERE;
    request.test_cases = vector<test_case>{
        make_test_case(1, "3", "4"),
        make_test_case(2, "2", "2")};
    EXPECT_EQ(d.execute(request).overall_status, status::RUNTIME_ERROR);
}

TEST_F(DispatcherTest, TimeLimitExceededTest) {
    dispatcher d(config, languages, runtime, pool);
    auto request = make_request("shell", "sleep 10; echo 4");
    request.limits.timeout_ms = 300;
    request.test_cases = vector<test_case>{make_test_case(1, "", "4")};

    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::TIME_LIMIT_EXCEEDED);
    ASSERT_EQ(result.test_results.size(), 1);
    EXPECT_EQ(result.test_results[0].result, status::TIME_LIMIT_EXCEEDED);
}

TEST_F(DispatcherTest, UnsupportedLanguageTest) {
    dispatcher d(config, languages, runtime, pool);
    auto request = make_request("cobol", "DISPLAY 'HELLO'.");
    request.test_cases = vector<test_case>{make_test_case(1, "", "HELLO")};

    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::RUNTIME_ERROR);
    ASSERT_EQ(result.test_results.size(), 1);
    EXPECT_NE(result.test_results[0].error.find("Unsupported language: cobol"), string::npos);
}

TEST_F(DispatcherTest, InternalErrorTest) {
    test::failing_runtime failing;
    dispatcher d(config, languages, failing, pool);
    auto request = make_request("shell", "echo 4");
    request.test_cases = vector<test_case>{make_test_case(1, "", "4"), make_test_case(2, "", "4")};

    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::SYSTEM_ERROR);
    EXPECT_EQ(result.total_tests, 2);
    ASSERT_EQ(result.test_results.size(), 2);
    for (auto &test : result.test_results) {
        EXPECT_EQ(test.result, status::SYSTEM_ERROR);
        EXPECT_FALSE(test.is_correct);
        EXPECT_FALSE(test.error.empty());
    }
}

TEST_F(DispatcherTest, StoppedPoolTest) {
    pool.shutdown();
    dispatcher d(config, languages, runtime, pool);
    auto request = make_request("shell", "echo 4");
    request.test_cases = vector<test_case>{make_test_case(1, "", "4"), make_test_case(2, "", "4")};

    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::ACCEPTED);
    EXPECT_EQ(result.passed_tests, 2);
}

TEST_F(DispatcherTest, IdempotenceTest) {
    dispatcher d(config, languages, runtime, pool);
    auto request = make_request("shell", "read a b; echo $((a * b))");
    request.test_cases = vector<test_case>{make_test_case(1, "3 4", "12"), make_test_case(2, "3 5", "16")};

    auto first = d.execute(request);
    auto second = d.execute(request);
    EXPECT_EQ(first.overall_status, second.overall_status);
    ASSERT_EQ(first.test_results.size(), second.test_results.size());
    for (size_t i = 0; i < first.test_results.size(); ++i) {
        EXPECT_EQ(first.test_results[i].result, second.test_results[i].result);
        EXPECT_EQ(first.test_results[i].actual_output, second.test_results[i].actual_output);
    }
}

TEST_F(DispatcherTest, DefaultLimitsTest) {
    dispatcher d(config, languages, runtime, pool);
    auto limits = d.effective_limits({0, 256, 0});
    EXPECT_EQ(limits.timeout_ms, config.default_timeout_ms);
    EXPECT_EQ(limits.memory_mb, 256);
    EXPECT_EQ(limits.cpu_shares, config.default_cpu_shares);
}

TEST_F(DispatcherTest, SourcePriorityTest) {
    mock_test_case_fetcher fetcher;
    EXPECT_CALL(fetcher, fetch(::testing::_)).Times(0);
    dispatcher d(config, languages, runtime, pool, &fetcher);

    auto request = make_request("shell", "cat");
    request.problem_id = 1001;
    request.input = "from input";
    request.test_cases = vector<test_case>{make_test_case(1, "from test cases", "from test cases")};

    auto result = d.execute(request);
    ASSERT_EQ(result.test_results.size(), 1);
    EXPECT_EQ(result.test_results[0].actual_output, "from test cases");

    request.test_cases.reset();
    result = d.execute(request);
    ASSERT_EQ(result.test_results.size(), 1);
    EXPECT_EQ(result.test_results[0].actual_output, "from input");
    EXPECT_EQ(result.test_results[0].result, status::EXECUTED);

    // 显式给出空的测试点列表
    request.test_cases = vector<test_case>();
    result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::NO_TEST_CASES);
    EXPECT_TRUE(result.test_results.empty());
}

TEST_F(DispatcherTest, ProblemIdTest) {
    mock_test_case_fetcher fetcher;
    EXPECT_CALL(fetcher, fetch(1001))
        .WillOnce(Return(vector<test_case>{make_test_case(1, "2 2", "4"), make_test_case(2, "3 3", "6")}));
    dispatcher d(config, languages, runtime, pool, &fetcher);

    auto request = make_request("shell", "read a b; echo $((a + b))");
    request.problem_id = 1001;

    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::ACCEPTED);
    EXPECT_EQ(result.total_tests, 2);
    EXPECT_EQ(result.passed_tests, 2);
}

TEST_F(DispatcherTest, ProblemIdFailureTest) {
    mock_test_case_fetcher fetcher;
    EXPECT_CALL(fetcher, fetch(404)).WillOnce(Throw(not_found_error("Problem 404 does not have any test case")));
    EXPECT_CALL(fetcher, fetch(500)).WillOnce(Throw(database_error("connection refused")));
    dispatcher d(config, languages, runtime, pool, &fetcher);

    auto request = make_request("shell", "echo 4");
    request.problem_id = 404;
    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::NO_TEST_CASES);
    EXPECT_TRUE(result.test_results.empty());

    request.problem_id = 500;
    result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::DATABASE_ERROR);
    EXPECT_NE(result.message.find("connection refused"), string::npos);
    EXPECT_EQ(runtime.launches, 0);

    dispatcher without_fetcher(config, languages, runtime, pool);
    EXPECT_EQ(without_fetcher.execute(request).overall_status, status::CONFIGURATION_ERROR);
}

TEST_F(DispatcherTest, RuntimeUnavailableTest) {
    test::unavailable_runtime unavailable;
    dispatcher d(config, languages, unavailable, pool);
    auto request = make_request("compiled-shell", "read a b; echo $((a + b))");
    request.test_cases = vector<test_case>{make_test_case(1, "2 2", "4")};

    auto result = d.execute(request);
    EXPECT_EQ(result.overall_status, status::SYSTEM_ERROR);
    ASSERT_EQ(result.test_results.size(), 1);
    EXPECT_EQ(result.test_results[0].result, status::SYSTEM_ERROR);
    EXPECT_NE(result.test_results[0].error.find("Cannot connect to the Docker daemon"), string::npos);
}
