#include "judge/request.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

template <typename T>
static optional<T> get_optional(const json &j, const char *key) {
    if (!j.count(key) || j.at(key).is_null()) return nullopt;
    return j.at(key).get<T>();
}

void from_json(const json &j, test_case &kase) {
    kase.id = get_optional<int>(j, "id");
    kase.input = get_optional<string>(j, "input_text").value_or("");
    kase.expected_output = get_optional<string>(j, "output_text");
}

void from_json(const json &j, execution_request &request) {
    request.problem_id = get_optional<int>(j, "problem_id");
    request.input = get_optional<string>(j, "input");
    request.test_cases = get_optional<vector<test_case>>(j, "test_cases");
    j.at("code").get_to(request.source);
    j.at("language").get_to(request.language);
    request.limits.timeout_ms = j.value("timeout_ms", 0);
    request.limits.memory_mb = j.value("memory_mb", 0);
    request.limits.cpu_shares = j.value("cpu_shares", 0);
}

void to_json(json &j, const test_result &result) {
    j = {
        {"id", result.id},
        {"input_text", result.input},
        {"output_text", result.expected_output.value_or("")},
        {"actual", result.actual_output},
        {"is_correct", result.is_correct},
        {"time_ms", result.elapsed_ms},
        {"error", result.error},
        {"status", get_display_message(result.result)}};
}

void to_json(json &j, const execution_result &result) {
    j = {
        {"overall_status", get_display_message(result.overall_status)},
        {"total_tests", result.total_tests},
        {"passed_tests", result.passed_tests},
        {"test_results", result.test_results}};
    if (!result.message.empty())
        j["message"] = result.message;
}

string dump_result(const execution_result &result) {
    return json(result).dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace codejudge
