#include "judge/aggregator.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<status, int> status_severity = boost::assign::map_list_of
    (status::WRONG_ANSWER, 1)
    (status::RUNTIME_ERROR, 2)
    (status::TIME_LIMIT_EXCEEDED, 3)
    (status::MEMORY_LIMIT_EXCEEDED, 4)
    (status::COMPILATION_ERROR, 5)
    (status::SYSTEM_ERROR, 6);
// clang-format on

int severity(status stat) {
    auto it = status_severity.find(stat);
    return it == status_severity.end() ? 0 : it->second;
}

status aggregate(const vector<test_result> &results, aggregation_policy policy) {
    const test_result *chosen = nullptr;
    for (auto &result : results) {
        if (result.is_correct) continue;
        if (policy == aggregation_policy::FIRST_FAILURE)
            return result.result;
        if (!chosen || severity(result.result) > severity(chosen->result))
            chosen = &result;
    }
    return chosen ? chosen->result : status::ACCEPTED;
}

}  // namespace codejudge
