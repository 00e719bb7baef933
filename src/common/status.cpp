#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::EXECUTED, "Executed")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::SYSTEM_ERROR, "Internal Error")
    (status::CONFIGURATION_ERROR, "Configuration Error")
    (status::NO_TEST_CASES, "No Test Cases")
    (status::DATABASE_ERROR, "Database Error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

bool is_correct(status stat) {
    return stat == status::ACCEPTED || stat == status::EXECUTED;
}

}  // namespace codejudge
