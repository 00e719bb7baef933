#include "judge/classifier.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <csignal>

namespace codejudge {
using namespace std;

// 各语言运行时内存不足时的报错，以及 docker 报告容器被 OOM killer 杀死
static const vector<string> memory_markers = {
    "OOMKilled",
    "OutOfMemoryError",               // Java
    "MemoryError",                    // Python
    "std::bad_alloc",                 // C++
    "JavaScript heap out of memory",  // Node.js
    "Cannot allocate memory"};

// 容器内存超限时 OOM killer 发送 SIGKILL，docker run 以 128 + 9 退出
static const int OOM_KILLED_EXITCODE = 128 + SIGKILL;

static const marker_table compiled_markers = {
    {"error:", "compilation failed"},
    memory_markers};

static const marker_table interpreted_markers = {
    {},
    memory_markers};

const marker_table &get_marker_table(language_family family) {
    switch (family) {
        case language_family::COMPILED:
            return compiled_markers;
        case language_family::INTERPRETED:
        default:
            return interpreted_markers;
    }
}

bool contains_marker(const string &text, const vector<string> &markers) {
    return any_of(markers.begin(), markers.end(), [&](const string &marker) {
        return boost::algorithm::contains(text, marker);
    });
}

string trim_output(const string &text) {
    return boost::algorithm::trim_copy(text);
}

status classify(const execution_outcome &outcome, language_family family, const optional<string> &expected_output) {
    if (outcome.timed_out)
        return status::TIME_LIMIT_EXCEEDED;

    if (!outcome.exited_normally) {
        auto &markers = get_marker_table(family);
        if (contains_marker(outcome.err, markers.memory_markers) ||
            outcome.exitcode == OOM_KILLED_EXITCODE || outcome.signal == SIGKILL)
            return status::MEMORY_LIMIT_EXCEEDED;
        else if (contains_marker(outcome.err, markers.compile_markers))
            return status::COMPILATION_ERROR;
        else
            return status::RUNTIME_ERROR;
    }

    if (!expected_output)
        return status::EXECUTED;

    return trim_output(outcome.out) == trim_output(*expected_output)
               ? status::ACCEPTED
               : status::WRONG_ANSWER;
}

}  // namespace codejudge
