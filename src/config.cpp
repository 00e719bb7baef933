#include "config.hpp"
#include <algorithm>
#include <thread>
#include "common/exceptions.hpp"

namespace codejudge {
using namespace std;

configuration::configuration()
    : docker("docker"),
      run_dir(filesystem::temp_directory_path()),
      workers(max(1u, thread::hardware_concurrency())) {}

aggregation_policy parse_aggregation_policy(const string &name) {
    if (name == "first_failure")
        return aggregation_policy::FIRST_FAILURE;
    else if (name == "most_severe")
        return aggregation_policy::MOST_SEVERE;
    else
        throw configuration_error("Unrecognized aggregation policy " + name);
}

}  // namespace codejudge
