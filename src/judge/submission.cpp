#include "judge/submission.hpp"

namespace codejudge {

bool test_case::has_expected_output() const {
    return expected_output && !expected_output->empty();
}

}  // namespace codejudge
