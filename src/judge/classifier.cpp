#include "judge/classifier.hpp"
#include <cmath>
#include "common/io_utils.hpp"

namespace arbiter {
using namespace std;

status map_backend_status(int status_id) {
    switch (status_id) {
        case 3:
            return status::ACCEPTED;
        case 4:
            return status::WRONG_ANSWER;
        case 5:
            return status::TIME_LIMIT_EXCEEDED;
        case 6:
            return status::COMPILATION_ERROR;
        case 7:   // SIGSEGV
        case 8:   // SIGXFSZ
        case 9:   // SIGFPE
        case 10:  // SIGABRT
        case 11:  // NZEC
        case 12:  // Other
            return status::RUNTIME_ERROR;
        case 1:
        case 2:
        case 13:
        case 14:
        default:
            return status::SYSTEM_ERROR;
    }
}

int elapsed_ms(const execution_outcome &outcome) {
    return static_cast<int>(lround(outcome.time * 1000));
}

status classify(const execution_outcome &outcome, const expectation &expect) {
    status mapped = map_backend_status(outcome.status_id);
    if (mapped == status::COMPILATION_ERROR || mapped == status::SYSTEM_ERROR)
        return mapped;

    if (elapsed_ms(outcome) >= expect.time_limit_ms)
        return status::TIME_LIMIT_EXCEEDED;

    if (outcome.memory_kb >= expect.memory_limit_kb)
        return status::MEMORY_LIMIT_EXCEEDED;

    if (outcome.exit_code != 0 && outcome.stderr_text.empty())
        return status::RUNTIME_ERROR;

    if (mapped == status::ACCEPTED || mapped == status::WRONG_ANSWER) {
        if (normalize_trailing_whitespace(outcome.stdout_text) == normalize_trailing_whitespace(expect.expected_output))
            return status::ACCEPTED;
        else
            return status::WRONG_ANSWER;
    }

    return mapped;
}

}  // namespace arbiter
