#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace arbiter {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "Pending")
    (status::RUNNING, "Running")
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::SYSTEM_ERROR, "System Error");

static const unordered_map<status, const char *> status_code = boost::assign::map_list_of
    (status::PENDING, "PENDING")
    (status::RUNNING, "RUNNING")
    (status::ACCEPTED, "AC")
    (status::WRONG_ANSWER, "WA")
    (status::TIME_LIMIT_EXCEEDED, "TLE")
    (status::MEMORY_LIMIT_EXCEEDED, "MLE")
    (status::RUNTIME_ERROR, "RE")
    (status::COMPILATION_ERROR, "CE")
    (status::SYSTEM_ERROR, "ERROR");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_short_code(status stat) {
    return status_code.at(stat);
}

status parse_short_code(const string &code) {
    for (auto &[stat, literal] : status_code)
        if (code == literal) return stat;
    throw invalid_argument("Unrecognized status code " + code);
}

bool is_terminal(status stat) {
    return stat != status::PENDING && stat != status::RUNNING;
}

}  // namespace arbiter
