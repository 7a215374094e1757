#include "contest/contest.hpp"
#include <boost/assign.hpp>
#include <algorithm>
#include <map>
#include <stdexcept>

namespace arbiter {
using namespace std;

// clang-format off
static const map<contest_phase, const char *> phase_names = boost::assign::map_list_of
    (contest_phase::DRAFT, "DRAFT")
    (contest_phase::SCHEDULED, "SCHEDULED")
    (contest_phase::LIVE, "LIVE")
    (contest_phase::ENDED, "ENDED")
    (contest_phase::ARCHIVED, "ARCHIVED");
// clang-format on

const char *get_phase_name(contest_phase phase) {
    return phase_names.at(phase);
}

contest_phase parse_phase(const string &name) {
    for (auto &[phase, phase_name] : phase_names)
        if (name == phase_name)
            return phase;
    throw invalid_argument("Unrecognized contest phase " + name);
}

bool contest::is_manager(const string &user_id) const {
    if (user_id == creator_id) return true;
    return find(manager_ids.begin(), manager_ids.end(), user_id) != manager_ids.end();
}

bool contest::is_participant(const string &user_id) const {
    return any_of(participants.begin(), participants.end(),
                  [&](const contest_participant &p) { return p.user_id == user_id; });
}

}  // namespace arbiter
