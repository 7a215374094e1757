#include "access/capability.hpp"

namespace arbiter {
using namespace std;

bool actor::is_anonymous() const {
    return user_id.empty();
}

const char *get_capability_name(capability cap) {
    switch (cap) {
        case capability::SUPERUSER:
            return "SUPERUSER";
        case capability::OWNER:
            return "OWNER";
        case capability::CONTEST_MANAGER:
            return "CONTEST_MANAGER";
        case capability::NONE:
        default:
            return "NONE";
    }
}

capability check_capability(const actor &who, const submission &submit, const contest *c) {
    if (who.is_anonymous()) return capability::NONE;
    if (who.is_superuser) return capability::SUPERUSER;
    if (who.user_id == submit.user_id) return capability::OWNER;
    if (c && submit.target.contest_id() == c->contest_id && c->is_manager(who.user_id))
        return capability::CONTEST_MANAGER;
    return capability::NONE;
}

bool can_view_result_details(const actor &who, capability cap, const contest *c, const testcase_result &result) {
    if (who.is_anonymous()) return false;
    if (cap != capability::NONE) return true;
    if (!c) return false;
    if (c->phase == contest_phase::LIVE) return result.is_sample;
    if (c->phase == contest_phase::ENDED || c->phase == contest_phase::ARCHIVED) return true;
    return false;
}

vector<testcase_result> visible_results(const actor &who, const submission &submit, const contest *c,
                                        const vector<testcase_result> &results) {
    capability cap = check_capability(who, submit, c);
    vector<testcase_result> visible;
    for (auto &result : results)
        if (can_view_result_details(who, cap, c, result))
            visible.push_back(result);
    return visible;
}

}  // namespace arbiter
