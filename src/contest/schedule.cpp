#include "contest/schedule.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <chrono>

namespace arbiter {
using namespace std;

contest_phase phase_at(time_t start, time_t end, time_t now) {
    if (now < start) return contest_phase::SCHEDULED;
    if (now < end) return contest_phase::LIVE;
    return contest_phase::ENDED;
}

vector<string> validate_contest_submission(const contest &c, const string &user_id, time_t now) {
    vector<string> errors;
    if (c.phase != contest_phase::LIVE)
        errors.push_back(fmt::format("Contest is {}, not accepting submissions", get_phase_name(c.phase)));
    if (now < c.start_time)
        errors.push_back("Contest has not started yet");
    if (now > c.end_time)
        errors.push_back("Contest has ended");
    if (!c.is_participant(user_id))
        errors.push_back("You are not a participant in this contest");
    return errors;
}

contest_reconciler::contest_reconciler(server::contest_source &contests, int interval_seconds)
    : contests(contests), interval_seconds(interval_seconds) {}

contest_reconciler::~contest_reconciler() {
    stop();
}

int contest_reconciler::reconcile_once(time_t now) {
    int count = contests.transition_phases(now);
    if (count > 0)
        LOG(INFO) << "Transitioned phases of " << count << " contests";
    return count;
}

void contest_reconciler::start() {
    {
        scoped_lock lock(mut);
        stopping = false;
    }
    thd = thread([this] { loop(); });
}

void contest_reconciler::stop() {
    {
        scoped_lock lock(mut);
        stopping = true;
    }
    cond.notify_all();
    if (thd.joinable()) thd.join();
}

void contest_reconciler::loop() {
    unique_lock lock(mut);
    while (!stopping) {
        lock.unlock();
        try {
            reconcile_once(time(nullptr));
        } catch (exception &ex) {
            // 下一次定时仍会重试
            LOG(ERROR) << "Unable to transition contest phases, " << ex.what();
        }
        lock.lock();
        cond.wait_for(lock, chrono::seconds(interval_seconds), [this] { return stopping; });
    }
}

}  // namespace arbiter
