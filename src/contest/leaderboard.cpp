#include "contest/leaderboard.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <map>

namespace arbiter {
using namespace std;
using namespace nlohmann;

std::vector<leaderboard_entry> compute_leaderboard(const contest &c, const vector<submission> &submissions,
                                                   const leaderboard_options &options) {
    // (user_id, item_id) -> 按提交时间排序的提交
    map<pair<string, string>, vector<const submission *>> history;
    for (auto &submit : submissions) {
        auto *item = get_if<contest_item_target>(&submit.target.value);
        if (!item || item->contest_id != c.contest_id) continue;
        history[{submit.user_id, item->item_id}].push_back(&submit);
    }
    for (auto &[key, list] : history)
        stable_sort(list.begin(), list.end(), [](const submission *a, const submission *b) {
            return a->created_at < b->created_at;
        });

    vector<leaderboard_entry> board;
    for (auto &participant : c.participants) {
        leaderboard_entry entry;
        entry.user_id = participant.user_id;
        entry.username = participant.username;

        for (auto &problem : c.problems) {
            problem_standing standing;
            standing.item_id = problem.item_id;
            standing.title = problem.title;

            auto it = history.find({participant.user_id, problem.item_id});
            if (it != history.end()) {
                standing.attempts = it->second.size();
                int wrong_attempts = 0;
                for (auto *submit : it->second) {
                    if (submit->state == status::ACCEPTED) {
                        standing.solved = true;
                        standing.score = problem.score;
                        standing.penalty = max<time_t>(0, submit->created_at - c.start_time) / 60.0 +
                                           wrong_attempts * options.wrong_attempt_penalty;
                        break;
                    } else if (is_terminal(submit->state)) {
                        ++wrong_attempts;
                    }
                }
            }

            if (standing.solved) {
                entry.total_score += standing.score;
                entry.total_penalty += standing.penalty;
            }
            entry.problems.push_back(standing);
        }
        board.push_back(move(entry));
    }

    stable_sort(board.begin(), board.end(), [](const leaderboard_entry &a, const leaderboard_entry &b) {
        if (a.total_score != b.total_score) return a.total_score > b.total_score;
        return a.total_penalty < b.total_penalty;
    });
    return board;
}

void to_json(json &j, const problem_standing &standing) {
    j = {{"problem", standing.item_id},
         {"title", standing.title},
         {"solved", standing.solved},
         {"attempts", standing.attempts},
         {"penalty", standing.penalty}};
}

void to_json(json &j, const leaderboard_entry &entry) {
    j = {{"user_id", entry.user_id},
         {"username", entry.username},
         {"total_score", entry.total_score},
         {"total_penalty", entry.total_penalty},
         {"problems", entry.problems}};
}

leaderboard_service::leaderboard_service(server::contest_source &contests, server::submission_store &store,
                                         const leaderboard_options &options)
    : contests(contests), store(store), options(options) {}

vector<leaderboard_entry> leaderboard_service::compute(const string &contest_id) {
    contest c = contests.load_contest(contest_id);
    vector<submission> submissions = store.contest_submissions(contest_id);
    DLOG(INFO) << "Computing leaderboard of contest " << contest_id << " from " << submissions.size() << " submissions";
    return compute_leaderboard(c, submissions, options);
}

}  // namespace arbiter
