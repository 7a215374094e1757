#include "judge/submission.hpp"
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace arbiter {
using namespace std;

submission_target::submission_target() : value(problem_target{}) {}

submission_target::submission_target(problem_target problem) : value(move(problem)) {}

submission_target::submission_target(contest_item_target item) : value(move(item)) {}

string submission_target::item_type() const {
    return visit(overloaded{
                     [](const problem_target &) -> string { return "problem"; },
                     [](const contest_item_target &item) -> string {
                         return item.kind == contest_item_target::item_kind::CHALLENGE ? "challenge" : "problem";
                     }},
                 value);
}

bool submission_target::is_practice() const {
    return holds_alternative<problem_target>(value);
}

optional<string> submission_target::contest_id() const {
    if (auto item = get_if<contest_item_target>(&value))
        return item->contest_id;
    return nullopt;
}

string submission_target::item_id() const {
    return visit(overloaded{
                     [](const problem_target &problem) { return problem.problem_id; },
                     [](const contest_item_target &item) { return item.wrapped_id; }},
                 value);
}

submission_target make_target(const optional<string> &problem_id,
                              const optional<string> &contest_item_id,
                              const optional<string> &contest_id,
                              const optional<string> &item_contest_id,
                              contest_item_target::item_kind kind,
                              const string &wrapped_id) {
    if (problem_id && contest_item_id)
        throw invalid_submission("Submission cannot target both a problem and a contest item");
    if (!problem_id && !contest_item_id)
        throw invalid_submission("Submission must target either a problem or a contest item");

    if (problem_id) {
        if (contest_id)
            throw invalid_submission("Practice submission of problem " + *problem_id + " must not reference a contest");
        return problem_target{*problem_id};
    }

    if (!contest_id)
        throw invalid_submission("Contest submission of item " + *contest_item_id + " must reference its contest");
    if (!item_contest_id || *item_contest_id != *contest_id)
        throw invalid_submission("Contest item " + *contest_item_id + " does not belong to contest " + *contest_id);

    contest_item_target item;
    item.item_id = *contest_item_id;
    item.contest_id = *contest_id;
    item.kind = kind;
    item.wrapped_id = wrapped_id;
    return item;
}

}  // namespace arbiter
