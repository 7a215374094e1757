#include "judge/orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <chrono>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const testcase_result &result) {
    j = {{"testcase", result.testcase_id},
         {"sample", result.is_sample},
         {"hidden", result.is_hidden},
         {"status", get_short_code(result.status)},
         {"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"time", result.time_ms},
         {"memory", result.memory_kb}};
}

void to_json(json &j, const judge_report &report) {
    j = {{"submission", report.submit.sub_id},
         {"status", get_short_code(report.submit.state)},
         {"fresh", report.fresh},
         {"results", report.results}};
}

orchestrator::orchestrator(server::submission_store &store,
                           server::testcase_source &testcases,
                           server::statistics_sink &statistics,
                           const language_registry &languages,
                           const testcase_runner &runner)
    : store(store), testcases(testcases), statistics(statistics), languages(languages), runner(runner) {}

judge_report orchestrator::stored_report(const string &sub_id) {
    judge_report report;
    report.submit = store.load(sub_id);
    report.results = store.results_of(sub_id);
    report.fresh = false;
    return report;
}

run_outcome orchestrator::run(const submission &submit) {
    try {
        vector<testcase> cases = testcases.testcases_for(submit.target);
        resource_limits limits = testcases.limits_for(submit.target);
        return runner.run(submit, move(cases), limits);
    } catch (exception &ex) {
        // 提交已经处于 RUNNING 状态，任何错误都必须变成终态，不能让提交卡住
        LOG(ERROR) << submit << " failed to judge, " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        run_outcome outcome;
        outcome.verdict = status::SYSTEM_ERROR;
        return outcome;
    }
}

server::completion orchestrator::persist(const submission &submit, time_t started_at, const run_outcome &outcome) {
    int backoff = PERSIST_BACKOFF_MS;
    for (int attempt = 1;; ++attempt) {
        try {
            return store.complete(submit.sub_id, started_at, outcome.verdict, outcome.results, time(nullptr));
        } catch (database_error &ex) {
            if (attempt >= PERSIST_ATTEMPTS) {
                LOG(ERROR) << submit << " unable to persist verdict " << get_short_code(outcome.verdict)
                           << " after " << attempt << " attempts, " << ex;
                throw orchestrator_error(fmt::format("Unable to persist verdict of submission {}: {}", submit.sub_id, ex.what()));
            }
            LOG(WARNING) << submit << " failed to persist verdict (attempt " << attempt << "), " << ex.what();
            this_thread::sleep_for(chrono::milliseconds(backoff));
            backoff *= 2;
        }
    }
}

void orchestrator::update_statistics(const submission &submit) {
    auto &problem = get<problem_target>(submit.target.value);
    try {
        statistics.problem_solved(submit.user_id, problem.problem_id, submit.sub_id);
    } catch (exception &ex) {
        // 评测结果已经保存，统计失败只记录日志
        LOG(ERROR) << submit << " failed to update statistics of user " << submit.user_id << ", " << ex.what();
    }
}

judge_report orchestrator::judge(const string &sub_id) {
    submission submit = store.load(sub_id);
    if (is_terminal(submit.state))
        return stored_report(sub_id);
    if (submit.state == status::RUNNING)
        throw already_judging(sub_id);

    try {
        languages.find(submit.language);
    } catch (unsupported_language &ex) {
        LOG(WARNING) << submit << " uses unsupported language " << ex.language;
        if (!store.reject(sub_id, status::SYSTEM_ERROR, time(nullptr)))
            LOG(WARNING) << submit << " left PENDING state before it could be rejected";
        throw;
    }

    time_t started_at = time(nullptr);
    if (!store.try_begin(sub_id, started_at)) {
        // 其他 worker 抢先领取了提交
        judge_report report = stored_report(sub_id);
        if (is_terminal(report.submit.state)) return report;
        throw already_judging(sub_id);
    }
    submit.state = status::RUNNING;
    submit.judging_started_at = started_at;
    LOG(INFO) << submit << " judging started";

    elapsed_time timer;
    run_outcome outcome = run(submit);
    if (outcome.verdict == status::COMPILATION_ERROR)
        LOG(INFO) << submit << " compilation error: " << outcome.compile_output;

    server::completion saved = persist(submit, started_at, outcome);
    if (!saved.completed) {
        LOG(WARNING) << submit << " was re-offered while judging, verdict " << get_short_code(outcome.verdict) << " discarded";
        judge_report report = stored_report(sub_id);
        if (is_terminal(report.submit.state)) return report;
        throw already_judging(sub_id);
    }

    submit.state = outcome.verdict;
    LOG(INFO) << submit << " judged " << get_short_code(outcome.verdict) << " with " << outcome.results.size()
              << " results in " << timer.duration<chrono::milliseconds>().count() << "ms";

    if (saved.first_accepted)
        update_statistics(submit);

    judge_report report;
    report.submit = submit;
    report.results = move(outcome.results);
    report.fresh = true;
    return report;
}

int orchestrator::sweep_stale(time_t now, int max_age_seconds) {
    time_t started_before = now - max_age_seconds;
    int count = 0;
    for (auto &sub_id : store.find_stale_running(started_before)) {
        if (store.reoffer(sub_id, started_before)) {
            LOG(WARNING) << "Submission " << sub_id << " has been running for more than " << max_age_seconds
                         << " seconds, re-offered";
            ++count;
        }
    }
    return count;
}

}  // namespace arbiter
