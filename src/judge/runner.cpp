#include "judge/runner.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <chrono>
#include <thread>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/classifier.hpp"

namespace arbiter {
using namespace std;

void sort_testcases(vector<testcase> &testcases) {
    stable_sort(testcases.begin(), testcases.end(), [](const testcase &a, const testcase &b) {
        if (a.order != b.order) return a.order < b.order;
        return a.sequence < b.sequence;
    });
}

status aggregate(const vector<testcase_result> &results) {
    for (auto &result : results)
        if (result.status != status::ACCEPTED)
            return result.status;
    return status::ACCEPTED;
}

testcase_runner::testcase_runner(execution_client &client, const language_registry &languages, const server::runner &options)
    : client(client), languages(languages), options(options) {}

void testcase_runner::on_testcase_finished(testcase_callback callback) {
    callbacks.push_back(move(callback));
}

testcase_result testcase_runner::judge_testcase(const submission &submit, const language_config &lang,
                                                const testcase &tc, const resource_limits &limits,
                                                string &compile_output) const {
    testcase_result result;
    result.testcase_id = tc.testcase_id;
    result.is_sample = tc.is_sample;
    result.is_hidden = tc.is_hidden;

    execution_request request;
    request.source_code = submit.source_code;
    request.language_id = lang.backend_id;
    request.stdin_text = tc.input;
    request.expected_output = tc.expected_output;
    request.time_limit_ms = limits.time_limit_ms;
    request.memory_limit_kb = limits.memory_limit_kb;

    for (int attempt = 0;; ++attempt) {
        try {
            execution_outcome outcome = client.execute(request);
            result.status = classify(outcome, {tc.expected_output, limits.time_limit_ms, limits.memory_limit_kb});
            result.stdout_text = outcome.stdout_text;
            result.stderr_text = outcome.stderr_text;
            result.time_ms = elapsed_ms(outcome);
            result.memory_kb = outcome.memory_kb;
            if (result.status == status::COMPILATION_ERROR)
                compile_output = outcome.compile_output;
            return result;
        } catch (executor_unreachable &ex) {
            if (attempt < options.max_retries) {
                LOG(WARNING) << submit << " testcase " << tc.testcase_id << ": judge backend unreachable, retrying. " << ex.what();
                this_thread::sleep_for(chrono::milliseconds(EXECUTOR_RETRY_DELAY_MS));
                continue;
            }
            LOG(WARNING) << submit << " testcase " << tc.testcase_id << ": judge backend unreachable after "
                         << attempt + 1 << " attempts. " << ex.what();
            result.status = status::SYSTEM_ERROR;
            result.stderr_text = ex.what();
            return result;
        } catch (executor_protocol_error &ex) {
            LOG(ERROR) << submit << " testcase " << tc.testcase_id << ": unexpected response from judge backend. " << ex;
            result.status = status::SYSTEM_ERROR;
            result.stderr_text = ex.what();
            return result;
        }
    }
}

run_outcome testcase_runner::run(const submission &submit, vector<testcase> testcases, const resource_limits &limits) const {
    const language_config &lang = languages.find(submit.language);
    resource_limits scaled = lang.scale(limits);
    sort_testcases(testcases);

    run_outcome outcome;
    for (auto &tc : testcases) {
        testcase_result result = judge_testcase(submit, lang, tc, scaled, outcome.compile_output);

        if (result.status == status::COMPILATION_ERROR) {
            // 编译错误与测试点无关，已经评测的测试点结果也一并丢弃
            outcome.results.clear();
            outcome.verdict = status::COMPILATION_ERROR;
            return outcome;
        }

        outcome.results.push_back(result);
        for (auto &callback : callbacks) callback(submit, result);

        if (result.status != status::ACCEPTED && options.policy == server::failure_policy::STOP_ON_FIRST_FAILURE)
            break;
    }

    outcome.verdict = aggregate(outcome.results);
    return outcome;
}

}  // namespace arbiter
