#pragma once

#include <ctime>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "judge/language.hpp"
#include "judge/runner.hpp"
#include "server/submission_store.hpp"

namespace arbiter {

/**
 * @brief 一次 judge 调用的结果
 */
struct judge_report {
    /**
     * @brief 评测之后（或者已经是终态时）保存的提交
     */
    submission submit;

    std::vector<testcase_result> results;

    /**
     * @brief 本次调用是否真正完成了评测
     * 提交已经是终态时为 false，此时不会修改任何数据
     */
    bool fresh = false;
};

void to_json(nlohmann::json &j, const testcase_result &result);

/**
 * @brief 输出提交 id、评测结果以及测试点结果，用于命令行的 judge 模式
 */
void to_json(nlohmann::json &j, const judge_report &report);

/**
 * @brief 提交状态机
 * PENDING -> RUNNING -> {AC, WA, TLE, MLE, RE, CE, ERROR}
 * 只有 orchestrator 修改提交的状态，每个提交最多被评测一次。
 */
struct orchestrator {
    orchestrator(server::submission_store &store,
                 server::testcase_source &testcases,
                 server::statistics_sink &statistics,
                 const language_registry &languages,
                 const testcase_runner &runner);

    /**
     * @brief 同步评测一个提交，返回时评测结果已经保存
     * 对已经是终态的提交重复调用不会产生新的测试点结果，也不会修改评测结果
     * @param sub_id 提交 id
     * @throw unsupported_language 提交的语言不支持，此时提交已经被设为 SYSTEM_ERROR
     * @throw already_judging 提交正在被其他 worker 评测
     * @throw orchestrator_error 多次重试后仍然无法保存评测结果，提交保持 RUNNING 状态
     * @throw invalid_submission 提交不存在或者评测目标不合法
     */
    judge_report judge(const std::string &sub_id);

    /**
     * @brief 将 RUNNING 状态超过 max_age_seconds 的提交重新设为 PENDING
     * @param now 当前时间
     * @return 重新分发的提交数量
     */
    int sweep_stale(time_t now, int max_age_seconds);

private:
    server::submission_store &store;
    server::testcase_source &testcases;
    server::statistics_sink &statistics;
    const language_registry &languages;
    const testcase_runner &runner;

    judge_report stored_report(const std::string &sub_id);

    run_outcome run(const submission &submit);

    server::completion persist(const submission &submit, time_t started_at, const run_outcome &outcome);

    void update_statistics(const submission &submit);
};

}  // namespace arbiter
