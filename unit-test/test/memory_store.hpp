#pragma once

#include <map>
#include <mutex>
#include "server/submission_store.hpp"

/**
 * 测试用的内存存储
 * 用法：
 * 1. 通过 add_submission、testcases、limits、contests 准备数据；
 * 2. 把 memory_store 同时作为 submission_store、testcase_source、contest_source 传给被测对象；
 * 3. 直接检查 submissions、results 中的数据。
 */
namespace arbiter::server::mock {

struct memory_store : public submission_store,
                      public testcase_source,
                      public contest_source {
    std::map<std::string, submission> submissions;

    std::map<std::string, std::vector<testcase_result>> results;

    /**
     * @brief 键为 submission_target::item_id()
     */
    std::map<std::string, std::vector<testcase>> testcases;

    std::map<std::string, resource_limits> limits;

    std::map<std::string, contest> contests;

    /**
     * @brief complete 在成功之前抛出 database_error 的次数，用于模拟数据库故障
     */
    int complete_failures = 0;

    /**
     * @brief complete 被调用的次数
     */
    int complete_calls = 0;

    void add_submission(const submission &submit);

    submission load(const std::string &sub_id) override;

    std::vector<std::string> fetch_pending(std::size_t limit) override;

    bool try_begin(const std::string &sub_id, time_t now) override;

    completion complete(const std::string &sub_id, time_t started_at, status verdict,
                        const std::vector<testcase_result> &results, time_t now) override;

    bool reject(const std::string &sub_id, status verdict, time_t now) override;

    std::vector<testcase_result> results_of(const std::string &sub_id) override;

    std::vector<std::string> find_stale_running(time_t started_before) override;

    bool reoffer(const std::string &sub_id, time_t started_before) override;

    std::vector<submission> contest_submissions(const std::string &contest_id) override;

    std::vector<testcase> testcases_for(const submission_target &target) override;

    resource_limits limits_for(const submission_target &target) override;

    contest load_contest(const std::string &contest_id) override;

    int transition_phases(time_t now) override;

private:
    std::recursive_mutex mut;

    /**
     * @brief 同一用户在同一练习题目上是否有其他 AC 提交，调用时必须持有 mut
     */
    bool has_other_accepted(const submission &accepted) const;
};

}  // namespace arbiter::server::mock
