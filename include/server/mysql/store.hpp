#pragma once

#include <ormpp/dbng.hpp>
#include <ormpp/mysql.hpp>
#include <mutex>
#include "server/common/config.hpp"
#include "server/submission_store.hpp"

/**
 * 基于 MySQL 的持久化实现，表结构和平台的 Web 端共享：
 * submissions_submission：提交，比平台多一列 judging_started_at（DATETIME NULL）
 * submissions_submissionresult：测试点结果，比平台多一列 is_hidden，memory_used 单位为 KB
 * problems_problem、problems_problemtestcase：练习题目以及测试点
 * challenges_challenge、challenges_challengetestcase：挑战以及测试点
 * contest_contest、contest_contest_managers、contest_contestitem、contest_contestparticipant：比赛
 * accounts_user、accounts_userstatistics：用户以及解题统计
 */
namespace arbiter::server::mysql {

/**
 * @brief MySQL 持久化实现
 * 所有操作共享一个数据库连接，通过 mut 串行执行；
 * 状态切换都在事务中先 SELECT ... FOR UPDATE 再 UPDATE，多个评测进程共享数据库时也不会重复领取提交。
 */
struct store : public submission_store,
               public testcase_source,
               public contest_source,
               public statistics_sink {
    /**
     * @brief 连接数据库
     * @throw database_error 无法连接数据库
     */
    explicit store(const database &config);

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

    void problem_solved(const std::string &user_id, const std::string &problem_id, const std::string &sub_id) override;

private:
    std::mutex mut;
    ormpp::dbng<ormpp::mysql> db;

    std::vector<submission> query_submissions(const char *condition, const std::string &arg, bool with_source);
};

}  // namespace arbiter::server::mysql
