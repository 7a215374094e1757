#pragma once

#include <ctime>
#include <string>
#include <vector>
#include "contest/contest.hpp"
#include "judge/submission.hpp"

/**
 * 评测引擎和持久化层之间的接口
 * 评测引擎只通过这些接口读写提交、测试点和比赛，不关心数据实际保存在哪里。
 * 所有实现都必须可以被多个 worker 并发调用。
 */
namespace arbiter::server {

/**
 * @brief complete 的结果
 */
struct completion {
    /**
     * @brief 评测结果是否保存成功
     */
    bool completed = false;

    /**
     * @brief 本次保存是否是用户在这道练习题目上的第一个 AC
     * 和评测结果在同一个事务中判定，同一用户同一题目并发 AC 时只有一个提交会得到 true
     */
    bool first_accepted = false;
};

/**
 * @brief 提交和测试点结果的存储
 */
struct submission_store {
    virtual ~submission_store();

    /**
     * @brief 读取一个提交
     * @throw invalid_submission 提交不存在，或者评测目标不合法
     * @throw database_error 数据库查询失败
     */
    virtual submission load(const std::string &sub_id) = 0;

    /**
     * @brief 按照提交时间顺序拉取最多 limit 个 PENDING 状态的提交 id
     * 拉取不会修改提交状态，领取提交必须通过 try_begin
     */
    virtual std::vector<std::string> fetch_pending(std::size_t limit) = 0;

    /**
     * @brief 尝试将提交从 PENDING 切换到 RUNNING，并记录开始评测的时间
     * 这是一个持久化的 compare-and-set 操作，保证同一个提交同一时间只会被一个 worker 评测，
     * 即使评测进程重启也不会重复评测
     * @param now 开始评测的时间，同时作为本次评测的凭据传给 complete
     * @return 是否切换成功，提交不是 PENDING 状态时返回 false
     */
    virtual bool try_begin(const std::string &sub_id, time_t now) = 0;

    /**
     * @brief 原子性地保存评测结果和所有测试点结果
     * 只有提交仍处于 RUNNING 状态且开始评测时间等于 started_at 时才会保存，
     * 否则说明提交已经被 stale sweep 重新分发，本次评测结果作废
     * @return 是否保存成功，以及是否是用户在练习题目上的第一个 AC
     * @throw database_error 数据库写入失败，此时没有任何数据被修改
     */
    virtual completion complete(const std::string &sub_id, time_t started_at, status verdict,
                          const std::vector<testcase_result> &results, time_t now) = 0;

    /**
     * @brief 在开始评测之前拒绝一个提交（比如语言不支持）
     * 只有 PENDING 状态的提交会被修改，不会保存任何测试点结果
     * @return 是否修改成功
     */
    virtual bool reject(const std::string &sub_id, status verdict, time_t now) = 0;

    /**
     * @brief 读取提交已经保存的测试点结果，按照评测顺序排列
     */
    virtual std::vector<testcase_result> results_of(const std::string &sub_id) = 0;

    /**
     * @brief 查找开始评测时间早于 started_before 仍处于 RUNNING 状态的提交
     */
    virtual std::vector<std::string> find_stale_running(time_t started_before) = 0;

    /**
     * @brief 将卡住的提交重新设为 PENDING
     * 使用和 find_stale_running 相同的条件，提交在此期间完成评测时不会被修改
     * @return 是否修改成功
     */
    virtual bool reoffer(const std::string &sub_id, time_t started_before) = 0;

    /**
     * @brief 读取比赛的所有提交，不读取源代码
     */
    virtual std::vector<submission> contest_submissions(const std::string &contest_id) = 0;
};

/**
 * @brief 题目和挑战的测试点来源，评测引擎只读
 */
struct testcase_source {
    virtual ~testcase_source();

    /**
     * @brief 评测目标的所有测试点，顺序不保证，由评测器排序
     */
    virtual std::vector<testcase> testcases_for(const submission_target &target) = 0;

    virtual resource_limits limits_for(const submission_target &target) = 0;
};

/**
 * @brief 比赛信息的来源
 */
struct contest_source {
    virtual ~contest_source();

    /**
     * @brief 读取比赛的题目、参赛者以及时间信息
     * @throw invalid_argument 比赛不存在
     */
    virtual contest load_contest(const std::string &contest_id) = 0;

    /**
     * @brief 根据当前时间切换比赛阶段：SCHEDULED -> LIVE -> ENDED
     * @return 切换了阶段的比赛数量
     */
    virtual int transition_phases(time_t now) = 0;
};

/**
 * @brief 用户解题统计
 */
struct statistics_sink {
    virtual ~statistics_sink();

    /**
     * @brief 用户第一次通过一道练习题目
     * 每个 (用户, 题目) 只会调用一次
     * @param sub_id 第一次通过的提交，实现可以据此去重
     */
    virtual void problem_solved(const std::string &user_id, const std::string &problem_id, const std::string &sub_id) = 0;
};

}  // namespace arbiter::server
