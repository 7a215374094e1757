#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "contest/contest.hpp"
#include "judge/submission.hpp"
#include "server/submission_store.hpp"

namespace arbiter {

/**
 * @brief 一个参赛者在一道比赛题目上的情况
 */
struct problem_standing {
    std::string item_id;

    std::string title;

    bool solved = false;

    /**
     * @brief 这道题目的提交次数，包括通过之后的提交
     */
    int attempts = 0;

    /**
     * @brief 罚时，没有通过时为 0
     * @note 单位为分钟，可能为小数
     */
    double penalty = 0;

    double score = 0;
};

/**
 * @brief 排行榜的一行，每次读取时根据提交记录重新计算，不保存
 */
struct leaderboard_entry {
    std::string user_id;

    std::string username;

    double total_score = 0;

    double total_penalty = 0;

    /**
     * @brief 按照比赛题目顺序排列
     */
    std::vector<problem_standing> problems;
};

struct leaderboard_options {
    /**
     * @brief 第一次通过之前每次错误提交增加的罚时
     * @note 单位为分钟，默认不计算错误提交的罚时
     */
    double wrong_attempt_penalty = 0;
};

/**
 * @brief 计算比赛排行榜
 * 对每个 (参赛者, 题目)，以最早的 AC 提交计算得分和罚时，罚时为提交时间距离比赛开始的分钟数。
 * 排名按照总分降序、总罚时升序，相同时保持参赛者的报名顺序。
 * PENDING 和 RUNNING 状态的提交不会被当作通过。
 * @param c 比赛信息，包括题目和参赛者
 * @param submissions 比赛的提交记录，顺序任意
 */
std::vector<leaderboard_entry> compute_leaderboard(const contest &c, const std::vector<submission> &submissions,
                                                   const leaderboard_options &options = {});

void to_json(nlohmann::json &j, const problem_standing &standing);

void to_json(nlohmann::json &j, const leaderboard_entry &entry);

/**
 * @brief 从持久化层读取比赛数据并计算排行榜
 * 只读取数据，不会锁定任何提交
 */
struct leaderboard_service {
    leaderboard_service(server::contest_source &contests, server::submission_store &store,
                        const leaderboard_options &options = {});

    std::vector<leaderboard_entry> compute(const std::string &contest_id);

private:
    server::contest_source &contests;
    server::submission_store &store;
    leaderboard_options options;
};

}  // namespace arbiter
