#pragma once

#include <ctime>
#include <string>
#include <vector>

namespace arbiter {

/**
 * @brief 比赛所处的阶段
 * 评测引擎只读取比赛阶段，阶段的切换由 contest_reconciler 定时完成
 */
enum class contest_phase {
    /**
     * @brief 比赛还在编辑中，不接受提交
     */
    DRAFT,

    SCHEDULED,

    LIVE,

    ENDED,

    /**
     * @brief 比赛已经归档，只读
     */
    ARCHIVED
};

const char *get_phase_name(contest_phase phase);

/**
 * @throw std::invalid_argument 阶段名不存在
 */
contest_phase parse_phase(const std::string &name);

/**
 * @brief 比赛中的一道题目
 */
struct contest_problem {
    /**
     * @brief 比赛题目的 id，和提交的 contest_item_target::item_id 对应
     */
    std::string item_id;

    std::string title;

    /**
     * @brief 通过这道题目获得的分数
     */
    double score = 1;
};

struct contest_participant {
    std::string user_id;

    std::string username;
};

/**
 * @brief 比赛的基本信息
 */
struct contest {
    std::string contest_id;

    std::string title;

    time_t start_time = 0;

    time_t end_time = 0;

    contest_phase phase = contest_phase::SCHEDULED;

    /**
     * @brief 比赛的创建者，自动拥有管理权限
     */
    std::string creator_id;

    std::vector<std::string> manager_ids;

    /**
     * @brief 按照比赛中的顺序（A、B、C...）排列的题目
     */
    std::vector<contest_problem> problems;

    /**
     * @brief 按照报名顺序排列的参赛者
     */
    std::vector<contest_participant> participants;

    bool is_manager(const std::string &user_id) const;

    bool is_participant(const std::string &user_id) const;
};

}  // namespace arbiter
