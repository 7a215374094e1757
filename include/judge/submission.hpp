#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "common/status.hpp"

/**
 * 这个头文件包含评测引擎使用的数据模型
 * 包含：
 * 1. submission_target（提交的评测目标，题目或者比赛题目二选一）
 * 2. submission 类（表示一个选手提交）
 * 3. testcase 类（表示一个测试点）
 * 4. testcase_result 类（表示一个测试点的评测结果）
 */
namespace arbiter {

/**
 * @brief 练习题目
 */
struct problem_target {
    std::string problem_id;
};

/**
 * @brief 比赛中的题目，比赛题目可能包装了一道题目，也可能包装了一个挑战
 */
struct contest_item_target {
    enum class item_kind {
        PROBLEM,
        CHALLENGE
    };

    /**
     * @brief 比赛题目的 id
     */
    std::string item_id;

    /**
     * @brief 比赛题目所属的比赛，和提交记录的比赛一定相同
     */
    std::string contest_id;

    item_kind kind = item_kind::PROBLEM;

    /**
     * @brief 比赛题目包装的题目或挑战的 id
     */
    std::string wrapped_id;
};

/**
 * @brief 提交的评测目标
 * 一个提交要么是练习题目的提交，要么是比赛题目的提交，不会同时是两者，也不会都不是。
 */
struct submission_target {
    std::variant<problem_target, contest_item_target> value;

    submission_target();
    submission_target(problem_target problem);
    submission_target(contest_item_target item);

    /**
     * @brief 评测目标的类型："problem" 或者 "challenge"
     * 由当前保存的是哪种目标计算得到，不单独存储
     */
    std::string item_type() const;

    /**
     * @brief 是否为练习题目的提交
     * 只有练习题目的 AC 会更新选手的解题统计
     */
    bool is_practice() const;

    /**
     * @brief 提交所属的比赛，练习提交返回空
     */
    std::optional<std::string> contest_id() const;

    /**
     * @brief 被评测的题目或挑战的 id
     */
    std::string item_id() const;
};

/**
 * @brief 将数据库中的可空外键转换为 submission_target
 * @param problem_id 练习题目 id
 * @param contest_item_id 比赛题目 id
 * @param contest_id 提交记录上的比赛 id
 * @param item_contest_id 比赛题目实际所属的比赛 id
 * @param kind 比赛题目包装的是题目还是挑战
 * @param wrapped_id 比赛题目包装的题目或挑战 id
 * @throw invalid_submission 如果外键的组合不合法
 */
submission_target make_target(const std::optional<std::string> &problem_id,
                              const std::optional<std::string> &contest_item_id,
                              const std::optional<std::string> &contest_id,
                              const std::optional<std::string> &item_contest_id,
                              contest_item_target::item_kind kind,
                              const std::string &wrapped_id);

/**
 * @brief 一个选手代码提交
 */
struct submission {
    /**
     * @brief 提交的 id
     * string 可以兼容一切情况
     */
    std::string sub_id;

    /**
     * @brief 选手用户 id
     */
    std::string user_id;

    submission_target target;

    /**
     * @brief 提交声明的语言代码，比如 CPP、PY、JAVA
     */
    std::string language;

    std::string source_code;

    status state = status::PENDING;

    /**
     * @brief 提交时间（从 1970 年 1 月 1 日开始的时间戳）
     * 用于计算比赛罚时
     */
    time_t created_at = 0;

    time_t updated_at = 0;

    /**
     * @brief 开始评测的时间，用于判断 RUNNING 状态的提交是否卡住
     * 不处于 RUNNING 状态时为 0
     */
    time_t judging_started_at = 0;
};

/**
 * @brief 表示一个测试点，由题目或挑战提供，评测引擎只读
 */
struct testcase {
    std::string testcase_id;

    /**
     * @brief 测试点的排列顺序，相同时按照 sequence 排序
     */
    int order = 0;

    /**
     * @brief 测试点的创建顺序（一般是自增主键）
     */
    long sequence = 0;

    std::string input;

    std::string expected_output;

    bool is_sample = false;

    bool is_hidden = false;
};

/**
 * @brief 题目的资源限制
 */
struct resource_limits {
    /**
     * @brief 时间限制
     * @note 单位为毫秒
     */
    int time_limit_ms = 1000;

    /**
     * @brief 内存限制
     * @note 单位为 KB
     */
    int memory_limit_kb = 262144;
};

struct testcase_result {
    std::string testcase_id;

    /**
     * @brief 创建结果时测试点是否为样例
     * 保存的是创建时的值，之后即使测试点被修改也不会改变
     */
    bool is_sample = false;

    bool is_hidden = false;

    arbiter::status status = arbiter::status::SYSTEM_ERROR;

    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 本测试点程序运行用时
     * @note 单位为毫秒
     */
    int time_ms = 0;

    /**
     * @brief 本测试点程序运行使用的内存
     * @note 单位为 KB
     */
    int memory_kb = 0;
};

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.target.item_type() << ":" << submit.target.item_id() << "-" << submit.sub_id << "]";
    return os;
}

}  // namespace arbiter
