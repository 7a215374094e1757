#pragma once

#include <string>
#include <vector>
#include "contest/contest.hpp"
#include "judge/submission.hpp"

namespace arbiter {

/**
 * @brief 访问提交的用户
 */
struct actor {
    /**
     * @brief 用户 id，匿名用户为空
     */
    std::string user_id;

    bool is_superuser = false;

    bool is_anonymous() const;
};

/**
 * @brief 用户对一个提交拥有的权限，按照优先级从高到低判断
 */
enum class capability {
    SUPERUSER,
    OWNER,
    CONTEST_MANAGER,
    NONE
};

const char *get_capability_name(capability cap);

/**
 * @brief 计算用户对提交的权限
 * @param c 提交所属的比赛，练习提交传 nullptr
 */
capability check_capability(const actor &who, const submission &submit, const contest *c);

/**
 * @brief 用户能否查看测试点的输出细节
 * 拥有任何权限的用户都可以查看；其他用户只有在比赛进行中可以查看样例测试点，
 * 比赛结束后可以查看全部测试点；练习提交只有拥有权限的用户可以查看。
 */
bool can_view_result_details(const actor &who, capability cap, const contest *c, const testcase_result &result);

/**
 * @brief 过滤出用户可以查看细节的测试点结果
 */
std::vector<testcase_result> visible_results(const actor &who, const submission &submit, const contest *c,
                                             const std::vector<testcase_result> &results);

}  // namespace arbiter
