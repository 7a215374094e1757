#pragma once

#include <condition_variable>
#include <ctime>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "contest/contest.hpp"
#include "server/submission_store.hpp"

namespace arbiter {

/**
 * @brief 根据比赛时间计算比赛在 now 时应处于的阶段
 * now < start 为 SCHEDULED，start <= now < end 为 LIVE，否则为 ENDED
 */
contest_phase phase_at(time_t start, time_t end, time_t now);

/**
 * @brief 检查用户能否在 now 时向比赛提交
 * @return 所有拒绝的原因，为空表示可以提交
 */
std::vector<std::string> validate_contest_submission(const contest &c, const std::string &user_id, time_t now);

/**
 * @brief 定时切换比赛阶段
 * 比赛阶段只在这里被修改，评测引擎和排行榜只读取比赛阶段。
 */
struct contest_reconciler {
    contest_reconciler(server::contest_source &contests, int interval_seconds);

    ~contest_reconciler();

    /**
     * @brief 立即切换一次比赛阶段
     * @return 切换了阶段的比赛数量
     */
    int reconcile_once(time_t now);

    /**
     * @brief 启动后台线程，每隔 interval_seconds 切换一次比赛阶段
     */
    void start();

    /**
     * @brief 停止后台线程并等待退出
     */
    void stop();

private:
    server::contest_source &contests;
    int interval_seconds;

    std::thread thd;
    std::mutex mut;
    std::condition_variable cond;
    bool stopping = false;

    void loop();
};

}  // namespace arbiter
