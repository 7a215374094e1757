#pragma once

#include <string>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "judge/orchestrator.hpp"
#include "server/submission_store.hpp"

/**
 * 评测 worker
 * 每个 worker 从 task_queue 中领取提交 id，交给 orchestrator 完成整个提交的评测。
 * 一个提交只由一个 worker 评测，提交内的测试点按顺序评测，不同提交由不同 worker 并行评测。
 *
 * 如果遇到评测队列为空的情况，worker 会向 submission_store 拉取最多 FETCH_BATCH_SIZE 个
 * PENDING 状态的提交放入队列。拉取不会修改提交状态，因此同一个提交可能被放入队列多次，
 * 由 orchestrator 的 try_begin 保证只会被评测一次。
 */
namespace arbiter {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，将 worker 状态标记为停止。worker 循环时会检查标记，
 * 如果停止，则不再拉取新提交，而且在没有评测任务时退出。
 */
void stop_workers();

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 编号，仅用于日志
 * @param task_queue 待评测提交 id 的队列，所有 worker 共享
 * @param judge 评测提交的 orchestrator，所有 worker 共享
 * @param store 队列为空时拉取提交的来源
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, concurrent_queue<std::string> &task_queue,
                         orchestrator &judge, server::submission_store &store);

}  // namespace arbiter
