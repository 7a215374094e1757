#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <atomic>
#include <mutex>
#include <unistd.h>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace arbiter {
using namespace std;

// 停止 worker 的标记
static atomic<bool> stop{false};

void stop_workers() {
    stop = true;
}

static mutex fetch_mutex;

/**
 * @brief 向数据库拉取一批待评测的提交
 * 同一时间只有一个 worker 拉取，拉取时队列不为空则放弃，避免评测队列过长
 * @return true 如果获取到了提交
 */
static bool fetch_submissions(size_t worker_id, concurrent_queue<string> &task_queue, server::submission_store &store) {
    scoped_lock guard(fetch_mutex);
    if (!task_queue.empty()) return true;
    try {
        auto ids = store.fetch_pending(FETCH_BATCH_SIZE);
        for (auto &id : ids) task_queue.push(id);
        return !ids.empty();
    } catch (exception &ex) {
        LOG(WARNING) << "Worker " << worker_id << " failed to fetch submissions, " << ex.what() << endl
                     << boost::diagnostic_information(ex);
        return false;
    }
}

static void judge_submission(size_t worker_id, const string &sub_id, orchestrator &judge, server::submission_store &store) {
    try {
        judge_report report = judge.judge(sub_id);
        if (report.fresh)
            LOG(INFO) << "Worker " << worker_id << " finished " << report.submit << ": " << get_display_message(report.submit.state);
    } catch (already_judging &) {
        // 提交被重复放入队列，另一个 worker 正在评测
        DLOG(INFO) << "Worker " << worker_id << " skipped submission " << sub_id << " judging elsewhere";
    } catch (unsupported_language &ex) {
        LOG(INFO) << "Worker " << worker_id << " rejected submission " << sub_id << ": " << ex.what();
    } catch (invalid_submission &ex) {
        LOG(ERROR) << "Worker " << worker_id << " found invalid submission " << sub_id << ": " << ex.what();
        // 不合法的提交不能留在 PENDING 状态，否则会被反复拉取
        try {
            if (!store.reject(sub_id, status::SYSTEM_ERROR, time(nullptr)))
                LOG(WARNING) << "Submission " << sub_id << " left PENDING state before it could be rejected";
        } catch (database_error &db_ex) {
            LOG(ERROR) << "Unable to reject submission " << sub_id << ", " << db_ex;
        }
    } catch (exception &ex) {
        // orchestrator_error 等错误：提交保持 RUNNING 状态，由 stale sweep 重新分发
        LOG(ERROR) << "Worker " << worker_id << " failed to judge submission " << sub_id << ", " << ex.what() << endl
                   << boost::diagnostic_information(ex);
    }
}

static void worker_loop(size_t worker_id, concurrent_queue<string> &task_queue, orchestrator &judge, server::submission_store &store) {
    LOG(INFO) << "Worker " << worker_id << " started";

    while (true) {
        string sub_id;
        if (!task_queue.try_pop(sub_id)) {
            if (stop) {
                // 如果需要停止 worker，在评测队列为空时自然退出 worker。
                break;
            }

            if (!fetch_submissions(worker_id, task_queue, store))
                usleep(10 * 1000);  // 10ms，这里必须等待，不可以忙等
            continue;
        }

        judge_submission(worker_id, sub_id, judge, store);
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, concurrent_queue<string> &task_queue, orchestrator &judge, server::submission_store &store) {
    return thread([worker_id, &task_queue, &judge, &store] {
        worker_loop(worker_id, task_queue, judge, store);
    });
}

}  // namespace arbiter
