#pragma once

#include <mutex>
#include <queue>

namespace arbiter {

/**
 * @brief 并发队列，写者读者模型
 * worker 从队列中领取待评测的提交 id，队列为空时由 worker 向数据库拉取新的提交
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     */
    void push(const T &value) {
        std::scoped_lock<std::mutex> mlock(mut);
        q.push(value);
    }

    bool empty() {
        std::scoped_lock<std::mutex> mlock(mut);
        return q.empty();
    }

private:
    std::queue<T> q;
    std::mutex mut;
};

}  // namespace arbiter
