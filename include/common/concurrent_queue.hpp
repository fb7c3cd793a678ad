#pragma once

#include <deque>
#include <mutex>

namespace passk {

/**
 * @brief 多个 worker 共享的任务队列
 * 只提供非阻塞的 try_pop，队列为空时由 worker 自行决定退出还是等待
 */
template <typename T>
struct concurrent_queue {
    void push(const T &value) {
        std::scoped_lock guard(mut);
        queue.push_back(value);
    }

    void push(T &&value) {
        std::scoped_lock guard(mut);
        queue.push_back(std::move(value));
    }

    bool try_pop(T &value) {
        std::scoped_lock guard(mut);
        if (queue.empty()) return false;
        value = std::move(queue.front());
        queue.pop_front();
        return true;
    }

private:
    std::mutex mut;
    std::deque<T> queue;
};

}  // namespace passk
