#pragma once

#include <string>

#include "passk/outcome.hpp"
#include "passk/task.hpp"

namespace passk {

enum class worker_state {
    START = 0,
    EVALUATING = 1,
    IDLE = 2,
    CRASHED = 3,
    STOPPED = 4
};

const char *get_worker_state_name(worker_state state);

/**
 * @brief 监控 worker 的评测过程
 * 所有回调都可能被多个 worker 线程并发调用，实现需要自行加锁
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief worker 开始评测一个候选补全
     */
    virtual void start_attempt(int worker_id, const attempt &request);

    /**
     * @brief worker 评测完一个候选补全
     * @param result 评测结果，评测环境不可用导致没有结果时为 nullptr
     */
    virtual void end_attempt(int worker_id, const attempt &request, const outcome *result);

    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &info);

    /**
     * @brief 报告评测环境的错误
     */
    virtual void report_error(int worker_id, const std::string &message);

    /**
     * @brief 收到中断信号，worker 不再领取新的候选补全
     */
    virtual void interrupt_attempts();
};

}  // namespace passk
