#pragma once

#include <map>
#include <mutex>
#include <string>

#include "monitor/monitor.hpp"

namespace passk {

/**
 * @brief 记录正在评测的候选补全
 * 收到中断信号时输出仍在评测的候选补全，便于确认中断后哪些结果缺失
 */
struct interrupt_monitor : public monitor {
    void start_attempt(int worker_id, const attempt &request) override;

    void end_attempt(int worker_id, const attempt &request, const outcome *result) override;

    void interrupt_attempts() override;

    std::size_t running_attempts() const;

private:
    mutable std::mutex mut;

    // worker_id -> (task_id, candidate)
    std::map<int, std::pair<std::string, std::size_t>> running;
};

}  // namespace passk
