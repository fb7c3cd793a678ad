#pragma once

#include "metrics.hpp"
#include "monitor/monitor.hpp"

namespace passk {

/**
 * @brief 通过 Prometheus 报告评测进度
 * passk_attempts_started：开始评测的候选补全数
 * passk_attempts_finished{status}：按评测结果分类的完成数，评测环境不可用时 status 为 SandboxUnavailable
 * passk_workers_busy：正在评测的 worker 数
 * passk_workers_status{worker_id}：每个 worker 的状态
 */
struct prometheus_monitor : public monitor {
    prometheus::Family<prometheus::Counter> &attempts_started, &attempts_finished, &sandbox_errors;
    prometheus::Family<prometheus::Gauge> &workers_busy, &worker_status;

    prometheus_monitor(std::shared_ptr<prometheus::Registry> registry);

    void start_attempt(int worker_id, const attempt &request) override;
    void end_attempt(int worker_id, const attempt &request, const outcome *result) override;
    void report_error(int worker_id, const std::string &message) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &info) override;
};

}  // namespace passk
