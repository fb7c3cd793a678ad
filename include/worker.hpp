#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "monitor/monitor.hpp"
#include "passk/aggregator.hpp"
#include "passk/executor.hpp"

namespace passk {

/**
 * @brief 一次评测请求及其结果，用于输出 attempts.jsonl
 */
struct attempt_record {
    attempt request;

    /**
     * @brief 评测结果，评测环境不可用时为空
     */
    std::optional<outcome> result;

    /**
     * @brief 评测环境不可用的原因，result 为空时有值
     */
    std::string infrastructure_error;
};

/**
 * @brief 评测完成时为 outcome 的所有字段加上 candidate，
 * 评测环境不可用时为 {task_id, candidate, infrastructure_error: true, error}，没有 status 字段
 */
void to_json(nlohmann::json &j, const attempt_record &record);

/**
 * @brief 一批候选补全的评测结果
 */
struct evaluation_report {
    /**
     * @brief 每道题目按样本编号排序的通过情况，可以直接交给 aggregate
     */
    task_result_map results;

    /**
     * @brief 按题目编号、样本编号排序的评测记录
     */
    std::vector<attempt_record> attempts;

    /**
     * @brief 由于评测环境不可用而没有真正评测的候选补全数
     * 这些候选补全不计入 results，对应题目的样本数相应减少
     */
    std::size_t infrastructure_errors = 0;

    /**
     * @brief 由于中断而没有评测的候选补全数
     */
    std::size_t skipped = 0;
};

void register_monitor(std::unique_ptr<monitor> &&monitor);

/**
 * @brief 使用 workers 个线程并发评测所有候选补全，所有 worker 退出后返回
 * 单个候选补全的评测环境错误不会中止整批评测
 * @throw passk_exception workers 为 0
 */
evaluation_report run_workers(const sandbox_executor &executor, const std::vector<attempt> &attempts, std::size_t workers);

/**
 * @brief 停止 worker 领取新的候选补全，正在评测的候选补全会继续完成
 * 由 main 中等待 SIGINT、SIGTERM 的线程调用
 */
void stop_workers();

bool workers_stopping();

}  // namespace passk
