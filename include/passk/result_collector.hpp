#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "passk/aggregator.hpp"

namespace passk {

/**
 * @brief 收集多个 worker 并发产生的评测结果
 *
 * 每道题目在评测开始前通过 register_task 登记样本数，之后 worker 可以并发调用 record。
 * 每道题目有自己的锁，不同题目的结果互不阻塞。
 * 结果按样本编号存放，因此最终顺序和评测完成的顺序无关。
 */
struct result_collector {
    /**
     * @brief 登记一道题目及其样本数
     * 必须在 worker 启动前调用，重复登记会覆盖之前的登记
     */
    void register_task(const std::string &task_id, std::size_t samples);

    /**
     * @brief 记录第 candidate 个样本是否通过
     * @throw internal_error 题目未登记，或 candidate 超出样本数
     */
    void record(const std::string &task_id, std::size_t candidate, bool passed);

    /**
     * @brief 导出给 aggregate 使用的结果，未记录的样本被忽略
     */
    task_result_map snapshot() const;

private:
    struct task_slot {
        mutable std::mutex mut;
        std::vector<std::optional<bool>> results;
    };

    // 登记完成后不再修改，worker 只修改 task_slot 内部
    std::map<std::string, std::unique_ptr<task_slot>> slots;
};

}  // namespace passk
