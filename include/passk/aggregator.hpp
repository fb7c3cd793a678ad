#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/json_utils.hpp"

namespace passk {

/**
 * @brief 一道题目所有候选补全的评测结果，按样本编号排序
 */
using task_result_set = std::vector<bool>;

/**
 * @brief 题目编号到评测结果的映射
 * 使用 std::map 保证遍历顺序固定，从而保证浮点数求和的顺序固定
 */
using task_result_map = std::map<std::string, task_result_set>;

/**
 * @brief 聚合得到的评测指标，只由 task_result_map 决定
 */
struct evaluation_metrics {
    /**
     * @brief 至少有一个样本的题目中，第一个样本通过的比例
     * 没有任何题目有样本时为 0
     */
    double pass_at_1 = 0;

    /**
     * @brief 每个 k > 1 对应的无偏 pass@k
     * 没有任何题目的样本数不少于 k 时为空
     */
    std::map<int, std::optional<double>> pass_at_k;

    /**
     * @brief 至少有一个样本通过的题目数
     */
    std::size_t resolved = 0;

    /**
     * @brief 题目总数，包括没有样本的题目
     */
    std::size_t total = 0;
};

/**
 * @brief 从 n 个样本（其中 c 个通过）中不放回地抽取 k 个，至少有一个通过的概率
 * 即 1 - C(n - c, k) / C(n, k)，n - c < k 时为 1
 * @throw passk_exception c > n 或 k == 0
 */
double per_task_pass_at_k(std::size_t n, std::size_t c, std::size_t k);

/**
 * @brief 计算 pass@1、每个 k > 1 的 pass@k、resolved 和 total
 * @param results 题目编号到评测结果的映射
 * @param ks 需要计算的 k，k = 1 由 pass@1 表示
 * @throw passk_exception ks 中存在非正数
 */
evaluation_metrics aggregate(const task_result_map &results, const std::set<int> &ks);

/**
 * @brief 同上，但 total 按数据集中的题目计算
 * 在 task_ids 中但不在 results 中的题目视为没有样本
 */
evaluation_metrics aggregate(const std::vector<std::string> &task_ids, const task_result_map &results, const std::set<int> &ks);

/**
 * @brief {"pass@1": float, "resolved": int, "total": int, "pass@<k>": float|null}
 */
void to_json(nlohmann::json &j, const evaluation_metrics &m);

}  // namespace passk
