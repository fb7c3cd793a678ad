#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "passk/task.hpp"

namespace passk {

/**
 * @brief 题目编号到候选补全列表的映射，列表按文件中出现的顺序排列
 */
using completion_map = std::map<std::string, std::vector<std::string>>;

/**
 * @brief 加载 JSONL 格式的数据集，每行一道题目 {task_id 或 name, prompt, tests}
 * 空行被忽略，无法解析的行会输出警告并跳过
 * @throw passk_exception 文件不存在
 */
std::map<std::string, task> load_dataset(const std::filesystem::path &path);

/**
 * @brief 加载 JSONL 格式的候选补全，每行一个 {task_id 或 name, solution/completion/canonical_solution}
 * @param max_samples 每道题目最多保留多少个候选补全
 * @throw passk_exception 文件不存在
 */
completion_map load_completions(const std::filesystem::path &path, std::size_t max_samples);

/**
 * @brief 从文件夹加载候选补全，<task_id>.jsonl 或 <task_id>.json 中每行一个候选补全
 * 也可以是 gzip 压缩后的 <task_id>.jsonl.gz、<task_id>.json.gz，其他扩展名的文件被忽略
 * 同一个 task_id 有多个文件时按文件名顺序合并
 * @throw passk_exception 文件夹不存在
 */
completion_map load_completions_dir(const std::filesystem::path &dir, std::size_t max_samples);

/**
 * @brief 为数据集中的每道题目和它的每个候选补全生成评测请求
 * 按题目编号、样本编号排序。不在数据集中的题目的候选补全被忽略
 */
std::vector<attempt> make_attempts(const std::map<std::string, task> &tasks, const completion_map &completions);

}  // namespace passk
