#pragma once

#include <string>

#include "common/json_utils.hpp"

/**
 * 这个头文件包含评测数据的表示
 * 1. task：一道题目，包含代码前缀和隐藏的测试代码，由外部加载后不可修改
 * 2. attempt：一道题目和一个候选补全组成的评测请求
 */
namespace passk {

/**
 * @brief 表示一道代码生成题目
 */
struct task {
    /**
     * @brief 题目编号，只用于报告
     */
    std::string task_id;

    /**
     * @brief 代码前缀，一般是函数签名和注释
     */
    std::string prompt;

    /**
     * @brief 隐藏的测试代码，包含 main 函数，测试通过时程序返回 0
     */
    std::string tests;
};

void from_json(const nlohmann::json &j, task &t);

/**
 * @brief 表示一次评测请求：一道题目和一个候选补全
 * 评测结束后临时文件全部删除，attempt 本身只保存请求内容
 */
struct attempt {
    std::string task_id;

    std::string prompt;

    /**
     * @brief 模型生成的候选补全
     */
    std::string solution;

    std::string tests;

    /**
     * @brief 该候选补全是这道题目的第几个样本，从 0 开始
     * 聚合时按样本编号排序，而不是按评测完成的顺序
     */
    std::size_t candidate = 0;

    /**
     * @brief 拼接成一个完整的源文件：prompt、solution、tests，中间以换行分隔，并去掉首尾空白字符
     */
    std::string source() const;
};

/**
 * @brief 解析评测请求 {task_id, prompt, solution, tests}
 * solution 缺失时使用 canonical_solution，task_id 缺失时为 unknown
 */
void from_json(const nlohmann::json &j, attempt &a);

}  // namespace passk
