#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "config.hpp"
#include "passk/outcome.hpp"
#include "passk/task.hpp"

namespace passk {

/**
 * @brief 评测环境不可用时的退出码，用于区分“候选代码错误”和“评测器无法运行”
 */
constexpr int EXIT_SANDBOX_UNAVAILABLE = 2;

/**
 * @brief 在隔离的临时环境中编译并运行一个候选补全
 *
 * 评测流程：
 * 1. prompt 和 solution 均为空时直接返回 INTERNAL_ERROR，不编译
 * 2. 创建独占的临时工作文件夹，写入 main.cpp，评测结束后无论如何都会删除
 * 3. 在 compile_budget 内编译，超时返回 TIMEOUT(compile)，编译器返回非 0 返回 COMPILE_ERROR
 * 4. 在 run_budget 内运行，禁用网络，工作路径为临时文件夹，
 *    超时返回 TIMEOUT(run)，返回非 0 为 RUNTIME_ERROR，返回 0 为 PASS
 *
 * 多个线程可以同时调用同一个 sandbox_executor 的 execute，每次评测之间不共享任何可修改的状态。
 */
struct sandbox_executor {
    /**
     * @param config 编译器、输出限制、网络隔离方式和工作文件夹根目录，
     *               config 中的时间限制只作为 execute(attempt) 的默认值
     */
    explicit sandbox_executor(execution_config config);

    /**
     * @brief 评测一个候选补全
     * @param compile_budget 编译时钟时间限制，单位为秒
     * @param run_budget 运行时钟时间限制，单位为秒
     * @throw sandbox_unavailable 评测环境本身不可用（找不到编译器、无法创建进程或网络命名空间等），
     *        这和候选代码本身的错误不同，调用方需要单独处理
     */
    outcome execute(const attempt &request, double compile_budget, double run_budget) const;

    /**
     * @brief 使用配置中的默认时间限制评测
     */
    outcome execute(const attempt &request) const;

    const execution_config &config() const;

private:
    outcome compile_and_run(const attempt &request, double compile_budget, double run_budget) const;

    execution_config cfg;
};

/**
 * @brief 使用默认配置评测一次
 * @throw sandbox_unavailable 评测环境不可用
 */
outcome execute(const std::string &task_id, const std::string &prompt, const std::string &solution,
                const std::string &tests, double compile_budget = 30, double run_budget = 10);

/**
 * @brief 从 in 读取一个评测请求 JSON，向 out 输出一行评测结果 JSON
 * 请求不合法时输出 task_id 为 unknown 的 InternalError
 * @return 0 表示评测完成，1 表示请求不合法或结果为 InternalError，
 *         EXIT_SANDBOX_UNAVAILABLE 表示评测环境不可用，此时不输出任何内容
 */
int execute_request(const execution_config &config, std::istream &in, std::ostream &out);

}  // namespace passk
