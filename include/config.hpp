#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace passk {

/**
 * @brief 沙箱执行配置
 * 配置来源的优先级（后者覆盖前者）：默认值、JSON 配置文件、环境变量、命令行参数
 */
struct execution_config {
    /**
     * @brief 编译时间限制（单位为秒）
     */
    double compile_budget = 30;

    /**
     * @brief 运行时间限制（单位为秒）
     */
    double run_budget = 10;

    /**
     * @brief 编译器，会在 PATH 中查找
     */
    std::string compiler = "g++";

    /**
     * @brief 编译参数，源文件和输出文件由执行器追加
     */
    std::vector<std::string> compile_flags = {"-std=c++17", "-O0"};

    /**
     * @brief stdout、stderr 各自最多保留多少字节
     */
    std::size_t max_output_bytes = 1024 * 1024;

    /**
     * @brief 候选程序运行时的网络隔离方式，编译器不做网络隔离
     */
    network_isolation isolation = network_isolation::REQUIRED;

    /**
     * @brief 临时工作文件夹的根目录，为空时使用系统临时文件夹
     */
    std::filesystem::path work_root;
};

void from_json(const nlohmann::json &j, execution_config &config);

/**
 * @brief 解析 required、best_effort、disabled
 * @throw passk_exception 无法识别的值
 */
network_isolation parse_network_isolation(const std::string &value);

const char *isolation_name(network_isolation isolation);

/**
 * @brief 使用环境变量覆盖配置
 * PASSK_COMPILE_TIMEOUT、PASSK_RUN_TIMEOUT、PASSK_CXX、PASSK_MAX_OUTPUT、PASSK_NETWORK_ISOLATION、PASSK_WORK_ROOT
 */
void apply_environment(execution_config &config);

/**
 * @brief 编译、运行时间限制的上限，单位为秒
 */
constexpr double MAX_BUDGET_SECONDS = 24 * 3600;

/**
 * @throw passk_exception 时间限制不在 (0, MAX_BUDGET_SECONDS] 内，或编译器为空
 */
void validate(const execution_config &config);

/**
 * @brief 读取默认值、配置文件（如果有）和环境变量，并检查合法性
 */
execution_config load_execution_config(const std::optional<std::filesystem::path> &config_path);

}  // namespace passk
