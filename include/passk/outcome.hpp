#pragma once

#include <optional>
#include <string>

#include "common/json_utils.hpp"

namespace passk {

/**
 * @brief 一次评测的最终结果
 * 所有结果都是终态，执行器内部不会重试
 */
enum class status {
    /**
     * @brief 编译通过且程序返回 0
     */
    PASS = 0,

    /**
     * @brief 编译器返回非 0
     * 此时不会运行程序
     */
    COMPILE_ERROR = 1,

    /**
     * @brief 程序返回非 0，或者被信号杀死
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 编译或运行超出时钟时间限制，具体阶段见 outcome::stage
     */
    TIMEOUT = 3,

    /**
     * @brief 评测请求不合法，比如 prompt 和 solution 均为空
     * 此时不会编译
     */
    INTERNAL_ERROR = 4
};

/**
 * @brief 评测结束时所处的阶段
 */
enum class stage {
    NONE = 0,
    COMPILE = 1,
    RUN = 2
};

/**
 * @brief 评测请求返回的状态字符串：OK、CompileError、RuntimeError、Timeout、InternalError
 */
const char *get_wire_status(status);

const char *get_stage_name(stage);

/**
 * @brief 一次评测的结果，生成后不可修改
 */
struct outcome {
    passk::status status = status::INTERNAL_ERROR;

    /**
     * @brief 对于 TIMEOUT，表示超时发生在编译阶段还是运行阶段
     */
    passk::stage stage = stage::NONE;

    std::string task_id;

    /**
     * @brief 编译错误时为编译器的 stdout，否则为程序的 stdout
     * 超出输出限制的部分会被截断
     */
    std::string stdout_text;

    /**
     * @brief 编译错误时为编译器的 stderr，否则为程序的 stderr
     */
    std::string stderr_text;

    /**
     * @brief 程序的退出码
     * 只有程序运行结束（没有超时）时才有值，编译错误、超时、请求不合法时为空
     */
    std::optional<int> exit_code;

    /**
     * @brief 编译和运行的总时钟时间，单位为秒
     */
    double wall_time = 0;

    bool passed() const;
};

/**
 * @brief 序列化为评测请求的返回值
 * {status, task_id, stdout, stderr, pass, wall_time, exit_code?, stage?}
 */
void to_json(nlohmann::json &j, const outcome &o);

/**
 * @brief 构造一个请求不合法的结果
 */
outcome make_internal_error(const std::string &task_id, const std::string &message);

}  // namespace passk
