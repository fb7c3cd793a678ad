#pragma once

#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

/**
 * @brief 子进程的网络隔离方式
 * 通过 unshare(CLONE_NEWUSER | CLONE_NEWNET) 将子进程放入一个只有 lo（且未启用）的网络命名空间
 */
enum class network_isolation {
    /**
     * @brief 必须隔离，无法创建网络命名空间时报告沙箱不可用
     */
    REQUIRED,

    /**
     * @brief 尽量隔离，无法创建网络命名空间时仍然运行子进程
     * 适合在禁止创建 user namespace 的容器中运行测试
     */
    BEST_EFFORT,

    /**
     * @brief 不隔离，比如调用编译器
     */
    DISABLED
};

/**
 * @brief 子进程的运行结果
 */
struct process_result {
    /**
     * @brief 子进程退出码
     * 正常退出时为 WEXITSTATUS，被信号杀死时为 128 + 信号编号，超时时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 杀死子进程的信号，0 表示子进程正常退出
     */
    int signal = 0;

    /**
     * @brief 子进程是否因为超出时钟时间限制而被杀死
     */
    bool timed_out = false;

    /**
     * @brief stdout 或 stderr 是否因为超出输出限制而被截断
     */
    bool output_truncated = false;

    std::string stdout_text;

    std::string stderr_text;
};

/**
 * @brief 同步运行外部程序
 * 子进程的 stdin 为 /dev/null，stdout 和 stderr 通过管道捕获，
 * 超出时钟时间限制时杀死子进程所在的整个进程组。
 */
struct process_builder {
    /**
     * @brief 设置子进程的工作路径
     */
    process_builder &directory(const std::filesystem::path &path);

    /**
     * @brief 设置子进程的时钟时间限制，单位为秒，小于等于 0 表示不限制
     */
    process_builder &timeout(double seconds);

    /**
     * @brief 设置 stdout、stderr 各自最多保留多少字节
     * 超出部分会被读出并丢弃，避免子进程因为管道写满而阻塞
     */
    process_builder &output_limit(std::size_t bytes);

    process_builder &isolate_network(network_isolation mode);

    template <typename... Args>
    process_result run(const std::string &program, Args &&...args) {
        std::vector<std::string> argv = {program};
        (append_argument(argv, std::forward<Args>(args)), ...);
        return exec_program(argv);
    }

    /**
     * @brief 运行程序并等待其结束
     * @param argv argv[0] 为程序名，会在 PATH 中查找
     * @throw sandbox_unavailable 无法创建管道、无法 fork，或子进程在 exec 之前失败
     */
    process_result exec_program(const std::vector<std::string> &argv);

private:
    static void append_argument(std::vector<std::string> &argv, const std::string &value) {
        argv.push_back(value);
    }

    static void append_argument(std::vector<std::string> &argv, const char *value) {
        argv.emplace_back(value);
    }

    static void append_argument(std::vector<std::string> &argv, const std::filesystem::path &value) {
        argv.push_back(value.string());
    }

    static void append_argument(std::vector<std::string> &argv, const std::vector<std::string> &values) {
        argv.insert(argv.end(), values.begin(), values.end());
    }

    static void append_argument(std::vector<std::string> &argv, const std::optional<std::string> &value) {
        if (value) argv.push_back(*value);
    }

    template <typename T, typename = std::enable_if_t<std::is_arithmetic_v<T>>>
    static void append_argument(std::vector<std::string> &argv, T value) {
        argv.push_back(boost::lexical_cast<std::string>(value));
    }

    bool epath = false;
    std::filesystem::path path;
    double timeout_seconds = -1;
    std::size_t max_output_bytes = 1024 * 1024;
    network_isolation isolation = network_isolation::DISABLED;
};

std::string get_env(const std::string &key, const std::string &def_value = "");

struct elapsed_time {
    elapsed_time();

    template <typename Duration>
    Duration duration() const {
        return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
    }

    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};
