#pragma once

#include <boost/log/trivial.hpp>
#include <filesystem>
#include <string>

std::string LOG_PREFIX(const char *file, int line, const char *function);
void LOG_BEGIN(const std::string &prefix);
void LOG_END();

namespace passk {

/**
 * @brief 初始化 Boost.Log
 * 日志输出到 stderr（stdout 留给 JSON 结果），如果 log_dir 非空，同时写入滚动日志文件
 * @param log_dir 日志文件夹
 * @param debug 是否输出 debug 级别的日志
 */
void init_logging(const std::filesystem::path &log_dir, bool debug);

}  // namespace passk

#define LOG_DEBUG BOOST_LOG_TRIVIAL(debug) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_INFO BOOST_LOG_TRIVIAL(info) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_WARN BOOST_LOG_TRIVIAL(warning) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_ERROR BOOST_LOG_TRIVIAL(error) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_FATAL BOOST_LOG_TRIVIAL(fatal) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
