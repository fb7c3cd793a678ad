#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace passk {

/**
 * @brief 读取文件内容
 * @param path 文件路径
 * @param max_bytes 最多读取多少字节，超出部分会被截断并追加 <...truncated>，小于等于 0 表示不限制
 * @throw passk_exception 文件不存在或无法打开
 */
std::string read_file_content(const std::filesystem::path &path, long max_bytes = -1);

/**
 * @brief 将 content 覆盖写入文件
 * @throw passk_exception 无法写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 按行读取文本文件，忽略只包含空白字符的行
 * 扩展名为 .gz 时按 gzip 解压后读取
 * @throw passk_exception 文件不存在、无法打开或无法解压
 */
std::vector<std::string> read_nonblank_lines(const std::filesystem::path &path);

/**
 * @brief 在 text 末尾追加截断标记，表示输出被截断
 */
void mark_truncated(std::string &text);

}  // namespace passk
