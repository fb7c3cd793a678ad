#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace nlohmann {

/**
 * @brief 判断 JSON 对象中是否存在键 key，且值不为 null
 */
bool exists(const json &j, const std::string &key);

}  // namespace nlohmann

namespace passk {

/**
 * @brief 序列化 JSON
 * 候选程序的输出不一定是合法的 UTF-8，非法字节会被替换成 U+FFFD 而不是抛出异常
 */
std::string dump_json(const nlohmann::json &j, int indent = -1);

/**
 * @brief 按顺序取第一个存在且非空的字符串字段，都不存在时返回空串
 * @throw nlohmann::json::type_error 字段不是字符串
 */
std::string first_nonempty(const nlohmann::json &j, const std::vector<std::string> &keys);

}  // namespace passk
