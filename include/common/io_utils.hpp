#pragma once

#include <filesystem>
#include <string>

namespace arbiter {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 保证字符串可以写入 utf8 编码的数据库列
 * 选手程序可能输出任意二进制内容，如果不是合法的 UTF-8，
 * 则把所有非 ASCII 字节替换为 '?'
 */
std::string sanitize_utf8(const std::string &string);

/**
 * @brief 去掉每一行行末的空白字符以及文末的空行
 * 用于比较选手输出和标准输出
 */
std::string normalize_trailing_whitespace(const std::string &text);

}  // namespace arbiter
