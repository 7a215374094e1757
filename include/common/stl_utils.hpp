#pragma once

#include <algorithm>
#include <cctype>
#include <string>

/**
 * @brief 将字符串转换为大写，用于不区分大小写的查找
 */
inline std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;
