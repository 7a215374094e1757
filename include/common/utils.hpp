#pragma once

#include <chrono>
#include <ctime>
#include <string>

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 解析数据库中的时间字符串（UTC），格式为 %Y-%m-%d %H:%M:%S
 * 字符串为空时返回 0
 */
time_t parse_datetime(const std::string &literal);

/**
 * @brief 将时间戳格式化为数据库使用的时间字符串（UTC）
 */
std::string format_datetime(time_t time);

/**
 * @brief 计时器，从构造时开始计时
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::system_clock::now() - start);
    }

private:
    std::chrono::system_clock::time_point start;
};
