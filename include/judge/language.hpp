#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace arbiter {

/**
 * @brief 一种编程语言在评测后端中的配置
 */
struct language_config {
    /**
     * @brief 提交中声明的语言代码，比如 CPP、PY
     */
    std::string code;

    /**
     * @brief 其他可以表示这个语言的代码，比如 PYTHON 也表示 PY
     */
    std::vector<std::string> aliases;

    std::string name;

    /**
     * @brief 评测后端使用的语言 id，比如 Judge0 中 C++ 为 54
     */
    int backend_id = 0;

    std::string file_name;

    bool compiled = false;

    /**
     * @brief 时间限制的倍数，比如 Python 和 Java 比 C++ 慢，给予 2 倍时间
     */
    double time_multiplier = 1;

    /**
     * @brief 内存限制的倍数
     */
    double memory_multiplier = 1;

    /**
     * @brief 根据倍数计算该语言的实际资源限制
     */
    resource_limits scale(const resource_limits &limits) const;
};

void from_json(const nlohmann::json &j, language_config &config);

/**
 * @brief 语言代码到语言配置的映射
 * 启动时初始化一次，之后只读，因此多个 worker 可以不加锁地并发查询
 */
struct language_registry {
    /**
     * @brief 使用内置的语言表
     */
    language_registry();

    explicit language_registry(const std::vector<language_config> &languages);

    /**
     * @brief 查询语言配置，不区分大小写
     * @throw unsupported_language 语言没有注册
     */
    const language_config &find(const std::string &code) const;

    bool supports(const std::string &code) const;

    static std::vector<language_config> default_languages();

private:
    std::vector<language_config> languages;

    // 键为大写的语言代码或别名，值为 languages 的下标
    std::map<std::string, std::size_t> index;
};

}  // namespace arbiter
