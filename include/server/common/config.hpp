#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace arbiter::server {
using namespace std;
using namespace nlohmann;

/**
 * @brief 描述一个 MySQL 数据库连接信息
 */
struct database {
    /**
     * @brief 数据库服务器的地址
     */
    string host;

    /**
     * @brief 数据库服务器的账号
     */
    string user;

    /**
     * @brief 数据库服务器的密码
     */
    string password;

    /**
     * @brief 使用连接到的数据库服务器的哪一个数据库
     */
    string database;

    /**
     * @brief 连接超时，单位为秒
     */
    int timeout = 5;
};

void from_json(const json &j, database &db);

/**
 * @brief 描述评测后端（Judge0）的连接信息
 */
struct backend {
    /**
     * @brief 评测后端的根地址，比如 https://ce.judge0.com
     */
    string url;

    /**
     * @brief 访问评测后端使用的 token，为空时不发送
     */
    string auth_token;
};

void from_json(const json &j, backend &config);

/**
 * @brief 非 AC 测试点之后是否继续评测
 */
enum class failure_policy {
    /**
     * @brief 遇到第一个非 AC 测试点就停止评测，用于只区分通过/不通过的计分方式
     */
    STOP_ON_FIRST_FAILURE,

    /**
     * @brief 评测全部测试点，用于部分分统计
     */
    RUN_ALL
};

failure_policy parse_failure_policy(const string &literal);

/**
 * @brief 测试点评测器的配置
 */
struct runner {
    failure_policy policy = failure_policy::STOP_ON_FIRST_FAILURE;

    /**
     * @brief 评测后端无法连接时，同一个测试点最多重试几次
     */
    int max_retries = 1;
};

void from_json(const json &j, runner &config);

}  // namespace arbiter::server
