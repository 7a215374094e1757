#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace arbiter {

struct arbiter_exception : std::exception {
    arbiter_exception();
    explicit arbiter_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const arbiter_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 提交使用的语言没有在 language_registry 中注册
 * 这种提交在评测开始之前就会被拒绝，不需要重试
 */
struct unsupported_language : public arbiter_exception {
    explicit unsupported_language(const std::string &language);

    std::string language;
};

/**
 * @brief 无法连接评测后端，或者评测后端返回了非 2xx 的状态码，
 * 或者等待评测后端超时（和选手程序超时不同）
 * 这是一个暂时性错误，可以重试
 */
struct executor_unreachable : public arbiter_exception {
    executor_unreachable();
    explicit executor_unreachable(const std::string &message);
};

/**
 * @brief 评测后端返回的数据无法解析成预期的格式
 * 一般意味着评测后端的接口发生了变化
 */
struct executor_protocol_error : public arbiter_exception {
    executor_protocol_error();
    explicit executor_protocol_error(const std::string &message);
};

/**
 * @brief 表示数据库查询错误
 */
struct database_error : public arbiter_exception {
    database_error();
    explicit database_error(const std::string &message);
};

/**
 * @brief 多次重试后仍然无法保存评测结果
 * 此时提交保持 RUNNING 状态，等待 stale sweep 重新分发
 */
struct orchestrator_error : public arbiter_exception {
    orchestrator_error();
    explicit orchestrator_error(const std::string &message);
};

/**
 * @brief 提交的评测目标不合法（同时指向题目和比赛题目，或者比赛不一致）
 */
struct invalid_submission : public arbiter_exception {
    invalid_submission();
    explicit invalid_submission(const std::string &message);
};

/**
 * @brief 提交正在被另一个 worker 评测，调用方应稍后重试
 */
struct already_judging : public arbiter_exception {
    explicit already_judging(const std::string &sub_id);
};

}  // namespace arbiter
