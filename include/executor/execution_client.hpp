#pragma once

#include <string>

namespace arbiter {

/**
 * @brief 发送给评测后端的一次执行请求，对应一个测试点
 */
struct execution_request {
    std::string source_code;

    /**
     * @brief 评测后端的语言 id，由 language_registry 给出
     */
    int language_id = 0;

    std::string stdin_text;

    /**
     * @brief 标准输出，评测后端支持时会在后端完成比较
     */
    std::string expected_output;

    /**
     * @brief 已经按照语言倍数放大的时间限制
     * @note 单位为毫秒
     */
    int time_limit_ms = 0;

    /**
     * @brief 已经按照语言倍数放大的内存限制
     * @note 单位为 KB
     */
    int memory_limit_kb = 0;
};

/**
 * @brief 评测后端返回的原始执行结果
 * 评测后端返回的字段可能缺失，缺失的字段为 0 或者空字符串
 */
struct execution_outcome {
    /**
     * @brief 评测后端的状态码，比如 Judge0 中 3 表示 Accepted
     */
    int status_id = 0;

    std::string status_description;

    std::string stdout_text;

    std::string stderr_text;

    std::string compile_output;

    /**
     * @brief 程序运行时间
     * @note 单位为秒
     */
    double time = 0;

    /**
     * @brief 程序运行峰值内存
     * @note 单位为 KB
     */
    int memory_kb = 0;

    int exit_code = 0;
};

/**
 * @brief 评测后端客户端，负责在不可信的评测后端上执行一次选手程序
 * 实现必须是无状态的，多个 worker 会并发调用同一个客户端
 */
struct execution_client {
    virtual ~execution_client();

    /**
     * @brief 执行一次请求并等待结果
     * 实现必须自己限制最长等待时间（时间限制 + BACKEND_OVERHEAD_MS），不能无限阻塞
     * @param request 执行请求
     * @return 评测后端返回的原始结果
     * @throw executor_unreachable 网络错误、等待超时、非 2xx 的返回
     * @throw executor_protocol_error 返回内容无法解析
     */
    virtual execution_outcome execute(const execution_request &request) = 0;
};

}  // namespace arbiter
