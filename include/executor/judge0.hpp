#pragma once

#include <nlohmann/json.hpp>
#include "executor/execution_client.hpp"
#include "server/common/config.hpp"

/**
 * Judge0 评测后端的客户端
 * 每个测试点发送一次同步请求：
 * POST {url}/submissions?base64_encoded=false&wait=true
 * @code{json}
 * {
 *   "source_code": "...",
 *   "language_id": 54,
 *   "stdin": "1 2",
 *   "expected_output": "3",
 *   "cpu_time_limit": 1.5,    // 秒
 *   "memory_limit": 262144    // KB
 * }
 * @endcode
 * 返回：
 * @code{json}
 * {
 *   "status": { "id": 3, "description": "Accepted" },
 *   "stdout": "3\n",
 *   "stderr": null,
 *   "compile_output": null,
 *   "time": "0.012",           // 秒，可能是字符串、数字或 null
 *   "memory": 3456,            // KB，可能是 null
 *   "exit_code": 0
 * }
 * @endcode
 */
namespace arbiter::judge0 {

/**
 * @brief 构造发送给 Judge0 的请求体
 */
nlohmann::json build_request_body(const execution_request &request);

/**
 * @brief 解析 Judge0 的返回
 * @param http_code HTTP 状态码
 * @param body 返回的内容
 * @throw executor_unreachable 状态码不是 2xx
 * @throw executor_protocol_error 返回内容不是 JSON 或者缺少 status.id
 */
execution_outcome parse_response(long http_code, const std::string &body);

struct client : public execution_client {
    explicit client(const server::backend &config);

    execution_outcome execute(const execution_request &request) override;

private:
    server::backend config;
};

}  // namespace arbiter::judge0
