#pragma once

#include <gmock/gmock.h>
#include "executor/execution_client.hpp"
#include "server/submission_store.hpp"

namespace arbiter::server::mock {

struct mock_execution_client : public execution_client {
    MOCK_METHOD1(execute, execution_outcome(const execution_request &request));
};

struct mock_statistics_sink : public statistics_sink {
    MOCK_METHOD3(problem_solved, void(const std::string &user_id, const std::string &problem_id, const std::string &sub_id));
};

/**
 * @brief 构造一个评测后端返回结果
 */
inline execution_outcome make_outcome(int status_id, const std::string &stdout_text, double time = 0.05, int memory_kb = 2048) {
    execution_outcome outcome;
    outcome.status_id = status_id;
    outcome.stdout_text = stdout_text;
    outcome.time = time;
    outcome.memory_kb = memory_kb;
    return outcome;
}

}  // namespace arbiter::server::mock
