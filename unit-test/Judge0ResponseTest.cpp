#include "common/exceptions.hpp"
#include "executor/judge0.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace arbiter;
using namespace nlohmann;

TEST(Judge0ResponseTest, RequestBody) {
    execution_request request;
    request.source_code = "print(input())";
    request.language_id = 71;
    request.stdin_text = "1 2";
    request.expected_output = "3";
    request.time_limit_ms = 1500;
    request.memory_limit_kb = 262144;

    json body = judge0::build_request_body(request);
    EXPECT_EQ("print(input())", body.at("source_code").get<string>());
    EXPECT_EQ(71, body.at("language_id").get<int>());
    EXPECT_EQ("1 2", body.at("stdin").get<string>());
    EXPECT_EQ("3", body.at("expected_output").get<string>());
    EXPECT_DOUBLE_EQ(1.5, body.at("cpu_time_limit").get<double>());
    EXPECT_EQ(262144, body.at("memory_limit").get<int>());
}

TEST(Judge0ResponseTest, ParseAccepted) {
    auto outcome = judge0::parse_response(201, R"({
        "status": {"id": 3, "description": "Accepted"},
        "stdout": "3\n",
        "stderr": null,
        "compile_output": null,
        "time": "0.012",
        "memory": 3456,
        "exit_code": 0
    })");
    EXPECT_EQ(3, outcome.status_id);
    EXPECT_EQ("Accepted", outcome.status_description);
    EXPECT_EQ("3\n", outcome.stdout_text);
    EXPECT_EQ("", outcome.stderr_text);
    EXPECT_DOUBLE_EQ(0.012, outcome.time);
    EXPECT_EQ(3456, outcome.memory_kb);
    EXPECT_EQ(0, outcome.exit_code);
}

TEST(Judge0ResponseTest, ParseNumericTimeAndMissingFields) {
    auto outcome = judge0::parse_response(200, R"({"status": {"id": 11}, "time": 0.5, "memory": null, "exit_code": 139})");
    EXPECT_EQ(11, outcome.status_id);
    EXPECT_DOUBLE_EQ(0.5, outcome.time);
    EXPECT_EQ(0, outcome.memory_kb);
    EXPECT_EQ(139, outcome.exit_code);
    EXPECT_EQ("", outcome.stdout_text);
}

TEST(Judge0ResponseTest, CompilationError) {
    auto outcome = judge0::parse_response(201, R"({
        "status": {"id": 6, "description": "Compilation Error"},
        "stdout": null,
        "compile_output": "main.cpp:1:1: error: expected unqualified-id",
        "time": null,
        "memory": null
    })");
    EXPECT_EQ(6, outcome.status_id);
    EXPECT_EQ("main.cpp:1:1: error: expected unqualified-id", outcome.compile_output);
    EXPECT_DOUBLE_EQ(0, outcome.time);
}

TEST(Judge0ResponseTest, NonSuccessfulHttpCodeIsUnreachable) {
    EXPECT_THROW(judge0::parse_response(503, "Service Unavailable"), executor_unreachable);
    EXPECT_THROW(judge0::parse_response(422, R"({"language_id": ["language with id 999 doesn't exist"]})"), executor_unreachable);
}

TEST(Judge0ResponseTest, MalformedResponseIsProtocolError) {
    EXPECT_THROW(judge0::parse_response(200, "<html>"), executor_protocol_error);
    EXPECT_THROW(judge0::parse_response(200, "[]"), executor_protocol_error);
    EXPECT_THROW(judge0::parse_response(200, R"({"stdout": "3"})"), executor_protocol_error);
    EXPECT_THROW(judge0::parse_response(200, R"({"status": {"id": "3"}})"), executor_protocol_error);
    EXPECT_THROW(judge0::parse_response(200, R"({"status": {"id": 3}, "time": "fast"})"), executor_protocol_error);
    EXPECT_THROW(judge0::parse_response(200, R"({"status": {"id": 3}, "stdout": 42})"), executor_protocol_error);
}
