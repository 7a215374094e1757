#include "gtest/gtest.h"
#include "judge/classifier.hpp"

using namespace std;
using namespace arbiter;

class VerdictClassifierTest : public ::testing::Test {
protected:
    expectation expect{"3\n", 1000, 262144};

    execution_outcome outcome(int status_id, const string &stdout_text = "3\n") {
        execution_outcome result;
        result.status_id = status_id;
        result.stdout_text = stdout_text;
        result.time = 0.05;
        result.memory_kb = 2048;
        return result;
    }
};

TEST_F(VerdictClassifierTest, MappingTableIsTotal) {
    EXPECT_EQ(status::SYSTEM_ERROR, map_backend_status(1));
    EXPECT_EQ(status::SYSTEM_ERROR, map_backend_status(2));
    EXPECT_EQ(status::ACCEPTED, map_backend_status(3));
    EXPECT_EQ(status::WRONG_ANSWER, map_backend_status(4));
    EXPECT_EQ(status::TIME_LIMIT_EXCEEDED, map_backend_status(5));
    EXPECT_EQ(status::COMPILATION_ERROR, map_backend_status(6));
    for (int id = 7; id <= 12; ++id)
        EXPECT_EQ(status::RUNTIME_ERROR, map_backend_status(id)) << id;
    EXPECT_EQ(status::SYSTEM_ERROR, map_backend_status(13));
    EXPECT_EQ(status::SYSTEM_ERROR, map_backend_status(14));
    for (int id : {-1, 0, 15, 100})
        EXPECT_EQ(status::SYSTEM_ERROR, map_backend_status(id)) << id;
}

TEST_F(VerdictClassifierTest, FloatingPointErrorIsRuntimeError) {
    auto result = outcome(9, "");
    result.exit_code = 136;
    result.stderr_text = "Floating point exception";
    EXPECT_EQ(status::RUNTIME_ERROR, classify(result, expect));
}

TEST_F(VerdictClassifierTest, Accepted) {
    EXPECT_EQ(status::ACCEPTED, classify(outcome(3), expect));
    // 行末空白和文末空行不影响结果
    EXPECT_EQ(status::ACCEPTED, classify(outcome(3, "3   \n\n"), expect));
    EXPECT_EQ(status::ACCEPTED, classify(outcome(3, "3"), expect));
}

TEST_F(VerdictClassifierTest, OutputMismatchIsWrongAnswer) {
    EXPECT_EQ(status::WRONG_ANSWER, classify(outcome(3, "4\n"), expect));
    EXPECT_EQ(status::WRONG_ANSWER, classify(outcome(4, "4\n"), expect));
}

TEST_F(VerdictClassifierTest, BackendWrongAnswerWithMatchingOutput) {
    // 评测后端比较时不忽略行末空白，以本地比较为准
    EXPECT_EQ(status::ACCEPTED, classify(outcome(4, "3 \n"), expect));
}

TEST_F(VerdictClassifierTest, TimeAtLimitIsTimeLimitExceeded) {
    auto result = outcome(3);
    result.time = 1.0;
    EXPECT_EQ(status::TIME_LIMIT_EXCEEDED, classify(result, expect));
    result.time = 0.999;
    EXPECT_EQ(status::ACCEPTED, classify(result, expect));
    result = outcome(11, "");
    result.time = 1.2;
    EXPECT_EQ(status::TIME_LIMIT_EXCEEDED, classify(result, expect));
}

TEST_F(VerdictClassifierTest, MemoryAtLimitIsMemoryLimitExceeded) {
    auto result = outcome(3);
    result.memory_kb = 262144;
    EXPECT_EQ(status::MEMORY_LIMIT_EXCEEDED, classify(result, expect));
}

TEST_F(VerdictClassifierTest, NonZeroExitWithoutStderrIsRuntimeError) {
    auto result = outcome(3);
    result.exit_code = 1;
    EXPECT_EQ(status::RUNTIME_ERROR, classify(result, expect));
    result.stderr_text = "warning";
    EXPECT_EQ(status::ACCEPTED, classify(result, expect));
}

TEST_F(VerdictClassifierTest, CompilationAndSystemErrorsAreFinal) {
    auto result = outcome(6, "");
    result.time = 5;
    result.compile_output = "main.cpp:1:1: error";
    EXPECT_EQ(status::COMPILATION_ERROR, classify(result, expect));

    result = outcome(13);
    result.time = 5;
    EXPECT_EQ(status::SYSTEM_ERROR, classify(result, expect));
}

TEST_F(VerdictClassifierTest, Deterministic) {
    for (int id = 0; id <= 15; ++id) {
        auto result = outcome(id, id % 2 ? "3" : "4");
        result.exit_code = id % 3;
        EXPECT_EQ(classify(result, expect), classify(result, expect)) << id;
    }
}
