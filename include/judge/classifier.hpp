#pragma once

#include <string>
#include "common/status.hpp"
#include "executor/execution_client.hpp"

/**
 * 评测结果分类器
 * 将评测后端返回的原始结果转换为平台统一的评测结果。
 * 分类器是纯函数，不读取时钟，不访问任何全局状态，相同的输入一定得到相同的结果。
 */
namespace arbiter {

/**
 * @brief 分类时需要的测试点信息
 */
struct expectation {
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
 * @brief Judge0 状态码到评测结果的映射表
 * 1 In Queue、2 Processing            -> SYSTEM_ERROR（同步请求不应该返回这两个状态）
 * 3 Accepted                          -> ACCEPTED
 * 4 Wrong Answer                      -> WRONG_ANSWER
 * 5 Time Limit Exceeded               -> TIME_LIMIT_EXCEEDED
 * 6 Compilation Error                 -> COMPILATION_ERROR
 * 7 ~ 12 Runtime Error (SIGSEGV, SIGXFSZ, SIGFPE, SIGABRT, NZEC, Other) -> RUNTIME_ERROR
 * 13 Internal Error、14 Exec Format Error -> SYSTEM_ERROR
 * 其他                                -> SYSTEM_ERROR
 */
status map_backend_status(int status_id);

/**
 * @brief 将一次执行的原始结果分类为评测结果
 * 在映射表的基础上依次检查：
 * 1. 编译错误和系统错误直接返回；
 * 2. 运行时间达到时间限制，返回 TIME_LIMIT_EXCEEDED；
 * 3. 内存达到内存限制，返回 MEMORY_LIMIT_EXCEEDED；
 * 4. 返回值非零且没有标准错误输出，返回 RUNTIME_ERROR；
 * 5. 映射表给出 ACCEPTED 或 WRONG_ANSWER 时，以忽略行末空白后比较标准输出的结果为准。
 * @param outcome 评测后端返回的原始结果
 * @param expect 标准输出和资源限制
 */
status classify(const execution_outcome &outcome, const expectation &expect);

/**
 * @brief 将评测后端返回的秒数转换为毫秒
 */
int elapsed_ms(const execution_outcome &outcome);

}  // namespace arbiter
