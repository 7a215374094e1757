#pragma once

#include <functional>
#include <vector>
#include "executor/execution_client.hpp"
#include "judge/language.hpp"
#include "judge/submission.hpp"
#include "server/common/config.hpp"

namespace arbiter {

/**
 * @brief 一次评测的结果
 */
struct run_outcome {
    /**
     * @brief 整个提交的评测结果
     */
    status verdict = status::ACCEPTED;

    /**
     * @brief 按照评测顺序排列的测试点结果
     * 编译错误时为空
     */
    std::vector<testcase_result> results;

    /**
     * @brief 编译错误时评测后端返回的编译信息
     */
    std::string compile_output;
};

/**
 * @brief 将测试点按照 order 排序，order 相同时按照 sequence 排序
 * 排序是稳定的，保证相同的测试点集合每次评测的顺序一致
 */
void sort_testcases(std::vector<testcase> &testcases);

/**
 * @brief 汇总测试点结果
 * 所有测试点都通过（或者没有测试点）时为 ACCEPTED，否则为第一个没有通过的测试点的结果
 */
status aggregate(const std::vector<testcase_result> &results);

/**
 * @brief 测试点评测器
 * 对一个提交逐个评测测试点，同一个提交的测试点永远不会并发评测。
 * 评测器本身没有可变状态，多个 worker 可以共享同一个评测器，
 * 但是必须在 worker 启动之前注册完回调函数。
 */
struct testcase_runner {
    typedef std::function<void(const submission &, const testcase_result &)> testcase_callback;

    testcase_runner(execution_client &client, const language_registry &languages, const server::runner &options = {});

    /**
     * @brief 评测一个提交的所有测试点
     * 评测后端的错误不会抛出，而是变成 SYSTEM_ERROR 的测试点结果
     * @param submit 要评测的提交
     * @param testcases 评测目标的测试点，不需要事先排序
     * @param limits 评测目标的资源限制，会按照语言倍数放大
     * @throw unsupported_language 提交的语言没有注册
     */
    run_outcome run(const submission &submit, std::vector<testcase> testcases, const resource_limits &limits) const;

    /**
     * @brief 注册测试点评测完成的回调
     * 每个测试点评测完成后立即调用，编译错误时不调用
     */
    void on_testcase_finished(testcase_callback callback);

private:
    execution_client &client;
    const language_registry &languages;
    server::runner options;
    std::vector<testcase_callback> callbacks;

    testcase_result judge_testcase(const submission &submit, const language_config &lang,
                                   const testcase &tc, const resource_limits &limits,
                                   std::string &compile_output) const;
};

}  // namespace arbiter
