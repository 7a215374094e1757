#pragma once

#include <string>

namespace arbiter {

/**
 * @brief 表示数据点或整个提交的评测结果
 * 除了 PENDING 和 RUNNING 之外的状态都是终态，枚举值按照“严重程度”递增，
 * 用于多个测试点结果之间的比较。
 */
enum class status {
    /**
     * @brief 提交已经创建，还没有被任何 worker 领取
     */
    PENDING = 0,

    /**
     * @brief 提交已经被某个 worker 领取，正在逐个评测测试点
     * 只有 orchestrator 可以把提交从 PENDING 切换到 RUNNING
     */
    RUNNING = 1,

    /**
     * @brief 用户程序本测试点评测通过
     * 对于整个提交，表示所有测试点均通过
     */
    ACCEPTED = 2,

    /**
     * @brief 答案错误
     * 忽略行末空白字符和文末空行后，选手输出和标准输出仍然不一致
     */
    WRONG_ANSWER = 3,

    /**
     * @brief 用户程序运行时间超出限制
     * 即使评测后端没有标记超时，只要运行时间达到限制也会返回该结果
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 用户程序运行内存超限
     */
    MEMORY_LIMIT_EXCEEDED = 5,

    /**
     * @brief 用户程序出现运行时错误
     * 包括段错误、浮点错误、非零返回值等所有异常退出的情况
     */
    RUNTIME_ERROR = 6,

    /**
     * @brief 用户程序编译错误
     * 编译错误与测试点无关，出现时立即停止评测，不保存任何测试点结果
     */
    COMPILATION_ERROR = 7,

    /**
     * @brief 内部错误，评测系统出错
     * 比如评测后端无法连接、返回了无法解析的数据
     */
    SYSTEM_ERROR = 8
};

const char *get_display_message(status);

/**
 * @brief 获取评测结果的短代码，比如 AC、WA，数据库中保存的就是短代码
 */
const char *get_short_code(status);

/**
 * @brief 根据短代码解析评测结果
 * @throw std::invalid_argument 如果短代码不存在
 */
status parse_short_code(const std::string &code);

/**
 * @brief 是否为终态（PENDING 和 RUNNING 之外的状态）
 */
bool is_terminal(status);

}  // namespace arbiter
