#pragma once

namespace arbiter {

/**
 * @brief 等待评测后端返回结果时，在测试点时间限制之外额外允许的等待时间
 * 评测后端是所有评测流量共享的，请求可能需要排队，
 * 因此单次请求的超时 = 测试点时间限制 + BACKEND_OVERHEAD_MS
 * @note 单位为毫秒
 */
extern int BACKEND_OVERHEAD_MS;

/**
 * @brief 连接评测后端的超时时间
 * @note 单位为毫秒
 */
extern int BACKEND_CONNECT_TIMEOUT_MS;

/**
 * @brief 评测后端无法连接时，重试同一个测试点之前等待的时间
 * @note 单位为毫秒
 */
extern int EXECUTOR_RETRY_DELAY_MS;

/**
 * @brief 保存评测结果失败时最多尝试多少次
 */
extern int PERSIST_ATTEMPTS;

/**
 * @brief 保存评测结果失败后第一次重试前的等待时间，之后每次翻倍
 * @note 单位为毫秒
 */
extern int PERSIST_BACKOFF_MS;

/**
 * @brief 提交处于 RUNNING 状态超过这个时间就认为评测进程已经崩溃，
 * 可以由 stale sweep 重新分发
 * @note 单位为秒
 */
extern int STALE_RUNNING_SECONDS;

/**
 * @brief worker 发现队列为空时，一次从数据库拉取多少个待评测提交
 */
extern int FETCH_BATCH_SIZE;

/**
 * @brief 比赛状态同步的间隔
 * @note 单位为秒
 */
extern int CONTEST_SWEEP_INTERVAL;

/**
 * @brief 检查卡住的 RUNNING 提交的间隔
 * @note 单位为秒
 */
extern int STALE_SWEEP_INTERVAL;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，会在日志中输出评测后端的完整请求和返回内容
 */
extern bool DEBUG;

}  // namespace arbiter
