#pragma once

#include "concurq/config.hpp"
#include "concurq/types.hpp"
#include "../queue/priority_task_queue.hpp"
#include "../tracker/status_tracker.hpp"
#include "../util/cancellation_token.hpp"
#include "../util/exception_handler.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace concurq {

/**
 * @brief 任务处理函数（真实工作单元）
 *
 * 在模拟处理时间之后调用；抛出的异常按可重试的处理错误对待。
 * 长时间运行的处理函数应观察 abort 令牌。
 */
using TaskHandler = std::function<void(const Task& task, util::CancellationToken& abort)>;

/**
 * @brief 模拟失败策略：返回 true 表示本次尝试模拟失败
 */
using FailurePolicy = std::function<bool(const QueuedTask& item)>;

/**
 * @brief 按固定概率失败的策略
 *
 * @param failure_rate 失败概率 [0, 1]
 */
FailurePolicy make_random_failure_policy(double failure_rate);

/**
 * @brief Worker 共享资源
 *
 * 全部 worker 共用同一组队列、跟踪器和计数器。
 */
struct WorkerContext {
    PriorityTaskQueue& queue;
    StatusTracker& tracker;
    std::atomic<uint64_t>& completed_count;       // 全局已完成计数
    std::atomic<size_t>& active_workers;          // 正在处理任务的 worker 数
    util::ExceptionHandler& exception_handler;
};

/**
 * @brief 任务处理 worker
 *
 * 单个任务的处理状态机：
 * 1. 标记 PROCESSING（记录开始时间）
 * 2. 执行：随机时长的可中断等待，然后调用 TaskHandler（如有）
 * 3. 模拟失败或处理函数抛出异常：标记 FAILED；retry_count < max_retries 时
 *    标记 RETRIED 并重新入队（retry_count + 1），否则停留在终态 FAILED，任务被丢弃
 * 4. 成功：COMPLETED，全局计数 +1
 *
 * 强制中止（abort）打断的任务直接标记为终态 FAILED，不再重试。
 */
class Worker {
public:
    /**
     * @brief 构造函数
     *
     * @param name worker 名称（如 "Worker-1"）
     * @param config worker 配置
     * @param context 共享资源
     * @throws std::invalid_argument 配置无效
     */
    Worker(const std::string& name, const WorkerConfig& config, WorkerContext context);

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void set_task_handler(TaskHandler handler);
    void set_failure_policy(FailurePolicy policy);

    /**
     * @brief 处理循环
     *
     * stop 被取消后：完成当前任务，继续以非阻塞方式取走队列中剩余任务，队列为空时退出。
     * abort 被取消后：立即退出，正在执行的任务标记为 FAILED。
     * 调用方应保证取消 abort 时也取消 stop。
     */
    void run(util::CancellationToken& stop, util::CancellationToken& abort);

    /**
     * @brief 处理单个任务（一次尝试）
     *
     * @return 最终写入跟踪器的状态（COMPLETED、RETRIED 或 FAILED）
     */
    TaskStatus process(const QueuedTask& item, util::CancellationToken& abort);

    const std::string& name() const { return name_; }

    /**
     * @brief 本 worker 完成的任务数
     */
    uint64_t processed_count() const;

    /**
     * @brief 本 worker 执行过的尝试次数（含重试）
     */
    uint64_t attempt_count() const;

private:
    std::chrono::milliseconds pick_processing_time() const;
    void requeue(const QueuedTask& item);

    std::string name_;
    WorkerConfig config_;
    WorkerContext context_;
    TaskHandler handler_;
    FailurePolicy failure_policy_;

    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> attempts_{0};
};

} // namespace concurq
