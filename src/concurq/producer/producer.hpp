#pragma once

#include "concurq/config.hpp"
#include "concurq/types.hpp"
#include "../queue/priority_task_queue.hpp"
#include "../tracker/status_tracker.hpp"
#include "../util/cancellation_token.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace concurq {

/**
 * @brief 任务工厂：根据生产者名称和序号（从 1 开始）生成任务
 */
using TaskFactory = std::function<Task(const std::string& producer_name, size_t sequence)>;

/**
 * @brief 默认任务工厂
 *
 * 分级规则：每第 3 个任务优先级 1（High），否则每第 5 个优先级 5（Medium），
 * 其余优先级 10（Low）。
 */
Task make_tiered_task(const std::string& producer_name, size_t sequence);

/**
 * @brief 生产者
 *
 * 按固定间隔生成 tasks_to_produce 个任务：先入队，再在跟踪器中记录 SUBMITTED。
 * 间隔等待可被取消令牌中断，已入队的任务不受影响。
 */
class Producer {
public:
    /**
     * @brief 构造函数
     *
     * @param config 生产者配置（name 不能为空，interval_ms 不能为负）
     * @param queue 共享任务队列
     * @param tracker 共享状态跟踪器
     * @param factory 任务工厂，为空时使用 make_tiered_task
     * @throws std::invalid_argument 配置无效
     */
    Producer(const ProducerConfig& config,
             PriorityTaskQueue& queue,
             StatusTracker& tracker,
             TaskFactory factory = nullptr);

    Producer(const Producer&) = delete;
    Producer& operator=(const Producer&) = delete;

    /**
     * @brief 生产循环
     *
     * 生成完全部任务或 token 被取消时返回。
     */
    void run(util::CancellationToken& token);

    const std::string& name() const { return config_.name; }

    /**
     * @brief 已入队的任务数
     */
    size_t produced_count() const;

private:
    ProducerConfig config_;
    PriorityTaskQueue& queue_;
    StatusTracker& tracker_;
    TaskFactory factory_;
    std::atomic<size_t> produced_{0};
};

} // namespace concurq
