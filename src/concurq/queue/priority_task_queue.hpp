#pragma once

#include "concurq/types.hpp"
#include "../util/cancellation_token.hpp"
#include <vector>
#include <mutex>
#include <condition_variable>
#include <cstddef>
#include <cstdint>

namespace concurq {

/**
 * @brief 优先级任务队列
 *
 * 无界、线程安全的阻塞队列，按 Task::priority 升序出队（数值越小越先出队）。
 * enqueue 永不阻塞；dequeue 阻塞直到有任务或取消令牌被触发。
 *
 * 使用 std::vector + 堆操作存储条目，每个条目附带递增的插入序号，
 * 同优先级按插入顺序（FIFO）出队。FIFO 只是当前实现的行为，
 * 调用方不应依赖同优先级任务的相对顺序。
 */
class PriorityTaskQueue {
public:
    PriorityTaskQueue() = default;
    ~PriorityTaskQueue() = default;

    // 禁止拷贝和移动
    PriorityTaskQueue(const PriorityTaskQueue&) = delete;
    PriorityTaskQueue& operator=(const PriorityTaskQueue&) = delete;
    PriorityTaskQueue(PriorityTaskQueue&&) = delete;
    PriorityTaskQueue& operator=(PriorityTaskQueue&&) = delete;

    /**
     * @brief 添加任务到队列
     *
     * @param task 任务对象（复制保存）
     * @param retry_count 该任务已经历的重试次数
     */
    void enqueue(const Task& task, int retry_count = 0);

    /**
     * @brief 添加队列条目
     */
    void enqueue(QueuedTask item);

    /**
     * @brief 阻塞获取优先级最高的任务
     *
     * 队列为空时阻塞，直到有新任务或 token 被取消。
     * 取消时不会消费任何条目。
     *
     * @param out 用于接收任务的引用
     * @param token 取消令牌
     * @return 成功获取任务返回true，被取消返回false
     */
    bool dequeue(QueuedTask& out, util::CancellationToken& token);

    /**
     * @brief 非阻塞获取优先级最高的任务
     *
     * @param out 用于接收任务的引用
     * @return 成功获取任务返回true，队列为空返回false
     */
    bool try_dequeue(QueuedTask& out);

    /**
     * @brief 获取队列大小
     *
     * 仅用于观测，在并发修改下可能已过期，不能用于正确性判断。
     */
    size_t size() const;

    /**
     * @brief 检查队列是否为空（同 size()，仅用于观测）
     */
    bool empty() const;

    /**
     * @brief 清空队列
     *
     * @return 被丢弃的条目数
     */
    size_t clear();

private:
    struct Entry {
        QueuedTask item;
        uint64_t sequence = 0;
    };

    // 堆比较器：返回 true 表示 lhs 应排在 rhs 之后（堆顶为最紧急的条目）
    struct EntryCompare {
        bool operator()(const Entry& lhs, const Entry& rhs) const {
            if (lhs.item.task.priority != rhs.item.task.priority) {
                return lhs.item.task.priority > rhs.item.task.priority;
            }
            return lhs.sequence > rhs.sequence;
        }
    };

    /** 持有 mutex_ 时调用：弹出堆顶条目 */
    void pop_top_locked(QueuedTask& out);

    std::vector<Entry> heap_;
    uint64_t next_sequence_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
};

} // namespace concurq
