#include "priority_task_queue.hpp"
#include <algorithm>
#include <utility>

namespace concurq {

void PriorityTaskQueue::enqueue(const Task& task, int retry_count) {
    QueuedTask item;
    item.task = task;
    item.retry_count = retry_count;
    enqueue(std::move(item));
}

void PriorityTaskQueue::enqueue(QueuedTask item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry entry;
        entry.item = std::move(item);
        entry.sequence = next_sequence_++;
        heap_.push_back(std::move(entry));
        std::push_heap(heap_.begin(), heap_.end(), EntryCompare{});
    }
    // 唤醒一个等待的消费者
    condition_.notify_one();
}

void PriorityTaskQueue::pop_top_locked(QueuedTask& out) {
    std::pop_heap(heap_.begin(), heap_.end(), EntryCompare{});
    out = std::move(heap_.back().item);
    heap_.pop_back();
}

bool PriorityTaskQueue::dequeue(QueuedTask& out, util::CancellationToken& token) {
    // 取消时在队列锁内唤醒，避免在谓词检查与进入等待之间丢失通知。
    // 注册对象必须先于 unique_lock 构造，这样注销发生在释放队列锁之后。
    util::CancellationRegistration registration(token, [this]() {
        { std::lock_guard<std::mutex> lock(mutex_); }
        condition_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this, &token]() {
        return token.is_cancelled() || !heap_.empty();
    });

    if (token.is_cancelled()) {
        return false;
    }

    pop_top_locked(out);
    return true;
}

bool PriorityTaskQueue::try_dequeue(QueuedTask& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (heap_.empty()) {
        return false;
    }
    pop_top_locked(out);
    return true;
}

size_t PriorityTaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heap_.size();
}

bool PriorityTaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heap_.empty();
}

size_t PriorityTaskQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = heap_.size();
    heap_.clear();
    return dropped;
}

} // namespace concurq
