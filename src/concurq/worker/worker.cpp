#include "worker.hpp"
#include "../task/task.hpp"
#include "../util/logger.hpp"
#include <random>
#include <stdexcept>

namespace concurq {

namespace {

std::mt19937& thread_rng() {
    static thread_local std::mt19937 rng(std::random_device{}());
    return rng;
}

// 处理期间维护 active_workers 计数
class ActiveScope {
public:
    explicit ActiveScope(std::atomic<size_t>& counter) : counter_(counter) {
        counter_.fetch_add(1, std::memory_order_relaxed);
    }
    ~ActiveScope() {
        counter_.fetch_sub(1, std::memory_order_relaxed);
    }
    ActiveScope(const ActiveScope&) = delete;
    ActiveScope& operator=(const ActiveScope&) = delete;

private:
    std::atomic<size_t>& counter_;
};

} // namespace

FailurePolicy make_random_failure_policy(double failure_rate) {
    if (failure_rate <= 0.0) {
        return [](const QueuedTask&) { return false; };
    }
    if (failure_rate >= 1.0) {
        return [](const QueuedTask&) { return true; };
    }
    return [failure_rate](const QueuedTask&) {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(thread_rng()) < failure_rate;
    };
}

Worker::Worker(const std::string& name, const WorkerConfig& config, WorkerContext context)
    : name_(name)
    , config_(config)
    , context_(context)
    , failure_policy_(make_random_failure_policy(config.failure_rate)) {
    if (name_.empty()) {
        throw std::invalid_argument("worker name must not be empty");
    }
    if (config_.max_retries < 0) {
        throw std::invalid_argument("max_retries must not be negative");
    }
    if (config_.failure_rate < 0.0 || config_.failure_rate > 1.0) {
        throw std::invalid_argument("failure_rate must be within [0, 1]");
    }
    if (config_.min_processing_ms < 0 || config_.min_processing_ms > config_.max_processing_ms) {
        throw std::invalid_argument("processing time bounds are invalid");
    }
}

void Worker::set_task_handler(TaskHandler handler) {
    handler_ = std::move(handler);
}

void Worker::set_failure_policy(FailurePolicy policy) {
    if (policy) {
        failure_policy_ = std::move(policy);
    } else {
        failure_policy_ = make_random_failure_policy(config_.failure_rate);
    }
}

void Worker::run(util::CancellationToken& stop, util::CancellationToken& abort) {
    CONCURQ_LOG_DEBUG("Worker " << name_ << " started.");

    while (!abort.is_cancelled()) {
        QueuedTask item;
        if (stop.is_cancelled()) {
            // 优雅停止：只取已经在队列中的任务，不再阻塞等待
            if (!context_.queue.try_dequeue(item)) {
                break;
            }
        } else if (!context_.queue.dequeue(item, stop)) {
            continue;
        }
        process(item, abort);
    }

    if (abort.is_cancelled()) {
        CONCURQ_LOG_WARN("Worker " << name_ << " aborted and shutting down.");
    } else {
        CONCURQ_LOG_INFO("Worker " << name_ << " stopped after completing "
                         << processed_count() << " tasks.");
    }
}

TaskStatus Worker::process(const QueuedTask& item, util::CancellationToken& abort) {
    ActiveScope active(context_.active_workers);
    attempts_.fetch_add(1, std::memory_order_relaxed);

    const Task& task = item.task;
    CONCURQ_LOG_INFO("Starting task " << task.id << " (Priority: " << task.priority
                     << ", Retries: " << item.retry_count << ")");
    context_.tracker.set_status(task.id, TaskStatus::PROCESSING);

    bool interrupted = false;
    bool errored = false;
    try {
        if (!abort.wait_for(pick_processing_time())) {
            interrupted = true;
        } else if (handler_) {
            handler_(task, abort);
            // 处理函数因 abort 提前返回，视为被打断
            interrupted = abort.is_cancelled();
        }
    } catch (...) {
        context_.exception_handler.handle_exception(task.id, std::current_exception());
        errored = true;
    }

    // 关闭过程中被打断或出错：不重试，避免与关闭流程竞争
    if (interrupted || (errored && abort.is_cancelled())) {
        CONCURQ_LOG_WARN("Interrupted during processing of task " << task.id);
        context_.tracker.set_status(task.id, TaskStatus::FAILED);
        return TaskStatus::FAILED;
    }

    if (errored) {
        context_.tracker.set_status(task.id, TaskStatus::FAILED);
        if (item.retry_count < config_.max_retries) {
            CONCURQ_LOG_INFO("Re-queueing failed task " << task.id << " for retry "
                             << item.retry_count + 1);
            requeue(item);
            return TaskStatus::RETRIED;
        }
        CONCURQ_LOG_ERROR("Task " << task.id << " failed after " << config_.max_retries
                          << " retries. Giving up.");
        return TaskStatus::FAILED;
    }

    if (failure_policy_(item)) {
        context_.tracker.set_status(task.id, TaskStatus::FAILED);
        if (item.retry_count < config_.max_retries) {
            CONCURQ_LOG_WARN("Simulating failure for task " << task.id << ". Re-queueing...");
            requeue(item);
            return TaskStatus::RETRIED;
        }
        CONCURQ_LOG_ERROR("Task " << task.id << " failed after " << config_.max_retries
                          << " retries. Giving up.");
        return TaskStatus::FAILED;
    }

    CONCURQ_LOG_INFO("Completed task " << task.id);
    context_.tracker.set_status(task.id, TaskStatus::COMPLETED);
    context_.completed_count.fetch_add(1, std::memory_order_relaxed);
    processed_.fetch_add(1, std::memory_order_relaxed);
    return TaskStatus::COMPLETED;
}

void Worker::requeue(const QueuedTask& item) {
    // 先记录 RETRIED 再入队：入队后其他 worker 可能立即标记 PROCESSING，
    // 顺序颠倒会让 RETRIED 覆盖新一轮的 PROCESSING
    context_.tracker.set_status(item.task.id, TaskStatus::RETRIED);
    context_.queue.enqueue(item.task, item.retry_count + 1);
}

std::chrono::milliseconds Worker::pick_processing_time() const {
    if (config_.max_processing_ms <= config_.min_processing_ms) {
        return std::chrono::milliseconds(config_.min_processing_ms);
    }
    std::uniform_int_distribution<int64_t> dist(config_.min_processing_ms,
                                                config_.max_processing_ms);
    return std::chrono::milliseconds(dist(thread_rng()));
}

uint64_t Worker::processed_count() const {
    return processed_.load(std::memory_order_relaxed);
}

uint64_t Worker::attempt_count() const {
    return attempts_.load(std::memory_order_relaxed);
}

} // namespace concurq
