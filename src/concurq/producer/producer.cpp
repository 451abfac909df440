#include "producer.hpp"
#include "../task/task.hpp"
#include "../util/logger.hpp"
#include <chrono>
#include <stdexcept>

namespace concurq {

Task make_tiered_task(const std::string& producer_name, size_t sequence) {
    const std::string seq = std::to_string(sequence);
    if (sequence % 3 == 0) {
        return make_task("HighPriorityTask-" + producer_name + "-" + seq, 1,
                         "Payload for High Priority Task " + seq);
    }
    if (sequence % 5 == 0) {
        return make_task("MediumPriorityTask-" + producer_name + "-" + seq, 5,
                         "Payload for Medium Priority Task " + seq);
    }
    return make_task("LowPriorityTask-" + producer_name + "-" + seq, 10,
                     "Payload for Low Priority Task " + seq);
}

Producer::Producer(const ProducerConfig& config,
                   PriorityTaskQueue& queue,
                   StatusTracker& tracker,
                   TaskFactory factory)
    : config_(config)
    , queue_(queue)
    , tracker_(tracker)
    , factory_(factory ? std::move(factory) : TaskFactory(make_tiered_task)) {
    if (config_.name.empty()) {
        throw std::invalid_argument("producer name must not be empty");
    }
    if (config_.interval_ms < 0) {
        throw std::invalid_argument("producer interval_ms must not be negative");
    }
}

void Producer::run(util::CancellationToken& token) {
    CONCURQ_LOG_INFO("Producer " << config_.name << " started. Will produce "
                     << config_.tasks_to_produce << " tasks every "
                     << config_.interval_ms << " ms.");

    for (size_t seq = 1; seq <= config_.tasks_to_produce; ++seq) {
        if (token.is_cancelled()) {
            break;
        }

        Task task = factory_(config_.name, seq);

        // 先入队再记录 SUBMITTED，保证被标记时任务已对 worker 可见
        queue_.enqueue(task);
        tracker_.set_status(task.id, TaskStatus::SUBMITTED);
        produced_.fetch_add(1, std::memory_order_relaxed);

        CONCURQ_LOG_INFO("Producer " << config_.name << " submitted task " << task.id
                         << " (Priority: " << task.priority << "). Queue size: "
                         << queue_.size());

        if (seq < config_.tasks_to_produce &&
            !token.wait_for(std::chrono::milliseconds(config_.interval_ms))) {
            break;
        }
    }

    if (token.is_cancelled()) {
        CONCURQ_LOG_WARN("Producer " << config_.name << " was cancelled after "
                         << produced_count() << " tasks.");
    } else {
        CONCURQ_LOG_INFO("Producer " << config_.name << " finished producing "
                         << produced_count() << " tasks.");
    }
}

size_t Producer::produced_count() const {
    return produced_.load(std::memory_order_relaxed);
}

} // namespace concurq
