#include "task.hpp"
#include <atomic>
#include <chrono>

namespace concurq {

namespace {
    // 全局任务ID计数器，使用原子操作保证线程安全
    std::atomic<uint64_t> g_task_id_counter{1};
}

bool operator==(const Task& lhs, const Task& rhs) {
    return lhs.id == rhs.id;
}

bool operator!=(const Task& lhs, const Task& rhs) {
    return !(lhs == rhs);
}

bool is_more_urgent(const Task& lhs, const Task& rhs) {
    return lhs.priority < rhs.priority;
}

std::string generate_task_id() {
    uint64_t id = g_task_id_counter.fetch_add(1, std::memory_order_relaxed);
    return "task_" + std::to_string(id);
}

Task make_task(const std::string& name, int priority, const std::string& payload) {
    Task task;
    task.id = generate_task_id();
    task.name = name;
    task.priority = priority;
    task.created_at = std::chrono::system_clock::now();
    task.created_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
    task.payload = payload;
    return task;
}

const char* to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::SUBMITTED:  return "SUBMITTED";
        case TaskStatus::PROCESSING: return "PROCESSING";
        case TaskStatus::COMPLETED:  return "COMPLETED";
        case TaskStatus::FAILED:     return "FAILED";
        case TaskStatus::RETRIED:    return "RETRIED";
        default:                     return "UNKNOWN";
    }
}

const std::vector<TaskStatus>& all_task_statuses() {
    static const std::vector<TaskStatus> statuses = {
        TaskStatus::SUBMITTED,
        TaskStatus::PROCESSING,
        TaskStatus::COMPLETED,
        TaskStatus::FAILED,
        TaskStatus::RETRIED
    };
    return statuses;
}

bool is_valid_transition(TaskStatus from, TaskStatus to) {
    if (from == to) {
        return true;
    }
    switch (from) {
        case TaskStatus::SUBMITTED:
            return to == TaskStatus::PROCESSING;
        case TaskStatus::PROCESSING:
            return to == TaskStatus::COMPLETED || to == TaskStatus::FAILED;
        case TaskStatus::FAILED:
            return to == TaskStatus::RETRIED;
        case TaskStatus::RETRIED:
            return to == TaskStatus::PROCESSING;
        case TaskStatus::COMPLETED:
        default:
            return false;
    }
}

} // namespace concurq
