#include "status_tracker.hpp"
#include "../task/task.hpp"
#include <mutex>

namespace concurq {

void StatusTracker::set_status(const std::string& task_id, TaskStatus status) {
    auto now = Clock::now();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Record& record = records_[task_id];
    record.status = status;
    if (status == TaskStatus::PROCESSING) {
        record.processing_start = now;
        record.has_processing_start = true;
    }
    record.history.push_back(status);
}

bool StatusTracker::get_status(const std::string& task_id, TaskStatus& out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(task_id);
    if (it == records_.end()) {
        return false;
    }
    out = it->second.status;
    return true;
}

bool StatusTracker::get_start_time(const std::string& task_id, Clock::time_point& out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(task_id);
    if (it == records_.end() || !it->second.has_processing_start) {
        return false;
    }
    out = it->second.processing_start;
    return true;
}

std::vector<TaskStatus> StatusTracker::get_history(const std::string& task_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(task_id);
    if (it == records_.end()) {
        return {};
    }
    return it->second.history;
}

std::map<std::string, TaskStatus> StatusTracker::snapshot_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, TaskStatus> result;
    for (const auto& [id, record] : records_) {
        result.emplace(id, record.status);
    }
    return result;
}

std::map<std::string, StatusTracker::Record> StatusTracker::snapshot_records() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::map<std::string, Record>(records_.begin(), records_.end());
}

std::map<TaskStatus, size_t> StatusTracker::count_by_status() const {
    std::map<TaskStatus, size_t> counts;
    for (TaskStatus status : all_task_statuses()) {
        counts[status] = 0;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : records_) {
        counts[entry.second.status] += 1;
    }
    return counts;
}

size_t StatusTracker::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

} // namespace concurq
