#pragma once

#include "concurq/types.hpp"
#include <chrono>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace concurq {

/**
 * @brief 任务状态跟踪器
 *
 * 记录每个任务的当前状态、最近一次进入 PROCESSING 的时间以及完整的状态历史。
 * 生产者和 worker 写入，监控器读取；内部使用读写锁，调用方无需加锁。
 *
 * 条目在跟踪器生命周期内不会被删除（完整的审计记录，不是缓存）。
 */
class StatusTracker {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief 单个任务的跟踪记录
     */
    struct Record {
        TaskStatus status = TaskStatus::SUBMITTED;
        bool has_processing_start = false;        // 是否进入过 PROCESSING
        Clock::time_point processing_start{};     // 最近一次 PROCESSING 的开始时间
        std::vector<TaskStatus> history;          // 全部状态变更（按时间顺序）
    };

    StatusTracker() = default;
    ~StatusTracker() = default;

    StatusTracker(const StatusTracker&) = delete;
    StatusTracker& operator=(const StatusTracker&) = delete;
    StatusTracker(StatusTracker&&) = delete;
    StatusTracker& operator=(StatusTracker&&) = delete;

    /**
     * @brief 设置任务状态
     *
     * 未知 id 视为插入。设置为 PROCESSING 时同时记录当前时间为开始时间，
     * 覆盖之前的值。
     *
     * @param task_id 任务ID
     * @param status 新状态
     */
    void set_status(const std::string& task_id, TaskStatus status);

    /**
     * @brief 获取任务当前状态
     * @return 任务存在返回true
     */
    bool get_status(const std::string& task_id, TaskStatus& out) const;

    /**
     * @brief 获取任务最近一次 PROCESSING 的开始时间
     * @return 任务存在且进入过 PROCESSING 返回true
     */
    bool get_start_time(const std::string& task_id, Clock::time_point& out) const;

    /**
     * @brief 获取任务的状态历史
     * @return 状态列表；未知任务返回空列表
     */
    std::vector<TaskStatus> get_history(const std::string& task_id) const;

    /**
     * @brief 全部任务当前状态的时间点快照
     */
    std::map<std::string, TaskStatus> snapshot_all() const;

    /**
     * @brief 全部任务完整记录的时间点快照
     */
    std::map<std::string, Record> snapshot_records() const;

    /**
     * @brief 按状态统计任务数（覆盖全部 TaskStatus，包括 0）
     */
    std::map<TaskStatus, size_t> count_by_status() const;

    /**
     * @brief 跟踪的任务数
     */
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Record> records_;
};

} // namespace concurq
