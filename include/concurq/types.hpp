#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string>
#include <vector>
#include <map>

namespace concurq {

/**
 * @brief 任务状态枚举
 *
 * 状态机：
 * SUBMITTED -> PROCESSING -> COMPLETED
 *                         -> FAILED -> RETRIED -> PROCESSING（循环）
 *                         -> FAILED（终态，重试次数耗尽）
 */
enum class TaskStatus {
    SUBMITTED = 0,
    PROCESSING = 1,
    COMPLETED = 2,
    FAILED = 3,
    RETRIED = 4
};

/**
 * @brief 任务结构体
 *
 * 创建后不可变，状态保存在 StatusTracker 中而不是 Task 上。
 * 相等性只由 id 决定；队列中的排序只看 priority（数值越小越紧急）。
 */
struct Task {
    std::string id;                                       // 任务ID（全局唯一）
    std::string name;                                     // 显示名称
    int priority = 0;                                     // 优先级，数值越小越优先，不限制范围
    std::chrono::system_clock::time_point created_at{};   // 创建时间（用于显示）
    int64_t created_ns = 0;                               // 创建时间（steady_clock 纳秒）
    std::string payload;                                  // 负载（不透明字符串）
};

/**
 * @brief 队列条目：任务 + 本次尝试链的重试计数
 */
struct QueuedTask {
    Task task;
    int retry_count = 0;                          // 已经历的 FAILED->RETRIED 次数
};

/**
 * @brief 停滞任务信息
 */
struct StalledTask {
    std::string task_id;                          // 任务ID
    int64_t elapsed_ms = 0;                       // 自最近一次 PROCESSING 起经过的时间（毫秒）
};

/**
 * @brief 监控报告
 *
 * 由 PipelineMonitor 周期性生成；status_counts 覆盖全部 TaskStatus（包括 0）。
 */
struct MonitorReport {
    std::chrono::system_clock::time_point timestamp{};    // 报告时间
    size_t queue_depth = 0;                               // 队列深度
    size_t active_workers = 0;                            // 正在处理任务的 worker 数
    size_t worker_threads = 0;                            // 存活的 worker 线程数
    uint64_t completed_count = 0;                         // 已完成任务计数
    size_t tracked_tasks = 0;                             // 跟踪器中的任务数
    std::map<TaskStatus, size_t> status_counts;           // 状态直方图
    std::vector<StalledTask> stalled_tasks;               // 停滞任务
};

/**
 * @brief 关闭阶段
 */
enum class ShutdownPhase {
    STOP_MONITOR = 0,
    STOP_PRODUCERS = 1,
    DRAIN_QUEUE = 2,
    STOP_WORKERS = 3,
    FINAL_REPORT = 4
};

/**
 * @brief 关闭报告（shutdown() 的最终结果）
 */
struct ShutdownReport {
    uint64_t completed_count = 0;                         // 已完成任务总数
    size_t remaining_queue_depth = 0;                     // 关闭后队列中剩余的任务数
    std::map<std::string, TaskStatus> task_statuses;      // 每个任务的最终状态
    std::vector<ShutdownPhase> timed_out_phases;          // 超时（被强制结束）的阶段
    std::vector<ShutdownPhase> failed_phases;             // 抛出异常的阶段（后续阶段照常执行）
};

/**
 * @brief 流水线状态（用于监控查询）
 */
struct PipelineStatus {
    bool is_running = false;                      // 是否运行中
    size_t producer_threads = 0;                  // 存活的生产者线程数
    size_t worker_threads = 0;                    // 存活的 worker 线程数
    size_t active_workers = 0;                    // 正在处理任务的 worker 数
    size_t queue_depth = 0;                       // 队列深度
    uint64_t completed_count = 0;                 // 已完成任务计数
    size_t tracked_tasks = 0;                     // 跟踪的任务数
};

/**
 * @brief 任务状态转字符串
 */
const char* to_string(TaskStatus status);

/**
 * @brief 关闭阶段转字符串
 */
const char* to_string(ShutdownPhase phase);

} // namespace concurq
