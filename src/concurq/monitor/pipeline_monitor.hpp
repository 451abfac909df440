#pragma once

#include "concurq/config.hpp"
#include "concurq/types.hpp"
#include "../queue/priority_task_queue.hpp"
#include "../tracker/status_tracker.hpp"
#include "../util/cancellation_token.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace concurq {
namespace monitor {

/**
 * @brief 流水线监控器
 *
 * 周期性生成 MonitorReport：队列深度、worker 活动、完成计数、状态直方图、停滞任务。
 * 对任务状态只读；停滞检测只使用本周期的跟踪器快照。
 */
class PipelineMonitor {
public:
    using ReportCallback = std::function<void(const MonitorReport&)>;
    using CountProvider = std::function<size_t()>;

    /**
     * @brief 构造函数
     *
     * @param config 监控配置（interval_ms 必须为正）
     * @param queue 共享任务队列（只读）
     * @param tracker 共享状态跟踪器（只读）
     * @param completed_count 全局已完成计数
     * @throws std::invalid_argument 配置无效
     */
    PipelineMonitor(const MonitorConfig& config,
                    const PriorityTaskQueue& queue,
                    const StatusTracker& tracker,
                    const std::atomic<uint64_t>& completed_count);

    PipelineMonitor(const PipelineMonitor&) = delete;
    PipelineMonitor& operator=(const PipelineMonitor&) = delete;

    /**
     * @brief 设置 worker 活动数据来源（由 Pipeline 注入，避免依赖线程池）
     *
     * @param active_workers 正在处理任务的 worker 数
     * @param worker_threads 存活的 worker 线程数
     */
    void set_worker_providers(CountProvider active_workers, CountProvider worker_threads);

    /**
     * @brief 设置报告回调（在监控线程中调用）
     */
    void set_report_callback(ReportCallback callback);

    /**
     * @brief 生成一份报告（不修改任何状态）
     */
    MonitorReport build_report() const;

    /**
     * @brief 监控循环
     *
     * 每 interval_ms 生成并发布一份报告，token 被取消时返回。
     * 正在生成的报告会完整发布后才退出。
     */
    void run(util::CancellationToken& token);

    /**
     * @brief 已发布的报告数
     */
    uint64_t reports_emitted() const;

private:
    void publish(const MonitorReport& report);

    MonitorConfig config_;
    const PriorityTaskQueue& queue_;
    const StatusTracker& tracker_;
    const std::atomic<uint64_t>& completed_count_;

    mutable std::mutex callback_mutex_;
    CountProvider active_workers_provider_;
    CountProvider worker_threads_provider_;
    ReportCallback report_callback_;

    std::atomic<uint64_t> reports_emitted_{0};
};

/**
 * @brief 将监控报告格式化为可读文本
 */
std::string format_report(const MonitorReport& report, int64_t stall_threshold_ms = 0);

} // namespace monitor
} // namespace concurq
