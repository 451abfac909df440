#include "pipeline_monitor.hpp"
#include "../task/task.hpp"
#include "../util/exception_handler.hpp"
#include "../util/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace concurq {
namespace monitor {

PipelineMonitor::PipelineMonitor(const MonitorConfig& config,
                                 const PriorityTaskQueue& queue,
                                 const StatusTracker& tracker,
                                 const std::atomic<uint64_t>& completed_count)
    : config_(config)
    , queue_(queue)
    , tracker_(tracker)
    , completed_count_(completed_count) {
    if (config_.interval_ms <= 0) {
        throw std::invalid_argument("monitor interval_ms must be greater than 0");
    }
    if (config_.stall_threshold_ms < 0) {
        throw std::invalid_argument("stall_threshold_ms must not be negative");
    }
}

void PipelineMonitor::set_worker_providers(CountProvider active_workers,
                                           CountProvider worker_threads) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    active_workers_provider_ = std::move(active_workers);
    worker_threads_provider_ = std::move(worker_threads);
}

void PipelineMonitor::set_report_callback(ReportCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    report_callback_ = std::move(callback);
}

MonitorReport PipelineMonitor::build_report() const {
    MonitorReport report;
    report.timestamp = std::chrono::system_clock::now();
    report.queue_depth = queue_.size();
    report.completed_count = completed_count_.load(std::memory_order_relaxed);

    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (active_workers_provider_) {
            report.active_workers = active_workers_provider_();
        }
        if (worker_threads_provider_) {
            report.worker_threads = worker_threads_provider_();
        }
    }

    for (TaskStatus status : all_task_statuses()) {
        report.status_counts[status] = 0;
    }

    // 直方图与停滞检测都基于同一份快照
    auto records = tracker_.snapshot_records();
    auto now = StatusTracker::Clock::now();
    const auto threshold = std::chrono::milliseconds(config_.stall_threshold_ms);

    report.tracked_tasks = records.size();
    for (const auto& [id, record] : records) {
        report.status_counts[record.status] += 1;

        if (record.status != TaskStatus::PROCESSING || !record.has_processing_start) {
            continue;
        }
        auto elapsed = now - record.processing_start;
        if (elapsed > threshold) {
            StalledTask stalled;
            stalled.task_id = id;
            stalled.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
            report.stalled_tasks.push_back(std::move(stalled));
        }
    }
    return report;
}

void PipelineMonitor::run(util::CancellationToken& token) {
    CONCURQ_LOG_INFO("Monitor started. Reporting every " << config_.interval_ms << " ms.");

    while (token.wait_for(std::chrono::milliseconds(config_.interval_ms))) {
        publish(build_report());
    }

    CONCURQ_LOG_INFO("Monitor stopped after " << reports_emitted() << " reports.");
}

void PipelineMonitor::publish(const MonitorReport& report) {
    reports_emitted_.fetch_add(1, std::memory_order_relaxed);
    CONCURQ_LOG_INFO(format_report(report, config_.stall_threshold_ms));

    ReportCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = report_callback_;
    }
    if (!callback) {
        return;
    }
    try {
        callback(report);
    } catch (...) {
        CONCURQ_LOG_ERROR("Report callback failed: "
                          << util::ExceptionHandler::describe(std::current_exception()));
    }
}

uint64_t PipelineMonitor::reports_emitted() const {
    return reports_emitted_.load(std::memory_order_relaxed);
}

std::string format_report(const MonitorReport& report, int64_t stall_threshold_ms) {
    std::time_t time = std::chrono::system_clock::to_time_t(report.timestamp);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time);
#else
    gmtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << "\n--- System Status Report ---\n";
    oss << "Timestamp: " << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ") << "\n";
    oss << "Current Queue Size: " << report.queue_depth << "\n";
    oss << "Total Tasks Processed: " << report.completed_count << "\n";
    oss << "Worker Pool Active Threads: " << report.active_workers
        << " / " << report.worker_threads << "\n";
    oss << "Tracked Tasks: " << report.tracked_tasks << "\n";
    oss << "Task Status Breakdown:\n";
    for (const auto& [status, count] : report.status_counts) {
        oss << "  - " << to_string(status) << ": " << count << "\n";
    }
    for (const auto& stalled : report.stalled_tasks) {
        oss << "  WARNING: Task " << stalled.task_id << " appears stalled (PROCESSING for "
            << stalled.elapsed_ms << "ms";
        if (stall_threshold_ms > 0) {
            oss << ", threshold " << stall_threshold_ms << "ms";
        }
        oss << ")\n";
    }
    oss << "----------------------------";
    return oss.str();
}

} // namespace monitor
} // namespace concurq
