#include "concurq/pipeline.hpp"
#include "queue/priority_task_queue.hpp"
#include "tracker/status_tracker.hpp"
#include "producer/producer.hpp"
#include "worker/worker.hpp"
#include "monitor/pipeline_monitor.hpp"
#include "pipeline/role_pool.hpp"
#include "task/task.hpp"
#include "util/exception_handler.hpp"
#include "util/logger.hpp"
#include <chrono>
#include <sstream>
#include <thread>

namespace concurq {

const char* to_string(ShutdownPhase phase) {
    switch (phase) {
        case ShutdownPhase::STOP_MONITOR:   return "STOP_MONITOR";
        case ShutdownPhase::STOP_PRODUCERS: return "STOP_PRODUCERS";
        case ShutdownPhase::DRAIN_QUEUE:    return "DRAIN_QUEUE";
        case ShutdownPhase::STOP_WORKERS:   return "STOP_WORKERS";
        case ShutdownPhase::FINAL_REPORT:   return "FINAL_REPORT";
        default:                            return "UNKNOWN";
    }
}

Pipeline::Pipeline(const PipelineConfig& config)
    : config_(config)
    , exception_handler_(std::make_unique<util::ExceptionHandler>())
    , queue_(std::make_unique<PriorityTaskQueue>())
    , tracker_(std::make_unique<StatusTracker>())
    , producer_pool_(std::make_unique<RolePool>("Producer", *exception_handler_))
    , worker_pool_(std::make_unique<RolePool>("Worker", *exception_handler_))
    , monitor_pool_(std::make_unique<RolePool>("Monitor", *exception_handler_)) {
    if (!validate_config(config_, &config_error_)) {
        return;
    }

    producers_.reserve(config_.producer_count);
    for (size_t i = 0; i < config_.producer_count; ++i) {
        ProducerConfig producer_config;
        producer_config.name = "Producer-" + std::to_string(i + 1);
        producer_config.tasks_to_produce = config_.tasks_per_producer;
        producer_config.interval_ms = config_.production_interval_ms;
        producers_.push_back(std::make_unique<Producer>(producer_config, *queue_, *tracker_));
    }

    WorkerContext context{*queue_, *tracker_, completed_count_, active_workers_, *exception_handler_};
    workers_.reserve(config_.worker_count);
    for (size_t i = 0; i < config_.worker_count; ++i) {
        workers_.push_back(std::make_unique<Worker>(
            "Worker-" + std::to_string(i + 1), config_.worker, context));
    }

    monitor_ = std::make_unique<monitor::PipelineMonitor>(
        config_.monitor, *queue_, *tracker_, completed_count_);
    monitor_->set_worker_providers(
        [this]() { return active_workers_.load(std::memory_order_relaxed); },
        [this]() { return worker_pool_->alive_count(); });
}

Pipeline::~Pipeline() {
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        running = (state_ == State::RUNNING);
    }
    if (running) {
        shutdown();
    }
}

bool Pipeline::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != State::CREATED) {
        return false;
    }
    if (!config_error_.empty()) {
        CONCURQ_LOG_ERROR("Cannot start pipeline: " << config_error_);
        return false;
    }

    bool ok = worker_pool_->start(workers_.size(),
        [this](size_t index, util::CancellationToken& stop, util::CancellationToken& abort) {
            workers_[index]->run(stop, abort);
        });
    ok = ok && producer_pool_->start(producers_.size(),
        [this](size_t index, util::CancellationToken& stop, util::CancellationToken&) {
            producers_[index]->run(stop);
        });
    ok = ok && monitor_pool_->start(1,
        [this](size_t, util::CancellationToken& stop, util::CancellationToken&) {
            monitor_->run(stop);
        });

    if (!ok) {
        CONCURQ_LOG_ERROR("Failed to start role pools; stopping what was started.");
        monitor_pool_->force_stop();
        producer_pool_->force_stop();
        worker_pool_->force_stop();
        monitor_pool_->join();
        producer_pool_->join();
        worker_pool_->join();
        state_ = State::STOPPED;
        return false;
    }

    state_ = State::RUNNING;
    CONCURQ_LOG_INFO("Pipeline started: " << producers_.size() << " producers, "
                     << workers_.size() << " workers, monitor every "
                     << config_.monitor.interval_ms << " ms.");
    return true;
}

ShutdownReport Pipeline::shutdown() {
    std::lock_guard<std::mutex> shutdown_lock(shutdown_mutex_);
    if (shutdown_done_) {
        return final_report_;
    }

    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        was_running = (state_ == State::RUNNING);
        state_ = State::STOPPED;
    }

    ShutdownReport report;
    if (was_running) {
        CONCURQ_LOG_INFO("Initiating pipeline shutdown...");
        run_phase(ShutdownPhase::STOP_MONITOR, report, [&]() {
            stop_pool(*monitor_pool_, config_.shutdown.monitor_timeout_ms,
                      ShutdownPhase::STOP_MONITOR, report);
        });
        run_phase(ShutdownPhase::STOP_PRODUCERS, report, [&]() {
            stop_pool(*producer_pool_, config_.shutdown.producer_timeout_ms,
                      ShutdownPhase::STOP_PRODUCERS, report);
        });
        run_phase(ShutdownPhase::DRAIN_QUEUE, report, [&]() { drain_queue(report); });
        run_phase(ShutdownPhase::STOP_WORKERS, report, [&]() {
            stop_pool(*worker_pool_, config_.shutdown.worker_timeout_ms,
                      ShutdownPhase::STOP_WORKERS, report);
        });
    }
    run_phase(ShutdownPhase::FINAL_REPORT, report, [&]() { build_final_report(report); });

    final_report_ = report;
    shutdown_done_ = true;
    return final_report_;
}

void Pipeline::run_phase(ShutdownPhase phase, ShutdownReport& report,
                         const std::function<void()>& body) {
    try {
        body();
    } catch (...) {
        exception_handler_->handle_exception(
            std::string("Pipeline::shutdown/") + to_string(phase), std::current_exception());
        report.failed_phases.push_back(phase);
    }
}

void Pipeline::stop_pool(RolePool& pool, int64_t timeout_ms, ShutdownPhase phase,
                         ShutdownReport& report) {
    CONCURQ_LOG_INFO("Attempting to shut down " << pool.name() << " pool...");
    pool.request_stop();
    if (pool.await_termination(std::chrono::milliseconds(timeout_ms))) {
        CONCURQ_LOG_INFO(pool.name() << " pool terminated successfully.");
        return;
    }

    CONCURQ_LOG_WARN(pool.name() << " pool did not terminate gracefully within "
                     << timeout_ms << " ms; forcing stop (" << pool.alive_count()
                     << " threads still running).");
    report.timed_out_phases.push_back(phase);
    pool.force_stop();
    if (pool.await_termination(std::chrono::milliseconds(timeout_ms))) {
        CONCURQ_LOG_INFO(pool.name() << " pool terminated after forced stop.");
        return;
    }

    // 无视 abort 的线程留给析构时回收
    CONCURQ_LOG_WARN(pool.name() << " pool still has " << pool.alive_count()
                     << " threads " << timeout_ms << " ms after forced stop; continuing shutdown.");
}

void Pipeline::drain_queue(ShutdownReport& report) {
    CONCURQ_LOG_INFO("Draining remaining tasks from queue before worker shutdown...");

    const auto poll_interval = std::chrono::milliseconds(config_.shutdown.drain_poll_interval_ms);
    const bool bounded = config_.shutdown.drain_timeout_ms > 0;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(config_.shutdown.drain_timeout_ms);

    // 从 worker 线程内调用时，调用线程自身不会再处理任务
    const size_t self = worker_pool_->owns_current_thread() ? 1 : 0;

    while (!queue_->empty()) {
        if (worker_pool_->alive_count() <= self) {
            CONCURQ_LOG_WARN("No worker threads alive; " << queue_->size()
                             << " tasks cannot be drained.");
            report.timed_out_phases.push_back(ShutdownPhase::DRAIN_QUEUE);
            return;
        }
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            CONCURQ_LOG_WARN("Queue drain timed out after " << config_.shutdown.drain_timeout_ms
                             << " ms with " << queue_->size() << " tasks remaining.");
            report.timed_out_phases.push_back(ShutdownPhase::DRAIN_QUEUE);
            return;
        }
        CONCURQ_LOG_INFO("Queue size: " << queue_->size() << ". Waiting for tasks to be processed...");
        std::this_thread::sleep_for(poll_interval);
    }

    CONCURQ_LOG_INFO("Queue is empty. Proceeding with worker shutdown.");
}

void Pipeline::build_final_report(ShutdownReport& report) {
    report.completed_count = completed_count_.load(std::memory_order_relaxed);
    report.remaining_queue_depth = queue_->size();
    report.task_statuses = tracker_->snapshot_all();

    CONCURQ_LOG_INFO("Pipeline shutdown complete. Total tasks processed: "
                     << report.completed_count);
    for (const auto& [id, status] : report.task_statuses) {
        CONCURQ_LOG_DEBUG("  Task " << id << ": " << to_string(status));
    }
}

bool Pipeline::is_running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == State::RUNNING;
}

PipelineStatus Pipeline::get_status() const {
    PipelineStatus status;
    status.is_running = is_running();
    status.producer_threads = producer_pool_->alive_count();
    status.worker_threads = worker_pool_->alive_count();
    status.active_workers = active_workers_.load(std::memory_order_relaxed);
    status.queue_depth = queue_->size();
    status.completed_count = completed_count_.load(std::memory_order_relaxed);
    status.tracked_tasks = tracker_->size();
    return status;
}

MonitorReport Pipeline::current_report() const {
    if (monitor_) {
        return monitor_->build_report();
    }

    // 配置无效时没有监控器，只报告队列和跟踪器
    MonitorReport report;
    report.timestamp = std::chrono::system_clock::now();
    report.queue_depth = queue_->size();
    report.completed_count = completed_count_.load(std::memory_order_relaxed);
    report.tracked_tasks = tracker_->size();
    report.status_counts = tracker_->count_by_status();
    return report;
}

std::map<std::string, TaskStatus> Pipeline::task_statuses() const {
    return tracker_->snapshot_all();
}

std::vector<TaskStatus> Pipeline::task_history(const std::string& task_id) const {
    return tracker_->get_history(task_id);
}

uint64_t Pipeline::completed_count() const {
    return completed_count_.load(std::memory_order_relaxed);
}

size_t Pipeline::queue_depth() const {
    return queue_->size();
}

bool Pipeline::set_report_callback(ReportCallback callback) {
    if (!monitor_) {
        return false;
    }
    monitor_->set_report_callback(std::move(callback));
    return true;
}

bool Pipeline::set_task_handler(TaskHandler handler) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != State::CREATED) {
        return false;
    }
    for (auto& worker : workers_) {
        worker->set_task_handler(handler);
    }
    return true;
}

bool Pipeline::set_failure_policy(FailurePolicy policy) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != State::CREATED) {
        return false;
    }
    for (auto& worker : workers_) {
        worker->set_failure_policy(policy);
    }
    return true;
}

void Pipeline::set_exception_callback(ExceptionCallback callback) {
    exception_handler_->set_exception_callback(std::move(callback));
}

std::string format_shutdown_report(const ShutdownReport& report) {
    std::ostringstream oss;
    oss << "Pipeline shutdown complete. Total tasks processed: " << report.completed_count << "\n";
    oss << "Tasks left in queue: " << report.remaining_queue_depth << "\n";
    if (!report.timed_out_phases.empty()) {
        oss << "Phases that timed out:";
        for (ShutdownPhase phase : report.timed_out_phases) {
            oss << " " << to_string(phase);
        }
        oss << "\n";
    }
    if (!report.failed_phases.empty()) {
        oss << "Phases that raised:";
        for (ShutdownPhase phase : report.failed_phases) {
            oss << " " << to_string(phase);
        }
        oss << "\n";
    }
    oss << "Final task statuses:\n";
    for (const auto& [id, status] : report.task_statuses) {
        oss << "  Task " << id << ": " << to_string(status) << "\n";
    }
    return oss.str();
}

} // namespace concurq
