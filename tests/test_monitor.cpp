#include <iostream>
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>

#include <concurq/config.hpp>
#include <concurq/types.hpp>
#include "concurq/monitor/pipeline_monitor.hpp"
#include "concurq/queue/priority_task_queue.hpp"
#include "concurq/tracker/status_tracker.hpp"
#include "concurq/task/task.hpp"
#include "concurq/util/cancellation_token.hpp"

using namespace concurq;
using concurq::monitor::PipelineMonitor;

// 测试辅助宏
#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while(0)

bool test_monitor_invalid_config() {
    std::cout << "Testing PipelineMonitor config validation..." << std::endl;

    PriorityTaskQueue queue;
    StatusTracker tracker;
    std::atomic<uint64_t> completed{0};

    MonitorConfig zero_interval;
    zero_interval.interval_ms = 0;
    bool threw = false;
    try {
        PipelineMonitor monitor(zero_interval, queue, tracker, completed);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Zero interval should be rejected");

    std::cout << "  PipelineMonitor config validation: PASSED" << std::endl;
    return true;
}

bool test_monitor_empty_report() {
    std::cout << "Testing PipelineMonitor report with no tasks..." << std::endl;

    PriorityTaskQueue queue;
    StatusTracker tracker;
    std::atomic<uint64_t> completed{0};
    MonitorConfig config;
    PipelineMonitor monitor(config, queue, tracker, completed);

    MonitorReport report = monitor.build_report();
    TEST_ASSERT(report.status_counts.size() == all_task_statuses().size(), "Histogram should cover every status");
    for (const auto& entry : report.status_counts) {
        TEST_ASSERT(entry.second == 0, "Every histogram entry should be zero");
    }
    TEST_ASSERT(report.stalled_tasks.empty(), "No stalled tasks");
    TEST_ASSERT(report.queue_depth == 0, "Queue should be empty");
    TEST_ASSERT(report.tracked_tasks == 0, "Nothing should be tracked");
    TEST_ASSERT(report.active_workers == 0 && report.worker_threads == 0,
                "Worker counts default to zero without providers");

    std::cout << "  PipelineMonitor empty report: PASSED" << std::endl;
    return true;
}

bool test_monitor_report_contents() {
    std::cout << "Testing PipelineMonitor report contents..." << std::endl;

    // 3 个 SUBMITTED（在队列中）、1 个 PROCESSING、2 个 COMPLETED
    PriorityTaskQueue queue;
    StatusTracker tracker;
    std::atomic<uint64_t> completed{2};

    for (int i = 0; i < 3; ++i) {
        Task task = make_task("queued", i);
        queue.enqueue(task);
        tracker.set_status(task.id, TaskStatus::SUBMITTED);
    }
    tracker.set_status("running", TaskStatus::SUBMITTED);
    tracker.set_status("running", TaskStatus::PROCESSING);
    for (const char* id : {"done_1", "done_2"}) {
        tracker.set_status(id, TaskStatus::SUBMITTED);
        tracker.set_status(id, TaskStatus::PROCESSING);
        tracker.set_status(id, TaskStatus::COMPLETED);
    }

    MonitorConfig config;
    config.interval_ms = 1000;
    config.stall_threshold_ms = 60000;
    PipelineMonitor monitor(config, queue, tracker, completed);
    monitor.set_worker_providers([]() { return size_t(1); }, []() { return size_t(4); });

    MonitorReport report = monitor.build_report();
    TEST_ASSERT(report.queue_depth == 3, "Queue depth should be 3");
    TEST_ASSERT(report.completed_count == 2, "Completed count should be 2");
    TEST_ASSERT(report.active_workers == 1, "Active workers should come from the provider");
    TEST_ASSERT(report.worker_threads == 4, "Worker threads should come from the provider");
    TEST_ASSERT(report.tracked_tasks == 6, "Six tasks should be tracked");
    TEST_ASSERT(report.status_counts.size() == 5, "Histogram should cover every status");
    TEST_ASSERT(report.status_counts[TaskStatus::SUBMITTED] == 3, "SUBMITTED count");
    TEST_ASSERT(report.status_counts[TaskStatus::PROCESSING] == 1, "PROCESSING count");
    TEST_ASSERT(report.status_counts[TaskStatus::COMPLETED] == 2, "COMPLETED count");
    TEST_ASSERT(report.status_counts[TaskStatus::FAILED] == 0, "FAILED count should be zero");
    TEST_ASSERT(report.status_counts[TaskStatus::RETRIED] == 0, "RETRIED count should be zero");
    TEST_ASSERT(report.stalled_tasks.empty(), "Nothing should be stalled yet");

    // 生成报告不修改任何状态
    TEST_ASSERT(queue.size() == 3, "Report should not consume the queue");
    TEST_ASSERT(tracker.size() == 6, "Report should not modify the tracker");

    std::cout << "  PipelineMonitor report contents: PASSED" << std::endl;
    return true;
}

bool test_monitor_stall_detection() {
    std::cout << "Testing PipelineMonitor stall detection..." << std::endl;

    PriorityTaskQueue queue;
    StatusTracker tracker;
    std::atomic<uint64_t> completed{0};

    MonitorConfig config;
    config.interval_ms = 1000;
    config.stall_threshold_ms = 50;
    PipelineMonitor monitor(config, queue, tracker, completed);

    tracker.set_status("stuck", TaskStatus::PROCESSING);
    tracker.set_status("finished", TaskStatus::PROCESSING);
    tracker.set_status("finished", TaskStatus::COMPLETED);
    tracker.set_status("waiting", TaskStatus::SUBMITTED);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    tracker.set_status("fresh", TaskStatus::PROCESSING);

    MonitorReport report = monitor.build_report();
    TEST_ASSERT(report.stalled_tasks.size() == 1, "Exactly one task should be stalled");
    TEST_ASSERT(report.stalled_tasks[0].task_id == "stuck", "The long-running task should be stalled");
    TEST_ASSERT(report.stalled_tasks[0].elapsed_ms >= 100, "Elapsed time should be reported");

    std::string text = concurq::monitor::format_report(report, config.stall_threshold_ms);
    TEST_ASSERT(text.find("stuck") != std::string::npos, "Formatted report should name the stalled task");
    TEST_ASSERT(text.find("WARNING") != std::string::npos, "Formatted report should warn about stalls");

    std::cout << "  PipelineMonitor stall detection: PASSED" << std::endl;
    return true;
}

bool test_monitor_run_loop() {
    std::cout << "Testing PipelineMonitor run loop..." << std::endl;

    PriorityTaskQueue queue;
    StatusTracker tracker;
    std::atomic<uint64_t> completed{0};

    MonitorConfig config;
    config.interval_ms = 20;
    PipelineMonitor monitor(config, queue, tracker, completed);

    std::mutex reports_mutex;
    std::vector<MonitorReport> reports;
    monitor.set_report_callback([&](const MonitorReport& report) {
        std::lock_guard<std::mutex> lock(reports_mutex);
        reports.push_back(report);
    });

    concurq::util::CancellationToken token;
    std::thread runner([&]() { monitor.run(token); });

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    token.cancel();
    runner.join();

    size_t received = 0;
    {
        std::lock_guard<std::mutex> lock(reports_mutex);
        received = reports.size();
    }
    TEST_ASSERT(received >= 2, "Several reports should be published");
    TEST_ASSERT(monitor.reports_emitted() == received, "Every emitted report should reach the callback");

    // 取消后不再发布报告
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    TEST_ASSERT(monitor.reports_emitted() == received, "No reports after cancellation");

    std::cout << "  PipelineMonitor run loop: PASSED" << std::endl;
    return true;
}

bool test_monitor_callback_exception() {
    std::cout << "Testing PipelineMonitor callback exceptions..." << std::endl;

    PriorityTaskQueue queue;
    StatusTracker tracker;
    std::atomic<uint64_t> completed{0};

    MonitorConfig config;
    config.interval_ms = 10;
    PipelineMonitor monitor(config, queue, tracker, completed);

    std::atomic<int> calls{0};
    monitor.set_report_callback([&calls](const MonitorReport&) {
        calls++;
        throw std::runtime_error("callback failure");
    });

    concurq::util::CancellationToken token;
    std::thread runner([&]() { monitor.run(token); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.cancel();
    runner.join();

    TEST_ASSERT(calls.load() >= 2, "Monitor should keep running after a callback throws");

    std::cout << "  PipelineMonitor callback exceptions: PASSED" << std::endl;
    return true;
}

bool test_format_report() {
    std::cout << "Testing format_report..." << std::endl;

    MonitorReport report;
    report.timestamp = std::chrono::system_clock::now();
    report.queue_depth = 7;
    report.completed_count = 12;
    report.active_workers = 3;
    report.worker_threads = 5;
    for (TaskStatus status : all_task_statuses()) {
        report.status_counts[status] = 0;
    }
    report.status_counts[TaskStatus::COMPLETED] = 12;

    std::string text = concurq::monitor::format_report(report);
    TEST_ASSERT(text.find("System Status Report") != std::string::npos, "Header should be present");
    TEST_ASSERT(text.find("Current Queue Size: 7") != std::string::npos, "Queue size should be printed");
    TEST_ASSERT(text.find("Total Tasks Processed: 12") != std::string::npos, "Completed count should be printed");
    TEST_ASSERT(text.find("3 / 5") != std::string::npos, "Worker activity should be printed");
    TEST_ASSERT(text.find("COMPLETED: 12") != std::string::npos, "Histogram should be printed");
    TEST_ASSERT(text.find("RETRIED: 0") != std::string::npos, "Zero buckets should be printed");
    TEST_ASSERT(text.find("WARNING") == std::string::npos, "No stall warnings without stalls");

    std::cout << "  format_report: PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Concurq Monitor Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    bool all_passed = true;

    all_passed &= test_monitor_invalid_config();
    all_passed &= test_monitor_empty_report();
    all_passed &= test_monitor_report_contents();
    all_passed &= test_monitor_stall_detection();
    all_passed &= test_monitor_run_loop();
    all_passed &= test_monitor_callback_exception();
    all_passed &= test_format_report();
    std::cout << std::endl;

    std::cout << "========================================" << std::endl;
    if (all_passed) {
        std::cout << "All tests PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "Some tests FAILED!" << std::endl;
        return 1;
    }
}
