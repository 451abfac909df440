#include <atomic>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include <concurq/pipeline.hpp>

using namespace concurq;

namespace {

std::atomic<bool> g_interrupted{false};

void handle_signal(int) {
    g_interrupted.store(true);
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --producers N     number of producers (default 2)\n"
              << "  --workers N       number of workers (default 5)\n"
              << "  --tasks N         tasks per producer (default 10)\n"
              << "  --interval-ms N   production interval in ms (default 1000)\n"
              << "  --monitor-ms N    monitor report interval in ms (default 5000)\n"
              << "  --runtime-s N     run time before shutdown in seconds\n"
              << "                    (default producers * tasks * interval + 10 s)\n";
}

// 上限保证默认运行时间的乘积不会溢出
constexpr long long kMaxCount = 100000;
constexpr long long kMaxMillis = 86400000;   // 1 天
constexpr long long kMaxSeconds = 86400;

bool parse_number(const char* text, long long max, long long& out) {
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || value < 0 || value > max) {
        return false;
    }
    out = value;
    return true;
}

long long option_limit(const char* arg) {
    if (std::strcmp(arg, "--interval-ms") == 0 || std::strcmp(arg, "--monitor-ms") == 0) {
        return kMaxMillis;
    }
    if (std::strcmp(arg, "--runtime-s") == 0) {
        return kMaxSeconds;
    }
    return kMaxCount;
}

} // namespace

int main(int argc, char** argv) {
    PipelineConfig config;
    long long runtime_s = -1;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
        long long value = 0;
        if (!parse_number(argv[i + 1], option_limit(arg), value)) {
            std::cerr << "Invalid value for " << arg << ": " << argv[i + 1]
                      << " (expected 0.." << option_limit(arg) << ")\n";
            return 1;
        }
        ++i;

        if (std::strcmp(arg, "--producers") == 0) {
            config.producer_count = static_cast<size_t>(value);
        } else if (std::strcmp(arg, "--workers") == 0) {
            config.worker_count = static_cast<size_t>(value);
        } else if (std::strcmp(arg, "--tasks") == 0) {
            config.tasks_per_producer = static_cast<size_t>(value);
        } else if (std::strcmp(arg, "--interval-ms") == 0) {
            config.production_interval_ms = value;
        } else if (std::strcmp(arg, "--monitor-ms") == 0) {
            config.monitor.interval_ms = value;
        } else if (std::strcmp(arg, "--runtime-s") == 0) {
            runtime_s = value;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::string error;
    if (!validate_config(config, &error)) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }

    // 默认运行时间：全部任务的生产时间再加 10 秒
    std::chrono::milliseconds runtime(runtime_s >= 0
        ? runtime_s * 1000
        : static_cast<long long>(config.producer_count * config.tasks_per_producer) *
              config.production_interval_ms + 10000);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::cout << "========================================\n";
    std::cout << "Concurq 任务处理流水线示例\n";
    std::cout << "========================================\n";
    std::cout << "Producers: " << config.producer_count
              << ", Workers: " << config.worker_count
              << ", Tasks per producer: " << config.tasks_per_producer
              << ", Runtime: " << runtime.count() << " ms\n\n";

    Pipeline pipeline(config);
    if (!pipeline.start()) {
        std::cerr << "Failed to start pipeline: " << pipeline.config_error() << "\n";
        return 1;
    }

    auto deadline = std::chrono::steady_clock::now() + runtime;
    while (!g_interrupted.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (g_interrupted.load()) {
        std::cout << "\nInterrupted, shutting down...\n";
    }

    ShutdownReport report = pipeline.shutdown();

    std::cout << "\n" << format_shutdown_report(report);
    std::cout << "Status counts:\n";
    std::map<TaskStatus, size_t> counts;
    for (const auto& entry : report.task_statuses) {
        counts[entry.second] += 1;
    }
    for (const auto& [status, count] : counts) {
        std::cout << "  " << to_string(status) << ": " << count << "\n";
    }
    return report.timed_out_phases.empty() ? 0 : 2;
}
