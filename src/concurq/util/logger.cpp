#include "logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace concurq {
namespace util {

namespace {
    std::mutex g_log_mutex;
    std::atomic<int> g_level{-1};   // -1 表示尚未从环境变量初始化
    std::unordered_map<std::thread::id, std::string> g_thread_names;
}

void Logger::set_level(LogLevel level) noexcept {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level() noexcept {
    int current = g_level.load(std::memory_order_relaxed);
    if (current < 0) {
        int parsed = static_cast<int>(parse_env_level());
        // 仅在仍未初始化时写入，避免覆盖 set_level 的结果
        g_level.compare_exchange_strong(current, parsed, std::memory_order_relaxed);
        current = g_level.load(std::memory_order_relaxed);
    }
    return static_cast<LogLevel>(current);
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        std::time_t time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
             << " [" << level_to_string(level) << "]"
             << " [" << thread_name() << "] "
             << message;

        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::cerr << line.str() << std::endl;
    } catch (const std::exception& e) {
        // 日志本身失败时不能再抛出，退化为直接写 stderr
        std::fputs("[logger] failed to format log line: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
    }
}

void Logger::set_thread_name(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

std::string Logger::thread_name() {
    auto tid = std::this_thread::get_id();
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        auto it = g_thread_names.find(tid);
        if (it != g_thread_names.end()) {
            return it->second;
        }
    }
    std::ostringstream oss;
    oss << "T" << tid;
    return oss.str();
}

LogLevel Logger::parse_env_level() noexcept {
    const char* env = std::getenv("CONCURQ_LOG_LEVEL");
    if (!env) {
        return LogLevel::INFO;
    }

    std::string value(env);
    for (char& c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (value == "error") return LogLevel::ERROR;
    if (value == "warn" || value == "warning") return LogLevel::WARN;
    if (value == "info") return LogLevel::INFO;
    if (value == "debug") return LogLevel::DEBUG;
    if (value == "trace") return LogLevel::TRACE;
    return LogLevel::INFO;
}

const char* Logger::level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default:              return "UNKN ";
    }
}

} // namespace util
} // namespace concurq
