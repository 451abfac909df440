#pragma once

#include <cstdint>
#include <string>
#include <sstream>

namespace concurq {
namespace util {

/**
 * @brief 日志级别
 */
enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

/**
 * @brief 进程级日志器
 *
 * 输出格式：[时间] [级别] [线程名] 消息，统一写到 stderr。
 * 级别默认读取环境变量 CONCURQ_LOG_LEVEL（error/warn/info/debug/trace），
 * 未设置时为 INFO。log() 不会抛出异常。
 */
class Logger {
public:
    static void set_level(LogLevel level) noexcept;
    static LogLevel level() noexcept;

    /**
     * @brief 判断某级别是否会被输出
     */
    static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    /**
     * @brief 为当前线程注册日志中显示的名称
     */
    static void set_thread_name(const std::string& name);

    /**
     * @brief 当前线程的日志名称（未注册时为 "T<id>"）
     */
    static std::string thread_name();

    static const char* level_to_string(LogLevel level) noexcept;

private:
    static LogLevel parse_env_level() noexcept;
};

} // namespace util
} // namespace concurq

// 流式日志宏：CONCURQ_LOG_INFO("queue size " << n)
#define CONCURQ_LOG(level, expr)                                            \
    do {                                                                    \
        if (::concurq::util::Logger::enabled(level)) {                      \
            std::ostringstream concurq_log_oss_;                            \
            concurq_log_oss_ << expr;                                       \
            ::concurq::util::Logger::log(level, concurq_log_oss_.str());    \
        }                                                                   \
    } while (0)

#define CONCURQ_LOG_ERROR(expr) CONCURQ_LOG(::concurq::util::LogLevel::ERROR, expr)
#define CONCURQ_LOG_WARN(expr)  CONCURQ_LOG(::concurq::util::LogLevel::WARN, expr)
#define CONCURQ_LOG_INFO(expr)  CONCURQ_LOG(::concurq::util::LogLevel::INFO, expr)
#define CONCURQ_LOG_DEBUG(expr) CONCURQ_LOG(::concurq::util::LogLevel::DEBUG, expr)
#define CONCURQ_LOG_TRACE(expr) CONCURQ_LOG(::concurq::util::LogLevel::TRACE, expr)
