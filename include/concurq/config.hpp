#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace concurq {

/**
 * @brief 生产者配置结构
 */
struct ProducerConfig {
    std::string name;                    // 生产者名称（如 "Producer-1"）
    size_t tasks_to_produce = 10;        // 需要生成的任务数
    int64_t interval_ms = 1000;          // 生成间隔（毫秒），0 表示不等待
};

/**
 * @brief Worker 配置结构
 */
struct WorkerConfig {
    int max_retries = 3;                 // 最大重试次数
    double failure_rate = 0.1;           // 模拟失败概率 [0, 1]
    int64_t min_processing_ms = 500;     // 模拟处理时间下限（毫秒）
    int64_t max_processing_ms = 2000;    // 模拟处理时间上限（毫秒）
};

/**
 * @brief 监控器配置结构
 */
struct MonitorConfig {
    int64_t interval_ms = 5000;          // 报告周期（毫秒）
    int64_t stall_threshold_ms = 5000;   // 停滞阈值（毫秒）
};

/**
 * @brief 关闭流程配置结构
 */
struct ShutdownConfig {
    int64_t monitor_timeout_ms = 3000;   // 监控器停止等待时间
    int64_t producer_timeout_ms = 5000;  // 生产者停止等待时间
    int64_t worker_timeout_ms = 30000;   // worker 停止等待时间
    int64_t drain_poll_interval_ms = 200;// 排空阶段轮询间隔
    int64_t drain_timeout_ms = 60000;    // 排空阶段超时，0 表示不限时
};

/**
 * @brief 流水线统一配置结构
 *
 * 用于 Pipeline 构造。计数字段必须为正；时长字段不设上限。
 */
struct PipelineConfig {
    size_t producer_count = 2;           // 生产者数量
    size_t worker_count = 5;             // worker 数量
    size_t tasks_per_producer = 10;      // 每个生产者生成的任务数
    int64_t production_interval_ms = 1000;   // 生产间隔（毫秒）
    WorkerConfig worker;                 // worker 配置
    MonitorConfig monitor;               // 监控器配置
    ShutdownConfig shutdown;             // 关闭流程配置
};

/**
 * @brief 校验流水线配置
 *
 * @param config 配置
 * @param error 失败时写入原因（可为 nullptr）
 * @return 配置有效返回 true
 */
bool validate_config(const PipelineConfig& config, std::string* error = nullptr);

} // namespace concurq
