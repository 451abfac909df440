#pragma once

#include "config.hpp"
#include "types.hpp"
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace concurq {

// 前向声明
class PriorityTaskQueue;
class StatusTracker;
class RolePool;
class Producer;
class Worker;
namespace monitor { class PipelineMonitor; }
namespace util { class ExceptionHandler; class CancellationToken; }

/**
 * @brief 任务处理流水线（编排器）
 *
 * 持有任务队列、状态跟踪器和三个独立的角色线程池（生产者、worker、监控器），
 * 负责启动和多阶段关闭。
 *
 * 关闭顺序：
 * 1. 停止监控器（超时则强制停止）
 * 2. 停止生产者（超时则强制停止，未完成的生成被放弃）
 * 3. 排空队列：轮询队列深度直到为空（受 drain_timeout_ms 限制）
 * 4. 优雅停止 worker（等待进行中的任务，超时则强制停止）
 * 5. 生成最终报告
 *
 * 各阶段超时只记录警告，不会中断关闭流程；强制停止后最多再等待同样的超时，
 * 仍未退出的线程在析构时回收。每个阶段单独捕获异常，某一阶段失败不影响后续阶段。
 * shutdown() 不抛出异常，可在任意线程调用（包括报告回调和任务处理函数），
 * 重复调用返回同一份报告。
 */
class Pipeline {
public:
    using ReportCallback = std::function<void(const MonitorReport&)>;
    using TaskHandler = std::function<void(const Task&, util::CancellationToken& abort)>;
    using FailurePolicy = std::function<bool(const QueuedTask&)>;
    using ExceptionCallback = std::function<void(const std::string&, std::exception_ptr)>;

    /**
     * @brief 构造函数
     *
     * 配置无效时不会抛出，start() 返回 false。
     *
     * @param config 流水线配置
     */
    explicit Pipeline(const PipelineConfig& config);

    /**
     * @brief 析构函数（RAII）
     *
     * 如果仍在运行，执行完整的关闭流程
     */
    ~Pipeline();

    // 禁止拷贝和赋值
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /**
     * @brief 启动全部生产者、worker 和监控器
     *
     * @return 启动成功返回true；配置无效、已启动或已关闭返回false
     */
    bool start();

    /**
     * @brief 执行关闭流程
     *
     * 未启动时直接返回当前状态的报告。
     *
     * @return 最终报告
     */
    ShutdownReport shutdown();

    bool is_running() const;

    /**
     * @brief 获取流水线状态
     */
    PipelineStatus get_status() const;

    /**
     * @brief 立即生成一份监控报告（不影响周期报告）
     */
    MonitorReport current_report() const;

    /**
     * @brief 全部任务的当前状态快照
     */
    std::map<std::string, TaskStatus> task_statuses() const;

    /**
     * @brief 单个任务的状态历史
     */
    std::vector<TaskStatus> task_history(const std::string& task_id) const;

    uint64_t completed_count() const;
    size_t queue_depth() const;

    const PipelineConfig& config() const { return config_; }

    /**
     * @brief 配置校验失败的原因（配置有效时为空）
     */
    const std::string& config_error() const { return config_error_; }

    /**
     * @brief 设置周期报告回调（可在运行中设置）
     *
     * @return 配置无效（没有监控器）时返回false
     */
    bool set_report_callback(ReportCallback callback);

    /**
     * @brief 设置任务处理函数（需在 start() 之前调用）
     *
     * 处理函数收到 abort 令牌，强制停止时应尽快返回。
     *
     * @return 已启动时返回false
     */
    bool set_task_handler(TaskHandler handler);

    /**
     * @brief 设置模拟失败策略（需在 start() 之前调用）
     *
     * @return 已启动时返回false
     */
    bool set_failure_policy(FailurePolicy policy);

    /**
     * @brief 设置异常回调（任务处理函数或角色循环抛出的异常）
     */
    void set_exception_callback(ExceptionCallback callback);

private:
    enum class State {
        CREATED,
        RUNNING,
        STOPPED
    };

    void run_phase(ShutdownPhase phase, ShutdownReport& report,
                   const std::function<void()>& body);
    void stop_pool(RolePool& pool, int64_t timeout_ms, ShutdownPhase phase,
                   ShutdownReport& report);
    void drain_queue(ShutdownReport& report);
    void build_final_report(ShutdownReport& report);

    PipelineConfig config_;
    std::string config_error_;

    // 共享状态（先于角色对象和线程池构造，最后析构）
    std::unique_ptr<util::ExceptionHandler> exception_handler_;
    std::unique_ptr<PriorityTaskQueue> queue_;
    std::unique_ptr<StatusTracker> tracker_;
    std::atomic<uint64_t> completed_count_{0};
    std::atomic<size_t> active_workers_{0};

    // 角色对象（线程池析构前必须存活）
    std::vector<std::unique_ptr<Producer>> producers_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::unique_ptr<monitor::PipelineMonitor> monitor_;

    // 线程池
    std::unique_ptr<RolePool> producer_pool_;
    std::unique_ptr<RolePool> worker_pool_;
    std::unique_ptr<RolePool> monitor_pool_;

    mutable std::mutex state_mutex_;
    State state_ = State::CREATED;

    std::mutex shutdown_mutex_;
    bool shutdown_done_ = false;
    ShutdownReport final_report_;
};

/**
 * @brief 将关闭报告格式化为可读文本
 */
std::string format_shutdown_report(const ShutdownReport& report);

} // namespace concurq
