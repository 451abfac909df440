#pragma once

#include "../util/cancellation_token.hpp"
#include "../util/exception_handler.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace concurq {

/**
 * @brief 角色线程池
 *
 * 固定数量的命名线程，每个线程运行一次角色循环（生产者、worker 或监控器），
 * 循环返回即线程退出。提供两级停止：
 * - request_stop()：取消 stop 令牌，角色自行收尾后退出
 * - force_stop()：同时取消 stop 和 abort 令牌，角色应立即退出
 *
 * 角色循环抛出的异常交给 ExceptionHandler，不会影响同池的其他线程。
 */
class RolePool {
public:
    /**
     * @brief 角色函数
     *
     * @param index 线程序号（从 0 开始）
     * @param stop 优雅停止令牌
     * @param abort 强制停止令牌
     */
    using RoleFunction = std::function<void(size_t index,
                                            util::CancellationToken& stop,
                                            util::CancellationToken& abort)>;

    /**
     * @brief 构造函数
     *
     * @param name 池名称，线程命名为 "<name>-<序号>"
     * @param exception_handler 角色循环异常的处理器
     */
    RolePool(const std::string& name, util::ExceptionHandler& exception_handler);

    /**
     * @brief 析构函数
     *
     * 强制停止并等待所有线程退出。在池内线程上析构时，该线程被分离。
     */
    ~RolePool();

    // 禁止拷贝和移动
    RolePool(const RolePool&) = delete;
    RolePool& operator=(const RolePool&) = delete;
    RolePool(RolePool&&) = delete;
    RolePool& operator=(RolePool&&) = delete;

    /**
     * @brief 启动线程
     *
     * @param thread_count 线程数（必须大于 0）
     * @param role 角色函数
     * @return 启动成功返回true；已启动或参数无效返回false
     */
    bool start(size_t thread_count, RoleFunction role);

    /**
     * @brief 请求优雅停止（不等待）
     */
    void request_stop();

    /**
     * @brief 强制停止（不等待）
     */
    void force_stop();

    /**
     * @brief 等待所有线程退出
     *
     * 全部退出时回收线程并返回true；超时返回false。
     * 从池内线程调用时不等待调用线程自身。
     *
     * @param timeout 最长等待时间
     */
    bool await_termination(std::chrono::milliseconds timeout);

    /**
     * @brief 阻塞等待并回收全部线程（调用线程自身除外）
     */
    void join();

    /**
     * @brief 调用线程是否属于本池
     */
    bool owns_current_thread();

    /**
     * @brief 仍在运行的线程数
     */
    size_t alive_count() const;

    /**
     * @brief 启动的线程总数
     */
    size_t thread_count() const;

    bool is_started() const;

    const std::string& name() const { return name_; }

private:
    void role_thread(size_t index);

    std::string name_;
    util::ExceptionHandler& exception_handler_;
    RoleFunction role_;

    std::vector<std::thread> threads_;
    std::atomic<bool> started_{false};
    std::atomic<size_t> thread_count_{0};

    util::CancellationToken stop_token_;
    util::CancellationToken abort_token_;

    // 退出计数：alive_ 在 exit_mutex_ 保护下递减，配合 exit_condition_ 等待
    mutable std::mutex exit_mutex_;
    std::condition_variable exit_condition_;
    size_t alive_ = 0;

    // 保护 threads_ 的回收
    std::mutex join_mutex_;
};

} // namespace concurq
