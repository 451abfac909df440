#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace concurq {
namespace util {

/**
 * @brief 协作式取消令牌
 *
 * 传入每个阻塞点（队列出队、间隔等待、模拟执行）。
 * cancel() 之后 wait_for() 立即返回，已注册的回调各执行一次，
 * 用于唤醒阻塞在其他条件变量上的线程。
 *
 * 取消是单向的，令牌不可重置。
 */
class CancellationToken {
public:
    using CallbackId = uint64_t;

    CancellationToken() = default;
    ~CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;
    CancellationToken(CancellationToken&&) = delete;
    CancellationToken& operator=(CancellationToken&&) = delete;

    /**
     * @brief 请求取消（重复调用无副作用）
     */
    void cancel();

    bool is_cancelled() const;

    /**
     * @brief 可中断的等待
     *
     * @param timeout 等待时长
     * @return 等满时长返回 true；期间被取消返回 false
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

    /**
     * @brief 注册取消回调
     *
     * 若令牌已取消，回调在当前线程立即执行并返回 0。
     * 回调在 cancel() 的调用线程中执行，不能再调用本令牌的 add/remove。
     *
     * @return 回调ID，用于 remove_callback
     */
    CallbackId add_callback(std::function<void()> callback);

    /**
     * @brief 注销回调
     *
     * 返回后保证该回调不在执行中。
     */
    void remove_callback(CallbackId id);

private:
    mutable std::mutex mutex_;                    // 保护等待条件
    mutable std::condition_variable condition_;
    std::atomic<bool> cancelled_{false};

    std::mutex callback_mutex_;                   // 保护回调表，cancel 期间持有
    std::map<CallbackId, std::function<void()>> callbacks_;
    CallbackId next_callback_id_ = 1;
};

/**
 * @brief 回调注册的 RAII 封装
 */
class CancellationRegistration {
public:
    CancellationRegistration(CancellationToken& token, std::function<void()> callback)
        : token_(token), id_(token.add_callback(std::move(callback))) {}

    ~CancellationRegistration() {
        if (id_ != 0) {
            token_.remove_callback(id_);
        }
    }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    CancellationToken& token_;
    CancellationToken::CallbackId id_;
};

} // namespace util
} // namespace concurq
