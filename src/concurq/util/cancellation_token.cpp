#include "cancellation_token.hpp"

namespace concurq {
namespace util {

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> callback_lock(callback_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_acquire)) {
            return;
        }
        cancelled_.store(true, std::memory_order_release);
    }
    condition_.notify_all();

    for (auto& entry : callbacks_) {
        if (entry.second) {
            entry.second();
        }
    }
}

bool CancellationToken::is_cancelled() const {
    return cancelled_.load(std::memory_order_acquire);
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    if (timeout.count() <= 0) {
        return !is_cancelled();
    }
    std::unique_lock<std::mutex> lock(mutex_);
    bool cancelled = condition_.wait_for(lock, timeout, [this]() {
        return cancelled_.load(std::memory_order_acquire);
    });
    return !cancelled;
}

CancellationToken::CallbackId CancellationToken::add_callback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (cancelled_.load(std::memory_order_acquire)) {
        if (callback) {
            callback();
        }
        return 0;
    }
    CallbackId id = next_callback_id_++;
    callbacks_.emplace(id, std::move(callback));
    return id;
}

void CancellationToken::remove_callback(CallbackId id) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callbacks_.erase(id);
}

} // namespace util
} // namespace concurq
