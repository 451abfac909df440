#include "role_pool.hpp"
#include "../util/logger.hpp"
#include "../util/thread_utils.hpp"

namespace concurq {

RolePool::RolePool(const std::string& name, util::ExceptionHandler& exception_handler)
    : name_(name)
    , exception_handler_(exception_handler) {
}

RolePool::~RolePool() {
    force_stop();
    join();

    // 只剩调用线程自身
    std::lock_guard<std::mutex> lock(join_mutex_);
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.detach();
        }
    }
    threads_.clear();
}

bool RolePool::start(size_t thread_count, RoleFunction role) {
    if (thread_count == 0 || !role) {
        return false;
    }

    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return false;  // 已经启动过
    }

    role_ = std::move(role);
    thread_count_.store(thread_count, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        alive_ = thread_count;
    }

    std::lock_guard<std::mutex> lock(join_mutex_);
    threads_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back(&RolePool::role_thread, this, i);
    }
    return true;
}

void RolePool::role_thread(size_t index) {
    const std::string thread_name = name_ + "-" + std::to_string(index + 1);
    util::set_current_thread_name(thread_name);

    try {
        role_(index, stop_token_, abort_token_);
    } catch (...) {
        // 捕获所有异常，通过ExceptionHandler处理，其他线程继续运行
        exception_handler_.handle_exception(thread_name, std::current_exception());
    }
    CONCURQ_LOG_DEBUG(thread_name << " exited.");

    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        --alive_;
    }
    exit_condition_.notify_all();
}

void RolePool::request_stop() {
    stop_token_.cancel();
}

void RolePool::force_stop() {
    stop_token_.cancel();
    abort_token_.cancel();
}

bool RolePool::await_termination(std::chrono::milliseconds timeout) {
    const size_t self = owns_current_thread() ? 1 : 0;
    {
        std::unique_lock<std::mutex> lock(exit_mutex_);
        bool exited = exit_condition_.wait_for(lock, timeout, [this, self]() {
            return alive_ <= self;
        });
        if (!exited) {
            return false;
        }
    }
    join();
    return true;
}

void RolePool::join() {
    const std::thread::id self = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(join_mutex_);
    std::vector<std::thread> remaining;
    for (auto& thread : threads_) {
        if (thread.get_id() == self) {
            remaining.push_back(std::move(thread));
        } else if (thread.joinable()) {
            thread.join();
        }
    }
    threads_ = std::move(remaining);
}

bool RolePool::owns_current_thread() {
    const std::thread::id self = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(join_mutex_);
    for (const auto& thread : threads_) {
        if (thread.get_id() == self) {
            return true;
        }
    }
    return false;
}

size_t RolePool::alive_count() const {
    std::lock_guard<std::mutex> lock(exit_mutex_);
    return alive_;
}

size_t RolePool::thread_count() const {
    return thread_count_.load(std::memory_order_acquire);
}

bool RolePool::is_started() const {
    return started_.load(std::memory_order_acquire);
}

} // namespace concurq
