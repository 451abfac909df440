#pragma once

#include <string>
#include <exception>
#include <functional>
#include <mutex>

namespace concurq {
namespace util {

/**
 * @brief 异常处理器
 *
 * 处理任务执行和角色循环中的异常，防止异常传播出工作线程。
 * 设置了回调时交给回调处理，否则写一条 ERROR 日志。
 */
class ExceptionHandler {
public:
    using ExceptionCallback = std::function<void(const std::string&, std::exception_ptr)>;

    ExceptionHandler() = default;
    ~ExceptionHandler() = default;

    // 禁止拷贝和移动
    ExceptionHandler(const ExceptionHandler&) = delete;
    ExceptionHandler& operator=(const ExceptionHandler&) = delete;
    ExceptionHandler(ExceptionHandler&&) = delete;
    ExceptionHandler& operator=(ExceptionHandler&&) = delete;

    /**
     * @brief 处理异常
     *
     * @param source 异常来源（如 "Worker-2" 或任务ID）
     * @param exception 异常指针
     */
    void handle_exception(const std::string& source, std::exception_ptr exception);

    /**
     * @brief 设置异常回调函数
     *
     * @param callback 回调函数，参数为来源和异常指针
     */
    void set_exception_callback(ExceptionCallback callback);

    /**
     * @brief 已处理的异常数量
     */
    size_t handled_count() const;

    /**
     * @brief 从异常指针中提取描述信息
     */
    static std::string describe(std::exception_ptr exception);

private:
    mutable std::mutex callback_mutex_;  // 保护回调函数和计数
    ExceptionCallback exception_callback_;
    size_t handled_count_ = 0;
};

} // namespace util
} // namespace concurq
