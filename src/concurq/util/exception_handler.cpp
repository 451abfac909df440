#include "exception_handler.hpp"
#include "logger.hpp"
#include <stdexcept>

namespace concurq {
namespace util {

void ExceptionHandler::handle_exception(const std::string& source,
                                        std::exception_ptr exception) {
    // 获取回调函数（需要加锁保护）
    ExceptionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        ++handled_count_;
        callback = exception_callback_;
    }

    if (callback) {
        try {
            callback(source, exception);
            return;
        } catch (const std::exception& e) {
            CONCURQ_LOG_ERROR("Exception callback threw while handling " << source
                              << ": " << e.what());
        } catch (...) {
            CONCURQ_LOG_ERROR("Exception callback threw while handling " << source);
        }
    }

    CONCURQ_LOG_ERROR("Unhandled exception in " << source << ": " << describe(exception));
}

void ExceptionHandler::set_exception_callback(ExceptionCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    exception_callback_ = std::move(callback);
}

size_t ExceptionHandler::handled_count() const {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    return handled_count_;
}

std::string ExceptionHandler::describe(std::exception_ptr exception) {
    if (!exception) {
        return "no exception";
    }
    try {
        std::rethrow_exception(exception);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace util
} // namespace concurq
