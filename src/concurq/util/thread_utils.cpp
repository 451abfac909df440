#include "thread_utils.hpp"
#include "logger.hpp"

#ifdef _WIN32
    #include <windows.h>
#elif defined(__linux__)
    #include <pthread.h>
#else
    #error "Unsupported platform"
#endif

namespace concurq {
namespace util {

#ifdef _WIN32

bool set_current_thread_name(const std::string& name) {
    Logger::set_thread_name(name);
    std::wstring wide(name.begin(), name.end());
    return SUCCEEDED(SetThreadDescription(GetCurrentThread(), wide.c_str()));
}

std::string get_current_thread_name() {
    PWSTR description = nullptr;
    if (FAILED(GetThreadDescription(GetCurrentThread(), &description))) {
        return {};
    }
    std::wstring wide(description);
    LocalFree(description);
    std::string result;
    result.reserve(wide.size());
    for (wchar_t c : wide) {
        result.push_back(static_cast<char>(c));
    }
    return result;
}

#elif defined(__linux__)

bool set_current_thread_name(const std::string& name) {
    Logger::set_thread_name(name);
    // Linux 线程名最多 15 个字符（不含结尾的 '\0'）
    std::string truncated = name.substr(0, 15);
    return pthread_setname_np(pthread_self(), truncated.c_str()) == 0;
}

std::string get_current_thread_name() {
    char buffer[16] = {0};
    if (pthread_getname_np(pthread_self(), buffer, sizeof(buffer)) != 0) {
        return {};
    }
    return std::string(buffer);
}

#endif

} // namespace util
} // namespace concurq
