#pragma once

#include <string>

namespace concurq {
namespace util {

/**
 * @brief 设置当前线程名称
 *
 * 同时设置系统线程名（Linux 下截断为 15 个字符，便于 top/gdb 查看）
 * 和日志中显示的线程名（不截断）。
 *
 * @param name 线程名称
 * @return 系统线程名设置成功返回true，失败返回false（日志名总会生效）
 */
bool set_current_thread_name(const std::string& name);

/**
 * @brief 获取当前线程的系统线程名称
 *
 * @return 线程名称，失败返回空字符串
 */
std::string get_current_thread_name();

} // namespace util
} // namespace concurq
