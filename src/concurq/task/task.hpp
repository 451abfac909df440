#pragma once

#include "concurq/types.hpp"
#include <string>
#include <vector>

namespace concurq {

/**
 * @brief Task 相等比较（只比较 id）
 */
bool operator==(const Task& lhs, const Task& rhs);
bool operator!=(const Task& lhs, const Task& rhs);

/**
 * @brief 判断 lhs 是否比 rhs 更紧急
 *
 * 只比较 priority（数值小的更紧急），不考虑其他字段。
 */
bool is_more_urgent(const Task& lhs, const Task& rhs);

/**
 * @brief 创建任务ID（辅助函数）
 *
 * 使用原子计数器生成进程内唯一的任务ID
 *
 * @return 唯一的任务ID字符串
 */
std::string generate_task_id();

/**
 * @brief 创建任务
 *
 * 分配新的 id 并记录创建时间。
 */
Task make_task(const std::string& name, int priority, const std::string& payload = "");

/**
 * @brief 全部任务状态（按声明顺序）
 */
const std::vector<TaskStatus>& all_task_statuses();

/**
 * @brief 检查状态转换是否合法
 *
 * from == to 视为合法（set_status 是幂等的）。
 */
bool is_valid_transition(TaskStatus from, TaskStatus to);

} // namespace concurq
