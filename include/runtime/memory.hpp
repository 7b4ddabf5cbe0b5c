#pragma once

#include <functional>
#include "execution/types.hpp"

namespace grader {

/**
 * @brief 读取 /proc/meminfo 中的 MemAvailable，判断是否有足够的内存加载 Python 运行时
 * 无法读取时假设有 4GB 可用内存。
 */
memory_check_result check_memory_pressure();

/**
 * @brief 根据可用内存（GB）计算内存压力
 * 低于 MEMORY_CRITICAL_GB 时拒绝加载，低于 MEMORY_LOW_GB 时给出警告
 */
memory_check_result evaluate_memory_pressure(double available_gb);

/**
 * @brief 内存检查函数，测试中可以替换为固定的结果
 */
typedef std::function<memory_check_result()> memory_probe;

}  // namespace grader
