#pragma once

#include <filesystem>
#include <string>

/**
 * 测试用的沙箱环境
 * 用法：
 * 1. 在 SetUpTestCase 中调用 setup_test_environment()
 * 2. 需要真实沙箱进程的测试先检查 node_available() 或 python_host_available()，不满足时 GTEST_SKIP()
 */
namespace grader {

void setup_test_environment();

/**
 * @brief 为每个测试创建独立的缓存目录，并设置为 CACHE_DIR
 */
std::filesystem::path make_test_cache_dir(const std::string &name);

bool runguard_available();

bool node_available();

bool python_host_available();

}  // namespace grader
