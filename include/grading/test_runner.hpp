#pragma once

#include <optional>
#include <string>
#include <vector>
#include "execution/executor_pool.hpp"
#include "execution/types.hpp"

namespace grader {

/**
 * @brief 规范化程序输出
 * CRLF 转换为 LF，删除每行末尾的空白、末尾的空行以及首尾空白
 */
std::string normalize_output(const std::string &output);

/**
 * @brief 比较程序输出和预期输出
 * 如果给出了 pattern，则在规范化后的输出中搜索该正则表达式（Perl 语法，^ 和 $ 匹配行首行尾），
 * 表达式不合法时退化为精确比较。
 */
bool compare_output(const std::string &actual, const std::string &expected, const std::optional<std::string> &pattern);

/**
 * @brief 在执行器上运行一组测试点
 */
struct test_runner {
    explicit test_runner(executor_pool &pool);

    /**
     * @brief 依次运行所有给定的测试点
     * 执行器只初始化一次，每个测试点运行后调用 reset()。
     * 单个测试点的失败记录在结果中，不会中断评测。
     * @throw runtime_unavailable 如果执行器无法初始化
     * @throw std::invalid_argument 如果语言不支持
     */
    test_results run_tests(const std::string &code, const std::vector<test_case> &test_cases,
                           const std::string &language, const execution_limits &limits = DEFAULT_EXECUTION_LIMITS);

    /**
     * @brief 只运行可见的测试点，用于学习者试运行
     */
    test_results run_visible_tests(const std::string &code, const std::vector<test_case> &test_cases,
                                   const std::string &language, const execution_limits &limits = DEFAULT_EXECUTION_LIMITS);

    /**
     * @brief 运行包括隐藏测试点在内的所有测试点，用于提交
     */
    test_results run_all_tests(const std::string &code, const std::vector<test_case> &test_cases,
                               const std::string &language, const execution_limits &limits = DEFAULT_EXECUTION_LIMITS);

private:
    test_case_result run_test_case(code_executor &executor, const std::string &code, const test_case &test, const execution_limits &limits);

    executor_pool &pool;
};

}  // namespace grader
