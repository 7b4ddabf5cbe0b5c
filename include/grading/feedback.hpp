#pragma once

#include <string>
#include <vector>
#include "execution/types.hpp"
#include "grading/exercise.hpp"

namespace grader {

/**
 * @brief 生成给学习者的评测反馈
 *
 * 全部通过时为 "All tests passed. Great work!"，否则第一行为 "P of T tests passed."，
 * 之后每个未通过的可见测试点一行（测试点自己的提示，或者预期输出与实际输出的对比），
 * 隐藏测试点只给出未通过的数量，不会泄露其输入和预期输出。
 * 最后给出第一个匹配到错误信息的 error_pattern 的提示。
 */
std::string generate_feedback(const test_results &results, const std::vector<error_pattern> &patterns = {});

}  // namespace grader
