#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "execution/types.hpp"
#include "grading/exercise.hpp"

namespace grader {

struct score_result {
    /**
     * @brief 得分，包括效率奖励，在 [0, max_points + bonus] 之间
     */
    double score = 0;

    /**
     * @brief 不包括效率奖励的得分百分比，四舍五入到整数
     */
    int percentage = 0;

    double max_points = 0;

    /**
     * @brief 获得的效率奖励，没有获得时为 0
     */
    double bonus = 0;

    /**
     * @brief 得分是否达到了及格分数
     */
    bool passed = false;
};

/**
 * @brief 按照题目的计分规则计算得分
 * 没有测试点时得分为 0。效率奖励只在全部测试点通过时发放。
 */
score_result calculate_score(const test_results &results, const scoring_rules &rules);

/**
 * @brief 扣除提示惩罚后的最终得分，不会为负数
 */
double final_score(double raw_score, double hint_penalties);

void to_json(nlohmann::json &j, const score_result &score);

}  // namespace grader
