#include "gtest/gtest.h"
#include "grading/scoring.hpp"

using namespace std;
using namespace grader;

static test_results make_results(const vector<bool> &passed, const vector<int> &points = {}, int64_t time_ms = 10) {
    test_results results;
    for (size_t i = 0; i < passed.size(); ++i) {
        test_case_result result;
        result.id = "t" + to_string(i + 1);
        result.name = "Test " + to_string(i + 1);
        result.points = i < points.size() ? points[i] : 1;
        result.passed = passed[i];
        result.earned_points = passed[i] ? result.points : 0;
        result.execution_time_ms = time_ms;

        ++results.total_tests;
        results.total_points += result.points;
        results.earned_points += result.earned_points;
        if (result.passed) ++results.passed_tests;
        results.results.push_back(result);
    }
    results.all_passed = results.passed_tests == results.total_tests;
    return results;
}

TEST(ScoringTest, NoTestsTest) {
    scoring_rules rules;
    auto score = calculate_score(make_results({}), rules);
    EXPECT_EQ(score.score, 0);
    EXPECT_EQ(score.percentage, 0);
    EXPECT_EQ(score.max_points, 100);
}

TEST(ScoringTest, PerTestTest) {
    scoring_rules rules;
    rules.method = scoring_method::PER_TEST;
    auto score = calculate_score(make_results({true, true, false}), rules);
    EXPECT_DOUBLE_EQ(score.score, 66.67);
    EXPECT_EQ(score.percentage, 67);
    EXPECT_EQ(score.bonus, 0);
}

TEST(ScoringTest, AllOrNothingTest) {
    scoring_rules rules;
    rules.method = scoring_method::ALL_OR_NOTHING;
    rules.max_points = 10;

    auto score = calculate_score(make_results({true, true, false}), rules);
    EXPECT_EQ(score.score, 0);
    EXPECT_EQ(score.percentage, 0);

    score = calculate_score(make_results({true, true, true}), rules);
    EXPECT_EQ(score.score, 10);
    EXPECT_EQ(score.percentage, 100);
}

TEST(ScoringTest, WeightedTest) {
    scoring_rules rules;
    rules.method = scoring_method::WEIGHTED;
    rules.weights["t1"] = 3;

    // t1 权重为 3，t2 使用其 points 1
    auto score = calculate_score(make_results({true, false}, {1, 1}), rules);
    EXPECT_DOUBLE_EQ(score.score, 75);
    EXPECT_EQ(score.percentage, 75);

    rules.weights.clear();
    score = calculate_score(make_results({false, true}, {1, 4}), rules);
    EXPECT_DOUBLE_EQ(score.score, 80);
}

TEST(ScoringTest, EfficiencyBonusTest) {
    scoring_rules rules;
    rules.bonus = efficiency_bonus{100, 10};

    auto score = calculate_score(make_results({true, true}, {}, 20), rules);
    EXPECT_EQ(score.bonus, 10);
    EXPECT_EQ(score.score, 110);
    EXPECT_EQ(score.percentage, 100);

    // 总执行时间没有低于阈值
    score = calculate_score(make_results({true, true}, {}, 50), rules);
    EXPECT_EQ(score.bonus, 0);
    EXPECT_EQ(score.score, 100);

    score = calculate_score(make_results({true, false}, {}, 1), rules);
    EXPECT_EQ(score.bonus, 0);
    EXPECT_EQ(score.score, 50);
}

TEST(ScoringTest, PassingScoreTest) {
    scoring_rules rules;
    rules.passing_score = 60;
    EXPECT_TRUE(calculate_score(make_results({true, true, false}), rules).passed);
    EXPECT_FALSE(calculate_score(make_results({true, false, false}), rules).passed);
}

TEST(ScoringTest, FinalScoreTest) {
    EXPECT_EQ(final_score(80, 5), 75);
    EXPECT_EQ(final_score(10, 15), 0);
    EXPECT_EQ(final_score(0, 0), 0);
}

TEST(ScoringTest, JsonTest) {
    scoring_rules rules;
    nlohmann::json j = calculate_score(make_results({true, false}), rules);
    EXPECT_EQ(j.at("score"), 50);
    EXPECT_EQ(j.at("percentage"), 50);
    EXPECT_EQ(j.at("maxPoints"), 100);
    EXPECT_EQ(j.at("passed"), true);
}
