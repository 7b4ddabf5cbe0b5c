#include "grading/scoring.hpp"
#include <boost/rational.hpp>
#include <algorithm>
#include <cmath>

namespace grader {
using namespace std;

static double round_to_cents(double value) {
    return round(value * 100) / 100;
}

score_result calculate_score(const test_results &results, const scoring_rules &rules) {
    score_result score;
    score.max_points = rules.max_points;
    if (results.total_tests == 0) return score;

    boost::rational<int64_t> fraction(0);
    switch (rules.method) {
        case scoring_method::ALL_OR_NOTHING:
            fraction = results.all_passed ? 1 : 0;
            break;
        case scoring_method::PER_TEST:
            fraction = boost::rational<int64_t>(results.passed_tests, results.total_tests);
            break;
        case scoring_method::WEIGHTED: {
            int64_t total = 0, earned = 0;
            for (auto &result : results.results) {
                auto it = rules.weights.find(result.id);
                int64_t weight = it == rules.weights.end() ? result.points : it->second;
                total += weight;
                if (result.passed) earned += weight;
            }
            if (total > 0) fraction = boost::rational<int64_t>(earned, total);
            break;
        }
    }

    score.score = round_to_cents(rules.max_points * boost::rational_cast<double>(fraction));
    score.percentage = (int)lround(100 * boost::rational_cast<double>(fraction));

    if (rules.bonus && results.all_passed) {
        int64_t total_time = 0;
        for (auto &result : results.results) total_time += result.execution_time_ms;
        if (total_time < rules.bonus->time_threshold_ms) {
            score.bonus = rules.bonus->bonus_points;
            score.score += score.bonus;
        }
    }

    score.passed = score.score >= rules.passing_score;
    return score;
}

double final_score(double raw_score, double hint_penalties) {
    return max(0.0, raw_score - hint_penalties);
}

void to_json(nlohmann::json &j, const score_result &score) {
    j = {{"score", score.score},
         {"percentage", score.percentage},
         {"maxPoints", score.max_points},
         {"bonus", score.bonus},
         {"passed", score.passed}};
}

}  // namespace grader
