#include "grading/exercise.hpp"
#include <fmt/core.h>
#include <algorithm>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

scoring_method parse_scoring_method(const string &name) {
    if (name == "all-or-nothing") return scoring_method::ALL_OR_NOTHING;
    if (name == "per-test") return scoring_method::PER_TEST;
    if (name == "weighted") return scoring_method::WEIGHTED;
    throw invalid_argument("unknown scoring method " + name);
}

const char *get_scoring_method_name(scoring_method method) {
    switch (method) {
        case scoring_method::ALL_OR_NOTHING: return "all-or-nothing";
        case scoring_method::PER_TEST: return "per-test";
        case scoring_method::WEIGHTED: return "weighted";
    }
    throw invalid_argument("unknown scoring method");
}

void from_json(const json &j, scoring_rules &rules) {
    rules.max_points = get_value_def<double>(j, 100, "maxPoints");
    if (rules.max_points < 0)
        throw invalid_argument("maxPoints must not be negative");
    rules.method = parse_scoring_method(get_value_def<string>(j, "per-test", "method"));
    rules.passing_score = get_value_def<double>(j, 0, "passingScore");

    if (exists(j, "efficiencyBonus")) {
        efficiency_bonus bonus;
        bonus.time_threshold_ms = get_value<int64_t>(j, "efficiencyBonus", "timeThresholdMs");
        bonus.bonus_points = get_value<double>(j, "efficiencyBonus", "bonusPoints");
        if (bonus.time_threshold_ms <= 0 || bonus.bonus_points < 0)
            throw invalid_argument("efficiencyBonus must have a positive threshold and non-negative points");
        rules.bonus = bonus;
    }

    if (exists(j, "weights")) {
        for (auto &[id, weight] : access(j, "weights").items()) {
            int value = weight.get<int>();
            if (value < 0)
                throw invalid_argument("weight of test case " + id + " must not be negative");
            rules.weights[id] = value;
        }
    }
}

void from_json(const json &j, exercise &ex) {
    const json &id = access(j, "id");
    ex.id = id.is_string() ? id.get<string>() : id.dump();
    ex.title = get_localized(j, "title").value_or(ex.id);
    ex.language = get_value<string>(j, "language");
    ex.starter_code = get_value_def<string>(j, "", "editor", "starterCode");

    if (exists(j, "testCases"))
        ex.test_cases = access(j, "testCases").get<vector<test_case>>();

    ex.limits = exists(j, "limits") ? access(j, "limits").get<execution_limits>() : DEFAULT_EXECUTION_LIMITS;
    if (!ex.limits.valid())
        throw invalid_argument("limits of exercise " + ex.id + " must be positive");

    if (exists(j, "scoring"))
        ex.scoring = access(j, "scoring").get<scoring_rules>();

    if (exists(j, "feedback", "errorPatterns")) {
        for (auto &item : access(j, "feedback", "errorPatterns")) {
            error_pattern pattern;
            pattern.pattern = get_value<string>(item, "pattern");
            pattern.feedback = get_localized(item, "feedback").value_or("");
            ex.error_patterns.push_back(pattern);
        }
    }

    if (exists(j, "hints")) {
        for (auto &item : access(j, "hints")) {
            hint h;
            h.id = get_value<string>(item, "id");
            h.content = get_localized(item, "content").value_or("");
            h.point_penalty = get_value_def<double>(item, 0, "pointPenalty");
            ex.hints.push_back(h);
        }
    }
}

double exercise::hint_penalties(const vector<string> &used_hints) const {
    double total = 0;
    for (auto &used : used_hints) {
        auto it = find_if(hints.begin(), hints.end(), [&](const hint &h) { return h.id == used; });
        if (it == hints.end())
            throw invalid_argument(fmt::format("exercise {} has no hint {}", id, used));
        total += it->point_penalty;
    }
    return total;
}

exercise read_exercise(const filesystem::path &path) {
    if (!filesystem::exists(path))
        throw invalid_argument(fmt::format("exercise file {} does not exist", path.string()));
    json j = json::parse(read_file_content(path), nullptr, false);
    if (j.is_discarded())
        throw invalid_argument(fmt::format("exercise file {} is not valid JSON", path.string()));
    try {
        return j.get<exercise>();
    } catch (const json::exception &ex) {
        throw invalid_argument(fmt::format("exercise file {} is malformed: {}", path.string(), ex.what()));
    }
}

}  // namespace grader
