#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "execution/types.hpp"

namespace grader {

enum class scoring_method {
    /**
     * @brief 全部测试点通过时得满分，否则为 0 分
     */
    ALL_OR_NOTHING,

    /**
     * @brief 每个测试点的分值相同
     */
    PER_TEST,

    /**
     * @brief 按测试点的权重计算，权重默认为测试点的 points
     */
    WEIGHTED
};

scoring_method parse_scoring_method(const std::string &name);
const char *get_scoring_method_name(scoring_method method);

struct efficiency_bonus {
    /**
     * @brief 所有测试点的执行时间之和低于该值时获得奖励
     */
    int64_t time_threshold_ms = 0;
    double bonus_points = 0;
};

struct scoring_rules {
    double max_points = 100;
    scoring_method method = scoring_method::PER_TEST;
    double passing_score = 0;
    std::optional<efficiency_bonus> bonus;

    /**
     * @brief WEIGHTED 计分时测试点的权重，没有列出的测试点使用其 points
     */
    std::map<std::string, int> weights;
};

/**
 * @brief 错误输出匹配 pattern 时给出的提示
 */
struct error_pattern {
    std::string pattern;
    std::string feedback;
};

struct hint {
    std::string id;
    std::string content;

    /**
     * @brief 使用该提示扣除的分数
     */
    double point_penalty = 0;
};

/**
 * @brief 一道编程练习题
 */
struct exercise {
    std::string id;
    std::string title;

    /**
     * @brief 可以为：javascript, python
     */
    std::string language;

    std::string starter_code;
    std::vector<test_case> test_cases;
    execution_limits limits;
    scoring_rules scoring;
    std::vector<error_pattern> error_patterns;
    std::vector<hint> hints;

    /**
     * @brief 计算使用了给定提示之后需要扣除的总分
     * @throw std::invalid_argument 如果提示不存在
     */
    double hint_penalties(const std::vector<std::string> &used_hints) const;
};

void from_json(const nlohmann::json &j, scoring_rules &rules);
void from_json(const nlohmann::json &j, exercise &ex);

/**
 * @brief 读取 JSON 格式的练习题
 * @throw std::invalid_argument 如果文件不存在或者格式错误
 */
exercise read_exercise(const std::filesystem::path &path);

}  // namespace grader
