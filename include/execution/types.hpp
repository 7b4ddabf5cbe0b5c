#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 一次执行的资源限制
 * 三个值都必须为正数。题目没有指定时使用默认配置 30000ms / 50MB / 10000 字符。
 */
struct execution_limits {
    /**
     * @brief 墙钟时间限制，单位为毫秒
     */
    int64_t timeout_ms = 30000;

    /**
     * @brief 内存限制，单位为字节
     */
    int64_t memory_bytes = 50 * 1024 * 1024;

    /**
     * @brief 标准输出的最大字符数，超出部分被截断
     */
    int64_t max_output_chars = 10000;

    bool valid() const;
};

extern const execution_limits DEFAULT_EXECUTION_LIMITS;

/**
 * @brief 一次执行的结果
 * 退出码约定：0 为正常结束，124 为超时，1 为运行时错误。
 */
struct execution_result {
    /**
     * @brief 执行是否正常结束
     * 因为输出超限而被截断的执行也视为成功
     */
    bool success = false;

    /**
     * @brief 用户程序的标准输出
     */
    std::string output;

    /**
     * @brief 面向学习者的错误信息，或者正常结束时的 stderr 内容
     */
    std::optional<std::string> error;

    int exit_code = 0;

    /**
     * @brief 执行时间（毫秒），超时时等于 timeout_ms
     */
    int64_t execution_time_ms = 0;

    int64_t memory_used_bytes = 0;

    /**
     * @brief 执行结束的原因
     */
    grader::status status = grader::status::ACCEPTED;
};

/**
 * @brief 一个测试点
 */
struct test_case {
    std::string id;
    std::string name;

    /**
     * @brief 为假时为隐藏测试点，只在提交时评测，且预期输出不能泄露给学习者
     */
    bool visible = true;

    std::string input;
    std::string expected_output;

    /**
     * @brief 输出匹配的正则表达式，存在时优先于 expected_output
     */
    std::optional<std::string> output_pattern;

    int points = 1;

    /**
     * @brief 测试点未通过时展示给学习者的提示
     */
    std::optional<std::string> failure_feedback;

    /**
     * @brief 覆盖题目级别的时间限制
     */
    std::optional<int64_t> timeout_ms;
};

/**
 * @brief 一个测试点的评测结果
 * earned_points 在 [0, points] 之间，且 earned_points == points 当且仅当 passed
 */
struct test_case_result : public test_case {
    bool passed = false;
    std::string actual_output;
    int64_t execution_time_ms = 0;
    std::optional<std::string> error;
    std::optional<std::string> feedback;
    int earned_points = 0;
};

/**
 * @brief 一组测试点的评测结果
 * earned_points 为各个测试点 earned_points 之和，all_passed 当且仅当 passed_tests == total_tests
 */
struct test_results {
    int total_tests = 0;
    int passed_tests = 0;
    int total_points = 0;
    int earned_points = 0;
    bool all_passed = true;
    std::vector<test_case_result> results;
};

/**
 * @brief 运行时加载的阶段
 * 阶段只会按 CHECKING -> DOWNLOADING -> LOADING -> READY 的顺序推进，任何阶段都可以进入 ERROR
 */
enum class runtime_load_stage {
    CHECKING,
    DOWNLOADING,
    LOADING,
    READY,
    ERROR
};

const char *get_stage_name(runtime_load_stage stage);

struct runtime_load_progress {
    runtime_load_stage stage = runtime_load_stage::CHECKING;

    /**
     * @brief 0 到 100 之间的进度
     */
    int progress = 0;

    std::optional<uint64_t> downloaded_bytes;
    std::optional<uint64_t> total_bytes;
    std::string message;
};

enum class memory_pressure {
    NOMINAL,
    LOW,
    CRITICAL
};

const char *get_pressure_name(memory_pressure pressure);

/**
 * @brief 内存压力检查结果
 * can_load_runtime 为假当且仅当 pressure 为 CRITICAL
 */
struct memory_check_result {
    double available_gb = 0;
    memory_pressure pressure = memory_pressure::NOMINAL;
    bool can_load_runtime = true;
    std::optional<std::string> warning;
};

/**
 * @brief 读取可以本地化的文本字段
 * 字段可以是字符串，或者 {"default": "...", "translations": {...}}，后者取 default
 * @throw std::invalid_argument 如果字段格式错误
 */
std::optional<std::string> get_localized(const nlohmann::json &j, const char *key);

void to_json(nlohmann::json &j, const execution_limits &limits);
void from_json(const nlohmann::json &j, execution_limits &limits);

void to_json(nlohmann::json &j, const execution_result &result);

void to_json(nlohmann::json &j, const test_case &test);
void from_json(const nlohmann::json &j, test_case &test);

void to_json(nlohmann::json &j, const test_case_result &result);
void to_json(nlohmann::json &j, const test_results &results);
void to_json(nlohmann::json &j, const runtime_load_progress &progress);
void to_json(nlohmann::json &j, const memory_check_result &result);

}  // namespace grader
