#include "execution/types.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

const execution_limits DEFAULT_EXECUTION_LIMITS;

bool execution_limits::valid() const {
    return timeout_ms > 0 && memory_bytes > 0 && max_output_chars > 0;
}

const char *get_stage_name(runtime_load_stage stage) {
    switch (stage) {
        case runtime_load_stage::CHECKING: return "checking";
        case runtime_load_stage::DOWNLOADING: return "downloading";
        case runtime_load_stage::LOADING: return "loading";
        case runtime_load_stage::READY: return "ready";
        case runtime_load_stage::ERROR: return "error";
    }
    throw invalid_argument("unknown runtime load stage");
}

const char *get_pressure_name(memory_pressure pressure) {
    switch (pressure) {
        case memory_pressure::NOMINAL: return "nominal";
        case memory_pressure::LOW: return "low";
        case memory_pressure::CRITICAL: return "critical";
    }
    throw invalid_argument("unknown memory pressure");
}

optional<string> get_localized(const json &j, const char *key) {
    const json *value = find_path(j, key);
    if (!value || value->is_null()) return nullopt;
    if (value->is_string()) return value->get<string>();
    if (value->is_object() && exists(*value, "default")) return get_value<string>(*value, "default");
    throw build_invalid_argument(j, key);
}

template <typename T>
static void put_optional(json &j, const char *key, const optional<T> &value) {
    if (value) j[key] = *value;
}

void to_json(json &j, const execution_limits &limits) {
    j = {{"timeoutMs", limits.timeout_ms},
         {"memoryBytes", limits.memory_bytes},
         {"maxOutputChars", limits.max_output_chars}};
}

void from_json(const json &j, execution_limits &limits) {
    limits.timeout_ms = get_value_def<int64_t>(j, DEFAULT_EXECUTION_LIMITS.timeout_ms, "timeoutMs");
    limits.memory_bytes = get_value_def<int64_t>(j, DEFAULT_EXECUTION_LIMITS.memory_bytes, "memoryBytes");
    limits.max_output_chars = get_value_def<int64_t>(j, DEFAULT_EXECUTION_LIMITS.max_output_chars, "maxOutputChars");
}

void to_json(json &j, const execution_result &result) {
    j = {{"success", result.success},
         {"output", result.output},
         {"exitCode", result.exit_code},
         {"executionTimeMs", result.execution_time_ms},
         {"memoryUsedBytes", result.memory_used_bytes},
         {"status", get_display_message(result.status)}};
    put_optional(j, "error", result.error);
}

void to_json(json &j, const test_case &test) {
    j = {{"id", test.id},
         {"name", test.name},
         {"visible", test.visible},
         {"input", test.input},
         {"expectedOutput", test.expected_output},
         {"points", test.points}};
    put_optional(j, "outputPattern", test.output_pattern);
    put_optional(j, "failureFeedback", test.failure_feedback);
    put_optional(j, "timeoutMs", test.timeout_ms);
}

void from_json(const json &j, test_case &test) {
    const json &id = access(j, "id");
    test.id = id.is_string() ? id.get<string>() : id.dump();
    test.name = get_value_def<string>(j, test.id, "name");
    test.visible = get_value_def<bool>(j, true, "visible");
    test.input = get_value_def<string>(j, "", "input");
    test.expected_output = get_value_def<string>(j, "", "expectedOutput");
    test.output_pattern = get_optional<string>(j, "outputPattern");
    test.points = get_value_def<int>(j, 1, "points");
    if (test.points < 0)
        throw invalid_argument("points of test case " + test.id + " must not be negative");
    test.failure_feedback = get_localized(j, "failureFeedback");
    test.timeout_ms = get_optional<int64_t>(j, "timeoutMs");
    if (test.timeout_ms && *test.timeout_ms <= 0)
        throw invalid_argument("timeoutMs of test case " + test.id + " must be positive");
}

void to_json(json &j, const test_case_result &result) {
    to_json(j, static_cast<const test_case &>(result));
    j["testCaseId"] = result.id;
    j["testCaseName"] = result.name;
    j["passed"] = result.passed;
    j["actualOutput"] = result.actual_output;
    j["executionTimeMs"] = result.execution_time_ms;
    j["earnedPoints"] = result.earned_points;
    put_optional(j, "error", result.error);
    put_optional(j, "feedback", result.feedback);
}

void to_json(json &j, const test_results &results) {
    j = {{"totalTests", results.total_tests},
         {"passedTests", results.passed_tests},
         {"totalPoints", results.total_points},
         {"earnedPoints", results.earned_points},
         {"allPassed", results.all_passed},
         {"results", results.results}};
}

void to_json(json &j, const runtime_load_progress &progress) {
    j = {{"stage", get_stage_name(progress.stage)},
         {"progress", progress.progress},
         {"message", progress.message}};
    put_optional(j, "downloadedBytes", progress.downloaded_bytes);
    put_optional(j, "totalBytes", progress.total_bytes);
}

void to_json(json &j, const memory_check_result &result) {
    j = {{"availableGB", result.available_gb},
         {"pressure", get_pressure_name(result.pressure)},
         {"canLoadPyodide", result.can_load_runtime}};
    put_optional(j, "warning", result.warning);
}

}  // namespace grader
