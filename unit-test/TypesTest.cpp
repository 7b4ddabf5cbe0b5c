#include "gtest/gtest.h"
#include "execution/types.hpp"
#include "runtime/memory.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace grader;

TEST(TypesTest, LimitsTest) {
    EXPECT_TRUE(DEFAULT_EXECUTION_LIMITS.valid());
    EXPECT_EQ(DEFAULT_EXECUTION_LIMITS.timeout_ms, 30000);
    EXPECT_EQ(DEFAULT_EXECUTION_LIMITS.memory_bytes, 50 * 1024 * 1024);
    EXPECT_EQ(DEFAULT_EXECUTION_LIMITS.max_output_chars, 10000);

    execution_limits limits;
    limits.max_output_chars = 0;
    EXPECT_FALSE(limits.valid());
    limits = nlohmann::json({{"timeoutMs", -5}}).get<execution_limits>();
    EXPECT_FALSE(limits.valid());
}

TEST(TypesTest, ExecutionResultJsonTest) {
    execution_result result;
    result.success = false;
    result.output = "partial";
    result.error = "Execution timed out after 1 seconds. Your code might have an infinite loop.";
    result.exit_code = 124;
    result.execution_time_ms = 1000;
    result.status = status::TIME_LIMIT_EXCEEDED;

    nlohmann::json j = result;
    EXPECT_EQ(j.at("success"), false);
    EXPECT_EQ(j.at("exitCode"), 124);
    EXPECT_EQ(j.at("executionTimeMs"), 1000);
    EXPECT_EQ(j.at("memoryUsedBytes"), 0);
    EXPECT_EQ(j.at("error"), *result.error);
    EXPECT_TRUE(j.contains("status"));

    result.error = nullopt;
    j = result;
    EXPECT_FALSE(j.contains("error"));
}

TEST(TypesTest, TestResultsJsonTest) {
    test_case_result result;
    result.id = "t1";
    result.name = "First";
    result.expected_output = "1";
    result.actual_output = "1";
    result.passed = true;
    result.earned_points = 1;

    test_results results;
    results.total_tests = results.passed_tests = 1;
    results.total_points = results.earned_points = 1;
    results.results.push_back(result);

    nlohmann::json j = results;
    EXPECT_EQ(j.at("allPassed"), true);
    EXPECT_EQ(j.at("totalTests"), 1);
    const auto &first = j.at("results").at(0);
    EXPECT_EQ(first.at("testCaseId"), "t1");
    EXPECT_EQ(first.at("testCaseName"), "First");
    EXPECT_EQ(first.at("passed"), true);
    EXPECT_EQ(first.at("actualOutput"), "1");
    EXPECT_EQ(first.at("earnedPoints"), 1);
    EXPECT_FALSE(first.contains("feedback"));
}

TEST(TypesTest, ProgressJsonTest) {
    runtime_load_progress progress;
    progress.stage = runtime_load_stage::DOWNLOADING;
    progress.progress = 47;
    progress.downloaded_bytes = 100;
    progress.total_bytes = 200;
    progress.message = "Downloading Python runtime (47%)...";

    EXPECT_JSON_EQ(nlohmann::json(progress), nlohmann::json::parse(R"({
        "stage": "downloading",
        "progress": 47,
        "downloadedBytes": 100,
        "totalBytes": 200,
        "message": "Downloading Python runtime (47%)..."
    })"));
}

TEST(TypesTest, LocalizedTextTest) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "plain": "hello",
        "localized": {"default": "hello", "translations": {"fr": "bonjour"}},
        "broken": 42
    })");
    EXPECT_EQ(get_localized(j, "plain"), string("hello"));
    EXPECT_EQ(get_localized(j, "localized"), string("hello"));
    EXPECT_FALSE(get_localized(j, "missing"));
    EXPECT_THROW(get_localized(j, "broken"), invalid_argument);
}

TEST(TypesTest, MemoryPressureTest) {
    auto critical = evaluate_memory_pressure(1.5);
    EXPECT_EQ(critical.pressure, memory_pressure::CRITICAL);
    EXPECT_FALSE(critical.can_load_runtime);
    EXPECT_EQ(critical.warning, string("Your device has very limited memory. The Python runtime may not work properly."));

    auto low = evaluate_memory_pressure(2.5);
    EXPECT_EQ(low.pressure, memory_pressure::LOW);
    EXPECT_TRUE(low.can_load_runtime);
    EXPECT_EQ(low.warning, string("Close other apps first to ensure smooth Python execution."));

    auto nominal = evaluate_memory_pressure(8);
    EXPECT_EQ(nominal.pressure, memory_pressure::NOMINAL);
    EXPECT_TRUE(nominal.can_load_runtime);
    EXPECT_FALSE(nominal.warning);

    nlohmann::json j = critical;
    EXPECT_EQ(j.at("canLoadPyodide"), false);
    EXPECT_EQ(j.at("pressure"), "critical");
    EXPECT_EQ(j.at("availableGB"), 1.5);
}

TEST(TypesTest, CheckMemoryPressureTest) {
    auto result = check_memory_pressure();
    EXPECT_GT(result.available_gb, 0);
    EXPECT_EQ(result.can_load_runtime, result.pressure != memory_pressure::CRITICAL);
}
