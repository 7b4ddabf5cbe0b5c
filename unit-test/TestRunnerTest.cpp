#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "grading/test_runner.hpp"
#include "test/mock_executor.hpp"

using namespace std;
using namespace grader;
using ::testing::_;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

static execution_result output_of(const string &output, int64_t time_ms = 5) {
    execution_result result;
    result.success = true;
    result.output = output;
    result.execution_time_ms = time_ms;
    return result;
}

static test_case make_test(const string &id, const string &input, const string &expected, bool visible = true, int points = 1) {
    test_case test;
    test.id = id;
    test.name = "Test " + id;
    test.input = input;
    test.expected_output = expected;
    test.visible = visible;
    test.points = points;
    return test;
}

class TestRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool.register_language("mock", [] { return make_unique<NiceMock<mock_executor>>(); });
        auto lease = pool.acquire("mock");
        executor = dynamic_cast<mock_executor *>(&*lease);
        ASSERT_NE(executor, nullptr);
        ON_CALL(*executor, language()).WillByDefault(Return("mock"));
    }

    executor_pool pool;
    mock_executor *executor = nullptr;
};

TEST_F(TestRunnerTest, RunsEveryTestCaseTest) {
    EXPECT_CALL(*executor, initialize()).Times(1);
    EXPECT_CALL(*executor, execute("print(input())", "1", _)).WillOnce(Return(output_of("1\n")));
    EXPECT_CALL(*executor, execute("print(input())", "2", _)).WillOnce(Return(output_of("3\n")));
    EXPECT_CALL(*executor, reset()).Times(2);

    test_runner runner(pool);
    auto results = runner.run_tests("print(input())", {make_test("a", "1", "1", true, 2), make_test("b", "2", "2", true, 3)}, "mock");

    EXPECT_EQ(results.total_tests, 2);
    EXPECT_EQ(results.passed_tests, 1);
    EXPECT_EQ(results.total_points, 5);
    EXPECT_EQ(results.earned_points, 2);
    EXPECT_FALSE(results.all_passed);
    ASSERT_EQ(results.results.size(), 2u);
    EXPECT_TRUE(results.results[0].passed);
    EXPECT_EQ(results.results[0].earned_points, 2);
    EXPECT_EQ(results.results[0].execution_time_ms, 5);
    EXPECT_FALSE(results.results[1].passed);
    EXPECT_EQ(results.results[1].earned_points, 0);
    EXPECT_EQ(results.results[1].actual_output, "3\n");
}

TEST_F(TestRunnerTest, FailedExecutionDoesNotPassTest) {
    execution_result crashed;
    crashed.success = false;
    crashed.output = "1\n";
    crashed.exit_code = 1;
    crashed.error = "Runtime Error";
    EXPECT_CALL(*executor, execute(_, _, _)).WillOnce(Return(crashed));

    test_runner runner(pool);
    auto results = runner.run_tests("code", {make_test("a", "", "1")}, "mock");
    EXPECT_FALSE(results.results[0].passed);
    EXPECT_EQ(results.results[0].error, string("Runtime Error"));
}

TEST_F(TestRunnerTest, TimeoutOverrideTest) {
    test_case slow = make_test("slow", "", "ok");
    slow.timeout_ms = 500;

    EXPECT_CALL(*executor, execute(_, _, Field(&execution_limits::timeout_ms, 500))).WillOnce(Return(output_of("ok")));
    EXPECT_CALL(*executor, execute(_, _, Field(&execution_limits::timeout_ms, 2000))).WillOnce(Return(output_of("ok")));

    execution_limits limits;
    limits.timeout_ms = 2000;
    test_runner runner(pool);
    auto results = runner.run_tests("code", {slow, make_test("fast", "", "ok")}, "mock", limits);
    EXPECT_TRUE(results.all_passed);
}

TEST_F(TestRunnerTest, InvalidLimitsFallBackToDefaultTest) {
    EXPECT_CALL(*executor, execute(_, _, Field(&execution_limits::memory_bytes, DEFAULT_EXECUTION_LIMITS.memory_bytes)))
        .WillOnce(Return(output_of("ok")));

    execution_limits limits;
    limits.memory_bytes = 0;
    test_runner runner(pool);
    runner.run_tests("code", {make_test("a", "", "ok")}, "mock", limits);
}

TEST_F(TestRunnerTest, ExecutorErrorIsRecordedTest) {
    EXPECT_CALL(*executor, execute(_, "1", _)).WillOnce(Throw(runtime_unavailable("Sandbox initialization timed out")));
    EXPECT_CALL(*executor, execute(_, "2", _)).WillOnce(Return(output_of("2")));

    test_runner runner(pool);
    auto results = runner.run_tests("code", {make_test("a", "1", "1"), make_test("b", "2", "2")}, "mock");
    ASSERT_EQ(results.results.size(), 2u);
    EXPECT_FALSE(results.results[0].passed);
    EXPECT_EQ(results.results[0].error, string("Sandbox initialization timed out"));
    EXPECT_TRUE(results.results[1].passed);
}

TEST_F(TestRunnerTest, ResetFailureDoesNotAbortTest) {
    EXPECT_CALL(*executor, execute(_, _, _)).WillRepeatedly(Return(output_of("x")));
    EXPECT_CALL(*executor, reset()).WillRepeatedly(Throw(runtime_unavailable("reset failed")));

    test_runner runner(pool);
    auto results = runner.run_tests("code", {make_test("a", "", "x"), make_test("b", "", "x")}, "mock");
    EXPECT_EQ(results.passed_tests, 2);
}

TEST_F(TestRunnerTest, InitializationFailurePropagatesTest) {
    EXPECT_CALL(*executor, initialize()).WillOnce(Throw(runtime_unavailable("Insufficient memory")));
    EXPECT_CALL(*executor, execute(_, _, _)).Times(0);

    test_runner runner(pool);
    EXPECT_THROW(runner.run_tests("code", {make_test("a", "", "x")}, "mock"), runtime_unavailable);
}

TEST_F(TestRunnerTest, UnsupportedLanguageTest) {
    test_runner runner(pool);
    EXPECT_THROW(runner.run_tests("code", {make_test("a", "", "x")}, "cobol"), invalid_argument);
}

TEST_F(TestRunnerTest, FailureFeedbackTest) {
    test_case with_feedback = make_test("a", "", "yes");
    with_feedback.failure_feedback = "Print yes.";
    test_case passing = make_test("b", "", "no");
    passing.failure_feedback = "Print no.";

    EXPECT_CALL(*executor, execute(_, _, _)).WillRepeatedly(Return(output_of("no")));

    test_runner runner(pool);
    auto results = runner.run_tests("code", {with_feedback, passing}, "mock");
    EXPECT_EQ(results.results[0].feedback, string("Print yes."));
    EXPECT_FALSE(results.results[1].feedback);
}

TEST_F(TestRunnerTest, VisibleTestsOnlyTest) {
    EXPECT_CALL(*executor, execute(_, "visible", _)).WillOnce(Return(output_of("v")));
    EXPECT_CALL(*executor, execute(_, "hidden", _)).Times(0);

    test_runner runner(pool);
    auto results = runner.run_visible_tests("code", {make_test("a", "visible", "v"), make_test("b", "hidden", "h", false)}, "mock");
    EXPECT_EQ(results.total_tests, 1);
    EXPECT_TRUE(results.all_passed);
}

TEST_F(TestRunnerTest, AllTestsIncludeHiddenTest) {
    EXPECT_CALL(*executor, execute(_, "visible", _)).WillOnce(Return(output_of("v")));
    EXPECT_CALL(*executor, execute(_, "hidden", _)).WillOnce(Return(output_of("wrong")));

    test_runner runner(pool);
    auto results = runner.run_all_tests("code", {make_test("a", "visible", "v"), make_test("b", "hidden", "h", false)}, "mock");
    EXPECT_EQ(results.total_tests, 2);
    EXPECT_EQ(results.passed_tests, 1);
    EXPECT_FALSE(results.results[1].visible);
}

TEST_F(TestRunnerTest, PatternMatchTest) {
    test_case test = make_test("a", "", "ignored");
    test.output_pattern = "^Result: \\d+$";
    EXPECT_CALL(*executor, execute(_, _, _)).WillOnce(Return(output_of("Result: 12\n")));

    test_runner runner(pool);
    EXPECT_TRUE(runner.run_tests("code", {test}, "mock").all_passed);
}

TEST_F(TestRunnerTest, NoTestCasesTest) {
    test_runner runner(pool);
    auto results = runner.run_tests("code", {}, "mock");
    EXPECT_EQ(results.total_tests, 0);
    EXPECT_TRUE(results.all_passed);
}
