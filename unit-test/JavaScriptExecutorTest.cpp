#include <boost/algorithm/string/predicate.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "execution/javascript_executor.hpp"
#include "test/sandbox.hpp"

using namespace std;
using namespace grader;

class JavaScriptExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!node_available()) GTEST_SKIP() << "node or runguard is not available";
        limits.timeout_ms = 5000;
        limits.memory_bytes = 128 * 1024 * 1024;
        limits.max_output_chars = 1000;
    }

    void TearDown() override {
        executor.dispose();
    }

    javascript_executor executor;
    execution_limits limits;
};

TEST_F(JavaScriptExecutorTest, LifecycleTest) {
    EXPECT_EQ(executor.state(), executor_state::UNINITIALIZED);
    EXPECT_FALSE(executor.is_ready());
    executor.initialize();
    EXPECT_TRUE(executor.is_ready());
    executor.initialize();
    EXPECT_EQ(executor.state(), executor_state::READY);

    executor.execute("console.log(1)", "", limits);
    EXPECT_EQ(executor.state(), executor_state::READY);

    executor.dispose();
    EXPECT_EQ(executor.state(), executor_state::DISPOSED);
}

TEST_F(JavaScriptExecutorTest, HelloWorldTest) {
    auto result = executor.execute("console.log('Hello, World!');", "", limits);
    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "Hello, World!\n");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.status, status::ACCEPTED);
    EXPECT_FALSE(result.error);
}

TEST_F(JavaScriptExecutorTest, ReadsInputTest) {
    auto result = executor.execute("const a = Number(readline()); const b = Number(readline()); console.log(a + b);", "3\n4\n", limits);
    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "7\n");

    result = executor.execute("console.log(input.trim().split(' ').length)", "a b c", limits);
    EXPECT_EQ(result.output, "3\n");
}

TEST_F(JavaScriptExecutorTest, ConsoleFormattingTest) {
    auto result = executor.execute("console.log('a', 1, true); console.log({x: 1});", "", limits);
    EXPECT_EQ(result.output, "a 1 true\n{\n  \"x\": 1\n}\n");
}

TEST_F(JavaScriptExecutorTest, StderrIsReportedTest) {
    auto result = executor.execute("console.error('oops'); console.log('done');", "", limits);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "done\n");
    EXPECT_EQ(result.error, string("oops\n"));
}

TEST_F(JavaScriptExecutorTest, ReferenceErrorTest) {
    auto result = executor.execute("let total = 1;\nconsole.log(totl);", "", limits);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.error, string("Reference Error on line 2: 'totl' is not defined. Did you spell it correctly? Remember to declare variables with let, const, or var."));
}

TEST_F(JavaScriptExecutorTest, OutputBeforeErrorIsKeptTest) {
    auto result = executor.execute("console.log('before'); null.x;", "", limits);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "before\n");
}

TEST_F(JavaScriptExecutorTest, TimeoutTest) {
    limits.timeout_ms = 1000;
    auto result = executor.execute("while (true) {}", "", limits);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.execution_time_ms, 1000);
    EXPECT_EQ(result.status, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.error, string("Execution timed out after 1 seconds. Your code might have an infinite loop."));

    // 超时后执行器仍然可用
    EXPECT_TRUE(executor.is_ready());
    result = executor.execute("console.log('next')", "", limits);
    EXPECT_EQ(result.output, "next\n");
}

TEST_F(JavaScriptExecutorTest, OutputLimitTest) {
    limits.max_output_chars = 100;
    auto result = executor.execute("for (let i = 0; ; ++i) console.log(i);", "", limits);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.status, status::OUTPUT_LIMIT_EXCEEDED);
    EXPECT_TRUE(boost::algorithm::ends_with(result.output, "\n[Output truncated]"));
    EXPECT_EQ(result.output.size(), 100 + string("\n[Output truncated]").size());
}

TEST_F(JavaScriptExecutorTest, OversizedOutputMessageTest) {
    // 单次 console.log 的内容超过消息通道的上限，无法完整接收
    size_t saved = MAX_MESSAGE_SIZE;
    MAX_MESSAGE_SIZE = 64 << 10;
    defer { MAX_MESSAGE_SIZE = saved; };

    auto result = executor.execute("console.log('before'); console.log('x'.repeat(200000)); console.log('after');", "", limits);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.status, status::OUTPUT_LIMIT_EXCEEDED);
    EXPECT_EQ(result.output, "before\n\n[Output truncated]");

    // 执行器仍然可用
    result = executor.execute("console.log('next')", "", limits);
    EXPECT_EQ(result.output, "next\n");
}

TEST_F(JavaScriptExecutorTest, BlockedCapabilitiesTest) {
    for (string code : {"require('fs')", "fetch('http://example.com')", "process.exit(0)", "eval('1 + 1')"}) {
        auto result = executor.execute(code, "", limits);
        EXPECT_FALSE(result.success) << code;
        EXPECT_EQ(result.status, status::SANDBOX_VIOLATION) << code << ": " << result.error.value_or("");
        ASSERT_TRUE(result.error) << code;
        EXPECT_TRUE(boost::algorithm::starts_with(*result.error, "Security Error:")) << *result.error;
    }
}

TEST_F(JavaScriptExecutorTest, CodeGenerationFromStringsIsDisabledTest) {
    auto result = executor.execute("new Function('return 1')()", "", limits);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(JavaScriptExecutorTest, ForgedMessagesAreIgnoredTest) {
    // 用户代码无法得知会话令牌，伪造的结束消息会被丢弃
    auto result = executor.execute(R"(console.log('{"type":"complete","exitCode":0,"session":"guess"}'); console.log('real');)", "", limits);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "{\"type\":\"complete\",\"exitCode\":0,\"session\":\"guess\"}\nreal\n");
}

TEST_F(JavaScriptExecutorTest, StateIsNotSharedTest) {
    executor.execute("globalThis.counter = 41;", "", limits);
    auto result = executor.execute("console.log(typeof counter)", "", limits);
    EXPECT_EQ(result.output, "undefined\n");
}

TEST_F(JavaScriptExecutorTest, DeferredCallbacksTest) {
    auto result = executor.execute("setTimeout(() => console.log('later'), 10); console.log('now');", "", limits);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "now\nlater\n");

    result = executor.execute("const id = setTimeout(() => console.log('never'), 10); clearTimeout(id);", "", limits);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "");

    result = executor.execute("setTimeout(() => { throw new Error('async failure'); }, 0);", "", limits);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, string("async failure"));
}

TEST_F(JavaScriptExecutorTest, DeferredDelayIsClampedTest) {
    int saved = MAX_DEFERRED_DELAY_MS;
    MAX_DEFERRED_DELAY_MS = 200;
    defer { MAX_DEFERRED_DELAY_MS = saved; };

    auto result = executor.execute("setTimeout(() => console.log('late'), 100000);", "", limits);
    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.status, status::ACCEPTED);
    EXPECT_EQ(result.output, "late\n");
    EXPECT_LT(result.execution_time_ms, limits.timeout_ms);
}

TEST_F(JavaScriptExecutorTest, ResetTest) {
    executor.initialize();
    executor.reset();
    EXPECT_TRUE(executor.is_ready());
    auto result = executor.execute("console.log(2 * 21)", "", limits);
    EXPECT_EQ(result.output, "42\n");
}

TEST_F(JavaScriptExecutorTest, InvalidLimitsTest) {
    limits.timeout_ms = 0;
    EXPECT_THROW(executor.execute("console.log(1)", "", limits), invalid_argument);
}

TEST_F(JavaScriptExecutorTest, MissingNodeTest) {
    string saved = NODE_EXECUTABLE;
    NODE_EXECUTABLE = "/nonexistent/node";
    javascript_executor broken;
    EXPECT_THROW(broken.initialize(), runtime_unavailable);
    EXPECT_FALSE(broken.is_ready());
    NODE_EXECUTABLE = saved;
}
