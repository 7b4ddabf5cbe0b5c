#include "execution/javascript_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <cmath>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

// V8 的堆大小下限，更小的值会导致 node 无法启动
const int64_t MIN_HEAP_MB = 16;

string javascript_executor::language() const {
    return "javascript";
}

unique_ptr<sandbox_session> javascript_executor::spawn(const execution_limits &limits) {
    sandbox_command command;
    int64_t heap_mb = max(MIN_HEAP_MB, limits.memory_bytes / (1024 * 1024));
    command.argv = {NODE_EXECUTABLE,
                    "--disallow-code-generation-from-strings",
                    fmt::format("--max-old-space-size={}", heap_mb),
                    (EXEC_DIR / "javascript" / "bootstrap.js").string()};
    command.env = {fmt::format("GRADER_MAX_DEFERRED_DELAY_MS={}", MAX_DEFERRED_DELAY_MS)};
    command.work_dir = EXEC_DIR / "javascript";
    // V8 为堆保留大量虚拟地址空间，不能限制 RLIMIT_AS，内存由 --max-old-space-size 限制。
    // V8 的 GC 线程会让 CPU 时间超过墙钟时间，因此 CPU 时间的兜底限制放宽一倍
    command.cpu_time = ceil(limits.timeout_ms / 1000.0) * 2 + 1;

    auto session = make_unique<sandbox_session>(move(command));
    try {
        session->start();
    } catch (const internal_error &ex) {
        throw runtime_unavailable(fmt::format("Unable to start JavaScript sandbox: {}", ex.what()));
    }

    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(SANDBOX_INIT_TIMEOUT_MS);
    switch (wait_for_ready(*session, deadline)) {
        case sandbox_session::wait_status::MESSAGE:
            return session;
        case sandbox_session::wait_status::TIMEOUT:
            session->terminate();
            throw runtime_unavailable("Sandbox initialization timed out");
        case sandbox_session::wait_status::CLOSED:
        default: {
            string diagnostics = session->take_diagnostics();
            session->terminate();
            LOG(ERROR) << "JavaScript sandbox exited during startup: " << diagnostics;
            throw runtime_unavailable(fmt::format("Sandbox failed to start: {}", diagnostics));
        }
    }
}

void javascript_executor::do_initialize() {
    if (context) return;
    context_limits = DEFAULT_EXECUTION_LIMITS;
    context = spawn(context_limits);
    LOG(INFO) << "JavaScript sandbox ready";
}

sandbox_session &javascript_executor::prepare_context(const execution_limits &limits) {
    if (!context || !context->running() ||
        context_limits.memory_bytes != limits.memory_bytes || context_limits.timeout_ms != limits.timeout_ms) {
        context.reset();
        context_limits = limits;
        context = spawn(limits);
    }
    return *context;
}

void javascript_executor::release_context(bool) {
    // 执行过代码的上下文不再复用
    context.reset();
}

void javascript_executor::do_reset() {
    context.reset();
    context = spawn(context_limits);
}

void javascript_executor::do_dispose() {
    context.reset();
}

classified_error javascript_executor::classify(const string &message, const string &stack) const {
    return classify_javascript_error(message, stack);
}

}  // namespace grader
