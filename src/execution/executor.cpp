#include "execution/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

const char *OUTPUT_TRUNCATED_NOTICE = "\n[Output truncated]";

// 等待 ready 消息时检查取消请求的间隔
const auto READY_POLL_INTERVAL = chrono::milliseconds(100);

static execution_result system_error_result(const string &message) {
    execution_result result;
    result.success = false;
    result.error = message;
    result.exit_code = E_RUNTIME_ERROR;
    result.status = status::SYSTEM_ERROR;
    return result;
}

bool sandboxed_executor::is_ready() const {
    return current_state == executor_state::READY;
}

executor_state sandboxed_executor::state() const {
    return current_state;
}

void sandboxed_executor::initialize() {
    lock_guard<mutex> guard(execution_mutex);
    if (current_state == executor_state::READY) return;
    do_initialize();
    current_state = executor_state::READY;
}

execution_result sandboxed_executor::execute(const string &code, const string &input, const execution_limits &limits) {
    if (!limits.valid())
        throw invalid_argument(fmt::format("execution limits must be positive, got timeout {}ms, memory {} bytes, output {} chars",
                                           limits.timeout_ms, limits.memory_bytes, limits.max_output_chars));

    lock_guard<mutex> guard(execution_mutex);
    if (current_state != executor_state::READY) {
        do_initialize();
        current_state = executor_state::READY;
    }

    current_state = executor_state::EXECUTING;
    defer { current_state = executor_state::READY; };

    try {
        sandbox_session &session = prepare_context(limits);
        nlohmann::json request = {
            {"type", "execute"},
            {"code", code},
            {"input", input},
            {"memoryBytes", limits.memory_bytes}};
        bool reusable = false;
        execution_result result = run(session, request, limits, reusable);
        release_context(reusable);
        return result;
    } catch (const runtime_unavailable &ex) {
        LOG(ERROR) << "[" << language() << "] execution environment lost: " << ex.what();
        release_context(false);
        return system_error_result(ex.what());
    } catch (const internal_error &ex) {
        LOG(ERROR) << "[" << language() << "] sandbox protocol failure: " << ex.what();
        release_context(false);
        return system_error_result(ex.what());
    }
}

void sandboxed_executor::reset() {
    lock_guard<mutex> guard(execution_mutex);
    if (current_state != executor_state::READY) return;
    do_reset();
}

void sandboxed_executor::dispose() {
    lock_guard<mutex> guard(execution_mutex);
    if (current_state == executor_state::DISPOSED) return;
    do_dispose();
    current_state = executor_state::DISPOSED;
}

execution_result sandboxed_executor::run(sandbox_session &session, const nlohmann::json &request, const execution_limits &limits, bool &reusable) {
    execution_result result;
    elapsed_time timer;
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(limits.timeout_ms);

    string output, errors;
    size_t output_chars = 0, error_chars = 0;
    reusable = false;

    auto truncated = [&] {
        int64_t memory = session.peak_memory_bytes();
        session.terminate();
        result.success = true;
        result.output = utf8_truncate(output, limits.max_output_chars) + OUTPUT_TRUNCATED_NOTICE;
        result.exit_code = E_SUCCESS;
        result.execution_time_ms = timer.duration<chrono::milliseconds>().count();
        result.memory_used_bytes = memory;
        result.status = status::OUTPUT_LIMIT_EXCEEDED;
        return result;
    };

    session.send(request);

    while (true) {
        nlohmann::json message;
        auto wait = session.next_message(message, deadline);

        if (wait == sandbox_session::wait_status::TIMEOUT) {
            session.terminate();
            result.success = false;
            result.output = output;
            result.error = fmt::format("Execution timed out after {:g} seconds. Your code might have an infinite loop.", limits.timeout_ms / 1000.0);
            result.exit_code = E_TIMEOUT;
            result.execution_time_ms = limits.timeout_ms;
            result.memory_used_bytes = 0;
            result.status = status::TIME_LIMIT_EXCEEDED;
            return result;
        }

        if (wait == sandbox_session::wait_status::CLOSED) {
            int64_t memory = session.peak_memory_bytes();
            string diagnostics = session.take_diagnostics();
            session.terminate();
            LOG(WARNING) << "[" << language() << "] sandbox exited without reporting a result, wait status "
                         << session.exit_status() << ": " << diagnostics;

            auto classified = classify_abnormal_exit(diagnostics, limits.memory_bytes);
            result.success = false;
            result.output = output;
            result.error = classified.message;
            result.exit_code = E_RUNTIME_ERROR;
            result.execution_time_ms = timer.duration<chrono::milliseconds>().count();
            result.memory_used_bytes = memory;
            result.status = classified.kind;
            return result;
        }

        // 一次输出的内容过长，已经无法完整接收，按输出超限处理
        if (wait == sandbox_session::wait_status::OVERSIZED) {
            LOG(WARNING) << "[" << language() << "] sandbox output message is too long, treated as output limit exceeded";
            return truncated();
        }

        string type = nlohmann::get_value_def<string>(message, "", "type");
        if (type == "stdout") {
            string data = nlohmann::get_value_def<string>(message, "", "data");
            output += data;
            output_chars += utf8_length(data);
            if (output_chars > (size_t)limits.max_output_chars)
                return truncated();
        } else if (type == "stderr") {
            // stderr 只用于展示，超出限制后丢弃剩余部分
            if (error_chars <= (size_t)limits.max_output_chars) {
                string data = nlohmann::get_value_def<string>(message, "", "data");
                errors += data;
                error_chars += utf8_length(data);
                if (error_chars > (size_t)limits.max_output_chars)
                    errors = utf8_truncate(errors, limits.max_output_chars) + OUTPUT_TRUNCATED_NOTICE;
            }
        } else if (type == "complete") {
            int exit_code = nlohmann::get_value_def<int>(message, E_SUCCESS, "exitCode");
            result.success = exit_code == E_SUCCESS;
            result.output = output;
            if (!errors.empty())
                result.error = errors;
            else if (exit_code != E_SUCCESS)
                result.error = fmt::format("Process exited with code {}", exit_code);
            result.exit_code = exit_code;
            result.execution_time_ms = timer.duration<chrono::milliseconds>().count();
            result.memory_used_bytes = nlohmann::get_value_def<int64_t>(message, session.peak_memory_bytes(), "memoryBytes");
            result.status = result.success ? status::ACCEPTED : status::RUNTIME_ERROR;
            reusable = session.running();
            return result;
        } else if (type == "error") {
            auto classified = classify(nlohmann::get_value_def<string>(message, "", "data"),
                                       nlohmann::get_value_def<string>(message, "", "stack"));
            result.success = false;
            result.output = output;
            result.error = classified.message;
            result.exit_code = E_RUNTIME_ERROR;
            result.execution_time_ms = timer.duration<chrono::milliseconds>().count();
            result.memory_used_bytes = nlohmann::get_value_def<int64_t>(message, session.peak_memory_bytes(), "memoryBytes");
            result.status = classified.kind;
            reusable = session.running();
            return result;
        } else {
            DLOG(INFO) << "[" << language() << "] ignoring sandbox message of type '" << type << "'";
        }
    }
}

sandbox_session::wait_status wait_for_ready(sandbox_session &session, chrono::steady_clock::time_point deadline, const function<void()> &check) {
    while (true) {
        if (check) check();
        auto slice = min(deadline, chrono::steady_clock::now() + READY_POLL_INTERVAL);
        nlohmann::json message;
        auto wait = session.next_message(message, slice);
        if (wait == sandbox_session::wait_status::CLOSED) return wait;
        if (wait == sandbox_session::wait_status::OVERSIZED) continue;
        if (wait == sandbox_session::wait_status::TIMEOUT) {
            if (chrono::steady_clock::now() >= deadline) return wait;
            continue;
        }
        if (nlohmann::get_value_def<string>(message, "", "type") == "ready")
            return sandbox_session::wait_status::MESSAGE;
        DLOG(INFO) << "ignoring sandbox message before ready: " << message.dump();
    }
}

}  // namespace grader
