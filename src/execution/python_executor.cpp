#include "execution/python_executor.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

python_executor::python_executor(runtime_package package, isolation_policy policy, memory_probe probe)
    : loader(move(package), move(probe)), isolation(policy) {}

string python_executor::language() const {
    return "python";
}

void python_executor::set_progress_callback(progress_callback callback) {
    lock_guard<mutex> guard(callback_mutex);
    on_progress = move(callback);
}

void python_executor::cancel_loading() {
    cancellation.cancel();
}

isolation_policy python_executor::policy() const {
    return isolation;
}

void python_executor::do_initialize() {
    if (host && host->running()) return;
    host.reset();

    progress_callback callback;
    {
        lock_guard<mutex> guard(callback_mutex);
        callback = on_progress;
    }

    cancellation.reset();
    // 加载成功之前不修改执行器的状态
    auto session = loader.load(callback, cancellation);
    host = move(session);
}

sandbox_session &python_executor::prepare_context(const execution_limits &) {
    // 上一次执行超时后进程已经被终止，从缓存重新加载
    if (!host || !host->running()) do_initialize();
    return *host;
}

void python_executor::release_context(bool reusable) {
    if (!reusable || isolation == isolation_policy::RESTART_PER_RUN)
        host.reset();
}

void python_executor::do_reset() {
    if (!host) return;
    if (isolation == isolation_policy::RESTART_PER_RUN) {
        host.reset();
        return;
    }

    try {
        host->send({{"type", "reset"}});
        auto deadline = chrono::steady_clock::now() + chrono::milliseconds(SANDBOX_INIT_TIMEOUT_MS);
        if (wait_for_ready(*host, deadline) == sandbox_session::wait_status::MESSAGE) return;
        LOG(WARNING) << "python host did not acknowledge reset: " << host->take_diagnostics();
    } catch (const internal_error &ex) {
        LOG(WARNING) << "unable to reset python host: " << ex.what();
    }
    // 下一次执行时重新加载
    host.reset();
}

void python_executor::do_dispose() {
    if (host && host->running()) {
        try {
            host->send({{"type", "shutdown"}});
        } catch (const internal_error &ex) {
            DLOG(INFO) << "python host already gone: " << ex.what();
        }
    }
    host.reset();
}

classified_error python_executor::classify(const string &message, const string &stack) const {
    return classify_python_error(message, stack);
}

}  // namespace grader
