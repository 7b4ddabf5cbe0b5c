#pragma once

#include <memory>
#include <mutex>
#include "execution/executor.hpp"
#include "runtime/loader.hpp"

namespace grader {

/**
 * @brief Python 解释器在两次执行之间的隔离方式
 */
enum class isolation_policy {
    /**
     * @brief 复用同一个解释器进程，每次执行使用新的 __main__ 模块，
     * reset() 卸载用户代码导入的模块。全局状态（比如修改过的标准库模块）可能残留。
     */
    REUSE_INTERPRETER,

    /**
     * @brief 每次执行后都重新启动解释器进程，隔离最彻底，但每次执行都需要等待解释器启动
     */
    RESTART_PER_RUN
};

/**
 * @brief Python 执行器
 * 首次使用时通过 runtime_loader 安装并启动 python-host，之后一直复用该进程。
 * 超时或者输出超限时进程被终止，下一次执行时从缓存重新加载。
 */
struct python_executor : public sandboxed_executor {
    explicit python_executor(runtime_package package,
                             isolation_policy policy = isolation_policy::REUSE_INTERPRETER,
                             memory_probe probe = check_memory_pressure);

    std::string language() const override;

    /**
     * @brief 设置加载运行时的进度回调，在调用 initialize() 的线程中调用
     */
    void set_progress_callback(progress_callback callback);

    /**
     * @brief 取消正在进行的加载，可以在任意线程调用
     * 正在进行的 initialize() 抛出 load_cancelled
     */
    void cancel_loading();

    isolation_policy policy() const;

protected:
    void do_initialize() override;
    sandbox_session &prepare_context(const execution_limits &limits) override;
    void release_context(bool reusable) override;
    void do_reset() override;
    void do_dispose() override;
    classified_error classify(const std::string &message, const std::string &stack) const override;

private:
    runtime_loader loader;
    isolation_policy isolation;
    cancellation_token cancellation;

    std::mutex callback_mutex;
    progress_callback on_progress;

    std::unique_ptr<sandbox_session> host;
};

}  // namespace grader
