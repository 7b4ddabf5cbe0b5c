#pragma once

#include <memory>
#include "execution/executor.hpp"

namespace grader {

/**
 * @brief JavaScript 执行器
 * 每次执行都在一个新启动的 node 沙箱进程（runguard + bootstrap.js）中进行，
 * 执行结束后进程即被丢弃，因此两次执行之间不会共享任何状态。
 * initialize() 和 reset() 会预先启动一个空闲的进程以减少下一次执行的等待时间。
 */
struct javascript_executor : public sandboxed_executor {
    std::string language() const override;

protected:
    void do_initialize() override;
    sandbox_session &prepare_context(const execution_limits &limits) override;
    void release_context(bool reusable) override;
    void do_reset() override;
    void do_dispose() override;
    classified_error classify(const std::string &message, const std::string &stack) const override;

private:
    /**
     * @brief 启动一个 node 沙箱进程并等待其就绪
     * @throw runtime_unavailable 如果进程无法在 SANDBOX_INIT_TIMEOUT_MS 内就绪
     */
    std::unique_ptr<sandbox_session> spawn(const execution_limits &limits);

    std::unique_ptr<sandbox_session> context;

    /**
     * @brief 空闲进程启动时使用的资源限制，与本次执行不同时需要重新启动
     */
    execution_limits context_limits;
};

}  // namespace grader
