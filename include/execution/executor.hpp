#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include "execution/error_classifier.hpp"
#include "execution/types.hpp"
#include "sandbox/session.hpp"

namespace grader {

/**
 * @brief 执行器的状态
 * UNINITIALIZED -> READY -> EXECUTING -> READY（循环）或者 DISPOSED
 */
enum class executor_state {
    UNINITIALIZED,
    READY,
    EXECUTING,
    DISPOSED
};

/**
 * @brief 表示一种语言的代码执行器
 * 每种语言在一个执行器池中只有一个实例，execute() 不能并发执行
 */
struct code_executor {
    virtual ~code_executor() = default;

    /**
     * @brief 执行器负责哪种语言
     * 目前可以为：javascript, python
     */
    virtual std::string language() const = 0;

    virtual bool is_ready() const = 0;

    /**
     * @brief 准备执行环境
     * 幂等，已经就绪时直接返回。
     * @throw runtime_unavailable 如果执行环境无法就绪
     */
    virtual void initialize() = 0;

    /**
     * @brief 在隔离的执行环境中运行一段代码
     * 执行期的所有错误（超时、运行时错误、访问被禁止的能力）都记录在返回值中而不会抛出，
     * 返回时执行器总是回到 READY 状态。执行器还没有就绪时会先调用 initialize()。
     * @param code 用户代码
     * @param input 标准输入
     * @param limits 资源限制，三个值都必须为正数
     * @throw runtime_unavailable 如果执行器还没有就绪且无法就绪
     */
    virtual execution_result execute(const std::string &code, const std::string &input, const execution_limits &limits) = 0;

    /**
     * @brief 丢弃当前的执行环境并重新创建，不运行任何代码
     */
    virtual void reset() = 0;

    /**
     * @brief 释放所有资源，之后需要重新 initialize()
     */
    virtual void dispose() = 0;
};

/**
 * @brief 在 runguard 沙箱进程中执行代码的执行器的公共实现
 * 负责状态机、互斥，以及与沙箱进程之间的一次执行的消息循环。
 * 子类负责创建沙箱进程并决定执行结束后是否保留它。
 */
struct sandboxed_executor : public code_executor {
    bool is_ready() const override;
    void initialize() override;
    execution_result execute(const std::string &code, const std::string &input, const execution_limits &limits) override;
    void reset() override;
    void dispose() override;

    executor_state state() const;

protected:
    /**
     * @brief 准备执行环境，调用时已经持有锁
     * @throw runtime_unavailable
     */
    virtual void do_initialize() = 0;

    /**
     * @brief 返回一个可以执行代码的沙箱会话，必要时重新创建
     * @throw runtime_unavailable
     */
    virtual sandbox_session &prepare_context(const execution_limits &limits) = 0;

    /**
     * @brief 一次执行结束后调用
     * @param reusable 会话是否仍然存活且遵守协议，为假时会话已经被终止
     */
    virtual void release_context(bool reusable) = 0;

    virtual void do_reset() = 0;
    virtual void do_dispose() = 0;

    virtual classified_error classify(const std::string &message, const std::string &stack) const = 0;

    /**
     * @brief 发送执行请求并等待结果
     * 完成、错误、输出超限、超时、进程退出中最先发生的一个决定结果，之后的消息不再处理。
     */
    execution_result run(sandbox_session &session, const nlohmann::json &request, const execution_limits &limits, bool &reusable);

    std::mutex execution_mutex;

private:
    std::atomic<executor_state> current_state{executor_state::UNINITIALIZED};
};

/**
 * @brief 等待沙箱进程发送 ready 消息
 * @param session 已经启动的会话
 * @param deadline 最晚等待到的时间点
 * @param check 每隔 100ms 调用一次，可以通过抛出异常中断等待
 */
sandbox_session::wait_status wait_for_ready(sandbox_session &session, std::chrono::steady_clock::time_point deadline,
                                            const std::function<void()> &check = {});

}  // namespace grader
