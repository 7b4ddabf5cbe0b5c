#pragma once

namespace grader {

/**
 * @brief 表示一次代码执行的结束原因
 *
 */
enum class status {
    /**
     * @brief 用户程序正常结束
     */
    ACCEPTED = 0,

    /**
     * @brief 用户程序出现未捕获的运行时错误
     * 包括语法错误、引用错误、类型错误，以及以非零退出码退出。
     */
    RUNTIME_ERROR = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * 宿主侧计时器先于完成消息到达，沙箱被强制终止，退出码为 124。
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序输出超出限制
     * 输出被截断并追加截断标记，该结果仍然视为执行成功。
     */
    OUTPUT_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序内存超限
     * 对于 JavaScript，V8 堆耗尽时进程崩溃；
     * 对于 Python，RLIMIT_AS 导致 MemoryError。
     */
    MEMORY_LIMIT_EXCEEDED = 4,

    /**
     * @brief 访问被禁止的能力
     * 比如网络、子进程、持久化存储、动态执行代码。
     * 执行失败，但执行器本身仍然可用。
     */
    SANDBOX_VIOLATION = 5,

    /**
     * @brief 内部错误
     * 比如 runguard 无法启动，或者沙箱进程违反通信协议。
     */
    SYSTEM_ERROR = 6
};

const char *get_display_message(status);

}  // namespace grader
