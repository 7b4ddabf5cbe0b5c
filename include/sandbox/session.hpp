#pragma once

#include <sys/types.h>
#include <chrono>
#include <deque>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "config.hpp"

namespace grader {

/**
 * @brief 描述如何通过 runguard 启动一个沙箱进程
 */
struct sandbox_command {
    /**
     * @brief 要执行的程序及其参数，argv[0] 会在 PATH 中查找
     */
    std::vector<std::string> argv;

    /**
     * @brief 沙箱进程的环境变量（KEY=VALUE），除 PATH 外不继承宿主的环境变量
     */
    std::vector<std::string> env;

    /**
     * @brief 沙箱进程的工作目录，为空时不改变
     */
    std::filesystem::path work_dir;

    /**
     * @brief CPU 时间的兜底限制（秒），0 表示不限制
     * 墙钟时间由宿主计时器保证，这里只防止宿主异常退出后进程一直占用 CPU
     */
    double cpu_time = 0;

    /**
     * @brief 地址空间限制（字节），-1 表示不限制
     */
    int64_t memory_limit = -1;

    /**
     * @brief 是否加载 seccomp 过滤器
     */
    bool seccomp = true;

    /**
     * @brief 是否尝试隔离网络、IPC、UTS 命名空间
     */
    bool isolate_namespaces = true;

    /**
     * @brief 单条消息的最大字节数，超出后该消息被丢弃并报告 OVERSIZED
     */
    size_t max_message_size = MAX_MESSAGE_SIZE;
};

/**
 * @brief 一个运行在 runguard 中的沙箱进程，以及与之通信的消息通道
 * 通道为沙箱进程的 stdin（请求）和 stdout（每行一个 JSON 消息），
 * stderr 作为诊断信息单独收集。
 *
 * 每个会话生成一个随机令牌，请求和响应都携带该令牌，
 * 令牌不匹配的消息（比如用户代码直接写 stdout 伪造的消息）会被丢弃。
 *
 * 会话只能被一个线程使用。
 */
struct sandbox_session {
    enum class wait_status {
        /**
         * @brief 收到一条消息
         */
        MESSAGE,

        /**
         * @brief 超过了截止时间
         */
        TIMEOUT,

        /**
         * @brief 沙箱进程关闭了 stdout，一般是进程已经退出
         */
        CLOSED,

        /**
         * @brief 沙箱进程写出了一条超过 max_message_size 仍没有结束的消息
         * 该消息被丢弃，在消息序列中的位置保持不变
         */
        OVERSIZED
    };

    explicit sandbox_session(sandbox_command command);
    ~sandbox_session();

    sandbox_session(const sandbox_session &) = delete;
    sandbox_session &operator=(const sandbox_session &) = delete;

    /**
     * @brief 启动沙箱进程，并发送携带会话令牌的 hello 请求
     * 沙箱进程收到 hello 后回复 ready
     * @throw internal_error 如果无法创建管道或 fork
     */
    void start();

    const std::string &token() const;

    /**
     * @brief 发送一条请求，请求会被附加会话令牌
     * @throw internal_error 如果沙箱进程已经关闭了 stdin
     */
    void send(nlohmann::json request);

    /**
     * @brief 等待下一条消息
     * @param message 收到的消息
     * @param deadline 最晚等待到的时间点
     */
    wait_status next_message(nlohmann::json &message, std::chrono::steady_clock::time_point deadline);

    /**
     * @brief 取出目前收集到的 stderr 诊断信息
     */
    std::string take_diagnostics();

    /**
     * @brief 沙箱进程是否还没有被回收
     */
    bool running() const;

    /**
     * @brief 读取沙箱进程的内存使用峰值（VmHWM）
     * @return 字节数，进程已经退出或者无法读取时返回 0
     */
    int64_t peak_memory_bytes() const;

    /**
     * @brief 强制终止沙箱进程
     * 先发送 SIGTERM，等待 0.1s 后对整个进程组发送 SIGKILL，并回收进程。
     */
    void terminate();

    /**
     * @brief 沙箱进程的 wait 状态，进程还没有被回收时为 -1
     */
    int exit_status() const;

private:
    void pump(int timeout_ms);
    void consume_stdout(const char *data, size_t size);
    void close_fd(int &fd);
    void reap(bool block);

    sandbox_command command;
    std::string session_token;
    pid_t child_pid = -1;
    int status = -1;
    int stdin_fd = -1, stdout_fd = -1, stderr_fd = -1;
    std::string line_buffer;
    bool skipping_line = false;
    std::string diagnostics;
    // 超长消息在队列中用 null 占位
    std::deque<nlohmann::json> messages;
};

}  // namespace grader
