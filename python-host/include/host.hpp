#pragma once

#include <boost/python.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <set>
#include <string>

namespace grader {

struct python_host;

/**
 * @brief 替换 sys.stdout 和 sys.stderr 的对象
 * 按行将用户程序的输出转发为 stdout/stderr 消息
 */
struct stream_proxy {
    stream_proxy(python_host &host, std::string stream);

    long write(const std::string &text);
    void flush();
    bool isatty() const;
    bool writable() const;

private:
    python_host &host;
    std::string stream;
    std::string buffer;
};

/**
 * @brief 内嵌 CPython 的沙箱宿主
 *
 * 请求从 request_fd 读取，响应写入 protocol_fd，每行一个 JSON 消息。
 * 原来的标准输入输出被重定向到 /dev/null，用户代码无法读写消息通道。
 *
 * 支持的请求：
 * 1. hello: 第一个请求，携带会话令牌，回复 ready
 * 2. execute: 在新的 __main__ 模块中运行代码，回复若干 stdout/stderr 以及 complete 或 error
 * 3. reset: 卸载用户代码导入的模块，回复 ready
 * 4. shutdown: 退出
 */
struct python_host {
    python_host(int request_fd, int protocol_fd);
    ~python_host();

    /**
     * @brief 运行 prelude.py 并记录运行时自带的模块
     * @throw boost::python::error_already_set
     */
    void prepare(const std::filesystem::path &runtime_dir);

    /**
     * @brief 处理请求直到收到 shutdown 或者请求通道关闭
     * @return 进程退出码
     */
    int serve();

    void send(nlohmann::json message);

private:
    bool read_request(nlohmann::json &request);
    void execute(const nlohmann::json &request);
    void reset();

    /**
     * @brief 取出当前的 Python 异常并发送 error 消息
     */
    void report_exception();

    /**
     * @brief 取出当前的 SystemExit 异常并计算退出码
     */
    int system_exit_code();

    /**
     * @brief 宿主进程的内存使用峰值（ru_maxrss）
     */
    int64_t peak_memory_bytes() const;

    FILE *requests = nullptr;
    int protocol_fd;
    std::string session;
    std::set<std::string> runtime_modules;
    boost::python::object original_main;
    stream_proxy out, err;
};

}  // namespace grader

extern "C" PyObject *PyInit_grader_host();
