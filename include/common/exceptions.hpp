#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测引擎的内部错误
 * 一般是沙箱进程没有按照协议通信，或者 runguard 无法启动
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示执行环境无法就绪
 * 运行时加载失败、内存不足、沙箱启动超时都会抛出该异常。
 * 这是唯一会传递给调用方的执行期错误，调用方可以再次调用 initialize() 重试。
 */
struct runtime_unavailable : public grader_exception {
    runtime_unavailable();
    explicit runtime_unavailable(const std::string &message);
};

/**
 * @brief 运行时加载被调用方取消
 */
struct load_cancelled : public runtime_unavailable {
    load_cancelled();
};

}  // namespace grader
