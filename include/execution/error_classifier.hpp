#pragma once

#include <cstdint>
#include <string>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 改写后的错误信息
 */
struct classified_error {
    /**
     * @brief 面向初学者的错误信息
     */
    std::string message;

    /**
     * @brief 错误对应的执行结果，一般为 RUNTIME_ERROR
     * 访问被禁止的能力时为 SANDBOX_VIOLATION，内存耗尽时为 MEMORY_LIMIT_EXCEEDED
     */
    status kind = status::RUNTIME_ERROR;
};

/**
 * @brief 将 JavaScript 的原始错误改写为面向初学者的信息
 * 按顺序匹配：未声明的标识符、调用非函数、访问 undefined 的属性、访问 null 的属性、
 * 意外的 token、代码不完整、访问沙箱禁止的能力。
 * 行号从调用栈中第一个 <anonymous>:行:列 标记提取，无法识别的错误原样返回。
 * @param message 错误的 message
 * @param stack 错误的调用栈，可以为空
 */
classified_error classify_javascript_error(const std::string &message, const std::string &stack);

/**
 * @brief 将 Python 的异常改写为面向初学者的信息
 * @param message 异常的类型和内容，比如 "NameError: name 'x' is not defined"
 * @param traceback 完整的 traceback 文本，可以为空
 */
classified_error classify_python_error(const std::string &message, const std::string &traceback);

/**
 * @brief 沙箱进程在没有发送结束消息的情况下退出时，根据其 stderr 诊断输出生成错误信息
 * @param diagnostics 沙箱进程的 stderr 输出
 * @param memory_bytes 本次执行的内存限制
 */
classified_error classify_abnormal_exit(const std::string &diagnostics, int64_t memory_bytes);

}  // namespace grader
