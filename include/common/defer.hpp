#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域结束时执行给定的代码块
 * @code{.cpp}
 *     state = executor_state::EXECUTING;
 *     defer { state = executor_state::READY; };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = grader::scoped_guard() + [&]

namespace grader {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 放弃执行清理代码
     */
    void dismiss();
};

}  // namespace grader
