#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "execution/executor.hpp"

namespace grader {

typedef std::function<std::unique_ptr<code_executor>()> executor_factory;

struct executor_pool;

/**
 * @brief 对某种语言执行器的独占使用权
 * 持有期间其他线程无法获得同一语言的执行器
 */
struct executor_lease {
    executor_lease(executor_lease &&) = default;

    code_executor &operator*() const;
    code_executor *operator->() const;

private:
    friend struct executor_pool;
    executor_lease(code_executor &executor, std::unique_lock<std::mutex> lock);

    code_executor *executor;
    std::unique_lock<std::mutex> lock;
};

/**
 * @brief 每种语言一个执行器的池
 * 执行器在第一次被借出时通过注册的工厂函数创建，池析构时统一 dispose()。
 */
struct executor_pool {
    executor_pool() = default;
    executor_pool(const executor_pool &) = delete;
    executor_pool &operator=(const executor_pool &) = delete;
    ~executor_pool();

    /**
     * @brief 注册一种语言的执行器工厂，已经注册过的语言会被覆盖
     */
    void register_language(const std::string &language, executor_factory factory);

    bool supports(const std::string &language) const;

    std::vector<std::string> languages() const;

    /**
     * @brief 借出某种语言的执行器，该语言的执行器正在被使用时阻塞
     * @throw std::invalid_argument 如果语言没有注册
     */
    executor_lease acquire(const std::string &language);

    /**
     * @brief 释放所有已经创建的执行器
     */
    void dispose_all();

private:
    struct slot {
        executor_factory factory;
        std::unique_ptr<code_executor> executor;
        std::mutex usage;
    };

    mutable std::mutex slots_mutex;
    std::map<std::string, std::unique_ptr<slot>> slots;
};

/**
 * @brief 注册了 javascript 和 python 两种语言的默认执行器池
 * Python 运行时包在第一次使用 Python 执行器时读取
 */
void register_default_languages(executor_pool &pool);

}  // namespace grader
