#include "execution/executor_pool.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <stdexcept>
#include "execution/javascript_executor.hpp"
#include "execution/python_executor.hpp"

namespace grader {
using namespace std;

executor_lease::executor_lease(code_executor &executor, unique_lock<mutex> lock)
    : executor(&executor), lock(move(lock)) {}

code_executor &executor_lease::operator*() const {
    return *executor;
}

code_executor *executor_lease::operator->() const {
    return executor;
}

executor_pool::~executor_pool() {
    dispose_all();
}

void executor_pool::register_language(const string &language, executor_factory factory) {
    lock_guard<mutex> guard(slots_mutex);
    auto &entry = slots[language];
    if (!entry) entry = make_unique<slot>();
    lock_guard<mutex> usage(entry->usage);
    entry->factory = move(factory);
    entry->executor.reset();
}

bool executor_pool::supports(const string &language) const {
    lock_guard<mutex> guard(slots_mutex);
    return slots.count(language) > 0;
}

vector<string> executor_pool::languages() const {
    lock_guard<mutex> guard(slots_mutex);
    vector<string> result;
    for (auto &[language, entry] : slots) result.push_back(language);
    return result;
}

executor_lease executor_pool::acquire(const string &language) {
    slot *entry;
    {
        lock_guard<mutex> guard(slots_mutex);
        auto it = slots.find(language);
        if (it == slots.end())
            throw invalid_argument(fmt::format("Unsupported language: {}", language));
        entry = it->second.get();
    }

    unique_lock<mutex> usage(entry->usage);
    if (!entry->executor) {
        entry->executor = entry->factory();
        if (!entry->executor)
            throw invalid_argument(fmt::format("Unsupported language: {}", language));
        LOG(INFO) << "created executor for " << language;
    }
    return executor_lease(*entry->executor, move(usage));
}

void executor_pool::dispose_all() {
    lock_guard<mutex> guard(slots_mutex);
    for (auto &[language, entry] : slots) {
        lock_guard<mutex> usage(entry->usage);
        if (entry->executor) entry->executor->dispose();
    }
}

void register_default_languages(executor_pool &pool) {
    pool.register_language("javascript", [] {
        return make_unique<javascript_executor>();
    });
    pool.register_language("python", [] {
        return make_unique<python_executor>(load_python_package());
    });
}

}  // namespace grader
