#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "execution/types.hpp"
#include "runtime/asset.hpp"
#include "runtime/memory.hpp"
#include "sandbox/session.hpp"

namespace grader {

/**
 * @brief 取消运行时加载的标记
 * cancel() 可以在任意线程调用，加载过程在每个阶段之间、每块数据复制之后
 * 以及等待解释器就绪时检查该标记。
 */
struct cancellation_token {
    void cancel();
    void reset();
    bool cancelled() const;

    /**
     * @throw load_cancelled 如果已经被取消
     */
    void throw_if_cancelled() const;

private:
    std::atomic<bool> flag{false};
};

typedef std::function<void(const runtime_load_progress &)> progress_callback;

/**
 * @brief 一个可以安装到缓存目录的运行时包
 */
struct runtime_package {
    std::string name;
    std::string version;
    std::vector<asset_ptr> assets;

    /**
     * @brief 运行时的安装目录 CACHE_DIR/runtimes/<name>-<version>
     */
    std::filesystem::path install_dir() const;

    uint64_t total_size() const;
};

/**
 * @brief 读取 EXEC_DIR/python/runtime.json 描述的 Python 运行时包
 * @code{.json}
 * {
 *     "name": "python",
 *     "version": "3.11-1",
 *     "files": ["prelude.py"]
 * }
 * @endcode
 * @throw runtime_unavailable 如果描述文件不存在或者格式错误
 */
runtime_package load_python_package();

/**
 * @brief 按需安装并启动 Python 运行时（python-host 进程）
 *
 * 阶段依次为：
 * 1. checking: 检查内存压力、磁盘空间，以及运行时是否已经安装在缓存目录中
 * 2. downloading: 运行时没有缓存时，将运行时包复制到临时目录，完成后原子地移动到安装目录
 * 3. loading: 启动 python-host 并等待其就绪
 * 4. ready
 * 任何阶段失败都会报告 error 阶段并抛出 runtime_unavailable。
 */
struct runtime_loader {
    explicit runtime_loader(runtime_package package, memory_probe probe = check_memory_pressure);

    /**
     * @brief 运行时是否已经完整地安装在缓存目录中
     */
    bool is_cached() const;

    /**
     * @brief 加载运行时
     * 被取消时会删除临时文件并终止已经启动的进程，不留下任何加载了一半的状态
     * @param on_progress 进度回调，可以为空
     * @param token 取消标记
     * @return 已经就绪的 python-host 会话
     * @throw runtime_unavailable 加载失败
     * @throw load_cancelled 加载被取消
     */
    std::unique_ptr<sandbox_session> load(const progress_callback &on_progress, const cancellation_token &token) const;

    const runtime_package &package() const;

private:
    void install(const progress_callback &on_progress, const cancellation_token &token) const;
    std::unique_ptr<sandbox_session> launch(const cancellation_token &token) const;

    runtime_package runtime;
    memory_probe probe;
};

}  // namespace grader
