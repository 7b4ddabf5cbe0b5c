#pragma once

#include <filesystem>

namespace grader {

enum error_codes {
    E_SUCCESS = 0,
    E_RUNTIME_ERROR = 1,
    E_INTERNAL_ERROR = 2,

    /**
     * @brief 超时，与 coreutils timeout 的约定一致
     */
    E_TIMEOUT = 124,

    /**
     * @brief runguard 无法建立沙箱（比如 seccomp 过滤器加载失败）
     */
    E_SANDBOX_SETUP = 125
};

/**
 * @brief 存放沙箱引导脚本和运行时包的路径，为项目根目录下的 exec 文件夹
 * @defaultValue 假设程序运行在项目根目录下的 bin 文件夹，因此 exec 文件夹在 ../exec
 *
 * EXEC_DIR
 * ├── javascript
 * │   └── bootstrap.js // node 沙箱的引导脚本，负责建立 vm 上下文和消息通道
 * └── python // Python 运行时包，首次使用时安装到 CACHE_DIR
 *     └── prelude.py
 */
extern std::filesystem::path EXEC_DIR;

/**
 * @brief 运行时缓存目录
 *
 * CACHE_DIR
 * └── runtimes
 *     ├── .lock
 *     └── python-3 // 运行时名称-版本
 *         ├── .installed // 安装完成标记
 *         └── prelude.py
 */
extern std::filesystem::path CACHE_DIR;

/**
 * @brief runguard 可执行文件路径
 * 所有沙箱进程都通过 runguard 启动，runguard 设置资源限制和 seccomp 过滤器后再 exec 目标程序
 */
extern std::filesystem::path RUNGUARD;

/**
 * @brief 内嵌 CPython 的沙箱宿主程序路径
 */
extern std::filesystem::path PYTHON_HOST;

/**
 * @brief node 可执行文件，可以是绝对路径或者在 PATH 中查找的程序名
 */
extern std::string NODE_EXECUTABLE;

/**
 * @brief 轻量沙箱启动的最长等待时间（毫秒），超时后 initialize() 失败
 */
extern int SANDBOX_INIT_TIMEOUT_MS;

/**
 * @brief 运行时从启动到就绪的最长等待时间（毫秒）
 */
extern int RUNTIME_LOAD_TIMEOUT_MS;

/**
 * @brief 用户代码中 setTimeout 允许的最长延迟（毫秒）
 */
extern int MAX_DEFERRED_DELAY_MS;

/**
 * @brief 沙箱消息通道中单条消息的最大字节数
 */
extern size_t MAX_MESSAGE_SIZE;

/**
 * @brief 可用内存低于该值（GB）时拒绝加载运行时
 */
extern double MEMORY_CRITICAL_GB;

/**
 * @brief 可用内存低于该值（GB）时给出警告
 */
extern double MEMORY_LOW_GB;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，沙箱进程的 stderr 诊断信息将全部写入日志
 */
extern bool DEBUG;

}  // namespace grader
