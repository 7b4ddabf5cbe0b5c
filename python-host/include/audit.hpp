#pragma once

namespace grader {

/**
 * @brief 用户代码编译时使用的文件名，出现在 traceback 中
 */
extern const char *EXERCISE_FILENAME;

/**
 * @brief 注册 CPython 审计钩子，必须在 Py_InitializeFromConfig 之前调用
 * 钩子只在用户代码运行期间（set_audit_armed(true) 之后）拒绝下列能力：
 * 网络（socket、urllib、http.client）、创建进程（subprocess、os.system、os.exec*、os.spawn*、
 * os.posix_spawn、os.fork）、向其他进程发送信号、ctypes、sqlite3、webbrowser、
 * 以写方式打开文件、访问 /proc，以及用户代码直接调用 exec/eval/compile。
 * 被拒绝的操作抛出 PermissionError("<name> is not available in the sandbox")。
 * @return 注册是否成功
 */
bool install_audit_hook();

void set_audit_armed(bool armed);

}  // namespace grader
