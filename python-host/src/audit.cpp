#include "audit.hpp"
#include <Python.h>
#include <fcntl.h>
#include <cstring>
#include <string>

namespace grader {
using namespace std;

const char *EXERCISE_FILENAME = "<exercise>";

static bool audit_armed = false;

struct denied_event {
    const char *prefix;
    const char *capability;
};

// 前缀匹配，以 "." 结尾的前缀匹配整个事件族
static const denied_event denied_events[] = {
    {"socket.", "socket"},
    {"urllib.Request", "urllib"},
    {"http.client.", "http.client"},
    {"subprocess.Popen", "subprocess"},
    {"os.system", "os.system"},
    {"os.exec", "os.exec"},
    {"os.spawn", "os.spawn"},
    {"os.posix_spawn", "os.posix_spawn"},
    {"os.fork", "os.fork"},
    {"os.forkpty", "os.fork"},
    {"os.kill", "os.kill"},
    {"os.killpg", "os.kill"},
    {"pty.spawn", "pty"},
    {"ctypes.", "ctypes"},
    {"sqlite3.", "sqlite3"},
    {"webbrowser.open", "webbrowser"},
};

static const char *denied_modules[] = {
    "socket", "_socket", "ssl", "_ssl", "subprocess", "_posixsubprocess", "multiprocessing",
    "ctypes", "_ctypes", "sqlite3", "_sqlite3", "webbrowser", "urllib.request", "http.client"};

static bool starts_with(const char *text, const char *prefix) {
    return strncmp(text, prefix, strlen(prefix)) == 0;
}

static int deny(const char *capability) {
    PyErr_Format(PyExc_PermissionError, "%s is not available in the sandbox", capability);
    return -1;
}

/**
 * @brief 当前的 Python 帧是否属于用户代码
 * builtins.exec 等 C 函数没有自己的帧，因此当前帧就是调用者
 */
static bool called_from_exercise() {
    PyFrameObject *frame = PyEval_GetFrame();
    if (!frame) return false;
    PyCodeObject *code = PyFrame_GetCode(frame);
    const char *filename = PyUnicode_AsUTF8(code->co_filename);
    bool result = filename && strcmp(filename, EXERCISE_FILENAME) == 0;
    Py_DECREF(code);
    if (!filename) PyErr_Clear();
    return result;
}

static bool is_write_mode(PyObject *mode, PyObject *flags) {
    if (mode && PyUnicode_Check(mode)) {
        const char *text = PyUnicode_AsUTF8(mode);
        if (!text) {
            PyErr_Clear();
            return true;
        }
        return strpbrk(text, "wax+") != nullptr;
    }
    if (flags && PyLong_Check(flags)) {
        long value = PyLong_AsLong(flags);
        return (value & (O_WRONLY | O_RDWR | O_CREAT | O_APPEND | O_TRUNC)) != 0;
    }
    return false;
}

static bool is_proc_path(PyObject *path) {
    PyObject *encoded = nullptr;
    if (!PyUnicode_FSConverter(path, &encoded)) {
        PyErr_Clear();
        return false;
    }
    string value = PyBytes_AsString(encoded);
    Py_DECREF(encoded);
    return value == "/proc" || starts_with(value.c_str(), "/proc/");
}

static int audit_hook(const char *event, PyObject *args, void *) {
    if (!audit_armed) return 0;

    for (auto &rule : denied_events)
        if (starts_with(event, rule.prefix))
            return deny(rule.capability);

    if (strcmp(event, "open") == 0 && PyTuple_Check(args) && PyTuple_GET_SIZE(args) >= 3) {
        PyObject *path = PyTuple_GET_ITEM(args, 0);
        if (is_write_mode(PyTuple_GET_ITEM(args, 1), PyTuple_GET_ITEM(args, 2)))
            return deny("open");
        if (PyLong_Check(path)) return 0;  // os.fdopen
        if (is_proc_path(path))
            return deny("open");
        return 0;
    }

    if (strcmp(event, "import") == 0 && PyTuple_Check(args) && PyTuple_GET_SIZE(args) >= 1) {
        const char *name = PyUnicode_Check(PyTuple_GET_ITEM(args, 0)) ? PyUnicode_AsUTF8(PyTuple_GET_ITEM(args, 0)) : nullptr;
        if (!name) {
            PyErr_Clear();
            return 0;
        }
        for (const char *module : denied_modules)
            if (strcmp(name, module) == 0)
                return deny(module);
        return 0;
    }

    // 标准库（比如 collections.namedtuple）内部会调用 exec，只拒绝用户代码自己的调用
    if ((strcmp(event, "exec") == 0 || strcmp(event, "compile") == 0) && called_from_exercise())
        return deny("exec");

    return 0;
}

bool install_audit_hook() {
    return PySys_AddAuditHook(audit_hook, nullptr) == 0;
}

void set_audit_armed(bool armed) {
    audit_armed = armed;
}

}  // namespace grader
