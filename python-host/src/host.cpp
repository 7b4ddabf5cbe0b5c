#include "host.hpp"
#include <glog/logging.h>
#include <sys/resource.h>
#include <unistd.h>
#include <boost/python/stl_iterator.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <system_error>
#include <vector>
#include "audit.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
namespace bp = boost::python;

// stream_proxy 缓冲区超过这个大小时即使没有换行也立即发送
const size_t MAX_PENDING_OUTPUT = 4096;

BOOST_PYTHON_MODULE(grader_host) {
    bp::class_<stream_proxy, boost::noncopyable>("StreamProxy", bp::no_init)
        .def("write", &stream_proxy::write)
        .def("flush", &stream_proxy::flush)
        .def("isatty", &stream_proxy::isatty)
        .def("writable", &stream_proxy::writable);
}

stream_proxy::stream_proxy(python_host &host, string stream)
    : host(host), stream(move(stream)) {}

long stream_proxy::write(const string &text) {
    buffer += text;
    size_t newline = buffer.rfind('\n');
    if (newline != string::npos) {
        host.send({{"type", stream}, {"data", buffer.substr(0, newline + 1)}});
        buffer.erase(0, newline + 1);
    }
    if (buffer.size() > MAX_PENDING_OUTPUT) flush();
    return text.size();
}

void stream_proxy::flush() {
    if (buffer.empty()) return;
    host.send({{"type", stream}, {"data", buffer}});
    buffer.clear();
}

bool stream_proxy::isatty() const {
    return false;
}

bool stream_proxy::writable() const {
    return true;
}

/**
 * @brief 在作用域内将地址空间的软限制设为当前用量加上 bytes
 * 解释器本身的内存不计入用户程序的内存限制
 */
struct address_space_limit {
    explicit address_space_limit(int64_t bytes) {
        if (bytes <= 0 || getrlimit(RLIMIT_AS, &saved) != 0) return;

        int64_t current = 0;
        ifstream fin("/proc/self/status");
        string key;
        while (fin >> key) {
            if (key == "VmSize:") {
                fin >> current;
                current *= 1024;
                break;
            }
            fin.ignore(numeric_limits<streamsize>::max(), '\n');
        }
        if (current <= 0) return;

        struct rlimit limit = saved;
        rlim_t wanted = (rlim_t)(current + bytes);
        limit.rlim_cur = saved.rlim_max == RLIM_INFINITY ? wanted : min(wanted, saved.rlim_max);
        if (setrlimit(RLIMIT_AS, &limit) != 0)
            PLOG(WARNING) << "unable to set address space limit";
        else
            active = true;
    }

    ~address_space_limit() {
        if (active && setrlimit(RLIMIT_AS, &saved) != 0)
            PLOG(WARNING) << "unable to restore address space limit";
    }

private:
    struct rlimit saved;
    bool active = false;
};

python_host::python_host(int request_fd, int protocol_fd)
    : protocol_fd(protocol_fd), out(*this, "stdout"), err(*this, "stderr") {
    requests = fdopen(request_fd, "r");
    if (!requests)
        throw system_error(errno, system_category(), "unable to open request channel");
}

python_host::~python_host() {
    if (requests) fclose(requests);
}

void python_host::prepare(const filesystem::path &runtime_dir) {
    bp::import("grader_host");

    bp::object sys = bp::import("sys");
    sys.attr("path").attr("insert")(0, runtime_dir.string());
    sys.attr("dont_write_bytecode") = true;
    original_main = sys.attr("modules")["__main__"];

    filesystem::path prelude = runtime_dir / "prelude.py";
    if (filesystem::exists(prelude)) {
        ifstream fin(prelude);
        string source((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
        bp::object module = bp::import("types").attr("ModuleType")("__prelude__");
        bp::handle<> compiled(Py_CompileString(source.c_str(), prelude.c_str(), Py_file_input));
        bp::object globals = module.attr("__dict__");
        bp::handle<> result(PyEval_EvalCode(compiled.get(), globals.ptr(), globals.ptr()));
    }

    bp::object keys = bp::list(sys.attr("modules").attr("keys")());
    runtime_modules = set<string>(bp::stl_input_iterator<string>(keys), bp::stl_input_iterator<string>());
    DLOG(INFO) << runtime_modules.size() << " modules loaded by the runtime";
}

void python_host::send(nlohmann::json message) {
    message["session"] = session;
    string line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(protocol_fd, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            // 宿主已经关闭了通道，没有人会再读取结果
            PLOG(ERROR) << "unable to write protocol message";
            _exit(1);
        }
        written += n;
    }
}

bool python_host::read_request(nlohmann::json &request) {
    char *line = nullptr;
    size_t capacity = 0;
    while (true) {
        ssize_t n = getline(&line, &capacity, requests);
        if (n < 0) {
            free(line);
            return false;
        }
        request = nlohmann::json::parse(line, line + n, nullptr, false);
        if (!request.is_discarded() && request.is_object()) break;
        LOG(WARNING) << "ignoring malformed request";
    }
    free(line);
    return true;
}

int python_host::serve() {
    nlohmann::json request;
    while (read_request(request)) {
        string type = nlohmann::get_value_def<string>(request, "", "type");
        string token = nlohmann::get_value_def<string>(request, "", "session");

        if (session.empty()) {
            if (type != "hello" || token.empty()) {
                LOG(ERROR) << "expected hello request, got '" << type << "'";
                return 1;
            }
            session = token;
            send({{"type", "ready"}});
            continue;
        }

        if (token != session) {
            LOG(WARNING) << "ignoring request with foreign session token";
            continue;
        }

        if (type == "execute") {
            execute(request);
        } else if (type == "reset") {
            reset();
            send({{"type", "ready"}});
        } else if (type == "shutdown") {
            return 0;
        } else {
            LOG(WARNING) << "ignoring unknown request type '" << type << "'";
        }
    }
    return 0;
}

void python_host::execute(const nlohmann::json &request) {
    string code = nlohmann::get_value_def<string>(request, "", "code");
    string input = nlohmann::get_value_def<string>(request, "", "input");
    int64_t memory_bytes = nlohmann::get_value_def<int64_t>(request, 0, "memoryBytes");

    bool ok = false;
    try {
        bp::object sys = bp::import("sys");
        bp::object builtins = bp::import("builtins");
        bp::object main_module = bp::import("types").attr("ModuleType")("__main__");
        bp::object globals = main_module.attr("__dict__");
        globals["__builtins__"] = builtins;
        sys.attr("modules")["__main__"] = main_module;
        sys.attr("argv") = bp::list(bp::make_tuple(EXERCISE_FILENAME));
        sys.attr("stdin") = bp::import("io").attr("StringIO")(input);
        sys.attr("stdout") = bp::object(bp::ptr(&out));
        sys.attr("stderr") = bp::object(bp::ptr(&err));

        address_space_limit limit(memory_bytes);
        bp::handle<> compiled(bp::allow_null(Py_CompileString(code.c_str(), EXERCISE_FILENAME, Py_file_input)));
        if (compiled) {
            set_audit_armed(true);
            bp::handle<> result(bp::allow_null(PyEval_EvalCode(compiled.get(), globals.ptr(), globals.ptr())));
            set_audit_armed(false);
            ok = (bool)result;
        }
    } catch (const bp::error_already_set &) {
        set_audit_armed(false);
    }

    out.flush();
    err.flush();

    if (!ok) {
        if (PyErr_ExceptionMatches(PyExc_SystemExit)) {
            int exit_code = system_exit_code();
            out.flush();
            err.flush();
            send({{"type", "complete"}, {"exitCode", exit_code}, {"memoryBytes", peak_memory_bytes()}});
        } else {
            report_exception();
        }
        return;
    }

    send({{"type", "complete"}, {"exitCode", 0}, {"memoryBytes", peak_memory_bytes()}});
}

int64_t python_host::peak_memory_bytes() const {
    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) != 0) return 0;
    return (int64_t)usage.ru_maxrss * 1024;
}

int python_host::system_exit_code() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    bp::handle<> htype(type), hvalue(bp::allow_null(value)), htraceback(bp::allow_null(traceback));
    if (!hvalue) return 0;

    try {
        bp::object code = bp::object(hvalue).attr("code");
        if (code.is_none()) return 0;
        bp::extract<int> number(code);
        if (number.check()) return number();
        err.write(bp::extract<string>(bp::str(code))() + "\n");
    } catch (const bp::error_already_set &) {
        PyErr_Clear();
    }
    return 1;
}

void python_host::report_exception() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) {
        send({{"type", "error"}, {"data", "Unknown error"}, {"stack", ""}});
        return;
    }
    PyErr_NormalizeException(&type, &value, &traceback);
    if (traceback) PyException_SetTraceback(value, traceback);
    bp::handle<> htype(type), hvalue(bp::allow_null(value)), htraceback(bp::allow_null(traceback));

    string data, stack;
    try {
        bp::object module = bp::import("traceback");
        bp::object otype(htype);
        bp::object ovalue = hvalue ? bp::object(hvalue) : bp::object();
        bp::object otraceback = htraceback ? bp::object(htraceback) : bp::object();
        bp::str empty("");
        data = bp::extract<string>(empty.join(module.attr("format_exception_only")(otype, ovalue)))();
        stack = bp::extract<string>(empty.join(module.attr("format_exception")(otype, ovalue, otraceback)))();
    } catch (const bp::error_already_set &) {
        PyErr_Clear();
        if (data.empty()) data = "Error";
    }

    while (!data.empty() && (data.back() == '\n' || data.back() == ' ')) data.pop_back();
    send({{"type", "error"}, {"data", data}, {"stack", stack}, {"memoryBytes", peak_memory_bytes()}});
}

void python_host::reset() {
    try {
        bp::object sys = bp::import("sys");
        bp::object modules = sys.attr("modules");
        bp::list keys(modules.attr("keys")());
        vector<string> loaded{bp::stl_input_iterator<string>(keys), bp::stl_input_iterator<string>()};
        for (auto &name : loaded)
            if (!runtime_modules.count(name))
                modules.attr("pop")(name, bp::object());
        modules["__main__"] = original_main;
        sys.attr("stdin") = sys.attr("__stdin__");
        sys.attr("stdout") = sys.attr("__stdout__");
        sys.attr("stderr") = sys.attr("__stderr__");
        bp::import("gc").attr("collect")();
    } catch (const bp::error_already_set &) {
        LOG(ERROR) << "unable to reset interpreter state";
        PyErr_Print();
    }
}

}  // namespace grader
