#include <Python.h>
#include <fcntl.h>
#include <glog/logging.h>
#include <unistd.h>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include "audit.hpp"
#include "host.hpp"

using namespace std;

/**
 * @brief 将消息通道从标准输入输出移走
 * 用户代码直接读写 fd 0/1 时只会读到 EOF，写入的内容被丢弃
 * @return 请求通道和响应通道的文件描述符
 */
static pair<int, int> detach_protocol_channel() {
    int request_fd = fcntl(STDIN_FILENO, F_DUPFD_CLOEXEC, 3);
    PCHECK(request_fd >= 0) << "unable to duplicate request channel";
    int protocol_fd = fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 3);
    PCHECK(protocol_fd >= 0) << "unable to duplicate protocol channel";

    int devnull = open("/dev/null", O_RDWR);
    PCHECK(devnull >= 0) << "unable to open /dev/null";
    PCHECK(dup2(devnull, STDIN_FILENO) >= 0 && dup2(devnull, STDOUT_FILENO) >= 0) << "unable to redirect standard streams";
    close(devnull);
    return {request_fd, protocol_fd};
}

int main(int argc, const char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("python-host options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("runtime-dir", po::value<string>()->required(), "installed Python runtime package, prelude.py is executed before serving requests")
        ("help,h", "display this help text and exit");
    // clang-format on

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            cout << desc << endl;
            return 0;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << desc << endl;
        return 2;
    }

    auto [request_fd, protocol_fd] = detach_protocol_channel();

    CHECK(grader::install_audit_hook()) << "unable to install audit hook";
    CHECK(PyImport_AppendInittab("grader_host", PyInit_grader_host) != -1) << "unable to register grader_host module";

    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.write_bytecode = 0;
    config.site_import = 0;
    config.buffered_stdio = 0;
    PyStatus status = PyConfig_SetBytesString(&config, &config.program_name, argv[0]);
    if (!PyStatus_Exception(status))
        status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status))
        Py_ExitStatusException(status);

    grader::python_host host(request_fd, protocol_fd);
    try {
        host.prepare(filesystem::path(vm["runtime-dir"].as<string>()));
    } catch (const boost::python::error_already_set&) {
        LOG(ERROR) << "unable to prepare Python runtime";
        PyErr_Print();
        return 1;
    }

    // boost::python 不支持 Py_Finalize，直接退出
    return host.serve();
}
