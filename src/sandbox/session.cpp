#include "sandbox/session.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <climits>
#include <cstring>
#include <fstream>
#include <limits>
#include <mutex>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s
const struct timespec reapdelay = {0, 10000000L};   // 0.01s

const int BUF_SIZE = 4096;
// 每次 pump 每个管道最多读取的块数，避免用户程序持续输出时饿死截止时间检查
const int MAX_CHUNKS_PER_PUMP = 64;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

const size_t MAX_DIAGNOSTICS_SIZE = 64 << 10;

static void ignore_sigpipe() {
    static once_flag flag;
    call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

static string generate_token() {
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    lock_guard<mutex> guard(generator_mutex);
    return boost::uuids::to_string(generator());
}

sandbox_session::sandbox_session(sandbox_command command)
    : command(move(command)), session_token(generate_token()) {}

sandbox_session::~sandbox_session() {
    terminate();
    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stderr_fd);
}

const string &sandbox_session::token() const {
    return session_token;
}

void sandbox_session::start() {
    if (child_pid > 0)
        throw internal_error("sandbox process already started");
    ignore_sigpipe();

    vector<string> args;
    to_string_list(args, RUNGUARD, "--no-core-dumps", "--file-limit", 0);
    if (command.cpu_time > 0) to_string_list(args, "--cpu-time", command.cpu_time);
    if (command.memory_limit > 0) to_string_list(args, "--memory-limit", command.memory_limit / 1024);
    if (!command.work_dir.empty()) to_string_list(args, "--work-dir", command.work_dir);
    if (!command.seccomp) to_string_list(args, "--no-seccomp");
    if (command.isolate_namespaces) to_string_list(args, "--isolate");
    for (auto &variable : command.env) to_string_list(args, "--variable", variable);
    to_string_list(args, "--", command.argv);

    // fork 之后子进程只能调用 async-signal-safe 的函数，因此提前准备好 argv
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    DLOG(INFO) << "starting sandbox: " << boost::algorithm::join(args, " ");

    int pipefd[3][2];
    for (int i = 0; i < 3; ++i) {
        if (pipe2(pipefd[i], O_CLOEXEC) != 0) {
            int err = errno;
            for (int j = 0; j < i; ++j) close(pipefd[j][0]), close(pipefd[j][1]);
            throw internal_error(fmt::format("unable to create pipe: {}", strerror(err)));
        }
    }

    switch (child_pid = fork()) {
        case -1: {
            int err = errno;
            for (int i = 0; i < 3; ++i) close(pipefd[i][0]), close(pipefd[i][1]);
            throw internal_error(fmt::format("unable to fork: {}", strerror(err)));
        }
        case 0:  // 子进程
            // 标准输入读取请求端，标准输出和标准错误输出写入端
            if (dup2(pipefd[STDIN_FILENO][PIPE_OUT], STDIN_FILENO) < 0 ||
                dup2(pipefd[STDOUT_FILENO][PIPE_IN], STDOUT_FILENO) < 0 ||
                dup2(pipefd[STDERR_FILENO][PIPE_IN], STDERR_FILENO) < 0)
                _exit(E_INTERNAL_ERROR);
            execv(argv[0], argv.data());
            _exit(E_INTERNAL_ERROR);
        default:  // 父进程
            close(pipefd[STDIN_FILENO][PIPE_OUT]);
            close(pipefd[STDOUT_FILENO][PIPE_IN]);
            close(pipefd[STDERR_FILENO][PIPE_IN]);
            stdin_fd = pipefd[STDIN_FILENO][PIPE_IN];
            stdout_fd = pipefd[STDOUT_FILENO][PIPE_OUT];
            stderr_fd = pipefd[STDERR_FILENO][PIPE_OUT];
            for (int fd : {stdout_fd, stderr_fd}) {
                int flags = fcntl(fd, F_GETFL);
                if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
                    throw internal_error(fmt::format("unable to set pipe non-blocking: {}", strerror(errno)));
            }
            status = -1;
            break;
    }

    send({{"type", "hello"}});
}

void sandbox_session::send(nlohmann::json request) {
    if (stdin_fd < 0)
        throw internal_error("sandbox input is closed");

    request["session"] = session_token;
    string line = request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = write(stdin_fd, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close_fd(stdin_fd);
            throw internal_error(fmt::format("unable to send request to sandbox: {}", strerror(err)));
        }
        written += n;
    }
}

sandbox_session::wait_status sandbox_session::next_message(nlohmann::json &message, chrono::steady_clock::time_point deadline) {
    while (true) {
        if (!messages.empty()) {
            message = move(messages.front());
            messages.pop_front();
            return message.is_null() ? wait_status::OVERSIZED : wait_status::MESSAGE;
        }
        if (stdout_fd < 0) return wait_status::CLOSED;

        auto now = chrono::steady_clock::now();
        if (now >= deadline) return wait_status::TIMEOUT;
        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - now).count() + 1;
        pump((int)min<int64_t>(remaining, INT_MAX));
    }
}

void sandbox_session::pump(int timeout_ms) {
    struct pollfd fds[2];
    int nfds = 0;
    if (stdout_fd >= 0) fds[nfds++] = {stdout_fd, POLLIN, 0};
    if (stderr_fd >= 0) fds[nfds++] = {stderr_fd, POLLIN, 0};
    if (nfds == 0) return;

    int r = poll(fds, nfds, timeout_ms);
    if (r == -1) {
        if (errno == EINTR) return;
        throw internal_error(fmt::format("waiting for sandbox data: {}", strerror(errno)));
    }

    char buf[BUF_SIZE];
    bool stdout_closed = false;
    for (int i = 0; i < nfds; ++i) {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        int fd = fds[i].fd;
        for (int chunk = 0; chunk < MAX_CHUNKS_PER_PUMP; ++chunk) {
            ssize_t nread = read(fd, buf, BUF_SIZE);
            if (nread == -1) {
                if (errno == EINTR) {
                    --chunk;
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                throw internal_error(fmt::format("reading sandbox pipe: {}", strerror(errno)));
            }
            if (nread == 0) {
                // EOF: 关闭管道并用 -1 标记
                if (fd == stdout_fd) {
                    close_fd(stdout_fd);
                    stdout_closed = true;
                } else {
                    close_fd(stderr_fd);
                }
                break;
            }
            if (fd == stdout_fd) {
                consume_stdout(buf, nread);
            } else {
                diagnostics.append(buf, nread);
                if (diagnostics.size() > MAX_DIAGNOSTICS_SIZE)
                    diagnostics.erase(0, diagnostics.size() - MAX_DIAGNOSTICS_SIZE);
            }
        }
    }

    // 进程退出时 stderr 中通常还有崩溃信息，在报告 CLOSED 之前取出来
    if (stdout_closed && stderr_fd >= 0) {
        size_t drained = 0;
        while (drained < MAX_DIAGNOSTICS_SIZE) {
            ssize_t nread = read(stderr_fd, buf, BUF_SIZE);
            if (nread == -1 && errno == EINTR) continue;
            if (nread <= 0) break;
            diagnostics.append(buf, nread);
            drained += nread;
        }
        if (diagnostics.size() > MAX_DIAGNOSTICS_SIZE)
            diagnostics.erase(0, diagnostics.size() - MAX_DIAGNOSTICS_SIZE);
    }
}

void sandbox_session::consume_stdout(const char *data, size_t size) {
    if (skipping_line) {
        // 丢弃超长消息剩余的部分，直到下一个换行符
        const char *newline = static_cast<const char *>(memchr(data, '\n', size));
        if (!newline) return;
        skipping_line = false;
        size -= newline + 1 - data;
        data = newline + 1;
    }

    line_buffer.append(data, size);
    size_t begin = 0, end;
    while ((end = line_buffer.find('\n', begin)) != string::npos) {
        string line = line_buffer.substr(begin, end - begin);
        begin = end + 1;
        if (line.empty()) continue;

        nlohmann::json message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            LOG(WARNING) << "ignoring malformed sandbox message: " << line.substr(0, 200);
            continue;
        }
        auto session = message.find("session");
        if (session == message.end() || !session->is_string() || session->get<string>() != session_token) {
            LOG(WARNING) << "ignoring sandbox message with foreign session token";
            continue;
        }
        messages.push_back(move(message));
    }
    line_buffer.erase(0, begin);

    if (line_buffer.size() > command.max_message_size) {
        LOG(WARNING) << "discarding sandbox message longer than " << command.max_message_size << " bytes";
        line_buffer.clear();
        messages.emplace_back(nullptr);
        skipping_line = true;
    }
}

string sandbox_session::take_diagnostics() {
    if (stderr_fd >= 0) pump(0);
    string result;
    swap(result, diagnostics);
    if (DEBUG && !result.empty())
        LOG(INFO) << "sandbox diagnostics: " << result;
    return result;
}

bool sandbox_session::running() const {
    return child_pid > 0;
}

int64_t sandbox_session::peak_memory_bytes() const {
    if (child_pid <= 0) return 0;
    ifstream fin(fmt::format("/proc/{}/status", child_pid));
    string key;
    while (fin >> key) {
        if (key == "VmHWM:") {
            int64_t kb = 0;
            fin >> kb;
            return kb * 1024;
        }
        fin.ignore(numeric_limits<streamsize>::max(), '\n');
    }
    return 0;
}

void sandbox_session::reap(bool block) {
    if (child_pid <= 0) return;
    int wstatus = 0;
    pid_t pid;
    do {
        pid = waitpid(child_pid, &wstatus, block ? 0 : WNOHANG);
    } while (pid == -1 && errno == EINTR);
    if (pid == child_pid || (pid == -1 && errno == ECHILD)) {
        status = pid == child_pid ? wstatus : -1;
        child_pid = -1;
    }
}

void sandbox_session::terminate() {
    close_fd(stdin_fd);
    reap(false);
    if (child_pid <= 0) return;

    // runguard 调用 setsid 之前进程组还不存在，此时直接对进程发送信号
    if (kill(-child_pid, SIGTERM) != 0 && kill(child_pid, SIGTERM) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGTERM to sandbox: " << strerror(errno);

    for (int waited = 0; waited < 10 && child_pid > 0; ++waited) {
        nanosleep(&reapdelay, nullptr);
        reap(false);
    }
    if (child_pid <= 0) return;

    if (kill(-child_pid, SIGKILL) != 0 && kill(child_pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to sandbox: " << strerror(errno);
    nanosleep(&killdelay, nullptr);
    reap(true);
}

int sandbox_session::exit_status() const {
    return status;
}

void sandbox_session::close_fd(int &fd) {
    if (fd < 0) return;
    close(fd);
    fd = -1;
}

}  // namespace grader
