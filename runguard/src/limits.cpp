#include "limits.hpp"
#include <dirent.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <math.h>
#include <sched.h>
#include <seccomp.h>
#include <signal.h>
#include <sys/resource.h>
#include <unistd.h>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

using namespace std;

void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), "setrlimit");
}

void set_restrictions(const struct runguard_options &opt) {
    if (!opt.preserve_sys_env) {
        string path = getenv("PATH") ? getenv("PATH") : "/usr/local/bin:/usr/bin:/bin";
        clearenv();
        setenv("PATH", path.c_str(), true);
    }

    for (auto &entry : opt.env) {
        auto idx = entry.find('=');
        if (idx == string::npos) continue;
        setenv(entry.substr(0, idx).c_str(), entry.substr(idx + 1).c_str(), true);
    }

    if (opt.use_cpu_limit) {
        /* Setting the real hard limit one second
		   higher: at the soft limit the kernel will send SIGXCPU at
		   the hard limit a SIGKILL. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    if (opt.memory_limit > 0)
        set_rlimit(RLIMIT_AS, opt.memory_limit, opt.memory_limit);

    if (opt.file_limit >= 0) {
        // writes beyond the limit fail with EFBIG instead of killing the command
        signal(SIGXFSZ, SIG_IGN);
        set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit);
    }
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    if (!opt.work_dir.empty()) {
        if (chdir(opt.work_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chdir to {}", opt.work_dir));
    }
}

static void write_proc_file(const string &path, const string &content) {
    ofstream fout(path);
    fout << content;
    fout.close();
    if (!fout)
        throw system_error(errno, generic_category(), "unable to write " + path);
}

bool isolate_namespaces() {
    uid_t uid = getuid();
    gid_t gid = getgid();

    /*
     * CLONE_NEWUSER：新的用户命名空间，使非特权用户也能创建下面的命名空间
     * CLONE_NEWNET：隔离网络命名空间，新命名空间中只有一个未启用的回环设备，无法访问主机网络
     * CLONE_NEWIPC：隔离 IPC 命名空间，受控程序无法与主机程序进行 System V IPC 通信
     * CLONE_NEWUTS: 隔离主机和受控程序的 hostname
     */
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS) != 0) {
        LOG(WARNING) << "unable to create namespaces, relying on seccomp only: " << strerror(errno);
        return false;
    }

    // 将当前用户映射为自己，保持文件访问权限不变
    write_proc_file("/proc/self/setgroups", "deny");
    write_proc_file("/proc/self/uid_map", fmt::format("{} {} 1", uid, uid));
    write_proc_file("/proc/self/gid_map", fmt::format("{} {} 1", gid, gid));
    return true;
}

void close_inherited_fds() {
    vector<int> fds;
    DIR *dir = opendir("/proc/self/fd");
    if (!dir)
        throw system_error(errno, generic_category(), "unable to list /proc/self/fd");
    int self = dirfd(dir);
    while (struct dirent *entry = readdir(dir)) {
        int fd = atoi(entry->d_name);
        if (entry->d_name[0] != '.' && fd > STDERR_FILENO && fd != self)
            fds.push_back(fd);
    }
    closedir(dir);
    for (int fd : fds) close(fd);
}

static void deny(scmp_filter_ctx ctx, uint32_t action, const char *name) {
    int syscall = seccomp_syscall_resolve_name(name);
    if (syscall == __NR_SCMP_ERROR) return;  // not available on this architecture
    int rc = seccomp_rule_add(ctx, action, syscall, 0);
    if (rc < 0)
        throw system_error(-rc, generic_category(), fmt::format("unable to add seccomp rule for {}", name));
}

void set_seccomp(const struct runguard_options &opt) {
    if (!opt.seccomp) return;

    // clang-format off
    static const char *denied[] = {
        // network
        "socket", "connect", "bind", "listen", "accept", "accept4",
        // process creation, threads are still allowed through clone(CLONE_THREAD)
        "fork", "vfork",
        // debugging other processes
        "ptrace", "process_vm_readv", "process_vm_writev",
        // file system modification
        "unlink", "unlinkat", "rmdir", "rename", "renameat", "renameat2",
        "truncate", "link", "linkat", "symlink", "symlinkat", "mknod", "mknodat",
        "chmod", "fchmodat", "chown", "fchownat", "lchown",
        // system administration
        "mount", "umount2", "pivot_root", "chroot", "reboot", "kexec_load",
        "init_module", "finit_module", "delete_module", "swapon", "swapoff"
    };
    // clang-format on

    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx)
        throw runtime_error("unable to initialize seccomp");

    try {
        for (const char *name : denied)
            deny(ctx, SCMP_ACT_ERRNO(EPERM), name);

        int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(clone), 1,
                                  SCMP_A0(SCMP_CMP_MASKED_EQ, CLONE_THREAD, 0));
        if (rc < 0)
            throw system_error(-rc, generic_category(), "unable to add seccomp rule for clone");

        // clone3 passes its flags in memory which seccomp cannot inspect,
        // ENOSYS makes the C library fall back to clone
        deny(ctx, SCMP_ACT_ERRNO(ENOSYS), "clone3");

        rc = seccomp_load(ctx);
        if (rc < 0)
            throw system_error(-rc, generic_category(), "unable to load seccomp filter");
    } catch (...) {
        seccomp_release(ctx);
        throw;
    }
    seccomp_release(ctx);
}
