#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct time_limit {
    double soft, hard;
};

struct runguard_options {
    std::string work_dir;

    bool use_cpu_limit = false;
    struct time_limit cpu_limit;  // CPU time

    int64_t memory_limit = -1;  // Memory limit in bytes
    int64_t file_limit = -1;    // Created file size limit in bytes
    bool no_core_dumps = false;

    bool preserve_sys_env = false;
    std::vector<std::string> env;

    bool isolate = false;  // new user/network/ipc/uts namespaces
    bool seccomp = true;

    std::vector<std::string> command;
};
