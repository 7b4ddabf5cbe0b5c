#include "run.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <cstring>
#include <iostream>
#include <system_error>
#include "limits.hpp"

using namespace std;

int runit(struct runguard_options opt) {
    try {
        set_restrictions(opt);
        if (opt.isolate) isolate_namespaces();
        close_inherited_fds();
        set_seccomp(opt);
    } catch (const exception &e) {
        cerr << "runguard: " << e.what() << endl;
        return EXIT_SETUP_FAILURE;
    }

    auto &cmd = opt.command;
    vector<char *> args;
    for (auto &arg : cmd) args.push_back(arg.data());
    args.push_back(nullptr);

    execvp(args[0], args.data());
    cerr << fmt::format("runguard: unable to start command {}: {}", cmd[0], strerror(errno)) << endl;
    return EXIT_SETUP_FAILURE;
}
