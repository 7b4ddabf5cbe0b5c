#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cmath>
#include <iostream>
#include "run.hpp"

using namespace std;

void validate(boost::any& v, const vector<string>& values, struct time_limit*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    struct time_limit result;
    string const& s = validators::get_single_string(values);
    auto colon = s.find(':');
    string left = s.substr(0, colon);
    string right = colon < s.size() ? s.substr(colon + 1) : "";

    try {
        result.soft = boost::lexical_cast<double>(left);
        if (right.size())
            result.hard = boost::lexical_cast<double>(right);
        else
            result.hard = result.soft;
    } catch (boost::bad_lexical_cast&) {
        throw validation_error(validation_error::invalid_option_value);
    }

    if (result.hard < result.soft ||
        !std::isfinite(result.hard) || !std::isfinite(result.soft) ||
        result.hard < 0 || result.soft < 0)
        throw validation_error(validation_error::invalid_option_value);

    v = result;
}

int main(int argc, const char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("runguard options");
    po::positional_options_description pos;
    po::variables_map vm;

    struct runguard_options opt;

    // clang-format off
    desc.add_options()
        ("work-dir,d", po::value<string>(), "change working directory before running command")
        ("cpu-time,t", po::value<time_limit>(), "set maximum CPU time (floating point is acceptable) consumption of the command in seconds")
        ("memory-limit,m", po::value<size_t>(), "set maximum address space of the command in KB")
        ("file-limit,f", po::value<size_t>(), "set maximum created file size of the command in KB, 0 forbids writing files")
        ("no-core-dumps", "disable core dumps")
        ("environment,E", "preseve system environment variables (or only PATH is loaded)")
        ("variable,V", po::value<vector<string>>(), "add additional environment variables (e.g. -Vkey1=value1 -Vkey2=value2)")
        ("isolate", "run command in new user, network, IPC and UTS namespaces if the kernel permits")
        ("no-seccomp", "do not install the syscall filter")
        ("cmd", po::value<vector<string>>()->composing()->required(), "commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "Runguard: Running untrusted program with resource limits and a syscall denylist." << endl
                 << "The command replaces runguard, so its process id is the one runguard was started with." << endl
                 << "Usage: " << argv[0] << " [options] -- [command]" << endl;
            cout << desc << endl;
            return 0;
        }
        if (vm.count("version")) {
            cout << "runguard" << endl;
            return 0;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_SETUP_FAILURE;
    }

    if (vm.count("work-dir")) opt.work_dir = vm["work-dir"].as<string>();
    if (vm.count("variable")) opt.env = vm["variable"].as<vector<string>>();
    if (vm.count("cpu-time")) opt.use_cpu_limit = true, opt.cpu_limit = vm["cpu-time"].as<time_limit>();
    if (vm.count("memory-limit")) opt.memory_limit = (int64_t)vm["memory-limit"].as<size_t>() * 1024;
    if (vm.count("file-limit")) opt.file_limit = (int64_t)vm["file-limit"].as<size_t>() * 1024;
    if (vm.count("no-core-dumps")) opt.no_core_dumps = true;
    if (vm.count("environment")) opt.preserve_sys_env = true;
    if (vm.count("isolate")) opt.isolate = true;
    if (vm.count("no-seccomp")) opt.seccomp = false;
    opt.command = vm["cmd"].as<vector<string>>();

    return runit(opt);
}
