#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "execution/executor_pool.hpp"
#include "grading/exercise.hpp"
#include "grading/feedback.hpp"
#include "grading/scoring.hpp"
#include "grading/test_runner.hpp"
#include "runtime/loader.hpp"
#include "runtime/memory.hpp"
using namespace std;

static filesystem::path resolve_path(const boost::program_options::variables_map &vm, const char *option, const char *env, const filesystem::path &def) {
    if (vm.count(option)) return filesystem::path(vm.at(option).as<string>());
    if (getenv(env)) return filesystem::path(getenv(env));
    return def;
}

static int grade(const boost::program_options::variables_map &vm) {
    grader::exercise exercise = grader::read_exercise(vm.at("exercise").as<string>());

    filesystem::path source_path(vm.at("source").as<string>());
    if (!filesystem::is_regular_file(source_path)) {
        cerr << "Source file " << source_path << " does not exist" << endl;
        return EXIT_FAILURE;
    }
    string code = grader::read_file_content(source_path);
    if (!grader::utf8_check_is_valid(code)) {
        cerr << "Source file " << source_path << " is not valid UTF-8" << endl;
        return EXIT_FAILURE;
    }

    vector<string> used_hints;
    if (vm.count("hint")) used_hints = vm.at("hint").as<vector<string>>();
    double penalties = exercise.hint_penalties(used_hints);

    grader::executor_pool pool;
    grader::register_default_languages(pool);
    grader::test_runner runner(pool);

    grader::test_results results;
    if (vm.count("visible-only"))
        results = runner.run_visible_tests(code, exercise.test_cases, exercise.language, exercise.limits);
    else
        results = runner.run_all_tests(code, exercise.test_cases, exercise.language, exercise.limits);

    grader::score_result score = grader::calculate_score(results, exercise.scoring);

    nlohmann::json report;
    report["exerciseId"] = exercise.id;
    report["results"] = results;
    report["score"] = score;
    report["hintPenalties"] = penalties;
    report["finalScore"] = grader::final_score(score.score, penalties);
    report["feedback"] = grader::generate_feedback(results, exercise.error_patterns);
    cout << report.dump(4) << endl;
    return results.all_passed ? EXIT_SUCCESS : 3;
}

static int preload_python() {
    grader::runtime_loader loader(grader::load_python_package(), grader::check_memory_pressure);
    grader::cancellation_token token;
    auto session = loader.load([](const grader::runtime_load_progress &progress) {
        cout << nlohmann::json(progress).dump() << endl;
    }, token);
    session->send({{"type", "shutdown"}});
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path bin_dir(filesystem::weakly_canonical(current).parent_path());
    filesystem::path repo_dir(bin_dir.parent_path());

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("exercise", po::value<string>(), "grade the source file against the exercise document at this path")
        ("source", po::value<string>(), "the learner's source file to be graded")
        ("visible-only", "run only the visible test cases, like a learner's trial run")
        ("hint", po::value<vector<string>>(), "id of a hint the learner has used, its penalty is deducted from the final score")
        ("memory-check", "print the memory pressure of this device as JSON")
        ("preload-python", "install and start the Python runtime, printing the progress as JSON lines")
        ("exec-dir", po::value<string>(), "set the directory of sandbox bootstrap scripts and runtime packages. You can either pass it from environ EXECDIR")
        ("cache-dir", po::value<string>(), "set the directory to install runtimes into. You can either pass it from environ CACHEDIR")
        ("runguard", po::value<string>(), "set the location of runguard. You can either pass it from environ RUNGUARD")
        ("python-host", po::value<string>(), "set the location of python-host. You can either pass it from environ PYTHONHOST")
        ("node", po::value<string>(), "set the node executable. You can either pass it from environ NODE")
        ("sandbox-init-timeout", po::value<int>(), "set the timeout in milliseconds for a sandbox to become ready, default to 5000")
        ("runtime-load-timeout", po::value<int>(), "set the timeout in milliseconds for the Python runtime to start, default to 30000")
        ("debug", "turn on the debug mode to log all diagnostics written by sandboxes")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: Run learner code in a sandbox and grade it against test cases" << endl
             << "Usage: " << argv[0] << " --exercise <exercise.json> --source <file> [options]" << endl
             << "       " << argv[0] << " --memory-check" << endl
             << "       " << argv[0] << " --preload-python" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) grader::DEBUG = true;

    grader::EXEC_DIR = resolve_path(vm, "exec-dir", "EXECDIR", repo_dir / "exec");
    CHECK(filesystem::is_directory(grader::EXEC_DIR))
        << "Executables directory " << grader::EXEC_DIR << " does not exist";

    grader::CACHE_DIR = resolve_path(vm, "cache-dir", "CACHEDIR", filesystem::temp_directory_path() / "grader-cache");
    filesystem::create_directories(grader::CACHE_DIR);
    CHECK(filesystem::is_directory(grader::CACHE_DIR))
        << "Cache directory " << grader::CACHE_DIR << " does not exist";

    // 默认情况下，假设运行环境是拉取代码直接编译的环境，runguard 和 python-host 与本程序位于同一目录
    grader::RUNGUARD = resolve_path(vm, "runguard", "RUNGUARD", bin_dir / "runguard");
    CHECK(filesystem::exists(grader::RUNGUARD))
        << "runguard " << grader::RUNGUARD << " does not exist. Pass --runguard or environ RUNGUARD to point out where the runguard executable locates in.";

    grader::PYTHON_HOST = resolve_path(vm, "python-host", "PYTHONHOST", bin_dir / "python-host");
    if (!filesystem::exists(grader::PYTHON_HOST))
        LOG(WARNING) << "python-host " << grader::PYTHON_HOST << " does not exist, Python exercises cannot be graded";

    if (vm.count("node"))
        grader::NODE_EXECUTABLE = vm.at("node").as<string>();
    else
        grader::NODE_EXECUTABLE = grader::get_env("NODE", grader::NODE_EXECUTABLE);

    if (vm.count("sandbox-init-timeout"))
        grader::SANDBOX_INIT_TIMEOUT_MS = vm.at("sandbox-init-timeout").as<int>();
    if (vm.count("runtime-load-timeout"))
        grader::RUNTIME_LOAD_TIMEOUT_MS = vm.at("runtime-load-timeout").as<int>();

    try {
        if (vm.count("memory-check")) {
            cout << nlohmann::json(grader::check_memory_pressure()).dump(4) << endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("preload-python"))
            return preload_python();

        if (!vm.count("exercise") || !vm.count("source")) {
            cerr << "Both --exercise and --source are required to grade a submission" << endl
                 << endl;
            cerr << desc << endl;
            return EXIT_FAILURE;
        }
        return grade(vm);
    } catch (const grader::runtime_unavailable &ex) {
        LOG(ERROR) << "execution environment unavailable: " << ex;
        cerr << ex.what() << endl;
        return 2;
    } catch (const invalid_argument &ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }
}
