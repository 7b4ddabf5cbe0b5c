#include "runtime/loader.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "execution/executor.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

// 安装运行时前要求的最小剩余磁盘空间
const uint64_t MIN_REQUIRED_STORAGE = 50 * 1024 * 1024;

const char *INSTALLED_MARKER = ".installed";

const int PROGRESS_DOWNLOAD_BEGIN = 10;
const int PROGRESS_DOWNLOAD_END = 85;
const int PROGRESS_INITIALIZE = 90;

void cancellation_token::cancel() {
    flag = true;
}

void cancellation_token::reset() {
    flag = false;
}

bool cancellation_token::cancelled() const {
    return flag;
}

void cancellation_token::throw_if_cancelled() const {
    if (flag) throw load_cancelled();
}

fs::path runtime_package::install_dir() const {
    return CACHE_DIR / "runtimes" / fmt::format("{}-{}", name, version);
}

uint64_t runtime_package::total_size() const {
    uint64_t total = 0;
    for (auto &file : assets) total += file->size();
    return total;
}

runtime_package load_python_package() {
    fs::path dir = EXEC_DIR / "python";
    fs::path manifest = dir / "runtime.json";
    if (!fs::exists(manifest))
        throw runtime_unavailable(fmt::format("Python runtime package is missing: {}", manifest.string()));

    nlohmann::json j = nlohmann::json::parse(read_file_content(manifest), nullptr, false);
    if (j.is_discarded())
        throw runtime_unavailable(fmt::format("Python runtime manifest is malformed: {}", manifest.string()));

    runtime_package package;
    try {
        package.name = nlohmann::get_value<string>(j, "name");
        package.version = nlohmann::get_value<string>(j, "version");
        for (auto &file : nlohmann::access(j, "files")) {
            string name = assert_safe_path(file.get<string>());
            package.assets.push_back(make_shared<local_asset>(name, dir / name));
        }
    } catch (const exception &ex) {
        throw runtime_unavailable(fmt::format("Python runtime manifest is malformed: {}", ex.what()));
    }
    return package;
}

runtime_loader::runtime_loader(runtime_package package, memory_probe probe)
    : runtime(move(package)), probe(move(probe)) {}

const runtime_package &runtime_loader::package() const {
    return runtime;
}

bool runtime_loader::is_cached() const {
    return fs::exists(runtime.install_dir() / INSTALLED_MARKER);
}

static void report(const progress_callback &on_progress, runtime_load_stage stage, int progress, const string &message) {
    if (!on_progress) return;
    runtime_load_progress value;
    value.stage = stage;
    value.progress = progress;
    value.message = message;
    on_progress(value);
}

unique_ptr<sandbox_session> runtime_loader::load(const progress_callback &on_progress, const cancellation_token &token) const {
    try {
        report(on_progress, runtime_load_stage::CHECKING, 0, "Checking device compatibility...");

        memory_check_result memory = probe ? probe() : check_memory_pressure();
        if (!memory.can_load_runtime)
            throw runtime_unavailable(memory.warning.value_or("Insufficient device memory for Python runtime"));
        if (memory.warning)
            LOG(WARNING) << "[" << runtime.name << "] " << *memory.warning;

        bool cached = is_cached();
        if (!cached) {
            fs::path runtimes = CACHE_DIR / "runtimes";
            fs::create_directories(runtimes);
            auto space = fs::space(runtimes);
            if (space.available < max(MIN_REQUIRED_STORAGE, runtime.total_size()))
                throw runtime_unavailable("Not enough storage space for Python runtime. Please free up at least 50MB.");
        }

        token.throw_if_cancelled();

        if (cached) {
            report(on_progress, runtime_load_stage::LOADING, PROGRESS_DOWNLOAD_BEGIN, "Loading Python runtime from cache...");
        } else {
            install(on_progress, token);
        }

        token.throw_if_cancelled();
        report(on_progress, runtime_load_stage::LOADING, PROGRESS_INITIALIZE, "Initializing Python environment...");
        auto session = launch(token);

        report(on_progress, runtime_load_stage::READY, 100, "Python runtime ready");
        LOG(INFO) << "[" << runtime.name << "] runtime " << runtime.version << " ready";
        return session;
    } catch (const runtime_unavailable &ex) {
        LOG(WARNING) << "[" << runtime.name << "] unable to load runtime: " << ex.what();
        report(on_progress, runtime_load_stage::ERROR, 0, ex.what());
        throw;
    } catch (const exception &ex) {
        LOG(ERROR) << "[" << runtime.name << "] unable to load runtime: " << ex.what();
        report(on_progress, runtime_load_stage::ERROR, 0, ex.what());
        throw runtime_unavailable(fmt::format("Failed to load Python runtime: {}", ex.what()));
    }
}

void runtime_loader::install(const progress_callback &on_progress, const cancellation_token &token) const {
    report(on_progress, runtime_load_stage::DOWNLOADING, PROGRESS_DOWNLOAD_BEGIN, "Downloading Python runtime...");

    fs::path runtimes = CACHE_DIR / "runtimes";
    auto lock = lock_directory(runtimes, false);

    // 等待锁的过程中其他进程可能已经安装好了
    if (is_cached()) return;

    fs::path target = runtime.install_dir();
    fs::path staging = runtimes / fmt::format(".staging-{}-{}-{}", runtime.name, runtime.version, getpid());
    fs::remove_all(staging);
    fs::create_directories(staging);

    try {
        uint64_t total = runtime.total_size(), downloaded = 0;
        for (auto &file : runtime.assets) {
            token.throw_if_cancelled();
            file->fetch(staging, [&](uint64_t bytes) {
                downloaded += bytes;
                int progress = PROGRESS_DOWNLOAD_BEGIN;
                if (total > 0)
                    progress += (int)((PROGRESS_DOWNLOAD_END - PROGRESS_DOWNLOAD_BEGIN) * min(downloaded, total) / total);
                if (on_progress) {
                    runtime_load_progress value;
                    value.stage = runtime_load_stage::DOWNLOADING;
                    value.progress = progress;
                    value.downloaded_bytes = downloaded;
                    value.total_bytes = total;
                    value.message = fmt::format("Downloading Python runtime ({}%)...", progress);
                    on_progress(value);
                }
                token.throw_if_cancelled();
            });
        }
        token.throw_if_cancelled();

        // 安装目录存在但没有标记，是上次安装中断留下的
        fs::remove_all(target);
        fs::rename(staging, target);
        write_file_content(target / INSTALLED_MARKER, runtime.version);
    } catch (...) {
        error_code ec;
        fs::remove_all(staging, ec);
        if (ec) LOG(WARNING) << "unable to remove staging directory " << staging << ": " << ec.message();
        throw;
    }
}

unique_ptr<sandbox_session> runtime_loader::launch(const cancellation_token &token) const {
    sandbox_command command;
    command.argv = {PYTHON_HOST.string(), "--runtime-dir", runtime.install_dir().string()};
    command.work_dir = runtime.install_dir();

    auto session = make_unique<sandbox_session>(move(command));
    try {
        session->start();
    } catch (const internal_error &ex) {
        throw runtime_unavailable(fmt::format("Unable to start Python runtime: {}", ex.what()));
    }

    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(RUNTIME_LOAD_TIMEOUT_MS);
    auto status = wait_for_ready(*session, deadline, [&] { token.throw_if_cancelled(); });
    if (status == sandbox_session::wait_status::TIMEOUT)
        throw runtime_unavailable("Python runtime initialization timed out");
    if (status == sandbox_session::wait_status::CLOSED) {
        string diagnostics = session->take_diagnostics();
        LOG(ERROR) << "python host exited during startup: " << diagnostics;
        throw runtime_unavailable(fmt::format("Python runtime failed to start: {}", diagnostics));
    }
    return session;
}

}  // namespace grader
