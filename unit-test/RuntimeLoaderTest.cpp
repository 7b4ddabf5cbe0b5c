#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "runtime/loader.hpp"
#include "test/sandbox.hpp"

using namespace std;
using namespace grader;

class RuntimeLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache_dir = make_test_cache_dir(::testing::UnitTest::GetInstance()->current_test_info()->name());
        saved_python_host = PYTHON_HOST;
        // 安装流程结束后 python-host 无法启动，加载总是在 loading 阶段失败
        PYTHON_HOST = cache_dir / "no-such-python-host";
    }

    void TearDown() override {
        PYTHON_HOST = saved_python_host;
        filesystem::remove_all(cache_dir);
    }

    static runtime_package make_package(size_t size = 100) {
        runtime_package package;
        package.name = "python";
        package.version = "test";
        package.assets.push_back(make_shared<text_asset>("prelude.py", "import math\n"));
        package.assets.push_back(make_shared<text_asset>("data/blob.txt", string(size, 'x')));
        return package;
    }

    static memory_probe fixed_memory(double gb) {
        return [gb] { return evaluate_memory_pressure(gb); };
    }

    progress_callback recorder() {
        return [this](const runtime_load_progress &progress) { reports.push_back(progress); };
    }

    vector<runtime_load_stage> stages() const {
        vector<runtime_load_stage> result;
        for (auto &report : reports)
            if (result.empty() || result.back() != report.stage) result.push_back(report.stage);
        return result;
    }

    filesystem::path cache_dir;
    filesystem::path saved_python_host;
    vector<runtime_load_progress> reports;
};

TEST_F(RuntimeLoaderTest, CriticalMemoryRefusesToLoadTest) {
    runtime_loader loader(make_package(), fixed_memory(1.0));
    cancellation_token token;
    try {
        loader.load(recorder(), token);
        FAIL() << "load should throw";
    } catch (const runtime_unavailable &ex) {
        EXPECT_STREQ(ex.what(), "Your device has very limited memory. The Python runtime may not work properly.");
    }

    EXPECT_EQ(stages(), (vector<runtime_load_stage>{runtime_load_stage::CHECKING, runtime_load_stage::ERROR}));
    EXPECT_EQ(reports.back().progress, 0);
    EXPECT_FALSE(loader.is_cached());
}

TEST_F(RuntimeLoaderTest, InstallsPackageIntoCacheTest) {
    runtime_loader loader(make_package(200 * 1024), fixed_memory(8));
    cancellation_token token;
    EXPECT_FALSE(loader.is_cached());
    EXPECT_THROW(loader.load(recorder(), token), runtime_unavailable);

    EXPECT_TRUE(loader.is_cached());
    auto install_dir = loader.package().install_dir();
    EXPECT_EQ(install_dir, cache_dir / "runtimes" / "python-test");
    EXPECT_EQ(read_file_content(install_dir / "prelude.py"), "import math\n");
    EXPECT_EQ(filesystem::file_size(install_dir / "data" / "blob.txt"), 200u * 1024);

    EXPECT_EQ(stages(), (vector<runtime_load_stage>{runtime_load_stage::CHECKING, runtime_load_stage::DOWNLOADING,
                                                    runtime_load_stage::LOADING, runtime_load_stage::ERROR}));

    // 进度单调不减，下载阶段在 10% 到 85% 之间
    int last = 0;
    for (auto &report : reports) {
        if (report.stage == runtime_load_stage::ERROR) break;
        EXPECT_GE(report.progress, last);
        last = report.progress;
        if (report.stage == runtime_load_stage::DOWNLOADING) {
            EXPECT_GE(report.progress, 10);
            EXPECT_LE(report.progress, 85);
        }
    }

    auto last_download = find_if(reports.rbegin(), reports.rend(), [](auto &report) { return report.stage == runtime_load_stage::DOWNLOADING; });
    ASSERT_NE(last_download, reports.rend());
    EXPECT_EQ(last_download->progress, 85);
    EXPECT_EQ(last_download->downloaded_bytes, last_download->total_bytes);
    EXPECT_EQ(last_download->message, "Downloading Python runtime (85%)...");

    auto loading = find_if(reports.begin(), reports.end(), [](auto &report) { return report.stage == runtime_load_stage::LOADING; });
    ASSERT_NE(loading, reports.end());
    EXPECT_EQ(loading->progress, 90);
    EXPECT_EQ(loading->message, "Initializing Python environment...");

    // 没有留下临时目录
    for (auto &entry : filesystem::directory_iterator(cache_dir / "runtimes"))
        EXPECT_EQ(entry.path().filename().string().find(".staging"), string::npos) << entry.path();
}

TEST_F(RuntimeLoaderTest, CachedRuntimeSkipsDownloadTest) {
    runtime_loader loader(make_package(), fixed_memory(8));
    cancellation_token token;
    EXPECT_THROW(loader.load(nullptr, token), runtime_unavailable);
    ASSERT_TRUE(loader.is_cached());

    EXPECT_THROW(loader.load(recorder(), token), runtime_unavailable);
    EXPECT_EQ(stages(), (vector<runtime_load_stage>{runtime_load_stage::CHECKING, runtime_load_stage::LOADING, runtime_load_stage::ERROR}));
    ASSERT_GE(reports.size(), 2u);
    EXPECT_EQ(reports[1].progress, 10);
    EXPECT_EQ(reports[1].message, "Loading Python runtime from cache...");
}

TEST_F(RuntimeLoaderTest, CancelledBeforeLoadTest) {
    runtime_loader loader(make_package(), fixed_memory(8));
    cancellation_token token;
    token.cancel();
    EXPECT_THROW(loader.load(recorder(), token), load_cancelled);
    EXPECT_FALSE(loader.is_cached());
    EXPECT_EQ(reports.back().stage, runtime_load_stage::ERROR);

    token.reset();
    EXPECT_FALSE(token.cancelled());
}

TEST_F(RuntimeLoaderTest, CancelDuringDownloadTest) {
    runtime_loader loader(make_package(1024 * 1024), fixed_memory(8));
    cancellation_token token;
    auto on_progress = [&](const runtime_load_progress &progress) {
        reports.push_back(progress);
        if (progress.stage == runtime_load_stage::DOWNLOADING && progress.downloaded_bytes) token.cancel();
    };
    EXPECT_THROW(loader.load(on_progress, token), load_cancelled);

    EXPECT_FALSE(loader.is_cached());
    EXPECT_FALSE(filesystem::exists(loader.package().install_dir()));
    for (auto &entry : filesystem::directory_iterator(cache_dir / "runtimes"))
        EXPECT_EQ(entry.path().filename().string().find(".staging"), string::npos) << entry.path();
}

TEST_F(RuntimeLoaderTest, UnsafeAssetNameTest) {
    runtime_package package = make_package();
    package.assets.push_back(make_shared<text_asset>("../escape.py", "print(1)\n"));
    runtime_loader loader(package, fixed_memory(8));
    cancellation_token token;
    EXPECT_THROW(loader.load(recorder(), token), runtime_unavailable);
    EXPECT_FALSE(loader.is_cached());
    EXPECT_FALSE(filesystem::exists(cache_dir / "escape.py"));
    EXPECT_EQ(reports.back().stage, runtime_load_stage::ERROR);
}

TEST_F(RuntimeLoaderTest, LowMemoryStillLoadsTest) {
    runtime_loader loader(make_package(), fixed_memory(2.5));
    cancellation_token token;
    EXPECT_THROW(loader.load(recorder(), token), runtime_unavailable);
    // 内存偏低只给出警告，安装照常进行
    EXPECT_TRUE(loader.is_cached());
}

TEST_F(RuntimeLoaderTest, PythonPackageManifestTest) {
    runtime_package package = load_python_package();
    EXPECT_EQ(package.name, "python");
    EXPECT_FALSE(package.version.empty());
    ASSERT_FALSE(package.assets.empty());
    EXPECT_EQ(package.assets[0]->name, "prelude.py");
    EXPECT_GT(package.total_size(), 0u);
}
