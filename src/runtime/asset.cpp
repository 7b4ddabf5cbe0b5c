#include "runtime/asset.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>
#include "common/io_utils.hpp"

namespace grader {
using namespace std;

const size_t COPY_CHUNK_SIZE = 64 * 1024;

asset::asset(const string &name) : name(name) {}

static ofstream open_target(const filesystem::path &dir, const string &name) {
    auto target = dir / assert_safe_path(name);
    filesystem::create_directories(target.parent_path());
    ofstream fout(target, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create " + target.string());
    return fout;
}

local_asset::local_asset(const string &name, const filesystem::path &path)
    : asset(name), path(path) {}

uint64_t local_asset::size() const {
    return filesystem::file_size(path);
}

void local_asset::fetch(const filesystem::path &dir, const chunk_callback &on_chunk) const {
    ifstream fin(path, ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    ofstream fout = open_target(dir, name);

    char buf[COPY_CHUNK_SIZE];
    while (fin) {
        fin.read(buf, sizeof(buf));
        streamsize n = fin.gcount();
        if (n <= 0) break;
        fout.write(buf, n);
        if (!fout)
            throw system_error(errno, system_category(), "unable to write " + (dir / name).string());
        if (on_chunk) on_chunk(n);
    }
    if (fin.bad())
        throw system_error(errno, system_category(), "unable to read " + path.string());
}

text_asset::text_asset(const string &name, const string &text)
    : asset(name), text(text) {}

uint64_t text_asset::size() const {
    return text.size();
}

void text_asset::fetch(const filesystem::path &dir, const chunk_callback &on_chunk) const {
    ofstream fout = open_target(dir, name);
    for (size_t offset = 0; offset < text.size(); offset += COPY_CHUNK_SIZE) {
        size_t n = min(COPY_CHUNK_SIZE, text.size() - offset);
        fout.write(text.data() + offset, n);
        if (!fout)
            throw system_error(errno, system_category(), "unable to write " + (dir / name).string());
        if (on_chunk) on_chunk(n);
    }
}

}  // namespace grader
