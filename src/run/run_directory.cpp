#include "run/run_directory.hpp"
#include <glog/logging.h>
#include <utility>
#include <vector>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/path_sanitizer.hpp"
#include "common/utils.hpp"
#include "run/language_profile.hpp"

namespace runner {
using namespace std;
namespace fs = std::filesystem;

run_directory::run_directory(const fs::path &dir, monitor &mon)
    : dir(dir), mon(&mon), done(false) {}

run_directory::run_directory(run_directory &&other)
    : dir(move(other.dir)), mon(other.mon), done(other.done) {
    other.done = true;
}

run_directory::~run_directory() {
    remove();
}

const fs::path &run_directory::path() const {
    return dir;
}

string run_directory::id() const {
    return dir.filename().string();
}

bool run_directory::released() const {
    return done;
}

bool run_directory::remove() {
    error_code ec;
    if (done) return !fs::exists(dir, ec) && !ec;
    done = true;

    fs::remove_all(dir, ec);
    if (ec) {
        LOG(ERROR) << "Unable to delete run directory " << dir << ": " << ec.message();
        try {
            mon->cleanup_failed(dir, ec.message());
        } catch (exception &ex) {
            LOG(ERROR) << "Monitor crashed when reporting cleanup failure, " << ex.what();
        }
        return false;
    }
    DLOG(INFO) << "Deleted run directory " << dir;
    return true;
}

run_directory_builder::run_directory_builder(const fs::path &root, workspace_store &store, monitor &mon)
    : root(root), store(store), mon(mon) {}

void run_directory_builder::copy_workspace(const string &workspace_id, const fs::path &dir) {
    vector<string> files;
    try {
        files = store.list(workspace_id);
    } catch (exception &ex) {
        // 工作区只是便利功能，不是运行的硬依赖
        LOG(WARNING) << "Unable to list workspace " << workspace_id << ": " << ex.what();
        mon.workspace_copy_failed(workspace_id, "", ex.what());
        return;
    }

    for (auto &file : files) {
        try {
            fs::path target = resolve_in(dir, file);
            write_file_content(target, store.read(workspace_id, file));
        } catch (exception &ex) {
            LOG(WARNING) << "Skipping file " << file << " of workspace " << workspace_id << ": " << ex.what();
            mon.workspace_copy_failed(workspace_id, file, ex.what());
        }
    }
}

run_directory run_directory_builder::build(const run_request &request) {
    fs::path dir = root / ("run_" + random_uuid());

    // 在创建目录之前完成所有的名字检查，非法的请求不会产生任何文件系统写入
    optional<string> workspace_id;
    if (request.workspace_id) {
        resolve_in(dir, *request.workspace_id);
        workspace_id = sanitize_name(*request.workspace_id);
    }

    vector<pair<fs::path, const string *>> supplied;
    for (auto &file : request.files) {
        string name = file.name ? *file.name : "file_" + random_uuid();
        supplied.emplace_back(resolve_in(dir, name), &file.content);
    }

    fs::create_directories(root);
    if (!fs::create_directory(dir))
        throw system_error(make_error_code(errc::file_exists), "run directory " + dir.string() + " already exists");

    // 从这里开始目录由 handle 持有，构建过程中抛出异常也会删除目录
    run_directory handle(dir, mon);

    if (workspace_id) copy_workspace(*workspace_id, dir);

    for (auto &[path, content] : supplied)
        write_file_content(path, *content);

    write_file_content(dir / STDIN_FILE, request.stdin_text);

    DLOG(INFO) << "Built run directory " << dir;
    return handle;
}

}  // namespace runner
