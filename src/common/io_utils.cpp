#include "common/io_utils.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace runner {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    fout.flush();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

vector<string> list_regular_files(const fs::path &dir) {
    vector<string> files;
    for (auto &entry : fs::directory_iterator(dir))
        if (entry.is_regular_file())
            files.push_back(entry.path().filename().string());
    sort(files.begin(), files.end());
    return files;
}

int count_directories_in_directory(const fs::path &dir) {
    if (!fs::is_directory(dir))
        return -1;
    return count_if(fs::directory_iterator(dir), {}, [](const fs::directory_entry &entry) { return entry.is_directory(); });
}

}  // namespace runner
