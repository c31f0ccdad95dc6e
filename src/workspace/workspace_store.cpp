#include "workspace/workspace_store.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/path_sanitizer.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;
namespace fs = std::filesystem;

static const char *const HELLO_PYTHON = R"(def greet(name):
    print(f"Hello, {name}!")

if __name__ == '__main__':
    greet('World')
)";

static const char *const HELLO_JAVA = R"(public class Main {
  public static void main(String[] args) {
    System.out.println("Hello, World!");
  }
}
)";

static const char *const HELLO_CPP = R"(#include <bits/stdc++.h>
using namespace std;
int main(){ cout<<"Hello, World!\n"; return 0; }
)";

workspace_store::~workspace_store() {}

local_workspace_store::local_workspace_store(const fs::path &root)
    : root(root) {}

fs::path local_workspace_store::workspace_path(const string &workspace_id) const {
    return resolve_in(root, workspace_id);
}

string local_workspace_store::create() {
    string id = random_uuid();
    fs::path dir = workspace_path(id);
    fs::create_directories(dir);
    write_file_content(dir / "main.py", HELLO_PYTHON);
    write_file_content(dir / "Main.java", HELLO_JAVA);
    write_file_content(dir / "main.cpp", HELLO_CPP);
    LOG(INFO) << "Created workspace " << id;
    return id;
}

vector<string> local_workspace_store::list(const string &workspace_id) {
    fs::path dir = workspace_path(workspace_id);
    if (!fs::is_directory(dir))
        throw workspace_error("workspace " + workspace_id + " does not exist");
    return list_regular_files(dir);
}

string local_workspace_store::read(const string &workspace_id, const string &filename) {
    fs::path path = resolve_in(workspace_path(workspace_id), filename);
    if (!fs::is_regular_file(path))
        throw workspace_error("file " + filename + " does not exist in workspace " + workspace_id);
    return read_file_content(path);
}

void local_workspace_store::write(const string &workspace_id, const string &filename, const string &content) {
    fs::path dir = workspace_path(workspace_id);
    fs::path path = resolve_in(dir, filename);
    fs::create_directories(dir);
    write_file_content(path, content);
}

void local_workspace_store::remove(const string &workspace_id, const string &filename) {
    fs::path path = resolve_in(workspace_path(workspace_id), filename);
    fs::remove(path);
}

}  // namespace runner
