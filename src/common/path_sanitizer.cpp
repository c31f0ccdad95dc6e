#include "common/path_sanitizer.hpp"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <vector>
#include "common/exceptions.hpp"

namespace runner {
using namespace std;
namespace fs = std::filesystem;

static bool is_safe_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '.' || c == '-';
}

string sanitize_name(const string &name) {
    string result = name;
    for (char &c : result)
        if (!is_safe_char(c)) c = '_';
    return result;
}

bool is_contained_in(const fs::path &root, const fs::path &path) {
    fs::path base = fs::weakly_canonical(fs::absolute(root));
    fs::path target = fs::weakly_canonical(fs::absolute(path));

    // 按路径段比较，避免 /tmp/run 与 /tmp/run2 这种字符串前缀误判
    fs::path relative = target.lexically_relative(base);
    if (relative.empty() || relative == ".") return false;
    return *relative.begin() != "..";
}

fs::path resolve_in(const fs::path &root, const string &raw_name) {
    if (raw_name.empty())
        throw invalid_path("empty name");
    if (raw_name.find('\0') != string::npos)
        throw invalid_path("name contains NUL byte");
    if (raw_name.front() == '/' || raw_name.front() == '\\')
        throw invalid_path("absolute name is not allowed: " + raw_name);

    vector<string> segments;
    boost::split(segments, raw_name, boost::is_any_of("/\\"));
    for (auto &segment : segments)
        if (segment == "..")
            throw invalid_path("name traverses to parent directory: " + raw_name);

    fs::path path = root / sanitize_name(raw_name);
    if (!is_contained_in(root, path))
        throw invalid_path("name escapes " + root.string() + ": " + raw_name);
    return path;
}

}  // namespace runner
