#include "run/language_profile.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace runner {
using namespace std;

const char *const STDIN_FILE = "input.txt";
const char *const BUILD_LOG_FILE = "compile.txt";
const char *const STATUS_FILE = "status.txt";

static map<string, language_profile> default_profiles() {
    map<string, language_profile> profiles;

    // clang-format off
    profiles["python"] = {
        "python", "main.py", ".py", "python:3.11-slim",
        {nullopt,
         R"(timeout "$2"s python3 ./"$1" < input.txt)"}};

    profiles["cpp"] = {
        "cpp", "main.cpp", ".cpp", "gcc:12",
        {R"(g++ -std=c++17 ./"$1" -O2 -o a.out)",
         R"(timeout "$2"s ./a.out < input.txt)"}};

    // 类名与入口文件名一致，去掉 .java 后缀即为要运行的类
    profiles["java"] = {
        "java", "Main.java", ".java", "openjdk:17",
        {R"(javac ./*.java)",
         R"(timeout "$2"s java "${1%.java}" < input.txt)"}};
    // clang-format on

    return profiles;
}

language_profile_resolver::language_profile_resolver(const map<string, string> &images)
    : profiles(default_profiles()) {
    for (auto &[language, image] : images) {
        auto it = profiles.find(language);
        if (it == profiles.end()) {
            LOG(WARNING) << "Ignoring image override for unsupported language " << language;
            continue;
        }
        it->second.image = image;
    }
}

const language_profile &language_profile_resolver::resolve(const string &language) const {
    auto it = profiles.find(language);
    if (it == profiles.end())
        throw unsupported_language(language);
    return it->second;
}

static bool ends_with(const string &s, const string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

string language_profile_resolver::find_entry(const language_profile &profile, const vector<string> &listing) {
    if (find(listing.begin(), listing.end(), profile.entry_file) != listing.end())
        return profile.entry_file;
    for (auto &file : listing)
        if (ends_with(file, profile.extension) && file[0] != '-')
            return file;
    return profile.entry_file;
}

sandbox_command language_profile_resolver::compose(const language_profile &profile, const string &entry, const resource_limits &limits) {
    sandbox_command command;
    if (profile.commands.build) {
        // 编译器返回非零不能中断脚本，是否编译失败只看诊断信息是否为空
        command.script = fmt::format(
            "{build} 2> {log} || true\n"
            "if [ -s {log} ]; then cat {log}; echo \"build {code}\" > {status}; exit {code}; fi\n",
            fmt::arg("build", *profile.commands.build),
            fmt::arg("log", BUILD_LOG_FILE),
            fmt::arg("code", (int)E_BUILD_FAILURE),
            fmt::arg("status", STATUS_FILE));
    }

    // 用户程序自己也可能以 124 退出，只有运行时间达到时间限制时才是 timeout 杀死了它
    command.script += fmt::format(
        "start=$(date +%s%N)\n"
        "{run}\n"
        "code=$?\n"
        "if [ \"$code\" -eq {limit_code} ] && [ $(( ($(date +%s%N) - start) / 1000000 )) -ge \"$3\" ]; then phase=timeout; else phase=exit; fi\n"
        "echo \"$phase $code\" > {status}\n"
        "exit \"$code\"\n",
        fmt::arg("run", profile.commands.run),
        fmt::arg("limit_code", (int)E_TIME_LIMIT),
        fmt::arg("status", STATUS_FILE));

    command.args = {entry,
                    fmt::format("{}", limits.time_limit),
                    fmt::format("{}", (long long)llround(limits.time_limit * 1000))};
    return command;
}

vector<string> language_profile_resolver::supported_languages() const {
    vector<string> languages;
    for (auto &[language, profile] : profiles)
        languages.push_back(language);
    return languages;
}

optional<script_status> read_script_status(const filesystem::path &run_dir) {
    filesystem::path path = run_dir / STATUS_FILE;
    error_code ec;
    if (!filesystem::is_regular_file(path, ec)) return nullopt;

    string content;
    try {
        content = read_file_content(path);
    } catch (system_error &ex) {
        LOG(WARNING) << "Unable to read script status " << path << ": " << ex.what();
        return nullopt;
    }

    istringstream in(content);
    string phase;
    int exit_code;
    if (!(in >> phase >> exit_code)) {
        LOG(WARNING) << "Malformed script status " << path << ": " << content;
        return nullopt;
    }

    if (phase == "exit") return script_status{script_status::EXITED, exit_code};
    if (phase == "timeout") return script_status{script_status::TIME_LIMIT, exit_code};
    if (phase == "build") return script_status{script_status::BUILD_FAILED, exit_code};
    LOG(WARNING) << "Unknown script phase " << phase << " in " << path;
    return nullopt;
}

}  // namespace runner
