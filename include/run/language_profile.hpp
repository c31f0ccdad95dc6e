#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "run/run_request.hpp"

namespace runner {

/**
 * @brief 运行目录中固定名字的文件
 */
extern const char *const STDIN_FILE;       // input.txt
extern const char *const BUILD_LOG_FILE;   // compile.txt
extern const char *const STATUS_FILE;      // status.txt

/**
 * @brief 沙箱内脚本结束前写入 STATUS_FILE 的执行状态
 * 用户程序可以以任意退出码退出，因此脚本的阶段不能从退出码推断，
 * 只能由脚本在用户程序结束后写入这个文件告知引擎。
 * 文件内容为一行 "<phase> <exit code>"，phase 为 exit、timeout、build 之一。
 */
struct script_status {
    enum phase_t {
        EXITED,       // 用户程序自行退出
        TIME_LIMIT,   // 沙箱内的 timeout 在时间限制到期时杀死了用户程序
        BUILD_FAILED  // 编译器输出了诊断信息，用户程序没有运行
    } phase;

    int exit_code;
};

/**
 * @brief 读取运行目录中脚本写下的执行状态
 * @return 文件不存在或格式错误时为空，说明脚本没有正常结束
 */
std::optional<script_status> read_script_status(const std::filesystem::path &run_dir);

/**
 * @brief 语言的两阶段命令模板
 * 模板是固定的 shell 脚本片段，只通过位置参数 "$1"（入口文件）、"$2"（时间限制，秒）、
 * "$3"（时间限制，毫秒）获取运行参数，文件名和限制永远不会被拼接进脚本文本中。
 * 入口文件总是以 ./"$1" 的形式传给编译器和解释器，以免以 - 开头的文件名被当作选项。
 */
struct command_template {
    /**
     * @brief 编译阶段，解释型语言没有编译阶段
     * 编译器的诊断信息必须写入 BUILD_LOG_FILE，且编译失败不能中断脚本
     */
    std::optional<std::string> build;

    /**
     * @brief 运行阶段，从 STDIN_FILE 读取标准输入
     */
    std::string run;
};

/**
 * @brief 语言的静态配置，启动后只读
 */
struct language_profile {
    std::string language;

    /**
     * @brief 首选的入口文件名
     */
    std::string entry_file;

    /**
     * @brief 找不到首选入口文件时，使用第一个有该后缀的文件
     */
    std::string extension;

    /**
     * @brief 沙箱镜像
     */
    std::string image;

    command_template commands;
};

/**
 * @brief 交给沙箱执行的命令：固定的脚本加上类型明确的参数
 * 在沙箱中以 bash -c <script> <program_name> <args...> 的方式执行
 */
struct sandbox_command {
    std::string script;
    std::vector<std::string> args;
};

/**
 * @brief 语言到运行方式的映射
 * 支持的语言在构造时确定，之后不再改变，因此可以在多个运行之间并发使用
 */
struct language_profile_resolver {
    /**
     * @param images 覆盖语言的默认镜像，键为语言名，未知语言的键会被忽略
     */
    explicit language_profile_resolver(const std::map<std::string, std::string> &images = {});

    /**
     * @brief 根据语言标识查找语言配置
     * @throw unsupported_language 语言不在支持的集合中
     */
    const language_profile &resolve(const std::string &language) const;

    /**
     * @brief 选择入口文件
     * 1. 首选入口文件在目录中时使用它
     * 2. 否则使用第一个有该语言后缀、且不以 - 开头的文件（listing 应当已经排序）
     * 3. 都不存在时仍然使用首选入口文件名，由沙箱内报告文件不存在
     */
    static std::string find_entry(const language_profile &profile, const std::vector<std::string> &listing);

    /**
     * @brief 组合出交给沙箱执行的命令
     * 脚本在结束前把执行状态写入 STATUS_FILE，参见 script_status
     */
    static sandbox_command compose(const language_profile &profile, const std::string &entry, const resource_limits &limits);

    std::vector<std::string> supported_languages() const;

private:
    std::map<std::string, language_profile> profiles;
};

}  // namespace runner
