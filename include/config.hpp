#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace runner {

/**
 * @brief 沙箱内脚本与引擎之间约定的退出码
 */
enum error_codes {
    E_SUCCESS = 0,

    /**
     * @brief 编译器输出了诊断信息，脚本打印诊断信息后以该退出码退出
     * 引擎不从退出码判断编译失败，而是读取脚本写下的执行状态
     */
    E_BUILD_FAILURE = 42,

    /**
     * @brief coreutils 的 timeout 在沙箱内的时间限制到期时返回该退出码
     * 用户程序也可以以该退出码退出，脚本需要结合运行时间才能确定是否超时
     */
    E_TIME_LIMIT = 124,

    /**
     * @brief docker run 自身失败（镜像不存在、守护进程不可用）时的退出码
     */
    E_DOCKER_LAUNCH_FAILURE = 125,

    /**
     * @brief 镜像中的 bash 无法执行
     */
    E_DOCKER_COMMAND_NOT_EXECUTABLE = 126,

    /**
     * @brief 镜像中没有 bash
     */
    E_DOCKER_COMMAND_NOT_FOUND = 127
};

/**
 * @brief 运行引擎的配置
 * 全部字段都有默认值，可以被配置文件、命令行参数、环境变量依次覆盖
 */
struct runner_config {
    /**
     * @brief 所有运行目录的根目录
     * RUN_DIR
     * ├── run_2f1c...  // 每次运行新建的目录，名字来自随机 uuid
     * │   ├── main.cpp // 工作区复制过来的文件，以及请求中携带的文件
     * │   ├── input.txt // 标准输入
     * │   ├── compile.txt // 编译器的诊断信息
     * │   ├── status.txt // 脚本写下的执行状态
     * │   └── a.out
     * └── ...
     */
    std::filesystem::path run_dir;

    /**
     * @brief 本地工作区存储的根目录，每个工作区为其中的一个子目录
     */
    std::filesystem::path workspace_dir;

    /**
     * @brief docker 可执行文件，可以是绝对路径或者 PATH 中的名字
     */
    std::string docker = "docker";

    /**
     * @brief 覆盖语言默认的沙箱镜像，键为语言名
     */
    std::map<std::string, std::string> images;

    /**
     * @brief 同时运行的沙箱数量上限，为 0 时使用 CPU 核心数
     */
    size_t max_concurrent_runs = 0;

    /**
     * @brief 宿主机看门狗比沙箱内时间限制多出的秒数
     */
    int watchdog_margin = 10;

    /**
     * @brief stdout、stderr 各自保留的最大字节数
     */
    size_t stream_limit = 4 << 20;
};

void from_json(const nlohmann::json &j, runner_config &config);

/**
 * @brief 从 JSON 配置文件读取配置，文件中不存在的字段保持 config 中原有的值
 * @throw std::exception 文件不存在或格式错误
 */
void load_config(const std::filesystem::path &path, runner_config &config);

/**
 * @brief 实际生效的并发运行上限
 */
size_t effective_concurrency(const runner_config &config);

}  // namespace runner
