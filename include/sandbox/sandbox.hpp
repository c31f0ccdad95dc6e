#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "run/language_profile.hpp"
#include "run/run_request.hpp"

namespace runner {

/**
 * @brief 一次沙箱执行所需的全部信息
 */
struct sandbox_spec {
    /**
     * @brief 运行 id，用于命名容器
     */
    std::string run_id;

    /**
     * @brief 运行目录，沙箱只能看到这个目录
     */
    std::filesystem::path run_dir;

    std::string image;

    sandbox_command command;

    resource_limits limits;
};

/**
 * @brief 隔离技术
 * 隔离技术本身只负责把命令变成一个可以被监控的外部进程，
 * 进程的监控、输出收集、超时处理和结果分类都由 sandboxed_executor 完成。
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 启动沙箱的完整命令行，通过 execvp 执行，不经过 shell
     */
    virtual std::vector<std::string> launch_command(const sandbox_spec &spec) const = 0;

    /**
     * @brief 启动命令在宿主机上的工作路径，默认为运行目录
     */
    virtual std::filesystem::path working_directory(const sandbox_spec &spec) const;

    /**
     * @brief 宿主机看门狗触发时调用，销毁不在启动进程的进程组中的资源
     */
    virtual void terminate(const sandbox_spec &spec);

    /**
     * @brief 判断退出码是否表示隔离技术自身没能启动
     * 只在脚本没有写下执行状态时才会被调用，此时退出码不可能来自用户程序
     */
    virtual bool is_launch_failure(int exit_code) const;
};

/**
 * @brief 基于 docker 的沙箱
 * docker run --rm --name code-runner-<run id> --network none --user=<uid>:<gid>
 *     --memory=<m>m --cpus=<c> -v <run dir>:/code -w /code <image>
 *     bash -c <script> runner <entry> <time limit> <time limit in ms>
 * 容器以引擎自身的用户运行，用户程序在运行目录中创建的文件都可以被引擎删除
 */
struct docker_sandbox : public sandbox {
    /**
     * @param docker docker 可执行文件
     */
    explicit docker_sandbox(const std::string &docker = "docker");

    std::vector<std::string> launch_command(const sandbox_spec &spec) const override;

    /**
     * @brief 通过 docker kill 杀死容器，容器进程不是 docker 客户端的子进程，杀死进程组无法影响容器
     */
    void terminate(const sandbox_spec &spec) override;

    bool is_launch_failure(int exit_code) const override;

    static std::string container_name(const sandbox_spec &spec);

private:
    std::string docker;
};

}  // namespace runner
