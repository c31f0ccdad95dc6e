#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace runner {

/**
 * @brief 受监控运行的外部进程的参数
 */
struct process_options {
    /**
     * @brief 外部命令的路径 (argv[0]) 和参数，通过 execvp 执行，不经过 shell
     */
    std::vector<std::string> argv;

    /**
     * @brief 子进程的工作路径
     */
    std::filesystem::path work_dir;

    /**
     * @brief 宿主机看门狗的时限，超时后杀死整个进程组
     */
    std::chrono::milliseconds timeout{0};

    /**
     * @brief stdout、stderr 各自最多保留的字节数，超出部分读出后丢弃
     */
    size_t stream_limit = 4 << 20;

    /**
     * @brief 看门狗触发时、杀死进程组之前调用，用于清理不在本进程组内的资源（比如容器）
     */
    std::function<void()> on_timeout;
};

struct process_result {
    /**
     * @brief 进程是否成功被 exec，若为 false，launch_error 保存失败原因
     */
    bool launched = false;
    std::string launch_error;

    /**
     * @brief 进程的退出码，如果因为信号终止，则为 128 + 信号编号
     */
    int exit_code = -1;
    int term_signal = 0;

    /**
     * @brief 宿主机看门狗是否触发
     */
    bool timed_out = false;

    std::string out, err;
    bool out_truncated = false;
    bool err_truncated = false;

    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief 在看门狗下运行外部进程并收集输出
 * 1. 创建 stdout、stderr 管道，以及一个 CLOEXEC 管道用于报告 exec 失败
 * 2. fork 子进程，子进程分离到独立的进程组，标准输入重定向到 /dev/null
 * 3. 父进程通过 poll 读取输出直到子进程退出或看门狗超时
 * 4. 超时则调用 on_timeout，然后通过 SIGKILL 杀死整个进程组
 * 5. 子进程退出后同样杀死进程组，确保后台进程不会留驻系统
 * @throw std::system_error 无法创建管道或 fork 失败
 */
process_result run_supervised(const process_options &opt);

}  // namespace runner
