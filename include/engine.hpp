#pragma once

#include <memory>
#include "common/admission_gate.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "monitor/monitor.hpp"
#include "run/execution_outcome.hpp"
#include "run/language_profile.hpp"
#include "run/run_directory.hpp"
#include "run/run_request.hpp"
#include "sandbox/sandboxed_executor.hpp"
#include "workspace/workspace_store.hpp"

namespace runner {

/**
 * @brief 运行编排引擎
 * 将一个运行请求变成一次完全隔离的沙箱执行：
 * 1. 检查语言是否支持，不支持则立即失败，不会创建任何目录
 * 2. 构建运行目录（工作区文件、附带文件、标准输入）
 * 3. 选择入口文件，组合沙箱命令
 * 4. 获取准入名额，在沙箱中执行
 * 5. 分类执行结果，删除运行目录
 *
 * run 可以被多个线程并发调用，每次运行只操作自己的运行目录。
 */
struct run_engine {
    /**
     * @param config 引擎配置，run_dir 为执行根目录
     * @param store 工作区存储，引擎只从中读取
     * @param box 隔离技术
     * @param mon 监控器，可以为空，不由引擎持有
     */
    run_engine(const runner_config &config, workspace_store &store, std::unique_ptr<sandbox> box, monitor *mon = nullptr);

    run_engine(const run_engine &) = delete;
    run_engine &operator=(const run_engine &) = delete;

    /**
     * @brief 执行一次运行请求
     * 无论结果如何，返回时运行目录都已经被删除
     * @return 用户程序的运行结果，包括编译失败、超时、非零退出码
     * @throw unsupported_language 语言不受支持
     * @throw invalid_path 工作区 id 或文件名非法
     * @throw host_execution_error 宿主机无法创建运行目录或启动进程
     */
    execution_outcome run(const run_request &request);

private:
    void report_failure(const runner_exception &ex);

    runner_config config;
    guarded_monitor mon;
    language_profile_resolver resolver;
    run_directory_builder builder;
    sandboxed_executor executor;
    admission_gate gate;
};

}  // namespace runner
