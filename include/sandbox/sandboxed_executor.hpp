#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include "common/process.hpp"
#include "run/execution_outcome.hpp"
#include "run/language_profile.hpp"
#include "sandbox/sandbox.hpp"

namespace runner {

/**
 * @brief 在沙箱中执行命令，并将原始的执行结果分类为 execution_outcome
 * 用户程序的任何异常行为（编译失败、超时、崩溃、非零退出码）都表示为结果而非异常。
 */
struct sandboxed_executor {
    /**
     * @param box 隔离技术
     * @param watchdog_margin 宿主机看门狗比沙箱内时间限制多出的秒数
     * @param stream_limit stdout、stderr 各自保留的最大字节数
     */
    sandboxed_executor(std::unique_ptr<sandbox> box, int watchdog_margin, size_t stream_limit);

    /**
     * @brief 执行沙箱命令直到其退出或者被看门狗杀死
     * @throw host_execution_error 宿主机无法创建任何进程（fork、pipe 失败），或者无法重置执行状态文件
     */
    execution_outcome execute(const sandbox_spec &spec);

    /**
     * @brief 结果分类，按优先级依次为：
     * 1. 启动程序无法被 exec：HOST_ERROR
     * 2. 宿主机看门狗触发：TIMEOUT
     * 3. 脚本写下了执行状态：按状态分为 TIMEOUT、BUILD_FAILURE、NORMAL
     * 4. 没有执行状态，且隔离技术报告自身启动失败：HOST_ERROR
     * 5. 其他情况：NORMAL，退出码原样返回
     * 用户程序的退出码不会被解释，即使它恰好等于某个约定值。
     * @param status 脚本写入运行目录的执行状态
     */
    static execution_outcome classify(const process_result &result, const std::optional<script_status> &status, const sandbox &box);

private:
    std::unique_ptr<sandbox> box;
    int watchdog_margin;
    size_t stream_limit;
};

}  // namespace runner
