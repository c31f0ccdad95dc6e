#pragma once

#include <atomic>
#include "sandbox/sandbox.hpp"

namespace runner::test {

/**
 * @brief 测试用的沙箱，直接在宿主机上以 bash 执行命令，不做任何隔离
 * 用于在没有 docker 的环境下测试运行引擎，只有 python3、g++ 可用
 *     bash -c <script> runner <entry> <time limit> <time limit in ms>
 * 工作路径为运行目录，与容器内的 /code 相同
 */
struct local_sandbox : public sandbox {
    std::vector<std::string> launch_command(const sandbox_spec &spec) const override;

    void terminate(const sandbox_spec &spec) override;

    /**
     * @brief terminate 被调用的次数
     */
    std::atomic<int> terminated{0};
};

/**
 * @brief 启动命令不存在的沙箱，模拟隔离技术不可用
 */
struct missing_sandbox : public sandbox {
    std::vector<std::string> launch_command(const sandbox_spec &spec) const override;
};

}  // namespace runner::test
