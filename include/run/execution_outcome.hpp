#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace runner {

/**
 * @brief 一次沙箱运行的结果类型，每次运行恰好得到其中一种
 */
enum class outcome_status {
    /**
     * @brief 程序正常结束（退出码可能非零，非零退出码也是正常的运行结果）
     */
    NORMAL = 0,

    /**
     * @brief 编译器输出了诊断信息，诊断信息保存在输出中
     */
    BUILD_FAILURE = 1,

    /**
     * @brief 沙箱内的时间限制或宿主机看门狗到期，进程树已经被杀死
     */
    TIMEOUT = 2,

    /**
     * @brief 隔离技术本身无法启动（docker 不可用、镜像不存在）
     */
    HOST_ERROR = 3
};

const char *get_display_message(outcome_status);

/**
 * @brief 一次运行的完整结果，不会只填充一部分
 */
struct execution_outcome {
    outcome_status status = outcome_status::NORMAL;

    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 沙箱进程的退出码，HOST_ERROR 且进程未能启动时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 可读的补充说明，HOST_ERROR 时为失败原因，TIMEOUT 时说明是哪个计时器到期
     */
    std::optional<std::string> detail;

    bool stdout_truncated = false;
    bool stderr_truncated = false;

    std::chrono::milliseconds elapsed{0};
};

void to_json(nlohmann::json &j, const execution_outcome &outcome);

}  // namespace runner
