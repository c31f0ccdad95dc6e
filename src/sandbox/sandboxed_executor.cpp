#include "sandbox/sandboxed_executor.hpp"
#include <boost/algorithm/string.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include <cmath>
#include <filesystem>
#include <system_error>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace runner {
using namespace std;

sandboxed_executor::sandboxed_executor(unique_ptr<sandbox> box, int watchdog_margin, size_t stream_limit)
    : box(move(box)), watchdog_margin(watchdog_margin), stream_limit(stream_limit) {}

execution_outcome sandboxed_executor::execute(const sandbox_spec &spec) {
    // 运行目录中可能带有同名的用户文件，启动前必须删除，否则无法区分脚本是否正常结束
    error_code ec;
    filesystem::remove(spec.run_dir / STATUS_FILE, ec);
    if (ec) {
        LOG(ERROR) << "Unable to reset script status of run " << spec.run_id << ": " << ec.message();
        throw host_execution_error(fmt::format("unable to reset script status: {}", ec.message()));
    }

    process_options opt;
    opt.argv = box->launch_command(spec);
    opt.work_dir = box->working_directory(spec);
    opt.timeout = chrono::milliseconds((long long)ceil((spec.limits.time_limit + watchdog_margin) * 1000));
    opt.stream_limit = stream_limit;
    opt.on_timeout = [this, &spec] { box->terminate(spec); };

    process_result result;
    try {
        result = run_supervised(opt);
    } catch (system_error &ex) {
        LOG(ERROR) << "Unable to start sandbox for run " << spec.run_id << ": " << ex.what();
        throw host_execution_error(fmt::format("unable to start sandbox: {}", ex.what()));
    }

    execution_outcome outcome = classify(result, read_script_status(spec.run_dir), *box);
    DLOG(INFO) << "Run " << spec.run_id << " finished with " << get_display_message(outcome.status)
               << ", exit code " << outcome.exit_code << ", " << outcome.elapsed.count() << "ms";
    return outcome;
}

execution_outcome sandboxed_executor::classify(const process_result &result, const optional<script_status> &status, const sandbox &box) {
    execution_outcome outcome;
    outcome.stdout_text = result.out;
    outcome.stderr_text = result.err;
    outcome.stdout_truncated = result.out_truncated;
    outcome.stderr_truncated = result.err_truncated;
    outcome.elapsed = result.elapsed;
    outcome.exit_code = result.exit_code;

    if (!result.launched) {
        outcome.status = outcome_status::HOST_ERROR;
        outcome.exit_code = -1;
        outcome.detail = result.launch_error;
    } else if (result.timed_out) {
        outcome.status = outcome_status::TIMEOUT;
        outcome.detail = "host watchdog expired";
    } else if (status) {
        // 脚本正常结束，退出码属于用户程序或者编译阶段，与隔离技术无关
        outcome.exit_code = status->exit_code;
        switch (status->phase) {
            case script_status::TIME_LIMIT:
                outcome.status = outcome_status::TIMEOUT;
                outcome.detail = "time limit exceeded";
                break;
            case script_status::BUILD_FAILED:
                outcome.status = outcome_status::BUILD_FAILURE;
                break;
            case script_status::EXITED:
                outcome.status = outcome_status::NORMAL;
                break;
        }
    } else if (box.is_launch_failure(result.exit_code)) {
        outcome.status = outcome_status::HOST_ERROR;
        string reason = boost::trim_copy(result.err);
        outcome.detail = reason.empty() ? fmt::format("sandbox failed to start, exit code {}", result.exit_code) : reason;
    } else {
        // 脚本没有写下状态就结束了，例如 bash 本身被杀死
        outcome.status = outcome_status::NORMAL;
    }
    return outcome;
}

}  // namespace runner
