#include "run/execution_outcome.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

const char *get_display_message(outcome_status status) {
    switch (status) {
        case outcome_status::NORMAL: return "normal";
        case outcome_status::BUILD_FAILURE: return "build_failure";
        case outcome_status::TIMEOUT: return "timeout";
        case outcome_status::HOST_ERROR: return "host_error";
    }
    return "unknown";
}

void to_json(json &j, const execution_outcome &outcome) {
    j = {
        {"status", get_display_message(outcome.status)},
        {"stdout", outcome.stdout_text},
        {"stderr", outcome.stderr_text},
        {"exitCode", outcome.exit_code},
        {"stdoutTruncated", outcome.stdout_truncated},
        {"stderrTruncated", outcome.stderr_truncated},
        {"elapsedMs", outcome.elapsed.count()}};
    if (outcome.detail) j["detail"] = *outcome.detail;
}

}  // namespace runner
