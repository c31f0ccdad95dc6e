#include "monitor/monitor.hpp"
#include <glog/logging.h>
#include <exception>

namespace runner {
using namespace std;

monitor::~monitor() {}

void monitor::start_run(const string &, const string &) {}

void monitor::end_run(const string &, const execution_outcome &) {}

void monitor::run_failed(const string &, const string &) {}

void monitor::workspace_copy_failed(const string &, const string &, const string &) {}

void monitor::cleanup_failed(const filesystem::path &, const string &) {}

void counting_monitor::start_run(const string &, const string &) {
    ++runs_started;
}

void counting_monitor::end_run(const string &, const execution_outcome &outcome) {
    ++runs_finished;
    switch (outcome.status) {
        case outcome_status::BUILD_FAILURE: ++build_failures; break;
        case outcome_status::TIMEOUT: ++timeouts; break;
        case outcome_status::HOST_ERROR: ++host_errors; break;
        case outcome_status::NORMAL: break;
    }
}

void counting_monitor::run_failed(const string &, const string &) {
    ++runs_failed;
}

void counting_monitor::workspace_copy_failed(const string &, const string &, const string &) {
    ++workspace_copy_failures;
}

void counting_monitor::cleanup_failed(const filesystem::path &, const string &) {
    ++cleanup_failures;
}

guarded_monitor::guarded_monitor(monitor *target)
    : target(target) {}

template <typename F>
void guarded_monitor::call(const char *event, F &&callback) {
    if (!target) return;
    try {
        callback(*target);
    } catch (exception &ex) {
        LOG(ERROR) << "Monitor has crashed when reporting " << event << ", " << ex.what();
    }
}

void guarded_monitor::start_run(const string &run_id, const string &language) {
    call("start_run", [&](monitor &m) { m.start_run(run_id, language); });
}

void guarded_monitor::end_run(const string &run_id, const execution_outcome &outcome) {
    call("end_run", [&](monitor &m) { m.end_run(run_id, outcome); });
}

void guarded_monitor::run_failed(const string &kind, const string &message) {
    call("run_failed", [&](monitor &m) { m.run_failed(kind, message); });
}

void guarded_monitor::workspace_copy_failed(const string &workspace_id, const string &filename, const string &reason) {
    call("workspace_copy_failed", [&](monitor &m) { m.workspace_copy_failed(workspace_id, filename, reason); });
}

void guarded_monitor::cleanup_failed(const filesystem::path &dir, const string &reason) {
    call("cleanup_failed", [&](monitor &m) { m.cleanup_failed(dir, reason); });
}

}  // namespace runner
