#include "engine.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace runner {
using namespace std;

run_engine::run_engine(const runner_config &config, workspace_store &store, unique_ptr<sandbox> box, monitor *target)
    : config(config),
      mon(target),
      resolver(config.images),
      builder(config.run_dir, store, mon),
      executor(move(box), config.watchdog_margin, config.stream_limit),
      gate(effective_concurrency(config)) {
    LOG(INFO) << "Run engine started, run directory " << config.run_dir
              << ", at most " << gate.get_capacity() << " concurrent runs";
}

void run_engine::report_failure(const runner_exception &ex) {
    LOG(WARNING) << "Run failed with " << ex.kind() << ": " << ex.what() << endl
                 << boost::diagnostic_information(ex);
    mon.run_failed(ex.kind(), ex.what());
}

execution_outcome run_engine::run(const run_request &request) {
    try {
        const language_profile &profile = resolver.resolve(request.language);

        run_directory dir = builder.build(request);
        resource_limits limits = resource_limits::clamped(request.limits.time_limit, request.limits.memory, request.limits.cpus);

        string entry = language_profile_resolver::find_entry(profile, list_regular_files(dir.path()));
        sandbox_spec spec{dir.id(), dir.path(), profile.image,
                          language_profile_resolver::compose(profile, entry, limits), limits};

        LOG(INFO) << "Starting run " << spec.run_id << ", language " << profile.language << ", entry " << entry;
        mon.start_run(spec.run_id, profile.language);

        execution_outcome outcome;
        {
            admission_gate::ticket ticket = gate.acquire();
            outcome = executor.execute(spec);
        }

        dir.remove();
        LOG(INFO) << "Run " << spec.run_id << " finished: " << get_display_message(outcome.status);
        mon.end_run(spec.run_id, outcome);
        return outcome;
    } catch (runner_exception &ex) {
        report_failure(ex);
        throw;
    } catch (system_error &ex) {
        // 运行目录无法创建、写入或列出，属于宿主机的问题
        host_execution_error err(fmt::format("unable to prepare run directory: {}", ex.what()));
        report_failure(err);
        throw err;
    }
}

}  // namespace runner
