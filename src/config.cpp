#include "config.hpp"
#include <algorithm>
#include <thread>
#include "common/io_utils.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, runner_config &config) {
    if (j.count("runDir"))
        config.run_dir = j.at("runDir").get<string>();
    if (j.count("workspaceDir"))
        config.workspace_dir = j.at("workspaceDir").get<string>();
    if (j.count("docker"))
        j.at("docker").get_to(config.docker);
    if (j.count("images"))
        for (auto &[language, image] : j.at("images").items())
            config.images[language] = image.get<string>();
    if (j.count("maxConcurrentRuns"))
        j.at("maxConcurrentRuns").get_to(config.max_concurrent_runs);
    if (j.count("watchdogMargin"))
        j.at("watchdogMargin").get_to(config.watchdog_margin);
    if (j.count("streamLimit"))
        j.at("streamLimit").get_to(config.stream_limit);
}

void load_config(const filesystem::path &path, runner_config &config) {
    json j = json::parse(read_file_content(path));
    from_json(j, config);
}

size_t effective_concurrency(const runner_config &config) {
    if (config.max_concurrent_runs > 0) return config.max_concurrent_runs;
    return max(1u, thread::hardware_concurrency());
}

}  // namespace runner
