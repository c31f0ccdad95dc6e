#include "sandbox/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <cmath>
#include "common/utils.hpp"
#include "config.hpp"

namespace runner {
using namespace std;
namespace fs = std::filesystem;

sandbox::~sandbox() {}

fs::path sandbox::working_directory(const sandbox_spec &spec) const {
    return spec.run_dir;
}

void sandbox::terminate(const sandbox_spec &) {}

bool sandbox::is_launch_failure(int) const {
    return false;
}

docker_sandbox::docker_sandbox(const string &docker)
    : docker(docker) {}

string docker_sandbox::container_name(const sandbox_spec &spec) {
    return "code-runner-" + spec.run_id;
}

vector<string> docker_sandbox::launch_command(const sandbox_spec &spec) const {
    vector<string> argv;
    to_string_list(argv,
                   docker, "run", "--rm",
                   "--name", container_name(spec),
                   "--network", "none",
                   fmt::format("--user={}:{}", getuid(), getgid()),
                   fmt::format("--memory={}m", (long long)llround(spec.limits.memory)),
                   fmt::format("--cpus={}", spec.limits.cpus),
                   "-v", fmt::format("{}:/code", fs::absolute(spec.run_dir).string()),
                   "-w", "/code",
                   spec.image,
                   "bash", "-c", spec.command.script, "runner",
                   spec.command.args);
    return argv;
}

void docker_sandbox::terminate(const sandbox_spec &spec) {
    string name = container_name(spec);
    int ret = call_process(docker, "kill", name);
    if (ret != 0)
        LOG(WARNING) << "docker kill " << name << " returned " << ret;
}

bool docker_sandbox::is_launch_failure(int exit_code) const {
    return exit_code == E_DOCKER_LAUNCH_FAILURE ||
           exit_code == E_DOCKER_COMMAND_NOT_EXECUTABLE ||
           exit_code == E_DOCKER_COMMAND_NOT_FOUND;
}

}  // namespace runner
