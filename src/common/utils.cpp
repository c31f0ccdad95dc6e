#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <system_error>

namespace runner {
using namespace std;

int exec_program(const map<string, string> &env, const vector<string> &args) {
    vector<char *> argv;
    for (auto &arg : args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "fork");
        case 0: {  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            int devnull = open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
            }
            for (auto &[key, value] : env)
                setenv(key.c_str(), value.c_str(), 1);
            execvp(argv[0], argv.data());
            _exit(127);
        }
        default:  // 父进程
            int status;
            while (waitpid(pid, &status, 0) < 0)
                if (errno != EINTR) throw system_error(errno, system_category(), "waitpid");
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
}

string random_uuid() {
    // random_generator 不是线程安全的，每个线程持有一个
    thread_local boost::uuids::random_generator generator;
    return boost::lexical_cast<string>(generator());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace runner
