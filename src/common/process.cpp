#include "common/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <system_error>
#include "common/defer.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;

const int BUF_SIZE = 4096;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

// 进程退出后 poll 的间隔，同时也是看门狗检查的粒度
const int POLL_INTERVAL_MS = 50;

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void make_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "pipe2");
}

struct captured_stream {
    int *fd;  // 指向管道数组，关闭后置为 -1
    string *data;
    bool *truncated;
};

/**
 * @brief 读出 fd 中当前可读的全部数据，超出 limit 的部分丢弃并标记截断
 * @return false 若 fd 已经到达 EOF 或出错，此时 fd 会被关闭
 */
static bool drain(captured_stream &stream, size_t limit) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t n = read(*stream.fd, buf, sizeof(buf));
        if (n > 0) {
            size_t room = limit > stream.data->size() ? limit - stream.data->size() : 0;
            size_t keep = min(room, (size_t)n);
            stream.data->append(buf, keep);
            if (keep < (size_t)n) *stream.truncated = true;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        close_fd(*stream.fd);
        return false;
    }
}

static void wait_child(pid_t pid, int &status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOG(ERROR) << "waitpid " << pid << " failed: " << strerror(errno);
            return;
        }
    }
}

process_result run_supervised(const process_options &opt) {
    process_result result;

    // 子进程中只能调用异步信号安全的函数，因此参数必须在 fork 之前准备好
    vector<char *> argv;
    for (auto &arg : opt.argv)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    string work_dir = opt.work_dir.string();

    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
    defer {
        for (int *fds : initializer_list<int *>{out_pipe, err_pipe, exec_pipe}) {
            close_fd(fds[PIPE_READ]);
            close_fd(fds[PIPE_WRITE]);
        }
    };
    make_pipe(out_pipe);
    make_pipe(err_pipe);
    make_pipe(exec_pipe);

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0)
        throw system_error(errno, system_category(), "fork");

    if (pid == 0) {
        // 将子进程分离到一个独立的进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
        setpgid(0, 0);
        signal(SIGINT, SIG_IGN);
        signal(SIGPIPE, SIG_DFL);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 ||
            dup2(devnull, STDIN_FILENO) < 0 ||
            dup2(out_pipe[PIPE_WRITE], STDOUT_FILENO) < 0 ||
            dup2(err_pipe[PIPE_WRITE], STDERR_FILENO) < 0 ||
            (!work_dir.empty() && chdir(work_dir.c_str()) != 0)) {
            int err = errno;
            (void)!write(exec_pipe[PIPE_WRITE], &err, sizeof(err));
            _exit(127);
        }
        execvp(argv[0], argv.data());
        int err = errno;
        (void)!write(exec_pipe[PIPE_WRITE], &err, sizeof(err));
        _exit(127);
    }

    // 父子进程都设置一次进程组，避免 kill(-pid) 时子进程还未来得及 setpgid
    setpgid(pid, pid);
    close_fd(out_pipe[PIPE_WRITE]);
    close_fd(err_pipe[PIPE_WRITE]);
    close_fd(exec_pipe[PIPE_WRITE]);

    int status = 0;
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[PIPE_READ], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == sizeof(exec_errno)) {
        wait_child(pid, status);
        result.launched = false;
        result.launch_error = fmt::format("unable to execute {}: {}", opt.argv.empty() ? "" : opt.argv[0], strerror(exec_errno));
        result.elapsed = timer.duration<chrono::milliseconds>();
        return result;
    }
    result.launched = true;

    fcntl(out_pipe[PIPE_READ], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[PIPE_READ], F_SETFL, O_NONBLOCK);
    captured_stream streams[2] = {
        {&out_pipe[PIPE_READ], &result.out, &result.out_truncated},
        {&err_pipe[PIPE_READ], &result.err, &result.err_truncated}};

    auto deadline = chrono::steady_clock::now() + opt.timeout;
    bool exited = false;
    while (true) {
        pollfd fds[2];
        captured_stream *polled[2];
        nfds_t nfds = 0;
        for (auto &stream : streams) {
            if (*stream.fd < 0) continue;
            fds[nfds] = {*stream.fd, POLLIN, 0};
            polled[nfds++] = &stream;
        }

        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
        int wait_ms = (int)max<long long>(0, min<long long>(remaining, POLL_INTERVAL_MS));
        if (nfds > 0) {
            if (poll(fds, nfds, wait_ms) < 0 && errno != EINTR)
                throw system_error(errno, system_category(), "poll");
            for (nfds_t i = 0; i < nfds; ++i)
                if (fds[i].revents & (POLLIN | POLLHUP | POLLERR))
                    drain(*polled[i], opt.stream_limit);
        } else {
            usleep(wait_ms * 1000);
        }

        if (!exited && waitpid(pid, &status, WNOHANG) == pid) exited = true;
        if (exited) break;

        if (chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
    }

    if (result.timed_out) {
        LOG(WARNING) << "Process " << pid << " exceeded watchdog timeout of " << opt.timeout.count() << "ms, killing process group";
        if (opt.on_timeout) {
            try {
                opt.on_timeout();
            } catch (exception &ex) {
                LOG(ERROR) << "Timeout hook of process " << pid << " failed: " << ex.what();
            }
        }
    }

    // 杀死进程组内所有的进程，以确保子进程结束后不会有残留的后台进程
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "Unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
    if (!exited) wait_child(pid, status);

    // 进程退出后，后台进程可能仍然持有管道，只读出已经写入的数据
    if (!result.timed_out)
        for (auto &stream : streams)
            if (*stream.fd >= 0) drain(stream, opt.stream_limit);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    result.elapsed = timer.duration<chrono::milliseconds>();
    return result;
}

}  // namespace runner
