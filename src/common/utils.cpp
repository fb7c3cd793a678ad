#include "common/utils.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <thread>

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/scoped_fd.hpp"
#include "logging.hpp"
using namespace std;

namespace {

/**
 * @brief 子进程在 exec 之前失败时，通过 status 管道告诉父进程失败的阶段和 errno
 */
enum class child_stage : int {
    REDIRECT = 1,
    UNSHARE = 2,
    CHDIR = 3,
    EXEC = 4
};

struct child_failure {
    child_stage stage;
    int error;
};

const char *stage_name(child_stage stage) {
    switch (stage) {
        case child_stage::REDIRECT:
            return "redirect standard streams";
        case child_stage::UNSHARE:
            return "create network namespace";
        case child_stage::CHDIR:
            return "change working directory";
        case child_stage::EXEC:
            return "execute";
    }
    return "unknown";
}

scoped_pipe make_pipe() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1)
        BOOST_THROW_EXCEPTION(passk::sandbox_unavailable() << "pipe2: " << strerror(errno));
    scoped_pipe result;
    result.read_end.reset(fds[0]);
    result.write_end.reset(fds[1]);
    return result;
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

/**
 * @brief 只允许调用 async-signal-safe 的函数，因为父进程可能是多线程的
 */
[[noreturn]] void report_child_failure(int status_fd, child_stage stage) {
    child_failure failure{stage, errno};
    ssize_t ignored = write(status_fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

/**
 * @brief 从 fd 读出当前所有可读数据，保留至多 limit 字节
 * @return false 如果读到了 EOF 或者出现了错误
 */
bool drain(int fd, string &out, size_t limit, bool &truncated) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            size_t count = static_cast<size_t>(n);
            size_t remaining = out.size() < limit ? limit - out.size() : 0;
            out.append(buf, min(count, remaining));
            if (count > remaining) truncated = true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

// 一年
const double MAX_TIMEOUT_SECONDS = 365.0 * 24 * 3600;

void kill_process_group(pid_t pid) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
}

}  // namespace

process_builder &process_builder::directory(const filesystem::path &path) {
    this->epath = true;
    this->path = path;
    return *this;
}

process_builder &process_builder::timeout(double seconds) {
    this->timeout_seconds = seconds;
    return *this;
}

process_builder &process_builder::output_limit(size_t bytes) {
    this->max_output_bytes = bytes;
    return *this;
}

process_builder &process_builder::isolate_network(network_isolation mode) {
    this->isolation = mode;
    return *this;
}

process_result process_builder::exec_program(const vector<string> &args) {
    if (args.empty())
        BOOST_THROW_EXCEPTION(passk::internal_error("empty command line"));

    // fork 之后子进程只能调用 async-signal-safe 函数，所以在 fork 之前准备好所有参数
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    string workdir = epath ? path.string() : string();

    scoped_pipe out_pipe = make_pipe();
    scoped_pipe err_pipe = make_pipe();
    scoped_pipe status_pipe = make_pipe();
    scoped_fd devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devnull.is_valid())
        BOOST_THROW_EXCEPTION(passk::sandbox_unavailable() << "open /dev/null: " << strerror(errno));

    LOG_DEBUG << "Running " << args[0] << " with timeout " << timeout_seconds << "s in " << workdir;

    pid_t pid = fork();
    switch (pid) {
        case -1:  // fork 失败
            BOOST_THROW_EXCEPTION(passk::sandbox_unavailable() << "fork: " << strerror(errno));
        case 0: {  // 子进程
            int status_fd = status_pipe.write_end.get();
            // 独立的进程组，超时时可以杀死子进程 fork 出来的所有进程
            setpgid(0, 0);
            // 父进程为了用 sigwait 接收信号屏蔽了 SIGINT、SIGTERM，屏蔽字会被 exec 继承
            sigset_t empty;
            sigemptyset(&empty);
            sigprocmask(SIG_SETMASK, &empty, nullptr);
            signal(SIGINT, SIG_DFL);
            signal(SIGPIPE, SIG_DFL);
            if (dup2(devnull.get(), STDIN_FILENO) == -1 ||
                dup2(out_pipe.write_end.get(), STDOUT_FILENO) == -1 ||
                dup2(err_pipe.write_end.get(), STDERR_FILENO) == -1)
                report_child_failure(status_fd, child_stage::REDIRECT);
            if (isolation != network_isolation::DISABLED) {
                if (unshare(CLONE_NEWUSER | CLONE_NEWNET) == -1 && isolation == network_isolation::REQUIRED)
                    report_child_failure(status_fd, child_stage::UNSHARE);
            }
            if (!workdir.empty() && chdir(workdir.c_str()) == -1)
                report_child_failure(status_fd, child_stage::CHDIR);
            execvp(argv[0], argv.data());
            report_child_failure(status_fd, child_stage::EXEC);
        }
        default:  // 父进程
            break;
    }

    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    status_pipe.write_end.reset();
    devnull.reset();

    // exec 成功后 status 管道因为 O_CLOEXEC 被关闭，此时读到 EOF
    child_failure failure;
    ssize_t n;
    do {
        n = read(status_pipe.read_end.get(), &failure, sizeof(failure));
    } while (n == -1 && errno == EINTR);
    if (n == sizeof(failure)) {
        int status;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        BOOST_THROW_EXCEPTION(passk::sandbox_unavailable()
                              << "unable to " << stage_name(failure.stage) << " " << args[0] << ": " << strerror(failure.error));
    }

    process_result result;
    set_nonblocking(out_pipe.read_end.get());
    set_nonblocking(err_pipe.read_end.get());

    bool out_open = true, err_open = true, reaped = false;
    int status = 0;
    // 过大的时间限制转换为纳秒时会溢出
    double limit = timeout_seconds > 0 ? min(timeout_seconds, MAX_TIMEOUT_SECONDS) : 0;
    auto deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(limit));
    while (out_open || err_open || !reaped) {
        if (timeout_seconds > 0 && chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }

        if (out_open || err_open) {
            struct pollfd fds[2];
            int nfds = 0;
            if (out_open) fds[nfds++] = {out_pipe.read_end.get(), POLLIN, 0};
            if (err_open) fds[nfds++] = {err_pipe.read_end.get(), POLLIN, 0};
            poll(fds, nfds, 50);

            if (out_open) out_open = drain(out_pipe.read_end.get(), result.stdout_text, max_output_bytes, result.output_truncated);
            if (err_open) err_open = drain(err_pipe.read_end.get(), result.stderr_text, max_output_bytes, result.output_truncated);
        } else {
            this_thread::sleep_for(chrono::milliseconds(10));
        }

        if (!reaped) {
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret == -1 && errno != EINTR)
                BOOST_THROW_EXCEPTION(passk::sandbox_unavailable() << "waitpid: " << strerror(errno));
            if (ret == pid) {
                reaped = true;
                // 子进程已经退出，清理它留下的后台进程，否则它们会一直占用管道
                kill(-pid, SIGKILL);
            }
        }
    }

    if (result.timed_out) {
        LOG_DEBUG << args[0] << " exceeded wall time limit " << timeout_seconds << "s, killing process group " << pid;
        kill_process_group(pid);
        if (!reaped) {
            while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
            }
        }
        // 进程组已被杀死，读出剩余的输出
        if (out_open) drain(out_pipe.read_end.get(), result.stdout_text, max_output_bytes, result.output_truncated);
        if (err_open) drain(err_pipe.read_end.get(), result.stderr_text, max_output_bytes, result.output_truncated);
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }

    if (result.output_truncated) {
        if (result.stdout_text.size() >= max_output_bytes) passk::mark_truncated(result.stdout_text);
        if (result.stderr_text.size() >= max_output_bytes) passk::mark_truncated(result.stderr_text);
    }
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}
