#include "common/utils.hpp"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>
#include <system_error>
#include <thread>
using namespace std;

static void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

static void append_limited(string &buffer, const char *data, size_t size, size_t limit) {
    if (limit > 0) {
        if (buffer.size() >= limit) return;
        size = min(size, limit - buffer.size());
    }
    buffer.append(data, size);
}

process_result exec_program(const process_options &options, const char **argv) {
    // 管道都带有 O_CLOEXEC，避免其他 worker 并发 fork 出的子进程继承管道导致读端收不到 EOF
    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) == -1 ||
        pipe2(err_pipe, O_CLOEXEC) == -1 ||
        pipe2(exec_pipe, O_CLOEXEC) == -1) {
        int error = errno;
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(exec_pipe);
        throw system_error(error, system_category(), "unable to create pipe");
    }

    process_result result;
    elapsed_time timer;

    pid_t pid = fork();
    switch (pid) {
        case -1: {  // fork 失败
            int error = errno;
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            close_pipe(exec_pipe);
            throw system_error(error, system_category(), "unable to fork");
        }
        case 0: {  // 子进程
            // 新建进程组，超时时可以一次性杀死外部命令产生的所有进程
            setpgid(0, 0);
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
            execvp(argv[0], (char **)argv);
            // 执行失败时通过 exec_pipe 告诉父进程 errno
            int error = errno;
            ssize_t written = write(exec_pipe[1], &error, sizeof(error));
            (void)written;
            _exit(127);
        }
        default:
            break;
    }

    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);

    {
        // exec 成功时管道因为 O_CLOEXEC 而关闭，read 返回 0
        int error = 0;
        ssize_t n;
        do {
            n = read(exec_pipe[0], &error, sizeof(error));
        } while (n < 0 && errno == EINTR);
        close(exec_pipe[0]);
        if (n == sizeof(error)) {
            close(out_pipe[0]);
            close(err_pipe[0]);
            waitpid(pid, nullptr, 0);
            throw system_error(error, system_category(), string("unable to execute ") + argv[0]);
        }
    }

    bool has_deadline = options.timeout.count() > 0;
    auto deadline = chrono::steady_clock::now() + options.timeout;
    chrono::steady_clock::time_point grace_deadline;

    auto kill_group = [&]() {
        kill(-pid, SIGKILL);
        result.timed_out = true;
        grace_deadline = chrono::steady_clock::now() + options.kill_grace;
        if (options.on_timeout) options.on_timeout();
    };

    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    string *buffers[2] = {&result.out, &result.err};
    int open_fds = 2;
    char buffer[4096];

    while (open_fds > 0) {
        int wait_ms = -1;
        auto now = chrono::steady_clock::now();
        if (result.timed_out) {
            if (now >= grace_deadline) break;
            wait_ms = (int)chrono::duration_cast<chrono::milliseconds>(grace_deadline - now).count() + 1;
        } else if (has_deadline) {
            if (now >= deadline) {
                kill_group();
                continue;
            }
            wait_ms = (int)chrono::duration_cast<chrono::milliseconds>(deadline - now).count() + 1;
        }

        int ret = poll(fds, 2, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            int error = errno;
            kill(-pid, SIGKILL);
            for (auto &fd : fds)
                if (fd.fd >= 0) close(fd.fd);
            waitpid(pid, nullptr, 0);
            throw system_error(error, system_category(), "unable to poll output of process");
        }
        if (ret == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                append_limited(*buffers[i], buffer, n, options.output_limit);
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    for (auto &fd : fds)
        if (fd.fd >= 0) close(fd.fd);

    // 外部命令可能关闭了 stdout 和 stderr 但仍在运行，此时依然要保证时间限制
    int status = 0;
    while (true) {
        pid_t ret = waitpid(pid, &status, has_deadline && !result.timed_out ? WNOHANG : 0);
        if (ret == pid) break;
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "unable to wait for process");
        }
        if (chrono::steady_clock::now() >= deadline)
            kill_group();
        else
            this_thread::sleep_for(chrono::milliseconds(5));
    }

    if (WIFEXITED(status))
        result.exitcode = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.signal = WTERMSIG(status);
    result.elapsed = timer.duration<chrono::milliseconds>();
    return result;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
