#include "runtime/process_runner.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <cerrno>
#include <system_error>

namespace remoteops::runtime {

namespace {

// strerror() shares a static buffer between threads
std::string errno_message(int err) {
    return std::error_code(err, std::generic_category()).message();
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Drain both pipes until the child closes them
void collect_output(int out_fd, int err_fd, std::string& out, std::string& err) {
    char buffer[4096];
    struct pollfd fds[2];
    fds[0] = {out_fd, POLLIN, 0};
    fds[1] = {err_fd, POLLIN, 0};
    int open_count = 2;

    while (open_count > 0) {
        int n = poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll() on child output failed: {}", errno_message(errno));
            return;
        }

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t r = read(fds[i].fd, buffer, sizeof(buffer));
            if (r > 0) {
                (i == 0 ? out : err).append(buffer, static_cast<size_t>(r));
            } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;
                open_count--;
            }
        }
    }
}

} // namespace

ProcessResult ProcessRunner::run(const std::string& program,
                                 const std::vector<std::string>& args) {
    return spawn(program, args, false);
}

ProcessResult ProcessRunner::run_tool(const std::string& program,
                                      const std::vector<std::string>& args) {
    return spawn(program, args, true);
}

ProcessResult ProcessRunner::spawn(const std::string& program,
                                   const std::vector<std::string>& args,
                                   bool search_path) {
    ProcessResult result;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    // Reports exec failure: closed on successful exec thanks to O_CLOEXEC
    int status_pipe[2] = {-1, -1};

    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
        pipe2(status_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("failed to create pipe: ") + errno_message(errno);
        spdlog::error("{}", result.error);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(status_pipe[0]); close_fd(status_pipe[1]);
        return result;
    }

    // Build argv before forking
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork() failed: ") + errno_message(errno);
        spdlog::error("{}", result.error);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(status_pipe[0]); close_fd(status_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }

        if (search_path) {
            execvp(argv[0], argv.data());
        } else {
            execv(argv[0], argv.data());
        }

        // If we get here, exec failed
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent: close write ends
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        waitpid(pid, nullptr, 0);
        result.error = "spawn " + program + " " + errno_message(exec_errno);
        spdlog::debug("exec of {} failed: {}", program, errno_message(exec_errno));
        return result;
    }

    result.spawned = true;
    collect_output(out_pipe[0], err_pipe[0], result.stdout_data, result.stderr_data);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        result.error = std::string("waitpid() failed: ") + errno_message(errno);
        spdlog::error("{}", result.error);
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }

    spdlog::debug("{} exited (code={}, signal={})", program, result.exit_code, result.term_signal);
    return result;
}

} // namespace remoteops::runtime
