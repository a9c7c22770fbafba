#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <poll.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace platform {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Drain whichever pipes are readable until both reach EOF.
void drain_pipes(int& out_fd, int& err_fd, std::string& out, std::string& err) {
    char buf[4096];
    while (out_fd >= 0 || err_fd >= 0) {
        struct pollfd fds[2];
        int n = 0;
        int out_idx = -1, err_idx = -1;
        if (out_fd >= 0) { fds[n] = {out_fd, POLLIN, 0}; out_idx = n++; }
        if (err_fd >= 0) { fds[n] = {err_fd, POLLIN, 0}; err_idx = n++; }

        int ready = poll(fds, static_cast<nfds_t>(n), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }

        auto pump = [&](int idx, int& fd, std::string& sink) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) return;
            ssize_t got = read(fd, buf, sizeof(buf));
            if (got > 0) {
                sink.append(buf, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                close_fd(fd);
            }
        };
        pump(out_idx, out_fd, out);
        pump(err_idx, err_fd, err);
    }
    close_fd(out_fd);
    close_fd(err_fd);
}

} // namespace

CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args) {
    CommandResult result{-1, "", ""};

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        result.stderr_data = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    if (pipe(err_pipe) != 0) {
        result.stderr_data = std::string("pipe: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_data = std::string("fork: ") + std::strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));

        // exec failed: report through stderr, then exit like a shell would
        const char* reason = std::strerror(errno);
        (void)!write(STDERR_FILENO, program.c_str(), program.size());
        (void)!write(STDERR_FILENO, ": ", 2);
        (void)!write(STDERR_FILENO, reason, std::strlen(reason));
        (void)!write(STDERR_FILENO, "\n", 1);
        _exit(127);
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    drain_pipes(out_fd, err_fd, result.stdout_data, result.stderr_data);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        result.exit_code = -1;
        result.stderr_data += std::string("waitpid: ") + std::strerror(errno);
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

std::string format_command(const std::string& program,
                           const std::vector<std::string>& args) {
    std::string line = program;
    for (const auto& a : args) {
        line += ' ';
        if (a.empty() || a.find_first_of(" \t\"'$\\") != std::string::npos) {
            line += '\'';
            for (char c : a) {
                if (c == '\'') line += "'\\''";
                else line += c;
            }
            line += '\'';
        } else {
            line += a;
        }
    }
    return line;
}

} // namespace platform
