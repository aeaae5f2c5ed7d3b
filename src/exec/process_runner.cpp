#include "normfmt/exec/process_runner.hpp"
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace normfmt {

namespace {

auto close_pipe(int (&fds)[2]) -> void {
    for (int& fd : fds) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

// Drain both pipes until the child closes them; reading one at a time could
// deadlock once the other fills up
auto drain(int stdout_fd, int stderr_fd, ProcessResult& result) -> void {
    std::array<pollfd, 2> fds{pollfd{.fd = stdout_fd, .events = POLLIN, .revents = 0},
                              pollfd{.fd = stderr_fd, .events = POLLIN, .revents = 0}};
    std::array<std::string*, 2> sinks{&result.stdout_output, &result.stderr_output};
    char buffer[4096];

    int open_count = 2;
    while (open_count > 0) {
        if (poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

} // namespace

auto ProcessRunner::run(const std::vector<std::string>& argv, const EnvOverrides& env) -> ProcessResult {
    ProcessResult result;
    if (argv.empty()) {
        result.exit_code = kExecFailureExitCode;
        result.stderr_output = "empty command line";
        return result;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) < 0 || pipe(stderr_pipe) < 0) {
        result.exit_code = -1;
        result.stderr_output = std::string("pipe failed: ") + std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        result.exit_code = -1;
        result.stderr_output = std::string("fork failed: ") + std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        for (const auto& [key, value] : env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        execvp(args[0], args.data());
        _exit(kExecFailureExitCode);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    drain(stdout_pipe[0], stderr_pipe[0], result);

    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -WTERMSIG(status);
    }

    return result;
}

} // namespace normfmt
