#include "../../include/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace metawipe {

namespace {

constexpr std::size_t kMaxCapturedStderr = 16 * 1024;

// exit status used by the child when execvp fails
constexpr int kExecFailedStatus = 127;

} // namespace

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv,
                                      const std::chrono::seconds timeout) {
    ProcessResult result;
    if (argv.empty()) {
        result.launch_failed = true;
        result.stderr_output = "empty command line";
        return result;
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    int err_pipe[2];
    if (pipe(err_pipe) != 0) {
        result.launch_failed = true;
        result.stderr_output = "pipe() failed";
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close(err_pipe[0]);
        close(err_pipe[1]);
        result.launch_failed = true;
        result.stderr_output = "fork() failed";
        return result;
    }

    if (pid == 0) {
        // child
        close(err_pipe[0]);
        dup2(err_pipe[1], STDERR_FILENO);
        close(err_pipe[1]);
        const int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            close(devnull);
        }
        execvp(c_argv[0], c_argv.data());
        _exit(kExecFailedStatus);
    }

    close(err_pipe[1]);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool pipe_open = true;
    char buf[4096];

    while (pipe_open) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd pfd{err_pipe[0], POLLIN, 0};
        const int rc = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        const ssize_t n = read(err_pipe[0], buf, sizeof(buf));
        if (n > 0) {
            if (result.stderr_output.size() < kMaxCapturedStderr) {
                result.stderr_output.append(buf, static_cast<std::size_t>(n));
            }
        } else if (n == 0 || errno != EINTR) {
            pipe_open = false;
        }
    }
    close(err_pipe[0]);

    int status = 0;
    if (result.timed_out) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        return result;
    }

    // stderr closed, but the child may still be running
    while (true) {
        const pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            result.launch_failed = true;
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            return result;
        }
        usleep(10 * 1000);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == kExecFailedStatus && result.stderr_output.empty()) {
            result.launch_failed = true;
        }
    } else if (WIFSIGNALED(status)) {
        // the child shares our process group, so a terminal ctrl+c lands here too
        result.signaled = true;
        result.term_signal = WTERMSIG(status);
    }
    return result;
}

std::optional<std::filesystem::path> find_executable(const std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }

    auto is_executable = [](const std::filesystem::path& p) {
        std::error_code ec;
        return std::filesystem::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string_view::npos) {
        std::filesystem::path p(name);
        if (is_executable(p)) {
            std::error_code ec;
            auto abs = std::filesystem::absolute(p, ec);
            return ec ? p : abs;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::string_view dirs(path_env);
    while (!dirs.empty()) {
        const auto sep = dirs.find(':');
        const auto dir = dirs.substr(0, sep);
        const auto candidate = std::filesystem::path(dir.empty() ? "." : std::string(dir)) / std::string(name);
        if (is_executable(candidate)) {
            return candidate;
        }
        if (sep == std::string_view::npos) break;
        dirs.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

} // namespace metawipe
