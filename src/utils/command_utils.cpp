/**
 * @file command_utils.cpp
 * @brief fork/exec based command execution with pipe capture
 *
 * Uses three pipes (stdin, stdout, stderr) multiplexed with poll(2) so a
 * chatty child can never deadlock against a full pipe buffer. Only
 * async-signal-safe calls are made between fork and exec, since the manager
 * forks from a multi-threaded process.
 *
 * @date 2025
 */

#include "sandpool/utils/command_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandpool {
namespace utils {

namespace {

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // anonymous namespace

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

CommandResult RunCommand(const std::vector<std::string>& argv,
                         const std::optional<std::string>& stdin_data,
                         std::chrono::milliseconds timeout) {
    CommandResult result;

    if (argv.empty()) {
        result.stderr_output = "empty command";
        return result;
    }

    spdlog::debug("Executing: {}", FormatCommand(argv));

    // Build argv before fork; the child must not allocate
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    if (pipe2(in_pipe, O_CLOEXEC) != 0 ||
        pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.stderr_output = std::string("pipe failed: ") + std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_output = std::string("fork failed: ") + std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(c_argv[0], c_argv.data());
        _exit(127);
    }

    // Parent
    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);

    int stdin_fd = in_pipe[1];
    int stdout_fd = out_pipe[0];
    int stderr_fd = err_pipe[0];

    std::size_t stdin_offset = 0;
    if (!stdin_data || stdin_data->empty()) {
        CloseFd(stdin_fd);
    } else {
        fcntl(stdin_fd, F_SETFL, fcntl(stdin_fd, F_GETFL) | O_NONBLOCK);
    }

    const bool has_deadline = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buffer;

    while (stdout_fd >= 0 || stderr_fd >= 0) {
        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        if (stdout_fd >= 0) fds[count++] = {stdout_fd, POLLIN, 0};
        if (stderr_fd >= 0) fds[count++] = {stderr_fd, POLLIN, 0};
        if (stdin_fd >= 0) fds[count++] = {stdin_fd, POLLOUT, 0};

        int wait_ms = -1;
        if (has_deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        int ready = poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed while running {}: {}", argv[0], std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;  // deadline check at loop head
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }

            if (fds[i].fd == stdin_fd) {
                ssize_t n = write(stdin_fd, stdin_data->data() + stdin_offset,
                                  stdin_data->size() - stdin_offset);
                if (n > 0) {
                    stdin_offset += static_cast<std::size_t>(n);
                }
                if ((n < 0 && errno != EAGAIN && errno != EINTR) ||
                    stdin_offset >= stdin_data->size()) {
                    CloseFd(stdin_fd);
                }
                continue;
            }

            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                auto& sink = (fds[i].fd == stdout_fd) ? result.stdout_output
                                                      : result.stderr_output;
                sink.append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                if (fds[i].fd == stdout_fd) {
                    CloseFd(stdout_fd);
                } else {
                    CloseFd(stderr_fd);
                }
            }
        }
    }

    CloseFd(stdin_fd);
    CloseFd(stdout_fd);
    CloseFd(stderr_fd);

    if (result.timed_out) {
        spdlog::warn("Command timed out after {} ms: {}", timeout.count(), argv[0]);
        kill(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid failed for {}: {}", argv[0], std::strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.started = result.exit_code != 127;
    } else {
        result.exit_code = -1;
        result.started = true;
    }

    return result;
}

bool IsProgramAvailable(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return false;
    }

    std::istringstream paths(path_env);
    std::string dir;
    while (std::getline(paths, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        auto candidate = std::filesystem::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

std::string FormatCommand(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        // Never print secrets passed as KEY=VALUE environment arguments
        if (i > 0 && (argv[i - 1] == "-e" || argv[i - 1] == "--env") &&
            argv[i].find('=') != std::string::npos) {
            oss << argv[i].substr(0, argv[i].find('=') + 1) << "***";
        } else if (i > 0 && (argv[i - 1] == "-k" || argv[i - 1] == "--access-key-secret")) {
            oss << "***";
        } else {
            oss << argv[i];
        }
    }
    return oss.str();
}

} // namespace utils
} // namespace sandpool
