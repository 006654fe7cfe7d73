/**
 * @file worker_supervisor.cpp
 * @brief Implementation of worker process supervision
 *
 * @date 2025
 */

#include "sandpool/server/worker_supervisor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

namespace sandpool {
namespace server {

namespace {

std::atomic<bool> g_stop{false};

void HandleStopSignal(int) {
    g_stop = true;
}

} // anonymous namespace

std::atomic<bool>& StopFlag() {
    return g_stop;
}

void InstallSignalHandlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = HandleStopSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::signal(SIGPIPE, SIG_IGN);
}

WorkerSupervisor::WorkerSupervisor(int workers, WorkerMain worker_main)
    : worker_count_(std::max(1, workers)),
      worker_main_(std::move(worker_main)) {
}

int WorkerSupervisor::Run(int listen_fd) {
    for (int index = 0; index < worker_count_; ++index) {
        pid_t pid = fork();
        if (pid < 0) {
            spdlog::error("fork failed for worker {}: {}", index, std::strerror(errno));
            StopFlag() = true;
            break;
        }
        if (pid == 0) {
            int code = 1;
            try {
                code = worker_main_(listen_fd, index);
            } catch (const std::exception& e) {
                spdlog::critical("Worker {} failed: {}", index, e.what());
            }
            spdlog::shutdown();
            _exit(code);
        }

        workers_.push_back(pid);
        spdlog::info("Started worker {} (pid {})", index, pid);
    }

    bool clean = true;
    bool forwarded = false;

    while (!workers_.empty()) {
        if (StopFlag() && !forwarded) {
            spdlog::info("Stopping {} worker(s)", workers_.size());
            SignalWorkers(SIGTERM);
            forwarded = true;
        }

        int status = 0;
        pid_t pid = waitpid(-1, &status, WNOHANG);
        if (pid < 0) {
            if (errno == EINTR) continue;
            spdlog::error("waitpid failed: {}", std::strerror(errno));
            break;
        }
        if (pid == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            continue;
        }

        workers_.erase(std::remove(workers_.begin(), workers_.end(), pid), workers_.end());

        if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
            spdlog::info("Worker pid {} exited", pid);
        } else {
            clean = false;
            if (WIFSIGNALED(status)) {
                spdlog::error("Worker pid {} killed by signal {}", pid, WTERMSIG(status));
            } else {
                spdlog::error("Worker pid {} exited with code {}", pid, WEXITSTATUS(status));
            }
            if (!StopFlag()) {
                spdlog::warn("{} worker(s) remain serving", workers_.size());
            }
        }
    }

    return clean ? 0 : 1;
}

void WorkerSupervisor::SignalWorkers(int signal) {
    for (pid_t pid : workers_) {
        if (kill(pid, signal) != 0 && errno != ESRCH) {
            spdlog::warn("Cannot signal worker {}: {}", pid, std::strerror(errno));
        }
    }
}

} // namespace server
} // namespace sandpool
