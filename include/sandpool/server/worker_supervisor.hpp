/**
 * @file worker_supervisor.hpp
 * @brief Pre-fork worker processes sharing one control socket
 *
 * The parent binds the listening socket, forks WORKERS children that each
 * build their own manager and accept on the inherited descriptor, then
 * waits. SIGINT/SIGTERM received by the parent are forwarded to every
 * worker, which performs its own bounded shutdown.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <functional>
#include <vector>

#include <sys/types.h>

namespace sandpool {
namespace server {

/**
 * @brief Process-wide stop flag set by the SIGINT/SIGTERM handlers
 */
std::atomic<bool>& StopFlag();

/**
 * @brief Install SIGINT/SIGTERM handlers that set StopFlag() and ignore SIGPIPE
 */
void InstallSignalHandlers();

/**
 * @class WorkerSupervisor
 * @brief Forks and reaps worker processes
 *
 * **Usage Example**:
 * @code
 * int fd = ControlServer::BindUnixSocket(path);
 * WorkerSupervisor supervisor(4, [&](int listen_fd, int index) {
 *     return RunWorker(config, listen_fd, index);
 * });
 * return supervisor.Run(fd);
 * @endcode
 */
class WorkerSupervisor {
public:
    /// Entry point of one worker; returns its exit code
    using WorkerMain = std::function<int(int listen_fd, int worker_index)>;

    WorkerSupervisor(int workers, WorkerMain worker_main);

    /**
     * @brief Fork the workers and wait for all of them to exit
     * @param listen_fd Listening descriptor inherited by the workers
     * @return 0 if every worker exited cleanly, 1 otherwise
     */
    int Run(int listen_fd);

    /// PIDs of workers still running
    std::vector<pid_t> Workers() const { return workers_; }

private:
    void SignalWorkers(int signal);

    int worker_count_;
    WorkerMain worker_main_;
    std::vector<pid_t> workers_;
};

} // namespace server
} // namespace sandpool
