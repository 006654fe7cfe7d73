/**
 * @file periodic_task.hpp
 * @brief Background thread invoking a callback at a fixed interval
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace sandpool {
namespace utils {

/**
 * @class PeriodicTask
 * @brief Runs a callback every @p interval until stopped
 *
 * Exceptions thrown by the callback are logged and the task keeps running.
 * Stop() interrupts the wait immediately; an in-progress tick runs to
 * completion first.
 *
 * **Usage Example**:
 * @code
 * PeriodicTask sweeper("sweep", std::chrono::seconds(30), [&] { controller.Sweep(idle); });
 * sweeper.Start();
 * // ...
 * sweeper.Stop();
 * @endcode
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval,
                 std::function<void()> callback);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief Launch the worker thread (no-op if already running)
     * @param run_immediately Invoke the callback once before the first wait
     */
    void Start(bool run_immediately = true);

    /**
     * @brief Signal the worker and join it (idempotent)
     */
    void Stop();

    bool IsRunning() const { return running_; }

    /// Number of completed ticks (including failed ones)
    std::size_t TickCount() const { return ticks_; }

private:
    void Run(bool run_immediately);
    void Tick();

    std::string name_;                        ///< Name used in log messages
    std::chrono::milliseconds interval_;      ///< Delay between ticks
    std::function<void()> callback_;          ///< Work to perform

    std::thread thread_;                      ///< Worker thread
    std::mutex mutex_;                        ///< Guards stop_requested_
    std::condition_variable cv_;              ///< Wakes the worker on Stop()
    bool stop_requested_{false};
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> ticks_{0};
};

} // namespace utils
} // namespace sandpool
