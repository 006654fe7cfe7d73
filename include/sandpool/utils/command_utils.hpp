/**
 * @file command_utils.hpp
 * @brief Child process execution with captured stdout/stderr
 *
 * The container backends drive the `docker`, `kubectl` and `ossutil` CLIs.
 * Arguments are passed as an argv vector straight to execvp, so nothing is
 * interpreted by a shell.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sandpool {
namespace utils {

/**
 * @struct CommandResult
 * @brief Outcome of a child process run
 */
struct CommandResult {
    int exit_code{-1};          ///< Exit status (-1 if not started or killed)
    std::string stdout_output;  ///< Captured standard output
    std::string stderr_output;  ///< Captured standard error
    bool timed_out{false};      ///< Killed after exceeding the timeout
    bool started{false};        ///< execvp succeeded

    bool Success() const { return started && !timed_out && exit_code == 0; }
};

/**
 * @brief Run a command and capture its output
 *
 * @param argv Program and arguments (argv[0] resolved through PATH)
 * @param stdin_data Optional data written to the child's stdin
 * @param timeout Kill the child with SIGKILL after this long (zero = no limit)
 * @return CommandResult; never throws for child failures
 *
 * **Example**:
 * @code
 * auto r = RunCommand({"docker", "inspect", "--format", "{{.State.Status}}", id});
 * if (r.Success()) { state = r.stdout_output; }
 * @endcode
 */
CommandResult RunCommand(const std::vector<std::string>& argv,
                         const std::optional<std::string>& stdin_data = std::nullopt,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

/**
 * @brief Check whether a program can be found on PATH
 * @param program Program name
 * @return true if an executable file with that name exists on PATH
 */
bool IsProgramAvailable(const std::string& program);

/**
 * @brief Render argv for log messages
 */
std::string FormatCommand(const std::vector<std::string>& argv);

} // namespace utils
} // namespace sandpool
