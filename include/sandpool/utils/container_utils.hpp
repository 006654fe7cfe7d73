/**
 * @file container_utils.hpp
 * @brief Docker container management utilities
 *
 * Thin, typed wrapper over the `docker` CLI covering the lifecycle steps a
 * sandbox needs: create with published port, environment, bind mounts,
 * resource limits and labels; start; stop; forced removal and state
 * inspection.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <chrono>

namespace sandpool {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by `docker inspect`
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running (or restarting)
    PAUSED,    ///< Container paused
    EXITED,    ///< Container exited or is being removed
    DEAD,      ///< Container is dead
    UNKNOWN    ///< Unknown state or container missing
};

/**
 * @struct VolumeMount
 * @brief Host directory bind-mounted into the container
 */
struct VolumeMount {
    std::filesystem::path host_path;       ///< Path on the host
    std::string container_path;            ///< Mount point inside the container
    bool read_only{false};                 ///< Mount with :ro
};

/**
 * @struct ContainerConfig
 * @brief Complete container configuration for `docker create`
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                           ///< Container name
    std::string image;                          ///< Image reference

    // Resource Limits
    std::string memory_limit;                   ///< e.g. "2g" (empty = unlimited)
    std::string cpu_limit;                      ///< e.g. "1.5" (empty = unlimited)

    // Network Settings
    std::map<int, int> port_mappings;           ///< host port -> container port

    // Filesystem Settings
    std::vector<VolumeMount> mounts;            ///< Bind mounts

    // Environment
    std::map<std::string, std::string> environment_vars;  ///< Environment variables

    // Metadata
    std::map<std::string, std::string> labels;  ///< Container labels
};

/**
 * @struct ContainerExecResult
 * @brief Result of one docker CLI invocation
 */
struct ContainerExecResult {
    int exit_code{0};              ///< Exit code
    std::string stdout_output;     ///< Standard output
    std::string stderr_output;     ///< Standard error
    std::chrono::milliseconds duration{0};  ///< Execution duration
    bool success{false};           ///< Success flag
};

/**
 * @class ContainerUtils
 * @brief Docker container lifecycle management
 *
 * Each call spawns one `docker` process; the object itself is stateless
 * beyond its configuration and is safe to share between threads.
 *
 * **Usage Example**:
 * @code
 * ContainerUtils docker;
 *
 * ContainerConfig config;
 * config.name = "sandbox_abc";
 * config.image = "agentscope/runtime-sandbox-base:latest";
 * config.port_mappings[49152] = 80;
 * config.environment_vars["SECRET_TOKEN"] = token;
 *
 * std::string error;
 * std::string id = docker.CreateContainer(config, &error);
 * docker.StartContainer(id);
 * bool up = docker.GetContainerState(id) == ContainerState::RUNNING;
 * docker.RemoveContainer(id, true);
 * @endcode
 */
class ContainerUtils {
public:
    /**
     * @brief Construct container utilities
     * @param binary Docker CLI program (resolved through PATH)
     * @param command_timeout Upper bound for any single CLI call
     */
    explicit ContainerUtils(std::string binary = "docker",
                            std::chrono::seconds command_timeout = std::chrono::seconds(120));

    ~ContainerUtils();

    /**
     * @brief Check if the container CLI is installed
     * @param binary CLI program
     * @return true if `<binary> --version` succeeds
     */
    static bool IsRuntimeAvailable(const std::string& binary = "docker");

    /**
     * @brief Get runtime version string
     * @return Version (x.y.z) or "unknown"
     */
    std::string GetRuntimeVersion() const;

    /**
     * @brief Check that the daemon answers (`docker info`)
     * @return true if reachable
     */
    bool IsDaemonRunning() const;

    /**
     * @brief Create (but do not start) a container
     * @param config Container configuration
     * @param error Receives the CLI error output on failure (optional)
     * @return Container ID, empty on failure
     */
    std::string CreateContainer(const ContainerConfig& config, std::string* error = nullptr);

    /**
     * @brief Start container
     * @param container_id Container ID
     * @param error Receives the CLI error output on failure (optional)
     * @return true if started successfully
     */
    bool StartContainer(const std::string& container_id, std::string* error = nullptr);

    /**
     * @brief Stop container gracefully
     * @param container_id Container ID
     * @param timeout Seconds docker waits before SIGKILL
     * @return true if stopped successfully
     */
    bool StopContainer(const std::string& container_id,
                       std::chrono::seconds timeout = std::chrono::seconds(10));

    /**
     * @brief Remove container
     * @param container_id Container ID
     * @param force Kill a running container first
     * @return true if removed (or already gone)
     */
    bool RemoveContainer(const std::string& container_id, bool force = false);

    /**
     * @brief Get container state
     * @param container_id Container ID
     * @return Container state (UNKNOWN if missing)
     */
    ContainerState GetContainerState(const std::string& container_id) const;

    /**
     * @brief Build the argument list for `docker create`
     * @param config Container configuration
     * @return Arguments (without the binary)
     */
    static std::vector<std::string> BuildCreateCommand(const ContainerConfig& config);

    static ContainerState ParseState(const std::string& state_str);

    const std::string& GetBinary() const { return binary_; }

private:
    std::string binary_;                    ///< CLI program
    std::chrono::seconds command_timeout_;  ///< Per-call timeout

    ContainerExecResult ExecuteDockerCommand(const std::vector<std::string>& args) const;
    bool ValidateConfig(const ContainerConfig& config) const;
};

} // namespace utils
} // namespace sandpool
