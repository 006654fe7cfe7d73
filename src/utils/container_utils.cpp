/**
 * @file container_utils.cpp
 * @brief Implementation of Docker container management utilities
 *
 * **Container Lifecycle**:
 * ```
 * Create -> Start -> (Stop -> Start)* -> Remove
 * ```
 *
 * Containers are created with `docker create` rather than `docker run -d` so
 * that a failed start leaves an inspectable container behind that the caller
 * removes explicitly. Removal of a container that no longer exists counts as
 * success, which keeps destroy paths idempotent.
 *
 * @date 2025
 */

#include "sandpool/utils/container_utils.hpp"
#include "sandpool/utils/command_utils.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <regex>

namespace sandpool {
namespace utils {

namespace {

bool IsNoSuchContainer(const std::string& stderr_output) {
    return stderr_output.find("No such container") != std::string::npos ||
           stderr_output.find("No such object") != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

ContainerUtils::ContainerUtils(std::string binary, std::chrono::seconds command_timeout)
    : binary_(std::move(binary)), command_timeout_(command_timeout) {
    spdlog::debug("Container Utils initialized with runtime binary: {}", binary_);
}

ContainerUtils::~ContainerUtils() = default;

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool ContainerUtils::IsRuntimeAvailable(const std::string& binary) {
    if (!IsProgramAvailable(binary)) {
        return false;
    }
    auto result = RunCommand({binary, "--version"}, std::nullopt, std::chrono::seconds(10));
    return result.Success();
}

std::string ContainerUtils::GetRuntimeVersion() const {
    auto result = ExecuteDockerCommand({"--version"});
    if (result.success) {
        // Extract version number (matches x.y.z format)
        std::regex version_regex(R"((\d+\.\d+\.\d+))");
        std::smatch match;
        if (std::regex_search(result.stdout_output, match, version_regex)) {
            return match[1].str();
        }
        return StringUtils::Trim(result.stdout_output);
    }
    return "unknown";
}

bool ContainerUtils::IsDaemonRunning() const {
    auto result = ExecuteDockerCommand({"info", "--format", "{{.ServerVersion}}"});
    return result.success;
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::string ContainerUtils::CreateContainer(const ContainerConfig& config, std::string* error) {
    spdlog::info("Creating container: {} ({})", config.name, config.image);

    if (!ValidateConfig(config)) {
        if (error) {
            *error = "invalid container configuration";
        }
        return "";
    }

    auto result = ExecuteDockerCommand(BuildCreateCommand(config));

    if (result.success) {
        std::string container_id = StringUtils::Trim(result.stdout_output);
        spdlog::info("Container created: {}", container_id.substr(0, 12));
        return container_id;
    }

    spdlog::error("Failed to create container {}: {}", config.name,
                  StringUtils::Trim(result.stderr_output));
    if (error) {
        *error = StringUtils::Trim(result.stderr_output);
    }
    return "";
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

bool ContainerUtils::StartContainer(const std::string& container_id, std::string* error) {
    spdlog::debug("Starting container: {}", container_id);

    auto result = ExecuteDockerCommand({"start", container_id});

    if (result.success) {
        return true;
    }

    spdlog::error("Failed to start container {}: {}", container_id,
                  StringUtils::Trim(result.stderr_output));
    if (error) {
        *error = StringUtils::Trim(result.stderr_output);
    }
    return false;
}

bool ContainerUtils::StopContainer(const std::string& container_id,
                                   std::chrono::seconds timeout) {
    spdlog::debug("Stopping container: {} (timeout: {}s)", container_id, timeout.count());

    auto result = ExecuteDockerCommand({
        "stop",
        "--time", std::to_string(timeout.count()),
        container_id
    });

    if (result.success) {
        return true;
    }

    spdlog::error("Failed to stop container {}: {}", container_id,
                  StringUtils::Trim(result.stderr_output));
    return false;
}

bool ContainerUtils::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::debug("Removing container: {} (force: {})", container_id, force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args);

    if (result.success || IsNoSuchContainer(result.stderr_output)) {
        return true;
    }

    spdlog::error("Failed to remove container {}: {}", container_id,
                  StringUtils::Trim(result.stderr_output));
    return false;
}

// ============================================================================
// CONTAINER INFORMATION RETRIEVAL
// ============================================================================

ContainerState ContainerUtils::GetContainerState(const std::string& container_id) const {
    auto result = ExecuteDockerCommand({
        "inspect",
        "--format", "{{.State.Status}}",
        container_id
    });

    if (result.success) {
        return ParseState(StringUtils::Trim(result.stdout_output));
    }

    return ContainerState::UNKNOWN;
}

// ============================================================================
// COMMAND CONSTRUCTION AND PARSING
// ============================================================================

std::vector<std::string> ContainerUtils::BuildCreateCommand(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("create");

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    if (!config.memory_limit.empty()) {
        args.push_back("--memory");
        args.push_back(config.memory_limit);
    }

    if (!config.cpu_limit.empty()) {
        args.push_back("--cpus");
        args.push_back(config.cpu_limit);
    }

    // Port mappings
    for (const auto& [host_port, container_port] : config.port_mappings) {
        args.push_back("-p");
        args.push_back(std::to_string(host_port) + ":" + std::to_string(container_port));
    }

    // Volume mounts
    for (const auto& mount : config.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path.string() + ":" + mount.container_path +
                       (mount.read_only ? ":ro" : ":rw"));
    }

    // Environment variables
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // Image (must be last)
    args.push_back(config.image);

    return args;
}

ContainerState ContainerUtils::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "removing") return ContainerState::EXITED;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    auto start_time = std::chrono::steady_clock::now();
    auto cmd_result = RunCommand(argv, std::nullopt, command_timeout_);
    auto end_time = std::chrono::steady_clock::now();

    ContainerExecResult exec_result;
    exec_result.exit_code = cmd_result.exit_code;
    exec_result.stdout_output = std::move(cmd_result.stdout_output);
    exec_result.stderr_output = std::move(cmd_result.stderr_output);
    exec_result.success = cmd_result.Success();
    exec_result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time);

    if (!cmd_result.started) {
        exec_result.stderr_output = binary_ + ": command not found";
    } else if (cmd_result.timed_out) {
        exec_result.stderr_output = binary_ + " " + (args.empty() ? "" : args[0]) +
                                    " timed out after " +
                                    std::to_string(command_timeout_.count()) + "s";
    }

    return exec_result;
}

bool ContainerUtils::ValidateConfig(const ContainerConfig& config) const {
    if (config.image.empty()) {
        spdlog::error("Container image not specified");
        return false;
    }

    for (const auto& [host_port, container_port] : config.port_mappings) {
        if (host_port <= 0 || host_port > 65535 || container_port <= 0 || container_port > 65535) {
            spdlog::error("Invalid port mapping {}:{}", host_port, container_port);
            return false;
        }
    }

    return true;
}

} // namespace utils
} // namespace sandpool
