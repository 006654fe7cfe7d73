/**
 * @file docker_driver.cpp
 * @brief Implementation of the Docker backend driver
 *
 * A failed CLI call is classified by probing the daemon afterwards: if
 * `docker info` also fails the substrate is unavailable, otherwise the
 * request itself was rejected (bad image, name clash, port conflict).
 *
 * @date 2025
 */

#include "sandpool/backends/docker_driver.hpp"
#include "sandpool/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace sandpool {
namespace backends {

DockerDriver::DockerDriver(std::string sandbox_host, std::string binary)
    : sandbox_host_(std::move(sandbox_host)), docker_(std::move(binary)) {
}

utils::ContainerConfig DockerDriver::ToContainerConfig(const ContainerSpec& spec) {
    utils::ContainerConfig config;
    config.name = spec.name;
    config.image = spec.image;
    config.memory_limit = spec.memory_limit;
    config.cpu_limit = spec.cpu_limit;
    config.port_mappings[spec.host_port] = spec.container_port;
    config.mounts = spec.mounts;
    config.environment_vars = spec.environment;
    config.labels = spec.labels;
    return config;
}

BackendHandle DockerDriver::Create(const ContainerSpec& spec) {
    std::string error;
    std::string id = docker_.CreateContainer(ToContainerConfig(spec), &error);
    if (id.empty()) {
        ThrowFailure("docker create " + spec.image, error);
    }
    return BackendHandle{id, sandbox_host_};
}

void DockerDriver::Start(const BackendHandle& handle) {
    std::string error;
    if (!docker_.StartContainer(handle.id, &error)) {
        ThrowFailure("docker start " + handle.id, error);
    }
}

bool DockerDriver::Stop(const BackendHandle& handle) {
    return docker_.StopContainer(handle.id);
}

bool DockerDriver::Destroy(const BackendHandle& handle) {
    if (handle.Empty()) {
        return true;
    }
    return docker_.RemoveContainer(handle.id, true);
}

bool DockerDriver::IsAlive(const BackendHandle& handle) {
    return docker_.GetContainerState(handle.id) == utils::ContainerState::RUNNING;
}

bool DockerDriver::IsAvailable() {
    if (!utils::ContainerUtils::IsRuntimeAvailable(docker_.GetBinary())) {
        spdlog::warn("{} CLI not found on PATH", docker_.GetBinary());
        return false;
    }
    if (!docker_.IsDaemonRunning()) {
        spdlog::warn("Docker daemon is not reachable");
        return false;
    }
    spdlog::debug("Docker runtime version: {}", docker_.GetRuntimeVersion());
    return true;
}

void DockerDriver::ThrowFailure(const std::string& what, const std::string& detail) {
    if (!docker_.IsDaemonRunning()) {
        throw core::BackendUnavailableError("Docker daemon unreachable during " + what);
    }
    throw core::ProvisioningError(what + " failed: " + detail);
}

} // namespace backends
} // namespace sandpool
