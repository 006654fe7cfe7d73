/**
 * @file docker_driver.hpp
 * @brief Backend driver for a local Docker engine
 *
 * @date 2025
 */

#pragma once

#include "sandpool/backends/backend_driver.hpp"
#include "sandpool/utils/container_utils.hpp"

namespace sandpool {
namespace backends {

/**
 * @class DockerDriver
 * @brief Maps sandbox instances onto containers via the docker CLI
 *
 * The reserved host port is published to the sandbox's service port with
 * `-p host:container`, so the instance is reachable at
 * `http://<sandbox_host>:<host_port>`.
 */
class DockerDriver : public BackendDriver {
public:
    /**
     * @param sandbox_host Host name clients use to reach published ports
     * @param binary Docker CLI program
     */
    explicit DockerDriver(std::string sandbox_host = "localhost",
                          std::string binary = "docker");

    BackendHandle Create(const ContainerSpec& spec) override;
    void Start(const BackendHandle& handle) override;
    bool Stop(const BackendHandle& handle) override;
    bool Destroy(const BackendHandle& handle) override;
    bool IsAlive(const BackendHandle& handle) override;
    bool IsAvailable() override;
    std::string Name() const override { return "docker"; }

    /**
     * @brief Translate a sandbox spec to a docker container configuration
     */
    static utils::ContainerConfig ToContainerConfig(const ContainerSpec& spec);

private:
    [[noreturn]] void ThrowFailure(const std::string& what, const std::string& detail);

    std::string sandbox_host_;        ///< Host part of instance URLs
    utils::ContainerUtils docker_;    ///< CLI wrapper
};

} // namespace backends
} // namespace sandpool
