/**
 * @file backend_driver.cpp
 * @brief Driver selection
 *
 * @date 2025
 */

#include "sandpool/backends/backend_driver.hpp"
#include "sandpool/backends/docker_driver.hpp"
#include "sandpool/backends/kubernetes_driver.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/core/manager_config.hpp"

#include <spdlog/spdlog.h>

namespace sandpool {
namespace backends {

std::shared_ptr<BackendDriver> CreateBackendDriver(const core::ManagerConfig& config) {
    if (config.container_deployment == "docker") {
        spdlog::info("Using Docker backend (sandbox host {})", config.sandbox_host);
        return std::make_shared<DockerDriver>(config.sandbox_host);
    }
    if (config.container_deployment == "k8s") {
        return std::make_shared<KubernetesDriver>(config.k8s_namespace, config.kubeconfig_path,
                                                  config.k8s_node_host);
    }
    throw core::ConfigError("Unsupported CONTAINER_DEPLOYMENT: " + config.container_deployment);
}

} // namespace backends
} // namespace sandpool
