/**
 * @file kubernetes_driver.hpp
 * @brief Backend driver for a Kubernetes cluster, driven through kubectl
 *
 * Each sandbox is a single-container Pod plus a NodePort Service named
 * `<pod>-service` whose nodePort is the reserved host port. Port ranges used
 * with this driver must therefore lie inside the cluster's NodePort range
 * (30000-32767 by default).
 *
 * @date 2025
 */

#pragma once

#include "sandpool/backends/backend_driver.hpp"
#include "sandpool/utils/command_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>

namespace sandpool {
namespace backends {

/**
 * @class KubernetesDriver
 * @brief Pod/Service lifecycle over the kubectl CLI
 *
 * Stop deletes the pod but keeps its manifest and service, so a later Start
 * re-applies the pod under the same name and port.
 */
class KubernetesDriver : public BackendDriver {
public:
    /**
     * @param k8s_namespace Namespace for pods and services
     * @param kubeconfig_path kubeconfig file (empty = kubectl default)
     * @param node_host Host clients use to reach NodePorts (empty = pod's hostIP)
     * @param ready_timeout How long Start waits for the pod to become Ready
     * @param binary kubectl program
     */
    KubernetesDriver(std::string k8s_namespace,
                     std::string kubeconfig_path = "",
                     std::string node_host = "",
                     std::chrono::seconds ready_timeout = std::chrono::seconds(60),
                     std::string binary = "kubectl");

    BackendHandle Create(const ContainerSpec& spec) override;
    void Start(const BackendHandle& handle) override;
    bool Stop(const BackendHandle& handle) override;
    bool Destroy(const BackendHandle& handle) override;
    bool IsAlive(const BackendHandle& handle) override;
    bool IsAvailable() override;
    std::string Name() const override { return "k8s"; }

    /**
     * @brief Pod manifest for a sandbox spec
     */
    nlohmann::json BuildPodManifest(const ContainerSpec& spec) const;

    /**
     * @brief NodePort service manifest exposing the pod's service port
     */
    nlohmann::json BuildServiceManifest(const ContainerSpec& spec) const;

    /**
     * @brief Convert a name to a valid DNS-1123 label
     */
    static std::string SanitizeName(const std::string& name);

    /**
     * @brief Convert a docker-style memory limit ("2g") to a k8s quantity ("2Gi")
     */
    static std::string ToQuantity(const std::string& docker_memory);

private:
    utils::CommandResult Kubectl(const std::vector<std::string>& args,
                                 const std::optional<std::string>& stdin_data = std::nullopt,
                                 std::chrono::seconds timeout = std::chrono::seconds(60)) const;
    void Apply(const nlohmann::json& manifest, const std::string& what);
    void WaitReady(const std::string& pod_name);
    bool PodExists(const std::string& pod_name) const;
    std::string ResolveHost(const std::string& pod_name) const;
    [[noreturn]] void ThrowFailure(const std::string& what, const utils::CommandResult& result);

    std::string namespace_;
    std::string kubeconfig_path_;
    std::string node_host_;
    std::chrono::seconds ready_timeout_;
    std::string binary_;

    std::mutex mutex_;                                   ///< Guards manifests_
    std::map<std::string, nlohmann::json> manifests_;    ///< Pod manifests by name
};

} // namespace backends
} // namespace sandpool
