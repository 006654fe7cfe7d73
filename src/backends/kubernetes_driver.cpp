/**
 * @file kubernetes_driver.cpp
 * @brief Implementation of the kubectl-based Kubernetes driver
 *
 * **Instance Lifecycle**:
 * ```
 * Create:  apply Pod, apply NodePort Service, wait Ready, resolve node host
 * Start:   re-apply Pod if it was deleted, wait Ready
 * Stop:    delete Pod (manifest and Service kept)
 * Destroy: delete Service, delete Pod (grace period 0)
 * ```
 *
 * Manifests are passed to `kubectl apply -f -` on stdin as JSON.
 *
 * @date 2025
 */

#include "sandpool/backends/kubernetes_driver.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

using json = nlohmann::json;

namespace sandpool {
namespace backends {

namespace {

constexpr std::size_t kMaxNameLength = 63;
const std::string kServiceSuffix = "-service";

std::string ServiceName(const std::string& pod_name) {
    return pod_name + kServiceSuffix;
}

bool IsNotFound(const utils::CommandResult& result) {
    return result.stderr_output.find("NotFound") != std::string::npos ||
           result.stderr_output.find("not found") != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

KubernetesDriver::KubernetesDriver(std::string k8s_namespace,
                                   std::string kubeconfig_path,
                                   std::string node_host,
                                   std::chrono::seconds ready_timeout,
                                   std::string binary)
    : namespace_(std::move(k8s_namespace)),
      kubeconfig_path_(std::move(kubeconfig_path)),
      node_host_(std::move(node_host)),
      ready_timeout_(ready_timeout),
      binary_(std::move(binary)) {
    spdlog::info("Kubernetes driver for namespace '{}'", namespace_);
}

// ============================================================================
// MANIFEST CONSTRUCTION
// ============================================================================

std::string KubernetesDriver::SanitizeName(const std::string& name) {
    std::string result;
    result.reserve(name.size());

    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            result.push_back(static_cast<char>(std::tolower(c)));
        } else if (c == '-' || c == '_' || c == '.') {
            result.push_back('-');
        }
    }

    if (result.size() > kMaxNameLength - kServiceSuffix.size()) {
        result.resize(kMaxNameLength - kServiceSuffix.size());
    }

    // Must start and end with an alphanumeric character
    while (!result.empty() && result.front() == '-') result.erase(0, 1);
    while (!result.empty() && result.back() == '-') result.pop_back();

    return result.empty() ? "sandbox" : result;
}

std::string KubernetesDriver::ToQuantity(const std::string& docker_memory) {
    std::string value = utils::StringUtils::Trim(docker_memory);
    if (value.empty()) {
        return value;
    }

    char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(value.back())));
    std::string number = value.substr(0, value.size() - 1);
    switch (suffix) {
        case 'k': return number + "Ki";
        case 'm': return number + "Mi";
        case 'g': return number + "Gi";
        case 'b': return number;
        default:  return value;
    }
}

json KubernetesDriver::BuildPodManifest(const ContainerSpec& spec) const {
    const std::string pod_name = SanitizeName(spec.name);

    json container_port = {{"containerPort", spec.container_port}, {"protocol", "TCP"}};
    json container = {
        {"name", "sandbox"},
        {"image", spec.image},
        {"imagePullPolicy", "IfNotPresent"}
    };
    container["ports"] = json::array({container_port});

    json env = json::array();
    for (const auto& [key, value] : spec.environment) {
        env.push_back({{"name", key}, {"value", value}});
    }
    if (!env.empty()) {
        container["env"] = env;
    }

    json volume_mounts = json::array();
    json volumes = json::array();
    for (std::size_t i = 0; i < spec.mounts.size(); ++i) {
        const auto& mount = spec.mounts[i];
        const std::string volume_name = "vol-" + std::to_string(i);
        volume_mounts.push_back({
            {"name", volume_name},
            {"mountPath", mount.container_path},
            {"readOnly", mount.read_only}
        });
        volumes.push_back({
            {"name", volume_name},
            {"hostPath", {{"path", mount.host_path.string()}}}
        });
    }
    if (!volume_mounts.empty()) {
        container["volumeMounts"] = volume_mounts;
    }

    json limits = json::object();
    if (!spec.memory_limit.empty()) {
        limits["memory"] = ToQuantity(spec.memory_limit);
    }
    if (!spec.cpu_limit.empty()) {
        limits["cpu"] = spec.cpu_limit;
    }
    if (!limits.empty()) {
        container["resources"] = {{"limits", limits}};
    }

    json labels = {{"app", pod_name}};
    for (const auto& [key, value] : spec.labels) {
        labels[key] = value;
    }

    json pod_spec = {
        {"containers", json::array({container})},
        {"restartPolicy", "Never"}
    };
    if (!volumes.empty()) {
        pod_spec["volumes"] = volumes;
    }

    return {
        {"apiVersion", "v1"},
        {"kind", "Pod"},
        {"metadata", {{"name", pod_name}, {"namespace", namespace_}, {"labels", labels}}},
        {"spec", pod_spec}
    };
}

json KubernetesDriver::BuildServiceManifest(const ContainerSpec& spec) const {
    const std::string pod_name = SanitizeName(spec.name);

    json port = {
        {"name", "port-" + std::to_string(spec.container_port)},
        {"port", spec.container_port},
        {"targetPort", spec.container_port},
        {"protocol", "TCP"}
    };
    if (spec.host_port > 0) {
        port["nodePort"] = spec.host_port;
    }

    return {
        {"apiVersion", "v1"},
        {"kind", "Service"},
        {"metadata", {{"name", ServiceName(pod_name)}, {"namespace", namespace_},
                      {"labels", {{"app", pod_name}}}}},
        {"spec", {
            {"type", "NodePort"},
            {"selector", {{"app", pod_name}}},
            {"ports", json::array({port})}
        }}
    };
}

// ============================================================================
// LIFECYCLE
// ============================================================================

BackendHandle KubernetesDriver::Create(const ContainerSpec& spec) {
    json pod = BuildPodManifest(spec);
    const std::string pod_name = pod["metadata"]["name"].get<std::string>();

    spdlog::info("Creating pod {} ({}) in namespace {}", pod_name, spec.image, namespace_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        manifests_[pod_name] = pod;
    }

    try {
        Apply(pod, "pod " + pod_name);
        Apply(BuildServiceManifest(spec), "service " + ServiceName(pod_name));
        WaitReady(pod_name);
    }
    catch (const core::SandboxError&) {
        Destroy(BackendHandle{pod_name, ""});
        throw;
    }

    return BackendHandle{pod_name, ResolveHost(pod_name)};
}

void KubernetesDriver::Start(const BackendHandle& handle) {
    if (!PodExists(handle.id)) {
        json manifest;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = manifests_.find(handle.id);
            if (it == manifests_.end()) {
                throw core::ProvisioningError("No manifest known for pod " + handle.id);
            }
            manifest = it->second;
        }
        Apply(manifest, "pod " + handle.id);
    }
    WaitReady(handle.id);
}

bool KubernetesDriver::Stop(const BackendHandle& handle) {
    auto result = Kubectl({"delete", "pod", handle.id, "--ignore-not-found=true",
                           "--wait=true"});
    if (!result.Success()) {
        spdlog::error("Failed to delete pod {}: {}", handle.id,
                      utils::StringUtils::Trim(result.stderr_output));
        return false;
    }
    return true;
}

bool KubernetesDriver::Destroy(const BackendHandle& handle) {
    if (handle.Empty()) {
        return true;
    }

    bool ok = true;

    auto svc = Kubectl({"delete", "service", ServiceName(handle.id), "--ignore-not-found=true"});
    if (!svc.Success() && !IsNotFound(svc)) {
        spdlog::warn("Failed to remove service {}: {}", ServiceName(handle.id),
                     utils::StringUtils::Trim(svc.stderr_output));
        ok = false;
    }

    auto pod = Kubectl({"delete", "pod", handle.id, "--ignore-not-found=true",
                        "--grace-period=0", "--force", "--wait=false"});
    if (!pod.Success() && !IsNotFound(pod)) {
        spdlog::error("Failed to remove pod {}: {}", handle.id,
                      utils::StringUtils::Trim(pod.stderr_output));
        ok = false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    manifests_.erase(handle.id);
    return ok;
}

bool KubernetesDriver::IsAlive(const BackendHandle& handle) {
    auto result = Kubectl({"get", "pod", handle.id, "-o", "jsonpath={.status.phase}"},
                          std::nullopt, std::chrono::seconds(15));
    return result.Success() && utils::StringUtils::Trim(result.stdout_output) == "Running";
}

bool KubernetesDriver::IsAvailable() {
    if (!utils::IsProgramAvailable(binary_)) {
        spdlog::warn("{} not found on PATH", binary_);
        return false;
    }
    auto result = Kubectl({"get", "namespace", namespace_, "-o", "name"},
                          std::nullopt, std::chrono::seconds(15));
    if (!result.Success()) {
        spdlog::warn("Kubernetes API unreachable: {}",
                     utils::StringUtils::Trim(result.stderr_output));
        return false;
    }
    return true;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

utils::CommandResult KubernetesDriver::Kubectl(const std::vector<std::string>& args,
                                               const std::optional<std::string>& stdin_data,
                                               std::chrono::seconds timeout) const {
    std::vector<std::string> argv = {binary_};
    if (!kubeconfig_path_.empty()) {
        argv.push_back("--kubeconfig");
        argv.push_back(kubeconfig_path_);
    }
    argv.push_back("--namespace");
    argv.push_back(namespace_);
    argv.insert(argv.end(), args.begin(), args.end());

    auto result = utils::RunCommand(argv, stdin_data, timeout);
    if (!result.started) {
        result.stderr_output = binary_ + ": command not found";
    }
    return result;
}

void KubernetesDriver::Apply(const json& manifest, const std::string& what) {
    auto result = Kubectl({"apply", "-f", "-"}, manifest.dump());
    if (!result.Success()) {
        ThrowFailure("apply " + what, result);
    }
    spdlog::debug("Applied {}", what);
}

void KubernetesDriver::WaitReady(const std::string& pod_name) {
    const std::string timeout_arg = "--timeout=" + std::to_string(ready_timeout_.count()) + "s";
    auto result = Kubectl({"wait", "--for=condition=Ready", "pod/" + pod_name, timeout_arg},
                          std::nullopt, ready_timeout_ + std::chrono::seconds(10));
    if (!result.Success()) {
        ThrowFailure("wait for pod " + pod_name + " to become ready", result);
    }
}

bool KubernetesDriver::PodExists(const std::string& pod_name) const {
    auto result = Kubectl({"get", "pod", pod_name, "-o", "name"},
                          std::nullopt, std::chrono::seconds(15));
    return result.Success();
}

std::string KubernetesDriver::ResolveHost(const std::string& pod_name) const {
    if (!node_host_.empty()) {
        return node_host_;
    }

    auto result = Kubectl({"get", "pod", pod_name, "-o", "jsonpath={.status.hostIP}"},
                          std::nullopt, std::chrono::seconds(15));
    std::string host = utils::StringUtils::Trim(result.stdout_output);
    if (!result.Success() || host.empty()) {
        spdlog::warn("Cannot resolve node IP of pod {}, using localhost", pod_name);
        return "localhost";
    }
    return host;
}

void KubernetesDriver::ThrowFailure(const std::string& what, const utils::CommandResult& result) {
    const std::string detail = result.timed_out ? std::string("timed out")
                                                : utils::StringUtils::Trim(result.stderr_output);
    if (!result.started ||
        detail.find("connection refused") != std::string::npos ||
        detail.find("Unable to connect to the server") != std::string::npos) {
        throw core::BackendUnavailableError("Kubernetes API unreachable during " + what +
                                            ": " + detail);
    }
    throw core::ProvisioningError(what + " failed: " + detail);
}

} // namespace backends
} // namespace sandpool
