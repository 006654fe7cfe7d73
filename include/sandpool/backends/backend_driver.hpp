/**
 * @file backend_driver.hpp
 * @brief Substrate-agnostic interface for creating and controlling sandboxes
 *
 * The pool and controller only ever talk to a BackendDriver. Drivers map a
 * ContainerSpec onto a concrete substrate (a local container engine or a
 * cluster orchestrator) and report failures as exceptions; they never retry.
 *
 * **Driver Contract**:
 * - Create: provisions the instance with the host port already reserved by
 *   the caller. Throws ProvisioningError or BackendUnavailableError.
 * - Start: brings a created or stopped instance up. Same errors as Create.
 * - Stop / Destroy: best effort, return false on failure. Destroy on an
 *   instance that no longer exists succeeds.
 * - IsAlive: true only if the instance is running.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/utils/container_utils.hpp"

#include <map>
#include <memory>
#include <string>

namespace sandpool {

namespace core {
struct ManagerConfig;
}

namespace backends {

/**
 * @struct ContainerSpec
 * @brief Everything a driver needs to provision one sandbox instance
 */
struct ContainerSpec {
    std::string name;                                  ///< Container / pod name
    std::string image;                                 ///< Image reference
    int host_port{0};                                  ///< Reserved host port
    int container_port{80};                            ///< Service port in the sandbox
    std::map<std::string, std::string> environment;    ///< Environment (incl. SECRET_TOKEN)
    std::vector<utils::VolumeMount> mounts;            ///< Workspace and read-only mounts
    std::string memory_limit;                          ///< e.g. "2g"
    std::string cpu_limit;                             ///< e.g. "1.0"
    std::map<std::string, std::string> labels;         ///< Ownership labels
};

/**
 * @struct BackendHandle
 * @brief Opaque reference to a provisioned instance
 */
struct BackendHandle {
    std::string id;    ///< Container id or pod name
    std::string host;  ///< Host on which the reserved port is reachable

    bool Empty() const { return id.empty(); }
};

/**
 * @class BackendDriver
 * @brief Abstract sandbox substrate
 */
class BackendDriver {
public:
    virtual ~BackendDriver() = default;

    /**
     * @brief Provision an instance
     * @param spec Instance description
     * @return Handle to the new instance
     * @throws core::ProvisioningError substrate rejected the request
     * @throws core::BackendUnavailableError substrate unreachable
     */
    virtual BackendHandle Create(const ContainerSpec& spec) = 0;

    /**
     * @brief Start a created or stopped instance
     * @throws core::ProvisioningError, core::BackendUnavailableError
     */
    virtual void Start(const BackendHandle& handle) = 0;

    /// Stop a running instance; false on failure
    virtual bool Stop(const BackendHandle& handle) = 0;

    /// Remove an instance and everything the driver created for it
    virtual bool Destroy(const BackendHandle& handle) = 0;

    /// True if the instance exists and is running
    virtual bool IsAlive(const BackendHandle& handle) = 0;

    /// True if the substrate can be reached
    virtual bool IsAvailable() = 0;

    /// Driver name for logs ("docker", "k8s")
    virtual std::string Name() const = 0;
};

/**
 * @brief Construct the driver selected by CONTAINER_DEPLOYMENT
 * @param config Manager configuration
 * @return Driver instance
 * @throws core::ConfigError for an unknown deployment
 */
std::shared_ptr<BackendDriver> CreateBackendDriver(const core::ManagerConfig& config);

} // namespace backends
} // namespace sandpool
