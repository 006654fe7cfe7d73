/**
 * @file lifecycle_controller.hpp
 * @brief Top-level sandbox manager: acquire, release, inspect, sweep, shutdown
 *
 * The controller is the single entry point used by the control server. It
 * owns the pool, tracks instances assigned by this worker, mirrors them into
 * the shared state store so that any worker can inspect or release them, and
 * runs the background fill and sweep tasks.
 *
 * **Instance Lifecycle**:
 * ```
 * Acquire --> Pool::Take --> record in store --> ASSIGNED
 *                                                   |
 *       Release / expiry / idle sweep / shutdown <--+
 *                     |
 *         recycle? --yes--> Pool::GiveBack (WARM)
 *                     no--> Pool::Destroy (port released)
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandpool/backends/backend_driver.hpp"
#include "sandpool/core/manager_config.hpp"
#include "sandpool/core/sandbox_registry.hpp"
#include "sandpool/core/sandbox_types.hpp"
#include "sandpool/state/state_store.hpp"
#include "sandpool/storage/data_storage.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

class SandboxPool;
class PortAllocator;

/**
 * @class LifecycleController
 * @brief Coordinates the pool, registry, driver and shared state
 *
 * All public methods are thread-safe.
 *
 * **Usage Example**:
 * @code
 * auto config = ManagerConfig::LoadFromEnvironment();
 * auto registry = std::make_shared<SandboxRegistry>();
 * registry->RegisterBuiltins(config);
 *
 * LifecycleController controller(config, registry,
 *                                backends::CreateBackendDriver(config),
 *                                std::make_shared<state::MemoryStateStore>(),
 *                                storage::CreateDataStorage(config));
 * controller.Start();
 *
 * SandboxHandle handle = controller.Acquire("base");
 * // ... client talks to handle.base_url with handle.bearer_token ...
 * controller.Release(handle.id);
 *
 * controller.Shutdown();
 * @endcode
 */
class LifecycleController {
public:
    /**
     * @param config Manager configuration
     * @param registry Type registry (shared with the control server)
     * @param driver Backend driver
     * @param store Shared state store
     * @param storage Workspace storage
     * @param owner Worker id; generated if empty
     */
    LifecycleController(ManagerConfig config,
                        std::shared_ptr<SandboxRegistry> registry,
                        std::shared_ptr<backends::BackendDriver> driver,
                        std::shared_ptr<state::StateStore> store,
                        std::shared_ptr<storage::DataStorage> storage,
                        std::string owner = "");

    /// Performs Shutdown() if it has not run yet
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    // ========================================================================
    // Sandbox Operations
    // ========================================================================

    /**
     * @brief Hand out a running sandbox of @p type
     * @param type Registered type identifier
     * @param timeout Lifetime override (0 = never expires); type default if unset
     * @param session Client session to bind the sandbox to (empty = none)
     * @return Handle with URL and bearer token
     * @throws UnknownTypeError type not registered (no port is allocated)
     * @throws ProvisioningError, ExhaustionError, BackendUnavailableError,
     *         StateStoreError, or SandboxError after Shutdown
     */
    SandboxHandle Acquire(const std::string& type,
                          std::optional<std::chrono::seconds> timeout = std::nullopt,
                          const std::string& session = "");

    /**
     * @brief Give a sandbox back (idempotent)
     *
     * Works for instances assigned by any worker sharing the store. Unknown
     * or already released ids are ignored.
     *
     * @param id Instance id
     * @param recycle Return to the pool instead of destroying; RECYCLE_ON_RELEASE if unset
     */
    void Release(const std::string& id, std::optional<bool> recycle = std::nullopt);

    /**
     * @brief Status of an assigned instance
     *
     * Reports state UNKNOWN when the shared store cannot be read.
     *
     * @throws NotFoundError if no worker knows the id
     */
    SandboxStatus Inspect(const std::string& id);

    /**
     * @brief Record activity on an instance, deferring its idle cleanup
     *
     * The shared record is only updated while it still exists. If another
     * worker released an instance of this worker in the meantime, the local
     * entry is dropped and torn down.
     *
     * @throws NotFoundError if no worker knows the id
     */
    void Touch(const std::string& id);

    /**
     * @brief Start the backend instance of an assigned sandbox
     * @return true if it is running afterwards
     * @throws NotFoundError, ProvisioningError, BackendUnavailableError, StateStoreError
     */
    bool StartSandbox(const std::string& id);

    /**
     * @brief Stop the backend instance of an assigned sandbox
     *
     * The sandbox stays assigned and keeps its port; StartSandbox resumes it.
     *
     * @return true if it is no longer running
     * @throws NotFoundError, StateStoreError
     */
    bool StopSandbox(const std::string& id);

    /// Ids of sandboxes bound to @p session (any worker)
    std::vector<std::string> SessionSandboxes(const std::string& session);

    /// Sessions with at least one sandbox bound
    std::vector<std::string> Sessions();

    /// Instances owned by this worker (assigned and warm)
    std::vector<SandboxStatus> List();

    /**
     * @brief Release instances that expired or stayed idle too long
     *
     * Covers instances of this worker and ASSIGNED records of other
     * workers found in the shared store.
     *
     * @param max_idle Idle limit (0 = only hard expiry applies)
     * @return Number of instances released
     */
    std::size_t Sweep(std::chrono::seconds max_idle);

    /// One pool maintenance round: prune dead and fill every pooled type
    std::size_t MaintainPools();

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Launch the fill and sweep background tasks
     */
    void Start();

    /**
     * @brief Stop background work and clean up, bounded by SHUTDOWN_GRACE
     */
    void Shutdown();

    /**
     * @brief Stop background work and clean up
     *
     * With AUTO_CLEANUP every warm and assigned instance of this worker is
     * destroyed concurrently; instances still being destroyed when @p grace
     * runs out are logged as abandoned. Idempotent.
     */
    void Shutdown(std::chrono::seconds grace);

    bool IsShutdown() const;

    // ========================================================================
    // Accessors
    // ========================================================================

    SandboxRegistry& Registry();
    SandboxPool& Pool();
    PortAllocator& Ports();
    backends::BackendDriver& Driver();
    const ManagerConfig& Config() const { return config_; }
    const std::string& Owner() const;

private:
    ManagerConfig config_;

    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Generate a worker id of the form `<hostname>-<pid>-<random>`
 */
std::string GenerateOwnerId();

} // namespace core
} // namespace sandpool
