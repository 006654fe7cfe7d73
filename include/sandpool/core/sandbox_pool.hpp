/**
 * @file sandbox_pool.hpp
 * @brief Per-type pools of pre-provisioned (warm) sandbox instances
 *
 * The pool owns provisioning and destruction of instances. It keeps up to
 * the configured number of warm instances per type so that acquisition is
 * usually a constant-time hand-off, and falls back to provisioning on demand
 * when a pool is empty.
 *
 * **Capacity Accounting**:
 * A slot is reserved under the pool mutex (pending count) before any slow
 * driver call, and the mutex is never held across driver calls. Warm plus
 * pending never exceeds the target size of a type.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/backends/backend_driver.hpp"
#include "sandpool/core/manager_config.hpp"
#include "sandpool/core/port_allocator.hpp"
#include "sandpool/core/sandbox_registry.hpp"
#include "sandpool/core/sandbox_types.hpp"
#include "sandpool/state/state_store.hpp"
#include "sandpool/storage/data_storage.hpp"

#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/**
 * @class SandboxPool
 * @brief Warm instance pools plus on-demand provisioning
 *
 * **Usage Example**:
 * @code
 * SandboxPool pool(config, registry, driver, ports, store, storage, "worker-1");
 * pool.FillAll();
 *
 * SandboxInstance instance = pool.Take("base");   // warm or freshly created
 * // ...
 * pool.GiveBack(std::move(instance), true);      // recycle into the pool
 * @endcode
 */
class SandboxPool {
public:
    SandboxPool(ManagerConfig config,
                std::shared_ptr<SandboxRegistry> registry,
                std::shared_ptr<backends::BackendDriver> driver,
                std::shared_ptr<PortAllocator> ports,
                std::shared_ptr<state::StateStore> store,
                std::shared_ptr<storage::DataStorage> storage,
                std::string owner);

    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    // ========================================================================
    // Pool Maintenance
    // ========================================================================

    /**
     * @brief Provision warm instances until @p type reaches its target
     *
     * Stops at the first provisioning failure. After FILL_RETRY_LIMIT
     * consecutive failures the type is skipped for FILL_COOLDOWN.
     *
     * @return Number of instances added
     */
    std::size_t Fill(const std::string& type);

    /// Fill every pooled type
    std::size_t FillAll();

    /**
     * @brief Destroy warm instances of @p type that are no longer running
     * @return Number of instances removed
     */
    std::size_t Prune(const std::string& type);

    /**
     * @brief Remove and return every warm instance
     *
     * The caller becomes responsible for destroying them.
     */
    std::vector<SandboxInstance> Drain();

    /**
     * @brief Stop accepting instances
     *
     * Fill becomes a no-op and GiveBack destroys instead of recycling.
     */
    void Close();

    bool IsClosed() const { return closed_; }

    // ========================================================================
    // Hand-off
    // ========================================================================

    /**
     * @brief Obtain a running instance of @p type
     *
     * Pops the oldest warm instance; warm instances built from an outdated
     * image or no longer running are destroyed and skipped. Provisions a new
     * instance when none is usable.
     *
     * @throws UnknownTypeError, ProvisioningError, ExhaustionError,
     *         BackendUnavailableError, StateStoreError
     */
    SandboxInstance Take(const std::string& type);

    /**
     * @brief Return an instance after use
     *
     * With @p recycle set and room in the pool, the workspace is saved and
     * wiped and the backend instance is replaced by a new one under a fresh
     * id and bearer token, keeping the port and workspace directory. It is
     * put back as WARM. Otherwise, or if any of that fails, the instance is
     * destroyed.
     */
    void GiveBack(SandboxInstance instance, bool recycle);

    /**
     * @brief Tear an instance down completely
     *
     * Saves the workspace, destroys the backend instance, removes the mount
     * directory and releases the port if @p instance still holds it. Safe
     * to call for an instance already destroyed elsewhere.
     *
     * @return false if the driver reported a failure
     */
    bool Destroy(const SandboxInstance& instance);

    // ========================================================================
    // Introspection
    // ========================================================================

    std::size_t WarmCount(const std::string& type) const;
    std::size_t PendingCount(const std::string& type) const;

    /// Configured target for @p type
    int TargetSize(const std::string& type) const { return config_.PoolSizeFor(type); }

    /// Copies of all warm instances
    std::vector<SandboxInstance> Snapshot() const;

    const std::string& Owner() const { return owner_; }

private:
    /**
     * @brief Create, start and verify a new instance
     * @param type Sandbox type
     * @param state Initial state to record (WARM or ASSIGNED)
     */
    SandboxInstance Provision(const std::string& type, InstanceState state);

    /// Build the driver spec for @p instance, then create, start and verify it
    void Launch(SandboxInstance& instance, const SandboxTypeConfig& type_config);

    /// Save + wipe the workspace, replace the backend instance, new id and token
    bool Reset(SandboxInstance& instance);

    /// Release the port reservation held by @p instance (logged on failure)
    void ReleasePort(const SandboxInstance& instance);

    void RecordMembership(const SandboxInstance& instance, bool member);

    bool IsOutdated(const SandboxInstance& instance) const;

    struct FillState {
        int consecutive_failures{0};
        std::optional<TimePoint> paused_until;
    };

    ManagerConfig config_;
    std::shared_ptr<SandboxRegistry> registry_;
    std::shared_ptr<backends::BackendDriver> driver_;
    std::shared_ptr<PortAllocator> ports_;
    std::shared_ptr<state::StateStore> store_;
    std::shared_ptr<storage::DataStorage> storage_;
    std::string owner_;                                      ///< Worker id stamped on instances
    state::KeySpace keys_;

    mutable std::mutex mutex_;                               ///< Guards the three maps below
    std::map<std::string, std::deque<SandboxInstance>> warm_;  ///< FIFO per type
    std::map<std::string, std::size_t> pending_;             ///< Reserved, not yet warm
    std::map<std::string, FillState> fill_state_;
    std::atomic<bool> closed_{false};
};

/**
 * @brief Key layout derived from the STATE_* settings
 */
state::KeySpace MakeKeySpace(const ManagerConfig& config);

} // namespace core
} // namespace sandpool
