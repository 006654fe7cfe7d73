/**
 * @file lifecycle_controller.cpp
 * @brief Implementation of the top-level sandbox manager
 *
 * Local bookkeeping (instances assigned by this worker) lives in a map
 * guarded by one mutex that is never held across driver or store calls.
 * The shared store holds one record per assigned instance; deleting that
 * record with a compare-and-delete is what claims an instance for
 * destruction, so concurrent releases from different workers destroy it
 * exactly once.
 *
 * @date 2025
 */

#include "sandpool/core/lifecycle_controller.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/core/port_allocator.hpp"
#include "sandpool/core/sandbox_pool.hpp"
#include "sandpool/utils/hash_utils.hpp"
#include "sandpool/utils/periodic_task.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdio>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

#include <unistd.h>

using json = nlohmann::json;

namespace sandpool {
namespace core {

namespace {

constexpr int kRecordUpdateAttempts = 5;

/// Reason an instance is due for cleanup, or nullptr
const char* DueReason(const SandboxInstance& instance, TimePoint now, std::chrono::seconds max_idle) {
    if (instance.expires_at && now >= *instance.expires_at) {
        return "expired";
    }
    if (max_idle.count() > 0 && now - instance.last_activity >= max_idle) {
        return "idle";
    }
    return nullptr;
}

struct ShutdownTracker {
    std::mutex mutex;
    std::condition_variable cv;
    std::size_t remaining{0};
};

} // anonymous namespace

std::string GenerateOwnerId() {
    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        std::snprintf(hostname, sizeof(hostname), "localhost");
    }
    return std::string(hostname) + "-" + std::to_string(getpid()) + "-" +
           utils::HashUtils::RandomId(6);
}

// ============================================================================
// IMPLEMENTATION STATE
// ============================================================================

class LifecycleController::Impl {
public:
    std::shared_ptr<SandboxRegistry> registry;
    std::shared_ptr<backends::BackendDriver> driver;
    std::shared_ptr<state::StateStore> store;
    std::shared_ptr<storage::DataStorage> storage;
    std::shared_ptr<PortAllocator> ports;
    std::shared_ptr<SandboxPool> pool;
    state::KeySpace keys;
    std::string owner;

    std::mutex mutex;                                   ///< Guards assigned
    std::map<std::string, SandboxInstance> assigned;    ///< Instances handed out by this worker
    std::atomic<bool> shutdown{false};

    std::unique_ptr<utils::PeriodicTask> fill_task;
    std::unique_ptr<utils::PeriodicTask> sweep_task;

    void WriteRecord(const SandboxInstance& instance) {
        store->Put(keys.Container(instance.id), InstanceToJson(instance).dump());
    }

    /**
     * @brief Read and parse a stored record
     * @return Record and its raw value, or nullopt if absent
     * @throws StateStoreError on store failure or a corrupt record
     */
    std::optional<std::pair<SandboxInstance, std::string>> ReadRecord(const std::string& id) {
        auto raw = store->Get(keys.Container(id));
        if (!raw) {
            return std::nullopt;
        }
        try {
            return std::make_pair(InstanceFromJson(json::parse(*raw)), *raw);
        } catch (const json::exception& e) {
            throw StateStoreError("Corrupt record for sandbox " + id + ": " + e.what());
        }
    }

    /**
     * @brief Stamp activity on the stored record with a compare-and-swap
     * @return false if the record no longer exists
     * @throws StateStoreError on store failure or persistent contention
     */
    bool RecordActivity(const std::string& id, TimePoint now) {
        const std::string key = keys.Container(id);
        for (int attempt = 0; attempt < kRecordUpdateAttempts; ++attempt) {
            auto record = ReadRecord(id);
            if (!record) {
                return false;
            }
            record->first.last_activity = now;
            if (store->ReplaceIfEquals(key, record->second, InstanceToJson(record->first).dump())) {
                return true;
            }
        }
        throw StateStoreError("Record of sandbox " + id + " kept changing during update");
    }

    /**
     * @brief Instance assigned by this worker, else the stored record
     * @throws NotFoundError, StateStoreError
     */
    SandboxInstance Locate(const std::string& id) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = assigned.find(id);
            if (it != assigned.end()) {
                return it->second;
            }
        }
        auto record = ReadRecord(id);
        if (!record) {
            throw NotFoundError(id);
        }
        return record->first;
    }

    void ForgetSession(const SandboxInstance& instance) {
        if (instance.session.empty()) {
            return;
        }
        try {
            store->RemoveMember(keys.Session(instance.session), instance.id);
        } catch (const StateStoreError& e) {
            spdlog::warn("Session {} still lists sandbox {}: {}", instance.session, instance.id, e.what());
        }
    }

    bool ReleaseInstance(const std::string& id, bool recycle);
};

bool LifecycleController::Impl::ReleaseInstance(const std::string& id, bool recycle) {
    std::optional<SandboxInstance> local;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = assigned.find(id);
        if (it != assigned.end()) {
            local = std::move(it->second);
            assigned.erase(it);
        }
    }

    const std::string key = keys.Container(id);

    if (local) {
        bool had_record = true;
        try {
            had_record = store->Erase(key);
        } catch (const StateStoreError& e) {
            spdlog::warn("Record of sandbox {} not removed: {}", id, e.what());
        }

        ForgetSession(*local);

        if (!had_record) {
            spdlog::info("Sandbox {} was already released by another worker", id);
            pool->Destroy(*local);
            return true;
        }

        spdlog::info("Releasing sandbox {} ({})", id, recycle ? "recycle" : "destroy");
        pool->GiveBack(std::move(*local), recycle && !shutdown);
        return true;
    }

    // Owned by another worker: claim the record, then destroy through the driver
    std::optional<std::pair<SandboxInstance, std::string>> record;
    try {
        record = ReadRecord(id);
    } catch (const StateStoreError& e) {
        spdlog::error("Cannot release sandbox {}: {}", id, e.what());
        return false;
    }

    if (!record) {
        spdlog::debug("Release of unknown sandbox {} ignored", id);
        return false;
    }

    bool claimed = false;
    try {
        claimed = store->EraseIfEquals(key, record->second);
    } catch (const StateStoreError& e) {
        spdlog::error("Cannot claim sandbox {} for release: {}", id, e.what());
        return false;
    }
    if (!claimed) {
        spdlog::debug("Sandbox {} changed or was released concurrently", id);
        return false;
    }

    spdlog::info("Releasing sandbox {} owned by worker {}", id, record->first.owner);
    ForgetSession(record->first);
    pool->Destroy(record->first);
    return true;
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

LifecycleController::LifecycleController(ManagerConfig config,
                                         std::shared_ptr<SandboxRegistry> registry,
                                         std::shared_ptr<backends::BackendDriver> driver,
                                         std::shared_ptr<state::StateStore> store,
                                         std::shared_ptr<storage::DataStorage> storage,
                                         std::string owner)
    : config_(std::move(config)),
      impl_(std::make_unique<Impl>()) {
    impl_->registry = std::move(registry);
    impl_->driver = std::move(driver);
    impl_->store = std::move(store);
    impl_->storage = std::move(storage);
    impl_->owner = owner.empty() ? GenerateOwnerId() : std::move(owner);
    impl_->keys = MakeKeySpace(config_);

    impl_->ports = std::make_shared<PortAllocator>(impl_->store, impl_->keys,
                                                   config_.port_range_low, config_.port_range_high,
                                                   config_.check_host_ports);
    impl_->pool = std::make_shared<SandboxPool>(config_, impl_->registry, impl_->driver,
                                                impl_->ports, impl_->store, impl_->storage,
                                                impl_->owner);

    spdlog::info("Sandbox manager {} ready (backend: {}, store: {}, storage: {})",
                 impl_->owner, impl_->driver->Name(), impl_->store->Name(), impl_->storage->Name());
}

LifecycleController::~LifecycleController() {
    try {
        Shutdown(config_.shutdown_grace);
    } catch (const std::exception& e) {
        spdlog::error("Error during sandbox manager shutdown: {}", e.what());
    }
}

// ============================================================================
// SANDBOX OPERATIONS
// ============================================================================

SandboxHandle LifecycleController::Acquire(const std::string& type,
                                           std::optional<std::chrono::seconds> timeout,
                                           const std::string& session) {
    if (impl_->shutdown) {
        throw SandboxError("Sandbox manager is shutting down");
    }

    auto type_config = impl_->registry->Find(type);
    if (!type_config) {
        throw UnknownTypeError(type);
    }

    SandboxInstance instance = impl_->pool->Take(type);

    const auto now = Clock::now();
    const auto lifetime = timeout.value_or(type_config->default_timeout);
    instance.state = InstanceState::ASSIGNED;
    instance.last_activity = now;
    instance.expires_at.reset();
    if (lifetime.count() > 0) {
        instance.expires_at = now + lifetime;
    }
    instance.session = session;

    try {
        impl_->WriteRecord(instance);
        if (!session.empty()) {
            impl_->store->AddMember(impl_->keys.Session(session), instance.id);
        }
    } catch (const StateStoreError& e) {
        spdlog::error("Cannot record sandbox {}: {}", instance.id, e.what());
        try {
            impl_->store->Erase(impl_->keys.Container(instance.id));
        } catch (const StateStoreError&) {
            spdlog::warn("Record of sandbox {} may be left behind", instance.id);
        }
        impl_->ForgetSession(instance);
        impl_->pool->Destroy(instance);
        throw;
    }

    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->shutdown) {
            impl_->assigned[instance.id] = instance;
            accepted = true;
        }
    }

    if (!accepted) {
        try {
            impl_->store->Erase(impl_->keys.Container(instance.id));
        } catch (const StateStoreError& e) {
            spdlog::warn("Record of sandbox {} not removed: {}", instance.id, e.what());
        }
        impl_->ForgetSession(instance);
        impl_->pool->Destroy(instance);
        throw SandboxError("Sandbox manager is shutting down");
    }

    spdlog::info("Assigned '{}' sandbox {} at {}", type, instance.id, instance.base_url);

    SandboxHandle handle;
    handle.id = instance.id;
    handle.base_url = instance.base_url;
    handle.bearer_token = instance.bearer_token;
    handle.expires_at = instance.expires_at;
    return handle;
}

void LifecycleController::Release(const std::string& id, std::optional<bool> recycle) {
    impl_->ReleaseInstance(id, recycle.value_or(config_.RecycleOnRelease()));
}

SandboxStatus LifecycleController::Inspect(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->assigned.find(id);
        if (it != impl_->assigned.end()) {
            return MakeStatus(it->second, true);
        }
    }

    try {
        auto record = impl_->ReadRecord(id);
        if (!record) {
            throw NotFoundError(id);
        }
        return MakeStatus(record->first, record->first.owner == impl_->owner);

    } catch (const StateStoreError& e) {
        spdlog::warn("State of sandbox {} unknown: {}", id, e.what());
        SandboxStatus status;
        status.id = id;
        status.state = InstanceState::UNKNOWN;
        return status;
    }
}

void LifecycleController::Touch(const std::string& id) {
    const auto now = Clock::now();

    bool local = false;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->assigned.find(id);
        if (it != impl_->assigned.end()) {
            it->second.last_activity = now;
            local = true;
        }
    }

    bool recorded = false;
    try {
        recorded = impl_->RecordActivity(id, now);
    } catch (const StateStoreError& e) {
        if (!local) {
            throw;
        }
        spdlog::warn("Activity of sandbox {} not recorded: {}", id, e.what());
        return;
    }
    if (recorded) {
        return;
    }

    if (local) {
        // Record gone: another worker claimed and destroyed the instance
        std::optional<SandboxInstance> orphan;
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            auto it = impl_->assigned.find(id);
            if (it != impl_->assigned.end()) {
                orphan = std::move(it->second);
                impl_->assigned.erase(it);
            }
        }
        if (orphan) {
            spdlog::info("Sandbox {} was released by another worker", id);
            impl_->ForgetSession(*orphan);
            impl_->pool->Destroy(*orphan);
        }
    }
    throw NotFoundError(id);
}

bool LifecycleController::StartSandbox(const std::string& id) {
    SandboxInstance instance = impl_->Locate(id);

    impl_->driver->Start(instance.handle);
    if (!impl_->driver->IsAlive(instance.handle)) {
        spdlog::error("Sandbox {} is not running after start", id);
        return false;
    }
    spdlog::info("Sandbox {} started", id);
    return true;
}

bool LifecycleController::StopSandbox(const std::string& id) {
    SandboxInstance instance = impl_->Locate(id);

    if (!impl_->driver->Stop(instance.handle) || impl_->driver->IsAlive(instance.handle)) {
        spdlog::error("Failed to stop sandbox {}", id);
        return false;
    }
    spdlog::info("Sandbox {} stopped", id);
    return true;
}

std::vector<std::string> LifecycleController::SessionSandboxes(const std::string& session) {
    return impl_->store->Members(impl_->keys.Session(session));
}

std::vector<std::string> LifecycleController::Sessions() {
    const std::string prefix = impl_->keys.SessionPrefix();
    std::vector<std::string> sessions;
    for (const auto& key : impl_->store->SetKeys(prefix)) {
        sessions.push_back(key.substr(prefix.size()));
    }
    return sessions;
}

std::vector<SandboxStatus> LifecycleController::List() {
    const auto now = Clock::now();
    std::vector<SandboxStatus> statuses;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& [id, instance] : impl_->assigned) {
            statuses.push_back(MakeStatus(instance, true, now));
        }
    }
    for (const auto& instance : impl_->pool->Snapshot()) {
        statuses.push_back(MakeStatus(instance, true, now));
    }
    return statuses;
}

std::size_t LifecycleController::Sweep(std::chrono::seconds max_idle) {
    const auto now = Clock::now();

    std::vector<SandboxInstance> candidates;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& [id, instance] : impl_->assigned) {
            if (DueReason(instance, now, max_idle)) {
                candidates.push_back(instance);
            }
        }
    }

    std::size_t released = 0;
    for (auto& instance : candidates) {
        const char* reason = DueReason(instance, now, max_idle);

        // Activity reported through another worker only reaches the store record
        if (std::string(reason) == "idle") {
            try {
                auto record = impl_->ReadRecord(instance.id);
                if (record && record->first.last_activity > instance.last_activity) {
                    std::lock_guard<std::mutex> lock(impl_->mutex);
                    auto it = impl_->assigned.find(instance.id);
                    if (it != impl_->assigned.end()) {
                        it->second.last_activity = record->first.last_activity;
                    }
                    instance.last_activity = record->first.last_activity;
                }
            } catch (const StateStoreError& e) {
                spdlog::debug("Cannot refresh activity of {}: {}", instance.id, e.what());
            }
            reason = DueReason(instance, now, max_idle);
            if (!reason) {
                continue;
            }
        }

        spdlog::info("Sandbox {} is {}, releasing", instance.id, reason);
        if (impl_->ReleaseInstance(instance.id, false)) {
            ++released;
        }
    }

    if (impl_->shutdown) {
        return released;
    }

    // Records of other workers
    const std::string prefix = impl_->keys.ContainerPrefix();
    std::vector<std::string> keys;
    try {
        keys = impl_->store->Keys(prefix);
    } catch (const StateStoreError& e) {
        spdlog::warn("Sweep cannot list sandbox records: {}", e.what());
        return released;
    }

    for (const auto& key : keys) {
        const std::string id = key.substr(prefix.size());
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            if (impl_->assigned.count(id) > 0) {
                continue;
            }
        }

        try {
            auto record = impl_->ReadRecord(id);
            if (!record || record->first.state != InstanceState::ASSIGNED) {
                continue;
            }
            const char* reason = DueReason(record->first, now, max_idle);
            if (!reason) {
                continue;
            }
            spdlog::info("Sandbox {} of worker {} is {}, releasing", id, record->first.owner, reason);
            if (impl_->ReleaseInstance(id, false)) {
                ++released;
            }
        } catch (const StateStoreError& e) {
            spdlog::warn("Sweep skipped sandbox {}: {}", id, e.what());
        }
    }

    if (released > 0) {
        spdlog::info("Sweep released {} sandbox(es)", released);
    }
    return released;
}

std::size_t LifecycleController::MaintainPools() {
    if (impl_->shutdown) {
        return 0;
    }
    for (const auto& type : config_.default_sandbox_types) {
        impl_->pool->Prune(type);
    }
    return impl_->pool->FillAll();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void LifecycleController::Start() {
    if (impl_->shutdown || impl_->fill_task) {
        return;
    }

    impl_->fill_task = std::make_unique<utils::PeriodicTask>(
        "pool-fill", config_.fill_interval, [this] { MaintainPools(); });
    impl_->sweep_task = std::make_unique<utils::PeriodicTask>(
        "sweep", config_.sweep_interval, [this] { Sweep(config_.max_idle); });

    impl_->fill_task->Start();
    impl_->sweep_task->Start(false);

    spdlog::info("Background tasks started (fill every {}s, sweep every {}s)",
                 config_.fill_interval.count(), config_.sweep_interval.count());
}

void LifecycleController::Shutdown() {
    Shutdown(config_.shutdown_grace);
}

void LifecycleController::Shutdown(std::chrono::seconds grace) {
    if (impl_->shutdown.exchange(true)) {
        return;
    }

    spdlog::info("Shutting down sandbox manager {}", impl_->owner);

    if (impl_->fill_task) impl_->fill_task->Stop();
    if (impl_->sweep_task) impl_->sweep_task->Stop();
    impl_->pool->Close();

    if (!config_.auto_cleanup) {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        spdlog::warn("AUTO_CLEANUP disabled, leaving {} assigned and {} warm sandbox(es) running",
                     impl_->assigned.size(), impl_->pool->Snapshot().size());
        return;
    }

    std::vector<SandboxInstance> victims = impl_->pool->Drain();
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto& [id, instance] : impl_->assigned) {
            victims.push_back(std::move(instance));
        }
        impl_->assigned.clear();
    }

    if (victims.empty()) {
        spdlog::info("No sandboxes to clean up");
        return;
    }

    for (const auto& instance : victims) {
        if (instance.state != InstanceState::ASSIGNED) {
            continue;
        }
        try {
            impl_->store->Erase(impl_->keys.Container(instance.id));
        } catch (const StateStoreError& e) {
            spdlog::warn("Record of sandbox {} not removed: {}", instance.id, e.what());
        }
        impl_->ForgetSession(instance);
    }

    spdlog::info("Destroying {} sandbox(es), grace {}s", victims.size(), grace.count());

    auto tracker = std::make_shared<ShutdownTracker>();
    tracker->remaining = victims.size();

    for (auto& instance : victims) {
        std::thread([pool = impl_->pool, tracker, instance = std::move(instance)]() {
            try {
                pool->Destroy(instance);
            } catch (const std::exception& e) {
                spdlog::error("Failed to destroy sandbox {}: {}", instance.id, e.what());
            }
            std::lock_guard<std::mutex> lock(tracker->mutex);
            --tracker->remaining;
            tracker->cv.notify_all();
        }).detach();
    }

    std::unique_lock<std::mutex> lock(tracker->mutex);
    bool finished = tracker->cv.wait_for(lock, grace, [&] { return tracker->remaining == 0; });

    if (finished) {
        spdlog::info("All sandboxes cleaned up");
    } else {
        spdlog::warn("Shutdown grace period elapsed, abandoning {} sandbox(es) still being destroyed",
                     tracker->remaining);
    }
}

bool LifecycleController::IsShutdown() const {
    return impl_->shutdown;
}

// ============================================================================
// ACCESSORS
// ============================================================================

SandboxRegistry& LifecycleController::Registry() { return *impl_->registry; }
SandboxPool& LifecycleController::Pool() { return *impl_->pool; }
PortAllocator& LifecycleController::Ports() { return *impl_->ports; }
backends::BackendDriver& LifecycleController::Driver() { return *impl_->driver; }
const std::string& LifecycleController::Owner() const { return impl_->owner; }

} // namespace core
} // namespace sandpool
