/**
 * @file sandbox_pool.cpp
 * @brief Implementation of warm pools, provisioning and teardown
 *
 * **Provisioning Steps**:
 * 1. Resolve the type and check its declared environment is complete
 * 2. Generate id, container name and bearer token
 * 3. Reserve a host port (held by the container name)
 * 4. Create the workspace directory and restore it from storage
 * 5. Build the driver spec, create, start and verify the instance
 *
 * Any failure after step 3 undoes the earlier steps before rethrowing.
 *
 * Recycling keeps the port reservation and the workspace directory but
 * replaces everything a previous client could have learned: the backend
 * instance, id, name and bearer token are all new.
 *
 * @date 2025
 */

#include "sandpool/core/sandbox_pool.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace sandpool {
namespace core {

namespace {

constexpr std::size_t kTokenBytes = 16;

void RemoveDirectory(const std::string& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        spdlog::warn("Failed to remove workspace {}: {}", dir, ec.message());
    }
}

} // anonymous namespace

state::KeySpace MakeKeySpace(const ManagerConfig& config) {
    state::KeySpace keys;
    keys.ns = config.state_namespace;
    keys.port_key = config.state_port_key;
    keys.pool_key = config.state_container_pool_key;
    return keys;
}

SandboxPool::SandboxPool(ManagerConfig config,
                         std::shared_ptr<SandboxRegistry> registry,
                         std::shared_ptr<backends::BackendDriver> driver,
                         std::shared_ptr<PortAllocator> ports,
                         std::shared_ptr<state::StateStore> store,
                         std::shared_ptr<storage::DataStorage> storage,
                         std::string owner)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      driver_(std::move(driver)),
      ports_(std::move(ports)),
      store_(std::move(store)),
      storage_(std::move(storage)),
      owner_(std::move(owner)),
      keys_(MakeKeySpace(config_)) {
}

// ============================================================================
// POOL MAINTENANCE
// ============================================================================

std::size_t SandboxPool::Fill(const std::string& type) {
    const int target = TargetSize(type);
    if (closed_ || target <= 0) {
        return 0;
    }
    if (!registry_->Contains(type)) {
        spdlog::warn("Cannot fill pool for unregistered type '{}'", type);
        return 0;
    }

    std::size_t added = 0;
    while (!closed_) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& fill = fill_state_[type];
            if (fill.paused_until) {
                if (Clock::now() < *fill.paused_until) {
                    return added;
                }
                spdlog::info("Resuming pool fill for '{}'", type);
                fill.paused_until.reset();
                fill.consecutive_failures = 0;
            }

            if (warm_[type].size() + pending_[type] >= static_cast<std::size_t>(target)) {
                break;
            }
            ++pending_[type];
        }

        try {
            SandboxInstance instance = Provision(type, InstanceState::WARM);
            RecordMembership(instance, true);

            bool kept = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --pending_[type];
                fill_state_[type].consecutive_failures = 0;
                if (!closed_) {
                    warm_[type].push_back(instance);
                    kept = true;
                }
            }

            if (!kept) {
                RecordMembership(instance, false);
                Destroy(instance);
                break;
            }
            ++added;

        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            --pending_[type];
            auto& fill = fill_state_[type];
            ++fill.consecutive_failures;

            if (fill.consecutive_failures >= config_.fill_retry_limit) {
                fill.paused_until = Clock::now() + config_.fill_cooldown;
                spdlog::error("Pool fill for '{}' failed {} times in a row, pausing for {}s: {}",
                              type, fill.consecutive_failures, config_.fill_cooldown.count(), e.what());
            } else {
                spdlog::warn("Pool fill for '{}' failed ({}/{}): {}",
                             type, fill.consecutive_failures, config_.fill_retry_limit, e.what());
            }
            break;
        }
    }

    if (added > 0) {
        spdlog::info("Added {} warm '{}' sandbox(es), pool now {}/{}",
                     added, type, WarmCount(type), target);
    }
    return added;
}

std::size_t SandboxPool::FillAll() {
    std::size_t added = 0;
    for (const auto& type : config_.default_sandbox_types) {
        added += Fill(type);
    }
    return added;
}

std::size_t SandboxPool::Prune(const std::string& type) {
    std::vector<SandboxInstance> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = warm_.find(type);
        if (it == warm_.end()) {
            return 0;
        }
        candidates.assign(it->second.begin(), it->second.end());
    }

    std::vector<std::string> dead;
    for (const auto& instance : candidates) {
        if (!driver_->IsAlive(instance.handle)) {
            dead.push_back(instance.id);
        }
    }
    if (dead.empty()) {
        return 0;
    }

    std::vector<SandboxInstance> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& queue = warm_[type];
        for (auto it = queue.begin(); it != queue.end();) {
            if (std::find(dead.begin(), dead.end(), it->id) != dead.end()) {
                removed.push_back(std::move(*it));
                it = queue.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& instance : removed) {
        spdlog::warn("Warm sandbox {} ({}) is no longer running, removing", instance.id, type);
        RecordMembership(instance, false);
        Destroy(instance);
    }
    return removed.size();
}

std::vector<SandboxInstance> SandboxPool::Drain() {
    std::vector<SandboxInstance> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [type, queue] : warm_) {
            for (auto& instance : queue) {
                drained.push_back(std::move(instance));
            }
            queue.clear();
        }
    }

    for (const auto& instance : drained) {
        RecordMembership(instance, false);
    }
    return drained;
}

void SandboxPool::Close() {
    if (!closed_.exchange(true)) {
        spdlog::debug("Sandbox pool closed");
    }
}

// ============================================================================
// HAND-OFF
// ============================================================================

SandboxInstance SandboxPool::Take(const std::string& type) {
    auto type_config = registry_->Find(type);
    if (!type_config) {
        throw UnknownTypeError(type);
    }

    while (true) {
        std::optional<SandboxInstance> candidate;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = warm_.find(type);
            if (it != warm_.end() && !it->second.empty()) {
                candidate = std::move(it->second.front());
                it->second.pop_front();
            }
        }
        if (!candidate) {
            break;
        }

        RecordMembership(*candidate, false);

        if (candidate->image != type_config->image) {
            spdlog::info("Discarding warm sandbox {} built from outdated image {}",
                         candidate->id, candidate->image);
            Destroy(*candidate);
            continue;
        }
        if (!driver_->IsAlive(candidate->handle)) {
            spdlog::warn("Warm sandbox {} is not running, discarding", candidate->id);
            Destroy(*candidate);
            continue;
        }

        candidate->state = InstanceState::ASSIGNED;
        candidate->last_activity = Clock::now();
        spdlog::debug("Took warm '{}' sandbox {}", type, candidate->id);
        return std::move(*candidate);
    }

    spdlog::info("No warm '{}' sandbox available, provisioning on demand", type);
    return Provision(type, InstanceState::ASSIGNED);
}

void SandboxPool::GiveBack(SandboxInstance instance, bool recycle) {
    const std::string type = instance.type;
    const int target = TargetSize(type);

    if (recycle && !closed_ && target > 0 && !IsOutdated(instance)) {
        bool reserved = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (warm_[type].size() + pending_[type] < static_cast<std::size_t>(target)) {
                ++pending_[type];
                reserved = true;
            }
        }

        if (reserved) {
            const std::string previous_id = instance.id;
            bool reset = Reset(instance);
            if (reset) {
                RecordMembership(instance, true);
            }

            bool kept = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --pending_[type];
                if (reset && !closed_) {
                    warm_[type].push_back(instance);
                    kept = true;
                }
            }

            if (kept) {
                spdlog::info("Recycled sandbox {} into '{}' pool as {}", previous_id, type, instance.id);
                return;
            }
            if (reset) {
                RecordMembership(instance, false);
            }
        } else {
            spdlog::debug("Pool for '{}' is full, destroying {}", type, instance.id);
        }
    }

    Destroy(instance);
}

bool SandboxPool::Destroy(const SandboxInstance& instance) {
    if (!instance.mount_dir.empty() && !instance.storage_path.empty()) {
        if (!storage_->Upload(instance.mount_dir, instance.storage_path)) {
            spdlog::warn("Workspace of {} could not be saved to {}", instance.id, instance.storage_path);
        }
    }

    bool destroyed = instance.handle.Empty() || driver_->Destroy(instance.handle);
    RemoveDirectory(instance.mount_dir);

    if (!destroyed) {
        spdlog::error("Backend failed to destroy sandbox {} ({}); port {} stays reserved",
                      instance.id, instance.handle.id, instance.port);
        return false;
    }

    ReleasePort(instance);
    spdlog::info("Destroyed sandbox {} ({})", instance.id, instance.type);
    return true;
}

// ============================================================================
// INTROSPECTION
// ============================================================================

std::size_t SandboxPool::WarmCount(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = warm_.find(type);
    return it == warm_.end() ? 0 : it->second.size();
}

std::size_t SandboxPool::PendingCount(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(type);
    return it == pending_.end() ? 0 : it->second;
}

std::vector<SandboxInstance> SandboxPool::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SandboxInstance> instances;
    for (const auto& [type, queue] : warm_) {
        instances.insert(instances.end(), queue.begin(), queue.end());
    }
    return instances;
}

// ============================================================================
// INTERNALS
// ============================================================================

SandboxInstance SandboxPool::Provision(const std::string& type, InstanceState state) {
    auto type_config = registry_->Find(type);
    if (!type_config) {
        throw UnknownTypeError(type);
    }

    for (const auto& [key, value] : type_config->environment) {
        if (value.empty()) {
            throw ProvisioningError("Environment variable " + key + " required by sandbox type '" +
                                    type + "' has no value");
        }
    }

    SandboxInstance instance;
    instance.id = utils::HashUtils::RandomId(kInstanceIdLength);
    instance.type = type;
    instance.name = config_.container_prefix_key + instance.id;
    instance.bearer_token = utils::HashUtils::RandomHex(kTokenBytes);
    instance.image = type_config->image;
    instance.owner = owner_;
    instance.state = state;

    instance.port = ports_->Acquire(instance.name);

    try {
        if (!config_.default_mount_dir.empty()) {
            fs::path dir = fs::absolute(fs::path(config_.default_mount_dir) / instance.id);
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) {
                throw ProvisioningError("Cannot create workspace " + dir.string() + ": " + ec.message());
            }
            instance.mount_dir = dir.string();

            if (!config_.storage_folder.empty()) {
                instance.storage_path = storage_->PathJoin(config_.storage_folder, instance.id);
                if (!storage_->Download(instance.storage_path, dir)) {
                    spdlog::warn("Could not restore workspace for {} from {}",
                                 instance.id, instance.storage_path);
                }
            }
        }

        spdlog::debug("Provisioning '{}' sandbox {} on port {}", type, instance.name, instance.port);
        Launch(instance, *type_config);

    } catch (const std::exception& e) {
        spdlog::error("Provisioning '{}' sandbox {} failed: {}", type, instance.name, e.what());
        if (!instance.handle.Empty()) {
            driver_->Destroy(instance.handle);
        }
        RemoveDirectory(instance.mount_dir);
        ReleasePort(instance);
        throw;
    }

    instance.created_at = Clock::now();
    instance.last_activity = instance.created_at;

    spdlog::info("Provisioned '{}' sandbox {} at {}", type, instance.id, instance.base_url);
    return instance;
}

void SandboxPool::Launch(SandboxInstance& instance, const SandboxTypeConfig& type_config) {
    InstanceParameters params;
    params.id = instance.id;
    params.name = instance.name;
    params.host_port = instance.port;
    params.bearer_token = instance.bearer_token;
    params.mount_dir = instance.mount_dir;
    params.workdir = config_.workdir;
    params.readonly_mounts = config_.readonly_mounts;
    params.labels["sandpool.managed"] = "true";
    params.labels["sandpool.owner"] = owner_;

    backends::ContainerSpec spec = SandboxRegistry::BuildSpec(type_config, params);

    instance.handle = driver_->Create(spec);
    driver_->Start(instance.handle);

    if (!driver_->IsAlive(instance.handle)) {
        throw ProvisioningError("Sandbox " + instance.name + " is not running after start");
    }

    instance.base_url = "http://" + instance.handle.host + ":" + std::to_string(instance.port);
}

bool SandboxPool::Reset(SandboxInstance& instance) {
    auto type_config = registry_->Find(instance.type);
    if (!type_config) {
        return false;
    }

    if (!instance.mount_dir.empty()) {
        if (!instance.storage_path.empty() &&
            !storage_->Upload(instance.mount_dir, instance.storage_path)) {
            spdlog::warn("Workspace of {} could not be saved before recycling", instance.id);
            return false;
        }

        std::error_code ec;
        std::vector<fs::path> entries;
        for (fs::directory_iterator it(instance.mount_dir, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
        if (ec) {
            spdlog::warn("Cannot list workspace {}: {}", instance.mount_dir, ec.message());
            return false;
        }
        for (const auto& entry : entries) {
            fs::remove_all(entry, ec);
            if (ec) {
                spdlog::warn("Cannot wipe workspace {}: {}", instance.mount_dir, ec.message());
                return false;
            }
        }
    }

    // The previous client's container and token go away with it
    if (!driver_->Destroy(instance.handle)) {
        spdlog::warn("Cannot remove backend instance of {} for recycling", instance.id);
        return false;
    }
    instance.handle = backends::BackendHandle{};

    const std::string id = utils::HashUtils::RandomId(kInstanceIdLength);
    const std::string name = config_.container_prefix_key + id;
    try {
        if (!ports_->Transfer(instance.port, instance.name, name)) {
            return false;
        }
    } catch (const StateStoreError& e) {
        spdlog::warn("Cannot move port {} to recycled sandbox: {}", instance.port, e.what());
        return false;
    }
    instance.id = id;
    instance.name = name;

    if (!instance.mount_dir.empty()) {
        fs::path renamed = fs::path(instance.mount_dir).parent_path() / id;
        std::error_code ec;
        fs::rename(instance.mount_dir, renamed, ec);
        if (ec) {
            spdlog::warn("Cannot move workspace {} to {}: {}", instance.mount_dir, renamed.string(), ec.message());
            return false;
        }
        instance.mount_dir = renamed.string();
    }

    instance.bearer_token = utils::HashUtils::RandomHex(kTokenBytes);
    instance.session.clear();

    try {
        Launch(instance, *type_config);
    } catch (const std::exception& e) {
        spdlog::warn("Cannot relaunch recycled sandbox {}: {}", instance.id, e.what());
        return false;
    }

    instance.storage_path = config_.storage_folder.empty()
        ? std::string()
        : storage_->PathJoin(config_.storage_folder, instance.id);
    instance.state = InstanceState::WARM;
    instance.created_at = Clock::now();
    instance.last_activity = instance.created_at;
    instance.expires_at.reset();
    return true;
}

void SandboxPool::ReleasePort(const SandboxInstance& instance) {
    if (instance.port <= 0) {
        return;
    }
    try {
        ports_->Release(instance.port, instance.name);
    } catch (const StateStoreError& e) {
        spdlog::error("Cannot release port {} of {}: {}", instance.port, instance.id, e.what());
    }
}

void SandboxPool::RecordMembership(const SandboxInstance& instance, bool member) {
    const std::string key = keys_.Pool(instance.type);
    try {
        if (member) {
            store_->AddMember(key, instance.id);
        } else {
            store_->RemoveMember(key, instance.id);
        }
    } catch (const StateStoreError& e) {
        spdlog::warn("Pool membership of {} not recorded: {}", instance.id, e.what());
    }
}

bool SandboxPool::IsOutdated(const SandboxInstance& instance) const {
    auto type_config = registry_->Find(instance.type);
    return !type_config || type_config->image != instance.image;
}

} // namespace core
} // namespace sandpool
