/**
 * @file sandbox_types.hpp
 * @brief Sandbox instance, handle and status data structures
 *
 * @date 2025
 */

#pragma once

#include "sandpool/backends/backend_driver.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace sandpool {
namespace core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @enum InstanceState
 * @brief Sandbox instance lifecycle
 *
 * ```
 * (created) -> WARM -> ASSIGNED -> WARM       (recycled)
 *                          |    -> DESTROYED
 * (created on pool miss) --+
 * ```
 */
enum class InstanceState {
    WARM,       ///< Idle in the pool
    ASSIGNED,   ///< Handed to a client
    DESTROYED,  ///< Backend instance removed
    UNKNOWN     ///< State could not be determined
};

/**
 * @struct SandboxInstance
 * @brief One live sandbox and everything needed to reach and destroy it
 */
struct SandboxInstance {
    std::string id;                        ///< Globally unique instance id
    std::string type;                      ///< Sandbox type identifier
    std::string name;                      ///< Container / pod name
    backends::BackendHandle handle;        ///< Driver handle
    int port{0};                           ///< Reserved host port
    std::string base_url;                  ///< http://host:port
    std::string bearer_token;              ///< Per-instance secret (never persisted)
    InstanceState state{InstanceState::WARM};
    std::string image;                     ///< Image the instance was created from

    TimePoint created_at;                  ///< Creation time
    TimePoint last_activity;               ///< Last acquire/touch
    std::optional<TimePoint> expires_at;   ///< Hard deadline while assigned

    std::string mount_dir;                 ///< Host workspace directory (empty = none)
    std::string storage_path;              ///< Persistent workspace location
    std::string owner;                     ///< Worker id owning the instance
    std::string session;                   ///< Client session bound at acquire (empty = none)
};

/**
 * @struct SandboxHandle
 * @brief What a client receives from Acquire
 */
struct SandboxHandle {
    std::string id;
    std::string base_url;
    std::string bearer_token;
    std::optional<TimePoint> expires_at;
};

/**
 * @struct SandboxStatus
 * @brief Result of Inspect / List
 */
struct SandboxStatus {
    std::string id;
    std::string type;
    InstanceState state{InstanceState::UNKNOWN};
    std::string base_url;
    std::string owner;
    std::string session;
    bool local{false};                     ///< Owned by this worker
    std::optional<TimePoint> created_at;
    std::optional<TimePoint> last_activity;
    std::optional<TimePoint> expires_at;
    std::chrono::seconds age{0};
    std::chrono::seconds idle{0};
};

std::string StateToString(InstanceState state);
InstanceState StateFromString(const std::string& str);

/// Milliseconds since the Unix epoch
long long ToEpochMillis(TimePoint tp);
TimePoint FromEpochMillis(long long ms);

/**
 * @brief Serialize an instance record for the shared state store
 *
 * The bearer token is omitted.
 */
nlohmann::json InstanceToJson(const SandboxInstance& instance);

/**
 * @brief Parse a stored instance record
 * @throws nlohmann::json::exception on malformed input
 */
SandboxInstance InstanceFromJson(const nlohmann::json& j);

nlohmann::json HandleToJson(const SandboxHandle& handle);
nlohmann::json StatusToJson(const SandboxStatus& status);

/**
 * @brief Build a status snapshot of an instance
 * @param instance Instance
 * @param local Owned by the calling worker
 * @param now Reference time for age and idle
 */
SandboxStatus MakeStatus(const SandboxInstance& instance, bool local, TimePoint now = Clock::now());

} // namespace core
} // namespace sandpool
