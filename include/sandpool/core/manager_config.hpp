/**
 * @file manager_config.hpp
 * @brief Sandbox manager configuration
 *
 * Values come from (lowest to highest precedence): built-in defaults, a
 * `.env` style file, the process environment, and command-line flags applied
 * by `main`. Keys use the environment variable names listed in Apply().
 *
 * @date 2025
 */

#pragma once

#include "sandpool/utils/container_utils.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/// Pod names are "<prefix><25-char id>" and must fit in 63 characters
constexpr std::size_t kInstanceIdLength = 25;
constexpr std::size_t kMaxContainerPrefixLength = 63 - kInstanceIdLength;
/// Pods also need room for the "-service" suffix of their NodePort service
constexpr std::size_t kMaxPodPrefixLength = kMaxContainerPrefixLength - 8;

constexpr int kNodePortLow = 30000;
constexpr int kNodePortHigh = 32767;

/**
 * @struct ManagerConfig
 * @brief Complete manager configuration
 */
struct ManagerConfig {
    // Service
    std::string host{"127.0.0.1"};                       ///< HOST (HTTP collaborator)
    int port{8000};                                      ///< PORT (HTTP collaborator)
    std::string control_socket{"/tmp/sandpool.sock"};    ///< CONTROL_SOCKET
    int workers{1};                                      ///< WORKERS
    bool debug{false};                                   ///< DEBUG
    std::string log_level{"info"};                       ///< LOG_LEVEL
    std::string log_file;                                ///< LOG_FILE (empty = console only)
    std::string bearer_token;                            ///< BEARER_TOKEN (empty = no auth)

    // Pool
    std::vector<std::string> default_sandbox_types{"base"};  ///< DEFAULT_SANDBOX_TYPE
    int pool_size{1};                                    ///< POOL_SIZE
    std::map<std::string, int> pool_sizes;               ///< POOL_SIZES (per-type override)
    bool auto_cleanup{true};                             ///< AUTO_CLEANUP
    std::optional<bool> recycle_on_release;              ///< RECYCLE_ON_RELEASE (default AUTO_CLEANUP)

    // Containers
    std::string container_prefix_key{"runtime_sandbox_container_"};  ///< CONTAINER_PREFIX_KEY
    std::string container_deployment{"docker"};          ///< CONTAINER_DEPLOYMENT (docker|k8s)
    std::string sandbox_host{"localhost"};               ///< SANDBOX_HOST
    std::string default_mount_dir{"sessions_mount_dir"}; ///< DEFAULT_MOUNT_DIR
    std::string workdir{"/workspace"};                   ///< WORKDIR
    std::vector<utils::VolumeMount> readonly_mounts;     ///< READONLY_MOUNTS

    // Workspace storage
    std::string storage_folder{"runtime_sandbox_storage"};  ///< STORAGE_FOLDER
    std::string file_system{"local"};                    ///< FILE_SYSTEM (local|oss)
    std::string oss_endpoint;                            ///< OSS_ENDPOINT
    std::string oss_access_key_id;                       ///< OSS_ACCESS_KEY_ID
    std::string oss_access_key_secret;                   ///< OSS_ACCESS_KEY_SECRET
    std::string oss_bucket_name;                         ///< OSS_BUCKET_NAME

    // Ports
    int port_range_low{49152};                           ///< PORT_RANGE low
    int port_range_high{59152};                          ///< PORT_RANGE high
    bool check_host_ports{true};                         ///< CHECK_HOST_PORTS

    // Shared state store
    bool state_store_enabled{false};                     ///< STATE_STORE_ENABLED
    std::string state_store_path{"/tmp/sandpool/state.json"};  ///< STATE_STORE_PATH
    std::string state_namespace{"sandpool"};             ///< STATE_NAMESPACE
    std::string state_port_key{"_runtime_sandbox_container_occupied_ports"};  ///< STATE_PORT_KEY
    std::string state_container_pool_key{"_runtime_sandbox_container_container_pool"};  ///< STATE_CONTAINER_POOL_KEY

    // Kubernetes
    std::string k8s_namespace{"default"};                ///< K8S_NAMESPACE
    std::string kubeconfig_path;                         ///< KUBECONFIG_PATH
    std::string k8s_node_host;                           ///< K8S_NODE_HOST

    // Images
    std::string image_registry;                          ///< IMAGE_REGISTRY
    std::string image_namespace{"agentscope"};           ///< IMAGE_NAMESPACE
    std::string image_tag{"latest"};                     ///< IMAGE_TAG

    // Timing
    std::chrono::seconds sandbox_timeout{3600};          ///< SANDBOX_TIMEOUT (0 = no expiry)
    std::chrono::seconds max_idle{1800};                 ///< MAX_IDLE (0 = never idle out)
    std::chrono::seconds sweep_interval{30};             ///< SWEEP_INTERVAL
    std::chrono::seconds fill_interval{10};              ///< FILL_INTERVAL
    int fill_retry_limit{3};                             ///< FILL_RETRY_LIMIT
    std::chrono::seconds fill_cooldown{60};              ///< FILL_COOLDOWN
    std::chrono::seconds shutdown_grace{30};             ///< SHUTDOWN_GRACE

    /**
     * @brief Load defaults overlaid with the process environment
     * @throws ConfigError on malformed values
     */
    static ManagerConfig LoadFromEnvironment();

    /**
     * @brief Load defaults, then a .env file, then the process environment
     * @param env_file `KEY=VALUE` file; `#` comments and quotes allowed
     * @throws ConfigError if the file cannot be read or a value is malformed
     */
    static ManagerConfig LoadFromFile(const std::filesystem::path& env_file);

    /**
     * @brief Parse a .env file into key/value pairs
     */
    static std::map<std::string, std::string> ParseEnvFile(const std::filesystem::path& env_file);

    /**
     * @brief Overlay key/value settings onto this configuration
     * @param values Keys named after environment variables
     * @throws ConfigError on malformed values
     */
    void Apply(const std::map<std::string, std::string>& values);

    /**
     * @brief Check cross-field consistency
     * @throws ConfigError describing the first problem found
     */
    void Validate() const;

    /// Warm pool target for a type (0 if the type is not pooled)
    int PoolSizeFor(const std::string& type) const;

    /// Whether released instances go back to the pool by default
    bool RecycleOnRelease() const { return recycle_on_release.value_or(auto_cleanup); }

    /// Workers actually used (forced to 1 without a shared store)
    int EffectiveWorkers() const { return state_store_enabled ? workers : 1; }
};

} // namespace core
} // namespace sandpool
