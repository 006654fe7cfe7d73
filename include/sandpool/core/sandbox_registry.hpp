/**
 * @file sandbox_registry.hpp
 * @brief Mapping from sandbox type identifiers to their configuration
 *
 * @date 2025
 */

#pragma once

#include "sandpool/backends/backend_driver.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

struct ManagerConfig;

/**
 * @enum SecurityLevel
 * @brief Isolation tier a type declares
 */
enum class SecurityLevel {
    LOW,
    MEDIUM,
    HIGH
};

std::string SecurityLevelToString(SecurityLevel level);
std::optional<SecurityLevel> SecurityLevelFromString(const std::string& str);

/**
 * @struct ResourceLimits
 * @brief Per-instance resource caps (docker notation)
 */
struct ResourceLimits {
    std::string memory;  ///< e.g. "2g" (empty = unlimited)
    std::string cpus;    ///< e.g. "1.0" (empty = unlimited)
};

/**
 * @struct InstanceParameters
 * @brief Per-instance values the pool decides before provisioning
 */
struct InstanceParameters {
    std::string id;                                ///< Instance id
    std::string name;                              ///< Container / pod name
    int host_port{0};                              ///< Reserved port
    std::string bearer_token;                      ///< Injected as SECRET_TOKEN
    std::string mount_dir;                         ///< Workspace on the host (empty = none)
    std::string workdir{"/workspace"};             ///< Workspace mount point
    std::vector<utils::VolumeMount> readonly_mounts;
    std::map<std::string, std::string> labels;
};

struct SandboxTypeConfig;

/**
 * @brief Turns a type plus instance parameters into a driver spec
 */
using SpecBuilder = std::function<backends::ContainerSpec(const SandboxTypeConfig&,
                                                          const InstanceParameters&)>;

/**
 * @struct SandboxTypeConfig
 * @brief Registration record for one sandbox type
 */
struct SandboxTypeConfig {
    std::string type;                                   ///< Type identifier
    std::string image;                                  ///< Image reference
    SecurityLevel security_level{SecurityLevel::MEDIUM};
    std::chrono::seconds default_timeout{3600};         ///< Lifetime once assigned (0 = none)
    std::map<std::string, std::string> environment;     ///< Declared environment
    std::string description;
    ResourceLimits resource_limits;
    int container_port{80};                             ///< Service port inside the sandbox
    SpecBuilder spec_builder;                           ///< Optional custom builder
};

/**
 * @class SandboxRegistry
 * @brief Thread-safe type registry
 *
 * Populated at startup with the built-in types and extended at runtime.
 * Re-registering a type replaces the previous entry.
 *
 * **Usage Example**:
 * @code
 * SandboxRegistry registry;
 * registry.RegisterBuiltins(config);
 *
 * SandboxTypeConfig custom;
 * custom.type = "jupyter";
 * custom.image = "example/jupyter-sandbox:1.2";
 * custom.environment["API_KEY"] = key;
 * registry.Register(custom);
 *
 * auto spec = registry.BuildSpec(*registry.Find("jupyter"), params);
 * @endcode
 */
class SandboxRegistry {
public:
    SandboxRegistry() = default;

    /**
     * @brief Add or replace a type
     * @param config Registration record
     * @return false if the record is invalid (empty type or image, bad port)
     */
    bool Register(SandboxTypeConfig config);

    /**
     * @brief Look up a type
     * @return Copy of the registration, or nullopt
     */
    std::optional<SandboxTypeConfig> Find(const std::string& type) const;

    bool Contains(const std::string& type) const;

    /// All registrations, ordered by type
    std::vector<SandboxTypeConfig> List() const;

    /**
     * @brief Register base, filesystem, browser and gui
     * @param config Supplies image registry, namespace, tag and default timeout
     */
    void RegisterBuiltins(const ManagerConfig& config);

    /**
     * @brief Image reference for a built-in type
     * @return `[registry/]namespace/runtime-sandbox-<type>:tag`
     */
    static std::string BuiltinImage(const ManagerConfig& config, const std::string& type);

    /**
     * @brief Produce the driver spec for an instance of @p type_config
     *
     * Uses the type's spec_builder if present, DefaultSpec otherwise.
     */
    static backends::ContainerSpec BuildSpec(const SandboxTypeConfig& type_config,
                                             const InstanceParameters& params);

    /**
     * @brief Standard mapping: image, env + SECRET_TOKEN, port, workspace, limits, labels
     */
    static backends::ContainerSpec DefaultSpec(const SandboxTypeConfig& type_config,
                                               const InstanceParameters& params);

private:
    mutable std::mutex mutex_;
    std::map<std::string, SandboxTypeConfig> types_;
};

/// JSON view of a registration (spec_builder omitted)
nlohmann::json TypeConfigToJson(const SandboxTypeConfig& config);

/**
 * @brief Parse a registration sent over the control protocol
 * @throws nlohmann::json::exception or SandboxError on malformed input
 */
SandboxTypeConfig TypeConfigFromJson(const nlohmann::json& j);

} // namespace core
} // namespace sandpool
