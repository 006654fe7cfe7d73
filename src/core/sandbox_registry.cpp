/**
 * @file sandbox_registry.cpp
 * @brief Implementation of the sandbox type registry
 *
 * @date 2025
 */

#include "sandpool/core/sandbox_registry.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/core/manager_config.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sandpool {
namespace core {

namespace {

struct BuiltinType {
    const char* type;
    const char* description;
};

const BuiltinType kBuiltinTypes[] = {
    {"base", "Base Sandbox"},
    {"filesystem", "Filesystem sandbox"},
    {"browser", "Browser sandbox"},
    {"gui", "GUI sandbox"},
};

} // anonymous namespace

std::string SecurityLevelToString(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::LOW: return "low";
        case SecurityLevel::HIGH: return "high";
        default: return "medium";
    }
}

std::optional<SecurityLevel> SecurityLevelFromString(const std::string& str) {
    if (str == "low") return SecurityLevel::LOW;
    if (str == "medium") return SecurityLevel::MEDIUM;
    if (str == "high") return SecurityLevel::HIGH;
    return std::nullopt;
}

// ============================================================================
// REGISTRATION
// ============================================================================

bool SandboxRegistry::Register(SandboxTypeConfig config) {
    if (config.type.empty() || config.image.empty()) {
        spdlog::error("Rejecting sandbox registration with empty type or image");
        return false;
    }
    if (config.container_port <= 0 || config.container_port > 65535) {
        spdlog::error("Rejecting sandbox type {}: invalid container port {}",
                      config.type, config.container_port);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = types_.find(config.type);
    if (it != types_.end()) {
        spdlog::warn("Sandbox type {} re-registered ({} -> {})",
                     config.type, it->second.image, config.image);
    } else {
        spdlog::info("Registered sandbox type {} ({})", config.type, config.image);
    }

    std::string type = config.type;
    types_[type] = std::move(config);
    return true;
}

std::optional<SandboxTypeConfig> SandboxRegistry::Find(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = types_.find(type);
    if (it == types_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SandboxRegistry::Contains(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return types_.count(type) > 0;
}

std::vector<SandboxTypeConfig> SandboxRegistry::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SandboxTypeConfig> result;
    result.reserve(types_.size());
    for (const auto& [type, config] : types_) {
        result.push_back(config);
    }
    return result;
}

void SandboxRegistry::RegisterBuiltins(const ManagerConfig& config) {
    for (const auto& builtin : kBuiltinTypes) {
        SandboxTypeConfig type_config;
        type_config.type = builtin.type;
        type_config.image = BuiltinImage(config, builtin.type);
        type_config.security_level = SecurityLevel::MEDIUM;
        type_config.default_timeout = config.sandbox_timeout;
        type_config.description = builtin.description;
        Register(std::move(type_config));
    }
}

std::string SandboxRegistry::BuiltinImage(const ManagerConfig& config, const std::string& type) {
    std::string image;
    if (!config.image_registry.empty()) {
        image = config.image_registry + "/";
    }
    if (!config.image_namespace.empty()) {
        image += config.image_namespace + "/";
    }
    image += "runtime-sandbox-" + type + ":" + config.image_tag;
    return image;
}

// ============================================================================
// SPEC CONSTRUCTION
// ============================================================================

backends::ContainerSpec SandboxRegistry::BuildSpec(const SandboxTypeConfig& type_config,
                                                   const InstanceParameters& params) {
    if (type_config.spec_builder) {
        return type_config.spec_builder(type_config, params);
    }
    return DefaultSpec(type_config, params);
}

backends::ContainerSpec SandboxRegistry::DefaultSpec(const SandboxTypeConfig& type_config,
                                                     const InstanceParameters& params) {
    backends::ContainerSpec spec;
    spec.name = params.name;
    spec.image = type_config.image;
    spec.host_port = params.host_port;
    spec.container_port = type_config.container_port;

    spec.environment = type_config.environment;
    spec.environment["SECRET_TOKEN"] = params.bearer_token;

    if (!params.mount_dir.empty()) {
        spec.mounts.push_back(utils::VolumeMount{params.mount_dir, params.workdir, false});
    }
    for (const auto& mount : params.readonly_mounts) {
        spec.mounts.push_back(mount);
    }

    spec.memory_limit = type_config.resource_limits.memory;
    spec.cpu_limit = type_config.resource_limits.cpus;

    spec.labels = params.labels;
    spec.labels["sandpool.type"] = type_config.type;
    spec.labels["sandpool.instance"] = params.id;

    return spec;
}

// ============================================================================
// JSON CONVERSION
// ============================================================================

json TypeConfigToJson(const SandboxTypeConfig& config) {
    json env_keys = json::array();
    for (const auto& [key, value] : config.environment) {
        env_keys.push_back(key);
    }

    return {
        {"type", config.type},
        {"image", config.image},
        {"security_level", SecurityLevelToString(config.security_level)},
        {"timeout", config.default_timeout.count()},
        {"environment", env_keys},
        {"description", config.description},
        {"resource_limits", {{"memory", config.resource_limits.memory},
                             {"cpu", config.resource_limits.cpus}}},
        {"container_port", config.container_port}
    };
}

SandboxTypeConfig TypeConfigFromJson(const json& j) {
    SandboxTypeConfig config;
    config.type = j.at("type").get<std::string>();
    config.image = j.at("image").get<std::string>();

    const std::string level = j.value("security_level", "medium");
    auto parsed = SecurityLevelFromString(level);
    if (!parsed) {
        throw SandboxError("Unknown security level: " + level);
    }
    config.security_level = *parsed;

    config.default_timeout = std::chrono::seconds(j.value("timeout", 3600LL));
    config.description = j.value("description", "");
    config.container_port = j.value("container_port", 80);

    if (j.contains("environment") && j["environment"].is_object()) {
        for (const auto& [key, value] : j["environment"].items()) {
            if (value.is_null()) {
                config.environment[key] = "";
            } else {
                config.environment[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
    }

    if (j.contains("resource_limits") && j["resource_limits"].is_object()) {
        const auto& limits = j["resource_limits"];
        config.resource_limits.memory = limits.value("memory", "");
        config.resource_limits.cpus = limits.value("cpu", "");
    }

    return config;
}

} // namespace core
} // namespace sandpool
