/**
 * @file manager_config.cpp
 * @brief Configuration loading and validation
 *
 * @date 2025
 */

#include "sandpool/core/manager_config.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace sandpool {
namespace core {

using utils::StringUtils;

namespace {

/// Every key Apply() understands
const std::vector<std::string> kKnownKeys = {
    "HOST", "PORT", "CONTROL_SOCKET", "WORKERS", "DEBUG", "LOG_LEVEL", "LOG_FILE",
    "BEARER_TOKEN", "DEFAULT_SANDBOX_TYPE", "POOL_SIZE", "POOL_SIZES", "AUTO_CLEANUP",
    "RECYCLE_ON_RELEASE", "CONTAINER_PREFIX_KEY", "CONTAINER_DEPLOYMENT", "SANDBOX_HOST",
    "DEFAULT_MOUNT_DIR", "WORKDIR", "READONLY_MOUNTS", "STORAGE_FOLDER", "FILE_SYSTEM",
    "OSS_ENDPOINT", "OSS_ACCESS_KEY_ID", "OSS_ACCESS_KEY_SECRET", "OSS_BUCKET_NAME",
    "PORT_RANGE", "CHECK_HOST_PORTS", "STATE_STORE_ENABLED", "STATE_STORE_PATH",
    "STATE_NAMESPACE", "STATE_PORT_KEY", "STATE_CONTAINER_POOL_KEY", "K8S_NAMESPACE",
    "KUBECONFIG_PATH", "K8S_NODE_HOST", "IMAGE_REGISTRY", "IMAGE_NAMESPACE", "IMAGE_TAG",
    "SANDBOX_TIMEOUT", "MAX_IDLE", "SWEEP_INTERVAL", "FILL_INTERVAL", "FILL_RETRY_LIMIT",
    "FILL_COOLDOWN", "SHUTDOWN_GRACE"
};

const std::vector<std::string> kLogLevels = {
    "trace", "debug", "info", "warn", "warning", "error", "critical", "off"
};

[[noreturn]] void ThrowInvalid(const std::string& key, const std::string& value,
                               const std::string& expected) {
    throw ConfigError("Invalid value for " + key + ": '" + value + "' (expected " +
                      expected + ")");
}

bool ToBool(const std::string& key, const std::string& value) {
    auto parsed = StringUtils::ParseBool(value);
    if (!parsed) {
        ThrowInvalid(key, value, "a boolean");
    }
    return *parsed;
}

int ToInt(const std::string& key, const std::string& value) {
    auto parsed = StringUtils::ParseInt(value);
    if (!parsed || *parsed < 0 || *parsed > 1000000000LL) {
        ThrowInvalid(key, value, "a non-negative integer");
    }
    return static_cast<int>(*parsed);
}

std::chrono::seconds ToSeconds(const std::string& key, const std::string& value) {
    return std::chrono::seconds(ToInt(key, value));
}

} // anonymous namespace

// ============================================================================
// LOADING
// ============================================================================

ManagerConfig ManagerConfig::LoadFromEnvironment() {
    ManagerConfig config;

    std::map<std::string, std::string> values;
    for (const auto& key : kKnownKeys) {
        if (const char* value = std::getenv(key.c_str())) {
            values[key] = value;
        }
    }
    config.Apply(values);

    return config;
}

ManagerConfig ManagerConfig::LoadFromFile(const std::filesystem::path& env_file) {
    ManagerConfig config;
    config.Apply(ParseEnvFile(env_file));

    // Process environment wins over the file
    std::map<std::string, std::string> values;
    for (const auto& key : kKnownKeys) {
        if (const char* value = std::getenv(key.c_str())) {
            values[key] = value;
        }
    }
    config.Apply(values);

    spdlog::debug("Loaded configuration from {}", env_file.string());
    return config;
}

std::map<std::string, std::string> ManagerConfig::ParseEnvFile(const std::filesystem::path& env_file) {
    std::ifstream file(env_file);
    if (!file) {
        throw ConfigError("Cannot read configuration file " + env_file.string());
    }

    std::map<std::string, std::string> values;
    std::string line;
    int line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = StringUtils::Trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (StringUtils::StartsWith(line, "export ")) {
            line = StringUtils::Trim(line.substr(7));
        }

        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            spdlog::warn("{}:{}: ignoring malformed line", env_file.string(), line_number);
            continue;
        }

        std::string key = StringUtils::Trim(line.substr(0, eq));
        std::string value = StringUtils::Trim(line.substr(eq + 1));

        // Strip trailing comment from unquoted values
        if (!value.empty() && value.front() != '"' && value.front() != '\'') {
            auto hash = value.find(" #");
            if (hash != std::string::npos) {
                value = StringUtils::Trim(value.substr(0, hash));
            }
        }

        values[key] = StringUtils::Unquote(value);
    }

    return values;
}

// ============================================================================
// KEY APPLICATION
// ============================================================================

void ManagerConfig::Apply(const std::map<std::string, std::string>& values) {
    for (const auto& [key, raw] : values) {
        const std::string value = StringUtils::Trim(raw);

        if (key == "HOST") host = value;
        else if (key == "PORT") port = ToInt(key, value);
        else if (key == "CONTROL_SOCKET") control_socket = value;
        else if (key == "WORKERS") workers = ToInt(key, value);
        else if (key == "DEBUG") debug = ToBool(key, value);
        else if (key == "LOG_LEVEL") log_level = StringUtils::ToLower(value);
        else if (key == "LOG_FILE") log_file = value;
        else if (key == "BEARER_TOKEN") bearer_token = value;
        else if (key == "DEFAULT_SANDBOX_TYPE") default_sandbox_types = StringUtils::Split(value, ',');
        else if (key == "POOL_SIZE") pool_size = ToInt(key, value);
        else if (key == "POOL_SIZES") {
            pool_sizes.clear();
            for (const auto& [type, size] : StringUtils::ParseKeyValueList(value, ':')) {
                pool_sizes[type] = ToInt(key, size);
            }
        }
        else if (key == "AUTO_CLEANUP") auto_cleanup = ToBool(key, value);
        else if (key == "RECYCLE_ON_RELEASE") {
            if (value.empty()) {
                recycle_on_release.reset();
            } else {
                recycle_on_release = ToBool(key, value);
            }
        }
        else if (key == "CONTAINER_PREFIX_KEY") container_prefix_key = value;
        else if (key == "CONTAINER_DEPLOYMENT") container_deployment = StringUtils::ToLower(value);
        else if (key == "SANDBOX_HOST") sandbox_host = value;
        else if (key == "DEFAULT_MOUNT_DIR") default_mount_dir = value;
        else if (key == "WORKDIR") workdir = value;
        else if (key == "READONLY_MOUNTS") {
            readonly_mounts.clear();
            for (const auto& [host_path, container_path] : StringUtils::ParseKeyValueList(value, ':')) {
                readonly_mounts.push_back(utils::VolumeMount{host_path, container_path, true});
            }
        }
        else if (key == "STORAGE_FOLDER") storage_folder = value;
        else if (key == "FILE_SYSTEM") file_system = StringUtils::ToLower(value);
        else if (key == "OSS_ENDPOINT") oss_endpoint = value;
        else if (key == "OSS_ACCESS_KEY_ID") oss_access_key_id = value;
        else if (key == "OSS_ACCESS_KEY_SECRET") oss_access_key_secret = value;
        else if (key == "OSS_BUCKET_NAME") oss_bucket_name = value;
        else if (key == "PORT_RANGE") {
            auto parts = StringUtils::Split(value, ',');
            if (parts.size() != 2) {
                ThrowInvalid(key, value, "'low,high'");
            }
            port_range_low = ToInt(key, parts[0]);
            port_range_high = ToInt(key, parts[1]);
        }
        else if (key == "CHECK_HOST_PORTS") check_host_ports = ToBool(key, value);
        else if (key == "STATE_STORE_ENABLED") state_store_enabled = ToBool(key, value);
        else if (key == "STATE_STORE_PATH") state_store_path = value;
        else if (key == "STATE_NAMESPACE") state_namespace = value;
        else if (key == "STATE_PORT_KEY") state_port_key = value;
        else if (key == "STATE_CONTAINER_POOL_KEY") state_container_pool_key = value;
        else if (key == "K8S_NAMESPACE") k8s_namespace = value;
        else if (key == "KUBECONFIG_PATH") kubeconfig_path = value;
        else if (key == "K8S_NODE_HOST") k8s_node_host = value;
        else if (key == "IMAGE_REGISTRY") image_registry = value;
        else if (key == "IMAGE_NAMESPACE") image_namespace = value;
        else if (key == "IMAGE_TAG") image_tag = value;
        else if (key == "SANDBOX_TIMEOUT") sandbox_timeout = ToSeconds(key, value);
        else if (key == "MAX_IDLE") max_idle = ToSeconds(key, value);
        else if (key == "SWEEP_INTERVAL") sweep_interval = ToSeconds(key, value);
        else if (key == "FILL_INTERVAL") fill_interval = ToSeconds(key, value);
        else if (key == "FILL_RETRY_LIMIT") fill_retry_limit = ToInt(key, value);
        else if (key == "FILL_COOLDOWN") fill_cooldown = ToSeconds(key, value);
        else if (key == "SHUTDOWN_GRACE") shutdown_grace = ToSeconds(key, value);
        else spdlog::debug("Ignoring unknown configuration key {}", key);
    }
}

// ============================================================================
// VALIDATION
// ============================================================================

void ManagerConfig::Validate() const {
    if (port_range_low < 1 || port_range_high > 65535 || port_range_low > port_range_high) {
        throw ConfigError("PORT_RANGE must satisfy 1 <= low <= high <= 65535 (got " +
                          std::to_string(port_range_low) + "," +
                          std::to_string(port_range_high) + ")");
    }

    if (workers < 1) {
        throw ConfigError("WORKERS must be at least 1");
    }

    if (container_deployment != "docker" && container_deployment != "k8s") {
        throw ConfigError("CONTAINER_DEPLOYMENT must be 'docker' or 'k8s' (got '" +
                          container_deployment + "')");
    }

    if (file_system != "local" && file_system != "oss") {
        throw ConfigError("FILE_SYSTEM must be 'local' or 'oss' (got '" + file_system + "')");
    }

    if (file_system == "oss" &&
        (oss_endpoint.empty() || oss_access_key_id.empty() ||
         oss_access_key_secret.empty() || oss_bucket_name.empty())) {
        throw ConfigError("FILE_SYSTEM=oss requires OSS_ENDPOINT, OSS_ACCESS_KEY_ID, "
                          "OSS_ACCESS_KEY_SECRET and OSS_BUCKET_NAME");
    }

    if (container_prefix_key.size() > kMaxContainerPrefixLength) {
        throw ConfigError("CONTAINER_PREFIX_KEY longer than " +
                          std::to_string(kMaxContainerPrefixLength) + " characters");
    }

    if (container_deployment == "k8s") {
        if (port_range_low < kNodePortLow || port_range_high > kNodePortHigh) {
            throw ConfigError("PORT_RANGE must lie within the NodePort range " +
                              std::to_string(kNodePortLow) + "-" + std::to_string(kNodePortHigh) +
                              " for CONTAINER_DEPLOYMENT=k8s");
        }
        if (container_prefix_key.size() > kMaxPodPrefixLength) {
            throw ConfigError("CONTAINER_PREFIX_KEY longer than " +
                              std::to_string(kMaxPodPrefixLength) + " characters for k8s");
        }
    }

    if (std::find(kLogLevels.begin(), kLogLevels.end(), log_level) == kLogLevels.end()) {
        throw ConfigError("Unknown LOG_LEVEL '" + log_level + "'");
    }

    if (fill_retry_limit < 1) {
        throw ConfigError("FILL_RETRY_LIMIT must be at least 1");
    }

    if (state_store_enabled && state_store_path.empty()) {
        throw ConfigError("STATE_STORE_ENABLED requires STATE_STORE_PATH");
    }

    if (workers > 1 && !state_store_enabled) {
        spdlog::warn("WORKERS={} without a shared state store; running a single worker", workers);
    }
}

int ManagerConfig::PoolSizeFor(const std::string& type) const {
    if (std::find(default_sandbox_types.begin(), default_sandbox_types.end(), type) ==
        default_sandbox_types.end()) {
        return 0;
    }
    auto it = pool_sizes.find(type);
    return it != pool_sizes.end() ? it->second : pool_size;
}

} // namespace core
} // namespace sandpool
