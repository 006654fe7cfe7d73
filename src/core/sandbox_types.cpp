/**
 * @file sandbox_types.cpp
 * @brief JSON conversion for sandbox records
 *
 * Timestamps are stored as integer milliseconds since the Unix epoch so the
 * records stay readable by any worker regardless of clock resolution.
 *
 * @date 2025
 */

#include "sandpool/core/sandbox_types.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sandpool {
namespace core {

std::string StateToString(InstanceState state) {
    switch (state) {
        case InstanceState::WARM: return "warm";
        case InstanceState::ASSIGNED: return "assigned";
        case InstanceState::DESTROYED: return "destroyed";
        default: return "unknown";
    }
}

InstanceState StateFromString(const std::string& str) {
    if (str == "warm") return InstanceState::WARM;
    if (str == "assigned") return InstanceState::ASSIGNED;
    if (str == "destroyed") return InstanceState::DESTROYED;
    return InstanceState::UNKNOWN;
}

long long ToEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromEpochMillis(long long ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

// ============================================================================
// INSTANCE RECORDS
// ============================================================================

json InstanceToJson(const SandboxInstance& instance) {
    json j = {
        {"id", instance.id},
        {"type", instance.type},
        {"name", instance.name},
        {"backend_id", instance.handle.id},
        {"backend_host", instance.handle.host},
        {"port", instance.port},
        {"base_url", instance.base_url},
        {"state", StateToString(instance.state)},
        {"image", instance.image},
        {"created_at", ToEpochMillis(instance.created_at)},
        {"last_activity", ToEpochMillis(instance.last_activity)},
        {"mount_dir", instance.mount_dir},
        {"storage_path", instance.storage_path},
        {"owner", instance.owner},
        {"session", instance.session}
    };

    if (instance.expires_at) {
        j["expires_at"] = ToEpochMillis(*instance.expires_at);
    } else {
        j["expires_at"] = nullptr;
    }

    return j;
}

SandboxInstance InstanceFromJson(const json& j) {
    SandboxInstance instance;
    instance.id = j.at("id").get<std::string>();
    instance.type = j.value("type", "");
    instance.name = j.value("name", "");
    instance.handle.id = j.value("backend_id", "");
    instance.handle.host = j.value("backend_host", "");
    instance.port = j.value("port", 0);
    instance.base_url = j.value("base_url", "");
    instance.state = StateFromString(j.value("state", ""));
    instance.image = j.value("image", "");
    instance.created_at = FromEpochMillis(j.value("created_at", 0LL));
    instance.last_activity = FromEpochMillis(j.value("last_activity", 0LL));
    instance.mount_dir = j.value("mount_dir", "");
    instance.storage_path = j.value("storage_path", "");
    instance.owner = j.value("owner", "");
    instance.session = j.value("session", "");

    if (j.contains("expires_at") && j["expires_at"].is_number()) {
        instance.expires_at = FromEpochMillis(j["expires_at"].get<long long>());
    }

    return instance;
}

// ============================================================================
// CLIENT-FACING VIEWS
// ============================================================================

json HandleToJson(const SandboxHandle& handle) {
    json j = {
        {"id", handle.id},
        {"base_url", handle.base_url},
        {"bearer_token", handle.bearer_token}
    };
    j["expires_at"] = handle.expires_at ? json(ToEpochMillis(*handle.expires_at)) : json(nullptr);
    return j;
}

json StatusToJson(const SandboxStatus& status) {
    auto optional_time = [](const std::optional<TimePoint>& tp) {
        return tp ? json(ToEpochMillis(*tp)) : json(nullptr);
    };

    return {
        {"id", status.id},
        {"type", status.type},
        {"state", StateToString(status.state)},
        {"base_url", status.base_url},
        {"owner", status.owner},
        {"session", status.session},
        {"local", status.local},
        {"created_at", optional_time(status.created_at)},
        {"last_activity", optional_time(status.last_activity)},
        {"expires_at", optional_time(status.expires_at)},
        {"age_seconds", status.age.count()},
        {"idle_seconds", status.idle.count()}
    };
}

SandboxStatus MakeStatus(const SandboxInstance& instance, bool local, TimePoint now) {
    SandboxStatus status;
    status.id = instance.id;
    status.type = instance.type;
    status.state = instance.state;
    status.base_url = instance.base_url;
    status.owner = instance.owner;
    status.session = instance.session;
    status.local = local;
    status.created_at = instance.created_at;
    status.last_activity = instance.last_activity;
    status.expires_at = instance.expires_at;
    status.age = std::chrono::duration_cast<std::chrono::seconds>(now - instance.created_at);
    status.idle = std::chrono::duration_cast<std::chrono::seconds>(now - instance.last_activity);
    return status;
}

} // namespace core
} // namespace sandpool
