/**
 * @file data_storage.cpp
 * @brief Local and OSS workspace storage
 *
 * @date 2025
 */

#include "sandpool/storage/data_storage.hpp"
#include "sandpool/core/manager_config.hpp"
#include "sandpool/utils/command_utils.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace sandpool {
namespace storage {

namespace {

constexpr auto kCopyOptions = fs::copy_options::recursive | fs::copy_options::overwrite_existing;

} // anonymous namespace

// ============================================================================
// LOCAL STORAGE
// ============================================================================

bool LocalStorage::Download(const std::string& remote, const fs::path& local) {
    std::error_code ec;
    if (!fs::exists(remote, ec)) {
        return true;
    }

    fs::create_directories(local, ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", local.string(), ec.message());
        return false;
    }

    fs::copy(remote, local, kCopyOptions, ec);
    if (ec) {
        spdlog::error("Failed to restore workspace {} -> {}: {}", remote, local.string(), ec.message());
        return false;
    }

    spdlog::debug("Restored workspace {} -> {}", remote, local.string());
    return true;
}

bool LocalStorage::Upload(const fs::path& local, const std::string& remote) {
    std::error_code ec;
    if (!fs::exists(local, ec)) {
        return true;
    }

    fs::create_directories(remote, ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", remote, ec.message());
        return false;
    }

    fs::copy(local, remote, kCopyOptions, ec);
    if (ec) {
        spdlog::error("Failed to save workspace {} -> {}: {}", local.string(), remote, ec.message());
        return false;
    }

    spdlog::debug("Saved workspace {} -> {}", local.string(), remote);
    return true;
}

std::string LocalStorage::PathJoin(const std::string& base, const std::string& name) const {
    return (fs::path(base) / name).string();
}

// ============================================================================
// OSS STORAGE
// ============================================================================

OssStorage::OssStorage(std::string endpoint, std::string access_key_id,
                       std::string access_key_secret, std::string bucket,
                       std::string binary)
    : endpoint_(std::move(endpoint)),
      access_key_id_(std::move(access_key_id)),
      access_key_secret_(std::move(access_key_secret)),
      bucket_(std::move(bucket)),
      binary_(std::move(binary)) {
    if (!utils::IsProgramAvailable(binary_)) {
        spdlog::warn("{} not found on PATH; workspace sync to OSS will fail", binary_);
    }
}

std::string OssStorage::ObjectUrl(const std::string& key) const {
    std::string trimmed = key;
    while (!trimmed.empty() && trimmed.front() == '/') trimmed.erase(0, 1);
    if (!trimmed.empty() && trimmed.back() != '/') trimmed.push_back('/');
    return "oss://" + bucket_ + "/" + trimmed;
}

bool OssStorage::Download(const std::string& remote, const fs::path& local) {
    std::error_code ec;
    fs::create_directories(local, ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", local.string(), ec.message());
        return false;
    }
    return Copy(ObjectUrl(remote), local.string() + "/");
}

bool OssStorage::Upload(const fs::path& local, const std::string& remote) {
    std::error_code ec;
    if (!fs::exists(local, ec)) {
        return true;
    }
    return Copy(local.string() + "/", ObjectUrl(remote));
}

std::string OssStorage::PathJoin(const std::string& base, const std::string& name) const {
    if (base.empty()) {
        return name;
    }
    return utils::StringUtils::EndsWith(base, "/") ? base + name : base + "/" + name;
}

bool OssStorage::Copy(const std::string& from, const std::string& to) {
    auto result = utils::RunCommand({
        binary_, "cp", "-r", "-f", from, to,
        "-e", endpoint_,
        "-i", access_key_id_,
        "-k", access_key_secret_
    }, std::nullopt, std::chrono::minutes(10));

    if (!result.Success()) {
        spdlog::error("ossutil cp {} -> {} failed: {}", from, to,
                      result.timed_out ? std::string("timed out")
                                       : utils::StringUtils::Trim(result.stderr_output));
        return false;
    }
    return true;
}

// ============================================================================
// FACTORY
// ============================================================================

std::shared_ptr<DataStorage> CreateDataStorage(const core::ManagerConfig& config) {
    if (config.file_system == "oss") {
        return std::make_shared<OssStorage>(config.oss_endpoint, config.oss_access_key_id,
                                            config.oss_access_key_secret, config.oss_bucket_name);
    }
    return std::make_shared<LocalStorage>();
}

} // namespace storage
} // namespace sandpool
