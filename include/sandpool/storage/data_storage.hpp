/**
 * @file data_storage.hpp
 * @brief Persistent storage for sandbox workspaces
 *
 * A sandbox's workspace is a host directory bind-mounted into the instance.
 * Before the instance starts its previous contents are downloaded from the
 * storage location; when the instance is destroyed or recycled the directory
 * is uploaded back.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace sandpool {

namespace core {
struct ManagerConfig;
}

namespace storage {

/**
 * @class DataStorage
 * @brief Abstract folder-level storage
 *
 * Failures are logged and reported through the return value; a missing
 * remote folder is not an error for Download.
 */
class DataStorage {
public:
    virtual ~DataStorage() = default;

    /**
     * @brief Copy a stored folder into a local directory
     * @param remote Storage location
     * @param local Destination directory (created if needed)
     * @return true on success or if @p remote does not exist
     */
    virtual bool Download(const std::string& remote, const std::filesystem::path& local) = 0;

    /**
     * @brief Copy a local directory to a storage location
     * @return true on success
     */
    virtual bool Upload(const std::filesystem::path& local, const std::string& remote) = 0;

    /// Join storage path components
    virtual std::string PathJoin(const std::string& base, const std::string& name) const = 0;

    virtual std::string Name() const = 0;
};

/**
 * @class LocalStorage
 * @brief Storage locations are directories on the local filesystem
 */
class LocalStorage : public DataStorage {
public:
    bool Download(const std::string& remote, const std::filesystem::path& local) override;
    bool Upload(const std::filesystem::path& local, const std::string& remote) override;
    std::string PathJoin(const std::string& base, const std::string& name) const override;
    std::string Name() const override { return "local"; }
};

/**
 * @class OssStorage
 * @brief Alibaba Cloud OSS bucket, accessed through the `ossutil` CLI
 */
class OssStorage : public DataStorage {
public:
    OssStorage(std::string endpoint, std::string access_key_id,
               std::string access_key_secret, std::string bucket,
               std::string binary = "ossutil");

    bool Download(const std::string& remote, const std::filesystem::path& local) override;
    bool Upload(const std::filesystem::path& local, const std::string& remote) override;
    std::string PathJoin(const std::string& base, const std::string& name) const override;
    std::string Name() const override { return "oss"; }

    /// `oss://<bucket>/<key>/`
    std::string ObjectUrl(const std::string& key) const;

private:
    bool Copy(const std::string& from, const std::string& to);

    std::string endpoint_;
    std::string access_key_id_;
    std::string access_key_secret_;
    std::string bucket_;
    std::string binary_;
};

/**
 * @brief Construct the storage selected by FILE_SYSTEM
 */
std::shared_ptr<DataStorage> CreateDataStorage(const core::ManagerConfig& config);

} // namespace storage
} // namespace sandpool
