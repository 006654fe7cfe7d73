/**
 * @file file_state_store.hpp
 * @brief Cross-process state store backed by a JSON file under flock(2)
 *
 * Every operation is one transaction:
 * 1. open and exclusively flock `<path>.lock`
 * 2. read and parse `<path>` (missing file = empty document)
 * 3. apply the operation
 * 4. if modified, write `<path>.tmp.<pid>` and rename it over `<path>`
 * 5. unlock
 *
 * The lock file is reopened per transaction so that forked workers never
 * share an open file description (flock locks belong to the description).
 *
 * @date 2025
 */

#pragma once

#include "sandpool/state/state_store.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <functional>

namespace sandpool {
namespace state {

/**
 * @class FileStateStore
 * @brief JSON document store shared by all workers on one host
 *
 * **Document Shape**:
 * ```json
 * { "values": { "<key>": "<value>" }, "sets": { "<key>": ["<member>"] } }
 * ```
 */
class FileStateStore : public StateStore {
public:
    /**
     * @brief Open (or lazily create) a store
     * @param path Document path; parent directories are created
     * @throws core::StateStoreError if the directory cannot be created
     */
    explicit FileStateStore(std::filesystem::path path);

    std::optional<std::string> Get(const std::string& key) override;
    void Put(const std::string& key, const std::string& value) override;
    bool PutIfAbsent(const std::string& key, const std::string& value) override;
    bool Erase(const std::string& key) override;
    bool EraseIfEquals(const std::string& key, const std::string& expected) override;
    bool ReplaceIfEquals(const std::string& key, const std::string& expected,
                         const std::string& value) override;
    std::vector<std::string> Keys(const std::string& prefix) override;
    bool AddMember(const std::string& key, const std::string& member) override;
    bool RemoveMember(const std::string& key, const std::string& member) override;
    std::vector<std::string> Members(const std::string& key) override;
    std::vector<std::string> SetKeys(const std::string& prefix) override;
    std::string Name() const override { return "file"; }

    const std::filesystem::path& GetPath() const { return path_; }

private:
    /**
     * @brief Run @p fn on the locked document
     * @param fn Mutator; returns true if it changed the document
     */
    void Transact(const std::function<bool(nlohmann::json&)>& fn);

    nlohmann::json ReadDocument() const;
    void WriteDocument(const nlohmann::json& doc) const;

    std::filesystem::path path_;       ///< Document path
    std::filesystem::path lock_path_;  ///< Sibling lock file
};

} // namespace state
} // namespace sandpool
