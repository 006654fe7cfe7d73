/**
 * @file memory_state_store.hpp
 * @brief In-process state store for single-worker deployments
 *
 * @date 2025
 */

#pragma once

#include "sandpool/state/state_store.hpp"

#include <map>
#include <mutex>
#include <set>

namespace sandpool {
namespace state {

/**
 * @class MemoryStateStore
 * @brief Mutex-guarded maps; atomic within one process only
 */
class MemoryStateStore : public StateStore {
public:
    MemoryStateStore() = default;

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
    std::string Name() const override { return "memory"; }

private:
    std::mutex mutex_;
    std::map<std::string, std::string> values_;            ///< Plain keys
    std::map<std::string, std::set<std::string>> sets_;    ///< Set keys
};

} // namespace state
} // namespace sandpool
