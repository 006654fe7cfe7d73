/**
 * @file memory_state_store.cpp
 * @brief Implementation of the in-process state store
 *
 * @date 2025
 */

#include "sandpool/state/memory_state_store.hpp"

namespace sandpool {
namespace state {

std::optional<std::string> MemoryStateStore::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStateStore::Put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

bool MemoryStateStore::PutIfAbsent(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.emplace(key, value).second;
}

bool MemoryStateStore::Erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.erase(key) > 0;
}

bool MemoryStateStore::EraseIfEquals(const std::string& key, const std::string& expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end() || it->second != expected) {
        return false;
    }
    values_.erase(it);
    return true;
}

bool MemoryStateStore::ReplaceIfEquals(const std::string& key, const std::string& expected,
                                       const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end() || it->second != expected) {
        return false;
    }
    it->second = value;
    return true;
}

std::vector<std::string> MemoryStateStore::Keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = values_.lower_bound(prefix);
         it != values_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        keys.push_back(it->first);
    }
    return keys;
}

bool MemoryStateStore::AddMember(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sets_[key].insert(member).second;
}

bool MemoryStateStore::RemoveMember(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sets_.find(key);
    if (it == sets_.end()) {
        return false;
    }
    bool removed = it->second.erase(member) > 0;
    if (it->second.empty()) {
        sets_.erase(it);
    }
    return removed;
}

std::vector<std::string> MemoryStateStore::Members(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sets_.find(key);
    if (it == sets_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

std::vector<std::string> MemoryStateStore::SetKeys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = sets_.lower_bound(prefix);
         it != sets_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        keys.push_back(it->first);
    }
    return keys;
}

} // namespace state
} // namespace sandpool
