/**
 * @file file_state_store.cpp
 * @brief Implementation of the flock-guarded JSON state store
 *
 * **Error Handling**:
 * - Lock file cannot be opened or locked: StateStoreError
 * - Document unreadable or corrupt: StateStoreError; the file is never reset
 * - Temporary file write or rename failure: StateStoreError
 *
 * @date 2025
 */

#include "sandpool/state/file_state_store.hpp"
#include "sandpool/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

using json = nlohmann::json;

namespace sandpool {
namespace state {

namespace {

/**
 * @brief RAII exclusive flock on a lock file
 */
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& path) {
        fd_ = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw core::StateStoreError("Cannot open lock file " + path.string() + ": " +
                                        std::strerror(errno));
        }
        while (flock(fd_, LOCK_EX) != 0) {
            if (errno != EINTR) {
                int err = errno;
                close(fd_);
                throw core::StateStoreError("Cannot lock " + path.string() + ": " +
                                            std::strerror(err));
            }
        }
    }

    ~FileLock() {
        if (fd_ >= 0) {
            flock(fd_, LOCK_UN);
            close(fd_);
        }
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_{-1};
};

json EmptyDocument() {
    return json{{"values", json::object()}, {"sets", json::object()}};
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

FileStateStore::FileStateStore(std::filesystem::path path)
    : path_(std::move(path)) {
    lock_path_ = path_;
    lock_path_ += ".lock";

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw core::StateStoreError("Cannot create state directory " +
                                        path_.parent_path().string() + ": " + ec.message());
        }
    }

    spdlog::info("File state store at {}", path_.string());
}

// ============================================================================
// TRANSACTIONS
// ============================================================================

void FileStateStore::Transact(const std::function<bool(json&)>& fn) {
    FileLock lock(lock_path_);

    json doc = ReadDocument();
    if (fn(doc)) {
        WriteDocument(doc);
    }
}

json FileStateStore::ReadDocument() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return EmptyDocument();
    }

    std::ifstream file(path_);
    if (!file) {
        throw core::StateStoreError("Cannot read state file " + path_.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string content = buffer.str();
    if (content.empty()) {
        return EmptyDocument();
    }

    json doc = json::parse(content, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw core::StateStoreError("Corrupt state file " + path_.string());
    }
    if (!doc.contains("values") || !doc["values"].is_object()) {
        doc["values"] = json::object();
    }
    if (!doc.contains("sets") || !doc["sets"].is_object()) {
        doc["sets"] = json::object();
    }
    return doc;
}

void FileStateStore::WriteDocument(const json& doc) const {
    std::filesystem::path tmp_path = path_;
    tmp_path += ".tmp." + std::to_string(getpid());

    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file) {
            throw core::StateStoreError("Cannot write state file " + tmp_path.string());
        }
        file << doc.dump();
        file.flush();
        if (!file) {
            throw core::StateStoreError("Short write to state file " + tmp_path.string());
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        int err = errno;
        std::filesystem::remove(tmp_path);
        throw core::StateStoreError("Cannot commit state file " + path_.string() + ": " +
                                    std::strerror(err));
    }
}

// ============================================================================
// KEY/VALUE OPERATIONS
// ============================================================================

std::optional<std::string> FileStateStore::Get(const std::string& key) {
    std::optional<std::string> result;
    Transact([&](json& doc) {
        const auto& values = doc["values"];
        auto it = values.find(key);
        if (it != values.end() && it->is_string()) {
            result = it->get<std::string>();
        }
        return false;
    });
    return result;
}

void FileStateStore::Put(const std::string& key, const std::string& value) {
    Transact([&](json& doc) {
        doc["values"][key] = value;
        return true;
    });
}

bool FileStateStore::PutIfAbsent(const std::string& key, const std::string& value) {
    bool inserted = false;
    Transact([&](json& doc) {
        auto& values = doc["values"];
        if (values.contains(key)) {
            return false;
        }
        values[key] = value;
        inserted = true;
        return true;
    });
    return inserted;
}

bool FileStateStore::Erase(const std::string& key) {
    bool erased = false;
    Transact([&](json& doc) {
        erased = doc["values"].erase(key) > 0;
        return erased;
    });
    return erased;
}

bool FileStateStore::EraseIfEquals(const std::string& key, const std::string& expected) {
    bool erased = false;
    Transact([&](json& doc) {
        auto& values = doc["values"];
        auto it = values.find(key);
        if (it == values.end() || !it->is_string() || it->get<std::string>() != expected) {
            return false;
        }
        values.erase(it);
        erased = true;
        return true;
    });
    return erased;
}

bool FileStateStore::ReplaceIfEquals(const std::string& key, const std::string& expected,
                                     const std::string& value) {
    bool replaced = false;
    Transact([&](json& doc) {
        auto& values = doc["values"];
        auto it = values.find(key);
        if (it == values.end() || !it->is_string() || it->get<std::string>() != expected) {
            return false;
        }
        *it = value;
        replaced = true;
        return true;
    });
    return replaced;
}

std::vector<std::string> FileStateStore::Keys(const std::string& prefix) {
    std::vector<std::string> keys;
    Transact([&](json& doc) {
        for (const auto& [key, value] : doc["values"].items()) {
            if (key.compare(0, prefix.size(), prefix) == 0) {
                keys.push_back(key);
            }
        }
        return false;
    });
    return keys;
}

// ============================================================================
// SET OPERATIONS
// ============================================================================

bool FileStateStore::AddMember(const std::string& key, const std::string& member) {
    bool added = false;
    Transact([&](json& doc) {
        auto& members = doc["sets"][key];
        if (!members.is_array()) {
            members = json::array();
        }
        if (std::find(members.begin(), members.end(), member) != members.end()) {
            return false;
        }
        members.push_back(member);
        added = true;
        return true;
    });
    return added;
}

bool FileStateStore::RemoveMember(const std::string& key, const std::string& member) {
    bool removed = false;
    Transact([&](json& doc) {
        auto& sets = doc["sets"];
        auto it = sets.find(key);
        if (it == sets.end() || !it->is_array()) {
            return false;
        }
        auto pos = std::find(it->begin(), it->end(), member);
        if (pos == it->end()) {
            return false;
        }
        it->erase(pos);
        if (it->empty()) {
            sets.erase(it);
        }
        removed = true;
        return true;
    });
    return removed;
}

std::vector<std::string> FileStateStore::Members(const std::string& key) {
    std::vector<std::string> members;
    Transact([&](json& doc) {
        const auto& sets = doc["sets"];
        auto it = sets.find(key);
        if (it != sets.end() && it->is_array()) {
            for (const auto& member : *it) {
                if (member.is_string()) {
                    members.push_back(member.get<std::string>());
                }
            }
        }
        return false;
    });
    return members;
}

std::vector<std::string> FileStateStore::SetKeys(const std::string& prefix) {
    std::vector<std::string> keys;
    Transact([&](json& doc) {
        for (const auto& [key, members] : doc["sets"].items()) {
            if (key.compare(0, prefix.size(), prefix) == 0 && members.is_array() && !members.empty()) {
                keys.push_back(key);
            }
        }
        return false;
    });
    return keys;
}

} // namespace state
} // namespace sandpool
