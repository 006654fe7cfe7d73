/**
 * @file state_store.hpp
 * @brief Shared key/value state visible to every worker process
 *
 * The store records occupied ports, pool membership and live instance
 * records. Port reservation relies on PutIfAbsent / EraseIfEquals being
 * atomic across all processes sharing one store; everything else is
 * best-effort bookkeeping.
 *
 * **Key Layout** (namespaced by KeySpace::ns):
 * ```
 * <ns>:<port_key>:<port>         -> holder id        (port reservations)
 * <ns>:<pool_key>:<type>         -> {instance ids}   (set, pool members)
 * <ns>:container:<id>            -> JSON record      (instance records)
 * <ns>:session:<session>         -> {instance ids}   (set, session mapping)
 * ```
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sandpool {
namespace state {

/**
 * @class StateStore
 * @brief Abstract key/value store with atomic conditional writes
 *
 * Implementations throw core::StateStoreError when the backing medium
 * cannot be read or written.
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    /**
     * @brief Read a value
     * @param key Key
     * @return Value, or nullopt if absent
     */
    virtual std::optional<std::string> Get(const std::string& key) = 0;

    /**
     * @brief Unconditionally write a value
     */
    virtual void Put(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Write only if the key is absent (atomic)
     * @return true if this call created the key
     */
    virtual bool PutIfAbsent(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Delete a key
     * @return true if the key existed
     */
    virtual bool Erase(const std::string& key) = 0;

    /**
     * @brief Delete a key only if it currently holds @p expected (atomic)
     * @return true if the key was deleted
     */
    virtual bool EraseIfEquals(const std::string& key, const std::string& expected) = 0;

    /**
     * @brief Overwrite a key only if it currently holds @p expected (atomic)
     * @return true if the value was replaced; false if it changed or is gone
     */
    virtual bool ReplaceIfEquals(const std::string& key, const std::string& expected,
                                 const std::string& value) = 0;

    /**
     * @brief List keys starting with a prefix
     */
    virtual std::vector<std::string> Keys(const std::string& prefix) = 0;

    /// Add @p member to the set at @p key; true if newly added
    virtual bool AddMember(const std::string& key, const std::string& member) = 0;

    /// Remove @p member from the set at @p key; true if it was present
    virtual bool RemoveMember(const std::string& key, const std::string& member) = 0;

    /// Members of the set at @p key (empty if absent)
    virtual std::vector<std::string> Members(const std::string& key) = 0;

    /// Keys of non-empty sets starting with a prefix
    virtual std::vector<std::string> SetKeys(const std::string& prefix) = 0;

    /// Short backend name for logs ("memory", "file")
    virtual std::string Name() const = 0;
};

/**
 * @struct KeySpace
 * @brief Builds namespaced store keys
 */
struct KeySpace {
    std::string ns{"sandpool"};                                          ///< Namespace prefix
    std::string port_key{"_runtime_sandbox_container_occupied_ports"};   ///< Port reservations
    std::string pool_key{"_runtime_sandbox_container_container_pool"};   ///< Pool members

    std::string Port(int port) const { return PortPrefix() + std::to_string(port); }
    std::string PortPrefix() const { return ns + ":" + port_key + ":"; }
    std::string Pool(const std::string& type) const { return ns + ":" + pool_key + ":" + type; }
    std::string Container(const std::string& id) const { return ContainerPrefix() + id; }
    std::string ContainerPrefix() const { return ns + ":container:"; }
    std::string Session(const std::string& session) const { return SessionPrefix() + session; }
    std::string SessionPrefix() const { return ns + ":session:"; }
};

} // namespace state
} // namespace sandpool
