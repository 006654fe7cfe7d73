/**
 * @file port_allocator.hpp
 * @brief Host port reservation shared by all workers
 *
 * @date 2025
 */

#pragma once

#include "sandpool/state/state_store.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sandpool {
namespace core {

/**
 * @class PortAllocator
 * @brief Allocates host ports from [low, high] through the shared state store
 *
 * A port is reserved by atomically creating `<ns>:<port_key>:<port>` with the
 * holder's name as value. The store is the only source of truth, so two
 * allocators in different processes never hand out the same port. Scanning
 * starts from a rotating cursor to spread reservations over the range.
 *
 * **Usage Example**:
 * @code
 * PortAllocator ports(store, keys, 49152, 59152);
 * int port = ports.Acquire("runtime_sandbox_container_abc");
 * // ...
 * ports.Release(port, "runtime_sandbox_container_abc");
 * @endcode
 */
class PortAllocator {
public:
    /**
     * @param store Shared state store
     * @param keys Key layout
     * @param low First port of the range
     * @param high Last port of the range (inclusive)
     * @param check_host_ports Skip ports some other process is bound to
     */
    PortAllocator(std::shared_ptr<state::StateStore> store,
                  state::KeySpace keys,
                  int low, int high,
                  bool check_host_ports = true);

    PortAllocator(const PortAllocator&) = delete;
    PortAllocator& operator=(const PortAllocator&) = delete;

    /**
     * @brief Reserve a free port
     * @param holder Name recorded as the reservation owner
     * @return Reserved port
     * @throws ExhaustionError if every port in the range is taken
     * @throws StateStoreError if the store cannot be written
     */
    int Acquire(const std::string& holder);

    /**
     * @brief Release a reservation (idempotent)
     * @param port Port to release
     * @param holder If set, release only while @p holder still owns the port
     * @return true if a reservation was removed
     * @throws StateStoreError if the store cannot be written
     */
    bool Release(int port, const std::optional<std::string>& holder = std::nullopt);

    /**
     * @brief Hand a reservation over to a new holder without freeing the port
     * @return false if @p from no longer holds @p port
     * @throws StateStoreError if the store cannot be written
     */
    bool Transfer(int port, const std::string& from, const std::string& to);

    bool IsReserved(int port) const;

    /// Ports currently reserved in the store (any holder), ascending
    std::vector<int> ReservedPorts() const;

    /// Number of ports in the range
    std::size_t Capacity() const { return static_cast<std::size_t>(high_ - low_ + 1); }

    int Low() const { return low_; }
    int High() const { return high_; }

    /**
     * @brief Test whether a TCP port can be bound on all interfaces
     */
    static bool IsHostPortFree(int port);

private:
    std::shared_ptr<state::StateStore> store_;  ///< Reservation store
    state::KeySpace keys_;
    int low_;
    int high_;
    bool check_host_ports_;

    std::mutex mutex_;  ///< Guards next_port_
    int next_port_;     ///< Rotating scan start
};

} // namespace core
} // namespace sandpool
