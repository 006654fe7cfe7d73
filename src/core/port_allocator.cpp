/**
 * @file port_allocator.cpp
 * @brief Implementation of store-backed port reservation
 *
 * **Allocation Algorithm**:
 * 1. Take the cursor and advance it by one (under the local mutex)
 * 2. Walk the range once starting from that port, wrapping at `high`
 * 3. For each candidate try PutIfAbsent(port key, holder)
 * 4. If the host port check is enabled and the port is bound by a foreign
 *    process, drop the reservation again and keep walking
 * 5. A full walk without success means the range is exhausted
 *
 * @date 2025
 */

#include "sandpool/core/port_allocator.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sandpool {
namespace core {

PortAllocator::PortAllocator(std::shared_ptr<state::StateStore> store,
                             state::KeySpace keys,
                             int low, int high,
                             bool check_host_ports)
    : store_(std::move(store)),
      keys_(std::move(keys)),
      low_(low),
      high_(high),
      check_host_ports_(check_host_ports),
      next_port_(low) {
    if (low_ < 1 || high_ > 65535 || low_ > high_) {
        throw ConfigError("Invalid port range " + std::to_string(low_) + "-" + std::to_string(high_));
    }
    spdlog::debug("Port allocator over {}-{} ({} ports, store: {})",
                  low_, high_, Capacity(), store_->Name());
}

// ============================================================================
// RESERVATION
// ============================================================================

int PortAllocator::Acquire(const std::string& holder) {
    int start;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        start = next_port_;
        next_port_ = (next_port_ >= high_) ? low_ : next_port_ + 1;
    }

    const int span = high_ - low_ + 1;
    for (int offset = 0; offset < span; ++offset) {
        const int port = low_ + (start - low_ + offset) % span;
        const std::string key = keys_.Port(port);

        if (!store_->PutIfAbsent(key, holder)) {
            continue;
        }

        if (check_host_ports_ && !IsHostPortFree(port)) {
            spdlog::debug("Port {} is bound by another process, skipping", port);
            store_->EraseIfEquals(key, holder);
            continue;
        }

        spdlog::debug("Reserved port {} for {}", port, holder);
        return port;
    }

    spdlog::error("Port range {}-{} exhausted", low_, high_);
    throw ExhaustionError("No free port in range " + std::to_string(low_) + "-" +
                          std::to_string(high_));
}

bool PortAllocator::Release(int port, const std::optional<std::string>& holder) {
    if (port < low_ || port > high_) {
        return false;
    }

    const std::string key = keys_.Port(port);
    bool released = holder ? store_->EraseIfEquals(key, *holder) : store_->Erase(key);

    if (released) {
        spdlog::debug("Released port {}", port);
    } else if (holder) {
        spdlog::debug("Port {} not held by {}, nothing released", port, *holder);
    }
    return released;
}

bool PortAllocator::Transfer(int port, const std::string& from, const std::string& to) {
    if (port < low_ || port > high_) {
        return false;
    }
    if (!store_->ReplaceIfEquals(keys_.Port(port), from, to)) {
        spdlog::warn("Port {} not held by {}, cannot hand it to {}", port, from, to);
        return false;
    }
    spdlog::debug("Port {} handed from {} to {}", port, from, to);
    return true;
}

// ============================================================================
// INSPECTION
// ============================================================================

bool PortAllocator::IsReserved(int port) const {
    return store_->Get(keys_.Port(port)).has_value();
}

std::vector<int> PortAllocator::ReservedPorts() const {
    const std::string prefix = keys_.PortPrefix();
    std::vector<int> ports;

    for (const auto& key : store_->Keys(prefix)) {
        auto parsed = utils::StringUtils::ParseInt(key.substr(prefix.size()));
        if (parsed && *parsed >= low_ && *parsed <= high_) {
            ports.push_back(static_cast<int>(*parsed));
        }
    }

    std::sort(ports.begin(), ports.end());
    return ports;
}

bool PortAllocator::IsHostPortFree(int port) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        spdlog::warn("Port check socket failed: {}", std::strerror(errno));
        return true;
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(port));

    bool free = bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    close(fd);
    return free;
}

} // namespace core
} // namespace sandpool
