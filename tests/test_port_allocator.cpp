#include "sandpool/core/errors.hpp"
#include "sandpool/core/port_allocator.hpp"
#include "sandpool/state/memory_state_store.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace sandpool;
using core::PortAllocator;

namespace {

std::shared_ptr<state::StateStore> NewStore() {
    return std::make_shared<state::MemoryStateStore>();
}

} // namespace

TEST(PortAllocatorTest, RejectsInvalidRange) {
    EXPECT_THROW(PortAllocator(NewStore(), state::KeySpace{}, 5000, 4000, false), core::ConfigError);
    EXPECT_THROW(PortAllocator(NewStore(), state::KeySpace{}, 0, 10, false), core::ConfigError);
    EXPECT_THROW(PortAllocator(NewStore(), state::KeySpace{}, 65000, 70000, false), core::ConfigError);
}

TEST(PortAllocatorTest, ExhaustionThenReuseAfterRelease) {
    PortAllocator ports(NewStore(), state::KeySpace{}, 49152, 49153, false);
    EXPECT_EQ(2u, ports.Capacity());

    int first = ports.Acquire("a");
    int second = ports.Acquire("b");
    EXPECT_NE(first, second);
    EXPECT_THROW(ports.Acquire("c"), core::ExhaustionError);

    EXPECT_TRUE(ports.Release(first));
    EXPECT_EQ(first, ports.Acquire("c"));
}

TEST(PortAllocatorTest, ReleaseIsHolderConditional) {
    PortAllocator ports(NewStore(), state::KeySpace{}, 49152, 49160, false);
    int port = ports.Acquire("sandbox-a");

    EXPECT_FALSE(ports.Release(port, std::string("sandbox-b")));
    EXPECT_TRUE(ports.IsReserved(port));
    EXPECT_TRUE(ports.Release(port, std::string("sandbox-a")));
    EXPECT_FALSE(ports.IsReserved(port));
    EXPECT_FALSE(ports.Release(port));
}

TEST(PortAllocatorTest, TransferKeepsPortReserved) {
    auto store = NewStore();
    PortAllocator ports(store, state::KeySpace{}, 49152, 49160, false);
    int port = ports.Acquire("sandbox-a");

    EXPECT_FALSE(ports.Transfer(port, "sandbox-x", "sandbox-b"));
    EXPECT_TRUE(ports.Transfer(port, "sandbox-a", "sandbox-b"));
    EXPECT_EQ("sandbox-b", store->Get(state::KeySpace{}.Port(port)).value());

    EXPECT_FALSE(ports.Release(port, std::string("sandbox-a")));
    EXPECT_TRUE(ports.Release(port, std::string("sandbox-b")));
    EXPECT_FALSE(ports.Transfer(port, "sandbox-b", "sandbox-c"));
}

TEST(PortAllocatorTest, ReleaseOutsideRangeIsIgnored) {
    PortAllocator ports(NewStore(), state::KeySpace{}, 49152, 49160, false);
    EXPECT_FALSE(ports.Release(80));
}

TEST(PortAllocatorTest, ReservedPortsAreSortedAndScopedToNamespace) {
    auto store = NewStore();
    state::KeySpace keys;
    keys.ns = "one";
    state::KeySpace other = keys;
    other.ns = "two";

    PortAllocator ports(store, keys, 49152, 49160, false);
    PortAllocator foreign(store, other, 49152, 49160, false);

    ports.Acquire("x");
    ports.Acquire("y");
    ports.Acquire("z");
    foreign.Acquire("q");

    auto reserved = ports.ReservedPorts();
    ASSERT_EQ(3u, reserved.size());
    EXPECT_TRUE(std::is_sorted(reserved.begin(), reserved.end()));
    EXPECT_EQ(1u, foreign.ReservedPorts().size());
}

TEST(PortAllocatorTest, AllocatorsSharingAStoreNeverCollide) {
    auto store = NewStore();
    PortAllocator worker_a(store, state::KeySpace{}, 49152, 49251, false);
    PortAllocator worker_b(store, state::KeySpace{}, 49152, 49251, false);

    std::mutex mutex;
    std::set<int> seen;
    std::atomic<bool> duplicate{false};

    auto grab = [&](PortAllocator& ports, const std::string& tag) {
        for (int i = 0; i < 25; ++i) {
            int port = ports.Acquire(tag + std::to_string(i));
            std::lock_guard<std::mutex> lock(mutex);
            if (!seen.insert(port).second) {
                duplicate = true;
            }
        }
    };

    std::vector<std::thread> threads;
    threads.emplace_back(grab, std::ref(worker_a), "a1-");
    threads.emplace_back(grab, std::ref(worker_a), "a2-");
    threads.emplace_back(grab, std::ref(worker_b), "b1-");
    threads.emplace_back(grab, std::ref(worker_b), "b2-");
    for (auto& t : threads) t.join();

    EXPECT_FALSE(duplicate.load());
    EXPECT_EQ(100u, seen.size());
    EXPECT_THROW(worker_a.Acquire("overflow"), core::ExhaustionError);
}

TEST(PortAllocatorTest, HostCheckSkipsBoundPorts) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = 0;
    ASSERT_EQ(0, bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)));
    ASSERT_EQ(0, listen(fd, 1));
    socklen_t len = sizeof(addr);
    ASSERT_EQ(0, getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len));
    const int bound = ntohs(addr.sin_port);

    EXPECT_FALSE(PortAllocator::IsHostPortFree(bound));

    PortAllocator ports(NewStore(), state::KeySpace{}, bound, bound, true);
    EXPECT_THROW(ports.Acquire("x"), core::ExhaustionError);
    EXPECT_FALSE(ports.IsReserved(bound));

    close(fd);
}
