#include "sandpool/core/errors.hpp"
#include "sandpool/core/sandbox_pool.hpp"
#include "sandpool/state/memory_state_store.hpp"
#include "fake_backend_driver.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>

using namespace sandpool;
using core::InstanceState;
using core::SandboxPool;

namespace fs = std::filesystem;

namespace {

/// Local storage that remembers every restore request
class RecordingStorage : public storage::LocalStorage {
public:
    bool Download(const std::string& remote, const fs::path& local) override {
        downloads.emplace_back(remote, local.string());
        return LocalStorage::Download(remote, local);
    }

    std::vector<std::pair<std::string, std::string>> downloads;
};

std::string ReadFile(const fs::path& path) {
    std::ifstream file(path);
    std::string content;
    std::getline(file, content);
    return content;
}

} // namespace

class SandboxPoolTest : public ::testing::Test {
protected:
    void MakePool(int pool_size, bool with_storage = false) {
        config_ = test::MakeTestConfig(scratch_.Path(), pool_size);
        if (with_storage) {
            config_.storage_folder = (scratch_.Path() / "storage").string();
        }
        registry_ = std::make_shared<core::SandboxRegistry>();
        registry_->RegisterBuiltins(config_);
        driver_ = std::make_shared<test::FakeBackendDriver>();
        store_ = std::make_shared<state::MemoryStateStore>();
        ports_ = std::make_shared<core::PortAllocator>(store_, core::MakeKeySpace(config_),
                                                        config_.port_range_low,
                                                        config_.port_range_high, false);
        storage_ = std::make_shared<RecordingStorage>();
        pool_ = std::make_unique<SandboxPool>(config_, registry_, driver_, ports_, store_,
                                              storage_, "worker-test");
    }

    std::vector<std::string> Members(const std::string& type) {
        return store_->Members(core::MakeKeySpace(config_).Pool(type));
    }

    test::TempDir scratch_;
    core::ManagerConfig config_;
    std::shared_ptr<core::SandboxRegistry> registry_;
    std::shared_ptr<test::FakeBackendDriver> driver_;
    std::shared_ptr<state::MemoryStateStore> store_;
    std::shared_ptr<core::PortAllocator> ports_;
    std::shared_ptr<RecordingStorage> storage_;
    std::unique_ptr<SandboxPool> pool_;
};

// ============================================================================
// Filling
// ============================================================================

TEST_F(SandboxPoolTest, FillReachesTargetOnce) {
    MakePool(2);

    EXPECT_EQ(2u, pool_->Fill("base"));
    EXPECT_EQ(2u, pool_->WarmCount("base"));
    EXPECT_EQ(0u, pool_->PendingCount("base"));
    EXPECT_EQ(2, driver_->CreateCalls());
    EXPECT_EQ(2u, ports_->ReservedPorts().size());
    EXPECT_EQ(2u, Members("base").size());

    EXPECT_EQ(0u, pool_->Fill("base"));
    EXPECT_EQ(2, driver_->CreateCalls());
}

TEST_F(SandboxPoolTest, FillIgnoresUnpooledAndUnknownTypes) {
    MakePool(2);
    EXPECT_EQ(0u, pool_->Fill("browser"));
    EXPECT_EQ(0u, pool_->Fill("nonexistent"));
    EXPECT_EQ(0, driver_->CreateCalls());
}

TEST_F(SandboxPoolTest, ConcurrentFillsRespectTarget) {
    MakePool(3);
    driver_->create_delay = std::chrono::milliseconds(20);

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this] { pool_->Fill("base"); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(3u, pool_->WarmCount("base"));
    EXPECT_EQ(3, driver_->CreateCalls());
    EXPECT_EQ(3, driver_->MaxLive());
}

TEST_F(SandboxPoolTest, FillPausesAfterRepeatedFailures) {
    MakePool(2);
    driver_->fail_creates = 10;

    EXPECT_EQ(0u, pool_->Fill("base"));
    EXPECT_EQ(1, driver_->CreateCalls());
    EXPECT_EQ(0u, pool_->Fill("base"));
    EXPECT_EQ(2, driver_->CreateCalls());

    // Paused for the cooldown
    EXPECT_EQ(0u, pool_->Fill("base"));
    EXPECT_EQ(2, driver_->CreateCalls());
    EXPECT_TRUE(ports_->ReservedPorts().empty());
    EXPECT_EQ(0u, pool_->PendingCount("base"));
}

TEST_F(SandboxPoolTest, PruneRemovesDeadInstances) {
    MakePool(2);
    pool_->Fill("base");
    auto warm = pool_->Snapshot();
    ASSERT_EQ(2u, warm.size());

    driver_->Kill(warm[0].handle.id);
    EXPECT_EQ(1u, pool_->Prune("base"));
    EXPECT_EQ(1u, pool_->WarmCount("base"));
    EXPECT_EQ(1u, ports_->ReservedPorts().size());
    EXPECT_EQ(std::vector<std::string>{warm[1].id}, Members("base"));
}

TEST_F(SandboxPoolTest, DrainEmptiesPoolAndMembership) {
    MakePool(2);
    pool_->Fill("base");

    auto drained = pool_->Drain();
    EXPECT_EQ(2u, drained.size());
    EXPECT_EQ(0u, pool_->WarmCount("base"));
    EXPECT_TRUE(Members("base").empty());
    // Caller owns teardown
    EXPECT_EQ(2, driver_->LiveCount());

    for (const auto& instance : drained) {
        EXPECT_TRUE(pool_->Destroy(instance));
    }
    EXPECT_EQ(0, driver_->LiveCount());
    EXPECT_TRUE(ports_->ReservedPorts().empty());
}

// ============================================================================
// Taking
// ============================================================================

TEST_F(SandboxPoolTest, TakeIsFirstInFirstOut) {
    MakePool(2);
    pool_->Fill("base");
    auto warm = pool_->Snapshot();

    auto first = pool_->Take("base");
    EXPECT_EQ(warm[0].id, first.id);
    EXPECT_EQ(InstanceState::ASSIGNED, first.state);
    EXPECT_EQ(warm[1].id, pool_->Take("base").id);
    EXPECT_EQ(2, driver_->CreateCalls());
    EXPECT_TRUE(Members("base").empty());
}

TEST_F(SandboxPoolTest, TakeProvisionsOnMiss) {
    MakePool(0);

    auto instance = pool_->Take("base");
    EXPECT_EQ(1, driver_->CreateCalls());
    EXPECT_EQ(InstanceState::ASSIGNED, instance.state);
    EXPECT_EQ("worker-test", instance.owner);
    EXPECT_EQ(config_.container_prefix_key + instance.id, instance.name);
    EXPECT_EQ("http://127.0.0.1:" + std::to_string(instance.port), instance.base_url);
    EXPECT_EQ(32u, instance.bearer_token.size());
    EXPECT_TRUE(std::filesystem::is_directory(instance.mount_dir));

    auto spec = driver_->SpecOf(instance.handle.id);
    EXPECT_EQ(instance.bearer_token, spec.environment["SECRET_TOKEN"]);
    EXPECT_EQ(instance.port, spec.host_port);
    EXPECT_EQ("worker-test", spec.labels["sandpool.owner"]);
    EXPECT_EQ("true", spec.labels["sandpool.managed"]);
}

TEST_F(SandboxPoolTest, TakeUnknownTypeReservesNothing) {
    MakePool(1);
    EXPECT_THROW(pool_->Take("nonexistent"), core::UnknownTypeError);
    EXPECT_TRUE(ports_->ReservedPorts().empty());
    EXPECT_EQ(0, driver_->CreateCalls());
}

TEST_F(SandboxPoolTest, TakeSkipsDeadWarmInstance) {
    MakePool(1);
    pool_->Fill("base");
    auto dead = pool_->Snapshot().front();
    driver_->Kill(dead.handle.id);

    auto instance = pool_->Take("base");
    EXPECT_NE(dead.id, instance.id);
    EXPECT_EQ(2, driver_->CreateCalls());
    EXPECT_EQ(std::vector<std::string>{dead.handle.id}, driver_->Destroyed());
    EXPECT_EQ(std::vector<int>{instance.port}, ports_->ReservedPorts());
}

TEST_F(SandboxPoolTest, TakeDiscardsOutdatedImage) {
    MakePool(1);
    pool_->Fill("base");
    auto stale = pool_->Snapshot().front();

    auto updated = *registry_->Find("base");
    updated.image = "agentscope/runtime-sandbox-base:next";
    registry_->Register(updated);

    auto instance = pool_->Take("base");
    EXPECT_EQ("agentscope/runtime-sandbox-base:next", instance.image);
    EXPECT_NE(stale.id, instance.id);
    EXPECT_EQ(1, driver_->LiveCount());
}

TEST_F(SandboxPoolTest, MissingEnvironmentValueFailsWithoutLeaks) {
    MakePool(0);
    core::SandboxTypeConfig type;
    type.type = "needs-key";
    type.image = "example/needs-key:1";
    type.environment["API_KEY"] = "";
    registry_->Register(type);

    EXPECT_THROW(pool_->Take("needs-key"), core::ProvisioningError);
    EXPECT_EQ(0, driver_->CreateCalls());
    EXPECT_TRUE(ports_->ReservedPorts().empty());
}

TEST_F(SandboxPoolTest, StartFailureUndoesProvisioning) {
    MakePool(0);
    driver_->fail_starts = 1;

    EXPECT_THROW(pool_->Take("base"), core::ProvisioningError);
    EXPECT_EQ(1, driver_->DestroyCalls());
    EXPECT_EQ(0, driver_->LiveCount());
    EXPECT_TRUE(ports_->ReservedPorts().empty());
    EXPECT_TRUE(std::filesystem::is_empty(config_.default_mount_dir));
}

// ============================================================================
// Returning
// ============================================================================

TEST_F(SandboxPoolTest, GiveBackRecyclesUnderFreshIdentity) {
    MakePool(1);
    auto instance = pool_->Take("base");
    const auto old_handle = instance.handle.id;
    const auto port = instance.port;
    fs::path marker = fs::path(instance.mount_dir) / "scratch.txt";
    std::ofstream(marker) << "client data";

    pool_->GiveBack(instance, true);

    EXPECT_EQ(1u, pool_->WarmCount("base"));
    EXPECT_EQ(std::vector<std::string>{old_handle}, driver_->Destroyed());
    EXPECT_EQ(2, driver_->CreateCalls());
    EXPECT_EQ(1, driver_->LiveCount());

    auto recycled = pool_->Snapshot().front();
    EXPECT_NE(instance.id, recycled.id);
    EXPECT_NE(instance.name, recycled.name);
    EXPECT_NE(instance.bearer_token, recycled.bearer_token);
    EXPECT_EQ(32u, recycled.bearer_token.size());
    EXPECT_EQ(port, recycled.port);
    EXPECT_EQ(InstanceState::WARM, recycled.state);

    // Workspace kept but emptied and renamed after the new id
    EXPECT_FALSE(fs::exists(instance.mount_dir));
    EXPECT_EQ(recycled.id, fs::path(recycled.mount_dir).filename().string());
    EXPECT_TRUE(fs::is_directory(recycled.mount_dir));
    EXPECT_TRUE(fs::is_empty(recycled.mount_dir));

    auto spec = driver_->SpecOf(recycled.handle.id);
    EXPECT_EQ(recycled.bearer_token, spec.environment["SECRET_TOKEN"]);
    EXPECT_EQ(recycled.id, spec.labels["sandpool.instance"]);
    EXPECT_EQ(recycled.name, spec.name);
    EXPECT_EQ(port, spec.host_port);

    // The reservation moved to the new name
    EXPECT_EQ(std::vector<int>{port}, ports_->ReservedPorts());
    EXPECT_FALSE(ports_->Release(port, instance.name));
    EXPECT_EQ(recycled.name, store_->Get(core::MakeKeySpace(config_).Port(port)).value());
    EXPECT_EQ(std::vector<std::string>{recycled.id}, Members("base"));
}

TEST_F(SandboxPoolTest, FailedRelaunchDestroysInstead) {
    MakePool(1);
    auto instance = pool_->Take("base");
    driver_->fail_creates = 1;

    pool_->GiveBack(instance, true);

    EXPECT_EQ(0u, pool_->WarmCount("base"));
    EXPECT_EQ(0u, pool_->PendingCount("base"));
    EXPECT_EQ(0, driver_->LiveCount());
    EXPECT_TRUE(ports_->ReservedPorts().empty());
    EXPECT_TRUE(Members("base").empty());
    EXPECT_TRUE(fs::is_empty(config_.default_mount_dir));
}

TEST_F(SandboxPoolTest, GiveBackDestroysWhenPoolFull) {
    MakePool(1);
    pool_->Fill("base");
    auto instance = pool_->Take("base");
    pool_->Fill("base");

    pool_->GiveBack(instance, true);
    EXPECT_EQ(1u, pool_->WarmCount("base"));
    EXPECT_EQ(1, driver_->LiveCount());
    EXPECT_FALSE(ports_->IsReserved(instance.port));
}

TEST_F(SandboxPoolTest, GiveBackWithoutRecycleDestroys) {
    MakePool(1);
    auto instance = pool_->Take("base");

    pool_->GiveBack(instance, false);
    EXPECT_EQ(0u, pool_->WarmCount("base"));
    EXPECT_EQ(0, driver_->LiveCount());
    EXPECT_FALSE(ports_->IsReserved(instance.port));
    EXPECT_FALSE(std::filesystem::exists(instance.mount_dir));
}

// ============================================================================
// Workspace storage
// ============================================================================

TEST_F(SandboxPoolTest, ProvisionRestoresWorkspaceFromStorage) {
    MakePool(0, true);
    auto instance = pool_->Take("base");

    EXPECT_EQ((fs::path(config_.storage_folder) / instance.id).string(), instance.storage_path);
    ASSERT_EQ(1u, storage_->downloads.size());
    EXPECT_EQ(instance.storage_path, storage_->downloads[0].first);
    EXPECT_EQ(instance.mount_dir, storage_->downloads[0].second);
}

TEST_F(SandboxPoolTest, DestroySavesWorkspaceToStorage) {
    MakePool(0, true);
    auto instance = pool_->Take("base");
    fs::create_directories(fs::path(instance.mount_dir) / "out");
    std::ofstream(fs::path(instance.mount_dir) / "out" / "result.txt") << "42";

    pool_->GiveBack(instance, false);

    fs::path saved = fs::path(config_.storage_folder) / instance.id / "out" / "result.txt";
    ASSERT_TRUE(fs::exists(saved));
    EXPECT_EQ("42", ReadFile(saved));
    EXPECT_FALSE(fs::exists(instance.mount_dir));
}

TEST_F(SandboxPoolTest, RecycleSavesWorkspaceBeforeWiping) {
    MakePool(1, true);
    auto instance = pool_->Take("base");
    std::ofstream(fs::path(instance.mount_dir) / "notes.txt") << "draft";

    pool_->GiveBack(instance, true);
    ASSERT_EQ(1u, pool_->WarmCount("base"));
    auto recycled = pool_->Snapshot().front();

    EXPECT_EQ("draft", ReadFile(fs::path(config_.storage_folder) / instance.id / "notes.txt"));
    EXPECT_TRUE(fs::is_empty(recycled.mount_dir));
    EXPECT_EQ((fs::path(config_.storage_folder) / recycled.id).string(), recycled.storage_path);
}

TEST_F(SandboxPoolTest, ClosedPoolStopsFillingAndRecycling) {
    MakePool(1);
    auto instance = pool_->Take("base");
    pool_->Close();

    EXPECT_TRUE(pool_->IsClosed());
    EXPECT_EQ(0u, pool_->Fill("base"));
    pool_->GiveBack(instance, true);
    EXPECT_EQ(0u, pool_->WarmCount("base"));
    EXPECT_EQ(0, driver_->LiveCount());
}
