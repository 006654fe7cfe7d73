#include "sandpool/core/errors.hpp"
#include "sandpool/core/manager_config.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace sandpool;
using core::ManagerConfig;

TEST(ManagerConfigTest, DefaultsAreValid) {
    ManagerConfig config;
    EXPECT_NO_THROW(config.Validate());
    EXPECT_EQ(std::vector<std::string>{"base"}, config.default_sandbox_types);
    EXPECT_EQ(49152, config.port_range_low);
    EXPECT_EQ(59152, config.port_range_high);
    EXPECT_TRUE(config.RecycleOnRelease());
    EXPECT_EQ(1, config.EffectiveWorkers());
}

TEST(ManagerConfigTest, ApplyOverlaysValues) {
    ManagerConfig config;
    config.Apply({
        {"DEFAULT_SANDBOX_TYPE", "base, browser"},
        {"POOL_SIZE", "3"},
        {"POOL_SIZES", "browser:1"},
        {"PORT_RANGE", "50000,50010"},
        {"AUTO_CLEANUP", "false"},
        {"READONLY_MOUNTS", "/data/models:/models"},
        {"SANDBOX_TIMEOUT", "120"},
        {"STATE_STORE_ENABLED", "true"},
        {"WORKERS", "4"},
    });

    EXPECT_EQ(3, config.PoolSizeFor("base"));
    EXPECT_EQ(1, config.PoolSizeFor("browser"));
    EXPECT_EQ(0, config.PoolSizeFor("gui"));
    EXPECT_EQ(50000, config.port_range_low);
    EXPECT_EQ(50010, config.port_range_high);
    EXPECT_FALSE(config.auto_cleanup);
    EXPECT_FALSE(config.RecycleOnRelease());
    ASSERT_EQ(1u, config.readonly_mounts.size());
    EXPECT_EQ("/models", config.readonly_mounts[0].container_path);
    EXPECT_TRUE(config.readonly_mounts[0].read_only);
    EXPECT_EQ(std::chrono::seconds(120), config.sandbox_timeout);
    EXPECT_EQ(4, config.EffectiveWorkers());
}

TEST(ManagerConfigTest, RecycleOverridesAutoCleanup) {
    ManagerConfig config;
    config.Apply({{"AUTO_CLEANUP", "false"}, {"RECYCLE_ON_RELEASE", "true"}});
    EXPECT_TRUE(config.RecycleOnRelease());

    config.Apply({{"RECYCLE_ON_RELEASE", ""}});
    EXPECT_FALSE(config.RecycleOnRelease());
}

TEST(ManagerConfigTest, MalformedValuesThrow) {
    ManagerConfig config;
    EXPECT_THROW(config.Apply({{"POOL_SIZE", "many"}}), core::ConfigError);
    EXPECT_THROW(config.Apply({{"POOL_SIZE", "-1"}}), core::ConfigError);
    EXPECT_THROW(config.Apply({{"AUTO_CLEANUP", "perhaps"}}), core::ConfigError);
    EXPECT_THROW(config.Apply({{"PORT_RANGE", "50000"}}), core::ConfigError);
}

TEST(ManagerConfigTest, ValidateRejectsInconsistentSettings) {
    ManagerConfig bad_range;
    bad_range.port_range_low = 6000;
    bad_range.port_range_high = 5000;
    EXPECT_THROW(bad_range.Validate(), core::ConfigError);

    ManagerConfig bad_deployment;
    bad_deployment.container_deployment = "nomad";
    EXPECT_THROW(bad_deployment.Validate(), core::ConfigError);

    ManagerConfig oss_without_credentials;
    oss_without_credentials.file_system = "oss";
    EXPECT_THROW(oss_without_credentials.Validate(), core::ConfigError);

    ManagerConfig long_prefix;
    long_prefix.container_prefix_key = std::string(core::kMaxContainerPrefixLength + 1, 'p');
    EXPECT_THROW(long_prefix.Validate(), core::ConfigError);

    ManagerConfig bad_level;
    bad_level.log_level = "chatty";
    EXPECT_THROW(bad_level.Validate(), core::ConfigError);
}

TEST(ManagerConfigTest, KubernetesNeedsNodePortRangeAndShortPrefix) {
    ManagerConfig config;
    config.container_deployment = "k8s";
    EXPECT_THROW(config.Validate(), core::ConfigError);

    config.port_range_low = 30000;
    config.port_range_high = 31000;
    EXPECT_NO_THROW(config.Validate());

    config.container_prefix_key = std::string(core::kMaxPodPrefixLength + 1, 'p');
    EXPECT_THROW(config.Validate(), core::ConfigError);
}

TEST(ManagerConfigTest, ParseEnvFileHandlesCommentsQuotesAndExport) {
    test::TempDir scratch;
    auto path = scratch.Path() / "sandpool.env";
    {
        std::ofstream file(path);
        file << "# comment\n"
             << "\n"
             << "export POOL_SIZE=2\n"
             << "IMAGE_TAG=\"v1 beta\"\n"
             << "SANDBOX_HOST=sandbox.local # trailing\n"
             << "garbage line\n";
    }

    auto values = ManagerConfig::ParseEnvFile(path);
    EXPECT_EQ("2", values["POOL_SIZE"]);
    EXPECT_EQ("v1 beta", values["IMAGE_TAG"]);
    EXPECT_EQ("sandbox.local", values["SANDBOX_HOST"]);
    EXPECT_EQ(3u, values.size());

    EXPECT_THROW(ManagerConfig::ParseEnvFile(scratch.Path() / "missing.env"), core::ConfigError);
}
