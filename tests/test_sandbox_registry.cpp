#include "sandpool/core/errors.hpp"
#include "sandpool/core/manager_config.hpp"
#include "sandpool/core/sandbox_registry.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace sandpool;
using core::SandboxRegistry;
using core::SandboxTypeConfig;

namespace {

SandboxTypeConfig MakeType(const std::string& type, const std::string& image) {
    SandboxTypeConfig config;
    config.type = type;
    config.image = image;
    return config;
}

} // namespace

TEST(SandboxRegistryTest, BuiltinsFollowImageSettings) {
    core::ManagerConfig config;
    config.image_registry = "registry.example.com";
    config.image_tag = "1.2";

    SandboxRegistry registry;
    registry.RegisterBuiltins(config);

    for (const char* type : {"base", "filesystem", "browser", "gui"}) {
        EXPECT_TRUE(registry.Contains(type)) << type;
    }
    EXPECT_EQ("registry.example.com/agentscope/runtime-sandbox-browser:1.2",
              registry.Find("browser")->image);
    EXPECT_EQ(config.sandbox_timeout, registry.Find("base")->default_timeout);

    config.image_registry.clear();
    config.image_namespace.clear();
    EXPECT_EQ("runtime-sandbox-gui:1.2", SandboxRegistry::BuiltinImage(config, "gui"));
}

TEST(SandboxRegistryTest, RegisterRejectsIncompleteConfig) {
    SandboxRegistry registry;
    EXPECT_FALSE(registry.Register(MakeType("", "img")));
    EXPECT_FALSE(registry.Register(MakeType("custom", "")));

    auto bad_port = MakeType("custom", "img");
    bad_port.container_port = 0;
    EXPECT_FALSE(registry.Register(bad_port));

    EXPECT_FALSE(registry.Find("custom").has_value());
}

TEST(SandboxRegistryTest, ReRegistrationReplaces) {
    SandboxRegistry registry;
    EXPECT_TRUE(registry.Register(MakeType("custom", "img:1")));
    EXPECT_TRUE(registry.Register(MakeType("custom", "img:2")));
    EXPECT_EQ("img:2", registry.Find("custom")->image);
    EXPECT_EQ(1u, registry.List().size());
}

TEST(SandboxRegistryTest, DefaultSpecInjectsTokenMountsAndLabels) {
    auto type = MakeType("base", "img");
    type.environment["OPENAI_API_KEY"] = "sk-test";
    type.resource_limits.memory = "1g";
    type.container_port = 8080;

    core::InstanceParameters params;
    params.id = "abc";
    params.name = "runtime_sandbox_container_abc";
    params.host_port = 49200;
    params.bearer_token = "tok";
    params.mount_dir = "/srv/mounts/abc";
    params.workdir = "/workspace";
    params.readonly_mounts.push_back(utils::VolumeMount{"/data", "/data", true});
    params.labels["sandpool.owner"] = "worker-1";

    auto spec = SandboxRegistry::BuildSpec(type, params);

    EXPECT_EQ(params.name, spec.name);
    EXPECT_EQ(49200, spec.host_port);
    EXPECT_EQ(8080, spec.container_port);
    EXPECT_EQ("tok", spec.environment["SECRET_TOKEN"]);
    EXPECT_EQ("sk-test", spec.environment["OPENAI_API_KEY"]);
    ASSERT_EQ(2u, spec.mounts.size());
    EXPECT_EQ("/workspace", spec.mounts[0].container_path);
    EXPECT_FALSE(spec.mounts[0].read_only);
    EXPECT_TRUE(spec.mounts[1].read_only);
    EXPECT_EQ("1g", spec.memory_limit);
    EXPECT_EQ("base", spec.labels["sandpool.type"]);
    EXPECT_EQ("abc", spec.labels["sandpool.instance"]);
    EXPECT_EQ("worker-1", spec.labels["sandpool.owner"]);
}

TEST(SandboxRegistryTest, CustomSpecBuilderWins) {
    auto type = MakeType("custom", "img");
    type.spec_builder = [](const SandboxTypeConfig& config, const core::InstanceParameters& params) {
        auto spec = SandboxRegistry::DefaultSpec(config, params);
        spec.environment["EXTRA"] = "1";
        spec.mounts.clear();
        return spec;
    };

    core::InstanceParameters params;
    params.name = "n";
    params.mount_dir = "/tmp/x";

    auto spec = SandboxRegistry::BuildSpec(type, params);
    EXPECT_EQ("1", spec.environment["EXTRA"]);
    EXPECT_TRUE(spec.mounts.empty());
}

TEST(SandboxRegistryTest, JsonConversion) {
    auto j = nlohmann::json::parse(R"({
        "type": "analysis",
        "image": "example/analysis:2",
        "security_level": "high",
        "timeout": 600,
        "environment": {"API_KEY": "k", "EMPTY": null},
        "resource_limits": {"memory": "512m", "cpu": "0.5"},
        "container_port": 8000
    })");

    auto config = core::TypeConfigFromJson(j);
    EXPECT_EQ("analysis", config.type);
    EXPECT_EQ(core::SecurityLevel::HIGH, config.security_level);
    EXPECT_EQ(std::chrono::seconds(600), config.default_timeout);
    EXPECT_EQ("k", config.environment["API_KEY"]);
    EXPECT_EQ("", config.environment["EMPTY"]);
    EXPECT_EQ("0.5", config.resource_limits.cpus);
    EXPECT_EQ(8000, config.container_port);

    auto out = core::TypeConfigToJson(config);
    EXPECT_EQ("high", out["security_level"]);
    // Environment values are not echoed back
    EXPECT_EQ(nlohmann::json::array({"API_KEY", "EMPTY"}), out["environment"]);

    EXPECT_THROW(core::TypeConfigFromJson(nlohmann::json{{"type", "x"}, {"image", "y"},
                                                         {"security_level", "extreme"}}),
                 core::SandboxError);
    EXPECT_THROW(core::TypeConfigFromJson(nlohmann::json{{"image", "y"}}), nlohmann::json::exception);
}
