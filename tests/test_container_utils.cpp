#include "sandpool/backends/docker_driver.hpp"
#include "sandpool/utils/command_utils.hpp"
#include "sandpool/utils/container_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace sandpool;
using utils::ContainerUtils;

namespace {

bool HasPair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(ContainerUtilsTest, CreateCommandCarriesSpec) {
    backends::ContainerSpec spec;
    spec.name = "runtime_sandbox_container_abc";
    spec.image = "agentscope/runtime-sandbox-base:latest";
    spec.host_port = 49160;
    spec.container_port = 80;
    spec.environment["SECRET_TOKEN"] = "tok";
    spec.mounts.push_back(utils::VolumeMount{"/srv/mounts/abc", "/workspace", false});
    spec.mounts.push_back(utils::VolumeMount{"/data/models", "/models", true});
    spec.memory_limit = "2g";
    spec.labels["sandpool.type"] = "base";

    auto args = ContainerUtils::BuildCreateCommand(backends::DockerDriver::ToContainerConfig(spec));

    ASSERT_FALSE(args.empty());
    EXPECT_EQ("create", args.front());
    EXPECT_EQ(spec.image, args.back());
    EXPECT_TRUE(HasPair(args, "--name", spec.name));
    EXPECT_TRUE(HasPair(args, "-p", "49160:80"));
    EXPECT_TRUE(HasPair(args, "-v", "/srv/mounts/abc:/workspace:rw"));
    EXPECT_TRUE(HasPair(args, "-v", "/data/models:/models:ro"));
    EXPECT_TRUE(HasPair(args, "-e", "SECRET_TOKEN=tok"));
    EXPECT_TRUE(HasPair(args, "--memory", "2g"));
    EXPECT_TRUE(HasPair(args, "--label", "sandpool.type=base"));
}

TEST(ContainerUtilsTest, ParseState) {
    EXPECT_EQ(utils::ContainerState::EXITED, ContainerUtils::ParseState("exited"));
    EXPECT_EQ(utils::ContainerState::DEAD, ContainerUtils::ParseState("dead"));
    EXPECT_EQ(utils::ContainerState::UNKNOWN, ContainerUtils::ParseState("bogus"));
}

TEST(CommandUtilsTest, FormatCommandMasksSecrets) {
    auto text = utils::FormatCommand({"docker", "create", "-e", "SECRET_TOKEN=abc", "img"});
    EXPECT_EQ(std::string::npos, text.find("abc"));
    EXPECT_NE(std::string::npos, text.find("SECRET_TOKEN=***"));

    auto oss = utils::FormatCommand({"ossutil", "cp", "-k", "hunter2"});
    EXPECT_EQ(std::string::npos, oss.find("hunter2"));
}

TEST(CommandUtilsTest, RunCommandCapturesOutput) {
    auto result = utils::RunCommand({"sh", "-c", "echo out; echo err >&2; exit 3"});
    EXPECT_TRUE(result.started);
    EXPECT_EQ(3, result.exit_code);
    EXPECT_EQ("out\n", result.stdout_output);
    EXPECT_EQ("err\n", result.stderr_output);
    EXPECT_FALSE(result.Success());
}

TEST(CommandUtilsTest, RunCommandFeedsStdin) {
    auto result = utils::RunCommand({"cat"}, std::string("manifest body"));
    EXPECT_TRUE(result.Success());
    EXPECT_EQ("manifest body", result.stdout_output);
}

TEST(CommandUtilsTest, RunCommandMissingProgram) {
    auto result = utils::RunCommand({"sandpool-definitely-not-installed"});
    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.Success());
    EXPECT_FALSE(utils::IsProgramAvailable("sandpool-definitely-not-installed"));
    EXPECT_TRUE(utils::IsProgramAvailable("sh"));
}

TEST(CommandUtilsTest, RunCommandTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto result = utils::RunCommand({"sleep", "5"}, std::nullopt, std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.Success());
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}
