#include "sandpool/server/control_server.hpp"
#include "sandpool/state/memory_state_store.hpp"
#include "fake_backend_driver.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <filesystem>
#include <thread>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace sandpool;
using json = nlohmann::json;
using server::ControlServer;

class ControlServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto config = test::MakeTestConfig(scratch_.Path(), 1);
        auto registry = std::make_shared<core::SandboxRegistry>();
        registry->RegisterBuiltins(config);
        controller_ = std::make_unique<core::LifecycleController>(
            config, registry, driver_, std::make_shared<state::MemoryStateStore>(),
            std::make_shared<storage::LocalStorage>(), "worker-test");
    }

    json Call(ControlServer& server, const json& request) {
        return json::parse(server.HandleLine(request.dump()));
    }

    test::TempDir scratch_;
    std::shared_ptr<test::FakeBackendDriver> driver_ = std::make_shared<test::FakeBackendDriver>();
    std::unique_ptr<core::LifecycleController> controller_;
};

TEST_F(ControlServerTest, MalformedRequests) {
    ControlServer server(*controller_);

    auto garbage = json::parse(server.HandleLine("{not json"));
    EXPECT_FALSE(garbage["ok"].get<bool>());
    EXPECT_EQ("bad_request", garbage["error"]);

    EXPECT_EQ("bad_request", Call(server, json::array({1, 2}))["error"]);
    EXPECT_EQ("bad_request", Call(server, {{"op", "teleport"}})["error"]);
    EXPECT_EQ("bad_request", Call(server, {{"op", "acquire"}})["error"]);
    EXPECT_EQ("bad_request", Call(server, {{"op", "acquire"}, {"type", "base"}, {"timeout", -5}})["error"]);
}

TEST_F(ControlServerTest, AcquireInspectTouchRelease) {
    ControlServer server(*controller_);

    auto acquired = Call(server, {{"op", "acquire"}, {"type", "base"}, {"timeout", 120}});
    ASSERT_TRUE(acquired["ok"].get<bool>()) << acquired.dump();
    const std::string id = acquired["sandbox"]["id"];
    EXPECT_EQ(32u, acquired["sandbox"]["bearer_token"].get<std::string>().size());
    EXPECT_FALSE(acquired["sandbox"]["expires_at"].is_null());

    auto inspected = Call(server, {{"op", "inspect"}, {"id", id}});
    EXPECT_EQ("assigned", inspected["status"]["state"]);
    EXPECT_EQ("worker-test", inspected["status"]["owner"]);
    EXPECT_TRUE(inspected["status"]["local"].get<bool>());

    EXPECT_TRUE(Call(server, {{"op", "touch"}, {"id", id}})["ok"].get<bool>());

    auto listed = Call(server, {{"op", "list"}});
    EXPECT_EQ(1u, listed["sandboxes"].size());

    EXPECT_TRUE(Call(server, {{"op", "release"}, {"id", id}, {"recycle", false}})["ok"].get<bool>());
    EXPECT_EQ(0, driver_->LiveCount());

    auto gone = Call(server, {{"op", "inspect"}, {"id", id}});
    EXPECT_FALSE(gone["ok"].get<bool>());
    EXPECT_EQ("not_found", gone["error"]);
}

TEST_F(ControlServerTest, ErrorKindsFollowExceptions) {
    ControlServer server(*controller_);

    EXPECT_EQ("unknown_type", Call(server, {{"op", "acquire"}, {"type", "nonexistent"}})["error"]);
    EXPECT_EQ("not_found", Call(server, {{"op", "touch"}, {"id", "missing"}})["error"]);

    driver_->fail_creates = 1;
    EXPECT_EQ("provisioning", Call(server, {{"op", "acquire"}, {"type", "base"}})["error"]);
}

TEST_F(ControlServerTest, SessionsAndPowerControl) {
    ControlServer server(*controller_);

    auto acquired = Call(server, {{"op", "acquire"}, {"type", "base"}, {"session", "chat-7"}});
    ASSERT_TRUE(acquired["ok"].get<bool>()) << acquired.dump();
    const std::string id = acquired["sandbox"]["id"];

    auto sessions = Call(server, {{"op", "sessions"}});
    EXPECT_EQ(json::array({"chat-7"}), sessions["sessions"]);

    auto bound = Call(server, {{"op", "session"}, {"session", "chat-7"}});
    EXPECT_EQ(json::array({id}), bound["sandboxes"]);
    EXPECT_EQ("bad_request", Call(server, {{"op", "session"}})["error"]);

    auto stopped = Call(server, {{"op", "stop"}, {"id", id}});
    EXPECT_TRUE(stopped["ok"].get<bool>());
    EXPECT_FALSE(stopped["running"].get<bool>());
    auto started = Call(server, {{"op", "start"}, {"id", id}});
    EXPECT_TRUE(started["running"].get<bool>());
    EXPECT_EQ("not_found", Call(server, {{"op", "start"}, {"id", "missing"}})["error"]);

    Call(server, {{"op", "release"}, {"id", id}});
    EXPECT_TRUE(Call(server, {{"op", "sessions"}})["sessions"].empty());
}

TEST_F(ControlServerTest, TokenIsRequiredWhenConfigured) {
    ControlServer server(*controller_, "s3cret");

    auto denied = Call(server, {{"op", "health"}});
    EXPECT_EQ("unauthorized", denied["error"]);
    EXPECT_EQ("unauthorized", Call(server, {{"op", "health"}, {"token", "wrong"}})["error"]);

    auto allowed = Call(server, {{"op", "health"}, {"token", "s3cret"}});
    EXPECT_TRUE(allowed["ok"].get<bool>());
}

TEST_F(ControlServerTest, RegisterAndListTypes) {
    ControlServer server(*controller_);

    json config = {{"type", "analysis"}, {"image", "example/analysis:1"}, {"timeout", 300}};
    auto registered = Call(server, {{"op", "register"}, {"config", config}});
    ASSERT_TRUE(registered["ok"].get<bool>()) << registered.dump();
    EXPECT_EQ("analysis", registered["type"]);

    auto invalid = Call(server, {{"op", "register"}, {"config", {{"type", "x"}, {"image", ""}}}});
    EXPECT_EQ("bad_request", invalid["error"]);

    auto types = Call(server, {{"op", "types"}});
    bool found = false;
    for (const auto& entry : types["types"]) {
        if (entry["type"] == "analysis") {
            found = true;
            EXPECT_EQ(0, entry["pool_size"]);
        }
        if (entry["type"] == "base") {
            EXPECT_EQ(1, entry["pool_size"]);
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(ControlServerTest, HealthReportsPools) {
    ControlServer server(*controller_);
    controller_->MaintainPools();

    auto health = Call(server, {{"op", "health"}});
    EXPECT_EQ("worker-test", health["owner"]);
    EXPECT_EQ("fake", health["backend"]);
    EXPECT_TRUE(health["backend_available"].get<bool>());
    EXPECT_FALSE(health["shutting_down"].get<bool>());
    EXPECT_EQ(1, health["pools"]["base"]["warm"]);
    EXPECT_EQ(1, health["pools"]["base"]["target"]);
}

TEST_F(ControlServerTest, ServesNewlineDelimitedRequestsOverSocket) {
    const std::string path = (scratch_.Path() / "control.sock").string();
    ControlServer server(*controller_);
    ASSERT_TRUE(server.Listen(path));

    std::atomic<bool> stop{false};
    std::thread runner([&] { server.Run(stop); });

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    ASSERT_EQ(0, connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)));

    const std::string requests = "{\"op\":\"health\"}\n\n{\"op\":\"list\"}\n";
    ASSERT_EQ(static_cast<ssize_t>(requests.size()), write(fd, requests.data(), requests.size()));

    std::string received;
    char chunk[1024];
    while (std::count(received.begin(), received.end(), '\n') < 2) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        ASSERT_GT(n, 0);
        received.append(chunk, static_cast<std::size_t>(n));
    }
    close(fd);

    auto newline = received.find('\n');
    auto first = json::parse(received.substr(0, newline));
    auto second = json::parse(received.substr(newline + 1));
    EXPECT_EQ("worker-test", first["owner"]);
    EXPECT_TRUE(second["sandboxes"].is_array());

    stop = true;
    runner.join();
    server.Stop();
    EXPECT_FALSE(std::filesystem::exists(path));
}
