/**
 * @file control_server.cpp
 * @brief Implementation of the control protocol server
 *
 * @date 2025
 */

#include "sandpool/server/control_server.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/core/sandbox_pool.hpp"
#include "sandpool/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;

namespace sandpool {
namespace server {

namespace {

constexpr int kPollTimeoutMs = 200;
constexpr std::size_t kMaxLineBytes = 1024 * 1024;

bool WriteAll(int fd, const std::string& data) {
    std::size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        offset += static_cast<std::size_t>(n);
    }
    return true;
}

} // anonymous namespace

ControlServer::ControlServer(core::LifecycleController& controller, std::string bearer_token)
    : controller_(controller),
      bearer_token_(std::move(bearer_token)) {
}

ControlServer::~ControlServer() {
    Stop();
}

// ============================================================================
// SOCKET HANDLING
// ============================================================================

int ControlServer::BindUnixSocket(const std::string& socket_path) {
    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Control socket path too long: {}", socket_path);
        return -1;
    }

    unlink(socket_path.c_str());

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        spdlog::error("Failed to create socket: {}", std::strerror(errno));
        return -1;
    }

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to bind {}: {}", socket_path, std::strerror(errno));
        close(fd);
        return -1;
    }

    if (listen(fd, 64) < 0) {
        spdlog::error("Failed to listen on {}: {}", socket_path, std::strerror(errno));
        close(fd);
        unlink(socket_path.c_str());
        return -1;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    spdlog::info("Control socket listening on {}", socket_path);
    return fd;
}

bool ControlServer::Listen(const std::string& socket_path) {
    int fd = BindUnixSocket(socket_path);
    if (fd < 0) {
        return false;
    }
    listen_fd_ = fd;
    owns_listener_ = true;
    socket_path_ = socket_path;
    return true;
}

void ControlServer::Adopt(int listen_fd) {
    listen_fd_ = listen_fd;
    owns_listener_ = false;
}

void ControlServer::Run(const std::atomic<bool>& stop) {
    if (listen_fd_ < 0) {
        spdlog::error("Control server has no listening socket");
        return;
    }

    while (!stop) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        int ready = poll(&pfd, 1, kPollTimeoutMs);
        ReapClients(false);

        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll on control socket failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        int client_fd = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            // Another worker sharing the listener may have taken it
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                spdlog::warn("accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_.push_back(ClientThread{
            std::thread([this, client_fd, done, &stop] {
                ServeClient(client_fd, stop);
                *done = true;
            }),
            done});
    }

    ReapClients(true);
}

void ControlServer::ServeClient(int client_fd, const std::atomic<bool>& stop) {
    spdlog::debug("Control client connected (fd={})", client_fd);

    std::string buffer;
    char chunk[4096];

    while (!stop) {
        pollfd pfd{client_fd, POLLIN, 0};
        int ready = poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(client_fd, chunk, sizeof(chunk));
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            spdlog::warn("Control client read error: {}", std::strerror(errno));
            break;
        }
        buffer.append(chunk, static_cast<std::size_t>(n));

        std::size_t newline;
        bool healthy = true;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (line.empty() || line == "\r") {
                continue;
            }
            if (!WriteAll(client_fd, HandleLine(line) + "\n")) {
                healthy = false;
                break;
            }
        }

        if (healthy && buffer.size() > kMaxLineBytes) {
            WriteAll(client_fd, ErrorResponse("bad_request", "Request line too long").dump() + "\n");
            healthy = false;
        }
        if (!healthy) {
            break;
        }
    }

    close(client_fd);
    spdlog::debug("Control client disconnected (fd={})", client_fd);
}

void ControlServer::ReapClients(bool all) {
    std::list<ClientThread> finished;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto it = clients_.begin(); it != clients_.end();) {
            if (all || *it->done) {
                finished.splice(finished.end(), clients_, it++);
            } else {
                ++it;
            }
        }
    }
    for (auto& client : finished) {
        if (client.thread.joinable()) {
            client.thread.join();
        }
    }
}

void ControlServer::Stop() {
    ReapClients(true);

    if (listen_fd_ >= 0 && owns_listener_) {
        close(listen_fd_);
        unlink(socket_path_.c_str());
        spdlog::info("Control socket {} closed", socket_path_);
    }
    listen_fd_ = -1;
    owns_listener_ = false;
}

// ============================================================================
// REQUEST DISPATCH
// ============================================================================

json ControlServer::ErrorResponse(const std::string& kind, const std::string& message) {
    return json{{"ok", false}, {"error", kind}, {"message", message}};
}

std::string ControlServer::HandleLine(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        return ErrorResponse("bad_request", std::string("Malformed JSON: ") + e.what()).dump();
    }
    return HandleRequest(request).dump();
}

bool ControlServer::Authorized(const json& request) const {
    if (bearer_token_.empty()) {
        return true;
    }
    auto it = request.find("token");
    if (it == request.end() || !it->is_string()) {
        return false;
    }
    return utils::HashUtils::ConstantTimeEquals(it->get<std::string>(), bearer_token_);
}

json ControlServer::HandleRequest(const json& request) {
    if (!request.is_object()) {
        return ErrorResponse("bad_request", "Request must be a JSON object");
    }
    if (!Authorized(request)) {
        spdlog::warn("Rejected control request with missing or invalid token");
        return ErrorResponse("unauthorized", "Missing or invalid token");
    }

    const std::string op = request.value("op", "");
    spdlog::debug("Control request: {}", op);

    try {
        if (op == "acquire")  return OnAcquire(request);
        if (op == "release")  return OnRelease(request);
        if (op == "inspect")  return OnInspect(request);
        if (op == "touch")    return OnTouch(request);
        if (op == "start")    return OnStart(request);
        if (op == "stop")     return OnStop(request);
        if (op == "sessions") return OnSessions();
        if (op == "session")  return OnSession(request);
        if (op == "list")     return OnList();
        if (op == "register") return OnRegister(request);
        if (op == "types")    return OnTypes();
        if (op == "health")   return OnHealth();
        return ErrorResponse("bad_request", "Unknown op: " + op);

    } catch (const core::SandboxError& e) {
        return ErrorResponse(e.Kind(), e.what());
    } catch (const json::exception& e) {
        return ErrorResponse("bad_request", e.what());
    } catch (const std::exception& e) {
        spdlog::error("Control request '{}' failed: {}", op, e.what());
        return ErrorResponse("internal", e.what());
    }
}

json ControlServer::OnAcquire(const json& request) {
    const std::string type = request.at("type").get<std::string>();

    std::optional<std::chrono::seconds> timeout;
    auto it = request.find("timeout");
    if (it != request.end() && !it->is_null()) {
        long long seconds = it->get<long long>();
        if (seconds < 0) {
            return ErrorResponse("bad_request", "timeout must not be negative");
        }
        timeout = std::chrono::seconds(seconds);
    }

    const std::string session = request.value("session", "");

    core::SandboxHandle handle = controller_.Acquire(type, timeout, session);
    return json{{"ok", true}, {"sandbox", core::HandleToJson(handle)}};
}

json ControlServer::OnRelease(const json& request) {
    const std::string id = request.at("id").get<std::string>();

    std::optional<bool> recycle;
    auto it = request.find("recycle");
    if (it != request.end() && !it->is_null()) {
        recycle = it->get<bool>();
    }

    controller_.Release(id, recycle);
    return json{{"ok", true}};
}

json ControlServer::OnInspect(const json& request) {
    auto status = controller_.Inspect(request.at("id").get<std::string>());
    return json{{"ok", true}, {"status", core::StatusToJson(status)}};
}

json ControlServer::OnTouch(const json& request) {
    controller_.Touch(request.at("id").get<std::string>());
    return json{{"ok", true}};
}

json ControlServer::OnStart(const json& request) {
    bool running = controller_.StartSandbox(request.at("id").get<std::string>());
    return json{{"ok", running}, {"running", running}};
}

json ControlServer::OnStop(const json& request) {
    bool stopped = controller_.StopSandbox(request.at("id").get<std::string>());
    return json{{"ok", stopped}, {"running", !stopped}};
}

json ControlServer::OnSessions() {
    return json{{"ok", true}, {"sessions", controller_.Sessions()}};
}

json ControlServer::OnSession(const json& request) {
    const std::string session = request.at("session").get<std::string>();
    return json{{"ok", true}, {"session", session}, {"sandboxes", controller_.SessionSandboxes(session)}};
}

json ControlServer::OnList() {
    json sandboxes = json::array();
    for (const auto& status : controller_.List()) {
        sandboxes.push_back(core::StatusToJson(status));
    }
    return json{{"ok", true}, {"sandboxes", sandboxes}};
}

json ControlServer::OnRegister(const json& request) {
    core::SandboxTypeConfig type_config = core::TypeConfigFromJson(request.at("config"));
    const std::string type = type_config.type;

    if (!controller_.Registry().Register(std::move(type_config))) {
        return ErrorResponse("bad_request", "Invalid sandbox type registration");
    }
    return json{{"ok", true}, {"type", type}};
}

json ControlServer::OnTypes() {
    json types = json::array();
    for (const auto& type_config : controller_.Registry().List()) {
        json entry = core::TypeConfigToJson(type_config);
        entry["pool_size"] = controller_.Pool().TargetSize(type_config.type);
        types.push_back(std::move(entry));
    }
    return json{{"ok", true}, {"types", types}};
}

json ControlServer::OnHealth() {
    json pools = json::object();
    for (const auto& type : controller_.Config().default_sandbox_types) {
        pools[type] = {
            {"warm", controller_.Pool().WarmCount(type)},
            {"pending", controller_.Pool().PendingCount(type)},
            {"target", controller_.Pool().TargetSize(type)}
        };
    }

    return json{
        {"ok", true},
        {"owner", controller_.Owner()},
        {"backend", controller_.Driver().Name()},
        {"backend_available", controller_.Driver().IsAvailable()},
        {"shutting_down", controller_.IsShutdown()},
        {"pools", pools}
    };
}

} // namespace server
} // namespace sandpool
