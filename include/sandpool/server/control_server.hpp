/**
 * @file control_server.hpp
 * @brief Newline-delimited JSON control protocol on a Unix domain socket
 *
 * **Protocol**:
 * One JSON object per line in each direction. Every request names an `op`
 * and, when a bearer token is configured, carries it as `token`.
 *
 * ```
 * -> {"op":"acquire","type":"base","timeout":600,"session":"chat-42"}
 * <- {"ok":true,"sandbox":{"id":"...","base_url":"http://localhost:49152",
 *                          "bearer_token":"...","expires_at":1735689600000}}
 * -> {"op":"release","id":"...","recycle":false}
 * <- {"ok":true}
 * -> {"op":"inspect","id":"nope"}
 * <- {"ok":false,"error":"not_found","message":"Sandbox not found: nope"}
 * -> {"op":"session","session":"chat-42"}
 * <- {"ok":true,"session":"chat-42","sandboxes":["..."]}
 * ```
 *
 * Operations: acquire, release, inspect, touch, start, stop, list, sessions,
 * session, register, types, health.
 *
 * @date 2025
 */

#pragma once

#include "sandpool/core/lifecycle_controller.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sandpool {
namespace server {

/**
 * @class ControlServer
 * @brief Serves control requests for one LifecycleController
 *
 * The listening socket is either created by Listen() or inherited from a
 * supervising parent through Adopt(). Each accepted connection is served
 * on its own thread so a slow acquire does not stall other clients.
 *
 * **Usage Example**:
 * @code
 * ControlServer server(controller, config.bearer_token);
 * if (!server.Listen(config.control_socket)) return 1;
 * server.Run(stop_flag);   // returns once stop_flag becomes true
 * @endcode
 */
class ControlServer {
public:
    /**
     * @param controller Manager serving the requests
     * @param bearer_token Required request token (empty = no auth)
     */
    ControlServer(core::LifecycleController& controller, std::string bearer_token = "");
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    /**
     * @brief Create, bind and listen on a Unix socket
     * @return false on failure (logged)
     */
    bool Listen(const std::string& socket_path);

    /**
     * @brief Serve on an already listening descriptor
     *
     * The descriptor is not closed or unlinked by this server.
     */
    void Adopt(int listen_fd);

    /**
     * @brief Accept and serve connections until @p stop becomes true
     */
    void Run(const std::atomic<bool>& stop);

    /**
     * @brief Close the listener and join connection threads
     */
    void Stop();

    /**
     * @brief Process one request
     * @param request Parsed request object
     * @return Response object (always contains "ok")
     */
    nlohmann::json HandleRequest(const nlohmann::json& request);

    /**
     * @brief Process one raw request line
     * @return Serialized response without trailing newline
     */
    std::string HandleLine(const std::string& line);

    /**
     * @brief Create a listening Unix socket
     * @param socket_path Filesystem path (an existing socket file is replaced)
     * @return Descriptor, or -1 on failure (logged)
     */
    static int BindUnixSocket(const std::string& socket_path);

    /// Build an error response
    static nlohmann::json ErrorResponse(const std::string& kind, const std::string& message);

private:
    void ServeClient(int client_fd, const std::atomic<bool>& stop);
    bool Authorized(const nlohmann::json& request) const;

    nlohmann::json OnAcquire(const nlohmann::json& request);
    nlohmann::json OnRelease(const nlohmann::json& request);
    nlohmann::json OnInspect(const nlohmann::json& request);
    nlohmann::json OnTouch(const nlohmann::json& request);
    nlohmann::json OnStart(const nlohmann::json& request);
    nlohmann::json OnStop(const nlohmann::json& request);
    nlohmann::json OnSessions();
    nlohmann::json OnSession(const nlohmann::json& request);
    nlohmann::json OnList();
    nlohmann::json OnRegister(const nlohmann::json& request);
    nlohmann::json OnTypes();
    nlohmann::json OnHealth();

    core::LifecycleController& controller_;
    std::string bearer_token_;

    int listen_fd_{-1};
    bool owns_listener_{false};          ///< Created by Listen(); closed and unlinked on Stop()
    std::string socket_path_;

    struct ClientThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    /// Join connection threads that have finished
    void ReapClients(bool all);

    std::mutex clients_mutex_;           ///< Guards clients_
    std::list<ClientThread> clients_;
};

} // namespace server
} // namespace sandpool
