/**
 * @file main.cpp
 * @brief sandpool - Sandbox manager command-line interface
 *
 * Subcommands:
 * - `serve`: run the manager and its control socket (optionally pre-forked)
 * - `types`: print the sandbox type registry
 * - `check`: validate configuration and check the backend and state store
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "sandpool/backends/backend_driver.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/core/lifecycle_controller.hpp"
#include "sandpool/core/manager_config.hpp"
#include "sandpool/core/sandbox_registry.hpp"
#include "sandpool/server/control_server.hpp"
#include "sandpool/server/worker_supervisor.hpp"
#include "sandpool/state/file_state_store.hpp"
#include "sandpool/state/memory_state_store.hpp"
#include "sandpool/storage/data_storage.hpp"

#include <iomanip>
#include <iostream>

#include <unistd.h>

using json = nlohmann::json;
using namespace sandpool;

/*******************************************************************************
 * Setup Helpers
 ******************************************************************************/

void ConfigureLogging(const core::ManagerConfig& config, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, 10 * 1024 * 1024, 5));
    }

    auto logger = std::make_shared<spdlog::logger>("sandpool", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (verbose || config.debug) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    }
    spdlog::set_pattern("[%H:%M:%S] [%P] [%^%l%$] %v");
}

core::ManagerConfig LoadConfig(const std::string& env_file) {
    if (env_file.empty()) {
        return core::ManagerConfig::LoadFromEnvironment();
    }
    return core::ManagerConfig::LoadFromFile(env_file);
}

std::shared_ptr<state::StateStore> CreateStateStore(const core::ManagerConfig& config) {
    if (config.state_store_enabled) {
        return std::make_shared<state::FileStateStore>(config.state_store_path);
    }
    return std::make_shared<state::MemoryStateStore>();
}

std::shared_ptr<core::SandboxRegistry> CreateRegistry(const core::ManagerConfig& config) {
    auto registry = std::make_shared<core::SandboxRegistry>();
    registry->RegisterBuiltins(config);
    return registry;
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

/**
 * @brief Body of one serving process
 * @param listen_fd Inherited listener, or -1 to bind CONTROL_SOCKET here
 */
int RunWorker(const core::ManagerConfig& config, int listen_fd, int worker_index) {
    core::LifecycleController controller(config,
                                         CreateRegistry(config),
                                         backends::CreateBackendDriver(config),
                                         CreateStateStore(config),
                                         storage::CreateDataStorage(config));

    server::ControlServer control(controller, config.bearer_token);
    if (listen_fd >= 0) {
        control.Adopt(listen_fd);
    } else if (!control.Listen(config.control_socket)) {
        return 1;
    }

    controller.Start();
    spdlog::info("Worker {} serving", worker_index);

    control.Run(server::StopFlag());

    spdlog::info("Worker {} stopping", worker_index);
    control.Stop();
    controller.Shutdown();
    return 0;
}

int Serve(core::ManagerConfig config) {
    config.Validate();

    const int workers = config.EffectiveWorkers();

    spdlog::info("Starting sandpool ({} backend, {} worker(s), pooled types: {})",
                 config.container_deployment, workers, config.default_sandbox_types.size());

    if (workers == 1) {
        return RunWorker(config, -1, 0);
    }

    int listen_fd = server::ControlServer::BindUnixSocket(config.control_socket);
    if (listen_fd < 0) {
        return 1;
    }

    server::WorkerSupervisor supervisor(workers, [&config](int fd, int index) {
        return RunWorker(config, fd, index);
    });
    int code = supervisor.Run(listen_fd);

    close(listen_fd);
    unlink(config.control_socket.c_str());
    spdlog::info("All workers stopped");
    return code;
}

int PrintTypes(const core::ManagerConfig& config, bool as_json) {
    auto registry = CreateRegistry(config);

    if (as_json) {
        json types = json::array();
        for (const auto& type_config : registry->List()) {
            types.push_back(core::TypeConfigToJson(type_config));
        }
        std::cout << types.dump(2) << std::endl;
        return 0;
    }

    std::cout << std::left << std::setw(12) << "TYPE"
              << std::setw(8) << "POOL"
              << std::setw(10) << "SECURITY"
              << "IMAGE" << "\n";
    for (const auto& type_config : registry->List()) {
        std::cout << std::left << std::setw(12) << type_config.type
                  << std::setw(8) << config.PoolSizeFor(type_config.type)
                  << std::setw(10) << core::SecurityLevelToString(type_config.security_level)
                  << type_config.image << "\n";
    }
    return 0;
}

int Check(const core::ManagerConfig& config) {
    bool healthy = true;

    try {
        config.Validate();
        spdlog::info("[OK] Configuration valid");
    } catch (const core::ConfigError& e) {
        spdlog::error("[FAIL] {}", e.what());
        healthy = false;
    }

    try {
        auto driver = backends::CreateBackendDriver(config);
        if (driver->IsAvailable()) {
            spdlog::info("[OK] {} backend reachable", driver->Name());
        } else {
            spdlog::error("[FAIL] {} backend not reachable", driver->Name());
            healthy = false;
        }
    } catch (const core::SandboxError& e) {
        spdlog::error("[FAIL] {}", e.what());
        healthy = false;
    }

    try {
        auto store = CreateStateStore(config);
        const std::string key = config.state_namespace + ":check:" + std::to_string(getpid());
        store->Put(key, "ok");
        store->Erase(key);
        spdlog::info("[OK] {} state store writable", store->Name());
    } catch (const core::StateStoreError& e) {
        spdlog::error("[FAIL] State store: {}", e.what());
        healthy = false;
    }

    return healthy ? 0 : 1;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sandpool - pooled sandbox manager"};
    app.require_subcommand(1);

    std::string env_file;
    bool verbose = false;
    app.add_option("-e,--env-file", env_file, "Load settings from a KEY=VALUE file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* serve_cmd = app.add_subcommand("serve", "Run the sandbox manager");
    std::string socket_path;
    int workers = 0;
    int pool_size = -1;
    std::string deployment;
    serve_cmd->add_option("-s,--socket", socket_path, "Control socket path (CONTROL_SOCKET)");
    serve_cmd->add_option("-w,--workers", workers, "Worker processes (WORKERS)")
        ->check(CLI::PositiveNumber);
    serve_cmd->add_option("-p,--pool-size", pool_size, "Warm instances per pooled type (POOL_SIZE)")
        ->check(CLI::NonNegativeNumber);
    serve_cmd->add_option("-d,--deployment", deployment, "Backend: docker or k8s (CONTAINER_DEPLOYMENT)")
        ->check(CLI::IsMember({"docker", "k8s"}));

    auto* types_cmd = app.add_subcommand("types", "List registered sandbox types");
    bool types_json = false;
    types_cmd->add_flag("--json", types_json, "Print as JSON");

    auto* check_cmd = app.add_subcommand("check", "Validate configuration and check the backend");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        core::ManagerConfig config = LoadConfig(env_file);

        if (!socket_path.empty()) config.control_socket = socket_path;
        if (workers > 0) config.workers = workers;
        if (pool_size >= 0) config.pool_size = pool_size;
        if (!deployment.empty()) config.container_deployment = deployment;

        ConfigureLogging(config, verbose);

        if (*serve_cmd) {
            server::InstallSignalHandlers();
            return Serve(config);
        }
        if (*types_cmd) {
            return PrintTypes(config, types_json);
        }
        if (*check_cmd) {
            return Check(config);
        }
        return 1;

    } catch (const core::ConfigError& e) {
        spdlog::error("[ERROR] Configuration: {}", e.what());
        return 2;
    } catch (const core::SandboxError& e) {
        spdlog::error("[ERROR] {} ({})", e.what(), e.Kind());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
