/**
 * remoteops Service
 *
 * Owns and wires every subsystem:
 * - TokenAuthority + PathPolicy (request gating)
 * - Download / Delete / Run operations
 * - RequestGateway (HTTP routing)
 * - HttpServer (httplib listener thread)
 * - TaskTracker (background downloads)
 */
#pragma once
#include <atomic>
#include <memory>
#include "core/config.hpp"
#include "core/delete_operation.hpp"
#include "core/download_operation.hpp"
#include "core/path_policy.hpp"
#include "core/run_operation.hpp"
#include "core/token_authority.hpp"
#include "http/http_server.hpp"
#include "http/request_gateway.hpp"
#include "runtime/fetcher.hpp"
#include "runtime/task_tracker.hpp"

namespace remoteops::core {

class Service {
public:
    explicit Service(ServiceConfig config,
                     std::unique_ptr<runtime::Fetcher> fetcher = runtime::make_default_fetcher());
    ~Service();

    // Non-copyable
    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Register routes, start the listener and install signal handlers
    bool init();

    // Serve until shutdown() (blocks), then drain outstanding work
    void run();

    // Request shutdown (safe from signal handlers)
    void shutdown();

    const ServiceConfig& config() const { return config_; }
    uint16_t port() const { return server_->port(); }

private:
    const ServiceConfig config_;
    std::atomic<bool> running_{false};

    TokenAuthority authority_;
    PathPolicy policy_;
    std::unique_ptr<runtime::Fetcher> fetcher_;
    runtime::TaskTracker tasks_;

    DownloadOperation download_;
    DeleteOperation delete_;
    RunOperation run_;
    http::RequestGateway gateway_;

    std::unique_ptr<http::HttpServer> server_;
};

} // namespace remoteops::core
