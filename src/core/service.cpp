#include "core/service.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <thread>

namespace remoteops::core {

// Global service pointer for signal handling
static Service* g_service = nullptr;

static void signal_handler(int /*signum*/) {
    if (g_service) {
        g_service->shutdown();
    }
}

Service::Service(ServiceConfig config, std::unique_ptr<runtime::Fetcher> fetcher)
    : config_(std::move(config))
    , authority_(config_.tokens)
    , policy_(config_.allowed_dirs, config_.allowed_file_patterns)
    , fetcher_(std::move(fetcher))
    , download_(config_, authority_, policy_, *fetcher_, tasks_)
    , delete_(authority_, policy_)
    , run_(config_, authority_, policy_)
    , gateway_(config_, authority_, download_, delete_, run_)
    , server_(std::make_unique<http::HttpServer>(config_.host, config_.port,
                                                 config_.max_body_bytes)) {}

Service::~Service() {
    if (g_service == this) {
        g_service = nullptr;
    }
    // Stop answering before workers that reference the operations finish
    server_->stop();
    tasks_.wait_idle();
}

bool Service::init() {
    spdlog::info("Initializing remoteops...");

    gateway_.register_routes(server_->server());

    if (!server_->start()) {
        spdlog::error("Failed to initialize HTTP server");
        return false;
    }

    // Set up signal handlers
    g_service = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    spdlog::info("Tokens: {}", authority_.size());
    for (const auto& dir : policy_.allowed_dirs()) {
        spdlog::info("Allowed directory: {}", dir);
    }
    for (const auto& pattern : policy_.allowed_file_patterns()) {
        spdlog::info("Allowed file pattern: {}", pattern);
    }
    spdlog::info("Request logging: {}", config_.log_requests ? "enabled" : "disabled");
    spdlog::info("Created-file logging: {}", config_.log_created_files ? "enabled" : "disabled");

    running_ = true;
    return true;
}

void Service::run() {
    spdlog::info("Listening on port {}", server_->port());

    // The listener runs on its own thread; signals only flip running_
    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Shutting down...");
    server_->stop();

    // Background downloads keep running after their request was answered
    tasks_.wait_idle();
    spdlog::info("Stopped");
}

void Service::shutdown() {
    running_ = false;
}

} // namespace remoteops::core
