#include "http/http_server.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <exception>

namespace remoteops::http {

HttpServer::HttpServer(std::string host, uint16_t port, size_t max_body_bytes)
    : host_(std::move(host))
    , port_(port) {
    server_.set_payload_max_length(max_body_bytes);

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                     std::exception_ptr ep) {
        std::string reason = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            reason = e.what();
        }
        spdlog::error("Handler for {} {} failed: {}", req.method, req.path, reason);

        nlohmann::json body;
        body["error"] = "Internal Server Error: " + reason;
        res.status = 500;
        res.set_content(body.dump(), "application/json; charset=utf-8");
    });
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (port_ == 0) {
        int bound = server_.bind_to_any_port(host_);
        if (bound < 0) {
            spdlog::error("Failed to bind {} on any port", host_);
            return false;
        }
        bound_port_ = static_cast<uint16_t>(bound);
    } else {
        if (!server_.bind_to_port(host_, port_)) {
            spdlog::error("Failed to bind {}:{}", host_, port_);
            return false;
        }
        bound_port_ = port_;
    }

    listener_ = std::thread([this]() {
        if (!server_.listen_after_bind()) {
            spdlog::debug("HTTP listener on port {} exited", bound_port_);
        }
    });

    server_.wait_until_ready();
    if (!server_.is_running()) {
        spdlog::error("HTTP server failed to start listening on {}:{}", host_, bound_port_);
        stop();
        return false;
    }

    spdlog::info("HTTP server listening on {}:{}", host_, bound_port_);
    return true;
}

void HttpServer::stop() {
    if (!listener_.joinable()) {
        return;
    }
    server_.stop();
    listener_.join();
    spdlog::info("HTTP server stopped");
}

} // namespace remoteops::http
