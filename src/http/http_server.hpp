/**
 * remoteops HTTP server
 *
 * Owns the httplib::Server and the thread it listens on. Routes are
 * registered by the caller through server() before start(). httplib runs
 * each request on its own worker pool, rejects bodies above the configured
 * limit with 413 and answers unknown routes with an empty 404.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <httplib.h>

namespace remoteops::http {

class HttpServer {
public:
    HttpServer(std::string host, uint16_t port, size_t max_body_bytes);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    httplib::Server& server() { return server_; }

    // Bind (port 0 picks a free port) and start the listener thread.
    // Returns once the server accepts connections, or false on failure.
    bool start();

    // Stop listening and join the listener thread
    void stop();

    // Port actually bound
    uint16_t port() const { return bound_port_; }

private:
    std::string host_;
    uint16_t port_;
    uint16_t bound_port_ = 0;
    httplib::Server server_;
    std::thread listener_;
};

} // namespace remoteops::http
