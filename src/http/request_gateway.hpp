#pragma once
#include <optional>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "core/config.hpp"
#include "core/delete_operation.hpp"
#include "core/download_operation.hpp"
#include "core/outcome.hpp"
#include "core/run_operation.hpp"
#include "core/token_authority.hpp"

namespace remoteops::http {

// Maps HTTP requests onto the operations:
//   POST   /download  {url, path}
//   POST   /run       {path}
//   DELETE /delete    {path, pattern?}
// The access token travels in the "token" query parameter.
class RequestGateway {
public:
    RequestGateway(const core::ServiceConfig& config,
                   const core::TokenAuthority& authority,
                   core::DownloadOperation& download,
                   core::DeleteOperation& remove,
                   core::RunOperation& run);

    // Register the three routes; anything else gets httplib's empty 404
    void register_routes(httplib::Server& server);

    void handle(const httplib::Request& request, httplib::Response& response);

    // First X-Forwarded-For entry, else the socket peer
    static std::string client_ip(const httplib::Request& request);

    // JSON object or urlencoded form body; nullopt if malformed
    static std::optional<nlohmann::json> parse_body(const httplib::Request& request);

    // Field value if present and a string
    static std::optional<std::string> string_field(const nlohmann::json& body, const char* name);

    // Serialize an outcome; a null body leaves the response empty
    static void write_outcome(const core::Outcome& outcome, httplib::Response& response);

private:
    const core::ServiceConfig& config_;
    const core::TokenAuthority& authority_;
    core::DownloadOperation& download_;
    core::DeleteOperation& delete_;
    core::RunOperation& run_;

    core::Outcome route(const httplib::Request& request, const std::string& ip);
};

} // namespace remoteops::http
