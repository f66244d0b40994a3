#include "http/request_gateway.hpp"
#include "util/logger.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace remoteops::http {

namespace {

const char* FORM_CONTENT_TYPE = "application/x-www-form-urlencoded";

std::optional<std::string> query_token(const httplib::Request& request) {
    if (!request.has_param("token")) {
        return std::nullopt;
    }
    return request.get_param_value("token");
}

} // namespace

RequestGateway::RequestGateway(const core::ServiceConfig& config,
                               const core::TokenAuthority& authority,
                               core::DownloadOperation& download,
                               core::DeleteOperation& remove,
                               core::RunOperation& run)
    : config_(config)
    , authority_(authority)
    , download_(download)
    , delete_(remove)
    , run_(run) {}

void RequestGateway::register_routes(httplib::Server& server) {
    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        handle(req, res);
    };
    server.Post("/download", handler);
    server.Post("/run", handler);
    server.Delete("/delete", handler);
}

void RequestGateway::handle(const httplib::Request& request, httplib::Response& response) {
    std::string ip = client_ip(request);
    core::Outcome outcome = route(request, ip);

    if (config_.log_requests) {
        spdlog::info("[{}] {} {} -> {}", util::truncate_ip(ip), request.method,
            request.path, outcome.status);
    }

    write_outcome(outcome, response);
}

core::Outcome RequestGateway::route(const httplib::Request& request, const std::string& ip) {
    bool is_download = request.method == "POST" && request.path == "/download";
    bool is_run = request.method == "POST" && request.path == "/run";
    bool is_delete = request.method == "DELETE" && request.path == "/delete";

    if (!is_download && !is_run && !is_delete) {
        return core::Outcome::unauthorized();
    }

    std::optional<std::string> token = query_token(request);

    auto body = parse_body(request);
    if (!body) {
        // Unauthenticated callers learn nothing, not even that the body was bad
        if (!authority_.is_authorized(token)) {
            return core::Outcome::unauthorized();
        }
        return core::Outcome::failure(core::ErrorKind::VALIDATION, "Invalid request body");
    }

    if (is_download) {
        core::DownloadRequest req;
        req.url = string_field(*body, "url");
        req.path = string_field(*body, "path");
        req.client_ip = ip;
        return download_.download(token, req);
    }

    if (is_run) {
        core::RunRequest req;
        req.path = string_field(*body, "path");
        req.client_ip = ip;
        return run_.run(token, req);
    }

    core::DeleteRequest req;
    req.path = string_field(*body, "path");
    if (body->contains("pattern") && !(*body)["pattern"].is_null()) {
        req.pattern = string_field(*body, "pattern");
        req.pattern_malformed = !req.pattern.has_value();
    }
    return delete_.remove(token, req);
}

std::string RequestGateway::client_ip(const httplib::Request& request) {
    std::string forwarded = request.get_header_value("X-Forwarded-For");
    std::string first = forwarded.substr(0, forwarded.find(','));
    size_t start = first.find_first_not_of(" \t");
    if (start != std::string::npos) {
        size_t end = first.find_last_not_of(" \t");
        return first.substr(start, end - start + 1);
    }
    return request.remote_addr;
}

std::optional<json> RequestGateway::parse_body(const httplib::Request& request) {
    std::string content_type = request.get_header_value("Content-Type");
    std::transform(content_type.begin(), content_type.end(), content_type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (content_type.rfind(FORM_CONTENT_TYPE, 0) == 0) {
        // httplib has already decoded form fields into the parameter map
        json form = json::object();
        for (const auto& [key, value] : request.params) {
            if (key != "token" && !form.contains(key)) {
                form[key] = value;
            }
        }
        return form;
    }

    if (request.body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return json::object();
    }

    try {
        json parsed = json::parse(request.body);
        if (!parsed.is_object()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const json::parse_error& e) {
        spdlog::debug("Rejecting request body: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> RequestGateway::string_field(const json& body, const char* name) {
    auto it = body.find(name);
    if (it == body.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

void RequestGateway::write_outcome(const core::Outcome& outcome, httplib::Response& response) {
    response.status = outcome.status;
    if (!outcome.has_body()) {
        return;
    }
    // Script output is not guaranteed to be UTF-8
    response.set_content(outcome.body.dump(-1, ' ', false, json::error_handler_t::replace),
                         "application/json; charset=utf-8");
}

} // namespace remoteops::http
