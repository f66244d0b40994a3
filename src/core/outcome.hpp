#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace remoteops::core {

// Failure classes an operation can end in
enum class ErrorKind {
    AUTH,                 // Bad or missing token (opaque 404)
    VALIDATION,           // Missing or malformed field
    POLICY,               // Path or file type not permitted
    NOT_FOUND_TOLERATED,  // Delete target already gone, reported as success
    EXECUTION             // Network, filesystem or subprocess failure
};

inline int status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AUTH:                return 404;
        case ErrorKind::VALIDATION:          return 400;
        case ErrorKind::POLICY:              return 403;
        case ErrorKind::NOT_FOUND_TOLERATED: return 200;
        case ErrorKind::EXECUTION:           return 500;
        default: return 500;
    }
}

// HTTP-level result of an operation. A null body means "send no body".
struct Outcome {
    int status = 200;
    nlohmann::json body;

    bool has_body() const { return !body.is_null(); }
    bool is_success() const { return status >= 200 && status < 300; }

    // {"success": true} plus any extra fields
    static Outcome success(int status = 200, const nlohmann::json& extra = nlohmann::json::object()) {
        Outcome outcome;
        outcome.status = status;
        outcome.body = extra.is_object() ? extra : nlohmann::json::object();
        outcome.body["success"] = true;
        return outcome;
    }

    // {"error": message}, except AUTH which carries nothing
    static Outcome failure(ErrorKind kind, const std::string& message) {
        Outcome outcome;
        outcome.status = status_for(kind);
        if (kind != ErrorKind::AUTH) {
            outcome.body = nlohmann::json::object();
            outcome.body["error"] = message;
        }
        return outcome;
    }

    static Outcome unauthorized() {
        return failure(ErrorKind::AUTH, "");
    }
};

} // namespace remoteops::core
