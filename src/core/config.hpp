#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <functional>
#include <stdexcept>

namespace remoteops::core {

// Raised when the startup configuration is missing or malformed
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Default early-success deadline for downloads
constexpr std::chrono::milliseconds DEFAULT_DOWNLOAD_TIMEOUT{25000};
constexpr size_t DEFAULT_MAX_BODY_BYTES = 1024 * 1024;
constexpr uint16_t DEFAULT_PORT = 8034;

// Service configuration. Built once at startup and read-only afterwards.
struct ServiceConfig {
    std::string host = "0.0.0.0";
    uint16_t port = DEFAULT_PORT;

    std::vector<std::string> tokens;                 // TOKENS
    std::vector<std::string> allowed_dirs;           // ALLOWED_DIRS
    std::vector<std::string> allowed_file_patterns;  // ALLOWED_FILE_PATTERNS

    bool log_requests = false;                       // LOG_REQUESTS
    bool log_created_files = false;                  // LOG_CREATED_FILES
    std::string log_level = "info";                  // LOG_LEVEL

    std::chrono::milliseconds download_timeout = DEFAULT_DOWNLOAD_TIMEOUT;
    size_t max_body_bytes = DEFAULT_MAX_BODY_BYTES;

    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    // Load from the process environment (after reading .env, if present)
    static ServiceConfig from_env();

    // Load through an arbitrary variable lookup
    static ServiceConfig from_lookup(const Lookup& lookup);

    // Throws ConfigError unless tokens, dirs and patterns are all non-empty
    void validate() const;
};

// Split on any of `delimiters`, trimming entries and dropping empty ones
std::vector<std::string> split_list(const std::string& value, const std::string& delimiters);

// "true"/"1" (any case, surrounding whitespace ignored)
bool parse_flag(const std::string& value);

// Read KEY=VALUE lines into the environment without overriding existing variables.
// Returns false if the file could not be opened.
bool load_env_file(const std::string& path);

} // namespace remoteops::core
