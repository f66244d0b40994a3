#include "core/config.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <climits>
#include <unistd.h>

namespace remoteops::core {

namespace {

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

uint64_t parse_number(const std::string& name, const std::string& value, uint64_t max) {
    std::string trimmed = trim(value);
    if (trimmed.empty() || !std::all_of(trimmed.begin(), trimmed.end(),
                                        [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError(fmt::format("{} must be a number, got '{}'", name, value));
    }

    uint64_t number = 0;
    try {
        number = std::stoull(trimmed);
    } catch (const std::out_of_range&) {
        throw ConfigError(fmt::format("{} is out of range: {}", name, value));
    }
    if (number > max) {
        throw ConfigError(fmt::format("{} is out of range: {}", name, value));
    }
    return number;
}

// .env next to the working directory or the executable
void load_dotenv() {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths = {
        std::filesystem::current_path() / ".env",
    };

    char exe_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len != -1) {
        exe_path[len] = '\0';
        auto exe_dir = std::filesystem::path(exe_path).parent_path();
        search_paths.push_back(exe_dir / ".env");
        search_paths.push_back(exe_dir.parent_path() / ".env");
    }

    for (const auto& env_path : search_paths) {
        std::error_code ec;
        if (std::filesystem::exists(env_path, ec) && load_env_file(env_path.string())) {
            spdlog::debug("Loaded environment from {}", env_path.string());
            break;
        }
    }
}

} // namespace

std::vector<std::string> split_list(const std::string& value, const std::string& delimiters) {
    std::vector<std::string> items;
    size_t start = 0;

    while (start <= value.size()) {
        size_t end = value.find_first_of(delimiters, start);
        if (end == std::string::npos) end = value.size();

        std::string item = trim(value.substr(start, end - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = end + 1;
    }

    return items;
}

bool parse_flag(const std::string& value) {
    std::string lower = trim(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "true" || lower == "1";
}

bool load_env_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip blanks and comments
        if (line.empty() || line[0] == '#') continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (key.rfind("export ", 0) == 0) {
            key = trim(key.substr(7));
        }

        // Remove surrounding quotes
        if (value.size() >= 2) {
            if ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\'')) {
                value = value.substr(1, value.size() - 2);
            }
        }

        // Only set if not already in environment
        if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }

    return true;
}

ServiceConfig ServiceConfig::from_env() {
    load_dotenv();

    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value) {
            return std::string(value);
        }
        return std::nullopt;
    });
}

ServiceConfig ServiceConfig::from_lookup(const Lookup& lookup) {
    ServiceConfig config;

    // Brace alternation in patterns uses commas, so only tokens split on ','
    if (auto v = lookup("TOKENS")) config.tokens = split_list(*v, ",;");
    if (auto v = lookup("ALLOWED_DIRS")) config.allowed_dirs = split_list(*v, ";");
    if (auto v = lookup("ALLOWED_FILE_PATTERNS")) config.allowed_file_patterns = split_list(*v, ";");

    if (auto v = lookup("HOST")) {
        std::string host = trim(*v);
        if (!host.empty()) config.host = host;
    }
    if (auto v = lookup("PORT")) {
        if (!trim(*v).empty()) {
            config.port = static_cast<uint16_t>(parse_number("PORT", *v, 65535));
        }
    }

    if (auto v = lookup("LOG_REQUESTS")) config.log_requests = parse_flag(*v);
    if (auto v = lookup("LOG_CREATED_FILES")) config.log_created_files = parse_flag(*v);
    if (auto v = lookup("LOG_LEVEL")) {
        std::string level = trim(*v);
        if (!level.empty()) config.log_level = level;
    }

    if (auto v = lookup("DOWNLOAD_TIMEOUT_MS")) {
        if (!trim(*v).empty()) {
            config.download_timeout = std::chrono::milliseconds(
                parse_number("DOWNLOAD_TIMEOUT_MS", *v, 24ULL * 60 * 60 * 1000));
        }
    }
    if (auto v = lookup("MAX_BODY_BYTES")) {
        if (!trim(*v).empty()) {
            config.max_body_bytes = static_cast<size_t>(
                parse_number("MAX_BODY_BYTES", *v, 1024ULL * 1024 * 1024));
        }
    }

    config.validate();
    return config;
}

void ServiceConfig::validate() const {
    std::vector<std::string> missing;
    if (tokens.empty()) missing.push_back("TOKENS");
    if (allowed_dirs.empty()) missing.push_back("ALLOWED_DIRS");
    if (allowed_file_patterns.empty()) missing.push_back("ALLOWED_FILE_PATTERNS");

    if (!missing.empty()) {
        std::string joined;
        for (size_t i = 0; i < missing.size(); i++) {
            if (i > 0) joined += ", ";
            joined += missing[i];
        }
        throw ConfigError(fmt::format("Missing required environment variable{}: {}",
                                      missing.size() == 1 ? "" : "s", joined));
    }

    if (port == 0) {
        throw ConfigError("PORT must not be 0");
    }
}

} // namespace remoteops::core
