#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace remoteops::util {

void init_logger(spdlog::level::level_enum level) {
    auto console = spdlog::get("remoteops");
    if (!console) {
        console = spdlog::stdout_color_mt("remoteops");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::string truncate_ip(const std::string& ip) {
    std::string addr = ip;

    // IPv4-mapped IPv6 (what dual-stack sockets report)
    const std::string mapped_prefix = "::ffff:";
    if (addr.rfind(mapped_prefix, 0) == 0 && addr.find('.') != std::string::npos) {
        addr = addr.substr(mapped_prefix.size());
    }

    if (addr.find(':') == std::string::npos) {
        size_t last_dot = addr.rfind('.');
        if (last_dot == std::string::npos) {
            return addr;
        }
        return addr.substr(0, last_dot) + ".x";
    }

    // IPv6: keep the first three groups
    size_t pos = 0;
    for (int groups = 0; groups < 3; groups++) {
        size_t next = addr.find(':', pos);
        if (next == std::string::npos || next == pos) {
            return addr;
        }
        pos = next + 1;
    }
    return addr.substr(0, pos) + ":";
}

std::string format_size(uint64_t bytes) {
    double kib = std::round(static_cast<double>(bytes) / 1024.0 * 100.0) / 100.0;
    double mib = std::round(static_cast<double>(bytes) / (1024.0 * 1024.0) * 100.0) / 100.0;

    if (mib > 0.5) {
        return fmt::format("{} MiB", mib);
    }
    return fmt::format("{} KiB", kib);
}

} // namespace remoteops::util
