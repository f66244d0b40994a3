#pragma once
#include <string>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace remoteops::util {

// Install the colored stdout logger as spdlog's default
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

void set_log_level(spdlog::level::level_enum level);

// Parse a level name ("debug", "info", ...). Unknown names map to info.
spdlog::level::level_enum parse_log_level(const std::string& name);

// Shorten a client address for log lines: IPv4 keeps three octets,
// IPv6 keeps the first three groups. "::ffff:" mapped addresses are unwrapped.
std::string truncate_ip(const std::string& ip);

// "12.5 KiB" / "3.25 MiB" (MiB once the size exceeds half a MiB)
std::string format_size(uint64_t bytes);

} // namespace remoteops::util
