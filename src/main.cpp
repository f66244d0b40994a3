#include <spdlog/spdlog.h>
#include "core/config.hpp"
#include "core/service.hpp"
#include "util/logger.hpp"

int main() {
    remoteops::util::init_logger();

    remoteops::core::ServiceConfig config;
    try {
        config = remoteops::core::ServiceConfig::from_env();
    } catch (const remoteops::core::ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    remoteops::util::set_log_level(remoteops::util::parse_log_level(config.log_level));

    remoteops::core::Service service(config);

    if (!service.init()) {
        spdlog::error("Failed to initialize service");
        return 1;
    }

    // Blocks until SIGINT/SIGTERM
    service.run();
    return 0;
}
