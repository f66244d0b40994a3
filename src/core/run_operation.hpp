#pragma once
#include <string>
#include <vector>
#include <optional>
#include "core/config.hpp"
#include "core/outcome.hpp"
#include "core/path_policy.hpp"
#include "core/token_authority.hpp"

namespace remoteops::core {

// Script extensions RunOperation will execute, whatever the file patterns say
const std::vector<std::string> RUNNABLE_EXTENSIONS = {".bat", ".cmd", ".sh"};

struct RunRequest {
    std::optional<std::string> path;
    std::string client_ip;
};

// Executes an allowed script and relays its output
class RunOperation {
public:
    RunOperation(const ServiceConfig& config,
                 const TokenAuthority& authority,
                 const PathPolicy& policy);

    Outcome run(const std::optional<std::string>& token, const RunRequest& request);

    // Case-insensitive check against RUNNABLE_EXTENSIONS
    static bool has_runnable_extension(const std::string& path);

private:
    const ServiceConfig& config_;
    const TokenAuthority& authority_;
    const PathPolicy& policy_;
};

} // namespace remoteops::core
