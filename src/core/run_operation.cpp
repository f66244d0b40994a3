#include "core/run_operation.hpp"
#include "runtime/process_runner.hpp"
#include "util/logger.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace remoteops::core {

RunOperation::RunOperation(const ServiceConfig& config,
                           const TokenAuthority& authority,
                           const PathPolicy& policy)
    : config_(config)
    , authority_(authority)
    , policy_(policy) {}

bool RunOperation::has_runnable_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(RUNNABLE_EXTENSIONS.begin(), RUNNABLE_EXTENSIONS.end(), ext)
        != RUNNABLE_EXTENSIONS.end();
}

Outcome RunOperation::run(const std::optional<std::string>& token, const RunRequest& request) {
    if (!authority_.is_authorized(token)) {
        return Outcome::unauthorized();
    }

    PolicyResult decision = policy_.resolve_path(request.path);
    if (!decision.ok()) {
        spdlog::warn("Run of {} denied: {}",
            request.path.value_or("<none>"), policy_error_to_string(decision.error));
        return policy_error_outcome(decision.error);
    }

    if (!has_runnable_extension(decision.path)) {
        return Outcome::failure(ErrorKind::VALIDATION, "Wrong file type");
    }

    spdlog::debug("Executing {}", decision.path);
    runtime::ProcessResult proc = runtime::ProcessRunner::run(decision.path);

    if (!proc.spawned) {
        spdlog::error("Starting '{}' failed: {}", decision.path, proc.error);
        return Outcome::failure(ErrorKind::EXECUTION, proc.error);
    }

    if (!proc.success()) {
        std::string status = proc.term_signal != 0
            ? fmt::format("killed by signal {}", proc.term_signal)
            : fmt::format("exit code {}", proc.exit_code);
        std::string message = fmt::format("Command failed: {} ({})", decision.path, status);
        if (!proc.stderr_data.empty()) {
            message += "\n" + proc.stderr_data;
        }
        spdlog::error("'{}' failed ({})", decision.path, status);
        return Outcome::failure(ErrorKind::EXECUTION, message);
    }

    if (config_.log_requests) {
        spdlog::info("[{}] Ran '{}'", util::truncate_ip(request.client_ip), decision.path);
    }

    nlohmann::json output;
    output["stdout"] = proc.stdout_data;
    output["stderr"] = proc.stderr_data;
    return Outcome::success(200, output);
}

} // namespace remoteops::core
