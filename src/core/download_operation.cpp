#include "core/download_operation.hpp"
#include "util/logger.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <atomic>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>

namespace fs = std::filesystem;

namespace remoteops::core {

namespace {

// Shared between the waiting request and the download task; whoever flips
// `answered` first produces the response.
struct DownloadGate {
    std::atomic<bool> answered{false};
    std::promise<Outcome> promise;
};

} // namespace

DownloadOperation::DownloadOperation(const ServiceConfig& config,
                                     const TokenAuthority& authority,
                                     const PathPolicy& policy,
                                     runtime::Fetcher& fetcher,
                                     runtime::TaskTracker& tasks)
    : config_(config)
    , authority_(authority)
    , policy_(policy)
    , fetcher_(fetcher)
    , tasks_(tasks) {}

Outcome DownloadOperation::download(const std::optional<std::string>& token,
                                    const DownloadRequest& request) {
    if (!authority_.is_authorized(token)) {
        return Outcome::unauthorized();
    }

    if (!request.url || request.url->empty()) {
        return Outcome::failure(ErrorKind::VALIDATION, "URL required");
    }

    PolicyResult decision = policy_.resolve_path(request.path);
    if (!decision.ok()) {
        spdlog::warn("Download to {} denied: {}",
            request.path.value_or("<none>"), policy_error_to_string(decision.error));
        return policy_error_outcome(decision.error);
    }

    auto gate = std::make_shared<DownloadGate>();
    std::future<Outcome> result = gate->promise.get_future();

    std::string url = *request.url;
    std::string path = decision.path;
    std::string client_ip = request.client_ip;

    bool launched = tasks_.launch([this, gate, url, path, client_ip]() {
        Outcome outcome = fetch_and_write(url, path, client_ip);

        if (!gate->answered.exchange(true)) {
            gate->promise.set_value(outcome);
        } else if (!outcome.is_success()) {
            spdlog::error("Background download of '{}' to '{}' failed: {}",
                url, path, outcome.body.value("error", std::string()));
        } else {
            spdlog::debug("Background download of '{}' to '{}' finished", url, path);
        }
    });

    if (!launched) {
        return Outcome::failure(ErrorKind::EXECUTION, "Internal Server Error: could not start download");
    }

    if (result.wait_for(config_.download_timeout) == std::future_status::ready) {
        return result.get();
    }

    if (!gate->answered.exchange(true)) {
        spdlog::info("Download of '{}' still running after {}ms, answering early",
            url, config_.download_timeout.count());
        return Outcome::success(201);
    }

    // The task won the gate between the timeout and the exchange
    return result.get();
}

bool DownloadOperation::ensure_parent_directory(const std::string& path, std::error_code& ec) {
    ec.clear();
    fs::path dir = fs::path(path).parent_path();
    if (dir.empty()) {
        return true;
    }
    fs::create_directories(dir, ec);
    return !ec;
}

Outcome DownloadOperation::fetch_and_write(const std::string& url, const std::string& path,
                                           const std::string& client_ip) {
    runtime::FetchResult fetched = fetcher_.fetch(url);
    if (!fetched.success) {
        spdlog::error("Fetching '{}' failed: {}", url, fetched.error);
        return Outcome::failure(ErrorKind::EXECUTION,
            fmt::format("Internal Server Error: {}", fetched.error));
    }

    std::error_code ec;
    if (!ensure_parent_directory(path, ec)) {
        spdlog::error("Creating directory for '{}' failed: {}", path, ec.message());
        return Outcome::failure(ErrorKind::EXECUTION,
            fmt::format("Internal Server Error: {}", ec.message()));
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        std::string reason = std::error_code(errno, std::generic_category()).message();
        spdlog::error("Opening '{}' for writing failed: {}", path, reason);
        return Outcome::failure(ErrorKind::EXECUTION,
            fmt::format("Internal Server Error: cannot open '{}': {}", path, reason));
    }

    file.write(fetched.body.data(), static_cast<std::streamsize>(fetched.body.size()));
    file.close();
    if (file.fail()) {
        spdlog::error("Writing '{}' failed", path);
        return Outcome::failure(ErrorKind::EXECUTION,
            fmt::format("Internal Server Error: failed to write '{}'", path));
    }

    if (config_.log_created_files) {
        spdlog::info("[{}] Downloaded '{}' from '{}' ({})",
            util::truncate_ip(client_ip), path, url, util::format_size(fetched.body.size()));
    }

    return Outcome::success(201);
}

} // namespace remoteops::core
