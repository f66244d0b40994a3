#include "runtime/fetcher.hpp"
#include "runtime/process_runner.hpp"
#include <spdlog/spdlog.h>

namespace remoteops::runtime {

CurlFetcher::CurlFetcher(std::string curl_path)
    : curl_path_(std::move(curl_path)) {}

FetchResult CurlFetcher::fetch(const std::string& url) {
    FetchResult result;

    // -f: HTTP errors are failures, -sS: quiet but keep error text, -L: follow redirects.
    // "--" keeps a URL starting with '-' from being read as an option.
    std::vector<std::string> args = {
        "-fsSL",
        "--proto", "=http,https",
        "--",
        url
    };

    spdlog::debug("Fetching {}", url);
    ProcessResult proc = ProcessRunner::run_tool(curl_path_, args);

    if (!proc.spawned) {
        result.error = proc.error.empty() ? "failed to start curl" : proc.error;
        return result;
    }

    if (!proc.success()) {
        std::string detail = proc.stderr_data;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
            detail.pop_back();
        }
        if (detail.empty()) {
            detail = "curl exited with code " + std::to_string(proc.exit_code);
        }
        result.error = "fetch failed: " + detail;
        return result;
    }

    result.success = true;
    result.body = std::move(proc.stdout_data);
    return result;
}

std::unique_ptr<Fetcher> make_default_fetcher() {
    return std::make_unique<CurlFetcher>();
}

} // namespace remoteops::runtime
