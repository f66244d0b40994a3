/**
 * Download operation
 *
 * Fetches a URL into an allowed path. The caller gets an answer after at
 * most `download_timeout`: if the fetch is still running by then the request
 * is answered with success and the work finishes in the background. A
 * one-shot gate makes sure only one of the two sides answers.
 */
#pragma once
#include <string>
#include <optional>
#include <system_error>
#include "core/config.hpp"
#include "core/outcome.hpp"
#include "core/path_policy.hpp"
#include "core/token_authority.hpp"
#include "runtime/fetcher.hpp"
#include "runtime/task_tracker.hpp"

namespace remoteops::core {

struct DownloadRequest {
    std::optional<std::string> url;
    std::optional<std::string> path;
    std::string client_ip;
};

class DownloadOperation {
public:
    DownloadOperation(const ServiceConfig& config,
                      const TokenAuthority& authority,
                      const PathPolicy& policy,
                      runtime::Fetcher& fetcher,
                      runtime::TaskTracker& tasks);

    // Non-copyable
    DownloadOperation(const DownloadOperation&) = delete;
    DownloadOperation& operator=(const DownloadOperation&) = delete;

    Outcome download(const std::optional<std::string>& token, const DownloadRequest& request);

    // Create the parent directory of `path` (and its ancestors) if missing
    static bool ensure_parent_directory(const std::string& path, std::error_code& ec);

private:
    const ServiceConfig& config_;
    const TokenAuthority& authority_;
    const PathPolicy& policy_;
    runtime::Fetcher& fetcher_;
    runtime::TaskTracker& tasks_;

    // Fetch, create directories, write. Runs on a tracked worker thread.
    Outcome fetch_and_write(const std::string& url, const std::string& path,
                            const std::string& client_ip);
};

} // namespace remoteops::core
