#pragma once
#include <string>
#include <optional>
#include <system_error>
#include "core/outcome.hpp"
#include "core/path_policy.hpp"
#include "core/token_authority.hpp"

namespace remoteops::core {

struct DeleteRequest {
    std::optional<std::string> path;
    std::optional<std::string> pattern;
    bool pattern_malformed = false;   // Pattern was supplied but is not a string
};

// Removes a path, or every glob match under it. Deleting something that is
// already gone succeeds.
class DeleteOperation {
public:
    DeleteOperation(const TokenAuthority& authority, const PathPolicy& policy);

    Outcome remove(const std::optional<std::string>& token, const DeleteRequest& request);

    // NOT_FOUND_TOLERATED for "no such file", EXECUTION for everything else
    static ErrorKind classify_removal_error(const std::error_code& ec);

private:
    const TokenAuthority& authority_;
    const PathPolicy& policy_;

    Outcome remove_single(const std::string& path);
    Outcome remove_matching(const std::string& root, const std::string& pattern);
};

} // namespace remoteops::core
