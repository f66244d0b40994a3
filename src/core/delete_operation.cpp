#include "core/delete_operation.hpp"
#include "core/glob.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace remoteops::core {

DeleteOperation::DeleteOperation(const TokenAuthority& authority, const PathPolicy& policy)
    : authority_(authority)
    , policy_(policy) {}

Outcome DeleteOperation::remove(const std::optional<std::string>& token,
                                const DeleteRequest& request) {
    if (!authority_.is_authorized(token)) {
        return Outcome::unauthorized();
    }

    PolicyResult decision = policy_.resolve_path(request.path);
    if (!decision.ok()) {
        spdlog::warn("Delete of {} denied: {}",
            request.path.value_or("<none>"), policy_error_to_string(decision.error));
        return policy_error_outcome(decision.error);
    }

    if (request.pattern_malformed) {
        return Outcome::failure(ErrorKind::VALIDATION, "Invalid pattern");
    }

    if (request.pattern && !request.pattern->empty()) {
        if (!glob::is_valid_pattern(*request.pattern)) {
            return Outcome::failure(ErrorKind::VALIDATION, "Invalid pattern");
        }
        return remove_matching(decision.path, *request.pattern);
    }

    return remove_single(decision.path);
}

ErrorKind DeleteOperation::classify_removal_error(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory) {
        return ErrorKind::NOT_FOUND_TOLERATED;
    }
    return ErrorKind::EXECUTION;
}

Outcome DeleteOperation::remove_single(const std::string& path) {
    std::error_code ec;
    auto count = fs::remove_all(path, ec);

    if (ec) {
        if (classify_removal_error(ec) == ErrorKind::NOT_FOUND_TOLERATED) {
            spdlog::debug("Delete of '{}': already gone", path);
            return Outcome::success();
        }
        spdlog::error("Deleting '{}' failed: {}", path, ec.message());
        return Outcome::failure(ErrorKind::EXECUTION,
            fmt::format("Internal Server Error: {}", ec.message()));
    }

    spdlog::info("Deleted '{}' ({} entries)", path, count);
    return Outcome::success();
}

Outcome DeleteOperation::remove_matching(const std::string& root, const std::string& pattern) {
    glob::GlobWalker walker(root, pattern);
    size_t removed = 0;

    while (auto match = walker.next()) {
        std::error_code ec;
        fs::remove_all(*match, ec);

        if (ec) {
            if (classify_removal_error(ec) == ErrorKind::NOT_FOUND_TOLERATED) {
                continue;
            }
            spdlog::error("Deleting '{}' failed: {}", match->string(), ec.message());
            return Outcome::failure(ErrorKind::EXECUTION,
                fmt::format("Internal Server Error: {}", ec.message()));
        }
        removed++;
    }

    const std::error_code& walk_error = walker.error();
    if (walk_error && walk_error != std::errc::no_such_file_or_directory &&
        walk_error != std::errc::not_a_directory) {
        return Outcome::failure(ErrorKind::EXECUTION,
            fmt::format("Internal Server Error: {}", walk_error.message()));
    }

    spdlog::info("Deleted {} match(es) of '{}' under '{}'", removed, pattern, root);
    nlohmann::json extra;
    extra["removed"] = removed;
    return Outcome::success(200, extra);
}

} // namespace remoteops::core
