#include "core/path_policy.hpp"
#include "core/glob.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace remoteops::core {

const char* policy_error_to_string(PolicyError error) {
    switch (error) {
        case PolicyError::NONE:             return "NONE";
        case PolicyError::MISSING_PATH:     return "MISSING_PATH";
        case PolicyError::PATTERN_REJECTED: return "PATTERN_REJECTED";
        case PolicyError::PATH_REJECTED:    return "PATH_REJECTED";
        default: return "UNKNOWN";
    }
}

Outcome policy_error_outcome(PolicyError error) {
    switch (error) {
        case PolicyError::MISSING_PATH:
            return Outcome::failure(ErrorKind::VALIDATION, "Path required");
        case PolicyError::PATTERN_REJECTED:
            return Outcome::failure(ErrorKind::POLICY, "File type not allowed");
        case PolicyError::PATH_REJECTED:
            return Outcome::failure(ErrorKind::POLICY, "Path not allowed");
        default:
            return Outcome::failure(ErrorKind::EXECUTION, "Unexpected policy state");
    }
}

PathPolicy::PathPolicy(std::vector<std::string> allowed_dirs,
                       std::vector<std::string> allowed_file_patterns)
    : allowed_dirs_(std::move(allowed_dirs))
    , allowed_file_patterns_(std::move(allowed_file_patterns)) {}

PolicyResult PathPolicy::resolve_path(const std::optional<std::string>& raw_path) const {
    PolicyResult result;

    if (!raw_path || raw_path->empty()) {
        result.error = PolicyError::MISSING_PATH;
        return result;
    }

    result.path = *raw_path;

    if (!matches_file_patterns(*raw_path)) {
        spdlog::debug("Path {} rejected: filename matches no allowed pattern", *raw_path);
        result.error = PolicyError::PATTERN_REJECTED;
        return result;
    }

    result.canonical_path = canonicalize(*raw_path);

    for (const auto& dir : allowed_dirs_) {
        if (is_contained_path(result.canonical_path, canonicalize(dir))) {
            return result;
        }
    }

    spdlog::debug("Path {} ({}) rejected: outside allowed directories",
        *raw_path, result.canonical_path);
    result.error = PolicyError::PATH_REJECTED;
    return result;
}

std::string PathPolicy::final_component(const std::string& path) {
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos) {
        return "";
    }
    size_t slash = path.find_last_of('/', end);
    size_t start = slash == std::string::npos ? 0 : slash + 1;
    return path.substr(start, end - start + 1);
}

bool PathPolicy::matches_file_patterns(const std::string& path) const {
    // "dir/x.git/" names x.git just like "dir/x.git"
    std::string filename = final_component(path);

    // Names without an extension-like part are not filtered
    if (filename.find('.') == std::string::npos) {
        return true;
    }

    for (const auto& pattern : allowed_file_patterns_) {
        if (glob::match_name(pattern, filename)) {
            return true;
        }
    }
    return false;
}

std::string PathPolicy::canonicalize(const std::string& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = fs::path(path);
    }

    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec) {
        // Unreadable components: fall back to lexical normalization
        canonical = absolute.lexically_normal();
    }

    if (!canonical.has_filename() && canonical.has_relative_path()) {
        canonical = canonical.parent_path();  // Drop trailing separator
    }
    return canonical.string();
}

bool PathPolicy::is_contained_path(const std::string& canonical_path,
                                   const std::string& canonical_parent) {
    if (canonical_path == canonical_parent) {
        return true;
    }

    fs::path relative = fs::path(canonical_path).lexically_relative(canonical_parent);
    if (relative.empty() || relative == ".") {
        return false;
    }

    std::string rel = relative.string();
    if (rel[0] == '/') {
        return false;
    }

    for (const auto& part : relative) {
        std::string segment = part.string();
        if (segment == "..") {
            return false;
        }
        // Drive-letter segments ("C:") indicate a cross-root escape
        if (segment.size() >= 2 && std::isalpha(static_cast<unsigned char>(segment[0])) &&
            segment[1] == ':') {
            return false;
        }
    }

    return true;
}

} // namespace remoteops::core
