#pragma once
#include <string>
#include <vector>
#include <optional>
#include "core/outcome.hpp"

namespace remoteops::core {

enum class PolicyError {
    NONE,
    MISSING_PATH,      // No usable path supplied
    PATTERN_REJECTED,  // Filename has an extension that matches no allowed pattern
    PATH_REJECTED      // Outside every allowed directory
};

const char* policy_error_to_string(PolicyError error);

// Outcome a request ends in when the policy refuses its path
Outcome policy_error_outcome(PolicyError error);

// Decision for one caller path
struct PolicyResult {
    PolicyError error = PolicyError::NONE;
    std::string path;            // Caller's path, as supplied
    std::string canonical_path;  // Absolute normalized form used for containment

    bool ok() const { return error == PolicyError::NONE; }
};

// Decides which filesystem paths requests may touch. Holds no mutable state.
class PathPolicy {
public:
    PathPolicy(std::vector<std::string> allowed_dirs,
               std::vector<std::string> allowed_file_patterns);

    // Full check: presence, filename pattern, directory containment
    PolicyResult resolve_path(const std::optional<std::string>& raw_path) const;

    // True when the filename has no '.' or matches an allowed pattern
    bool matches_file_patterns(const std::string& path) const;

    const std::vector<std::string>& allowed_dirs() const { return allowed_dirs_; }
    const std::vector<std::string>& allowed_file_patterns() const { return allowed_file_patterns_; }

    // Last path segment with trailing separators ignored ("a/b.git/" -> "b.git").
    // "." and ".." are returned as-is.
    static std::string final_component(const std::string& path);

    // Absolute, normalized path with symlinks resolved for the part that exists
    static std::string canonicalize(const std::string& path);

    // Containment test on canonical paths: equal, or a descendant reached
    // without "..", a root separator or a drive-letter segment
    static bool is_contained_path(const std::string& canonical_path,
                                  const std::string& canonical_parent);

private:
    const std::vector<std::string> allowed_dirs_;
    const std::vector<std::string> allowed_file_patterns_;
};

} // namespace remoteops::core
