/**
 * remoteops glob matching
 *
 * Brace alternation ({a,b}, nested) is expanded first; each alternative is
 * then matched with POSIX fnmatch semantics (*, ?, [...]). A name starting
 * with '.' only matches a pattern that starts with an explicit '.'. A "**"
 * segment spans any number of directory levels.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <system_error>

namespace remoteops::core::glob {

// Expand brace alternation. Patterns without alternation come back as-is.
std::vector<std::string> expand_braces(const std::string& pattern);

// Match a single name (no separators) against a pattern
bool match_name(const std::string& pattern, const std::string& name);

// Patterns must stay relative: no leading '/', no ".." segment
bool is_valid_pattern(const std::string& pattern);

// Lazily enumerates absolute paths under `root` whose path relative to
// `root` matches `pattern`. Matching directories are yielded but not
// descended into. Directory symlinks are not followed.
class GlobWalker {
public:
    GlobWalker(const std::filesystem::path& root, const std::string& pattern);

    // Non-copyable
    GlobWalker(const GlobWalker&) = delete;
    GlobWalker& operator=(const GlobWalker&) = delete;

    // Next match, or nullopt once the walk is over
    std::optional<std::filesystem::path> next();

    // Error that ended the walk early (empty if none). A missing root is
    // reported here as no_such_file_or_directory.
    const std::error_code& error() const { return error_; }

private:
    std::filesystem::path root_;
    std::vector<std::vector<std::string>> alternatives_;  // Split pattern segments
    bool has_globstar_ = false;
    size_t max_segments_ = 0;

    std::filesystem::recursive_directory_iterator it_;
    bool done_ = false;
    std::error_code error_;

    bool matches(const std::vector<std::string>& segments) const;
};

} // namespace remoteops::core::glob
