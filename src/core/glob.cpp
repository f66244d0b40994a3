#include "core/glob.hpp"
#include <spdlog/spdlog.h>
#include <fnmatch.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace remoteops::core::glob {

namespace {

// Upper bound on alternatives produced by one pattern
constexpr size_t MAX_EXPANSIONS = 4096;

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        std::string segment = path.substr(start, end - start);
        if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        start = end + 1;
    }
    return segments;
}

bool match_segments(const std::vector<std::string>& pattern, size_t pi,
                    const std::vector<std::string>& segments, size_t si) {
    if (pi == pattern.size()) {
        return si == segments.size();
    }

    if (pattern[pi] == "**") {
        // Zero levels
        if (match_segments(pattern, pi + 1, segments, si)) {
            return true;
        }
        // One more level (hidden directories are not crossed)
        if (si < segments.size() && segments[si][0] != '.') {
            return match_segments(pattern, pi, segments, si + 1);
        }
        return false;
    }

    if (si == segments.size()) {
        return false;
    }

    if (fnmatch(pattern[pi].c_str(), segments[si].c_str(), FNM_PERIOD) != 0) {
        return false;
    }
    return match_segments(pattern, pi + 1, segments, si + 1);
}

// Position of the '}' closing the '{' at `open`, or npos
size_t find_closing_brace(const std::string& pattern, size_t open) {
    int depth = 0;
    for (size_t i = open; i < pattern.size(); i++) {
        char c = pattern[i];
        if (c == '\\') {
            i++;
            continue;
        }
        if (c == '{') {
            depth++;
        } else if (c == '}') {
            depth--;
            if (depth == 0) return i;
        }
    }
    return std::string::npos;
}

// Top-level comma-separated alternatives inside a brace body
std::vector<std::string> split_alternatives(const std::string& body) {
    std::vector<std::string> parts;
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < body.size(); i++) {
        char c = body[i];
        if (c == '\\') {
            i++;
            continue;
        }
        if (c == '{') depth++;
        else if (c == '}') depth--;
        else if (c == ',' && depth == 0) {
            parts.push_back(body.substr(start, i - start));
            start = i + 1;
        }
    }
    parts.push_back(body.substr(start));
    return parts;
}

void expand_into(const std::string& pattern, size_t search_from, std::vector<std::string>& out) {
    if (out.size() >= MAX_EXPANSIONS) {
        return;
    }

    for (size_t i = search_from; i < pattern.size(); i++) {
        if (pattern[i] == '\\') {
            i++;
            continue;
        }
        if (pattern[i] != '{') continue;

        size_t close = find_closing_brace(pattern, i);
        if (close == std::string::npos) {
            break;  // Unbalanced: the rest is literal
        }

        auto alternatives = split_alternatives(pattern.substr(i + 1, close - i - 1));
        if (alternatives.size() < 2) {
            continue;  // "{x}" is literal
        }

        std::string prefix = pattern.substr(0, i);
        std::string suffix = pattern.substr(close + 1);
        for (const auto& alt : alternatives) {
            // Re-scan from the start of the alternative so nested braces expand
            expand_into(prefix + alt + suffix, prefix.size(), out);
        }
        return;
    }

    out.push_back(pattern);
}

} // namespace

std::vector<std::string> expand_braces(const std::string& pattern) {
    std::vector<std::string> out;
    expand_into(pattern, 0, out);
    return out;
}

bool match_name(const std::string& pattern, const std::string& name) {
    for (const auto& alt : expand_braces(pattern)) {
        if (fnmatch(alt.c_str(), name.c_str(), FNM_PERIOD) == 0) {
            return true;
        }
    }
    return false;
}

bool is_valid_pattern(const std::string& pattern) {
    if (pattern.empty() || pattern[0] == '/') {
        return false;
    }
    for (const auto& alt : expand_braces(pattern)) {
        if (!alt.empty() && alt[0] == '/') {
            return false;
        }
        for (const auto& segment : split_segments(alt)) {
            if (segment == "..") {
                return false;
            }
        }
    }
    return true;
}

// ============================================================================
// GlobWalker Implementation
// ============================================================================

GlobWalker::GlobWalker(const fs::path& root, const std::string& pattern) {
    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    root_ = (ec ? root : absolute).lexically_normal();
    if (!root_.has_filename() && root_.has_relative_path()) {
        root_ = root_.parent_path();  // Drop trailing separator
    }

    for (const auto& alt : expand_braces(pattern)) {
        auto segments = split_segments(alt);
        if (segments.empty()) continue;

        for (const auto& segment : segments) {
            if (segment == "**") has_globstar_ = true;
        }
        max_segments_ = std::max(max_segments_, segments.size());
        alternatives_.push_back(std::move(segments));
    }

    if (alternatives_.empty()) {
        done_ = true;
        return;
    }

    it_ = fs::recursive_directory_iterator(
        root_, fs::directory_options::skip_permission_denied, error_);
    if (error_) {
        spdlog::debug("Glob walk of {} not started: {}", root_.string(), error_.message());
        done_ = true;
    }
}

std::optional<fs::path> GlobWalker::next() {
    while (!done_) {
        if (it_ == fs::recursive_directory_iterator()) {
            done_ = true;
            break;
        }

        fs::path path = it_->path();
        auto segments = split_segments(path.lexically_relative(root_).generic_string());
        bool matched = matches(segments);

        std::error_code type_ec;
        bool is_dir = it_->is_directory(type_ec);

        if (is_dir && matched) {
            it_.disable_recursion_pending();
        } else if (is_dir && !has_globstar_ && segments.size() >= max_segments_) {
            // Nothing deeper can match
            it_.disable_recursion_pending();
        }

        std::error_code ec;
        it_.increment(ec);
        if (ec) {
            error_ = ec;
            done_ = true;
            spdlog::warn("Glob walk of {} stopped: {}", root_.string(), ec.message());
        }

        if (matched) {
            return path;
        }
    }

    return std::nullopt;
}

bool GlobWalker::matches(const std::vector<std::string>& segments) const {
    for (const auto& alt : alternatives_) {
        if (match_segments(alt, 0, segments, 0)) {
            return true;
        }
    }
    return false;
}

} // namespace remoteops::core::glob
