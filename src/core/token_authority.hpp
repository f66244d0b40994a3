#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_set>

namespace remoteops::core {

// Fixed set of accepted access tokens
class TokenAuthority {
public:
    explicit TokenAuthority(const std::vector<std::string>& tokens);

    // True iff a token was supplied and it is one of the configured tokens
    bool is_authorized(const std::optional<std::string>& token) const;

    size_t size() const { return tokens_.size(); }

private:
    const std::unordered_set<std::string> tokens_;
};

} // namespace remoteops::core
