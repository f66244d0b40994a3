#include "core/token_authority.hpp"

namespace remoteops::core {

TokenAuthority::TokenAuthority(const std::vector<std::string>& tokens)
    : tokens_(tokens.begin(), tokens.end()) {}

bool TokenAuthority::is_authorized(const std::optional<std::string>& token) const {
    if (!token) {
        return false;
    }
    return tokens_.count(*token) > 0;
}

} // namespace remoteops::core
