#include "mcptk/transport/cors.hpp"
#include <algorithm>

namespace mcptk {

CorsPolicy::CorsPolicy(std::vector<std::string> allowed_origins)
    : allowed_(std::move(allowed_origins)) {
    if (allowed_.empty()) allowed_.push_back("*");
    wildcard_ = std::find(allowed_.begin(), allowed_.end(), "*") != allowed_.end();
}

bool CorsPolicy::is_origin_allowed(const std::string& origin) const {
    if (wildcard_) return true;
    for (const auto& allowed : allowed_) {
        if (!allowed.empty() && allowed.back() == '*') {
            if (origin.compare(0, allowed.size() - 1, allowed, 0, allowed.size() - 1) == 0) {
                return true;
            }
        } else if (origin == allowed) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> CorsPolicy::allow_origin(const std::string& origin) const {
    if (!origin.empty() && is_origin_allowed(origin)) return origin;
    if (wildcard_) return std::string("*");
    return std::nullopt;
}

CorsPolicy::Headers CorsPolicy::headers(const std::string& origin, bool expose_session_id) const {
    Headers h;
    if (auto value = allow_origin(origin)) {
        h.emplace_back("Access-Control-Allow-Origin", *value);
    }
    h.emplace_back("Access-Control-Allow-Methods", "POST, GET, OPTIONS");
    h.emplace_back("Access-Control-Allow-Headers",
                   "Content-Type, Authorization, Accept, Mcp-Session-Id");
    h.emplace_back("Access-Control-Max-Age", "86400");
    if (expose_session_id) {
        h.emplace_back("Access-Control-Expose-Headers", "Mcp-Session-Id");
    }
    return h;
}

} // namespace mcptk
