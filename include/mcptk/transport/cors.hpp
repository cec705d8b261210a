#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcptk {

/// Origin allow-list. Entries are exact origins, "*" or a prefix ending in "*".
class CorsPolicy {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    explicit CorsPolicy(std::vector<std::string> allowed_origins = {"*"});

    [[nodiscard]] bool is_origin_allowed(const std::string& origin) const;

    /// Value for Access-Control-Allow-Origin, or nullopt to omit the header.
    [[nodiscard]] std::optional<std::string> allow_origin(const std::string& origin) const;

    /// Full header set for a response to a request carrying `origin`.
    [[nodiscard]] Headers headers(const std::string& origin, bool expose_session_id = false) const;

    [[nodiscard]] const std::vector<std::string>& allowed_origins() const { return allowed_; }

private:
    std::vector<std::string> allowed_;
    bool wildcard_ = false;
};

} // namespace mcptk
