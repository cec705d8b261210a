#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcptk {

class Codec {
public:
    /// Parse raw UTF-8 bytes into a JSON document.
    /// Throws McpParseError on invalid UTF-8, invalid JSON or trailing content.
    [[nodiscard]] static nlohmann::json parse_document(std::string_view raw);

    /// Validate the shape of a single request object.
    /// Only jsonrpc, method, params and id are allowed at the top level.
    [[nodiscard]] static std::variant<JsonRpcRequest, JsonRpcError>
    parse_request(const nlohmann::json& j);

    /// Best-effort id extraction used to key INVALID_REQUEST replies.
    [[nodiscard]] static std::optional<RequestId> extract_id(const nlohmann::json& j);

    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);
    [[nodiscard]] static std::string serialize_batch(const std::vector<JsonRpcResponse>& resps);
};

} // namespace mcptk
