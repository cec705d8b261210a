#include "mcptk/json_rpc.hpp"
#include "mcptk/version.hpp"

namespace mcptk {

namespace {

nlohmann::json id_to_json(const std::optional<RequestId>& id) {
    if (!id) return nullptr;
    nlohmann::json j;
    to_json(j, *id);
    return j;
}

std::optional<RequestId> id_from_json(const nlohmann::json& j) {
    if (j.is_null()) return std::nullopt;
    RequestId id;
    from_json(j, id);
    return id;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
    if (r.id) j["id"] = id_to_json(r.id);
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
    if (j.contains("id")) r.id = id_from_json(j.at("id"));
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json(nullptr);
    }
    j["id"] = id_to_json(r.id);
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    r.id = id_from_json(j.at("id"));
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

JsonRpcResponse make_result(std::optional<RequestId> id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse make_error(std::optional<RequestId> id, int code, std::string message,
                           std::optional<nlohmann::json> data) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::move(data)};
    return resp;
}

} // namespace mcptk
