#include "mcptk/codec.hpp"
#include "mcptk/error.hpp"
#include "mcptk/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace mcptk {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw McpParseError("Unexpected JSON value type");
    }
}

// Top-level scalars cannot be read through get_value()
nlohmann::json scalar_document(simdjson::ondemand::document& doc,
                               simdjson::ondemand::json_type type) {
    switch (type) {
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto result_int = doc.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = doc.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(doc.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(doc.get_bool().value());
        case simdjson::ondemand::json_type::null:
            if (!doc.is_null().value()) throw McpParseError("Invalid null literal");
            return nlohmann::json(nullptr);
        default:
            throw McpParseError("Unexpected JSON value type");
    }
}

bool is_allowed_key(const std::string& key) {
    return key == "jsonrpc" || key == "method" || key == "params" || key == "id";
}

JsonRpcError invalid_request(std::string message) {
    return JsonRpcError{error::InvalidRequest, "Invalid Request",
                        nlohmann::json{{"details", std::move(message)}}};
}

} // anonymous namespace

nlohmann::json Codec::parse_document(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::json_type type;
        if (auto type_error = doc.type().get(type)) {
            throw McpParseError(std::string("JSON parse error: ") +
                                simdjson::error_message(type_error));
        }
        if (type == simdjson::ondemand::json_type::object ||
            type == simdjson::ondemand::json_type::array) {
            auto val = doc.get_value();
            if (val.error()) {
                throw McpParseError(std::string("JSON parse error: ") +
                                    simdjson::error_message(val.error()));
            }
            j = simdjson_to_nlohmann(val.value());
        } else {
            j = scalar_document(doc, type);
        }
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON conversion error: ") + e.what());
    }

    if (!doc.at_end()) {
        throw McpParseError("Trailing content after JSON document");
    }
    return j;
}

std::variant<JsonRpcRequest, JsonRpcError> Codec::parse_request(const nlohmann::json& j) {
    if (!j.is_object()) {
        return invalid_request("Request must be a JSON object");
    }
    for (const auto& item : j.items()) {
        if (!is_allowed_key(item.key())) {
            return invalid_request("Unexpected field '" + item.key() + "'");
        }
    }

    auto jsonrpc = j.find("jsonrpc");
    if (jsonrpc == j.end() || !jsonrpc->is_string() ||
        jsonrpc->get<std::string>() != JSONRPC_VERSION) {
        return invalid_request("Invalid jsonrpc version, expected '2.0'");
    }

    auto method = j.find("method");
    if (method == j.end() || !method->is_string()) {
        return invalid_request("Missing or non-string 'method'");
    }

    JsonRpcRequest req;
    req.method = method->get<std::string>();

    auto params = j.find("params");
    if (params != j.end()) {
        if (!params->is_object() && !params->is_array()) {
            return invalid_request("'params' must be an object or an array");
        }
        req.params = *params;
    }

    auto id = j.find("id");
    if (id != j.end()) {
        if (id->is_number_integer() || id->is_string()) {
            RequestId rid;
            from_json(*id, rid);
            req.id = std::move(rid);
        } else if (!id->is_null()) {
            return invalid_request("'id' must be a string, an integer or null");
        }
    }
    return req;
}

std::optional<RequestId> Codec::extract_id(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto id = j.find("id");
    if (id == j.end()) return std::nullopt;
    if (id->is_number_integer() || id->is_string()) {
        RequestId rid;
        from_json(*id, rid);
        return rid;
    }
    return std::nullopt;
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j.dump();
}

std::string Codec::serialize_batch(const std::vector<JsonRpcResponse>& resps) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& resp : resps) {
        nlohmann::json j;
        to_json(j, resp);
        arr.push_back(std::move(j));
    }
    return arr.dump();
}

} // namespace mcptk
