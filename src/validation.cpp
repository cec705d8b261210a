#include "mcptk/validation.hpp"

namespace mcptk {

bool matches_schema_type(const nlohmann::json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    // Unknown type names are not enforced
    return true;
}

namespace {

bool matches_any_type(const nlohmann::json& value, const nlohmann::json& type) {
    if (type.is_string()) return matches_schema_type(value, type.get<std::string>());
    if (type.is_array()) {
        for (const auto& t : type) {
            if (t.is_string() && matches_schema_type(value, t.get<std::string>())) return true;
        }
        return false;
    }
    return true;
}

} // anonymous namespace

ValidationResult validate_against_schema(const nlohmann::json& schema,
                                         const nlohmann::json& params) {
    ValidationResult result;
    if (!schema.is_object()) return result;

    if (!params.is_object()) {
        result.is_valid = false;
        result.errors.push_back({"", "Parameters must be an object", validation_code::InvalidType,
                                 std::nullopt});
        return result;
    }

    auto required = schema.find("required");
    if (required != schema.end() && required->is_array()) {
        for (const auto& field : *required) {
            if (!field.is_string()) continue;
            const auto name = field.get<std::string>();
            if (!params.contains(name)) {
                result.errors.push_back({name, "Missing required parameter '" + name + "'",
                                         validation_code::Required, std::nullopt});
            }
        }
    }

    auto properties = schema.find("properties");
    if (properties != schema.end() && properties->is_object()) {
        for (const auto& prop : properties->items()) {
            auto value = params.find(prop.key());
            if (value == params.end() || !prop.value().is_object()) continue;

            auto type = prop.value().find("type");
            if (type != prop.value().end() && !matches_any_type(*value, *type)) {
                result.errors.push_back({prop.key(),
                                         "Parameter '" + prop.key() + "' has wrong type",
                                         validation_code::InvalidType,
                                         nlohmann::json{{"expected", *type}}});
                continue;
            }

            auto allowed = prop.value().find("enum");
            if (allowed != prop.value().end() && allowed->is_array()) {
                bool found = false;
                for (const auto& candidate : *allowed) {
                    if (candidate == *value) { found = true; break; }
                }
                if (!found) {
                    result.errors.push_back({prop.key(),
                                             "Parameter '" + prop.key() + "' is not an allowed value",
                                             validation_code::InvalidEnum,
                                             nlohmann::json{{"allowed", *allowed}}});
                }
            }
        }
    }

    result.is_valid = result.errors.empty();
    return result;
}

} // namespace mcptk
