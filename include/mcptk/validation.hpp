#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>

namespace mcptk {

namespace validation_code {
    constexpr const char* Required    = "REQUIRED";
    constexpr const char* InvalidType = "INVALID_TYPE";
    constexpr const char* InvalidEnum = "INVALID_ENUM";
} // namespace validation_code

/// Check params against a JSON-Schema-like object: `required`, the primitive
/// `type` of each declared property, and `enum` membership. Every violation is
/// reported; nothing stops at the first one.
[[nodiscard]] ValidationResult validate_against_schema(const nlohmann::json& schema,
                                                       const nlohmann::json& params);

/// True if value matches a JSON-Schema primitive type name.
[[nodiscard]] bool matches_schema_type(const nlohmann::json& value, const std::string& type);

} // namespace mcptk
