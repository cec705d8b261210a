#pragma once
#include <string_view>

namespace mcptk {

constexpr std::string_view LIBRARY_VERSION          = "0.1.0";
constexpr std::string_view SERVER_NAME              = "mcptk";
constexpr std::string_view JSONRPC_VERSION          = "2.0";
constexpr std::string_view DEFAULT_PROTOCOL_VERSION = "2024-11-05";

constexpr std::string_view SUPPORTED_PROTOCOL_VERSIONS[] = {
    "2024-11-05",
    "2025-03-26",
    "2025-06-18",
};

} // namespace mcptk
