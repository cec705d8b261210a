#pragma once
#include <string>

namespace mcptk {

/// Random RFC 4122 version 4 UUID in canonical text form.
std::string generate_uuid();

} // namespace mcptk
