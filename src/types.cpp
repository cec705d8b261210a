#include "mcptk/types.hpp"
#include <stdexcept>

namespace mcptk {

// ---------- Enums ----------

std::string to_string(ToolType t) {
    switch (t) {
        case ToolType::Function: return "function";
        case ToolType::Resource: return "resource";
        case ToolType::Prompt:   return "prompt";
    }
    return "function";
}

std::string to_string(ToolStatus s) {
    switch (s) {
        case ToolStatus::Available: return "available";
        case ToolStatus::Busy:      return "busy";
        case ToolStatus::Error:     return "error";
        case ToolStatus::Disabled:  return "disabled";
    }
    return "error";
}

std::string to_string(Priority p) {
    switch (p) {
        case Priority::Low:      return "low";
        case Priority::Normal:   return "normal";
        case Priority::High:     return "high";
        case Priority::Critical: return "critical";
    }
    return "normal";
}

namespace {

ToolType tool_type_from_string(const std::string& s) {
    if (s == "function") return ToolType::Function;
    if (s == "resource") return ToolType::Resource;
    if (s == "prompt") return ToolType::Prompt;
    throw std::invalid_argument("Unknown tool type: " + s);
}

} // anonymous namespace

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& d) {
    j = {{"name", d.name},
         {"description", d.description},
         {"parameters", d.parameters},
         {"tool_type", to_string(d.tool_type)},
         {"required_permissions", d.required_permissions}};
}

void from_json(const nlohmann::json& j, ToolDefinition& d) {
    d.name = j.at("name").get<std::string>();
    d.description = j.value("description", "");
    if (j.contains("parameters")) d.parameters = j.at("parameters");
    if (j.contains("tool_type")) d.tool_type = tool_type_from_string(j.at("tool_type").get<std::string>());
    if (j.contains("required_permissions")) {
        d.required_permissions = j.at("required_permissions").get<std::vector<std::string>>();
    }
}

nlohmann::json to_mcp_tool(const ToolDefinition& d) {
    return {{"name", d.name}, {"description", d.description}, {"inputSchema", d.parameters}};
}

// ---------- Results ----------

void to_json(nlohmann::json& j, const ToolError& e) {
    j = {{"code", e.code}, {"message", e.message}};
    if (e.details) j["details"] = *e.details;
}

void to_json(nlohmann::json& j, const ExecutionMetadata& m) {
    j = {{"execution_time", m.execution_time},
         {"memory_used", m.memory_used},
         {"cpu_time", m.cpu_time},
         {"io_operations", m.io_operations},
         {"cache_hit", m.cache_hit}};
}

void to_json(nlohmann::json& j, const ResourceUsage& r) {
    j = {{"memory_mb", r.memory_mb},
         {"cpu_time_ms", r.cpu_time_ms},
         {"io_operations", r.io_operations},
         {"network_requests", r.network_requests}};
}

void to_json(nlohmann::json& j, const ToolExecutionResult& r) {
    j = {{"success", r.success}};
    if (r.content) j["content"] = *r.content;
    if (r.error) j["error"] = *r.error;
    if (r.metadata) j["metadata"] = *r.metadata;
    if (r.resources_used) j["resources_used"] = *r.resources_used;
}

void to_json(nlohmann::json& j, const ValidationError& e) {
    j = {{"field", e.field}, {"message", e.message}, {"code", e.code}};
    if (e.details) j["details"] = *e.details;
}

ToolExecutionResult ToolExecutionResult::ok(nlohmann::json content) {
    ToolExecutionResult r;
    r.success = true;
    r.content = std::move(content);
    return r;
}

ToolExecutionResult ToolExecutionResult::fail(std::string code, std::string message,
                                              std::optional<nlohmann::json> details) {
    ToolExecutionResult r;
    r.success = false;
    r.error = ToolError{std::move(code), std::move(message), std::move(details)};
    return r;
}

} // namespace mcptk
