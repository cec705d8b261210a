#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcptk {

// ---------- Enums ----------

enum class ToolType { Function, Resource, Prompt };
enum class ToolStatus { Available, Busy, Error, Disabled };
enum class Priority { Low = 1, Normal = 2, High = 3, Critical = 4 };

std::string to_string(ToolType t);
std::string to_string(ToolStatus s);
std::string to_string(Priority p);

// ---------- Tool definition ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();  // JSON-Schema-like
    ToolType tool_type = ToolType::Function;
    std::vector<std::string> required_permissions;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && parameters == o.parameters && tool_type == o.tool_type
               && required_permissions == o.required_permissions;
    }
};

// ---------- Execution context ----------

struct UserInfo {
    std::string user_id;
    std::vector<std::string> permissions;
    std::optional<std::string> session_id;
};

struct ExecutionContext {
    std::string request_id;
    std::optional<std::string> session_id;
    std::optional<UserInfo> user_info;
    std::string working_directory = ".";
    std::map<std::string, std::string> environment_variables;
    std::optional<std::vector<std::string>> permissions;
};

struct ToolExecutionRequest {
    std::string tool_name;
    nlohmann::json parameters = nlohmann::json::object();
    ExecutionContext execution_context;
    std::optional<std::chrono::milliseconds> timeout;
    Priority priority = Priority::Normal;
    /// Raised by the executor when the deadline passes. Tools may poll it.
    std::shared_ptr<std::atomic<bool>> cancelled = std::make_shared<std::atomic<bool>>(false);

    [[nodiscard]] bool is_cancelled() const { return cancelled && cancelled->load(); }
};

// ---------- Results ----------

struct ResourceEstimate {
    double memory_mb = 10.0;
    double cpu_time_ms = 100.0;
    int io_operations = 1;
    int network_requests = 0;
};

struct ResourceUsage {
    double memory_mb = 0.0;
    double cpu_time_ms = 0.0;
    int io_operations = 0;
    int network_requests = 0;
};

struct ExecutionMetadata {
    double execution_time = 0.0;  // ms
    double memory_used = 0.0;     // MB
    double cpu_time = 0.0;        // ms
    int io_operations = 0;
    bool cache_hit = false;
};

struct ToolError {
    std::string code;
    std::string message;
    std::optional<nlohmann::json> details;
};

struct ToolExecutionResult {
    bool success = false;
    std::optional<nlohmann::json> content;
    std::optional<ToolError> error;
    std::optional<ExecutionMetadata> metadata;
    std::optional<ResourceUsage> resources_used;

    static ToolExecutionResult ok(nlohmann::json content);
    static ToolExecutionResult fail(std::string code, std::string message,
                                    std::optional<nlohmann::json> details = std::nullopt);
};

// ---------- Validation ----------

struct ValidationError {
    std::string field;
    std::string message;
    std::string code;
    std::optional<nlohmann::json> details;
};

struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationError> errors;
    std::vector<std::string> warnings;
    std::optional<nlohmann::json> sanitized_params;
};

// ---------- JSON conversions ----------

void to_json(nlohmann::json& j, const ToolDefinition& d);
void from_json(const nlohmann::json& j, ToolDefinition& d);

void to_json(nlohmann::json& j, const ToolError& e);
void to_json(nlohmann::json& j, const ExecutionMetadata& m);
void to_json(nlohmann::json& j, const ResourceUsage& r);
void to_json(nlohmann::json& j, const ToolExecutionResult& r);
void to_json(nlohmann::json& j, const ValidationError& e);

/// MCP wire shape of a tool: {"name","description","inputSchema"}.
nlohmann::json to_mcp_tool(const ToolDefinition& d);

} // namespace mcptk
