#pragma once
#include "types.hpp"
#include "validation.hpp"
#include <atomic>
#include <chrono>
#include <optional>

namespace mcptk {

/// A callable tool. Implementations must tolerate concurrent execute() calls.
class ITool {
public:
    virtual ~ITool() = default;

    [[nodiscard]] virtual ToolDefinition definition() const = 0;

    /// Run the tool. Expected failures are reported through the result;
    /// exceptions are converted to EXECUTION_ERROR by the registry.
    virtual ToolExecutionResult execute(const ToolExecutionRequest& request) = 0;

    /// Defaults to a check against the definition's parameter schema.
    [[nodiscard]] virtual ValidationResult validate_parameters(const nlohmann::json& params) const {
        return validate_against_schema(definition().parameters, params);
    }

    [[nodiscard]] virtual ToolStatus status() const { return status_.load(); }
    [[nodiscard]] bool is_available() const { return status() == ToolStatus::Available; }
    void set_status(ToolStatus s) { status_.store(s); }

    [[nodiscard]] virtual ResourceEstimate estimate_resources(const nlohmann::json& /*params*/) const {
        return ResourceEstimate{};
    }

    /// Per-tool timeout override; the registry default applies when empty.
    [[nodiscard]] virtual std::optional<std::chrono::milliseconds> default_timeout() const {
        return std::nullopt;
    }

    /// Called when the registry drops the tool.
    virtual void cleanup() {}

private:
    std::atomic<ToolStatus> status_{ToolStatus::Available};
};

} // namespace mcptk
