#pragma once
#include "../tool.hpp"

namespace mcptk::tools {

/// Returns "Echo: <message>". Always registered as a smoke test.
class EchoTool : public ITool {
public:
    [[nodiscard]] ToolDefinition definition() const override;
    ToolExecutionResult execute(const ToolExecutionRequest& request) override;
};

} // namespace mcptk::tools
