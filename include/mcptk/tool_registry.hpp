#pragma once
#include "tool.hpp"
#include "types.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace mcptk {

/// Holds tool instances keyed by name and executes them under a deadline.
class ToolRegistry {
public:
    struct Options {
        std::chrono::milliseconds default_timeout{30000};
        int worker_threads = 4;
    };

    ToolRegistry();
    explicit ToolRegistry(Options opts);
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// Register a tool; an existing tool of the same name is replaced.
    void register_tool(std::shared_ptr<ITool> tool,
                       const std::optional<std::string>& category = std::nullopt);

    /// Remove a tool and call its cleanup(). Returns false if unknown.
    bool unregister_tool(const std::string& name);

    [[nodiscard]] std::shared_ptr<ITool> get_tool(const std::string& name) const;

    /// Tool names in registration order, optionally restricted to a category.
    [[nodiscard]] std::vector<std::string> list_tools(
        const std::optional<std::string>& category = std::nullopt) const;
    [[nodiscard]] std::vector<std::string> list_categories() const;

    [[nodiscard]] std::optional<ToolDefinition> get_tool_definition(const std::string& name) const;
    [[nodiscard]] std::vector<ToolDefinition> definitions(
        const std::optional<std::string>& category = std::nullopt) const;

    /// Never throws for tool-level failures; everything is reported in the result.
    ToolExecutionResult execute_tool(ToolExecutionRequest request);

    /// Clean up and drop every tool.
    void clear();

    [[nodiscard]] size_t size() const;

private:
    std::chrono::milliseconds timeout_for(const ITool& tool,
                                          const ToolExecutionRequest& request) const;

    Options opts_;
    WorkerPool pool_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::map<std::string, std::shared_ptr<ITool>> tools_;
    std::vector<std::pair<std::string, std::vector<std::string>>> categories_;
};

} // namespace mcptk
