#include "mcptk/tool_registry.hpp"
#include "mcptk/error.hpp"
#include "mcptk/log.hpp"
#include <algorithm>
#include <future>

namespace mcptk {

namespace {

std::vector<std::string> missing_permissions(const ToolDefinition& def,
                                             const ExecutionContext& ctx) {
    const std::vector<std::string>* granted = nullptr;
    if (ctx.permissions) {
        granted = &*ctx.permissions;
    } else if (ctx.user_info) {
        granted = &ctx.user_info->permissions;
    }
    std::vector<std::string> missing;
    if (!granted) return missing;
    for (const auto& p : def.required_permissions) {
        if (std::find(granted->begin(), granted->end(), p) == granted->end()) {
            missing.push_back(p);
        }
    }
    return missing;
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // anonymous namespace

ToolRegistry::ToolRegistry() : ToolRegistry(Options{}) {}

ToolRegistry::ToolRegistry(Options opts)
    : opts_(opts), pool_(opts.worker_threads), logger_(log::get("mcptk.registry")) {}

ToolRegistry::~ToolRegistry() {
    pool_.stop();
}

void ToolRegistry::register_tool(std::shared_ptr<ITool> tool,
                                 const std::optional<std::string>& category) {
    if (!tool) throw McpError("Cannot register a null tool");
    const auto name = tool->definition().name;

    std::lock_guard<std::mutex> lock(mutex_);
    if (tools_.count(name)) {
        logger_->warn("Tool '{}' already registered, replacing it", name);
    } else {
        order_.push_back(name);
    }
    tools_[name] = std::move(tool);

    if (category) {
        auto it = std::find_if(categories_.begin(), categories_.end(),
                               [&](const auto& c) { return c.first == *category; });
        if (it == categories_.end()) {
            categories_.emplace_back(*category, std::vector<std::string>{name});
        } else if (std::find(it->second.begin(), it->second.end(), name) == it->second.end()) {
            it->second.push_back(name);
        }
    }
    logger_->info("Registered tool '{}' (category: {})", name, category.value_or("none"));
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    std::shared_ptr<ITool> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) return false;
        removed = std::move(it->second);
        tools_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
        for (auto& [cat, names] : categories_) {
            names.erase(std::remove(names.begin(), names.end(), name), names.end());
        }
    }
    try {
        removed->cleanup();
    } catch (const std::exception& e) {
        logger_->error("Cleanup of tool '{}' failed: {}", name, e.what());
    } catch (...) {
        logger_->error("Cleanup of tool '{}' failed with a non-standard exception", name);
    }
    logger_->info("Unregistered tool '{}'", name);
    return true;
}

std::shared_ptr<ITool> ToolRegistry::get_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : it->second;
}

std::vector<std::string> ToolRegistry::list_tools(const std::optional<std::string>& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!category) return order_;
    for (const auto& [cat, names] : categories_) {
        if (cat == *category) return names;
    }
    return {};
}

std::vector<std::string> ToolRegistry::list_categories() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(categories_.size());
    for (const auto& c : categories_) out.push_back(c.first);
    return out;
}

std::optional<ToolDefinition> ToolRegistry::get_tool_definition(const std::string& name) const {
    auto tool = get_tool(name);
    if (!tool) return std::nullopt;
    return tool->definition();
}

std::vector<ToolDefinition> ToolRegistry::definitions(const std::optional<std::string>& category) const {
    std::vector<ToolDefinition> defs;
    for (const auto& name : list_tools(category)) {
        if (auto def = get_tool_definition(name)) defs.push_back(std::move(*def));
    }
    return defs;
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

void ToolRegistry::clear() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names = order_;
    }
    for (const auto& name : names) unregister_tool(name);
    std::lock_guard<std::mutex> lock(mutex_);
    categories_.clear();
}

std::chrono::milliseconds ToolRegistry::timeout_for(const ITool& tool,
                                                    const ToolExecutionRequest& request) const {
    if (request.timeout) return *request.timeout;
    if (auto t = tool.default_timeout()) return *t;
    return opts_.default_timeout;
}

ToolExecutionResult ToolRegistry::execute_tool(ToolExecutionRequest request) {
    auto tool = get_tool(request.tool_name);
    if (!tool) {
        return ToolExecutionResult::fail(tool_error::ToolNotFound,
                                         "Tool '" + request.tool_name + "' not found");
    }

    if (!tool->is_available()) {
        return ToolExecutionResult::fail(tool_error::ToolUnavailable,
                                         "Tool '" + request.tool_name + "' is currently unavailable",
                                         nlohmann::json{{"status", to_string(tool->status())}});
    }

    const auto def = tool->definition();
    auto missing = missing_permissions(def, request.execution_context);
    if (!missing.empty()) {
        return ToolExecutionResult::fail(tool_error::PermissionDenied,
                                         "Missing permissions for tool '" + request.tool_name + "'",
                                         nlohmann::json{{"missing", missing}});
    }

    ValidationResult validation;
    try {
        validation = tool->validate_parameters(request.parameters);
    } catch (const std::exception& e) {
        return ToolExecutionResult::fail(tool_error::ExecutionError,
                                         std::string("Parameter validation failed: ") + e.what());
    } catch (...) {
        return ToolExecutionResult::fail(tool_error::ExecutionError,
                                         "Parameter validation failed: unknown exception");
    }
    if (!validation.is_valid) {
        nlohmann::json errors = nlohmann::json::array();
        for (const auto& err : validation.errors) {
            errors.push_back({{"field", err.field}, {"message", err.message}, {"code", err.code}});
        }
        return ToolExecutionResult::fail(tool_error::InvalidParameters,
                                         "Parameter validation failed",
                                         nlohmann::json{{"validation_errors", errors}});
    }
    if (validation.sanitized_params) {
        request.parameters = std::move(*validation.sanitized_params);
    }

    const auto timeout = timeout_for(*tool, request);
    auto cancelled = request.cancelled;
    auto started = std::make_shared<std::promise<std::chrono::steady_clock::time_point>>();
    auto started_fut = started->get_future();

    std::future<ToolExecutionResult> fut;
    try {
        fut = pool_.submit([tool, started, req = std::move(request)]() mutable {
            started->set_value(std::chrono::steady_clock::now());
            if (req.is_cancelled()) {
                return ToolExecutionResult::fail(tool_error::ExecutionError,
                                                 "Tool execution cancelled before start");
            }
            return tool->execute(req);
        });
    } catch (const McpError& e) {
        return ToolExecutionResult::fail(tool_error::ExecutionError, e.what());
    }

    // The deadline covers execution only; time spent queued behind other calls is not charged.
    const auto start = started_fut.get();
    if (fut.wait_until(start + timeout) == std::future_status::timeout) {
        if (cancelled) cancelled->store(true);
        pool_.add_replacement();
        logger_->warn("Tool '{}' timed out after {} ms", def.name, timeout.count());
        return ToolExecutionResult::fail(
            tool_error::ExecutionTimeout,
            "Tool execution timed out (>" + std::to_string(timeout.count()) + " ms)",
            nlohmann::json{{"timeout_ms", timeout.count()}});
    }

    ToolExecutionResult result;
    try {
        result = fut.get();
    } catch (const std::exception& e) {
        logger_->error("Tool '{}' raised: {}", def.name, e.what());
        return ToolExecutionResult::fail(tool_error::ExecutionError,
                                         std::string("Tool execution failed: ") + e.what());
    } catch (...) {
        logger_->error("Tool '{}' raised a non-standard exception", def.name);
        return ToolExecutionResult::fail(tool_error::ExecutionError,
                                         "Tool execution failed: unknown exception");
    }

    if (!result.metadata) result.metadata = ExecutionMetadata{};
    result.metadata->execution_time = elapsed_ms(start);
    return result;
}

} // namespace mcptk
