#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace spdlog { class logger; }

namespace mcptk {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;

/// Every handler returns a future; absent params arrive as std::nullopt.
using MethodHandler =
    std::function<std::future<HandlerResult>(const std::optional<nlohmann::json>& params)>;

using SyncMethodHandler =
    std::function<HandlerResult(const std::optional<nlohmann::json>& params)>;

/// Wrap a synchronous callable as a MethodHandler. The call runs inline and
/// its result or exception is delivered through a ready future.
MethodHandler make_sync_handler(SyncMethodHandler fn);

/// Transport-agnostic JSON-RPC 2.0 processor.
class JsonRpcProcessor {
public:
    JsonRpcProcessor();

    void register_method(const std::string& method, MethodHandler handler);
    void register_sync_method(const std::string& method, SyncMethodHandler handler);
    bool unregister_method(const std::string& method);

    [[nodiscard]] bool has_method(const std::string& method) const;

    /// Method names in registration order.
    [[nodiscard]] std::vector<std::string> registered_methods() const;

    /// Process one message (object or batch). Returns the serialized reply,
    /// or an empty string when nothing must be sent back.
    [[nodiscard]] std::string process_message(std::string_view raw);

private:
    std::optional<JsonRpcResponse> process_single(const nlohmann::json& j);
    std::optional<JsonRpcResponse> dispatch(const JsonRpcRequest& req);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, MethodHandler> handlers_;
    std::vector<std::string> order_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mcptk
