#include "mcptk/processor.hpp"
#include "mcptk/codec.hpp"
#include "mcptk/error.hpp"
#include "mcptk/log.hpp"
#include <algorithm>

namespace mcptk {

namespace {

std::string id_for_log(const std::optional<RequestId>& id) {
    if (!id) return "null";
    if (const auto* n = std::get_if<int64_t>(&*id)) return std::to_string(*n);
    return std::get<std::string>(*id);
}

} // anonymous namespace

MethodHandler make_sync_handler(SyncMethodHandler fn) {
    return [fn = std::move(fn)](const std::optional<nlohmann::json>& params) {
        std::promise<HandlerResult> p;
        try {
            p.set_value(fn(params));
        } catch (...) {
            p.set_exception(std::current_exception());
        }
        return p.get_future();
    };
}

JsonRpcProcessor::JsonRpcProcessor() : logger_(log::get("mcptk.processor")) {}

void JsonRpcProcessor::register_method(const std::string& method, MethodHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handlers_.count(method)) order_.push_back(method);
    handlers_[method] = std::move(handler);
    logger_->debug("Registered method '{}'", method);
}

void JsonRpcProcessor::register_sync_method(const std::string& method, SyncMethodHandler handler) {
    register_method(method, make_sync_handler(std::move(handler)));
}

bool JsonRpcProcessor::unregister_method(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handlers_.erase(method) == 0) return false;
    order_.erase(std::remove(order_.begin(), order_.end(), method), order_.end());
    return true;
}

bool JsonRpcProcessor::has_method(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(method) > 0;
}

std::vector<std::string> JsonRpcProcessor::registered_methods() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

std::string JsonRpcProcessor::process_message(std::string_view raw) {
    try {
        nlohmann::json doc;
        try {
            doc = Codec::parse_document(raw);
        } catch (const McpParseError& e) {
            logger_->debug("Parse error: {}", e.what());
            return Codec::serialize(make_error(std::nullopt, error::ParseError, "Parse error",
                                               nlohmann::json{{"details", e.what()}}));
        }

        if (doc.is_array()) {
            if (doc.empty()) {
                return Codec::serialize(make_error(std::nullopt, error::InvalidRequest,
                                                   "Invalid Request",
                                                   nlohmann::json{{"details", "Empty batch"}}));
            }
            std::vector<JsonRpcResponse> responses;
            for (const auto& item : doc) {
                if (auto resp = process_single(item)) responses.push_back(std::move(*resp));
            }
            if (responses.empty()) return "";
            return Codec::serialize_batch(responses);
        }

        auto resp = process_single(doc);
        return resp ? Codec::serialize(*resp) : "";
    } catch (const std::exception& e) {
        logger_->error("Unexpected error while processing message: {}", e.what());
        return Codec::serialize(make_error(std::nullopt, error::InternalError, "Internal error",
                                           nlohmann::json{{"details", e.what()}}));
    } catch (...) {
        logger_->error("Unexpected non-standard exception while processing message");
        return Codec::serialize(make_error(std::nullopt, error::InternalError, "Internal error"));
    }
}

std::optional<JsonRpcResponse> JsonRpcProcessor::process_single(const nlohmann::json& j) {
    auto parsed = Codec::parse_request(j);
    if (auto* err = std::get_if<JsonRpcError>(&parsed)) {
        return make_error(Codec::extract_id(j), err->code, err->message, err->data);
    }
    return dispatch(std::get<JsonRpcRequest>(parsed));
}

std::optional<JsonRpcResponse> JsonRpcProcessor::dispatch(const JsonRpcRequest& req) {
    // Hold lock only to look up the handler
    MethodHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(req.method);
        if (it != handlers_.end()) handler = it->second;
    }

    if (!handler) {
        if (req.is_notification()) {
            logger_->debug("Ignoring notification for unknown method '{}'", req.method);
            return std::nullopt;
        }
        return make_error(req.id, error::MethodNotFound, "Method not found",
                          nlohmann::json{{"method", req.method}});
    }

    try {
        auto result = handler(req.params).get();
        if (req.is_notification()) return std::nullopt;
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            return make_error(req.id, err->code, err->message, err->data);
        }
        return make_result(req.id, std::move(std::get<nlohmann::json>(result)));
    } catch (const std::exception& e) {
        if (req.is_notification()) {
            logger_->warn("Notification handler '{}' failed: {}", req.method, e.what());
            return std::nullopt;
        }
        logger_->error("Handler '{}' failed (id {}): {}", req.method, id_for_log(req.id), e.what());
        return make_error(req.id, error::ToolExecutionError,
                          std::string("Execution error: ") + e.what());
    } catch (...) {
        if (req.is_notification()) {
            logger_->warn("Notification handler '{}' failed with a non-standard exception", req.method);
            return std::nullopt;
        }
        logger_->error("Handler '{}' failed (id {}) with a non-standard exception",
                       req.method, id_for_log(req.id));
        return make_error(req.id, error::ToolExecutionError, "Execution error: unknown exception");
    }
}

} // namespace mcptk
