#include <gtest/gtest.h>
#include "mcptk/types.hpp"
#include <nlohmann/json.hpp>

using namespace mcptk;

// ---- ToolDefinition ----

TEST(ToolDefinition, SerializeDeserialize) {
    ToolDefinition def;
    def.name = "search";
    def.description = "Search things";
    def.parameters = {{"type", "object"}, {"properties", {{"q", {{"type", "string"}}}}}};
    def.tool_type = ToolType::Resource;
    def.required_permissions = {"read"};

    nlohmann::json j = def;
    EXPECT_EQ(j["tool_type"], "resource");
    EXPECT_EQ(j["required_permissions"][0], "read");

    auto back = j.get<ToolDefinition>();
    EXPECT_TRUE(back == def);
}

TEST(ToolDefinition, DefaultsWhenFieldsMissing) {
    auto def = nlohmann::json{{"name", "bare"}}.get<ToolDefinition>();
    EXPECT_EQ(def.name, "bare");
    EXPECT_EQ(def.description, "");
    EXPECT_TRUE(def.parameters.is_object());
    EXPECT_EQ(def.tool_type, ToolType::Function);
    EXPECT_TRUE(def.required_permissions.empty());
}

TEST(ToolDefinition, UnknownToolTypeThrows) {
    auto j = nlohmann::json{{"name", "x"}, {"tool_type", "widget"}};
    EXPECT_THROW(j.get<ToolDefinition>(), std::invalid_argument);
}

TEST(ToolDefinition, McpWireShape) {
    ToolDefinition def{"echo", "Echo", {{"type", "object"}}, ToolType::Function, {}};
    auto j = to_mcp_tool(def);
    EXPECT_EQ(j["name"], "echo");
    EXPECT_EQ(j["description"], "Echo");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_FALSE(j.contains("parameters"));
}

// ---- Enums ----

TEST(Enums, ToString) {
    EXPECT_EQ(to_string(ToolStatus::Disabled), "disabled");
    EXPECT_EQ(to_string(Priority::Critical), "critical");
    EXPECT_EQ(to_string(ToolType::Prompt), "prompt");
    EXPECT_LT(static_cast<int>(Priority::Low), static_cast<int>(Priority::High));
}

// ---- Results ----

TEST(ToolExecutionResult, OkCarriesContent) {
    auto r = ToolExecutionResult::ok("hello");
    EXPECT_TRUE(r.success);
    ASSERT_TRUE(r.content.has_value());
    EXPECT_EQ(*r.content, "hello");
    EXPECT_FALSE(r.error.has_value());
}

TEST(ToolExecutionResult, FailCarriesError) {
    auto r = ToolExecutionResult::fail("EXECUTION_ERROR", "broken", nlohmann::json{{"k", 1}});
    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.error.has_value());

    nlohmann::json j = r;
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error"]["code"], "EXECUTION_ERROR");
    EXPECT_EQ(j["error"]["details"]["k"], 1);
    EXPECT_FALSE(j.contains("content"));
}

TEST(ToolExecutionResult, MetadataSerialization) {
    auto r = ToolExecutionResult::ok(nlohmann::json::object());
    r.metadata = ExecutionMetadata{};
    r.metadata->execution_time = 12.5;
    nlohmann::json j = r;
    EXPECT_DOUBLE_EQ(j["metadata"]["execution_time"].get<double>(), 12.5);
    EXPECT_EQ(j["metadata"]["cache_hit"], false);
}

TEST(ToolExecutionRequest, CancellationFlag) {
    ToolExecutionRequest req;
    EXPECT_FALSE(req.is_cancelled());
    auto copy = req;
    copy.cancelled->store(true);
    EXPECT_TRUE(req.is_cancelled());
}

TEST(ResourceEstimate, Defaults) {
    ResourceEstimate e;
    EXPECT_DOUBLE_EQ(e.memory_mb, 10.0);
    EXPECT_DOUBLE_EQ(e.cpu_time_ms, 100.0);
    EXPECT_EQ(e.io_operations, 1);
    EXPECT_EQ(e.network_requests, 0);
}
