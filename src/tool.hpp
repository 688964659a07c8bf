#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace toolfence {

// Tool declaration supplied by the chat runtime for one generation request.
struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
    std::optional<nlohmann::json> input_schema; // JSON Schema, opaque here
};

// A call recovered from a tool_call fence (or an extended-grammar literal).
struct ParsedToolCall {
    std::string tool_call_id;
    std::string tool_name;
    nlohmann::json args; // object for object syntax; raw string if unparseable
};

// Outcome of executing a ParsedToolCall, produced by the caller.
struct ToolResult {
    std::optional<std::string> tool_call_id;
    std::string tool_name;
    nlohmann::json result; // null when the tool produced nothing
    bool is_error = false;
};

// One model turn split into calls and the prose around them.
struct ParsedResponse {
    std::vector<ParsedToolCall> tool_calls;
    std::string text_content;

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

} // namespace toolfence
