#include "prompt.hpp"
#include "fence.hpp"
#include "util.hpp"

#include <sstream>
#include <nlohmann/json.hpp>

namespace toolfence {

namespace {

nlohmann::ordered_json parameters_for(const ToolDefinition& tool) {
    if (tool.input_schema && !tool.input_schema->is_null()) {
        // Re-read through ordered_json so the schema keeps a stable layout
        return nlohmann::ordered_json::parse(tool.input_schema->dump(
            -1, ' ', false, nlohmann::json::error_handler_t::replace));
    }
    nlohmann::ordered_json empty;
    empty["type"] = "object";
    empty["properties"] = nlohmann::ordered_json::object();
    return empty;
}

} // namespace

std::string format_tool_listing(const std::vector<ToolDefinition>& tools) {
    nlohmann::ordered_json listing = nlohmann::ordered_json::array();
    for (const auto& tool : tools) {
        nlohmann::ordered_json entry;
        entry["name"] = tool.name;
        entry["description"] = tool.description.value_or("No description provided.");
        entry["parameters"] = parameters_for(tool);
        listing.push_back(std::move(entry));
    }
    return listing.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string build_tool_system_prompt(const std::optional<std::string>& original_prompt,
                                     const std::vector<ToolDefinition>& tools,
                                     const PromptOptions& options) {
    std::string prior = original_prompt ? trim(*original_prompt) : "";

    if (tools.empty()) {
        return prior.empty() ? "" : *original_prompt;
    }

    const std::string call_fence = canonical_opener(FenceKind::ToolCall);
    const std::string result_fence = canonical_opener(FenceKind::ToolResult);

    std::ostringstream ss;
    ss << "You are a helpful AI assistant with access to tools.\n\n";

    ss << "# Available Tools\n"
       << format_tool_listing(tools) << "\n\n";

    ss << "# Tool Calling Instructions\n";
    if (options.allow_parallel_tool_calls) {
        ss << "You may return multiple tool calls in the array if they are independent "
           << "and can be executed in parallel. Calls that depend on an earlier result "
           << "must wait until that result is available.\n\n";
    } else {
        ss << "Only request one tool call at a time. "
           << "Wait for tool results before asking for another tool.\n\n";
    }

    ss << "To call a tool, output JSON in this exact format inside a "
       << call_fence << " code fence:\n\n"
       << call_fence << "\n"
       << "{\"name\": \"tool_name\", \"arguments\": {\"param1\": \"value1\", \"param2\": \"value2\"}}\n"
       << kFenceTicks << "\n\n";

    if (options.allow_parallel_tool_calls) {
        ss << "For multiple parallel calls:\n\n"
           << call_fence << "\n"
           << "[{\"name\": \"tool1\", \"arguments\": {\"param\": \"value\"}}, "
           << "{\"name\": \"tool2\", \"arguments\": {\"param\": \"value\"}}]\n"
           << kFenceTicks << "\n\n";
    }

    ss << "Tool responses will be provided in " << result_fence
       << " fences. Each line contains JSON like:\n"
       << result_fence << "\n"
       << "{\"id\": \"call_123\", \"name\": \"tool_name\", \"result\": {...}, \"error\": false}\n"
       << kFenceTicks << "\n"
       << "Use the `result` payload (and treat `error` as a boolean flag) "
       << "when continuing the conversation.\n\n";

    ss << "Important:\n"
       << "- Use exact tool and parameter names from the schema above\n"
       << "- Arguments must be a valid JSON object matching the tool's parameters\n"
       << "- You can include brief reasoning before or after the tool call\n"
       << "- If no tool is needed, respond directly without " << call_fence << " fences";

    if (prior.empty()) return ss.str();
    return prior + "\n\n" + ss.str();
}

} // namespace toolfence
