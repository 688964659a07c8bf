#pragma once
#include "tool.hpp"
#include <string>
#include <vector>
#include <optional>

namespace toolfence {

struct PromptOptions {
    bool allow_parallel_tool_calls = false;
};

// Build the system prompt that teaches a text-only model the tool_call /
// tool_result fence convention. With no tools the original prompt is
// returned as-is (empty when absent). A non-blank original prompt is
// trimmed and placed ahead of the tool instructions.
std::string build_tool_system_prompt(const std::optional<std::string>& original_prompt,
                                     const std::vector<ToolDefinition>& tools,
                                     const PromptOptions& options = {});

// Pretty-printed JSON listing of name/description/parameters per tool
std::string format_tool_listing(const std::vector<ToolDefinition>& tools);

} // namespace toolfence
