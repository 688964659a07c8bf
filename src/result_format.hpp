#pragma once
#include "tool.hpp"
#include <string>
#include <vector>
#include <optional>

namespace toolfence {

// One compact JSON line: {"id":...,"name":...,"result":...,"error":...}
// "id" is left out entirely when the result carries no call ID.
std::string format_tool_result_line(const ToolResult& result);

// ```tool_result fence with one line per result; "" for an empty list
std::string format_tool_results(const std::vector<ToolResult>& results);

std::string format_single_tool_result(const ToolResult& result);

// Whether text contains a complete ```tool_result fence
bool has_tool_results(const std::string& text);

// First complete ```tool_result fence, delimiters included
std::optional<std::string> extract_tool_result_block(const std::string& text);

} // namespace toolfence
