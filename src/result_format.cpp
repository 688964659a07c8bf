#include "result_format.hpp"
#include "fence.hpp"

#include <nlohmann/json.hpp>

namespace toolfence {

namespace {

// Tool output may carry arbitrary bytes; replace invalid UTF-8 instead of throwing.
// Backticks can only sit inside string literals; escaped as \u0060 they
// decode to the same value and never close the result fence.
std::string dump_compact(const nlohmann::json& value) {
    std::string raw = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (c == '`') {
            out += "\\u0060";
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace

std::string format_tool_result_line(const ToolResult& result) {
    const nlohmann::json& payload =
        result.result.is_discarded() ? nlohmann::json() : result.result;

    // Field order is part of the wire format, so the object is written by hand
    std::string line = "{";
    if (result.tool_call_id) {
        line += "\"id\":" + dump_compact(*result.tool_call_id) + ",";
    }
    line += "\"name\":" + dump_compact(result.tool_name);
    line += ",\"result\":" + dump_compact(payload);
    line += ",\"error\":";
    line += result.is_error ? "true" : "false";
    line += "}";
    return line;
}

std::string format_tool_results(const std::vector<ToolResult>& results) {
    if (results.empty()) return "";

    std::string out = canonical_opener(FenceKind::ToolResult) + "\n";
    for (const auto& result : results) {
        out += format_tool_result_line(result);
        out += "\n";
    }
    out += kFenceTicks;
    return out;
}

std::string format_single_tool_result(const ToolResult& result) {
    return format_tool_results({result});
}

bool has_tool_results(const std::string& text) {
    return find_fence(text, 0, FenceKind::ToolResult).has_value();
}

std::optional<std::string> extract_tool_result_block(const std::string& text) {
    auto span = find_fence(text, 0, FenceKind::ToolResult);
    if (!span) return std::nullopt;
    return text.substr(span->start, span->length());
}

} // namespace toolfence
