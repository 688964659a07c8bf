#include "tool_call_parser.hpp"
#include "fence.hpp"
#include "util.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

namespace toolfence {

namespace {

struct CallBlock {
    FenceKind kind = FenceKind::ToolCall;
    FenceSpan span;
};

// Earliest block of any syntax enabled by the grammar
std::optional<CallBlock> find_call_block(const std::string& text, size_t from,
                                         Grammar grammar) {
    std::optional<CallBlock> best;
    for (auto kind : call_fence_kinds(grammar)) {
        auto span = find_fence(text, from, kind);
        if (span && (!best || span->start < best->span.start)) {
            best = CallBlock{kind, *span};
        }
    }
    return best;
}

bool is_truthy(const nlohmann::json& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) return !value.get_ref<const std::string&>().empty();
    return true;
}

nlohmann::json resolve_args(const nlohmann::json& candidate) {
    nlohmann::json args = nlohmann::json::object();
    for (const char* key : {"arguments", "parameters"}) {
        auto it = candidate.find(key);
        if (it != candidate.end() && is_truthy(*it)) {
            args = *it;
            break;
        }
    }

    // Some models double-encode the arguments object
    if (args.is_string()) {
        try {
            args = nlohmann::json::parse(args.get<std::string>());
        } catch (const std::exception&) { // NOLINT(bugprone-empty-catch)
            // Not JSON, keep the raw string
        }
    }
    return args;
}

std::optional<ParsedToolCall> to_tool_call(const nlohmann::json& candidate, bool debug) {
    if (!candidate.is_object()) {
        if (debug) std::cerr << "[toolfence] Skipping non-object tool call candidate\n";
        return std::nullopt;
    }

    auto name = candidate.find("name");
    if (name == candidate.end() || !name->is_string() ||
        name->get_ref<const std::string&>().empty()) {
        if (debug) std::cerr << "[toolfence] Skipping tool call without name\n";
        return std::nullopt;
    }

    ParsedToolCall call;
    call.tool_name = name->get<std::string>();
    call.args = resolve_args(candidate);

    auto id = candidate.find("id");
    if (id != candidate.end() && id->is_string() && !id->get_ref<const std::string&>().empty()) {
        call.tool_call_id = id->get<std::string>();
    } else if (id != candidate.end() && id->is_number()) {
        call.tool_call_id = id->dump();
    } else {
        call.tool_call_id = generate_tool_call_id();
    }
    return call;
}

void collect_candidates(const nlohmann::json& parsed, std::vector<ParsedToolCall>& calls,
                        bool debug) {
    if (parsed.is_array()) {
        for (const auto& element : parsed) {
            if (auto call = to_tool_call(element, debug)) calls.push_back(std::move(*call));
        }
    } else if (auto call = to_tool_call(parsed, debug)) {
        calls.push_back(std::move(*call));
    }
}

// Split on commas outside of quoted values
std::vector<std::string> split_top_level(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    char quote = '\0';
    for (char c : s) {
        if (quote != '\0') {
            if (c == quote) quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == ',') {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    parts.push_back(current);
    return parts;
}

std::string strip_quotes(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

ParsedToolCall parse_literal_call(const std::string& name, const std::string& inner) {
    ParsedToolCall call;
    call.tool_call_id = generate_tool_call_id();
    call.tool_name = name;
    call.args = nlohmann::json::object();

    if (trim(inner).empty()) return call;

    for (const auto& raw : split_top_level(inner)) {
        std::string pair = trim(raw);
        size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = trim(pair.substr(0, eq));
        call.args[key] = strip_quotes(trim(pair.substr(eq + 1)));
    }
    return call;
}

std::vector<ParsedToolCall> calls_in_span(const std::string& text, FenceKind kind,
                                          const FenceSpan& span, bool debug) {
    std::string inner = text.substr(span.inner_start, span.inner_end - span.inner_start);
    if (kind == FenceKind::ToolCallLiteral) {
        // Opener is "[name("
        std::string name = text.substr(span.start + 1, span.inner_start - span.start - 2);
        return {parse_literal_call(name, inner)};
    }
    return parse_call_payload(inner, debug);
}

} // namespace

std::optional<Grammar> parse_grammar(const std::string& name) {
    std::string n = trim(name);
    if (n.size() == 4 && match_ci(n, 0, "json") == 4) return Grammar::Json;
    if (n.size() == 8 && match_ci(n, 0, "extended") == 8) return Grammar::Extended;
    return std::nullopt;
}

const char* grammar_name(Grammar grammar) {
    switch (grammar) {
        case Grammar::Json: return "json";
        case Grammar::Extended: return "extended";
    }
    return "json";
}

std::vector<FenceKind> call_fence_kinds(Grammar grammar) {
    if (grammar == Grammar::Extended) {
        return {FenceKind::ToolCall, FenceKind::ToolCallTag, FenceKind::ToolCallLiteral};
    }
    return {FenceKind::ToolCall};
}

std::vector<ParsedToolCall> parse_call_payload(const std::string& inner, bool debug) {
    std::vector<ParsedToolCall> calls;
    std::string trimmed = trim(inner);
    if (trimmed.empty()) return calls;

    // Whole payload as one JSON value (object or array)
    nlohmann::json parsed;
    bool whole = false;
    try {
        parsed = nlohmann::json::parse(trimmed);
        whole = true;
    } catch (const std::exception&) { // NOLINT(bugprone-empty-catch)
        // Fall back to one JSON value per line
    }
    if (whole) {
        collect_candidates(parsed, calls, debug);
        return calls;
    }

    for (const auto& raw : split(trimmed, '\n')) {
        std::string line = trim(raw);
        if (line.empty()) continue;
        nlohmann::json candidate;
        try {
            candidate = nlohmann::json::parse(line);
        } catch (const std::exception& e) {
            if (debug) {
                std::cerr << "[toolfence] Skipping malformed tool call line: " << e.what() << "\n";
            }
            continue;
        }
        collect_candidates(candidate, calls, debug);
    }
    return calls;
}

ParsedResponse parse_tool_calls(const std::string& response, const ParserOptions& options) {
    ParsedResponse result;
    std::string text;
    size_t cursor = 0;
    bool matched = false;

    while (auto block = find_call_block(response, cursor, options.grammar)) {
        matched = true;
        text += response.substr(cursor, block->span.start - cursor);
        cursor = block->span.end;

        for (auto& call : calls_in_span(response, block->kind, block->span, options.debug)) {
            result.tool_calls.push_back(std::move(call));
        }
    }

    if (!matched) {
        result.text_content = response;
        return result;
    }

    text += response.substr(cursor);
    result.text_content = trim(collapse_newline_runs(text));

    if (options.debug) {
        for (const auto& call : result.tool_calls) {
            std::cerr << "[toolfence] Parsed tool call " << call.tool_name
                      << " (" << call.tool_call_id << ")\n";
        }
    }
    return result;
}

bool has_tool_calls(const std::string& response, Grammar grammar) {
    return find_call_block(response, 0, grammar).has_value();
}

std::optional<std::string> extract_tool_call_block(const std::string& response,
                                                   Grammar grammar) {
    auto block = find_call_block(response, 0, grammar);
    if (!block) return std::nullopt;
    return response.substr(block->span.start, block->span.length());
}

std::vector<ParsedToolCall> parse_call_block(const std::string& block, FenceKind kind,
                                             bool debug) {
    auto span = find_fence(block, 0, kind);
    if (!span) return {};
    return calls_in_span(block, kind, *span, debug);
}

} // namespace toolfence
