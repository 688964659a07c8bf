#pragma once
#include "tool.hpp"
#include "fence.hpp"
#include <string>
#include <vector>
#include <optional>

namespace toolfence {

// Syntaxes accepted when recovering calls from model text.
//   Json:     ```tool_call fences holding a JSON object, an array of
//             objects, or one JSON object per line
//   Extended: Json plus <tool_call>...</tool_call> tags and compact
//             [fn(key="value", key2=value2)] literals
enum class Grammar { Json, Extended };

// "json" / "extended" (case-insensitive); nullopt for anything else
std::optional<Grammar> parse_grammar(const std::string& name);
const char* grammar_name(Grammar grammar);

// Block syntaxes recognised under a grammar; the earliest block in a text wins
std::vector<FenceKind> call_fence_kinds(Grammar grammar);

struct ParserOptions {
    Grammar grammar = Grammar::Json;
    bool debug = false; // log dropped candidates to stderr
};

// Extract every call block from a model response. Blocks are removed from
// the text; when none are found text_content is the response unchanged.
ParsedResponse parse_tool_calls(const std::string& response,
                                const ParserOptions& options = {});

// Parse the inner text of one fence or tag (delimiters already stripped).
// Malformed candidates are dropped individually; never throws.
std::vector<ParsedToolCall> parse_call_payload(const std::string& inner,
                                               bool debug = false);

// Calls in one complete block of the given syntax, delimiters included.
// Never throws; a block that does not parse yields no calls.
std::vector<ParsedToolCall> parse_call_block(const std::string& block, FenceKind kind,
                                             bool debug = false);

// Whether the response contains at least one complete call block
bool has_tool_calls(const std::string& response, Grammar grammar = Grammar::Json);

// First complete call block, delimiters included
std::optional<std::string> extract_tool_call_block(const std::string& response,
                                                   Grammar grammar = Grammar::Json);

} // namespace toolfence
