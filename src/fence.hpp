#pragma once
#include <string>
#include <optional>
#include <cstddef>

namespace toolfence {

// Delimited block syntaxes.
//   ToolCall:        ```tool_call ... ```
//   ToolResult:      ```tool_result ... ```
//   ToolCallTag:     <tool_call> ... </tool_call>
//   ToolCallLiteral: [name(args)]  (args contain no ')')
enum class FenceKind { ToolCall, ToolResult, ToolCallTag, ToolCallLiteral };

// Offsets of one complete fence inside a text.
struct FenceSpan {
    size_t start = 0;       // first char of the opener
    size_t end = 0;         // one past the closer
    size_t inner_start = 0; // first char after the opener token
    size_t inner_end = 0;   // first char of the closer

    size_t length() const { return end - start; }
};

enum class CloseState {
    Open,   // no closer yet; more input may complete the fence
    Closed, // closer found
    Broken  // the opener turned out not to start a fence (literals only)
};

struct FenceClose {
    CloseState state = CloseState::Open;
    size_t pos = 0;    // first char of the closer (Closed only)
    size_t length = 0; // closer length (Closed only)
};

// Code fence delimiter shared by openers and closers
constexpr const char* kFenceTicks = "```";

// Opener as written by this library ("```tool_call", "<tool_call>", ...).
// Literal openers carry the function name, so "[" is returned for them.
std::string canonical_opener(FenceKind kind);

// Longest accepted opener spelling, separator included. Literal openers
// have no bound and report npos.
size_t max_opener_length(FenceKind kind);

// Length of the opener token starting exactly at pos, or 0 if there is none.
// Backtick fences accept tool_call, tool-call and toolcall in any letter
// case; tags match case-insensitively.
size_t opener_length_at(const std::string& text, size_t pos, FenceKind kind);

// Position of the first opener at or after from, or npos
size_t find_opener(const std::string& text, size_t from, FenceKind kind);

// Look for the closer of a fence whose opener token ends at inner_start.
// Backtick fences close at the first delimiter, tags at the first
// </tool_call>, literals at the first ')' which must be followed by ']'.
FenceClose find_closer(const std::string& text, size_t inner_start, FenceKind kind);

// First complete opener...closer span at or after from.
std::optional<FenceSpan> find_fence(const std::string& text, size_t from, FenceKind kind);

// True when text[pos..] is non-empty and a proper prefix of some opener
// spelling, i.e. more input could still turn it into an opener.
bool could_begin_opener(const std::string& text, size_t pos, FenceKind kind);

// Start of the earliest suffix of text that could still begin an opener,
// or text.size() when there is none.
size_t partial_opener_start(const std::string& text, FenceKind kind);

} // namespace toolfence
