#pragma once
#include "fence_detector.hpp"
#include "tool_call_parser.hpp"
#include <string>
#include <vector>
#include <functional>

namespace toolfence {

enum class StreamEventType { Text, ToolCalls };

struct StreamEvent {
    StreamEventType type = StreamEventType::Text;
    std::string text;                        // prose delta, or the raw call block
    std::vector<ParsedToolCall> tool_calls;  // ToolCalls only; may be empty
};

// Callback receives each event in stream order. Return false to stop.
using StreamEventCallback = std::function<bool(const StreamEvent& event)>;

// Turns one streamed model turn into prose deltas and parsed tool calls.
// Event texts, concatenated, reproduce the chunks fed in.
class ToolCallStream {
public:
    explicit ToolCallStream(ParserOptions options = {});

    // Feed a raw chunk. Returns false if the callback asked to stop; the
    // unprocessed remainder then stays buffered.
    bool feed(const std::string& chunk, const StreamEventCallback& callback);

    // End of stream: anything still buffered, including an unterminated
    // fence, is flushed as a final Text event.
    bool finish(const StreamEventCallback& callback);

    // Drop all state, e.g. when the turn is aborted
    void reset();

    const std::vector<ParsedToolCall>& tool_calls() const { return tool_calls_; }
    bool in_fence() const { return detector_.in_fence(); }

private:
    bool drain(const StreamEventCallback& callback);
    bool emit_fence(const std::string& fence, FenceKind kind,
                    const StreamEventCallback& callback);

    ParserOptions options_;
    FenceDetector detector_;
    std::vector<ParsedToolCall> tool_calls_;
};

} // namespace toolfence
