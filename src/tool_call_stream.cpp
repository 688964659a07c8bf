#include "tool_call_stream.hpp"

#include <iostream>

namespace toolfence {

ToolCallStream::ToolCallStream(ParserOptions options)
    : options_(options), detector_(call_fence_kinds(options.grammar)) {}

bool ToolCallStream::feed(const std::string& chunk, const StreamEventCallback& callback) {
    detector_.add_chunk(chunk);
    return drain(callback);
}

bool ToolCallStream::finish(const StreamEventCallback& callback) {
    if (!drain(callback)) return false;

    bool keep_going = true;
    if (detector_.has_content()) {
        if (options_.debug && detector_.in_fence()) {
            std::cerr << "[toolfence] Stream ended inside a tool call block ("
                      << detector_.buffer_size() << " bytes), flushing as text\n";
        }
        StreamEvent event;
        event.type = StreamEventType::Text;
        event.text = detector_.buffer();
        keep_going = callback(event);
    }
    detector_.clear_buffer();
    detector_.reset_streaming_state();
    return keep_going;
}

void ToolCallStream::reset() {
    detector_.clear_buffer();
    detector_.reset_streaming_state();
    tool_calls_.clear();
}

bool ToolCallStream::drain(const StreamEventCallback& callback) {
    while (true) {
        bool was_in_fence = detector_.in_fence();
        auto step = detector_.detect_streaming_fence();

        if (!step.prefix_text.empty()) {
            StreamEvent event;
            event.type = StreamEventType::Text;
            event.text = std::move(step.prefix_text);
            if (!callback(event)) return false;
        }

        if (step.complete_fence) {
            if (!emit_fence(*step.complete_fence, step.kind, callback)) return false;
            continue;
        }

        // Stop once a step neither completed a fence nor changed state
        if (detector_.in_fence() == was_in_fence) return true;
    }
}

bool ToolCallStream::emit_fence(const std::string& fence, FenceKind kind,
                                const StreamEventCallback& callback) {
    StreamEvent event;
    event.type = StreamEventType::ToolCalls;
    event.text = fence;
    event.tool_calls = parse_call_block(fence, kind, options_.debug);

    if (options_.debug) {
        std::cerr << "[toolfence] Fence complete: " << event.tool_calls.size()
                  << " tool call(s)\n";
    }
    tool_calls_.insert(tool_calls_.end(), event.tool_calls.begin(), event.tool_calls.end());
    return callback(event);
}

} // namespace toolfence
