#pragma once
#include "fence.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace toolfence {

// Result of a batch scan over the buffered text.
struct FenceDetection {
    std::string prefix_text;          // prose that can be emitted now
    std::optional<std::string> fence; // complete fence including delimiters
    std::string remaining_text;       // text after the closer (fence found only)
    FenceKind kind = FenceKind::ToolCall; // syntax of fence, when set
};

// Result of one incremental step.
struct StreamingFenceDetection {
    std::string prefix_text;                   // prose released while scanning
    std::optional<std::string> complete_fence; // set when a fence just closed
    FenceKind kind = FenceKind::ToolCall;      // syntax of complete_fence
};

// Separates prose from fenced payloads in a chunked model stream. Never
// drops or duplicates a byte: everything handed out, in order, equals
// everything fed in. One instance per generation turn.
class FenceDetector {
public:
    enum class State { Scanning, InFence };

    explicit FenceDetector(FenceKind kind = FenceKind::ToolCall);

    // Watch for several syntaxes at once; the earliest opener wins
    explicit FenceDetector(std::vector<FenceKind> kinds);

    // Append raw text; classification happens in detect_*()
    void add_chunk(const std::string& chunk);

    // Batch mode. On a complete fence the whole buffer is handed out as
    // prefix/fence/remaining and the buffer is emptied; the caller feeds
    // remaining_text back in if it wants it scanned. Otherwise the prose
    // that cannot start an opener is released and the rest retained.
    FenceDetection detect_fence();

    // Incremental mode. Scanning: releases prose up to a possible opener and
    // switches to InFence once a whole opener is buffered. InFence: returns
    // the complete fence once its closer arrives and switches back, or
    // releases the first char and switches back if the opener turns out
    // not to start a fence. At most one transition per call.
    StreamingFenceDetection detect_streaming_fence();

    bool has_content() const { return !buffer_.empty(); }
    size_t buffer_size() const { return buffer_.size(); }
    const std::string& buffer() const { return buffer_; }
    State state() const { return state_; }
    bool in_fence() const { return state_ == State::InFence; }
    FenceKind fence_kind() const { return active_; } // open or last completed fence

    void clear_buffer();
    void reset_streaming_state();

private:
    // Earliest complete opener of any watched kind at or after from
    size_t next_opener(size_t from, FenceKind& kind) const;
    // Start of the longest buffer suffix that may still become an opener
    size_t holdback_start() const;
    std::string release(size_t count);

    std::vector<FenceKind> kinds_;
    FenceKind active_ = FenceKind::ToolCall;
    std::string buffer_;
    State state_ = State::Scanning;
};

} // namespace toolfence
