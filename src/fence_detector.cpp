#include "fence_detector.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace toolfence {

FenceDetector::FenceDetector(FenceKind kind)
    : FenceDetector(std::vector<FenceKind>{kind}) {}

FenceDetector::FenceDetector(std::vector<FenceKind> kinds)
    : kinds_(std::move(kinds)) {
    if (kinds_.empty()) throw std::invalid_argument("FenceDetector needs at least one fence kind");
    active_ = kinds_.front();
}

void FenceDetector::add_chunk(const std::string& chunk) {
    buffer_ += chunk;
}

FenceDetection FenceDetector::detect_fence() {
    FenceDetection result;

    size_t from = 0;
    while (true) {
        FenceKind kind = kinds_.front();
        size_t opener = next_opener(from, kind);
        if (opener == std::string::npos) {
            result.prefix_text = release(holdback_start());
            return result;
        }

        size_t inner = opener + opener_length_at(buffer_, opener, kind);
        auto close = find_closer(buffer_, inner, kind);
        if (close.state == CloseState::Broken) {
            from = opener + 1;
            continue;
        }
        // An opener without its closer: keep everything from the opener on
        if (close.state == CloseState::Open) {
            result.prefix_text = release(opener);
            return result;
        }

        size_t end = close.pos + close.length;
        result.prefix_text = buffer_.substr(0, opener);
        result.fence = buffer_.substr(opener, end - opener);
        result.remaining_text = buffer_.substr(end);
        result.kind = kind;
        active_ = kind;
        buffer_.clear();
        return result;
    }
}

StreamingFenceDetection FenceDetector::detect_streaming_fence() {
    StreamingFenceDetection result;

    if (state_ == State::Scanning) {
        FenceKind kind = kinds_.front();
        size_t opener = next_opener(0, kind);
        if (opener == std::string::npos) {
            result.prefix_text = release(holdback_start());
            return result;
        }
        result.prefix_text = release(opener);
        active_ = kind;
        state_ = State::InFence;
        return result;
    }

    // InFence: the buffer starts with the opener
    size_t token = opener_length_at(buffer_, 0, active_);
    auto close = find_closer(buffer_, token, active_);
    switch (close.state) {
        case CloseState::Open:
            break;
        case CloseState::Broken:
            result.prefix_text = release(1);
            state_ = State::Scanning;
            break;
        case CloseState::Closed:
            result.complete_fence = release(close.pos + close.length);
            result.kind = active_;
            state_ = State::Scanning;
            break;
    }
    return result;
}

void FenceDetector::clear_buffer() {
    buffer_.clear();
}

void FenceDetector::reset_streaming_state() {
    state_ = State::Scanning;
    active_ = kinds_.front();
}

size_t FenceDetector::next_opener(size_t from, FenceKind& kind) const {
    size_t best = std::string::npos;
    for (auto candidate : kinds_) {
        size_t pos = find_opener(buffer_, from, candidate);
        if (pos < best) {
            best = pos;
            kind = candidate;
        }
    }
    return best;
}

size_t FenceDetector::holdback_start() const {
    size_t keep = buffer_.size();
    for (auto kind : kinds_) keep = std::min(keep, partial_opener_start(buffer_, kind));
    return keep;
}

std::string FenceDetector::release(size_t count) {
    std::string out = buffer_.substr(0, count);
    buffer_.erase(0, count);
    return out;
}

} // namespace toolfence
