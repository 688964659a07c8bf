#include "fence.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace toolfence {

namespace {

constexpr const char* kOpenTag = "<tool_call>";
constexpr const char* kCloseTag = "</tool_call>";

const char* kind_word(FenceKind kind) {
    return kind == FenceKind::ToolResult ? "result" : "call";
}

bool is_separator(char c) {
    return c == '_' || c == '-';
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

char first_char(FenceKind kind) {
    switch (kind) {
        case FenceKind::ToolCallTag: return '<';
        case FenceKind::ToolCallLiteral: return '[';
        default: return '`';
    }
}

size_t find_ci(const std::string& text, const char* literal, size_t from) {
    size_t len = std::strlen(literal);
    for (size_t pos = from; pos + len <= text.size(); ++pos) {
        if (match_ci(text, pos, literal) == len) return pos;
    }
    return std::string::npos;
}

// ```tool_call / ```tool-call / ```toolcall (or result)
size_t backtick_opener_length(const std::string& text, size_t pos, FenceKind kind) {
    size_t p = pos;
    if (match_ci(text, p, kFenceTicks) != 3) return 0;
    p += 3;
    if (match_ci(text, p, "tool") != 4) return 0;
    p += 4;
    if (p < text.size() && is_separator(text[p])) ++p;

    const char* word = kind_word(kind);
    size_t word_len = std::strlen(word);
    if (match_ci(text, p, word) != word_len) return 0;
    return p + word_len - pos;
}

// [name(
size_t literal_opener_length(const std::string& text, size_t pos) {
    if (pos >= text.size() || text[pos] != '[') return 0;
    size_t p = pos + 1;
    while (p < text.size() && is_word_char(text[p])) ++p;
    if (p == pos + 1 || p >= text.size() || text[p] != '(') return 0;
    return p + 1 - pos;
}

bool could_begin_backtick_opener(const std::string& text, size_t pos, FenceKind kind) {
    size_t p = pos;

    size_t m = match_ci(text, p, kFenceTicks);
    if (m < 3) return p + m == text.size();
    p += 3;

    m = match_ci(text, p, "tool");
    if (m < 4) return p + m == text.size();
    p += 4;
    if (p == text.size()) return true;

    if (is_separator(text[p])) {
        ++p;
        if (p == text.size()) return true;
    }

    const char* word = kind_word(kind);
    m = match_ci(text, p, word);
    if (m < std::strlen(word)) return p + m == text.size();
    return false; // already a complete opener
}

} // namespace

std::string canonical_opener(FenceKind kind) {
    switch (kind) {
        case FenceKind::ToolCallTag: return kOpenTag;
        case FenceKind::ToolCallLiteral: return "[";
        default: return std::string(kFenceTicks) + "tool_" + kind_word(kind);
    }
}

size_t max_opener_length(FenceKind kind) {
    if (kind == FenceKind::ToolCallLiteral) return std::string::npos;
    return canonical_opener(kind).size();
}

size_t opener_length_at(const std::string& text, size_t pos, FenceKind kind) {
    switch (kind) {
        case FenceKind::ToolCallTag: {
            size_t len = std::strlen(kOpenTag);
            return match_ci(text, pos, kOpenTag) == len ? len : 0;
        }
        case FenceKind::ToolCallLiteral:
            return literal_opener_length(text, pos);
        default:
            return backtick_opener_length(text, pos, kind);
    }
}

size_t find_opener(const std::string& text, size_t from, FenceKind kind) {
    char c = first_char(kind);
    size_t pos = from;
    while ((pos = text.find(c, pos)) != std::string::npos) {
        if (opener_length_at(text, pos, kind) > 0) return pos;
        ++pos;
    }
    return std::string::npos;
}

FenceClose find_closer(const std::string& text, size_t inner_start, FenceKind kind) {
    FenceClose close;

    if (kind == FenceKind::ToolCallLiteral) {
        size_t paren = text.find(')', inner_start);
        if (paren == std::string::npos || paren + 1 >= text.size()) return close;
        if (text[paren + 1] != ']') {
            close.state = CloseState::Broken;
            return close;
        }
        close.state = CloseState::Closed;
        close.pos = paren;
        close.length = 2;
        return close;
    }

    size_t pos = kind == FenceKind::ToolCallTag ? find_ci(text, kCloseTag, inner_start)
                                                : text.find(kFenceTicks, inner_start);
    if (pos == std::string::npos) return close;

    close.state = CloseState::Closed;
    close.pos = pos;
    close.length = kind == FenceKind::ToolCallTag ? std::strlen(kCloseTag) : 3;
    return close;
}

std::optional<FenceSpan> find_fence(const std::string& text, size_t from, FenceKind kind) {
    size_t start;
    while ((start = find_opener(text, from, kind)) != std::string::npos) {
        size_t inner_start = start + opener_length_at(text, start, kind);
        auto close = find_closer(text, inner_start, kind);

        // Any later opener would need a closer after this point too
        if (close.state == CloseState::Open) return std::nullopt;
        if (close.state == CloseState::Broken) {
            from = start + 1;
            continue;
        }

        FenceSpan span;
        span.start = start;
        span.inner_start = inner_start;
        span.inner_end = close.pos;
        span.end = close.pos + close.length;
        return span;
    }
    return std::nullopt;
}

bool could_begin_opener(const std::string& text, size_t pos, FenceKind kind) {
    if (pos >= text.size()) return false;

    switch (kind) {
        case FenceKind::ToolCallTag: {
            size_t m = match_ci(text, pos, kOpenTag);
            return m < std::strlen(kOpenTag) && pos + m == text.size();
        }
        case FenceKind::ToolCallLiteral:
            // '[' followed by nothing but word characters so far
            return text[pos] == '[' &&
                   std::all_of(text.begin() + static_cast<std::ptrdiff_t>(pos) + 1, text.end(),
                               is_word_char);
        default:
            return could_begin_backtick_opener(text, pos, kind);
    }
}

size_t partial_opener_start(const std::string& text, FenceKind kind) {
    if (kind == FenceKind::ToolCallLiteral) {
        // Only the last '[' can be followed by word characters alone
        size_t pos = text.rfind('[');
        if (pos != std::string::npos && could_begin_opener(text, pos, kind)) return pos;
        return text.size();
    }

    // A retained tail is always shorter than the longest opener
    size_t window = std::min(text.size(), max_opener_length(kind) - 1);
    for (size_t pos = text.size() - window; pos < text.size(); ++pos) {
        if (could_begin_opener(text, pos, kind)) return pos;
    }
    return text.size();
}

} // namespace toolfence
