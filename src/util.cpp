#include "util.hpp"

#include <cctype>
#include <chrono>
#include <random>
#include <sstream>

namespace toolfence {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

size_t match_ci(const std::string& text, size_t pos, const char* literal) {
    size_t n = 0;
    while (literal[n] != '\0' && pos + n < text.size()) {
        auto a = std::tolower(static_cast<unsigned char>(text[pos + n]));
        auto b = std::tolower(static_cast<unsigned char>(literal[n]));
        if (a != b) break;
        ++n;
    }
    return n;
}

std::string collapse_newline_runs(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\n' && !out.empty() && out.back() == '\n') continue;
        out += c;
    }
    return out;
}

uint64_t epoch_millis() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::string generate_tool_call_id() {
    static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<int> dist(0, 35);

    std::string suffix;
    for (int i = 0; i < 7; ++i) {
        suffix += kAlphabet[dist(gen)];
    }
    return "call_" + std::to_string(epoch_millis()) + "_" + suffix;
}

} // namespace toolfence
