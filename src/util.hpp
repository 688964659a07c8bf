#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace toolfence {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII case-insensitive compare of text[pos..] against literal, limited to
// the characters available in text. Returns the number of matching chars.
size_t match_ci(const std::string& text, size_t pos, const char* literal);

// Replace every run of two or more '\n' with a single '\n'
std::string collapse_newline_runs(const std::string& s);

// Unix epoch milliseconds
uint64_t epoch_millis();

// Tool call ID in the form call_<epoch-millis>_<7 base-36 chars>
std::string generate_tool_call_id();

} // namespace toolfence
