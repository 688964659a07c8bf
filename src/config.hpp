#pragma once
#include "prompt.hpp"
#include "tool_call_parser.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace toolfence {

struct ProtocolConfig {
    Grammar grammar = Grammar::Json;        // which call syntaxes the backend emits
    bool allow_parallel_tool_calls = false; // several calls per fence
    bool debug_tool_calls = false;          // log parse decisions to stderr

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Read known keys; missing or ill-typed values keep their defaults
    static ProtocolConfig from_json(const nlohmann::json& j);

    // Load a JSON config file, then apply env overrides. A missing or
    // malformed file falls back to defaults.
    static ProtocolConfig load(const std::string& path);

    // TOOLFENCE_GRAMMAR, TOOLFENCE_PARALLEL_TOOL_CALLS, TOOLFENCE_DEBUG_TOOL_CALLS
    void apply_env();

    nlohmann::json to_json() const;

    PromptOptions prompt_options() const;
    ParserOptions parser_options() const;
};

// Per-call overrides. A boolean "parallel_tool_calls" / "debug_tool_calls"
// in call_options wins; anything else falls back to the configured value.
bool resolve_parallel_tool_calls(const nlohmann::json& call_options,
                                 const ProtocolConfig& config);
bool resolve_debug_tool_calls(const nlohmann::json& call_options,
                              const ProtocolConfig& config);

} // namespace toolfence
