#include "config.hpp"
#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>

namespace toolfence {

namespace {

std::optional<bool> parse_bool_flag(const std::string& raw) {
    std::string v = trim(raw);
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

void apply_bool_env(const char* name, bool& target) {
    const char* raw = std::getenv(name);
    if (!raw) return;
    auto value = parse_bool_flag(raw);
    if (value) {
        target = *value;
    } else {
        std::cerr << "[config] Ignoring " << name << "=" << raw << ": expected a boolean\n";
    }
}

bool resolve_flag(const nlohmann::json& call_options, const char* key, bool configured) {
    if (call_options.is_object()) {
        auto it = call_options.find(key);
        if (it != call_options.end() && it->is_boolean()) return it->get<bool>();
    }
    return configured;
}

} // namespace

nlohmann::json ProtocolConfig::defaults_json() {
    return {
        {"grammar", "json"},
        {"allow_parallel_tool_calls", false},
        {"debug_tool_calls", false}
    };
}

ProtocolConfig ProtocolConfig::from_json(const nlohmann::json& j) {
    ProtocolConfig cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("grammar") && j["grammar"].is_string()) {
        auto name = j["grammar"].get<std::string>();
        if (auto grammar = parse_grammar(name)) {
            cfg.grammar = *grammar;
        } else {
            std::cerr << "[config] Unknown grammar \"" << name << "\", using "
                      << grammar_name(cfg.grammar) << "\n";
        }
    }
    if (j.contains("allow_parallel_tool_calls") && j["allow_parallel_tool_calls"].is_boolean())
        cfg.allow_parallel_tool_calls = j["allow_parallel_tool_calls"].get<bool>();
    if (j.contains("debug_tool_calls") && j["debug_tool_calls"].is_boolean())
        cfg.debug_tool_calls = j["debug_tool_calls"].get<bool>();

    return cfg;
}

ProtocolConfig ProtocolConfig::load(const std::string& path) {
    nlohmann::json j = defaults_json();

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            j = nlohmann::json::parse(file);
        } catch (const std::exception&) {
            std::cerr << "[config] Malformed config file " << path << ", using defaults\n";
            j = defaults_json();
        }
    }

    ProtocolConfig cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void ProtocolConfig::apply_env() {
    if (const char* raw = std::getenv("TOOLFENCE_GRAMMAR")) {
        if (auto value = parse_grammar(raw)) {
            grammar = *value;
        } else {
            std::cerr << "[config] Ignoring TOOLFENCE_GRAMMAR=" << raw
                      << ": expected json or extended\n";
        }
    }
    apply_bool_env("TOOLFENCE_PARALLEL_TOOL_CALLS", allow_parallel_tool_calls);
    apply_bool_env("TOOLFENCE_DEBUG_TOOL_CALLS", debug_tool_calls);
}

nlohmann::json ProtocolConfig::to_json() const {
    return {
        {"grammar", grammar_name(grammar)},
        {"allow_parallel_tool_calls", allow_parallel_tool_calls},
        {"debug_tool_calls", debug_tool_calls}
    };
}

PromptOptions ProtocolConfig::prompt_options() const {
    PromptOptions options;
    options.allow_parallel_tool_calls = allow_parallel_tool_calls;
    return options;
}

ParserOptions ProtocolConfig::parser_options() const {
    ParserOptions options;
    options.grammar = grammar;
    options.debug = debug_tool_calls;
    return options;
}

bool resolve_parallel_tool_calls(const nlohmann::json& call_options,
                                 const ProtocolConfig& config) {
    return resolve_flag(call_options, "parallel_tool_calls", config.allow_parallel_tool_calls);
}

bool resolve_debug_tool_calls(const nlohmann::json& call_options,
                              const ProtocolConfig& config) {
    return resolve_flag(call_options, "debug_tool_calls", config.debug_tool_calls);
}

} // namespace toolfence
