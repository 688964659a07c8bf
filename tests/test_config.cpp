#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace toolfence;
using json = nlohmann::json;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("ProtocolConfig: default values", "[config]") {
    ProtocolConfig cfg;
    REQUIRE(cfg.grammar == Grammar::Json);
    REQUIRE_FALSE(cfg.allow_parallel_tool_calls);
    REQUIRE_FALSE(cfg.debug_tool_calls);
}

TEST_CASE("ProtocolConfig::defaults_json: matches default struct", "[config]") {
    auto cfg = ProtocolConfig::from_json(ProtocolConfig::defaults_json());
    REQUIRE(cfg.grammar == Grammar::Json);
    REQUIRE_FALSE(cfg.allow_parallel_tool_calls);
    REQUIRE_FALSE(cfg.debug_tool_calls);
    REQUIRE(ProtocolConfig{}.to_json() == ProtocolConfig::defaults_json());
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("ProtocolConfig::from_json: reads all keys", "[config]") {
    auto cfg = ProtocolConfig::from_json(json{
        {"grammar", "extended"},
        {"allow_parallel_tool_calls", true},
        {"debug_tool_calls", true}
    });
    REQUIRE(cfg.grammar == Grammar::Extended);
    REQUIRE(cfg.allow_parallel_tool_calls);
    REQUIRE(cfg.debug_tool_calls);
}

TEST_CASE("ProtocolConfig::from_json: ill-typed values keep defaults", "[config]") {
    auto cfg = ProtocolConfig::from_json(json{
        {"grammar", 7},
        {"allow_parallel_tool_calls", "true"},
        {"debug_tool_calls", 1}
    });
    REQUIRE(cfg.grammar == Grammar::Json);
    REQUIRE_FALSE(cfg.allow_parallel_tool_calls);
    REQUIRE_FALSE(cfg.debug_tool_calls);
}

TEST_CASE("ProtocolConfig::from_json: unknown grammar keeps default", "[config]") {
    auto cfg = ProtocolConfig::from_json(json{{"grammar", "xml"}});
    REQUIRE(cfg.grammar == Grammar::Json);
}

TEST_CASE("ProtocolConfig::from_json: non-object gives defaults", "[config]") {
    auto cfg = ProtocolConfig::from_json(json::array({1, 2}));
    REQUIRE(cfg.grammar == Grammar::Json);
    REQUIRE_FALSE(cfg.allow_parallel_tool_calls);
}

TEST_CASE("ProtocolConfig::from_json: unknown keys ignored", "[config]") {
    auto cfg = ProtocolConfig::from_json(json{{"model", "x"}, {"debug_tool_calls", true}});
    REQUIRE(cfg.debug_tool_calls);
}

// ── parse_grammar / grammar_name ─────────────────────────────────

TEST_CASE("parse_grammar: accepts known names case-insensitively", "[config]") {
    REQUIRE(parse_grammar("json") == Grammar::Json);
    REQUIRE(parse_grammar(" Extended ") == Grammar::Extended);
    REQUIRE_FALSE(parse_grammar("").has_value());
    REQUIRE_FALSE(parse_grammar("jsonx").has_value());
    REQUIRE(std::string(grammar_name(Grammar::Extended)) == "extended");
}

// ── ProtocolConfig::load ─────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "toolfence_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: temp dir plus cleared TOOLFENCE_* env vars, restored on destruction
struct ConfigTestGuard {
    std::string dir;

    ConfigTestGuard() {
        dir = make_temp_dir();
        clear_env();
    }

    ~ConfigTestGuard() {
        clear_env();
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string write(const std::string& name, const std::string& content) const {
        std::string path = dir + "/" + name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    static void clear_env() {
        unsetenv("TOOLFENCE_GRAMMAR");
        unsetenv("TOOLFENCE_PARALLEL_TOOL_CALLS");
        unsetenv("TOOLFENCE_DEBUG_TOOL_CALLS");
    }
};

TEST_CASE("ProtocolConfig::load: missing file gives defaults", "[config]") {
    ConfigTestGuard guard;
    auto cfg = ProtocolConfig::load(guard.dir + "/nonexistent.json");
    REQUIRE(cfg.grammar == Grammar::Json);
    REQUIRE_FALSE(cfg.allow_parallel_tool_calls);
    REQUIRE_FALSE(cfg.debug_tool_calls);
}

TEST_CASE("ProtocolConfig::load: malformed file gives defaults", "[config]") {
    ConfigTestGuard guard;
    auto path = guard.write("config.json", "{ not json");
    auto cfg = ProtocolConfig::load(path);
    REQUIRE(cfg.grammar == Grammar::Json);
    REQUIRE_FALSE(cfg.allow_parallel_tool_calls);
}

TEST_CASE("ProtocolConfig::load: reads file values", "[config]") {
    ConfigTestGuard guard;
    auto path = guard.write("config.json",
        R"({"grammar": "extended", "allow_parallel_tool_calls": true})");
    auto cfg = ProtocolConfig::load(path);
    REQUIRE(cfg.grammar == Grammar::Extended);
    REQUIRE(cfg.allow_parallel_tool_calls);
    REQUIRE_FALSE(cfg.debug_tool_calls);
}

TEST_CASE("ProtocolConfig::load: env overrides file", "[config]") {
    ConfigTestGuard guard;
    auto path = guard.write("config.json",
        R"({"grammar": "extended", "allow_parallel_tool_calls": true})");
    setenv("TOOLFENCE_GRAMMAR", "json", 1);
    setenv("TOOLFENCE_PARALLEL_TOOL_CALLS", "off", 1);
    setenv("TOOLFENCE_DEBUG_TOOL_CALLS", "YES", 1);

    auto cfg = ProtocolConfig::load(path);
    REQUIRE(cfg.grammar == Grammar::Json);
    REQUIRE_FALSE(cfg.allow_parallel_tool_calls);
    REQUIRE(cfg.debug_tool_calls);
}

TEST_CASE("ProtocolConfig::apply_env: invalid values ignored", "[config]") {
    ConfigTestGuard guard;
    setenv("TOOLFENCE_GRAMMAR", "yaml", 1);
    setenv("TOOLFENCE_PARALLEL_TOOL_CALLS", "maybe", 1);

    ProtocolConfig cfg;
    cfg.grammar = Grammar::Extended;
    cfg.allow_parallel_tool_calls = true;
    cfg.apply_env();
    REQUIRE(cfg.grammar == Grammar::Extended);
    REQUIRE(cfg.allow_parallel_tool_calls);
}

TEST_CASE("ProtocolConfig::apply_env: numeric flags", "[config]") {
    ConfigTestGuard guard;
    setenv("TOOLFENCE_PARALLEL_TOOL_CALLS", "1", 1);
    setenv("TOOLFENCE_DEBUG_TOOL_CALLS", "0", 1);

    ProtocolConfig cfg;
    cfg.debug_tool_calls = true;
    cfg.apply_env();
    REQUIRE(cfg.allow_parallel_tool_calls);
    REQUIRE_FALSE(cfg.debug_tool_calls);
}

// ── Derived options ──────────────────────────────────────────────

TEST_CASE("ProtocolConfig: to_json round-trips through from_json", "[config]") {
    ProtocolConfig cfg;
    cfg.grammar = Grammar::Extended;
    cfg.debug_tool_calls = true;

    auto j = cfg.to_json();
    REQUIRE(j["grammar"] == "extended");
    REQUIRE(j["debug_tool_calls"] == true);

    auto back = ProtocolConfig::from_json(j);
    REQUIRE(back.grammar == Grammar::Extended);
    REQUIRE(back.debug_tool_calls);
    REQUIRE_FALSE(back.allow_parallel_tool_calls);
}

TEST_CASE("ProtocolConfig: prompt and parser options", "[config]") {
    ProtocolConfig cfg;
    cfg.grammar = Grammar::Extended;
    cfg.allow_parallel_tool_calls = true;
    cfg.debug_tool_calls = true;

    REQUIRE(cfg.prompt_options().allow_parallel_tool_calls);
    auto parser = cfg.parser_options();
    REQUIRE(parser.grammar == Grammar::Extended);
    REQUIRE(parser.debug);
}

// ── Per-call overrides ───────────────────────────────────────────

TEST_CASE("resolve_parallel_tool_calls: per-call boolean wins", "[config]") {
    ProtocolConfig cfg;
    cfg.allow_parallel_tool_calls = true;
    REQUIRE_FALSE(resolve_parallel_tool_calls(json{{"parallel_tool_calls", false}}, cfg));

    cfg.allow_parallel_tool_calls = false;
    REQUIRE(resolve_parallel_tool_calls(json{{"parallel_tool_calls", true}}, cfg));
}

TEST_CASE("resolve_parallel_tool_calls: falls back to config", "[config]") {
    ProtocolConfig cfg;
    REQUIRE_FALSE(resolve_parallel_tool_calls(json::object(), cfg));
    REQUIRE_FALSE(resolve_parallel_tool_calls(nullptr, cfg));

    cfg.allow_parallel_tool_calls = true;
    REQUIRE(resolve_parallel_tool_calls(json{{"parallel_tool_calls", "no"}}, cfg));
    REQUIRE(resolve_parallel_tool_calls(json::array(), cfg));
}

TEST_CASE("resolve_debug_tool_calls: per-call boolean wins", "[config]") {
    ProtocolConfig cfg;
    REQUIRE(resolve_debug_tool_calls(json{{"debug_tool_calls", true}}, cfg));
    REQUIRE_FALSE(resolve_debug_tool_calls(json{{"debug_tool_calls", 1}}, cfg));

    cfg.debug_tool_calls = true;
    REQUIRE(resolve_debug_tool_calls(json{{"other", false}}, cfg));
}
