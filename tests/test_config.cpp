#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "log.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace gitmcp;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.scripts_dir.empty());
    REQUIRE(cfg.log_level == "info");
    REQUIRE(cfg.sentinel_script == "git-undo");
}

TEST_CASE("Config::defaults_json: matches struct defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    REQUIRE(cfg.scripts_dir.empty());
    REQUIRE(cfg.log_level == "info");
    REQUIRE(cfg.sentinel_script == "git-undo");
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every field", "[config]") {
    Config cfg = Config::from_json({
        {"scripts_dir", "/opt/git-scripts"},
        {"log_level", "debug"},
        {"sentinel_script", "git-redo"},
    });
    REQUIRE(cfg.scripts_dir == "/opt/git-scripts");
    REQUIRE(cfg.log_level == "debug");
    REQUIRE(cfg.sentinel_script == "git-redo");
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    Config cfg = Config::from_json({
        {"scripts_dir", 42},
        {"log_level", false},
        {"sentinel_script", ""},
    });
    REQUIRE(cfg.scripts_dir.empty());
    REQUIRE(cfg.log_level == "info");
    REQUIRE(cfg.sentinel_script == "git-undo");
}

TEST_CASE("Config::from_json: non-object gives defaults", "[config]") {
    Config cfg = Config::from_json(nlohmann::json::array());
    REQUIRE(cfg.log_level == "info");
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "gitmcp_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("GIT_SCRIPTS_DIR");
        unsetenv("GIT_SCRIPTS_MCP_LOG_LEVEL");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("GIT_SCRIPTS_DIR");
        unsetenv("GIT_SCRIPTS_MCP_LOG_LEVEL");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.git-scripts-mcp/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.git-scripts-mcp");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads default config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    g.write_config(R"({"scripts_dir": "/srv/scripts", "log_level": "warn"})");

    Config cfg = Config::load();
    REQUIRE(cfg.scripts_dir == "/srv/scripts");
    REQUIRE(cfg.log_level == "warn");
    REQUIRE(cfg.sentinel_script == "git-undo");
}

TEST_CASE("Config::load: missing file gives defaults and writes nothing", "[config]") {
    ConfigTestGuard g;
    Config cfg = Config::load();
    REQUIRE(cfg.scripts_dir.empty());
    REQUIRE(cfg.log_level == "info");
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not valid json");
    Config cfg = Config::load();
    REQUIRE(cfg.scripts_dir.empty());
    REQUIRE(cfg.log_level == "info");
}

TEST_CASE("Config::load: partial file keeps defaults for missing keys", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"log_level": "error", "unrelated": {"nested": true}})");
    Config cfg = Config::load();
    REQUIRE(cfg.log_level == "error");
    REQUIRE(cfg.scripts_dir.empty());
    REQUIRE(cfg.sentinel_script == "git-undo");
}

TEST_CASE("Config::load: non-object file falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"(["scripts_dir", "/ignored"])");
    Config cfg = Config::load();
    REQUIRE(cfg.scripts_dir.empty());
    REQUIRE(cfg.log_level == "info");
    REQUIRE(cfg.sentinel_script == "git-undo");
}

TEST_CASE("Config::load: explicit path", "[config]") {
    ConfigTestGuard g;
    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({"sentinel_script": "git-recommit"})";
    }
    Config cfg = Config::load(path);
    REQUIRE(cfg.sentinel_script == "git-recommit");
}

TEST_CASE("Config::load: tilde in scripts_dir expanded", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"scripts_dir": "~/bin"})");
    Config cfg = Config::load();
    REQUIRE(cfg.scripts_dir == g.dir + "/bin");
}

TEST_CASE("Config::load: environment overrides file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"scripts_dir": "/from/file", "log_level": "error"})");
    setenv("GIT_SCRIPTS_DIR", "/from/env", 1);
    setenv("GIT_SCRIPTS_MCP_LOG_LEVEL", "debug", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.scripts_dir == "/from/env");
    REQUIRE(cfg.log_level == "debug");
}

TEST_CASE("Config::apply_env: empty variables ignored", "[config]") {
    ConfigTestGuard g;
    setenv("GIT_SCRIPTS_DIR", "", 1);
    Config cfg;
    cfg.scripts_dir = "/kept";
    cfg.apply_env();
    REQUIRE(cfg.scripts_dir == "/kept");
}

// ── log levels ───────────────────────────────────────────────────

TEST_CASE("parse_log_level: known names, any case", "[config]") {
    LogLevel level = LogLevel::Info;
    REQUIRE(parse_log_level("DEBUG", level));
    REQUIRE(level == LogLevel::Debug);
    REQUIRE(parse_log_level("warning", level));
    REQUIRE(level == LogLevel::Warn);
    REQUIRE(parse_log_level("error", level));
    REQUIRE(level == LogLevel::Error);
}

TEST_CASE("parse_log_level: unknown name leaves level untouched", "[config]") {
    LogLevel level = LogLevel::Warn;
    REQUIRE_FALSE(parse_log_level("verbose", level));
    REQUIRE(level == LogLevel::Warn);
}

TEST_CASE("set_log_level: round trips", "[config]") {
    LogLevel saved = log_level();
    set_log_level(LogLevel::Error);
    REQUIRE(log_level() == LogLevel::Error);
    set_log_level(saved);
}
