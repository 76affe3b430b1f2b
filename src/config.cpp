#include "config.hpp"
#include "log.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace gitmcp {

std::string default_config_path() {
    return expand_home("~/.git-scripts-mcp/config.json");
}

nlohmann::json Config::defaults_json() {
    return {
        {"scripts_dir", ""},
        {"log_level", "info"},
        {"sentinel_script", "git-undo"},
    };
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("scripts_dir") && j["scripts_dir"].is_string())
        cfg.scripts_dir = expand_home(j["scripts_dir"].get<std::string>());
    if (j.contains("log_level") && j["log_level"].is_string())
        cfg.log_level = j["log_level"].get<std::string>();
    if (j.contains("sentinel_script") && j["sentinel_script"].is_string() &&
        !j["sentinel_script"].get<std::string>().empty())
        cfg.sentinel_script = j["sentinel_script"].get<std::string>();
    return cfg;
}

Config Config::load(const std::string& path) {
    std::string config_path = path.empty() ? default_config_path() : expand_home(path);
    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json parsed = nlohmann::json::parse(file);
            if (parsed.is_object()) {
                j = std::move(parsed);
            } else {
                log_warn("config", "Ignoring non-object config: " + config_path);
            }
        } catch (const nlohmann::json::exception& e) {
            // Malformed config: fall back to defaults
            log_warn("config", "Ignoring malformed config " + config_path + ": " + e.what());
        }
    } else if (!path.empty()) {
        log_warn("config", "Config file not found: " + config_path);
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("GIT_SCRIPTS_DIR"); v && *v)
        scripts_dir = expand_home(v);
    if (const char* v = std::getenv("GIT_SCRIPTS_MCP_LOG_LEVEL"); v && *v)
        log_level = v;
}

} // namespace gitmcp
