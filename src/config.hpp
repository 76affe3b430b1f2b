#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace gitmcp {

struct Config {
    std::string scripts_dir;                 // empty = derive from executable location
    std::string log_level = "info";
    std::string sentinel_script = "git-undo"; // must exist for the server to start

    // Load from `path` (or ~/.git-scripts-mcp/config.json when empty) +
    // env vars. A missing file means defaults; the file is never written.
    static Config load(const std::string& path = "");

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build from a JSON object; missing fields and fields of the wrong type
    // keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // GIT_SCRIPTS_DIR and GIT_SCRIPTS_MCP_LOG_LEVEL override the file.
    void apply_env();
};

std::string default_config_path();

} // namespace gitmcp
