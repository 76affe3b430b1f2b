#include "config.hpp"
#include "dispatcher.hpp"
#include "log.hpp"
#include "script_locator.hpp"
#include "server.hpp"
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

static void print_usage() {
    std::cerr << "Usage: git-scripts-mcp [options]\n"
              << "\n"
              << "Serves the git-scripts collection as MCP tools over stdin/stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --scripts-dir DIR    Directory holding the git-* scripts\n"
              << "                       (default: one level above this binary's directory)\n"
              << "  --config PATH        Config file (default: ~/.git-scripts-mcp/config.json)\n"
              << "  --log-level LEVEL    debug, info, warn or error (default: info)\n"
              << "  --check              Report which scripts are installed and exit\n"
              << "  --version            Print version and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  GIT_SCRIPTS_DIR            Overrides the scripts directory\n"
              << "  GIT_SCRIPTS_MCP_LOG_LEVEL  Overrides the log level\n";
}

static int run_check(const gitmcp::Dispatcher& dispatcher) {
    const auto& scripts = dispatcher.scripts();
    std::cout << "Scripts directory: " << scripts.root().string() << "\n";

    int missing = 0;
    for (const auto& status : gitmcp::check_scripts(scripts, dispatcher.required_scripts())) {
        const char* state = "ok";
        if (!status.present) {
            state = "MISSING";
            missing++;
        } else if (!status.executable) {
            state = "NOT EXECUTABLE";
            missing++;
        }
        std::cout << "  " << status.name << ": " << state << "\n";
    }

    if (missing > 0) {
        std::cout << missing << " script(s) unavailable.\n";
        return 1;
    }
    std::cout << "All scripts available.\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string scripts_dir;
    std::string config_path;
    std::string log_level;
    bool check = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << gitmcp::McpServer::kServerName << " "
                      << gitmcp::McpServer::kServerVersion << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "--scripts-dir") == 0 && i + 1 < argc) {
            scripts_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            log_level = argv[++i];
        } else if (std::strcmp(argv[i], "--check") == 0) {
            check = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = gitmcp::Config::load(config_path);

    // Override config with CLI args
    if (!scripts_dir.empty()) config.scripts_dir = scripts_dir;
    if (!log_level.empty()) config.log_level = log_level;

    gitmcp::LogLevel level;
    if (gitmcp::parse_log_level(config.log_level, level)) {
        gitmcp::set_log_level(level);
    } else {
        gitmcp::log_warn("config", "Unknown log level '" + config.log_level + "', using info");
    }

    std::filesystem::path root = config.scripts_dir.empty()
        ? gitmcp::ScriptLocator::install_root_for(gitmcp::ScriptLocator::self_executable(argv[0]))
        : std::filesystem::path(config.scripts_dir);

    gitmcp::Dispatcher dispatcher{gitmcp::ScriptLocator(root)};

    if (check) {
        return run_check(dispatcher);
    }

    if (!dispatcher.scripts().exists(config.sentinel_script)) {
        gitmcp::log_error("server", "Git scripts not found in: " +
                                        dispatcher.scripts().root().string());
        gitmcp::log_error("server", "Please ensure git scripts are installed and accessible");
        return 1;
    }
    gitmcp::log_info("server", "Git scripts found in: " + dispatcher.scripts().root().string());

    // Writes to an exited child or a closed stdout must fail with EPIPE,
    // not kill the bridge.
    std::signal(SIGPIPE, SIG_IGN);

    gitmcp::McpServer server(dispatcher, STDIN_FILENO, STDOUT_FILENO);
    gitmcp::log_info("server", "Git Scripts MCP Server starting...");
    return server.run();
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
