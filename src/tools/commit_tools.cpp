#include "commit_tools.hpp"
#include "tool_util.hpp"

namespace gitmcp {

// ── git_undo ────────────────────────────────────────────────────

static ToolDefinition undo_definition() {
    return ToolDefinition{
        ToolId::Undo,
        tool_name(ToolId::Undo),
        "🔄 Safely undo the last commit while preserving changes in staging area.\n"
        "Perfect for when you need to modify, split, or enhance your last commit.\n"
        "Uses 'git reset --soft HEAD^' with safety checks and confirmations.\n"
        "\n"
        "📋 USE WHEN: Need to modify last commit, split commit into multiple parts,\n"
        "or add more changes to last commit. Safer than 'git reset --hard'.",
        {
            flag_param("confirm",
                       "Skip confirmation prompt (default: false - will prompt user)"),
        },
    };
}

UndoTool::UndoTool()
    : ScriptTool(undo_definition(), "git-undo", "❌ Git undo failed:\n") {}

void UndoTool::append_args(const nlohmann::json& args, CommandSpec& spec) const {
    spec.stdin_text = confirm_stdin(args);
}

std::string UndoTool::success_banner(const nlohmann::json& /*args*/) const {
    return "✅ Git undo completed successfully:\n\n";
}

// ── git_redo ────────────────────────────────────────────────────

static ToolDefinition redo_definition() {
    return ToolDefinition{
        ToolId::Redo,
        tool_name(ToolId::Redo),
        "↩️ Redo the most recently undone commit. Works by finding reset operations\n"
        "in reflog and restoring the undone commit. Two modes available:\n"
        "• Full restore: Cherry-picks original commit completely\n"
        "• Message-only: Commits staged changes with original message\n"
        "\n"
        "📋 USE WHEN: Want to restore an undone commit or reuse its commit message.\n"
        "Perfect partner to git_undo for safe commit modifications.",
        {
            flag_param("message_only",
                       "Only use original commit message, don't restore content"),
            flag_param("confirm", "Skip confirmation prompt"),
        },
    };
}

RedoTool::RedoTool()
    : ScriptTool(redo_definition(), "git-redo", "❌ Git redo failed:\n") {}

void RedoTool::append_args(const nlohmann::json& args, CommandSpec& spec) const {
    if (arg_flag(args, "message_only")) {
        spec.argv.push_back("--message-only");
    }
    spec.stdin_text = confirm_stdin(args);
}

std::string RedoTool::success_banner(const nlohmann::json& /*args*/) const {
    return "✅ Git redo completed successfully:\n\n";
}

// ── git_recommit ────────────────────────────────────────────────

static ToolDefinition recommit_definition() {
    return ToolDefinition{
        ToolId::Recommit,
        tool_name(ToolId::Recommit),
        "📝 Convenience alias for 'git_redo --message-only'. Commits currently\n"
        "staged changes using the commit message from the most recently undone commit.\n"
        "\n"
        "📋 USE WHEN: You've undone a commit, made additional changes, and want to\n"
        "commit with the original message. Common workflow after git_undo.",
        {
            flag_param("confirm", "Skip confirmation prompt"),
        },
    };
}

RecommitTool::RecommitTool()
    : ScriptTool(recommit_definition(), "git-recommit", "❌ Git recommit failed:\n") {}

void RecommitTool::append_args(const nlohmann::json& args, CommandSpec& spec) const {
    spec.stdin_text = confirm_stdin(args);
}

std::string RecommitTool::success_banner(const nlohmann::json& /*args*/) const {
    return "✅ Git recommit completed successfully:\n\n";
}

} // namespace gitmcp
