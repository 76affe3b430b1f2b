#include "search_tools.hpp"
#include "tool_util.hpp"
#include "../classify.hpp"

namespace gitmcp {

// ── git_find_file ───────────────────────────────────────────────

static ToolDefinition find_file_definition() {
    return ToolDefinition{
        ToolId::FindFile,
        tool_name(ToolId::FindFile),
        "🔎 Search for files matching a pattern across Git branches.\n"
        "Useful for finding where specific files exist in different branches,\n"
        "tracking file renames, or locating configuration files.\n"
        "Pattern is treated as grep regex.\n"
        "\n"
        "📋 USE WHEN: Need to find files across branches, track file history,\n"
        "or locate configuration/build files in different branch contexts.",
        {
            required_param("pattern", "File pattern or regex to search for (required)"),
            flag_param("local", "Search local branches only (default: remote branches)"),
        },
    };
}

FindFileTool::FindFileTool()
    : ScriptTool(find_file_definition(), "git-find_file", "❌ Git find file failed:\n") {}

std::optional<ResultEnvelope> FindFileTool::validate(const nlohmann::json& args) const {
    if (!arg_required(args, "pattern")) {
        return error_envelope("❌ Error: pattern parameter is required");
    }
    return std::nullopt;
}

void FindFileTool::append_args(const nlohmann::json& args, CommandSpec& spec) const {
    spec.argv.push_back(*arg_required(args, "pattern"));
    if (arg_flag(args, "local")) {
        spec.argv.push_back("--local");
    }
}

std::string FindFileTool::success_banner(const nlohmann::json& /*args*/) const {
    return "🔎 Git find file results:\n\n";
}

// ── git_diff_patch ──────────────────────────────────────────────

static ToolDefinition diff_patch_definition() {
    return ToolDefinition{
        ToolId::DiffPatch,
        tool_name(ToolId::DiffPatch),
        "↔️  Compare two commits for functional equivalence using patch-id.\n"
        "Useful for checking if two commits are the same after a rebase or cherry-pick.\n"
        "\n"
        "📋 USE WHEN: You need to verify if two different commits introduce the exact same code changes.",
        {
            required_param("commit1", "The first commit to compare."),
            required_param("commit2", "The second commit to compare."),
        },
    };
}

DiffPatchTool::DiffPatchTool()
    : ScriptTool(diff_patch_definition(), "git-diff-patch", "❌ Git diff-patch failed:\n") {}

std::optional<ResultEnvelope> DiffPatchTool::validate(const nlohmann::json& args) const {
    if (!arg_required(args, "commit1") || !arg_required(args, "commit2")) {
        return error_envelope("❌ Error: commit1 and commit2 are required.");
    }
    return std::nullopt;
}

void DiffPatchTool::append_args(const nlohmann::json& args, CommandSpec& spec) const {
    spec.argv.push_back(*arg_required(args, "commit1"));
    spec.argv.push_back(*arg_required(args, "commit2"));
}

std::string DiffPatchTool::success_banner(const nlohmann::json& /*args*/) const {
    return "✅ Patch comparison results:\n\n";
}

} // namespace gitmcp
