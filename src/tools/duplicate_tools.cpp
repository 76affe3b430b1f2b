#include "duplicate_tools.hpp"
#include "tool_util.hpp"
#include "../classify.hpp"
#include "../util.hpp"

namespace gitmcp {

// ── git_check_dup ───────────────────────────────────────────────

static ToolDefinition check_dup_definition() {
    return ToolDefinition{
        ToolId::CheckDup,
        tool_name(ToolId::CheckDup),
        "🔍 Find duplicate commits between branches based on content (patch-id),\n"
        "not commit hash. Identifies commits that make identical code changes\n"
        "but have different hashes due to cherry-picking, rebasing, etc.\n"
        "\n"
        "📋 USE WHEN: Before rebasing, after cherry-picking, cleaning up branches,\n"
        "or preparing pull requests to identify redundant commits that can be safely removed.",
        {
            string_param("remote_branch",
                         "Branch to compare against (default: origin/main)",
                         kDefaultRemoteBranch),
            flag_param("quiet", "Output only essential data for parsing"),
        },
    };
}

CheckDupTool::CheckDupTool()
    : ScriptTool(check_dup_definition(), "git-check-dup", "❌ Git check-dup failed:\n") {}

void CheckDupTool::append_args(const nlohmann::json& args, CommandSpec& spec) const {
    if (arg_flag(args, "quiet")) {
        spec.argv.push_back("--quiet");
    }
    std::string remote_branch = arg_string(args, "remote_branch", kDefaultRemoteBranch);
    if (remote_branch != kDefaultRemoteBranch) {
        spec.argv.push_back(remote_branch);
    }
}

std::string CheckDupTool::success_banner(const nlohmann::json& /*args*/) const {
    return "🔍 Duplicate commits found:\n\n";
}

ResultEnvelope CheckDupTool::classify(const nlohmann::json& args,
                                      const std::vector<ExecutionOutcome>& outcomes) const {
    const auto& outcome = outcomes.at(0);
    if (outcome.exit_code == 0 && trim(output_text(outcome)).empty()) {
        return success_envelope("✅ No duplicate commits detected.");
    }
    return ScriptTool::classify(args, outcomes);
}

// ── git_remove_redundant_commits ────────────────────────────────

static ToolDefinition remove_redundant_definition() {
    return ToolDefinition{
        ToolId::RemoveRedundantCommits,
        tool_name(ToolId::RemoveRedundantCommits),
        "🧹 Automatically remove redundant/duplicate commits and cleanly rebase\n"
        "branch. Uses two-phase approach:\n"
        "1. Removes content duplicates via rebase onto remote\n"
        "2. Rebases cleaned commits onto target branch\n"
        "\n"
        "⚠️ Always creates timestamped backup branch for safety.\n"
        "🔒 Dry-run by default - use --apply to execute.\n"
        "\n"
        "📋 USE WHEN: Branch has redundant commits from cherry-picking/rebasing\n"
        "and needs clean history before merging.",
        {
            string_param("onto_branch",
                         "Branch to rebase onto (default: origin/main)",
                         kDefaultRemoteBranch),
            flag_param("apply", "Actually perform the cleanup (default: dry-run only)"),
        },
    };
}

RemoveRedundantCommitsTool::RemoveRedundantCommitsTool()
    : ScriptTool(remove_redundant_definition(), "git-remove-redundant-commits",
                 "❌ Git remove redundant commits failed:\n") {}

void RemoveRedundantCommitsTool::append_args(const nlohmann::json& args,
                                             CommandSpec& spec) const {
    std::string onto_branch = arg_string(args, "onto_branch", kDefaultRemoteBranch);
    if (onto_branch != kDefaultRemoteBranch) {
        spec.argv.push_back("--onto");
        spec.argv.push_back(onto_branch);
    }
    if (arg_flag(args, "apply")) {
        spec.argv.push_back("--apply");
    }
}

std::string RemoveRedundantCommitsTool::success_banner(const nlohmann::json& args) const {
    std::string mode = arg_flag(args, "apply") ? "🔧 Applied changes" : "🔍 Dry-run analysis";
    return "✅ Git remove redundant commits - " + mode + ":\n\n";
}

} // namespace gitmcp
