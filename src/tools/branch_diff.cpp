#include "branch_diff.hpp"
#include "tool_util.hpp"
#include "../classify.hpp"

namespace gitmcp {

static constexpr const char* kDefaultBranch1 = "HEAD";
static constexpr const char* kDefaultBranch2 = "origin/main";
static constexpr const char* kMaxCount = "--max-count=20";

static CommandSpec log_command(const std::string& branch) {
    return CommandSpec{{"git", "log", "--oneline", kMaxCount, branch}, std::nullopt};
}

BranchDiffTool::BranchDiffTool()
    : definition_{
          ToolId::BranchDiff,
          tool_name(ToolId::BranchDiff),
          "📊 Visual comparison of commit logs between two branches.\n"
          "Shows commits unique to each branch in side-by-side format.\n"
          "Great for understanding branch divergence and planning merges.\n"
          "\n"
          "📋 USE WHEN: Need to see what commits differ between branches,\n"
          "understand branch history, or prepare for merges/rebases.",
          {
              string_param("branch1", "First branch to compare (default: HEAD)",
                           kDefaultBranch1),
              string_param("branch2", "Second branch to compare (default: origin/main)",
                           kDefaultBranch2),
          },
      }
{}

std::optional<ResultEnvelope> BranchDiffTool::build(const nlohmann::json& args,
                                                    const ScriptLocator& /*scripts*/,
                                                    std::vector<CommandSpec>& out) const {
    out.push_back(log_command(arg_string(args, "branch1", kDefaultBranch1)));
    out.push_back(log_command(arg_string(args, "branch2", kDefaultBranch2)));
    return std::nullopt;
}

ResultEnvelope BranchDiffTool::classify(const nlohmann::json& args,
                                        const std::vector<ExecutionOutcome>& outcomes) const {
    const auto& log1 = outcomes.at(0);
    const auto& log2 = outcomes.at(1);
    std::string branch1 = arg_string(args, "branch1", kDefaultBranch1);
    std::string branch2 = arg_string(args, "branch2", kDefaultBranch2);

    if (log1.exit_code == 0 && log2.exit_code == 0) {
        return success_envelope(
            "📊 Branch comparison (" + branch1 + " vs " + branch2 + "):\n\n"
            "=== " + branch1 + " commits ===\n" + output_text(log1) + "\n"
            "=== " + branch2 + " commits ===\n" + output_text(log2) + "\n"
            "💡 Tip: Use 'git log --oneline --graph " + branch1 + " " + branch2 +
            "' for visual graph");
    }

    // First non-empty stderr wins; with both empty, name the failing side
    const ExecutionOutcome* source = &log1;
    if (log1.stderr_bytes.empty()) {
        if (!log2.stderr_bytes.empty() || log1.exit_code == 0) source = &log2;
    }
    return error_envelope("❌ Git branch diff failed:\n" + failure_text(*source));
}

} // namespace gitmcp
