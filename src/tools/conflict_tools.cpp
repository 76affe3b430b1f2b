#include "conflict_tools.hpp"
#include "tool_util.hpp"
#include "../classify.hpp"
#include "../util.hpp"

namespace gitmcp {

// ── git_extract_conflict_files ──────────────────────────────────

static ToolDefinition extract_definition() {
    return ToolDefinition{
        ToolId::ExtractConflictFiles,
        tool_name(ToolId::ExtractConflictFiles),
        "🔄 Extract conflict files for manual editing during merge conflicts.\n"
        "Creates temporary files containing 'ours', 'theirs', and 'base' versions\n"
        "of a conflicted file. Returns file paths for manual editing.\n"
        "\n"
        "📋 USE WHEN: Need to manually resolve complex merge conflicts by editing\n"
        "individual versions before re-merging.",
        {
            required_param("file", "Path to the conflicted file"),
        },
    };
}

ExtractConflictFilesTool::ExtractConflictFilesTool()
    : ScriptTool(extract_definition(), kConflictScript,
                 "❌ Git extract conflict files failed:\n") {}

std::optional<ResultEnvelope> ExtractConflictFilesTool::validate(
    const nlohmann::json& args) const {
    if (!arg_required(args, "file")) {
        return error_envelope("❌ Error: file parameter is required");
    }
    return std::nullopt;
}

void ExtractConflictFilesTool::append_args(const nlohmann::json& args,
                                           CommandSpec& spec) const {
    spec.argv.push_back("--extract");
    spec.argv.push_back(*arg_required(args, "file"));
}

std::string ExtractConflictFilesTool::success_banner(const nlohmann::json& /*args*/) const {
    return "🔄 Conflict files extracted successfully:\n\n";
}

ResultEnvelope ExtractConflictFilesTool::classify(
    const nlohmann::json& args, const std::vector<ExecutionOutcome>& outcomes) const {
    const auto& outcome = outcomes.at(0);
    if (outcome.exit_code != 0) {
        return error_envelope(failure_banner() + failure_text(outcome));
    }

    std::string output = trim(output_text(outcome));
    auto paths = parse_conflict_paths(output);
    if (!paths) {
        return error_envelope("❌ Unexpected output format:\n" + output);
    }

    return success_envelope(
        success_banner(args) +
        "📁 Temp directory: " + paths->temp_dir + "\n"
        "📄 Ours file: " + paths->ours + "\n"
        "📄 Base file: " + paths->base + "\n"
        "📄 Theirs file: " + paths->theirs + "\n\n"
        "💡 Edit the 'ours' and/or 'theirs' files as needed, then use "
        "git_remerge_from_files to apply changes.");
}

// ── git_remerge_from_files ──────────────────────────────────────

static ToolDefinition remerge_definition() {
    return ToolDefinition{
        ToolId::RemergeFromFiles,
        tool_name(ToolId::RemergeFromFiles),
        "🔧 Re-merge using edited conflict files. Performs a fresh 3-way merge\n"
        "using previously extracted and edited 'ours', 'theirs', and 'base' files.\n"
        "Automatically shows diff and stages the result if merge is clean.\n"
        "\n"
        "📋 USE WHEN: After editing extracted conflict files, need to apply the\n"
        "changes back to the original conflicted file.",
        {
            required_param("file", "Path to the original conflicted file"),
            required_param("ours_path", "Path to the edited 'ours' file"),
            required_param("base_path", "Path to the 'base' file"),
            required_param("theirs_path", "Path to the edited 'theirs' file"),
        },
    };
}

static const char* const kRemergeFields[] = {"file", "ours_path", "base_path", "theirs_path"};

RemergeFromFilesTool::RemergeFromFilesTool()
    : ScriptTool(remerge_definition(), kConflictScript,
                 "❌ Git remerge from files failed:\n") {}

std::optional<ResultEnvelope> RemergeFromFilesTool::validate(
    const nlohmann::json& args) const {
    for (const char* field : kRemergeFields) {
        if (!arg_required(args, field)) {
            return error_envelope(
                "❌ Error: file, ours_path, base_path, and theirs_path are all required");
        }
    }
    return std::nullopt;
}

void RemergeFromFilesTool::append_args(const nlohmann::json& args,
                                       CommandSpec& spec) const {
    spec.argv.push_back("--remerge");
    for (const char* field : kRemergeFields) {
        spec.argv.push_back(*arg_required(args, field));
    }
}

std::string RemergeFromFilesTool::success_banner(const nlohmann::json& /*args*/) const {
    return "🔧 Re-merge completed successfully:\n\n";
}

} // namespace gitmcp
