#pragma once
#include "script_tool.hpp"

namespace gitmcp {

// Both conflict tools drive the same script in different modes.
constexpr const char* kConflictScript = "git-diff-123";

// git-diff-123 --extract FILE: write ours/base/theirs copies of a
// conflicted file to a temp dir and report their paths.
class ExtractConflictFilesTool : public ScriptTool {
public:
    ExtractConflictFilesTool();

    ResultEnvelope classify(const nlohmann::json& args,
                            const std::vector<ExecutionOutcome>& outcomes) const override;

protected:
    std::optional<ResultEnvelope> validate(const nlohmann::json& args) const override;
    void append_args(const nlohmann::json& args, CommandSpec& spec) const override;
    std::string success_banner(const nlohmann::json& args) const override;
};

// git-diff-123 --remerge FILE OURS BASE THEIRS: three-way merge of the
// edited copies back into FILE.
class RemergeFromFilesTool : public ScriptTool {
public:
    RemergeFromFilesTool();

protected:
    std::optional<ResultEnvelope> validate(const nlohmann::json& args) const override;
    void append_args(const nlohmann::json& args, CommandSpec& spec) const override;
    std::string success_banner(const nlohmann::json& args) const override;
};

} // namespace gitmcp
