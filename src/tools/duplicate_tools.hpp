#pragma once
#include "script_tool.hpp"

namespace gitmcp {

constexpr const char* kDefaultRemoteBranch = "origin/main";

// git-check-dup: list commits whose patch-id already exists upstream.
// The branch token is passed only when it differs from the script's own
// default.
class CheckDupTool : public ScriptTool {
public:
    CheckDupTool();

    ResultEnvelope classify(const nlohmann::json& args,
                            const std::vector<ExecutionOutcome>& outcomes) const override;

protected:
    void append_args(const nlohmann::json& args, CommandSpec& spec) const override;
    std::string success_banner(const nlohmann::json& args) const override;
};

// git-remove-redundant-commits: drop duplicate commits and rebase. Dry
// run unless apply is set.
class RemoveRedundantCommitsTool : public ScriptTool {
public:
    RemoveRedundantCommitsTool();

protected:
    void append_args(const nlohmann::json& args, CommandSpec& spec) const override;
    std::string success_banner(const nlohmann::json& args) const override;
};

} // namespace gitmcp
