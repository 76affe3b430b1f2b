#pragma once
#include "script_tool.hpp"

namespace gitmcp {

// git-find_file: grep for file names across branches.
class FindFileTool : public ScriptTool {
public:
    FindFileTool();

protected:
    std::optional<ResultEnvelope> validate(const nlohmann::json& args) const override;
    void append_args(const nlohmann::json& args, CommandSpec& spec) const override;
    std::string success_banner(const nlohmann::json& args) const override;
};

// git-diff-patch: compare two commits by patch-id.
class DiffPatchTool : public ScriptTool {
public:
    DiffPatchTool();

protected:
    std::optional<ResultEnvelope> validate(const nlohmann::json& args) const override;
    void append_args(const nlohmann::json& args, CommandSpec& spec) const override;
    std::string success_banner(const nlohmann::json& args) const override;
};

} // namespace gitmcp
