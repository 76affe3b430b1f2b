#pragma once
#include "script_tool.hpp"

namespace gitmcp {

// git-undo: soft reset of the last commit. confirm answers the prompt.
class UndoTool : public ScriptTool {
public:
    UndoTool();

protected:
    void append_args(const nlohmann::json& args, CommandSpec& spec) const override;
    std::string success_banner(const nlohmann::json& args) const override;
};

// git-redo: restore the most recently undone commit, or only its message.
class RedoTool : public ScriptTool {
public:
    RedoTool();

protected:
    void append_args(const nlohmann::json& args, CommandSpec& spec) const override;
    std::string success_banner(const nlohmann::json& args) const override;
};

// git-recommit: commit staged changes with the undone commit's message.
class RecommitTool : public ScriptTool {
public:
    RecommitTool();

protected:
    void append_args(const nlohmann::json& args, CommandSpec& spec) const override;
    std::string success_banner(const nlohmann::json& args) const override;
};

} // namespace gitmcp
