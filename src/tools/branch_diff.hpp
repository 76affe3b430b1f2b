#pragma once
#include "../tool.hpp"

namespace gitmcp {

// Side-by-side `git log --oneline` of two branches. Runs git directly; no
// external script involved.
class BranchDiffTool : public Tool {
public:
    BranchDiffTool();

    const ToolDefinition& definition() const override { return definition_; }

    std::optional<ResultEnvelope> build(const nlohmann::json& args,
                                        const ScriptLocator& scripts,
                                        std::vector<CommandSpec>& out) const override;

    ResultEnvelope classify(const nlohmann::json& args,
                            const std::vector<ExecutionOutcome>& outcomes) const override;

private:
    ToolDefinition definition_;
};

} // namespace gitmcp
