#include "script_tool.hpp"
#include "../classify.hpp"
#include "../script_locator.hpp"

namespace gitmcp {

ScriptTool::ScriptTool(ToolDefinition definition, std::string script,
                       std::string failure_banner)
    : definition_(std::move(definition))
    , script_(std::move(script))
    , failure_banner_(std::move(failure_banner))
{}

std::optional<ResultEnvelope> ScriptTool::build(const nlohmann::json& args,
                                                const ScriptLocator& scripts,
                                                std::vector<CommandSpec>& out) const {
    if (auto err = validate(args)) return err;

    CommandSpec spec;
    spec.argv.push_back(scripts.locate(script_).string());
    append_args(args, spec);
    out.push_back(std::move(spec));
    return std::nullopt;
}

ResultEnvelope ScriptTool::classify(const nlohmann::json& args,
                                    const std::vector<ExecutionOutcome>& outcomes) const {
    return classify_outcome(outcomes.at(0), success_banner(args), failure_banner_);
}

} // namespace gitmcp
