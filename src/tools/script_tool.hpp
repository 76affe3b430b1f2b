#pragma once
#include "../tool.hpp"
#include <string>

namespace gitmcp {

// Base for tools that run exactly one external script from the install
// root: argv is [script path, ...append_args()].
class ScriptTool : public Tool {
public:
    const ToolDefinition& definition() const override { return definition_; }

    std::optional<ResultEnvelope> build(const nlohmann::json& args,
                                        const ScriptLocator& scripts,
                                        std::vector<CommandSpec>& out) const override;

    ResultEnvelope classify(const nlohmann::json& args,
                            const std::vector<ExecutionOutcome>& outcomes) const override;

    std::vector<std::string> scripts() const override { return {script_}; }

protected:
    ScriptTool(ToolDefinition definition, std::string script, std::string failure_banner);

    // Checked before the script is located; an envelope here stops the call.
    virtual std::optional<ResultEnvelope> validate(const nlohmann::json& /*args*/) const {
        return std::nullopt;
    }

    // Add arguments after the script path and set stdin if needed.
    virtual void append_args(const nlohmann::json& args, CommandSpec& spec) const = 0;

    // Text placed before stdout on success.
    virtual std::string success_banner(const nlohmann::json& args) const = 0;

    const std::string& failure_banner() const { return failure_banner_; }

private:
    ToolDefinition definition_;
    std::string script_;
    std::string failure_banner_;
};

} // namespace gitmcp
