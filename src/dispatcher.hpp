#pragma once
#include "process.hpp"
#include "script_locator.hpp"
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gitmcp {

// A tool call between validation and classification. When `result` is set
// the call is already resolved (unknown tool, invalid arguments, missing
// script) and `commands` is empty.
struct PendingCall {
    std::string name;
    nlohmann::json arguments;
    const Tool* tool = nullptr;
    std::vector<CommandSpec> commands;
    std::optional<ResultEnvelope> result;
};

// Static catalog of tools plus the call path around them. Holds no
// per-call state; begin() and finish() may be interleaved freely across
// calls. Exceptions never escape begin(), finish() or call_tool().
class Dispatcher {
public:
    explicit Dispatcher(ScriptLocator scripts);

    std::vector<ToolDefinition> list_tools() const;

    const Tool* find(const std::string& name) const;
    const Tool& tool(ToolId id) const;

    // Look up, validate and build the commands for one call.
    PendingCall begin(const std::string& name, const nlohmann::json& arguments) const;

    // Classify the outcomes of a call's commands, one per command in order.
    ResultEnvelope finish(const PendingCall& call,
                          const std::vector<ExecutionOutcome>& outcomes) const;

    // begin(), run every command to completion in order, finish().
    ResultEnvelope call_tool(const std::string& name, const nlohmann::json& arguments) const;

    // Distinct external scripts used by the catalog, in catalog order.
    std::vector<std::string> required_scripts() const;

    const ScriptLocator& scripts() const { return scripts_; }

private:
    ScriptLocator scripts_;
    std::array<std::unique_ptr<Tool>, kToolCount> tools_;
};

} // namespace gitmcp
