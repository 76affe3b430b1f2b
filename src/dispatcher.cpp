#include "dispatcher.hpp"
#include "classify.hpp"
#include "log.hpp"
#include "util.hpp"
#include <algorithm>

namespace gitmcp {

static ResultEnvelope execution_failed(const std::string& name, const std::exception& e) {
    log_error("dispatch", "Error executing " + name + ": " + e.what());
    return error_envelope(std::string("Tool execution failed: ") + e.what());
}

Dispatcher::Dispatcher(ScriptLocator scripts)
    : scripts_(std::move(scripts))
    , tools_(create_builtin_tools())
{}

std::vector<ToolDefinition> Dispatcher::list_tools() const {
    std::vector<ToolDefinition> defs;
    defs.reserve(tools_.size());
    for (const auto& t : tools_) {
        defs.push_back(t->definition());
    }
    return defs;
}

const Tool* Dispatcher::find(const std::string& name) const {
    auto id = tool_id_from_name(name);
    if (!id) return nullptr;
    return &tool(*id);
}

const Tool& Dispatcher::tool(ToolId id) const {
    return *tools_[static_cast<size_t>(id)];
}

PendingCall Dispatcher::begin(const std::string& name, const nlohmann::json& arguments) const {
    PendingCall call;
    call.name = name;
    call.arguments = arguments.is_object() ? arguments : nlohmann::json::object();
    call.tool = find(name);

    if (!call.tool) {
        call.result = error_envelope("Unknown tool: " + name);
        return call;
    }

    try {
        if (auto err = call.tool->build(call.arguments, scripts_, call.commands)) {
            call.commands.clear();
            call.result = std::move(err);
            return call;
        }
    } catch (const std::exception& e) {
        call.commands.clear();
        call.result = execution_failed(name, e);
        return call;
    }

    for (const auto& cmd : call.commands) {
        log_debug("dispatch", name + ": " + format_argv(cmd.argv) +
                                  (cmd.stdin_text ? " (with stdin)" : ""));
    }
    return call;
}

ResultEnvelope Dispatcher::finish(const PendingCall& call,
                                  const std::vector<ExecutionOutcome>& outcomes) const {
    if (call.result) return *call.result;
    try {
        return call.tool->classify(call.arguments, outcomes);
    } catch (const std::exception& e) {
        return execution_failed(call.name, e);
    }
}

ResultEnvelope Dispatcher::call_tool(const std::string& name,
                                     const nlohmann::json& arguments) const {
    PendingCall call = begin(name, arguments);
    if (call.result) return *call.result;

    std::vector<ExecutionOutcome> outcomes;
    outcomes.reserve(call.commands.size());
    try {
        for (const auto& cmd : call.commands) {
            outcomes.push_back(run_process(cmd));
        }
    } catch (const std::exception& e) {
        return execution_failed(name, e);
    }
    return finish(call, outcomes);
}

std::vector<std::string> Dispatcher::required_scripts() const {
    std::vector<std::string> names;
    for (const auto& t : tools_) {
        for (auto& script : t->scripts()) {
            if (std::find(names.begin(), names.end(), script) == names.end()) {
                names.push_back(std::move(script));
            }
        }
    }
    return names;
}

} // namespace gitmcp
