#pragma once
#include "process.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gitmcp {

class ScriptLocator;

// Catalog order is the order tools are listed to clients.
enum class ToolId {
    Undo,
    Redo,
    Recommit,
    CheckDup,
    RemoveRedundantCommits,
    BranchDiff,
    FindFile,
    DiffPatch,
    ExtractConflictFiles,
    RemergeFromFiles,
};

constexpr size_t kToolCount = 10;

const char* tool_name(ToolId id);
std::optional<ToolId> tool_id_from_name(const std::string& name);

struct ParamSpec {
    std::string name;
    std::string type;        // JSON schema type: "string" or "boolean"
    std::string description;
    std::optional<nlohmann::json> default_value;
    bool required = false;
};

struct ToolDefinition {
    ToolId id;
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;

    // JSON schema object describing the arguments
    nlohmann::json input_schema() const;

    // {name, description, inputSchema} as listed to clients
    nlohmann::json to_json() const;
};

// Externally visible result of one tool call.
struct ResultEnvelope {
    bool is_error = false;
    std::string text;
};

class Tool {
public:
    virtual ~Tool() = default;

    virtual const ToolDefinition& definition() const = 0;

    // Validate `args` and append the commands to run, in order, to `out`.
    // Returns an error envelope instead when validation fails, in which
    // case nothing is appended and nothing runs. May throw
    // ScriptNotFoundError.
    virtual std::optional<ResultEnvelope> build(const nlohmann::json& args,
                                                const ScriptLocator& scripts,
                                                std::vector<CommandSpec>& out) const = 0;

    // Fold one outcome per built command into the final envelope.
    virtual ResultEnvelope classify(const nlohmann::json& args,
                                    const std::vector<ExecutionOutcome>& outcomes) const = 0;

    // External scripts this tool depends on (empty for tools that only run git)
    virtual std::vector<std::string> scripts() const { return {}; }

    const std::string& name() const { return definition().name; }
};

// Create the full catalog, indexed by ToolId.
std::array<std::unique_ptr<Tool>, kToolCount> create_builtin_tools();

} // namespace gitmcp
