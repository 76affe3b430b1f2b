#include "tool.hpp"
#include "tools/branch_diff.hpp"
#include "tools/commit_tools.hpp"
#include "tools/conflict_tools.hpp"
#include "tools/duplicate_tools.hpp"
#include "tools/search_tools.hpp"

namespace gitmcp {

static const std::array<const char*, kToolCount> kToolNames = {
    "git_undo",
    "git_redo",
    "git_recommit",
    "git_check_dup",
    "git_remove_redundant_commits",
    "git_branch_diff",
    "git_find_file",
    "git_diff_patch",
    "git_extract_conflict_files",
    "git_remerge_from_files",
};

const char* tool_name(ToolId id) {
    return kToolNames[static_cast<size_t>(id)];
}

std::optional<ToolId> tool_id_from_name(const std::string& name) {
    for (size_t i = 0; i < kToolNames.size(); ++i) {
        if (name == kToolNames[i]) return static_cast<ToolId>(i);
    }
    return std::nullopt;
}

nlohmann::json ToolDefinition::input_schema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& p : params) {
        nlohmann::json prop = {{"type", p.type}, {"description", p.description}};
        if (p.default_value) prop["default"] = *p.default_value;
        properties[p.name] = std::move(prop);
        if (p.required) required.push_back(p.name);
    }

    nlohmann::json schema = {{"type", "object"}, {"properties", std::move(properties)}};
    if (!required.empty()) schema["required"] = std::move(required);
    return schema;
}

nlohmann::json ToolDefinition::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema()},
    };
}

std::array<std::unique_ptr<Tool>, kToolCount> create_builtin_tools() {
    std::array<std::unique_ptr<Tool>, kToolCount> tools;
    auto put = [&tools](std::unique_ptr<Tool> tool) {
        auto index = static_cast<size_t>(tool->definition().id);
        tools[index] = std::move(tool);
    };
    put(std::make_unique<UndoTool>());
    put(std::make_unique<RedoTool>());
    put(std::make_unique<RecommitTool>());
    put(std::make_unique<CheckDupTool>());
    put(std::make_unique<RemoveRedundantCommitsTool>());
    put(std::make_unique<BranchDiffTool>());
    put(std::make_unique<FindFileTool>());
    put(std::make_unique<DiffPatchTool>());
    put(std::make_unique<ExtractConflictFilesTool>());
    put(std::make_unique<RemergeFromFilesTool>());
    return tools;
}

} // namespace gitmcp
