#pragma once
#include "process.hpp"
#include "tool.hpp"
#include <optional>
#include <string>

namespace gitmcp {

ResultEnvelope success_envelope(std::string text);
ResultEnvelope error_envelope(std::string text);

// Decoded stdout of an outcome
std::string output_text(const ExecutionOutcome& outcome);

// Decoded stderr, or a generic line naming the exit code when the
// process wrote nothing to stderr.
std::string failure_text(const ExecutionOutcome& outcome);

// Exit code 0: success with success_banner + stdout.
// Otherwise: error with failure_banner + failure_text().
ResultEnvelope classify_outcome(const ExecutionOutcome& outcome,
                                const std::string& success_banner,
                                const std::string& failure_banner);

// Paths printed by `git-diff-123 --extract` as "tmpdir:ours:base:theirs".
struct ConflictPaths {
    std::string temp_dir;
    std::string ours;
    std::string base;
    std::string theirs;
};

// Parse the trimmed extract output. Fields past the fourth are ignored;
// fewer than four fields yields nullopt.
std::optional<ConflictPaths> parse_conflict_paths(const std::string& text);

} // namespace gitmcp
