#include "classify.hpp"
#include "util.hpp"

namespace gitmcp {

ResultEnvelope success_envelope(std::string text) {
    return ResultEnvelope{false, std::move(text)};
}

ResultEnvelope error_envelope(std::string text) {
    return ResultEnvelope{true, std::move(text)};
}

std::string output_text(const ExecutionOutcome& outcome) {
    return decode_lossy(outcome.stdout_bytes);
}

std::string failure_text(const ExecutionOutcome& outcome) {
    if (outcome.stderr_bytes.empty()) {
        return "(no error output, exit code " + std::to_string(outcome.exit_code) + ")";
    }
    return decode_lossy(outcome.stderr_bytes);
}

ResultEnvelope classify_outcome(const ExecutionOutcome& outcome,
                                const std::string& success_banner,
                                const std::string& failure_banner) {
    if (outcome.exit_code == 0) {
        return success_envelope(success_banner + output_text(outcome));
    }
    return error_envelope(failure_banner + failure_text(outcome));
}

std::optional<ConflictPaths> parse_conflict_paths(const std::string& text) {
    auto parts = split(text, ':');
    if (parts.size() < 4) return std::nullopt;
    return ConflictPaths{parts[0], parts[1], parts[2], parts[3]};
}

} // namespace gitmcp
