#include <catch2/catch_test_macros.hpp>
#include "classify.hpp"

using namespace gitmcp;

static ExecutionOutcome outcome(int code, std::string out, std::string err = "") {
    ExecutionOutcome o;
    o.exit_code = code;
    o.stdout_bytes = std::move(out);
    o.stderr_bytes = std::move(err);
    return o;
}

// ── classify_outcome ─────────────────────────────────────────────

TEST_CASE("classify_outcome: exit zero uses success banner and stdout", "[classify]") {
    auto env = classify_outcome(outcome(0, "done\n"), "OK:\n\n", "FAIL:\n");
    REQUIRE_FALSE(env.is_error);
    REQUIRE(env.text == "OK:\n\ndone\n");
}

TEST_CASE("classify_outcome: exit zero with stderr is still success", "[classify]") {
    auto env = classify_outcome(outcome(0, "out", "warning: noisy"), "OK:", "FAIL:");
    REQUIRE_FALSE(env.is_error);
    REQUIRE(env.text == "OK:out");
}

TEST_CASE("classify_outcome: non-zero uses failure banner and stderr", "[classify]") {
    auto env = classify_outcome(outcome(2, "partial", "fatal: bad ref\n"), "OK:", "FAIL:\n");
    REQUIRE(env.is_error);
    REQUIRE(env.text == "FAIL:\nfatal: bad ref\n");
}

TEST_CASE("classify_outcome: empty stderr names the exit code", "[classify]") {
    auto env = classify_outcome(outcome(5, "ignored"), "OK:", "FAIL:\n");
    REQUIRE(env.is_error);
    REQUIRE(env.text == "FAIL:\n(no error output, exit code 5)");
}

TEST_CASE("classify_outcome: signal death is a failure", "[classify]") {
    auto env = classify_outcome(outcome(-9, ""), "OK:", "FAIL:\n");
    REQUIRE(env.is_error);
    REQUIRE(env.text == "FAIL:\n(no error output, exit code -9)");
}

TEST_CASE("classify_outcome: invalid utf-8 output is replaced", "[classify]") {
    auto env = classify_outcome(outcome(0, "bad\xFF" "byte"), "", "");
    REQUIRE(env.text == "bad\xEF\xBF\xBD" "byte");
}

// ── parse_conflict_paths ─────────────────────────────────────────

TEST_CASE("parse_conflict_paths: four fields", "[classify]") {
    auto paths = parse_conflict_paths("/tmp/x:/tmp/x/ours:/tmp/x/base:/tmp/x/theirs");
    REQUIRE(paths.has_value());
    REQUIRE(paths->temp_dir == "/tmp/x");
    REQUIRE(paths->ours == "/tmp/x/ours");
    REQUIRE(paths->base == "/tmp/x/base");
    REQUIRE(paths->theirs == "/tmp/x/theirs");
}

TEST_CASE("parse_conflict_paths: fewer than four fields rejected", "[classify]") {
    REQUIRE_FALSE(parse_conflict_paths("a:b").has_value());
    REQUIRE_FALSE(parse_conflict_paths("a:b:c").has_value());
    REQUIRE_FALSE(parse_conflict_paths("").has_value());
}

TEST_CASE("parse_conflict_paths: extra fields ignored", "[classify]") {
    auto paths = parse_conflict_paths("a:b:c:d:e");
    REQUIRE(paths.has_value());
    REQUIRE(paths->theirs == "d");
}

TEST_CASE("parse_conflict_paths: trailing empty field counts", "[classify]") {
    auto paths = parse_conflict_paths("a:b:c:");
    REQUIRE(paths.has_value());
    REQUIRE(paths->base == "c");
    REQUIRE(paths->theirs.empty());
}
