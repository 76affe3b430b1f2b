#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <cstdlib>

using namespace gitmcp;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
}

TEST_CASE("trim: no whitespace unchanged", "[util]") {
    REQUIRE(trim("hello") == "hello");
}

// ── split ────────────────────────────────────────────────────────

TEST_CASE("split: normal delimiter", "[util]") {
    auto parts = split("a,b,c", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("split: empty parts preserved", "[util]") {
    auto parts = split("a,,b", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "", "b"});
}

TEST_CASE("split: no delimiter found", "[util]") {
    auto parts = split("hello", ',');
    REQUIRE(parts == std::vector<std::string>{"hello"});
}

TEST_CASE("split: trailing delimiter keeps empty last field", "[util]") {
    auto parts = split("a:b:", ':');
    REQUIRE(parts == std::vector<std::string>{"a", "b", ""});
}

TEST_CASE("split: leading delimiter keeps empty first field", "[util]") {
    auto parts = split(":a", ':');
    REQUIRE(parts == std::vector<std::string>{"", "a"});
}

TEST_CASE("split: empty string is one empty field", "[util]") {
    REQUIRE(split("", ',') == std::vector<std::string>{""});
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (!home) return;
    REQUIRE(expand_home("~/scripts") == std::string(home) + "/scripts");
}

TEST_CASE("expand_home: absolute path unchanged", "[util]") {
    REQUIRE(expand_home("/opt/git-scripts") == "/opt/git-scripts");
}

// ── decode_lossy ─────────────────────────────────────────────────

static const std::string kFffd = "\xEF\xBF\xBD";

TEST_CASE("decode_lossy: ascii unchanged", "[util]") {
    REQUIRE(decode_lossy("abc 123\n") == "abc 123\n");
}

TEST_CASE("decode_lossy: valid multibyte unchanged", "[util]") {
    std::string text = "caf\xC3\xA9 \xE2\x9C\x85 \xF0\x9F\x94\x8D";
    REQUIRE(decode_lossy(text) == text);
}

TEST_CASE("decode_lossy: stray continuation byte replaced", "[util]") {
    REQUIRE(decode_lossy("a\x80" "b") == "a" + kFffd + "b");
}

TEST_CASE("decode_lossy: invalid lead byte replaced", "[util]") {
    REQUIRE(decode_lossy("\xFF") == kFffd);
    REQUIRE(decode_lossy("\xC0\xAF") == kFffd + kFffd);
}

TEST_CASE("decode_lossy: truncated sequence at end collapses to one", "[util]") {
    REQUIRE(decode_lossy("ok\xE2\x9C") == "ok" + kFffd);
}

TEST_CASE("decode_lossy: truncated sequence before ascii keeps ascii", "[util]") {
    REQUIRE(decode_lossy("\xE2\x9C" "x") == kFffd + "x");
}

TEST_CASE("decode_lossy: surrogate code points rejected", "[util]") {
    // U+D800 encoded directly is not valid UTF-8
    std::string out = decode_lossy("\xED\xA0\x80");
    REQUIRE(out.find("\xED\xA0\x80") == std::string::npos);
    REQUIRE(out.find(kFffd) == 0);
}

TEST_CASE("decode_lossy: empty input", "[util]") {
    REQUIRE(decode_lossy("").empty());
}

// ── format_argv ──────────────────────────────────────────────────

TEST_CASE("format_argv: plain tokens joined by spaces", "[util]") {
    REQUIRE(format_argv({"git", "log", "--oneline"}) == "git log --oneline");
}

TEST_CASE("format_argv: tokens with spaces are quoted", "[util]") {
    REQUIRE(format_argv({"git-find_file", "my file"}) == "git-find_file 'my file'");
}

TEST_CASE("format_argv: empty token is quoted", "[util]") {
    REQUIRE(format_argv({"a", ""}) == "a ''");
}

TEST_CASE("format_argv: single quote escaped", "[util]") {
    REQUIRE(format_argv({"it's"}) == "'it'\\''s'");
}
