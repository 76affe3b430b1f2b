#pragma once
#include <string>
#include <vector>

namespace gitmcp {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter. Every delimiter separates two fields, so
// empty fields (leading, inner and trailing) are kept.
std::vector<std::string> split(const std::string& s, char delim);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Decode raw bytes as UTF-8 text. Invalid sequences become U+FFFD instead
// of failing, so arbitrary process output is always representable.
std::string decode_lossy(const std::string& bytes);

// Render an argv for log lines: tokens joined by spaces, tokens with
// whitespace or quotes wrapped in single quotes.
std::string format_argv(const std::vector<std::string>& argv);

} // namespace gitmcp
