#include "util.hpp"

#include <cctype>
#include <cstdlib>

namespace gitmcp {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            result.push_back(s.substr(start));
            return result;
        }
        result.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::string decode_lossy(const std::string& bytes) {
    static const char kReplacement[] = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        // Sequence length and the allowed range of the first continuation
        // byte (narrower for lead bytes that could encode overlongs,
        // surrogates or code points past U+10FFFF).
        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3; lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            len = 3;
        } else if (c == 0xED) {
            len = 3; hi = 0x9F;
        } else if (c == 0xF0) {
            len = 4; lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4; hi = 0x8F;
        } else {
            out += kReplacement;
            ++i;
            continue;
        }

        size_t k = 1;
        while (k < len && i + k < n) {
            auto cc = static_cast<unsigned char>(bytes[i + k]);
            unsigned char min = (k == 1) ? lo : 0x80;
            unsigned char max = (k == 1) ? hi : 0xBF;
            if (cc < min || cc > max) break;
            ++k;
        }

        if (k == len) {
            out.append(bytes, i, len);
        } else {
            // Maximal invalid prefix collapses into one replacement
            out += kReplacement;
        }
        i += k;
    }
    return out;
}

std::string format_argv(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) out += ' ';
        const std::string& tok = argv[i];
        bool needs_quotes = tok.empty();
        for (char c : tok) {
            if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' || c == '"') {
                needs_quotes = true;
                break;
            }
        }
        if (!needs_quotes) {
            out += tok;
            continue;
        }
        out += '\'';
        for (char c : tok) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        out += '\'';
    }
    return out;
}

} // namespace gitmcp
