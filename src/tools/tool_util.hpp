#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace gitmcp {

// Boolean flag argument. Only a JSON `true` counts; absent, false and
// non-boolean values all read as false.
inline bool arg_flag(const nlohmann::json& args, const char* field) {
    auto it = args.find(field);
    return it != args.end() && it->is_boolean() && it->get<bool>();
}

// String argument with a documented default. Absent or non-string values
// yield the default.
inline std::string arg_string(const nlohmann::json& args, const char* field,
                              const std::string& fallback) {
    auto it = args.find(field);
    if (it == args.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

// Required string argument. Missing, non-string and empty all yield nullopt.
inline std::optional<std::string> arg_required(const nlohmann::json& args, const char* field) {
    auto it = args.find(field);
    if (it == args.end() || !it->is_string()) return std::nullopt;
    std::string value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

// Interactive confirmation is answered through stdin, not a flag.
inline std::optional<std::string> confirm_stdin(const nlohmann::json& args) {
    if (arg_flag(args, "confirm")) return std::string("y\n");
    return std::nullopt;
}

inline ParamSpec flag_param(const std::string& name, const std::string& description) {
    return ParamSpec{name, "boolean", description, nlohmann::json(false), false};
}

inline ParamSpec string_param(const std::string& name, const std::string& description,
                              const std::string& default_value) {
    return ParamSpec{name, "string", description, nlohmann::json(default_value), false};
}

inline ParamSpec required_param(const std::string& name, const std::string& description) {
    return ParamSpec{name, "string", description, std::nullopt, true};
}

} // namespace gitmcp
