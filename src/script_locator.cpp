#include "script_locator.hpp"

#include <system_error>
#include <unistd.h>

namespace gitmcp {

namespace fs = std::filesystem;

ScriptLocator::ScriptLocator(const fs::path& root) {
    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    root_ = (ec ? root : abs).lexically_normal();
}

fs::path ScriptLocator::locate(const std::string& script_name) const {
    fs::path path = root_ / script_name;
    if (!exists(script_name)) {
        throw ScriptNotFoundError(path);
    }
    return path;
}

bool ScriptLocator::exists(const std::string& script_name) const {
    std::error_code ec;
    return fs::exists(root_ / script_name, ec);
}

fs::path ScriptLocator::install_root_for(const fs::path& executable) {
    return executable.parent_path().parent_path();
}

fs::path ScriptLocator::self_executable(const std::string& argv0) {
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) return self;

    fs::path fallback = fs::weakly_canonical(fs::path(argv0), ec);
    if (!ec) return fallback;
    return fs::absolute(fs::path(argv0), ec);
}

std::vector<ScriptStatus> check_scripts(const ScriptLocator& locator,
                                        const std::vector<std::string>& names) {
    std::vector<ScriptStatus> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        ScriptStatus status;
        status.name = name;
        status.path = locator.root() / name;
        status.present = locator.exists(name);
        std::error_code ec;
        status.executable = status.present &&
                            fs::is_regular_file(status.path, ec) &&
                            ::access(status.path.c_str(), X_OK) == 0;
        result.push_back(std::move(status));
    }
    return result;
}

} // namespace gitmcp
