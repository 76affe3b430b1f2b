#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace gitmcp {

class ScriptNotFoundError : public std::runtime_error {
public:
    explicit ScriptNotFoundError(const std::filesystem::path& path)
        : std::runtime_error("Script not found: " + path.string()), path_(path) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Resolves external scripts inside the install root. Nothing is cached:
// every lookup checks the filesystem again.
class ScriptLocator {
public:
    explicit ScriptLocator(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }

    // Absolute path of `script_name` under the root. Throws
    // ScriptNotFoundError when nothing exists there.
    std::filesystem::path locate(const std::string& script_name) const;

    bool exists(const std::string& script_name) const;

    // Install root for a binary at `executable`: one directory above the
    // directory holding it.
    static std::filesystem::path install_root_for(const std::filesystem::path& executable);

    // Location of the running binary: /proc/self/exe where available,
    // otherwise argv0 resolved against the working directory.
    static std::filesystem::path self_executable(const std::string& argv0);

private:
    std::filesystem::path root_;
};

struct ScriptStatus {
    std::string name;
    std::filesystem::path path;
    bool present = false;
    bool executable = false;
};

// Presence and executability of each named script.
std::vector<ScriptStatus> check_scripts(const ScriptLocator& locator,
                                        const std::vector<std::string>& names);

} // namespace gitmcp
