#pragma once

#include <string>

namespace hostlink {
namespace agent {

// Maps user-facing paths onto the local filesystem:
// - "~" and "~/x" expand to the home directory
// - a bare well-known folder ("Desktop", "Documents/notes.txt", ...) resolves under home
// - other relative paths resolve against the agent's working directory
// Results are absolute and lexically normalized.
class PathResolver {
public:
    explicit PathResolver(std::string home_directory);

    std::string resolve(const std::string &path) const;

    const std::string &home_directory() const { return home_; }

    // $HOME, falling back to the passwd entry of the current user
    static std::string detect_home_directory();

private:
    std::string home_;
};

}  // namespace agent
}  // namespace hostlink
