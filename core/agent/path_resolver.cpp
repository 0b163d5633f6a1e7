#include "path_resolver.hpp"

#include <pwd.h>
#include <unistd.h>

#include <array>
#include <cstdlib>
#include <filesystem>

namespace hostlink {
namespace agent {

namespace fs = std::filesystem;

namespace {
constexpr std::array<const char *, 6> kHomeFolders = {"Desktop", "Documents", "Downloads",
                                                      "Pictures", "Videos",    "Music"};

bool is_home_folder_path(const std::string &path) {
    for (const char *folder : kHomeFolders) {
        const std::string name(folder);
        if (path == name || path.rfind(name + "/", 0) == 0) {
            return true;
        }
    }
    return false;
}
}  // namespace

PathResolver::PathResolver(std::string home_directory) : home_(std::move(home_directory)) {}

std::string PathResolver::resolve(const std::string &path) const {
    fs::path resolved;
    if (path == "~") {
        resolved = home_;
    } else if (path.rfind("~/", 0) == 0) {
        resolved = fs::path(home_) / path.substr(2);
    } else if (is_home_folder_path(path)) {
        resolved = fs::path(home_) / path;
    } else {
        resolved = fs::absolute(path);
    }

    std::string normalized = resolved.lexically_normal().string();
    // "/a/b/" -> "/a/b" so prefix checks and listings agree
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

std::string PathResolver::detect_home_directory() {
    const char *home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return home;
    }
    struct passwd *pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return pw->pw_dir;
    }
    return fs::current_path().string();
}

}  // namespace agent
}  // namespace hostlink
