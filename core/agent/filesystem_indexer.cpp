#include "filesystem_indexer.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <system_error>

#include "logging/logger.hpp"

namespace hostlink {
namespace agent {

namespace fs = std::filesystem;

namespace {

constexpr std::array<const char *, 14> kWellKnownDirectories = {
    "Desktop", "Documents", "Downloads", "Pictures", "Videos",   "Music",   "Projects",
    "Code",    "Development", "Workspace", "Work",   "Dropbox", "OneDrive", "Google Drive"};

bool is_hidden(const fs::path &path) {
    const std::string name = path.filename().string();
    return !name.empty() && name[0] == '.';
}

// Sorted, non-hidden children of a directory; empty if it cannot be read
std::vector<fs::directory_entry> children(const fs::path &directory) {
    std::vector<fs::directory_entry> result;
    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_DEBUG("[Index] Skipping " << directory.string() << ": " << ec.message());
        return result;
    }
    for (const auto &entry : it) {
        if (!is_hidden(entry.path())) {
            result.push_back(entry);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) { return a.path() < b.path(); });
    return result;
}

bool is_directory(const fs::directory_entry &entry) {
    std::error_code ec;
    return entry.is_directory(ec) && !ec;
}

}  // namespace

FilesystemIndexer::FilesystemIndexer(const runtime::IndexConfig &config) : config_(config) {}

bool FilesystemIndexer::is_well_known_directory(const std::string &name) {
    return std::find(kWellKnownDirectories.begin(), kWellKnownDirectories.end(), name) !=
           kWellKnownDirectories.end();
}

protocol::FilesystemIndex FilesystemIndexer::build(const std::string &home_directory) const {
    protocol::FilesystemIndex index;
    if (!config_.enabled) {
        return index;
    }

    for (const auto &entry : children(home_directory)) {
        if (!is_directory(entry)) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        const std::string path = entry.path().string();
        index.directories.push_back({name, path});
        index.indexed_paths.push_back(path);

        if (is_well_known_directory(name)) {
            walk(path, 1, index);
        } else {
            for (const auto &child : children(entry.path())) {
                index.indexed_paths.push_back(child.path().string());
            }
        }
    }

    LOG_INFO("[Index] Indexed " << index.directories.size() << " directories and " << index.indexed_paths.size()
                                << " paths under " << home_directory << " (depth " << config_.max_depth << ")");
    return index;
}

void FilesystemIndexer::walk(const std::string &directory, int depth, protocol::FilesystemIndex &index) const {
    if (depth > config_.max_depth) {
        return;
    }
    for (const auto &entry : children(directory)) {
        if (!is_directory(entry)) {
            continue;
        }
        index.indexed_paths.push_back(entry.path().string());
        if (depth < config_.max_depth) {
            walk(entry.path().string(), depth + 1, index);
        }
    }
}

}  // namespace agent
}  // namespace hostlink
