#include "local_operations.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "protocol/messages.hpp"

namespace hostlink {
namespace agent {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throw_fs_error(const std::string &action, const std::string &path, const std::error_code &ec) {
    throw std::runtime_error(action + " '" + path + "': " + ec.message());
}

[[noreturn]] void throw_fs_error(const std::string &action, const std::string &path, std::errc code) {
    throw_fs_error(action, path, std::make_error_code(code));
}

int64_t stat_mtime_ms(const struct stat &st) {
    return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 + st.st_mtim.tv_nsec / 1000000;
}

void list_into(const fs::path &dir, int depth_remaining, nlohmann::json &out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return;  // Unreadable subdirectory
    }

    std::vector<fs::path> children;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        children.push_back(it->path());
    }
    std::sort(children.begin(), children.end());

    for (const auto &child : children) {
        struct stat st;
        if (::stat(child.c_str(), &st) != 0) {
            continue;
        }
        const bool is_dir = S_ISDIR(st.st_mode);
        out.push_back({{"name", child.filename().string()},
                       {"path", child.string()},
                       {"kind", is_dir ? "directory" : "file"},
                       {"size", static_cast<int64_t>(st.st_size)},
                       {"mtime", protocol::format_iso8601(stat_mtime_ms(st))}});
        if (is_dir && depth_remaining > 0) {
            list_into(child, depth_remaining - 1, out);
        }
    }
}

}  // namespace

nlohmann::json list_directory(const protocol::ListRequest &request) {
    std::error_code ec;
    auto status = fs::status(request.path, ec);
    if (ec || !fs::exists(status)) {
        throw_fs_error("Cannot list", request.path, std::errc::no_such_file_or_directory);
    }
    if (!fs::is_directory(status)) {
        throw_fs_error("Cannot list", request.path, std::errc::not_a_directory);
    }

    fs::directory_iterator probe(request.path, ec);
    if (ec) {
        throw_fs_error("Cannot list", request.path, ec);
    }

    nlohmann::json entries = nlohmann::json::array();
    list_into(request.path, request.depth, entries);
    return entries;
}

nlohmann::json read_file(const protocol::ReadRequest &request) {
    std::error_code ec;
    auto status = fs::status(request.path, ec);
    if (ec || !fs::exists(status)) {
        throw_fs_error("Cannot read", request.path, std::errc::no_such_file_or_directory);
    }
    if (fs::is_directory(status)) {
        throw_fs_error("Cannot read", request.path, std::errc::is_a_directory);
    }

    std::ifstream file(request.path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw_fs_error("Cannot read", request.path, std::errc::permission_denied);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw_fs_error("Cannot read", request.path, std::errc::io_error);
    }
    return {{"content", content}};
}

nlohmann::json write_file(const protocol::WriteRequest &request) {
    const fs::path target(request.path);
    const fs::path parent = target.parent_path();
    std::error_code ec;

    if (!parent.empty()) {
        if (request.create_dirs) {
            fs::create_directories(parent, ec);
            if (ec) {
                throw_fs_error("Cannot create directory", parent.string(), ec);
            }
        } else if (!fs::is_directory(parent, ec)) {
            throw_fs_error("Cannot write", request.path, std::errc::no_such_file_or_directory);
        }
    }
    if (fs::is_directory(target, ec)) {
        throw_fs_error("Cannot write", request.path, std::errc::is_a_directory);
    }

    std::ofstream file(request.path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw_fs_error("Cannot write", request.path, std::errc::permission_denied);
    }
    file.write(request.content.data(), static_cast<std::streamsize>(request.content.size()));
    file.close();
    if (file.fail()) {
        throw_fs_error("Cannot write", request.path, std::errc::io_error);
    }
    return {{"success", true}, {"path", request.path}, {"bytes", request.content.size()}};
}

nlohmann::json delete_path(const protocol::DeleteRequest &request) {
    std::error_code ec;
    auto status = fs::symlink_status(request.path, ec);
    if (ec || !fs::exists(status)) {
        throw_fs_error("Cannot delete", request.path, std::errc::no_such_file_or_directory);
    }

    if (fs::is_directory(status) && request.recursive) {
        fs::remove_all(request.path, ec);
    } else {
        // Non-recursive: fails with directory_not_empty for populated directories
        fs::remove(request.path, ec);
    }
    if (ec) {
        throw_fs_error("Cannot delete", request.path, ec);
    }
    return {{"success", true}, {"path", request.path}};
}

nlohmann::json move_path(const protocol::MoveRequest &request) {
    std::error_code ec;
    auto status = fs::symlink_status(request.source, ec);
    if (ec || !fs::exists(status)) {
        throw_fs_error("Cannot move", request.source, std::errc::no_such_file_or_directory);
    }

    const fs::path parent = fs::path(request.destination).parent_path();
    if (request.create_dest_dirs && !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw_fs_error("Cannot create directory", parent.string(), ec);
        }
    }

    // rename(2): cross-device moves fail with EXDEV and are reported as-is
    fs::rename(request.source, request.destination, ec);
    if (ec) {
        throw_fs_error("Cannot move", request.source + " -> " + request.destination, ec);
    }
    return {{"success", true}, {"source", request.source}, {"destination", request.destination}};
}

}  // namespace agent
}  // namespace hostlink
