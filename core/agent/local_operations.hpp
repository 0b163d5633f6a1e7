#pragma once

#include <nlohmann/json.hpp>

#include "protocol/operation.hpp"

namespace hostlink {
namespace agent {

// Filesystem handlers behind fs.list / fs.read / fs.write / fs.delete / fs.move.
// Paths are expected to be resolved already (see PathResolver). Failures throw
// std::runtime_error with a message naming the path and the OS reason; the
// dispatcher turns that into a REMOTE_ERROR.

// [{name, path, kind: "file"|"directory", size, mtime}] in pre-order, sorted by
// name per directory. depth 0 lists only `path` itself; entries that cannot be
// stat'ed (and subdirectories that cannot be opened) are skipped.
nlohmann::json list_directory(const protocol::ListRequest &request);

// {content}
nlohmann::json read_file(const protocol::ReadRequest &request);

// {success, path, bytes}
nlohmann::json write_file(const protocol::WriteRequest &request);

// {success, path}; directories need recursive=true unless empty
nlohmann::json delete_path(const protocol::DeleteRequest &request);

// {success, source, destination}
nlohmann::json move_path(const protocol::MoveRequest &request);

}  // namespace agent
}  // namespace hostlink
