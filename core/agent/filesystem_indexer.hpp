#pragma once

#include <string>

#include "protocol/messages.hpp"
#include "runtime/config.hpp"

namespace hostlink {
namespace agent {

/**
 * @brief Shallow scan of the home directory sent with agent-metadata
 *
 * Every non-hidden directory directly under home becomes an IndexedDirectory.
 * Well-known folders (Desktop, Documents, Projects, ...) have their
 * subdirectories walked down to max_depth; any other folder contributes only
 * its immediate children. Hidden entries and unreadable directories are
 * skipped without failing the scan.
 */
class FilesystemIndexer {
public:
    explicit FilesystemIndexer(const runtime::IndexConfig &config);

    protocol::FilesystemIndex build(const std::string &home_directory) const;

    static bool is_well_known_directory(const std::string &name);

private:
    void walk(const std::string &directory, int depth, protocol::FilesystemIndex &index) const;

    runtime::IndexConfig config_;
};

}  // namespace agent
}  // namespace hostlink
