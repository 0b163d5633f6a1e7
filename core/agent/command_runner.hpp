#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "runtime/config.hpp"

namespace hostlink {
namespace agent {

constexpr int kExitCodeTimedOut = 124;

struct CommandResult {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    bool truncated = false;  // Either stream hit max_output_bytes

    // {exitCode, stdout, stderr[, timedOut][, truncated]}
    nlohmann::json to_json() const;
};

// Runs exec.run commands through `<shell> -c <command>`.
//
// The child gets its own process group, /dev/null as stdin and pipes for
// stdout/stderr. On timeout the whole group is SIGKILLed, the exit code is
// 124 and whatever output was captured so far is returned. A child killed by
// a signal reports 128 + signal number.
class CommandRunner {
public:
    explicit CommandRunner(const runtime::ExecConfig &config);

    // Throws std::runtime_error if cwd is not a directory or the process cannot be spawned
    CommandResult run(const std::string &command, const std::optional<std::string> &cwd,
                      std::optional<int64_t> timeout_ms) const;

private:
    runtime::ExecConfig config_;
};

}  // namespace agent
}  // namespace hostlink
