#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hostlink {
namespace agent {

enum class ActionResult { SUCCESS, ERROR, DENIED };

std::string action_result_to_string(ActionResult result);

struct ActionEntry {
    std::string timestamp;  // ISO-8601 UTC
    std::string user_id;
    std::string operation;  // Wire name, e.g. "fs.read"
    ActionResult result = ActionResult::SUCCESS;
    std::string details;
};

nlohmann::json action_entry_to_json(const ActionEntry &entry);

// Bounded audit trail of dispatched operations; oldest entries drop first.
class ActionLog {
public:
    explicit ActionLog(size_t capacity = 1000);

    void record(ActionEntry entry);

    // Newest `limit` entries, oldest first
    std::vector<ActionEntry> recent(size_t limit) const;

    // Entries recorded since construction, including dropped ones
    size_t total() const;

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<ActionEntry> entries_;
    size_t total_ = 0;
};

}  // namespace agent
}  // namespace hostlink
