#include "action_log.hpp"

#include <algorithm>

namespace hostlink {
namespace agent {

std::string action_result_to_string(ActionResult result) {
    switch (result) {
        case ActionResult::SUCCESS:
            return "success";
        case ActionResult::ERROR:
            return "error";
        case ActionResult::DENIED:
            return "denied";
        default:
            return "error";
    }
}

nlohmann::json action_entry_to_json(const ActionEntry &entry) {
    return {{"timestamp", entry.timestamp},
            {"userId", entry.user_id},
            {"operation", entry.operation},
            {"result", action_result_to_string(entry.result)},
            {"details", entry.details}};
}

ActionLog::ActionLog(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void ActionLog::record(ActionEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
    if (entries_.size() > capacity_) {
        entries_.pop_front();
    }
    ++total_;
}

std::vector<ActionEntry> ActionLog::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t count = std::min(limit, entries_.size());
    return std::vector<ActionEntry>(entries_.end() - static_cast<std::ptrdiff_t>(count), entries_.end());
}

size_t ActionLog::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

}  // namespace agent
}  // namespace hostlink
