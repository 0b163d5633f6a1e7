#include "agent/action_log.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace hostlink::agent;

namespace {
ActionEntry entry(const std::string &operation, ActionResult result = ActionResult::SUCCESS) {
    ActionEntry e;
    e.timestamp = "2024-05-01T12:00:00.000Z";
    e.user_id = "alice";
    e.operation = operation;
    e.result = result;
    e.details = operation + " details";
    return e;
}
}  // namespace

TEST(ActionLogTest, RecentReturnsNewestOldestFirst) {
    ActionLog log(10);
    for (int i = 0; i < 5; ++i) {
        log.record(entry("op" + std::to_string(i)));
    }

    auto recent = log.recent(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].operation, "op2");
    EXPECT_EQ(recent[2].operation, "op4");
    EXPECT_EQ(log.recent(100).size(), 5u);
    EXPECT_TRUE(log.recent(0).empty());
}

TEST(ActionLogTest, OldestEntriesDropAtCapacity) {
    ActionLog log(3);
    for (int i = 0; i < 7; ++i) {
        log.record(entry("op" + std::to_string(i)));
    }

    auto all = log.recent(10);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all.front().operation, "op4");
    EXPECT_EQ(log.total(), 7u);
    EXPECT_EQ(log.capacity(), 3u);
}

TEST(ActionLogTest, EntryJson) {
    auto json = action_entry_to_json(entry("fs.read", ActionResult::DENIED));
    EXPECT_EQ(json["operation"], "fs.read");
    EXPECT_EQ(json["result"], "denied");
    EXPECT_EQ(json["userId"], "alice");
    EXPECT_EQ(json["timestamp"], "2024-05-01T12:00:00.000Z");
    EXPECT_EQ(action_result_to_string(ActionResult::ERROR), "error");
}

TEST(ActionLogTest, ConcurrentRecording) {
    ActionLog log(50);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&log]() {
            for (int i = 0; i < 100; ++i) {
                log.record(entry("fs.list"));
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    EXPECT_EQ(log.total(), 400u);
    EXPECT_EQ(log.recent(1000).size(), 50u);
}
