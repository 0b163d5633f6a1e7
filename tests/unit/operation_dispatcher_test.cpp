/**
 * operation_dispatcher_test.cpp - guard, execution and audit in one pass
 */

#include "agent/operation_dispatcher.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>

using namespace hostlink;
using namespace hostlink::agent;
using namespace hostlink::protocol;
namespace fs = std::filesystem;

class OperationDispatcherTest : public ::testing::Test {
protected:
    fs::path home;
    PlanGuard guard;
    ActionLog log{100};
    std::unique_ptr<OperationDispatcher> dispatcher;

    void SetUp() override {
        home = fs::temp_directory_path() / "hostlink_dispatcher_test";
        fs::remove_all(home);
        fs::create_directories(home / "Documents");
        std::ofstream(home / "Documents" / "note.txt") << "hello";
        dispatcher = std::make_unique<OperationDispatcher>("alice", PathResolver(home.string()), guard, log,
                                                           runtime::ExecConfig{});
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(home, ec);
    }

    Plan documents_plan() {
        Plan plan;
        plan.mode = PlanMode::BALANCED;
        plan.allowed_directories = {"~/Documents"};
        plan.allowed_operations = {Capability::READ, Capability::WRITE};
        return plan;
    }
};

TEST_F(OperationDispatcherTest, ReadResolvesHomeRelativePaths) {
    auto result = dispatcher->dispatch(ReadRequest{"~/Documents/note.txt"});
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.data["content"], "hello");

    auto entries = log.recent(1);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].operation, "fs.read");
    EXPECT_EQ(entries[0].result, ActionResult::SUCCESS);
    EXPECT_EQ(entries[0].user_id, "alice");
}

TEST_F(OperationDispatcherTest, WriteWithoutPlanIsDenied) {
    auto result = dispatcher->dispatch(WriteRequest{"~/Documents/new.txt", "x"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::DENIED);
    EXPECT_FALSE(fs::exists(home / "Documents" / "new.txt"));
    EXPECT_EQ(log.recent(1)[0].result, ActionResult::DENIED);
}

TEST_F(OperationDispatcherTest, ApprovedPlanDirectoriesAreResolved) {
    Plan installed = dispatcher->approve_plan(documents_plan());
    ASSERT_EQ(installed.allowed_directories.size(), 1u);
    EXPECT_EQ(installed.allowed_directories[0], (home / "Documents").string());
    EXPECT_EQ(log.recent(1)[0].operation, "plan.approve");

    auto inside = dispatcher->dispatch(WriteRequest{"Documents/new.txt", "x"});
    ASSERT_TRUE(inside.success) << inside.error_message;
    EXPECT_TRUE(fs::exists(home / "Documents" / "new.txt"));

    auto outside = dispatcher->dispatch(WriteRequest{(home / "elsewhere.txt").string(), "x"});
    EXPECT_EQ(outside.error_kind, ErrorKind::DENIED);
}

TEST_F(OperationDispatcherTest, HandlerFailureIsRemoteError) {
    auto result = dispatcher->dispatch(ReadRequest{"~/Documents/missing.txt"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::REMOTE_ERROR);
    EXPECT_NE(result.error_message.find("missing.txt"), std::string::npos);
    EXPECT_EQ(log.recent(1)[0].result, ActionResult::ERROR);
}

TEST_F(OperationDispatcherTest, NonZeroExitIsSuccess) {
    Plan plan;
    plan.mode = PlanMode::UNRESTRICTED;
    dispatcher->approve_plan(plan);

    auto result = dispatcher->dispatch(ExecRequest{"exit 3", std::string("~"), std::nullopt});
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.data["exitCode"], 3);
}

TEST_F(OperationDispatcherTest, KillIsAuditedAndRefusesReads) {
    dispatcher->kill();
    EXPECT_TRUE(guard.is_killed());
    EXPECT_EQ(log.recent(1)[0].operation, "kill");

    auto result = dispatcher->dispatch(ListRequest{"~", 0});
    EXPECT_EQ(result.error_kind, ErrorKind::DENIED);
}

TEST_F(OperationDispatcherTest, ResolvePathsCoversMoveAndExec) {
    auto move = std::get<MoveRequest>(dispatcher->resolve_paths(MoveRequest{"~/a", "Desktop/b", true}));
    EXPECT_EQ(move.source, (home / "a").string());
    EXPECT_EQ(move.destination, (home / "Desktop" / "b").string());

    auto exec = std::get<ExecRequest>(dispatcher->resolve_paths(ExecRequest{"ls", std::string("~"), std::nullopt}));
    ASSERT_TRUE(exec.cwd.has_value());
    EXPECT_EQ(*exec.cwd, home.string());
}
