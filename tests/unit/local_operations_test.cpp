/**
 * local_operations_test.cpp - filesystem handlers behind the fs.* operations
 */

#include "agent/local_operations.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using namespace hostlink;
using namespace hostlink::agent;

class LocalOperationsTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() /
               ("hostlink_local_ops_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const fs::path &path, const std::string &content) {
        fs::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    std::string read(const fs::path &path) {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }
};

// ============================================================================
// fs.list
// ============================================================================

TEST_F(LocalOperationsTest, ListDepthZeroAndOne) {
    fs::create_directories(root / "x");
    write(root / "x" / "y.txt", "0123456789");

    auto shallow = list_directory({root.string(), 0});
    ASSERT_EQ(shallow.size(), 1u);
    EXPECT_EQ(shallow[0]["name"], "x");
    EXPECT_EQ(shallow[0]["kind"], "directory");
    EXPECT_EQ(shallow[0]["path"], (root / "x").string());

    auto deep = list_directory({root.string(), 1});
    ASSERT_EQ(deep.size(), 2u);
    EXPECT_EQ(deep[0]["name"], "x");
    EXPECT_EQ(deep[1]["name"], "y.txt");
    EXPECT_EQ(deep[1]["kind"], "file");
    EXPECT_EQ(deep[1]["size"], 10);
    EXPECT_TRUE(deep[1]["mtime"].get<std::string>().back() == 'Z');
}

TEST_F(LocalOperationsTest, ListIsSortedByName) {
    write(root / "b.txt", "b");
    write(root / "a.txt", "a");
    write(root / "c.txt", "c");

    auto entries = list_directory({root.string(), 0});
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0]["name"], "a.txt");
    EXPECT_EQ(entries[2]["name"], "c.txt");
}

TEST_F(LocalOperationsTest, ListFailsForMissingOrFile) {
    EXPECT_THROW(list_directory({(root / "missing").string(), 0}), std::runtime_error);
    write(root / "file.txt", "x");
    EXPECT_THROW(list_directory({(root / "file.txt").string(), 0}), std::runtime_error);
}

// ============================================================================
// fs.read / fs.write
// ============================================================================

TEST_F(LocalOperationsTest, WriteThenReadUtf8) {
    const std::string content = "h\xC3\xA9llo \xE2\x9C\x93\nline two";
    const auto path = (root / "notes.txt").string();

    auto written = write_file({path, content, true, "utf8"});
    EXPECT_EQ(written["success"], true);
    EXPECT_EQ(written["bytes"], content.size());

    auto data = read_file({path, "utf8"});
    EXPECT_EQ(data["content"], content);
}

TEST_F(LocalOperationsTest, WriteCreatesParentsOnlyWhenAsked) {
    const auto nested = (root / "a" / "b" / "c.txt").string();
    EXPECT_THROW(write_file({nested, "x", false, "utf8"}), std::runtime_error);
    EXPECT_FALSE(fs::exists(root / "a"));

    write_file({nested, "x", true, "utf8"});
    EXPECT_EQ(read(nested), "x");
}

TEST_F(LocalOperationsTest, WriteTruncatesExistingFile) {
    const auto path = root / "f.txt";
    write(path, "a much longer original");
    write_file({path.string(), "short", true, "utf8"});
    EXPECT_EQ(read(path), "short");
}

TEST_F(LocalOperationsTest, ReadFailures) {
    EXPECT_THROW(read_file({(root / "missing.txt").string(), "utf8"}), std::runtime_error);
    try {
        read_file({root.string(), "utf8"});
        FAIL() << "Expected read of a directory to throw";
    } catch (const std::runtime_error &e) {
        EXPECT_NE(std::string(e.what()).find(root.string()), std::string::npos);
    }
}

// ============================================================================
// fs.delete / fs.move
// ============================================================================

TEST_F(LocalOperationsTest, DeleteFile) {
    write(root / "f.txt", "x");
    auto result = delete_path({(root / "f.txt").string(), false});
    EXPECT_EQ(result["success"], true);
    EXPECT_FALSE(fs::exists(root / "f.txt"));
}

TEST_F(LocalOperationsTest, DeletePopulatedDirectoryNeedsRecursive) {
    write(root / "dir" / "inner" / "f.txt", "x");

    EXPECT_THROW(delete_path({(root / "dir").string(), false}), std::runtime_error);
    EXPECT_TRUE(fs::exists(root / "dir" / "inner" / "f.txt"));

    delete_path({(root / "dir").string(), true});
    EXPECT_FALSE(fs::exists(root / "dir"));
}

TEST_F(LocalOperationsTest, DeleteEmptyDirectoryWithoutRecursive) {
    fs::create_directories(root / "empty");
    delete_path({(root / "empty").string(), false});
    EXPECT_FALSE(fs::exists(root / "empty"));
}

TEST_F(LocalOperationsTest, DeleteMissingFails) {
    EXPECT_THROW(delete_path({(root / "nope").string(), true}), std::runtime_error);
}

TEST_F(LocalOperationsTest, MoveCreatesDestinationDirectories) {
    write(root / "src.txt", "payload");
    const auto destination = root / "out" / "dst.txt";

    EXPECT_THROW(move_path({(root / "src.txt").string(), destination.string(), false}), std::runtime_error);
    EXPECT_TRUE(fs::exists(root / "src.txt"));

    auto result = move_path({(root / "src.txt").string(), destination.string(), true});
    EXPECT_EQ(result["destination"], destination.string());
    EXPECT_FALSE(fs::exists(root / "src.txt"));
    EXPECT_EQ(read(destination), "payload");
}

TEST_F(LocalOperationsTest, MoveMissingSourceFails) {
    EXPECT_THROW(move_path({(root / "nope").string(), (root / "x").string(), true}), std::runtime_error);
}
