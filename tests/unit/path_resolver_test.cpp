#include "agent/path_resolver.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace hostlink::agent;

TEST(PathResolverTest, ExpandsHome) {
    PathResolver resolver("/home/alice");
    EXPECT_EQ(resolver.resolve("~"), "/home/alice");
    EXPECT_EQ(resolver.resolve("~/notes/todo.txt"), "/home/alice/notes/todo.txt");
    EXPECT_EQ(resolver.resolve("~/"), "/home/alice");
}

TEST(PathResolverTest, WellKnownFoldersResolveUnderHome) {
    PathResolver resolver("/home/alice");
    EXPECT_EQ(resolver.resolve("Documents"), "/home/alice/Documents");
    EXPECT_EQ(resolver.resolve("Desktop/report.pdf"), "/home/alice/Desktop/report.pdf");
    // Only whole-name matches
    EXPECT_NE(resolver.resolve("DocumentsArchive"), "/home/alice/DocumentsArchive");
}

TEST(PathResolverTest, AbsolutePathsAreNormalized) {
    PathResolver resolver("/home/alice");
    EXPECT_EQ(resolver.resolve("/tmp/./a/../b/"), "/tmp/b");
    EXPECT_EQ(resolver.resolve("/"), "/");
}

TEST(PathResolverTest, RelativePathsUseWorkingDirectory) {
    PathResolver resolver("/home/alice");
    const auto expected = (std::filesystem::current_path() / "build/out.txt").lexically_normal().string();
    EXPECT_EQ(resolver.resolve("build/out.txt"), expected);
}

TEST(PathResolverTest, DetectHomeDirectoryIsAbsolute) {
    const std::string home = PathResolver::detect_home_directory();
    ASSERT_FALSE(home.empty());
    EXPECT_EQ(home.front(), '/');
}
