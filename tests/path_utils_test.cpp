#include "repobox/utils/path_utils.hpp"

#include <gtest/gtest.h>

using repobox::utils::PathUtils;

TEST(PathUtilsTest, NormalizeCollapsesDotsAndSlashes) {
    EXPECT_EQ("/workspace/src", PathUtils::Normalize("/workspace//./src/"));
    EXPECT_EQ("/workspace", PathUtils::Normalize("/workspace/src/.."));
    EXPECT_EQ("/", PathUtils::Normalize(""));
    EXPECT_EQ("/", PathUtils::Normalize("/../.."));
    EXPECT_EQ("/etc/passwd", PathUtils::Normalize("/workspace/../../etc/passwd"));
}

TEST(PathUtilsTest, ResolveAgainstBase) {
    EXPECT_EQ("/workspace", PathUtils::Resolve("/workspace", ""));
    EXPECT_EQ("/workspace/src/main.cpp", PathUtils::Resolve("/workspace", "src/main.cpp"));
    EXPECT_EQ("/tmp/x", PathUtils::Resolve("/workspace", "/tmp/x"));
    EXPECT_EQ("/etc/passwd", PathUtils::Resolve("/workspace", "../../etc/passwd"));
}

TEST(PathUtilsTest, IsWithinComparesWholeComponents) {
    EXPECT_TRUE(PathUtils::IsWithin("/workspace", "/workspace"));
    EXPECT_TRUE(PathUtils::IsWithin("/workspace", "/workspace/a/b"));
    EXPECT_FALSE(PathUtils::IsWithin("/workspace", "/workspace2"));
    EXPECT_FALSE(PathUtils::IsWithin("/workspace", "/etc/passwd"));
    EXPECT_FALSE(PathUtils::IsWithin("/workspace", "/"));
    EXPECT_TRUE(PathUtils::IsWithin("/", "/anything"));
}
