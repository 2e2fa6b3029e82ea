#include "repobox/utils/string_utils.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using repobox::utils::StringUtils;
using ::testing::ElementsAre;

TEST(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ("abc", StringUtils::Trim("  abc\t\n"));
    EXPECT_EQ("", StringUtils::Trim(" \n "));
    EXPECT_EQ("a b", StringUtils::Trim("a b"));
}

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
    EXPECT_THAT(StringUtils::Split("a,,b,", ','), ElementsAre("a", "", "b", ""));
    EXPECT_THAT(StringUtils::Split("", ','), ElementsAre(""));
}

TEST(StringUtilsTest, SplitNLeavesRemainderInLastField) {
    EXPECT_THAT(StringUtils::SplitN("f\t12\tname\twith\ttabs", '\t', 3),
                ElementsAre("f", "12", "name\twith\ttabs"));
    EXPECT_THAT(StringUtils::SplitN("only", '\t', 5), ElementsAre("only"));
    EXPECT_TRUE(StringUtils::SplitN("x", '\t', 0).empty());
}

TEST(StringUtilsTest, JoinAndAffixes) {
    EXPECT_EQ("a/b/c", StringUtils::Join({"a", "b", "c"}, "/"));
    EXPECT_EQ("", StringUtils::Join({}, "/"));
    EXPECT_TRUE(StringUtils::StartsWith("repo-container-1", "repo-"));
    EXPECT_FALSE(StringUtils::StartsWith("re", "repo"));
    EXPECT_TRUE(StringUtils::EndsWith("main.lock", ".lock"));
    EXPECT_TRUE(StringUtils::Contains("Error: No such container: x", "No such container"));
}

TEST(StringUtilsTest, AcceptsCommonRepositoryUrls) {
    EXPECT_TRUE(StringUtils::IsRepositoryURL("https://github.com/org/repo.git"));
    EXPECT_TRUE(StringUtils::IsRepositoryURL("http://gitlab.example.com:8080/group/sub/repo"));
    EXPECT_TRUE(StringUtils::IsRepositoryURL("ssh://git@github.com/org/repo.git"));
    EXPECT_TRUE(StringUtils::IsRepositoryURL("git://example.org/repo.git"));
    EXPECT_TRUE(StringUtils::IsRepositoryURL("git@github.com:org/repo.git"));
    EXPECT_TRUE(StringUtils::IsRepositoryURL("file:///srv/git/repo.git"));
}

TEST(StringUtilsTest, RejectsMalformedRepositoryUrls) {
    EXPECT_FALSE(StringUtils::IsRepositoryURL(""));
    EXPECT_FALSE(StringUtils::IsRepositoryURL("not a url"));
    EXPECT_FALSE(StringUtils::IsRepositoryURL("ftp://example.com/repo.git"));
    EXPECT_FALSE(StringUtils::IsRepositoryURL("--upload-pack=touch /tmp/x"));
    EXPECT_FALSE(StringUtils::IsRepositoryURL("https://github.com/org/repo.git\n"));
    EXPECT_FALSE(StringUtils::IsRepositoryURL("https://github.com"));
}

TEST(StringUtilsTest, ExtractsLowercaseHost) {
    EXPECT_EQ("github.com", StringUtils::ExtractHost("https://GitHub.com/org/repo").value());
    EXPECT_EQ("gitlab.internal", StringUtils::ExtractHost("git@gitlab.internal:team/app.git").value());
    EXPECT_EQ("example.com", StringUtils::ExtractHost("ssh://user@example.com:2222/r.git").value());
    EXPECT_FALSE(StringUtils::ExtractHost("file:///srv/git/repo.git").has_value());
}

TEST(StringUtilsTest, GitRefNames) {
    EXPECT_TRUE(StringUtils::IsGitRefName("main"));
    EXPECT_TRUE(StringUtils::IsGitRefName("feature/login-form"));
    EXPECT_TRUE(StringUtils::IsGitRefName("v1.2.3"));
    EXPECT_FALSE(StringUtils::IsGitRefName(""));
    EXPECT_FALSE(StringUtils::IsGitRefName("-delete"));
    EXPECT_FALSE(StringUtils::IsGitRefName("a..b"));
    EXPECT_FALSE(StringUtils::IsGitRefName("has space"));
    EXPECT_FALSE(StringUtils::IsGitRefName("topic.lock"));
    EXPECT_FALSE(StringUtils::IsGitRefName("weird~1"));
    EXPECT_FALSE(StringUtils::IsGitRefName("trailing/"));
}

TEST(StringUtilsTest, CommitHashes) {
    EXPECT_TRUE(StringUtils::IsCommitHash("abc1234"));
    EXPECT_TRUE(StringUtils::IsCommitHash("0123456789abcdef0123456789abcdef01234567"));
    EXPECT_FALSE(StringUtils::IsCommitHash("abc"));
    EXPECT_FALSE(StringUtils::IsCommitHash("xyz1234"));
    EXPECT_FALSE(StringUtils::IsCommitHash("HEAD~1"));
}

TEST(StringUtilsTest, EnvironmentVariableNames) {
    EXPECT_TRUE(StringUtils::IsEnvVarName("NODE_ENV"));
    EXPECT_TRUE(StringUtils::IsEnvVarName("_private1"));
    EXPECT_FALSE(StringUtils::IsEnvVarName("1ABC"));
    EXPECT_FALSE(StringUtils::IsEnvVarName("A-B"));
    EXPECT_FALSE(StringUtils::IsEnvVarName("A=B"));
    EXPECT_FALSE(StringUtils::IsEnvVarName(""));
}

TEST(StringUtilsTest, PrintableUtf8Detection) {
    EXPECT_TRUE(StringUtils::IsPrintableUtf8("plain text\n"));
    EXPECT_TRUE(StringUtils::IsPrintableUtf8("caf\xc3\xa9 \xe2\x9c\x93"));
    EXPECT_TRUE(StringUtils::IsPrintableUtf8(""));
    EXPECT_FALSE(StringUtils::IsPrintableUtf8(std::string("a\0b", 3)));
    EXPECT_FALSE(StringUtils::IsPrintableUtf8("\xff\xfe"));
    EXPECT_FALSE(StringUtils::IsPrintableUtf8("truncated \xe2\x9c"));
}

TEST(StringUtilsTest, Base64Encoding) {
    EXPECT_EQ("", StringUtils::ToBase64(""));
    EXPECT_EQ("Zg==", StringUtils::ToBase64("f"));
    EXPECT_EQ("Zm8=", StringUtils::ToBase64("fo"));
    EXPECT_EQ("Zm9vYmFy", StringUtils::ToBase64("foobar"));
    EXPECT_EQ("AP8=", StringUtils::ToBase64(std::string("\x00\xff", 2)));
}

TEST(StringUtilsTest, TruncateAppendsSuffix) {
    EXPECT_EQ("short", StringUtils::Truncate("short", 10));
    EXPECT_EQ("abcdefg...", StringUtils::Truncate("abcdefghijklmnop", 10));
    EXPECT_EQ("ab", StringUtils::Truncate("abcdef", 2));
}
