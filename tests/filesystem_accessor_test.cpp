#include "repobox/core/filesystem_accessor.hpp"
#include "repobox/core/provisioner.hpp"
#include "repobox/core/errors.hpp"
#include "fake_container_runtime.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace repobox::core;
using repobox::test::FakeContainerRuntime;
using repobox::test::TestConfig;
using ::testing::ElementsAre;

namespace {

std::vector<std::string> Names(const DirectoryListing& listing) {
    std::vector<std::string> names;
    for (const auto& entry : listing.entries) {
        names.push_back(entry.name);
    }
    return names;
}

} // anonymous namespace

class FilesystemAccessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        CreateRequest request;
        request.repo_url = "https://github.com/org/repo.git";
        id_ = provisioner_.CreateContainer(request).id;
    }

    ServiceConfig config_ = TestConfig();
    FakeContainerRuntime runtime_;
    SandboxRegistry registry_;
    CommandExecutor executor_{registry_, runtime_, config_};
    Provisioner provisioner_{registry_, runtime_, executor_, config_};
    FilesystemAccessor accessor_{registry_, runtime_, config_};
    std::string id_;
};

TEST_F(FilesystemAccessorTest, BrowsesWorkspaceRoot) {
    auto listing = accessor_.BrowseDirectory(id_, "");

    EXPECT_EQ("/workspace", listing.path);
    ASSERT_THAT(Names(listing), ElementsAre("README.md", "src"));

    const auto& readme = listing.entries[0];
    EXPECT_EQ(EntryKind::FILE, readme.kind);
    EXPECT_EQ(7u, readme.size);
    EXPECT_EQ("-rw-r--r--", readme.permissions);
    ASSERT_TRUE(readme.modified_at.has_value());
    EXPECT_EQ(1700000000, std::chrono::duration_cast<std::chrono::seconds>(
        readme.modified_at->time_since_epoch()).count());

    EXPECT_EQ(EntryKind::DIRECTORY, listing.entries[1].kind);
    EXPECT_EQ("drwxr-xr-x", listing.entries[1].permissions);
}

TEST_F(FilesystemAccessorTest, BrowsesSubdirectory) {
    auto listing = accessor_.BrowseDirectory(id_, "src");

    EXPECT_EQ("/workspace/src", listing.path);
    EXPECT_THAT(Names(listing), ElementsAre("main.cpp"));
}

TEST_F(FilesystemAccessorTest, EntriesAreSortedAndKeepUnusualNames) {
    runtime_.AddFile(id_, "/workspace/src/b.txt", "b");
    runtime_.AddFile(id_, "/workspace/src/a\ttab\nnewline", "x");
    runtime_.AddSymlink(id_, "/workspace/src/link", "main.cpp");

    auto listing = accessor_.BrowseDirectory(id_, "/workspace/src/");

    EXPECT_THAT(Names(listing), ElementsAre("a\ttab\nnewline", "b.txt", "link", "main.cpp"));
    EXPECT_EQ(EntryKind::SYMLINK, listing.entries[2].kind);
}

TEST_F(FilesystemAccessorTest, DotDotTraversalRejectedWithoutProbing) {
    auto execs = runtime_.ExecCount();

    EXPECT_THROW(accessor_.ReadFile(id_, "../../etc/passwd"), PathTraversalError);
    EXPECT_THROW(accessor_.BrowseDirectory(id_, "/etc"), PathTraversalError);
    EXPECT_THROW(accessor_.BrowseDirectory(id_, "src/../../"), PathTraversalError);

    EXPECT_EQ(execs, runtime_.ExecCount());
}

TEST_F(FilesystemAccessorTest, SymlinkEscapeRejected) {
    runtime_.AddFile(id_, "/etc/passwd", "root:x:0:0:root:/root:/bin/bash\n");
    runtime_.AddSymlink(id_, "/workspace/escape", "/etc");

    EXPECT_THROW(accessor_.ReadFile(id_, "escape/passwd"), PathTraversalError);
    EXPECT_THROW(accessor_.BrowseDirectory(id_, "escape"), PathTraversalError);
}

TEST_F(FilesystemAccessorTest, SymlinkInsideWorkspaceIsFollowed) {
    runtime_.AddSymlink(id_, "/workspace/code", "src");

    auto listing = accessor_.BrowseDirectory(id_, "code");

    EXPECT_EQ("/workspace/src", listing.path);
    EXPECT_THAT(Names(listing), ElementsAre("main.cpp"));
}

TEST_F(FilesystemAccessorTest, MissingPathIsNotFound) {
    EXPECT_THROW(accessor_.BrowseDirectory(id_, "nope"), NotFoundError);
    EXPECT_THROW(accessor_.ReadFile(id_, "src/nope.cpp"), NotFoundError);
}

TEST_F(FilesystemAccessorTest, WrongEntryTypeIsValidationError) {
    EXPECT_THROW(accessor_.BrowseDirectory(id_, "README.md"), ValidationError);
    EXPECT_THROW(accessor_.ReadFile(id_, "src"), ValidationError);
}

TEST_F(FilesystemAccessorTest, ReadsTextFile) {
    auto content = accessor_.ReadFile(id_, "README.md");

    EXPECT_EQ("/workspace/README.md", content.path);
    EXPECT_EQ("# demo\n", content.content);
    EXPECT_EQ(7u, content.size);
    EXPECT_FALSE(content.is_binary);
}

TEST_F(FilesystemAccessorTest, ReadsEmptyFile) {
    runtime_.AddFile(id_, "/workspace/empty", "");

    auto content = accessor_.ReadFile(id_, "empty");

    EXPECT_EQ("", content.content);
    EXPECT_EQ(0u, content.size);
    EXPECT_FALSE(content.is_binary);
}

TEST_F(FilesystemAccessorTest, FlagsBinaryFile) {
    runtime_.AddFile(id_, "/workspace/blob.bin", std::string("\x7f" "ELF\x00\x01\x02", 7));

    auto content = accessor_.ReadFile(id_, "blob.bin");

    EXPECT_TRUE(content.is_binary);
    EXPECT_EQ(7u, content.size);
}

TEST_F(FilesystemAccessorTest, OversizedFileIsRejected) {
    runtime_.AddFile(id_, "/workspace/big.log", std::string(config_.max_file_size_bytes + 1, 'x'));
    runtime_.AddFile(id_, "/workspace/exact.log", std::string(config_.max_file_size_bytes, 'x'));

    EXPECT_THROW(accessor_.ReadFile(id_, "big.log"), SizeExceededError);
    EXPECT_EQ(config_.max_file_size_bytes, accessor_.ReadFile(id_, "exact.log").size);
}

TEST_F(FilesystemAccessorTest, RejectsNulInPath) {
    EXPECT_THROW(accessor_.ReadFile(id_, std::string("README.md\0.txt", 14)), ValidationError);
}

TEST_F(FilesystemAccessorTest, UnknownContainerIsNotFound) {
    EXPECT_THROW(accessor_.BrowseDirectory("repo-container-0-0", ""), NotFoundError);
    EXPECT_THROW(accessor_.ReadFile("repo-container-0-0", "README.md"), NotFoundError);
}
