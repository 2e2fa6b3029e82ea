#include "repobox/core/reaper.hpp"
#include "repobox/core/provisioner.hpp"
#include "repobox/core/errors.hpp"
#include "fake_container_runtime.hpp"

#include <gtest/gtest.h>

#include <future>
#include <shared_mutex>
#include <thread>

using namespace repobox::core;
using repobox::runtime::SandboxSpec;
using repobox::test::FakeContainerRuntime;
using repobox::test::TestConfig;

class ReaperTest : public ::testing::Test {
protected:
    // Registers a running sandbox whose lifetime ends at now + offset
    std::string AddSandbox(const std::string& id,
                           std::optional<std::chrono::seconds> expires_in,
                           ContainerStatus status = ContainerStatus::RUNNING) {
        SandboxSpec spec;
        spec.name = id;
        ContainerRecord record;
        record.id = id;
        record.handle = runtime_.Start(spec);
        record.status = status;
        record.repo_url = "https://github.com/org/repo.git";
        record.branch = "main";
        record.created_at = Clock::now();
        record.working_directory = "/workspace";
        if (expires_in) {
            record.expires_at = record.created_at + *expires_in;
        }
        registry_.Insert(record);
        return id;
    }

    ServiceConfig config_ = TestConfig();
    FakeContainerRuntime runtime_;
    SandboxRegistry registry_;
    Reaper reaper_{registry_, runtime_, std::chrono::milliseconds(50)};
};

TEST_F(ReaperTest, DestroysExpiredAndKeepsLiveSandboxes) {
    AddSandbox("expired", std::chrono::seconds(-1));
    AddSandbox("later", std::chrono::seconds(3600));
    AddSandbox("forever", std::nullopt);

    EXPECT_EQ(1u, reaper_.RunOnce());

    EXPECT_FALSE(registry_.Find("expired").has_value());
    EXPECT_FALSE(runtime_.Exists("expired"));
    EXPECT_TRUE(registry_.Find("later").has_value());
    EXPECT_TRUE(registry_.Find("forever").has_value());
    EXPECT_EQ(2u, runtime_.SandboxCount());
}

TEST_F(ReaperTest, ExpiredContainerAcceptsNoFurtherCommands) {
    CommandExecutor executor(registry_, runtime_, config_);
    Provisioner provisioner(registry_, runtime_, executor, config_);

    CreateRequest request;
    request.repo_url = "https://github.com/org/repo.git";
    request.max_runtime_secs = 1;
    auto record = provisioner.CreateContainer(request);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    EXPECT_EQ(1u, reaper_.RunOnce());

    auto execs = runtime_.ExecCount();
    ExecuteRequest execute;
    execute.command = "ls";
    EXPECT_THROW(executor.ExecuteCommand(record.id, execute), NotFoundError);
    EXPECT_EQ(execs, runtime_.ExecCount());
}

TEST_F(ReaperTest, ExpiredButUnsweptContainerRejectsCommands) {
    AddSandbox("stale", std::chrono::seconds(-1));
    ExecuteRequest execute;
    execute.command = "ls";

    CommandExecutor serialized(registry_, runtime_, config_);
    EXPECT_THROW(serialized.ExecuteCommand("stale", execute), InvalidStateError);

    auto concurrent_config = config_;
    concurrent_config.serialize_commands = false;
    CommandExecutor concurrent(registry_, runtime_, concurrent_config);
    EXPECT_THROW(concurrent.ExecuteCommand("stale", execute), InvalidStateError);

    EXPECT_EQ(0, runtime_.ExecCount());
}

TEST_F(ReaperTest, HeldCommandLockDefersExpiry) {
    AddSandbox("busy", std::chrono::seconds(-1));
    auto command_mutex = registry_.CommandLock("busy");

    {
        std::shared_lock<std::shared_mutex> in_flight(*command_mutex);
        EXPECT_EQ(0u, reaper_.RunOnce());
        EXPECT_EQ(ContainerStatus::RUNNING, registry_.Get("busy").status);
        EXPECT_TRUE(runtime_.Exists("busy"));
    }

    EXPECT_EQ(1u, reaper_.RunOnce());
    EXPECT_FALSE(registry_.Find("busy").has_value());
}

TEST_F(ReaperTest, CommandInFlightAtExpiryCompletesBeforeDestroy) {
    auto concurrent_config = config_;
    concurrent_config.serialize_commands = false;
    CommandExecutor executor(registry_, runtime_, concurrent_config);
    AddSandbox("running", std::chrono::seconds(1));

    std::promise<void> entered;
    std::promise<void> release;
    auto released = release.get_future().share();
    runtime_.exec_hook = [&entered, released](const std::string&, const repobox::runtime::ExecSpec&)
        -> std::optional<repobox::runtime::ExecOutcome> {
        entered.set_value();
        released.wait();
        return std::nullopt;
    };

    ExecuteRequest execute;
    execute.command = "echo done";
    CommandResult result;
    std::thread command([&] { result = executor.ExecuteCommand("running", execute); });

    entered.get_future().wait();
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    EXPECT_EQ(0u, reaper_.RunOnce());
    EXPECT_EQ(ContainerStatus::RUNNING, registry_.Get("running").status);

    release.set_value();
    command.join();
    EXPECT_EQ("done\n", result.stdout_output);

    EXPECT_EQ(1u, reaper_.RunOnce());
    EXPECT_FALSE(runtime_.Exists("running"));
}

TEST_F(ReaperTest, SkipsProvisioningRecords) {
    AddSandbox("provisioning", std::chrono::seconds(-1), ContainerStatus::PROVISIONING);

    EXPECT_EQ(0u, reaper_.RunOnce());
    EXPECT_TRUE(registry_.Find("provisioning").has_value());
}

TEST_F(ReaperTest, FailedDestroyIsRetriedOnNextSweep) {
    AddSandbox("stubborn", std::chrono::seconds(-1));
    runtime_.destroy_failures = 1;

    EXPECT_EQ(0u, reaper_.RunOnce());
    ASSERT_TRUE(registry_.Find("stubborn").has_value());
    EXPECT_EQ(ContainerStatus::EXPIRED, registry_.Get("stubborn").status);

    EXPECT_EQ(1u, reaper_.RunOnce());
    EXPECT_FALSE(registry_.Find("stubborn").has_value());
    EXPECT_EQ(2, runtime_.DestroyCount());
}

TEST_F(ReaperTest, ExpiredFailedRecordsAreCleanedUp) {
    AddSandbox("dead", std::chrono::seconds(-1), ContainerStatus::FAILED);

    EXPECT_EQ(1u, reaper_.RunOnce());
    EXPECT_EQ(0u, registry_.Size());
}

TEST_F(ReaperTest, DestroyAllRemovesEverything) {
    AddSandbox("a", std::nullopt);
    AddSandbox("b", std::chrono::seconds(3600));

    EXPECT_EQ(2u, reaper_.DestroyAll());
    EXPECT_EQ(0u, registry_.Size());
    EXPECT_EQ(0u, runtime_.SandboxCount());
}

TEST_F(ReaperTest, BackgroundLoopReapsWithoutExplicitSweep) {
    reaper_.Start();
    reaper_.Start();
    EXPECT_TRUE(reaper_.IsRunning());

    AddSandbox("short", std::chrono::seconds(0));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (registry_.Size() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    EXPECT_EQ(0u, registry_.Size());
    reaper_.Stop();
    EXPECT_FALSE(reaper_.IsRunning());
}

TEST_F(ReaperTest, StopWithDestroyRemainingSweepsAll) {
    reaper_.Start();
    AddSandbox("a", std::nullopt);

    reaper_.Stop(true);

    EXPECT_EQ(0u, registry_.Size());
    EXPECT_FALSE(runtime_.Exists("a"));
}
