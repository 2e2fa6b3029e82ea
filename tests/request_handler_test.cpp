#include "repobox/api/request_handler.hpp"
#include "repobox/api/json_codec.hpp"
#include "repobox/core/errors.hpp"
#include "fake_container_runtime.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <set>
#include <sstream>
#include <streambuf>
#include <thread>
#include <vector>

using json = nlohmann::json;
using namespace repobox;
using repobox::test::FakeContainerRuntime;
using repobox::test::TestConfig;
using ::testing::HasSubstr;

namespace {

// Hands out one line per read and runs a callback before each one
class LineFeed : public std::streambuf {
public:
    LineFeed(std::vector<std::string> lines, std::function<void()> before_line)
        : lines_(std::move(lines)), before_line_(std::move(before_line)) {}

protected:
    int_type underflow() override {
        if (next_ >= lines_.size()) {
            return traits_type::eof();
        }
        before_line_();
        current_ = lines_[next_++];
        setg(&current_[0], &current_[0], &current_[0] + current_.size());
        return traits_type::to_int_type(current_[0]);
    }

private:
    std::vector<std::string> lines_;
    std::function<void()> before_line_;
    std::string current_;
    std::size_t next_{0};
};

} // anonymous namespace

class RequestHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto runtime = std::make_unique<FakeContainerRuntime>();
        runtime_ = runtime.get();
        manager_ = std::make_unique<core::SandboxManager>(TestConfig(), std::move(runtime));
        handler_ = std::make_unique<api::RequestHandler>(*manager_);
    }

    std::string CreateContainer() {
        auto response = handler_->Handle({{"id", 1}, {"op", "create"},
                                          {"repo_url", "https://github.com/org/repo.git"}});
        EXPECT_TRUE(response.at("ok").get<bool>()) << response.dump();
        return response.at("result").at("id").get<std::string>();
    }

    FakeContainerRuntime* runtime_{nullptr};
    std::unique_ptr<core::SandboxManager> manager_;
    std::unique_ptr<api::RequestHandler> handler_;
};

TEST_F(RequestHandlerTest, CreateReturnsContainerView) {
    auto response = handler_->Handle({{"id", "req-1"}, {"op", "create"},
                                      {"repo_url", "https://github.com/org/repo.git"},
                                      {"branch", "develop"},
                                      {"max_runtime_secs", 600}});

    ASSERT_TRUE(response.at("ok").get<bool>()) << response.dump();
    EXPECT_EQ("req-1", response.at("id"));

    const auto& result = response.at("result");
    EXPECT_EQ("running", result.at("status"));
    EXPECT_EQ("develop", result.at("branch"));
    EXPECT_TRUE(result.at("commit").is_null());
    EXPECT_TRUE(result.at("expires_at").is_string());
    EXPECT_EQ("/workspace", result.at("working_directory"));
}

TEST_F(RequestHandlerTest, GetListAndDelete) {
    auto id = CreateContainer();

    auto get = handler_->Handle({{"id", 2}, {"op", "get"}, {"container_id", id}});
    ASSERT_TRUE(get.at("ok").get<bool>());
    EXPECT_EQ(id, get.at("result").at("id"));

    auto list = handler_->Handle({{"id", 3}, {"op", "list"}});
    EXPECT_EQ(1, list.at("result").at("total_count"));
    EXPECT_EQ(1, list.at("result").at("active_count"));

    auto deleted = handler_->Handle({{"id", 4}, {"op", "delete"}, {"container_id", id}});
    ASSERT_TRUE(deleted.at("ok").get<bool>());
    EXPECT_EQ("Container " + id + " deleted", deleted.at("result").at("message"));

    auto missing = handler_->Handle({{"id", 5}, {"op", "get"}, {"container_id", id}});
    EXPECT_FALSE(missing.at("ok").get<bool>());
    EXPECT_EQ("not_found", missing.at("error"));
    EXPECT_EQ(5, missing.at("id"));
}

TEST_F(RequestHandlerTest, ExecuteReturnsCommandResult) {
    auto id = CreateContainer();

    auto response = handler_->Handle({{"id", 2}, {"op", "execute"}, {"container_id", id},
                                      {"command", "echo hello"}, {"timeout_secs", 5}});

    ASSERT_TRUE(response.at("ok").get<bool>()) << response.dump();
    const auto& result = response.at("result");
    EXPECT_EQ("echo hello", result.at("command"));
    EXPECT_EQ(0, result.at("exit_code"));
    EXPECT_EQ("hello\n", result.at("stdout"));
    EXPECT_EQ("", result.at("stderr"));
    EXPECT_FALSE(result.at("timed_out").get<bool>());
    EXPECT_TRUE(result.at("elapsed_secs").is_number());
}

TEST_F(RequestHandlerTest, ExecuteRejectsNonIntegerTimeout) {
    auto id = CreateContainer();

    auto response = handler_->Handle({{"id", 2}, {"op", "execute"}, {"container_id", id},
                                      {"command", "ls"}, {"timeout_secs", "5"}});

    EXPECT_FALSE(response.at("ok").get<bool>());
    EXPECT_EQ("validation", response.at("error"));
}

TEST_F(RequestHandlerTest, BrowseAndReadFile) {
    auto id = CreateContainer();
    runtime_->AddFile(id, "/workspace/logo.bin", std::string("\x89PNG\x00", 5));

    auto browse = handler_->Handle({{"id", 2}, {"op", "browse"}, {"container_id", id}});
    ASSERT_TRUE(browse.at("ok").get<bool>()) << browse.dump();
    EXPECT_EQ("/workspace", browse.at("result").at("path"));
    EXPECT_EQ(3, browse.at("result").at("total_items"));
    EXPECT_EQ("README.md", browse.at("result").at("items").at(0).at("name"));
    EXPECT_EQ("file", browse.at("result").at("items").at(0).at("type"));

    auto text = handler_->Handle({{"id", 3}, {"op", "read_file"}, {"container_id", id},
                                  {"file_path", "README.md"}});
    ASSERT_TRUE(text.at("ok").get<bool>());
    EXPECT_EQ("# demo\n", text.at("result").at("content"));
    EXPECT_EQ("utf-8", text.at("result").at("encoding"));

    auto binary = handler_->Handle({{"id", 4}, {"op", "read_file"}, {"container_id", id},
                                    {"file_path", "logo.bin"}});
    ASSERT_TRUE(binary.at("ok").get<bool>());
    EXPECT_TRUE(binary.at("result").at("is_binary").get<bool>());
    EXPECT_EQ("base64", binary.at("result").at("encoding"));
    EXPECT_EQ("iVBORwA=", binary.at("result").at("content"));
}

TEST_F(RequestHandlerTest, ErrorKindsAreReported) {
    auto id = CreateContainer();

    auto traversal = handler_->Handle({{"id", 2}, {"op", "read_file"}, {"container_id", id},
                                       {"file_path", "../../etc/passwd"}});
    EXPECT_EQ("path_traversal", traversal.at("error"));

    auto missing_field = handler_->Handle({{"id", 3}, {"op", "read_file"}, {"container_id", id}});
    EXPECT_EQ("validation", missing_field.at("error"));

    auto bad_url = handler_->Handle({{"id", 4}, {"op", "create"}, {"repo_url", "nope"}});
    EXPECT_EQ("validation", bad_url.at("error"));

    auto unknown = handler_->Handle({{"id", 5}, {"op", "reboot"}});
    EXPECT_FALSE(unknown.at("ok").get<bool>());
    EXPECT_EQ("validation", unknown.at("error"));
    EXPECT_THAT(unknown.at("detail").get<std::string>(), HasSubstr("Unknown operation"));
    EXPECT_TRUE(unknown.at("timestamp").is_string());
}

TEST_F(RequestHandlerTest, ServiceStatusOperations) {
    auto health = handler_->Handle({{"op", "health"}});
    EXPECT_TRUE(health.at("id").is_null());
    EXPECT_EQ("healthy", health.at("result").at("status"));
    EXPECT_EQ("fake", health.at("result").at("runtime"));

    EXPECT_EQ("ready", handler_->Handle({{"op", "ready"}}).at("result").at("status"));
    EXPECT_EQ("alive", handler_->Handle({{"op", "live"}}).at("result").at("status"));

    auto info = handler_->Handle({{"op", "info"}});
    EXPECT_EQ("Remote Code Docker Deployment API", info.at("result").at("api_name"));
    EXPECT_EQ("fake", info.at("result").at("runtime").at("name"));
}

TEST_F(RequestHandlerTest, MalformedLineYieldsValidationError) {
    auto response = json::parse(handler_->HandleLine("{not json"));

    EXPECT_TRUE(response.at("id").is_null());
    EXPECT_FALSE(response.at("ok").get<bool>());
    EXPECT_EQ("validation", response.at("error"));

    auto not_object = json::parse(handler_->HandleLine("[1,2,3]"));
    EXPECT_EQ("validation", not_object.at("error"));
}

TEST_F(RequestHandlerTest, ServeAnswersEveryRequestLine) {
    std::istringstream in(
        "{\"id\": 1, \"op\": \"live\"}\n"
        "\n"
        "{\"id\": 2, \"op\": \"health\"}\n"
        "garbage\n");
    std::ostringstream out;
    std::atomic<bool> stop{false};

    handler_->Serve(in, out, stop);

    std::set<std::string> ids;
    std::istringstream lines(out.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        auto response = json::parse(line);
        ids.insert(response.at("id").dump());
        ++count;
    }

    EXPECT_EQ(3, count);
    EXPECT_EQ((std::set<std::string>{"1", "2", "null"}), ids);
}

TEST_F(RequestHandlerTest, ServeReleasesFinishedRequests) {
    constexpr int kRequests = 200;
    std::vector<std::string> lines;
    for (int i = 0; i < kRequests; ++i) {
        lines.push_back("{\"id\": " + std::to_string(i) + ", \"op\": \"live\"}\n");
    }

    std::size_t peak = 0;
    LineFeed feed(lines, [this, &peak] {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        peak = std::max(peak, handler_->InFlightRequests());
    });
    std::istream in(&feed);
    std::ostringstream out;
    std::atomic<bool> stop{false};

    handler_->Serve(in, out, stop);

    EXPECT_LE(peak, 8u);
    EXPECT_EQ(0u, handler_->InFlightRequests());
    auto responses = out.str();
    EXPECT_EQ(kRequests, std::count(responses.begin(), responses.end(), '\n'));
}

TEST(JsonCodecTest, FormatsUtcTimestamps) {
    EXPECT_EQ("1970-01-01T00:00:00Z", api::FormatTimestamp(core::TimePoint{}));
    EXPECT_EQ("2023-11-14T22:13:20Z",
              api::FormatTimestamp(core::TimePoint(std::chrono::seconds(1700000000))));
}

TEST(JsonCodecTest, ParsesCreateRequest) {
    auto request = api::ParseCreateRequest({
        {"repo_url", "https://github.com/org/repo.git"},
        {"commit", "abc1234"},
        {"env_vars", {{"A", "1"}}},
        {"initial_command", "make"}
    });

    EXPECT_EQ("https://github.com/org/repo.git", request.repo_url);
    EXPECT_FALSE(request.branch.has_value());
    EXPECT_EQ("abc1234", request.commit.value());
    EXPECT_EQ("1", request.env_vars.at("A"));
    EXPECT_EQ("make", request.initial_command.value());

    EXPECT_THROW(api::ParseCreateRequest(json::object()), core::ValidationError);
    EXPECT_THROW(api::ParseCreateRequest({{"repo_url", "x"}, {"env_vars", {{"A", 1}}}}),
                 core::ValidationError);
    EXPECT_THROW(api::ParseCreateRequest({{"repo_url", "x"}, {"max_runtime_secs", 1.5}}),
                 core::ValidationError);
}

TEST(JsonCodecTest, CommandResultView) {
    core::CommandResult result;
    result.command = "sleep 5";
    result.exit_code = core::kTimeoutExitCode;
    result.elapsed_secs = 1.00049;
    result.timed_out = true;

    auto view = api::ToJson(result);

    EXPECT_EQ(124, view.at("exit_code"));
    EXPECT_TRUE(view.at("timed_out").get<bool>());
    EXPECT_DOUBLE_EQ(1.0, view.at("elapsed_secs").get<double>());
}
