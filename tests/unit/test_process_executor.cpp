#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "runtime/process_executor.hpp"

namespace {

using turnstile::protocol::AgentEvent;
using turnstile::protocol::AgentItem;
using turnstile::protocol::AgentItemKind;
using turnstile::protocol::AgentMessage;
using turnstile::protocol::TurnUsage;
using turnstile::runtime::parse_executor_line;
using turnstile::runtime::ProcessExecutor;
using turnstile::runtime::ProcessExecutorOptions;
using turnstile::runtime::TurnRequest;
using turnstile::runtime::TurnCompletion;

class RecordingSink : public turnstile::runtime::TurnSink {
public:
    void on_event(const AgentEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    void on_finished(const TurnCompletion& completion) override {
        std::lock_guard<std::mutex> lock(mutex_);
        completion_ = completion;
        ++finished_count_;
        cv_.notify_all();
    }

    bool wait_finished(const std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return finished_count_ > 0; });
    }

    std::vector<AgentEvent> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    TurnCompletion completion() {
        std::lock_guard<std::mutex> lock(mutex_);
        return completion_;
    }

    int finished_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_count_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<AgentEvent> events_;
    TurnCompletion completion_;
    int finished_count_ = 0;
};

TurnRequest make_request(const std::string& prompt) {
    TurnRequest request;
    request.key = {1, 4};
    request.turn_id = 1;
    request.workdir = std::filesystem::temp_directory_path();
    request.prompt = prompt;
    return request;
}

struct TurnRun {
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    std::shared_ptr<std::atomic_bool> cancel = std::make_shared<std::atomic_bool>(false);
};

TEST(ParseExecutorLineTest, ParsesMessage) {
    auto event = parse_executor_line(R"({"type":"message","id":"m1","text":"hi"})");
    ASSERT_TRUE(event.has_value());
    const auto* message = std::get_if<AgentMessage>(&event.value());
    ASSERT_NE(message, nullptr);
    EXPECT_EQ(message->id, "m1");
    EXPECT_EQ(message->text, "hi");
}

TEST(ParseExecutorLineTest, ParsesItemWithPayload) {
    auto event = parse_executor_line(
        R"({"type":"item","id":"i1","kind":"command_execution","payload":{"command":"ls"}})");
    ASSERT_TRUE(event.has_value());
    const auto* item = std::get_if<AgentItem>(&event.value());
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->kind, AgentItemKind::CommandExecution);
    EXPECT_EQ(item->payload["command"], "ls");
}

TEST(ParseExecutorLineTest, ParsesUsage) {
    auto event = parse_executor_line(R"({"type":"turn_usage","usage_json":{"tokens":12}})");
    ASSERT_TRUE(event.has_value());
    const auto* usage = std::get_if<TurnUsage>(&event.value());
    ASSERT_NE(usage, nullptr);
    ASSERT_TRUE(usage->usage_json.has_value());
    EXPECT_EQ(usage->usage_json.value()["tokens"], 12);
}

TEST(ParseExecutorLineTest, IgnoresUnknownOrMalformedLines) {
    EXPECT_FALSE(parse_executor_line("plain progress text").has_value());
    EXPECT_FALSE(parse_executor_line("[1,2]").has_value());
    EXPECT_FALSE(parse_executor_line(R"({"type":"message","id":"m1"})").has_value());
    EXPECT_FALSE(parse_executor_line(R"({"type":"item","id":"i","kind":"dance"})").has_value());
    EXPECT_FALSE(parse_executor_line(R"({"type":"other"})").has_value());
}

TEST(ProcessExecutorTest, EmptyCommandFailsTurn) {
    TurnRun run;
    {
        ProcessExecutor executor(ProcessExecutorOptions{"", 2048});
        executor.start(make_request("hello"), run.cancel, run.sink);
    }
    ASSERT_TRUE(run.sink->wait_finished(std::chrono::seconds(5)));
    EXPECT_FALSE(run.sink->completion().success);
    EXPECT_EQ(run.sink->completion().error_message, "no agent command configured");
}

TEST(ProcessExecutorTest, StreamsEventsFromStdout) {
    const std::string command =
        "read prompt; "
        "printf '%s\\n' '{\"type\":\"message\",\"id\":\"m1\",\"text\":\"working\"}'; "
        "echo 'not json'; "
        "printf '{\"type\":\"message\",\"id\":\"m2\",\"text\":\"%s\"}\\n' \"$prompt\"";
    TurnRun run;
    {
        ProcessExecutor executor(ProcessExecutorOptions{command, 2048});
        executor.start(make_request("fix the build\n"), run.cancel, run.sink);
        ASSERT_TRUE(run.sink->wait_finished(std::chrono::seconds(10)));
    }

    EXPECT_TRUE(run.sink->completion().success);
    const auto events = run.sink->events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<AgentMessage>(events[0]).text, "working");
    EXPECT_EQ(std::get<AgentMessage>(events[1]).id, "m2");
    EXPECT_EQ(std::get<AgentMessage>(events[1]).text, "fix the build");
}

TEST(ProcessExecutorTest, ExportsTaskEnvironment) {
    const std::string command =
        "printf '{\"type\":\"message\",\"id\":\"env\",\"text\":\"%s\"}\\n' \"$TURNSTILE_TASK\"";
    TurnRun run;
    {
        ProcessExecutor executor(ProcessExecutorOptions{command, 2048});
        executor.start(make_request(""), run.cancel, run.sink);
        ASSERT_TRUE(run.sink->wait_finished(std::chrono::seconds(10)));
    }
    const auto events = run.sink->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<AgentMessage>(events[0]).text, "w1/t4");
}

TEST(ProcessExecutorTest, NonZeroExitReportsStderrTail) {
    TurnRun run;
    {
        ProcessExecutor executor(ProcessExecutorOptions{"echo 'model unavailable' >&2; exit 3", 2048});
        executor.start(make_request("x"), run.cancel, run.sink);
        ASSERT_TRUE(run.sink->wait_finished(std::chrono::seconds(10)));
    }
    EXPECT_FALSE(run.sink->completion().success);
    EXPECT_EQ(run.sink->completion().error_message, "model unavailable");
}

TEST(ProcessExecutorTest, SilentFailureReportsExitCode) {
    TurnRun run;
    {
        ProcessExecutor executor(ProcessExecutorOptions{"exit 5", 2048});
        executor.start(make_request("x"), run.cancel, run.sink);
        ASSERT_TRUE(run.sink->wait_finished(std::chrono::seconds(10)));
    }
    EXPECT_FALSE(run.sink->completion().success);
    EXPECT_EQ(run.sink->completion().error_message, "agent process failed with exit code 5");
}

TEST(ProcessExecutorTest, CancelStopsLongRunningTurn) {
    TurnRun run;
    const auto started = std::chrono::steady_clock::now();
    {
        ProcessExecutor executor(ProcessExecutorOptions{"sleep 30", 2048});
        executor.start(make_request("x"), run.cancel, run.sink);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        run.cancel->store(true);
        ASSERT_TRUE(run.sink->wait_finished(std::chrono::seconds(10)));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_FALSE(run.sink->completion().success);
    EXPECT_EQ(run.sink->completion().error_message, "turn cancelled");
    EXPECT_EQ(run.sink->finished_count(), 1);
}

TEST(ProcessExecutorTest, FinishedWorkersAreReaped) {
    ProcessExecutor executor(ProcessExecutorOptions{"true", 2048});
    for (int i = 0; i < 5; ++i) {
        TurnRun run;
        executor.start(make_request("turn " + std::to_string(i)), run.cancel, run.sink);
        ASSERT_TRUE(run.sink->wait_finished(std::chrono::seconds(10)));
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (executor.live_workers() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(executor.live_workers(), 0u);
}

}  // namespace
