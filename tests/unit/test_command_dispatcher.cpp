#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/tokens.hpp"
#include "core/errors/service_errors.hpp"
#include "pty/pty_session.hpp"
#include "scripted_executor.hpp"
#include "session/attachment_store.hpp"
#include "session/command_dispatcher.hpp"
#include "session/conversation_journal.hpp"

namespace {

using nlohmann::json;
using turnstile::core::errors::get_error;
using turnstile::core::errors::get_value;
using turnstile::core::errors::is_error;
using turnstile::protocol::TaskKey;
using turnstile::protocol::UserInput;
using turnstile::session::CommandDispatcher;
using turnstile::session::DispatcherServices;
using turnstile::test_support::ScriptedExecutor;

namespace protocol = turnstile::protocol;
namespace session = turnstile::session;

std::vector<json> drain_broadcasts(session::Mailbox& mailbox) {
    std::vector<json> events;
    while (auto item = mailbox.pop(std::chrono::milliseconds(0))) {
        if (item->kind == session::OutboundKind::Broadcast) {
            events.push_back(json::parse(*item->payload));
        }
    }
    return events;
}

std::vector<std::string> event_types(const std::vector<json>& events) {
    std::vector<std::string> types;
    for (const auto& event : events) {
        types.push_back(event["event"]["type"].get<std::string>());
    }
    return types;
}

UserInput text_input(const std::string& text) {
    return UserInput{text, {}};
}

class CommandDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        scratch_ = std::filesystem::temp_directory_path() /
                   ("turnstile_dispatcher_" + turnstile::core::config::generate_token("", 12));
        std::filesystem::create_directories(scratch_);
        workdir_ = store_.add_workdir("alpha", std::filesystem::temp_directory_path());
        subscription_ = hub_.subscribe(1024);
        dispatcher_ = std::make_unique<CommandDispatcher>(store_, revisions_, hub_, turns_,
                                                          executor_);
    }

    void TearDown() override {
        dispatcher_.reset();
        std::error_code ec;
        std::filesystem::remove_all(scratch_, ec);
    }

    TaskKey create_task() {
        auto rev = dispatcher_->apply("create", protocol::CreateTask{workdir_});
        EXPECT_FALSE(is_error(rev));
        auto tasks = store_.workdir_summaries(workdir_);
        return TaskKey{workdir_, tasks.back().task_id};
    }

    protocol::ConversationSnapshot conversation(const TaskKey& key) {
        auto snapshot = dispatcher_->conversation_snapshot(key, std::nullopt, std::nullopt);
        EXPECT_FALSE(is_error(snapshot));
        return get_value(snapshot);
    }

    std::filesystem::path scratch_;
    session::TaskStore store_;
    session::RevisionStore revisions_;
    session::EventHub hub_;
    session::TurnRegistry turns_;
    ScriptedExecutor executor_;
    protocol::WorkdirId workdir_ = 0;
    std::unique_ptr<session::Subscription> subscription_;
    std::unique_ptr<CommandDispatcher> dispatcher_;
};

TEST_F(CommandDispatcherTest, CreateTaskCommitsOneRevision) {
    auto rev = dispatcher_->apply("r1", protocol::CreateTask{workdir_});
    ASSERT_FALSE(is_error(rev));
    EXPECT_EQ(get_value(rev), 1u);
    EXPECT_EQ(revisions_.current(), 1u);

    const auto events = drain_broadcasts(subscription_->mailbox());
    EXPECT_EQ(event_types(events),
              (std::vector<std::string>{"conversation_changed", "task_summaries_changed",
                                        "workdir_tasks_changed", "task_created"}));
    for (const auto& event : events) {
        EXPECT_EQ(event["rev"], 1);
    }
    EXPECT_EQ(events.back()["event"]["request_id"], "r1");
    EXPECT_EQ(events.back()["event"]["task_id"], 1);
}

TEST_F(CommandDispatcherTest, CreateTaskInUnknownWorkdirFails) {
    auto rev = dispatcher_->apply("r1", protocol::CreateTask{99});
    ASSERT_TRUE(is_error(rev));
    EXPECT_EQ(get_error(rev).code, "workdir_not_found");
    EXPECT_EQ(revisions_.current(), 0u);
    EXPECT_TRUE(drain_broadcasts(subscription_->mailbox()).empty());
}

TEST_F(CommandDispatcherTest, NoOpReturnsCurrentRevisionWithoutBroadcast) {
    const TaskKey key = create_task();
    drain_broadcasts(subscription_->mailbox());

    auto rev = dispatcher_->apply("r2", protocol::TaskStatusSet{key, protocol::TaskStatus::Todo});
    ASSERT_FALSE(is_error(rev));
    EXPECT_EQ(get_value(rev), 1u);
    EXPECT_TRUE(drain_broadcasts(subscription_->mailbox()).empty());

    auto starred = dispatcher_->apply("r3", protocol::TaskStarSet{key, true});
    ASSERT_FALSE(is_error(starred));
    EXPECT_EQ(get_value(starred), 2u);
}

TEST_F(CommandDispatcherTest, MutatingMissingTaskFails) {
    auto rev = dispatcher_->apply("r1", protocol::CancelAgentTurn{TaskKey{workdir_, 42}});
    ASSERT_TRUE(is_error(rev));
    EXPECT_EQ(get_error(rev).code, "task_not_found");
}

TEST_F(CommandDispatcherTest, SendMessageStartsTurnAndRecordsOutput) {
    const TaskKey key = create_task();
    auto sent = dispatcher_->apply(
        "r2", protocol::SendAgentMessage{key, text_input("Fix the login redirect\nDetails")});
    ASSERT_FALSE(is_error(sent));

    ASSERT_EQ(executor_.started_count(), 1u);
    const auto turn = executor_.started()[0];
    EXPECT_EQ(turn.request.key, key);
    EXPECT_EQ(turn.request.prompt, "Fix the login redirect\nDetails");
    EXPECT_EQ(turn.request.workdir, std::filesystem::temp_directory_path());

    auto running = conversation(key);
    EXPECT_EQ(running.title, "Fix the login redirect");
    EXPECT_EQ(running.task_status, protocol::TaskStatus::Iterating);
    EXPECT_EQ(running.run_status, protocol::OperationStatus::Running);

    const auto before_event = revisions_.current();
    turn.sink->on_event(protocol::AgentEvent{protocol::AgentMessage{"m1", "Looking at it"}});
    EXPECT_EQ(revisions_.current(), before_event + 1);
    turn.sink->on_finished(turnstile::runtime::TurnCompletion{true, "", 1200});

    auto finished = conversation(key);
    EXPECT_EQ(finished.run_status, protocol::OperationStatus::Idle);
    ASSERT_GE(finished.entries.size(), 2u);
    const auto& last = finished.entries.back();
    const auto* agent = std::get_if<protocol::AgentEvent>(&last.body);
    ASSERT_NE(agent, nullptr);
    ASSERT_TRUE(std::holds_alternative<protocol::TurnDuration>(*agent));
    EXPECT_EQ(std::get<protocol::TurnDuration>(*agent).duration_ms, 1200u);
    ASSERT_TRUE(finished.latest_turn.has_value());
    EXPECT_EQ(finished.latest_turn->outcome, protocol::TurnOutcome::Completed);
}

TEST_F(CommandDispatcherTest, SendToUnseenTaskCreatesIt) {
    const TaskKey key{workdir_, 5};
    auto sent = dispatcher_->apply("r1", protocol::SendAgentMessage{key, text_input("hello")});
    ASSERT_FALSE(is_error(sent));
    EXPECT_NE(store_.find_task(key), nullptr);
    EXPECT_EQ(executor_.started_count(), 1u);

    auto next = dispatcher_->apply("r2", protocol::CreateTask{workdir_});
    ASSERT_FALSE(is_error(next));
    EXPECT_EQ(store_.workdir_summaries(workdir_).back().task_id, 6u);
}

TEST_F(CommandDispatcherTest, BlankMessageIsRejected) {
    const TaskKey key = create_task();
    auto sent = dispatcher_->apply("r1", protocol::SendAgentMessage{key, text_input("  \n ")});
    ASSERT_TRUE(is_error(sent));
    EXPECT_EQ(get_error(sent).code, "invalid_action");
    EXPECT_EQ(executor_.started_count(), 0u);
}

TEST_F(CommandDispatcherTest, RejectedMessageDoesNotCreateUnseenTask) {
    const TaskKey blank_key{workdir_, 7};
    auto blank = dispatcher_->apply("r1", protocol::SendAgentMessage{blank_key, text_input("   ")});
    ASSERT_TRUE(is_error(blank));
    EXPECT_EQ(get_error(blank).code, "invalid_action");

    auto queued =
        dispatcher_->apply("r2", protocol::QueueAgentMessage{blank_key, text_input("\n")});
    ASSERT_TRUE(is_error(queued));
    EXPECT_EQ(get_error(queued).code, "invalid_action");

    auto replaced = dispatcher_->apply(
        "r3", protocol::CancelAndSendAgentMessage{blank_key, text_input("")});
    ASSERT_TRUE(is_error(replaced));
    EXPECT_EQ(get_error(replaced).code, "invalid_action");

    protocol::AttachmentRef missing;
    missing.id = "att_0123456789abcdef";
    missing.name = "x.png";
    const TaskKey attachment_key{workdir_, 8};
    auto unresolved = dispatcher_->apply(
        "r4", protocol::SendAgentMessage{attachment_key, UserInput{"look", {missing}}});
    ASSERT_TRUE(is_error(unresolved));
    EXPECT_EQ(get_error(unresolved).code, "attachment_not_found");

    EXPECT_EQ(revisions_.current(), 0u);
    EXPECT_EQ(store_.find_task(blank_key), nullptr);
    EXPECT_EQ(store_.find_task(attachment_key), nullptr);
    EXPECT_TRUE(store_.workdir_summaries(workdir_).empty());
    EXPECT_TRUE(drain_broadcasts(subscription_->mailbox()).empty());
    EXPECT_EQ(executor_.started_count(), 0u);
}

TEST_F(CommandDispatcherTest, MessagesWhileRunningAreQueuedAndRunInOrder) {
    const TaskKey key = create_task();
    ASSERT_FALSE(is_error(dispatcher_->apply("r1", protocol::SendAgentMessage{key, text_input("first")})));
    ASSERT_FALSE(is_error(dispatcher_->apply("r2", protocol::SendAgentMessage{key, text_input("second")})));
    ASSERT_FALSE(is_error(dispatcher_->apply("r3", protocol::QueueAgentMessage{key, text_input("third")})));
    ASSERT_EQ(executor_.started_count(), 1u);

    auto queued = conversation(key);
    ASSERT_EQ(queued.pending_prompts.size(), 2u);
    EXPECT_EQ(queued.pending_prompts[0].text, "second");
    EXPECT_EQ(queued.pending_prompts[1].text, "third");

    executor_.started()[0].sink->on_finished(turnstile::runtime::TurnCompletion{true, "", 10});
    ASSERT_EQ(executor_.started_count(), 2u);
    EXPECT_EQ(executor_.started()[1].request.prompt, "second");
    EXPECT_EQ(conversation(key).pending_prompts.size(), 1u);
}

TEST_F(CommandDispatcherTest, CancelPausesQueueUntilResumed) {
    const TaskKey key = create_task();
    ASSERT_FALSE(is_error(dispatcher_->apply("r1", protocol::SendAgentMessage{key, text_input("first")})));
    ASSERT_FALSE(is_error(dispatcher_->apply("r2", protocol::QueueAgentMessage{key, text_input("next")})));
    const auto first = executor_.started()[0];

    ASSERT_FALSE(is_error(dispatcher_->apply("r3", protocol::CancelAgentTurn{key})));
    EXPECT_TRUE(first.cancel_token->load());
    auto paused = conversation(key);
    EXPECT_TRUE(paused.queue_paused);
    EXPECT_EQ(paused.run_status, protocol::OperationStatus::Idle);

    // Output and completion of the cancelled turn arrive late and are dropped.
    const auto rev = revisions_.current();
    first.sink->on_event(protocol::AgentEvent{protocol::AgentMessage{"m1", "late"}});
    first.sink->on_finished(turnstile::runtime::TurnCompletion{false, "turn cancelled", 0});
    EXPECT_EQ(revisions_.current(), rev);
    EXPECT_EQ(executor_.started_count(), 1u);

    auto cancel_again = dispatcher_->apply("r4", protocol::CancelAgentTurn{key});
    ASSERT_TRUE(is_error(cancel_again));
    EXPECT_EQ(get_error(cancel_again).code, "turn_not_running");

    ASSERT_FALSE(is_error(dispatcher_->apply("r5", protocol::ResumeQueuedPrompts{key})));
    ASSERT_EQ(executor_.started_count(), 2u);
    EXPECT_EQ(executor_.started()[1].request.prompt, "next");
}

TEST_F(CommandDispatcherTest, CancelAndSendReplacesRunningTurn) {
    const TaskKey key = create_task();
    ASSERT_FALSE(is_error(dispatcher_->apply("r1", protocol::SendAgentMessage{key, text_input("slow")})));
    ASSERT_FALSE(is_error(
        dispatcher_->apply("r2", protocol::CancelAndSendAgentMessage{key, text_input("instead")})));
    ASSERT_EQ(executor_.started_count(), 2u);
    EXPECT_TRUE(executor_.started()[0].cancel_token->load());
    EXPECT_FALSE(executor_.started()[1].cancel_token->load());
    EXPECT_EQ(executor_.started()[1].request.prompt, "instead");
}

TEST_F(CommandDispatcherTest, QueueEditing) {
    const TaskKey key = create_task();
    ASSERT_FALSE(is_error(dispatcher_->apply("r1", protocol::SendAgentMessage{key, text_input("run")})));
    for (const std::string text : {"a", "b", "c"}) {
        ASSERT_FALSE(is_error(dispatcher_->apply("q", protocol::QueueAgentMessage{key, text_input(text)})));
    }
    auto ids = conversation(key).pending_prompts;
    ASSERT_EQ(ids.size(), 3u);

    ASSERT_FALSE(is_error(dispatcher_->apply(
        "r2", protocol::ReorderQueuedPrompt{key, ids[2].id, ids[0].id})));
    ASSERT_FALSE(is_error(dispatcher_->apply(
        "r3", protocol::UpdateQueuedPrompt{key, ids[1].id, text_input("b2")})));
    ASSERT_FALSE(is_error(dispatcher_->apply("r4", protocol::RemoveQueuedPrompt{key, ids[0].id})));

    auto edited = conversation(key).pending_prompts;
    ASSERT_EQ(edited.size(), 2u);
    EXPECT_EQ(edited[0].text, "c");
    EXPECT_EQ(edited[1].text, "b2");

    auto missing = dispatcher_->apply("r5", protocol::RemoveQueuedPrompt{key, 999});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "queued_prompt_not_found");

    ASSERT_FALSE(is_error(dispatcher_->apply("r6", protocol::ClearQueuedPrompts{key})));
    EXPECT_TRUE(conversation(key).pending_prompts.empty());
}

TEST_F(CommandDispatcherTest, FailedTurnPublishesToast) {
    const TaskKey key = create_task();
    ASSERT_FALSE(is_error(dispatcher_->apply("r1", protocol::SendAgentMessage{key, text_input("go")})));
    drain_broadcasts(subscription_->mailbox());

    executor_.started()[0].sink->on_finished(turnstile::runtime::TurnCompletion{false, "boom", 0});
    const auto events = drain_broadcasts(subscription_->mailbox());
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back()["event"]["type"], "toast");
    EXPECT_EQ(events.back()["event"]["message"], "Turn failed: boom");
    EXPECT_EQ(store_.workdir_summaries(workdir_).back().last_turn_result,
              protocol::TurnResult::Failed);
}

TEST_F(CommandDispatcherTest, AttachmentsRequireTheStore) {
    const TaskKey key = create_task();
    protocol::AttachmentRef ref;
    ref.id = "att_0123456789abcdef";
    ref.name = "x.png";
    auto sent = dispatcher_->apply("r1", protocol::SendAgentMessage{key, UserInput{"look", {ref}}});
    ASSERT_TRUE(is_error(sent));
    EXPECT_EQ(get_error(sent).code, "attachment_not_found");
}

TEST_F(CommandDispatcherTest, AttachmentsAreResolvedFromTheStore) {
    session::AttachmentStore attachments(scratch_, 1024);
    DispatcherServices services;
    services.attachments = &attachments;
    CommandDispatcher dispatcher(store_, revisions_, hub_, turns_, executor_, services);

    auto stored = attachments.store(workdir_, "trace.log", "stack trace", "text/plain");
    ASSERT_FALSE(is_error(stored));

    protocol::AttachmentRef claimed;
    claimed.id = get_value(stored).id;
    claimed.name = "renamed-by-client";
    const TaskKey key{workdir_, 1};
    auto sent = dispatcher.apply("r1", protocol::SendAgentMessage{key, UserInput{"see log", {claimed}}});
    ASSERT_FALSE(is_error(sent));

    ASSERT_EQ(executor_.started_count(), 1u);
    const auto request = executor_.started()[0].request;
    ASSERT_EQ(request.attachments.size(), 1u);
    EXPECT_EQ(request.attachments[0].name, "trace.log");
    EXPECT_EQ(request.attachments[0].kind, protocol::AttachmentKind::Text);
    ASSERT_EQ(request.attachment_paths.size(), 1u);
    EXPECT_TRUE(std::filesystem::is_regular_file(request.attachment_paths[0]));
}

TEST_F(CommandDispatcherTest, EntriesAreJournaled) {
    session::ConversationJournal journal(scratch_);
    DispatcherServices services;
    services.journal = &journal;
    CommandDispatcher dispatcher(store_, revisions_, hub_, turns_, executor_, services);

    const TaskKey key{workdir_, 3};
    ASSERT_FALSE(is_error(dispatcher.apply("r1", protocol::SendAgentMessage{key, text_input("hi")})));

    auto path = journal.journal_path(key);
    ASSERT_FALSE(is_error(path));
    std::ifstream in(get_value(path));
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    // task created, status change, user message
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(json::parse(lines[2])["payload"]["type"], "user_event");
}

TEST_F(CommandDispatcherTest, ShutdownCancelsAndRefusesNewTurns) {
    const TaskKey key = create_task();
    ASSERT_FALSE(is_error(dispatcher_->apply("r1", protocol::SendAgentMessage{key, text_input("one")})));
    const auto first = executor_.started()[0];

    dispatcher_->shutdown();
    EXPECT_TRUE(first.cancel_token->load());

    first.sink->on_finished(turnstile::runtime::TurnCompletion{false, "turn cancelled", 0});
    ASSERT_FALSE(is_error(dispatcher_->apply("r2", protocol::SendAgentMessage{key, text_input("two")})));
    EXPECT_EQ(executor_.started_count(), 1u);

    auto snapshot = conversation(key);
    EXPECT_EQ(snapshot.run_status, protocol::OperationStatus::Idle);
    const auto* agent = std::get_if<protocol::AgentEvent>(&snapshot.entries.back().body);
    ASSERT_NE(agent, nullptr);
    ASSERT_TRUE(std::holds_alternative<protocol::TurnError>(*agent));
    EXPECT_EQ(std::get<protocol::TurnError>(*agent).message, "server is shutting down");
}

TEST_F(CommandDispatcherTest, TerminalCommandsNeedRegistryAndCommand) {
    const TaskKey key = create_task();
    auto unavailable =
        dispatcher_->apply("r1", protocol::TerminalCommandStart{key, "ls", std::nullopt});
    ASSERT_TRUE(is_error(unavailable));
    EXPECT_EQ(get_error(unavailable).code, "terminal_unavailable");

    turnstile::pty::PtyRegistry terminals(4096);
    DispatcherServices services;
    services.terminals = &terminals;
    CommandDispatcher dispatcher(store_, revisions_, hub_, turns_, executor_, services);
    const auto before = revisions_.current();
    auto blank = dispatcher.apply("r2", protocol::TerminalCommandStart{key, "  \t", std::nullopt});
    ASSERT_TRUE(is_error(blank));
    EXPECT_EQ(get_error(blank).code, "invalid_action");
    EXPECT_EQ(revisions_.current(), before);
}

TEST_F(CommandDispatcherTest, TerminalCommandRecordsStartAndFinish) {
    turnstile::pty::PtyRegistry terminals(4096);
    DispatcherServices services;
    services.terminals = &terminals;
    CommandDispatcher dispatcher(store_, revisions_, hub_, turns_, executor_, services);

    const TaskKey key{workdir_, 1};
    auto started = dispatcher.apply(
        "r1", protocol::TerminalCommandStart{key, "printf term-ok; sleep 0.3", std::string("build")});
    ASSERT_FALSE(is_error(started));
    EXPECT_NE(terminals.find(key, "build"), nullptr);

    std::optional<protocol::TerminalCommandFinished> finished;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!finished.has_value() && std::chrono::steady_clock::now() < deadline) {
        auto snapshot = dispatcher.conversation_snapshot(key, std::nullopt, std::nullopt);
        ASSERT_FALSE(is_error(snapshot));
        for (const auto& entry : get_value(snapshot).entries) {
            const auto* user = std::get_if<protocol::UserEvent>(&entry.body);
            if (user == nullptr) {
                continue;
            }
            if (const auto* done = std::get_if<protocol::TerminalCommandFinished>(user)) {
                finished = *done;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(finished->reconnect, "build");
    EXPECT_EQ(finished->command, "printf term-ok; sleep 0.3");
    EXPECT_GT(finished->output_byte_len, 0u);
    EXPECT_FALSE(finished->output_base64.empty());
}

TEST_F(CommandDispatcherTest, UnpaginatedReadReturnsWholeConversation) {
    const TaskKey key = create_task();
    ASSERT_FALSE(is_error(dispatcher_->apply("r1", protocol::SendAgentMessage{key, text_input("go")})));
    const auto sink = executor_.started()[0].sink;
    for (int i = 0; i < 300; ++i) {
        sink->on_event(protocol::AgentEvent{
            protocol::AgentMessage{"m" + std::to_string(i), "line " + std::to_string(i)}});
    }
    drain_broadcasts(subscription_->mailbox());

    const auto full = conversation(key);
    const std::size_t total = full.entries_total;
    EXPECT_GT(total, 300u);
    EXPECT_EQ(full.entries.size(), total);
    EXPECT_EQ(full.entries_start, 0u);

    auto page = dispatcher_->conversation_snapshot(key, std::nullopt, std::size_t{10});
    ASSERT_FALSE(is_error(page));
    EXPECT_EQ(get_value(page).entries.size(), 10u);
    EXPECT_EQ(get_value(page).entries_start, total - 10);

    // Broadcast snapshots stay bounded by the event window.
    ASSERT_FALSE(is_error(dispatcher_->apply("r2", protocol::TaskStarSet{key, true})));
    const auto events = drain_broadcasts(subscription_->mailbox());
    ASSERT_FALSE(events.empty());
    ASSERT_EQ(events.front()["event"]["type"], "conversation_changed");
    const auto& broadcast = events.front()["event"]["snapshot"];
    EXPECT_EQ(broadcast["entries"].size(), 200u);
    EXPECT_EQ(broadcast["entries_total"], total);
    EXPECT_EQ(broadcast["entries_truncated"], true);
}

TEST_F(CommandDispatcherTest, ConcurrentActionsOnDistinctTasksGetDistinctRevisions) {
    constexpr int kThreads = 8;
    constexpr int kActionsPerThread = 40;
    std::vector<std::vector<protocol::Revision>> revs(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t, &revs] {
            const TaskKey key{workdir_, static_cast<protocol::TaskId>(100 + t)};
            for (int i = 0; i < kActionsPerThread; ++i) {
                auto rev = dispatcher_->apply(
                    "t" + std::to_string(t),
                    protocol::SendAgentMessage{key, text_input("message " + std::to_string(i))});
                if (!is_error(rev)) {
                    revs[t].push_back(get_value(rev));
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<protocol::Revision> distinct;
    std::size_t ok = 0;
    for (const auto& per_thread : revs) {
        ok += per_thread.size();
        distinct.insert(per_thread.begin(), per_thread.end());
        for (std::size_t i = 1; i < per_thread.size(); ++i) {
            EXPECT_LT(per_thread[i - 1], per_thread[i]);
        }
    }
    const std::size_t expected = kThreads * kActionsPerThread;
    EXPECT_EQ(ok, expected);
    EXPECT_EQ(distinct.size(), expected);
    EXPECT_EQ(revisions_.current(), expected);
    EXPECT_EQ(*distinct.rbegin(), expected);
    EXPECT_EQ(store_.workdir_summaries(workdir_).size(), static_cast<std::size_t>(kThreads));
    EXPECT_EQ(executor_.started_count(), static_cast<std::size_t>(kThreads));
}

TEST_F(CommandDispatcherTest, ReadSnapshotsReportMissingTargets) {
    auto conversation_result =
        dispatcher_->conversation_snapshot(TaskKey{workdir_, 9}, std::nullopt, std::nullopt);
    ASSERT_TRUE(is_error(conversation_result));
    EXPECT_EQ(get_error(conversation_result).code, "task_not_found");

    auto workdir_result = dispatcher_->workdir_tasks_snapshot(77);
    ASSERT_TRUE(is_error(workdir_result));
    EXPECT_EQ(get_error(workdir_result).code, "workdir_not_found");

    create_task();
    const auto app = dispatcher_->app_snapshot();
    EXPECT_EQ(app.rev, revisions_.current());
    ASSERT_EQ(app.workdirs.size(), 1u);
    EXPECT_EQ(app.workdirs[0].task_count, 1u);
    EXPECT_EQ(app.tasks.size(), 1u);
}

}  // namespace
