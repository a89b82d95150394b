#include <gtest/gtest.h>
#include "session/task_state.hpp"

namespace {

using turnstile::core::errors::get_error;
using turnstile::core::errors::get_value;
using turnstile::core::errors::is_error;
using turnstile::protocol::TaskKey;
using turnstile::protocol::TaskStatus;
using turnstile::protocol::TurnResult;
using turnstile::protocol::TurnStatus;
using turnstile::protocol::UserInput;
using turnstile::session::TaskState;
using turnstile::runtime::TurnCompletion;
using turnstile::session::TurnRegistry;
using turnstile::session::TurnState;

UserInput text(const std::string& value) {
    return UserInput{value, {}};
}

class TaskStateTest : public ::testing::Test {
protected:
    TaskStateTest() : state_(TaskKey{1, 3}, 1000) {}

    std::uint64_t send(const std::string& value) {
        auto started = state_.send_message(text(value), turns_, 2000);
        EXPECT_FALSE(is_error(started));
        EXPECT_TRUE(get_value(started).has_value());
        return get_value(started)->turn_id;
    }

    TurnRegistry turns_;
    TaskState state_;
};

TEST_F(TaskStateTest, NewTaskHasCreatedEntryAndDefaults) {
    EXPECT_EQ(state_.title(), "Task 3");
    EXPECT_EQ(state_.task_status(), TaskStatus::Todo);
    EXPECT_FALSE(state_.is_running());
    EXPECT_EQ(state_.turn_status(), TurnStatus::Idle);
    ASSERT_EQ(state_.log().size(), 1u);
    EXPECT_TRUE(turnstile::protocol::is_system_event(state_.log().entries()[0]));
}

TEST_F(TaskStateTest, FirstMessageStartsTurnAndMovesTodoToIterating) {
    const auto turn_id = send("  Fix the login bug\nmore detail");

    EXPECT_TRUE(state_.is_running());
    EXPECT_EQ(state_.active_turn_id().value(), turn_id);
    EXPECT_EQ(state_.task_status(), TaskStatus::Iterating);
    EXPECT_EQ(state_.title(), "Fix the login bug");
    // created, status change, user message
    EXPECT_EQ(state_.log().size(), 3u);
    EXPECT_EQ(get_value(turns_.get_turn_state(turn_id)), TurnState::Running);
}

TEST_F(TaskStateTest, BlankMessageIsRejected) {
    auto result = state_.send_message(text("  \n"), turns_, 2000);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_action");
    EXPECT_EQ(state_.log().size(), 1u);
}

TEST_F(TaskStateTest, MessageWhileRunningIsQueued) {
    send("first");
    auto second = state_.send_message(text("second"), turns_, 2100);
    ASSERT_FALSE(is_error(second));
    EXPECT_FALSE(get_value(second).has_value());
    ASSERT_EQ(state_.queue().size(), 1u);
    EXPECT_EQ(state_.queue().front().input.text, "second");
}

TEST_F(TaskStateTest, FinishingTurnStartsNextQueuedPrompt) {
    const auto first = send("first");
    ASSERT_FALSE(is_error(state_.queue_message(text("second"), turns_, 2100)));

    auto transition = state_.finish_turn(first, TurnCompletion{true, "", 25}, turns_, 2200);
    EXPECT_TRUE(transition.changed);
    ASSERT_TRUE(transition.start.has_value());
    EXPECT_EQ(transition.start->input.text, "second");
    EXPECT_TRUE(state_.queue().empty());
    EXPECT_EQ(state_.last_turn_result().value(), TurnResult::Completed);
    EXPECT_EQ(get_error(turns_.get_turn_state(first)).code, "turn_not_found");
    EXPECT_EQ(turns_.turn_count(), 1u);
}

TEST_F(TaskStateTest, StaleCompletionIsIgnored) {
    const auto first = send("first");
    auto transition = state_.finish_turn(first + 100, TurnCompletion{true, "", 1}, turns_, 2200);
    EXPECT_FALSE(transition.changed);
    EXPECT_TRUE(state_.is_running());
}

TEST_F(TaskStateTest, AgentEventsOfOtherTurnsAreDropped) {
    const auto first = send("first");
    EXPECT_TRUE(state_.record_agent_event(
        first, turnstile::protocol::AgentMessage{"m1", "hi"}, 2100));
    EXPECT_FALSE(state_.record_agent_event(
        first + 1, turnstile::protocol::AgentMessage{"m2", "late"}, 2100));
}

TEST_F(TaskStateTest, CancelPausesNonEmptyQueue) {
    const auto first = send("first");
    ASSERT_FALSE(is_error(state_.queue_message(text("second"), turns_, 2100)));

    auto cancelled = state_.cancel_turn(turns_, 2200);
    ASSERT_FALSE(is_error(cancelled));
    EXPECT_FALSE(state_.is_running());
    EXPECT_TRUE(state_.queue_paused());
    EXPECT_EQ(state_.turn_status(), TurnStatus::Paused);
    EXPECT_TRUE(is_error(turns_.get_turn_state(first)));
    EXPECT_EQ(turns_.turn_count(), 0u);

    // The executor's late completion no longer changes anything.
    auto late = state_.finish_turn(first, TurnCompletion{false, "killed", 0}, turns_, 2300);
    EXPECT_FALSE(late.changed);
}

TEST_F(TaskStateTest, CancelWithoutRunningTurnFails) {
    auto cancelled = state_.cancel_turn(turns_, 2000);
    ASSERT_TRUE(is_error(cancelled));
    EXPECT_EQ(get_error(cancelled).code, "turn_not_running");
}

TEST_F(TaskStateTest, ResumeStartsNextQueuedPrompt) {
    send("first");
    ASSERT_FALSE(is_error(state_.queue_message(text("second"), turns_, 2100)));
    ASSERT_FALSE(is_error(state_.cancel_turn(turns_, 2200)));

    auto resumed = state_.resume_queue(turns_, 2300);
    EXPECT_TRUE(resumed.changed);
    ASSERT_TRUE(resumed.start.has_value());
    EXPECT_EQ(resumed.start->input.text, "second");
    EXPECT_FALSE(state_.queue_paused());

    EXPECT_FALSE(state_.resume_queue(turns_, 2400).changed);
}

TEST_F(TaskStateTest, CancelAndSendReplacesRunningTurn) {
    const auto first = send("first");
    auto replaced = state_.cancel_and_send(text("instead"), turns_, 2100);
    ASSERT_FALSE(is_error(replaced));
    EXPECT_NE(get_value(replaced).turn_id, first);
    EXPECT_TRUE(is_error(turns_.get_turn_state(first)));
    EXPECT_EQ(turns_.running_count(state_.key()), 1u);
    EXPECT_TRUE(state_.is_running());
}

TEST_F(TaskStateTest, QueueEditing) {
    send("running");
    ASSERT_FALSE(is_error(state_.queue_message(text("a"), turns_, 2100)));
    ASSERT_FALSE(is_error(state_.queue_message(text("b"), turns_, 2100)));
    ASSERT_FALSE(is_error(state_.queue_message(text("c"), turns_, 2100)));
    const auto a = state_.queue()[0].id;
    const auto c = state_.queue()[2].id;

    auto moved = state_.reorder_queued(c, a, 2200);
    ASSERT_FALSE(is_error(moved));
    EXPECT_TRUE(get_value(moved));
    EXPECT_EQ(state_.queue()[0].input.text, "c");
    EXPECT_EQ(state_.queue()[1].input.text, "a");
    EXPECT_EQ(state_.queue()[2].input.text, "b");

    auto same = state_.reorder_queued(a, a, 2200);
    ASSERT_FALSE(is_error(same));
    EXPECT_FALSE(get_value(same));

    ASSERT_FALSE(is_error(state_.update_queued(a, text("a2"), 2300)));
    EXPECT_EQ(state_.queue()[1].input.text, "a2");

    ASSERT_FALSE(is_error(state_.remove_queued(c, 2400)));
    EXPECT_EQ(state_.queue().size(), 2u);

    auto missing = state_.remove_queued(999, 2400);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "queued_prompt_not_found");

    EXPECT_TRUE(state_.clear_queue(2500));
    EXPECT_TRUE(state_.queue().empty());
    EXPECT_FALSE(state_.clear_queue(2500));
}

TEST_F(TaskStateTest, StatusAndStarChangesReportNoOps) {
    EXPECT_TRUE(state_.set_status(TaskStatus::Backlog, 2000));
    EXPECT_FALSE(state_.set_status(TaskStatus::Backlog, 2000));
    EXPECT_TRUE(state_.set_starred(true, 2000));
    EXPECT_FALSE(state_.set_starred(true, 2000));
    EXPECT_TRUE(state_.is_starred());
}

TEST_F(TaskStateTest, SnapshotCarriesQueueAndLatestTurn) {
    send("first");
    ASSERT_FALSE(is_error(state_.queue_message(text("second"), turns_, 2100)));

    auto snapshot = state_.snapshot(7, std::nullopt, 2);
    ASSERT_FALSE(is_error(snapshot));
    const auto& value = get_value(snapshot);
    EXPECT_EQ(value.rev, 7u);
    EXPECT_EQ(value.entries.size(), 2u);
    EXPECT_EQ(value.entries_total, 3u);
    EXPECT_EQ(value.entries_start, 1u);
    ASSERT_EQ(value.pending_prompts.size(), 1u);
    EXPECT_EQ(value.pending_prompts[0].text, "second");
    EXPECT_EQ(value.run_status, turnstile::protocol::OperationStatus::Running);
    ASSERT_TRUE(value.latest_turn.has_value());
    EXPECT_EQ(value.latest_turn->outcome, turnstile::protocol::TurnOutcome::Running);
}

TEST(DeriveTitleTest, TrimsFirstLineAndCapsLength) {
    EXPECT_EQ(turnstile::session::derive_title("  hello world  \nsecond"), "hello world");
    EXPECT_EQ(turnstile::session::derive_title("   "), "");
    const std::string long_text(120, 'x');
    EXPECT_EQ(turnstile::session::derive_title(long_text).size(), 80u);
}

}  // namespace
